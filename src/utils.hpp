// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2025 Jussi Pakkanen

#pragma once

#include <errorhandling.hpp>
#include <stdio.h>

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace formpdf::internal {

template<class... Ts> struct overloaded : Ts... {
    using Ts::operator()...;
};
#if defined __APPLE__
// This should not be needed, but Xcode 15 still requires it.
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;
#endif

rvoe<std::vector<std::byte>> flate_compress(std::string_view data);

rvoe<std::string> flate_decompress(std::string_view data);

rvoe<std::string> load_file_as_string(const char *fname);

rvoe<std::string> load_file_as_string(FILE *f);

// Writes to a temporary file first and renames it over the target once fully written.
rvoe<NoReturnValue> write_file(const char *ofname, std::string_view contents);

std::string create_trailer_id();

std::span<const std::byte> str2span(std::string_view s);
std::string_view span2sv(std::span<const std::byte> s);

struct FileCloser {
    static void del(FILE *f) {
        if(f) {
            fclose(f);
        }
    }
    void operator()(FILE *f) const { del(f); }
};

} // namespace formpdf::internal
