// SPDX-License-Identifier: Apache-2.0
// Copyright 2024-2025 Jussi Pakkanen

#pragma once

#include <errorhandling.hpp>
#include <cstdint>
#include <span>
#include <vector>

namespace formpdf::internal {

rvoe<std::span<const std::byte>> get_substring(const char *buf,
                                               const int64_t bufsize,
                                               const int64_t offset,
                                               const int64_t substr_size);

rvoe<std::span<const std::byte>>
get_substring(std::span<const std::byte> sv, const size_t offset, const int64_t substr_size);

rvoe<NoReturnValue> append_be_field(std::vector<std::byte> &s, uint64_t value, int32_t width);

rvoe<uint64_t> read_be_field(std::span<const std::byte> bf, size_t offset, int32_t width);

} // namespace formpdf::internal
