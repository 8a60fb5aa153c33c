// SPDX-License-Identifier: Apache-2.0
// Copyright 2024-2025 Jussi Pakkanen

#pragma once

#include <errorhandling.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace formpdf::internal {

struct XRefFree {
    int32_t next_free = 0;
    uint16_t generation = 65535;
};

struct XRefNormal {
    uint64_t offset;
    uint16_t generation = 0;
};

struct XRefCompressed {
    int32_t stream_object;
    int32_t index;
};

typedef std::variant<XRefFree, XRefNormal, XRefCompressed> XRefEntry;

// Field widths of the binary entries we write.
constexpr std::array<int32_t, 3> xref_stream_widths{1, 4, 2};

// Classic table from "xref" up to, but not including, "trailer".
rvoe<std::string> encode_xref_table(const std::vector<XRefEntry> &entries);

rvoe<std::vector<XRefEntry>> parse_xref_table(std::string_view text, size_t xref_offset);

rvoe<std::vector<std::byte>> encode_xref_stream_data(const std::vector<XRefEntry> &entries);

// Decodes uncompressed cross reference stream data. Entries for object numbers
// outside the /Index subsections are not present so the result is keyed on
// object number with free entries filling the holes.
rvoe<std::vector<XRefEntry>> decode_xref_stream_data(std::span<const std::byte> data,
                                                     const std::array<int32_t, 3> &widths,
                                                     const std::vector<int64_t> &index);

} // namespace formpdf::internal
