// SPDX-License-Identifier: Apache-2.0
// Copyright 2024-2025 Jussi Pakkanen

#include <bitfiddling.hpp>

namespace formpdf::internal {

rvoe<std::span<const std::byte>> get_substring(const char *buf,
                                               const int64_t bufsize,
                                               const int64_t offset,
                                               const int64_t substr_size) {
    if(!buf) {
        RETERR(ArgIsNull);
    }
    if(bufsize < 0 || offset < 0 || substr_size < 0) {
        RETERR(IndexIsNegative);
    }
    if(offset > bufsize) {
        RETERR(IndexOutOfBounds);
    }
    if(offset + substr_size > bufsize) {
        RETERR(IndexOutOfBounds);
    }
    if(substr_size == 0) {
        return std::span<const std::byte>{};
    }
    return std::span<const std::byte>((const std::byte *)buf + offset, substr_size);
}

rvoe<std::span<const std::byte>>
get_substring(std::span<const std::byte> sv, const size_t offset, const int64_t substr_size) {
    return get_substring((const char *)sv.data(), sv.size(), offset, substr_size);
}

rvoe<NoReturnValue> append_be_field(std::vector<std::byte> &s, uint64_t value, int32_t width) {
    if(width < 0 || width > 8) {
        RETERR(InvalidBufsize);
    }
    if(width < 8 && (value >> (8 * width)) != 0) {
        RETERR(XRefFieldOverflow);
    }
    for(int32_t i = width - 1; i >= 0; --i) {
        s.push_back(std::byte((value >> (8 * i)) & 0xFF));
    }
    RETOK;
}

rvoe<uint64_t> read_be_field(std::span<const std::byte> bf, size_t offset, int32_t width) {
    if(width < 0 || width > 8) {
        RETERR(InvalidBufsize);
    }
    ERC(area, get_substring(bf, offset, width));
    uint64_t value = 0;
    for(const auto b : area) {
        value = (value << 8) | uint64_t(b);
    }
    return value;
}

} // namespace formpdf::internal
