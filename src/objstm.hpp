// SPDX-License-Identifier: Apache-2.0
// Copyright 2024-2025 Jussi Pakkanen

#pragma once

#include <errorhandling.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace formpdf::internal {

struct PackedObjectStream {
    int32_t stream_id;
    // Complete object body, dictionary and stream data.
    std::string body;
    // Member object numbers in the order they are stored.
    std::vector<int32_t> ids;

    std::optional<int32_t> index_of(int32_t id) const;
};

rvoe<PackedObjectStream>
pack_object_stream(const std::map<int32_t, std::string> &members, int32_t stream_id, bool compress);

// Splits a decoded object stream payload into its member objects. Member
// bodies have surrounding whitespace removed.
rvoe<std::vector<std::pair<int32_t, std::string>>>
unpack_object_stream(std::string_view dict_text, std::string_view payload);

} // namespace formpdf::internal
