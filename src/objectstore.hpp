// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2025 Jussi Pakkanen

#pragma once

#include <errorhandling.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace formpdf::internal {

// Object bodies keyed by object number. Everything between "N 0 obj" and "endobj"
// is stored verbatim. Number 0 is the head of the free list and never stored.
class ObjectStore {
public:
    ObjectStore() = default;

    int32_t reserve_id() { return next_id++; }

    // Stores the body under a freshly allocated number.
    int32_t add(std::string body);

    rvoe<NoReturnValue> set(int32_t id, std::string body);

    rvoe<const std::string *> get(int32_t id) const;

    bool contains(int32_t id) const { return objects.find(id) != objects.end(); }

    // Reserved numbers count even if they never got a body.
    int32_t highest_id() const { return next_id - 1; }

    size_t size() const { return objects.size(); }

    const std::map<int32_t, std::string> &entries() const { return objects; }

private:
    std::map<int32_t, std::string> objects;
    int32_t next_id = 1;
};

// True if the body is a dictionary followed by stream data.
bool is_stream_body(std::string_view body);

} // namespace formpdf::internal
