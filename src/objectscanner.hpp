// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#pragma once

#include <docproperties.hpp>
#include <errorhandling.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace formpdf::internal {

struct ScannedDocument {
    std::map<int32_t, std::string> objects;
    // Where each "N G obj" line starts in the source. Members of object
    // streams have no entry.
    std::map<int32_t, size_t> offsets;
    std::string trailer;
    PdfVersion version = PdfVersion::v14;
    std::optional<uint64_t> startxref;

    const std::string *find(int32_t id) const;
};

struct StreamParts {
    std::string_view dict;
    std::string_view data;
};

rvoe<StreamParts> split_stream_body(std::string_view body);

// Only Flate (or no filter) is supported.
rvoe<std::string> decode_stream_data(std::string_view dict_text, std::string_view data);

rvoe<ScannedDocument> scan_document(std::string_view bytes);

rvoe<int32_t> find_page_object(const ScannedDocument &doc);

struct PageInfo {
    bool has_annots = false;
    std::vector<int32_t> annots;
    std::vector<int32_t> contents;
    // Set when /Resources is an indirect reference.
    std::optional<int32_t> resources_ref;
    // Resolved dictionary text, empty if the page has no resources.
    std::string resources;
    // Taken from the parent /Pages node. The page gets its own copy when rewritten.
    bool resources_inherited = false;
};

rvoe<PageInfo> extract_page_info(const ScannedDocument &doc, int32_t page_id);

} // namespace formpdf::internal
