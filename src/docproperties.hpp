// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2025 Jussi Pakkanen

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace formpdf::internal {

enum class PdfVersion : int32_t {
    v13,
    v14,
    v15,
    v16,
    v17,
    v20,
};

// Parses the "1.x" part of a file header.
std::optional<PdfVersion> parse_pdf_version(std::string_view text);

bool supports_xref_streams(PdfVersion version);

struct DocumentProperties {
    PdfVersion version = PdfVersion::v16;
    // Non-stream objects go in an object stream indexed by a cross reference stream.
    bool use_xref_stream = true;
    bool compress_streams = true;
};

struct FlattenOptions {
    double left_padding = 2;
    double default_font_size = 12;
    std::string font_resource_name = "Helv";
    bool compress_overlay = false;
};

} // namespace formpdf::internal
