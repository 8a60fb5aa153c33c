// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2025 Jussi Pakkanen

#include <docproperties.hpp>

#include <array>

namespace formpdf::internal {

namespace {

const std::array<std::string_view, 6> version_strings{"1.3", "1.4", "1.5", "1.6", "1.7", "2.0"};

}

std::optional<PdfVersion> parse_pdf_version(std::string_view text) {
    for(size_t i = 0; i < version_strings.size(); ++i) {
        if(text.starts_with(version_strings[i])) {
            return PdfVersion(i);
        }
    }
    return {};
}

bool supports_xref_streams(PdfVersion version) { return version >= PdfVersion::v15; }

} // namespace formpdf::internal
