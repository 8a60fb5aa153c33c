// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#pragma once

#include <errorhandling.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace formpdf::internal {

struct ScannedDocument;

// Font dictionary of a resource dictionary, following one indirect reference.
// Empty if there is no /Font entry.
rvoe<std::string> resolve_font_dict(const ScannedDocument &doc, std::string_view resources_text);

// Builds a resource dictionary whose /Font maps font_name to font_ref followed by
// the entries of font_dict_text. /ProcSet and all other categories are kept.
rvoe<std::string> merge_resources(std::string_view resources_text,
                                  std::string_view font_dict_text,
                                  int32_t font_ref,
                                  std::string_view font_name = "Helv");

} // namespace formpdf::internal
