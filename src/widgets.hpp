// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#pragma once

#include <errorhandling.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace formpdf::internal {

struct ScannedDocument;

struct PdfRectangle {
    double x1{};
    double y1{};
    double x2{};
    double y2{};

    double w() const { return x2 - x1; }
    double h() const { return y2 - y1; }
};

struct Widget {
    std::optional<PdfRectangle> rect;
    // Decoded field value.
    std::optional<std::string> value;
    // Raw /DA contents without parentheses.
    std::optional<std::string> default_appearance;
    std::optional<std::string> field_type;
    std::optional<int32_t> parent;
    bool is_button = false;
};

// Returns an empty optional for annotations that are not widgets.
rvoe<std::optional<Widget>> parse_widget(std::string_view body);

// The widget's own /FT or the one of its immediate parent.
std::optional<std::string> resolve_field_type(const ScannedDocument &doc, const Widget &w);

struct AnnotationClassification {
    // Annotation object numbers that stay on the page.
    std::vector<int32_t> preserved;
    // Text-like widgets with a value, in page order.
    std::vector<Widget> candidates;
};

rvoe<AnnotationClassification> classify_annotations(const ScannedDocument &doc,
                                                    const std::vector<int32_t> &annots);

struct AcroFormInfo {
    std::optional<int32_t> id;
    // Raw /DA contents without parentheses.
    std::optional<std::string> default_appearance;
    // The font registered in /DR under the given resource name.
    std::optional<int32_t> font_ref;
};

// Looks for the form dictionary through the catalog first and then among all objects.
rvoe<AcroFormInfo> find_acroform(const ScannedDocument &doc, std::string_view font_resource_name);

} // namespace formpdf::internal
