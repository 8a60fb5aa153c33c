// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#pragma once

#include <docproperties.hpp>
#include <objectscanner.hpp>
#include <objectstore.hpp>
#include <widgets.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace formpdf::internal {

enum class FlattenState : uint8_t {
    Start,
    Scanned,
    FieldsResolved,
    OverlayBuilt,
    PageRewritten,
    Reassembled,
};

struct FlattenResult {
    std::string bytes;
    // False when there was nothing to flatten and the input was passed through.
    bool modified = false;
    size_t num_flattened = 0;
    size_t num_preserved = 0;
};

// Replaces the text form fields of a single page document with static page
// content. Each step may only be run once and in order.
class FormFlattener {
public:
    FormFlattener(std::string_view source, const FlattenOptions &opts);

    rvoe<FlattenResult> run();

    rvoe<NoReturnValue> scan();
    rvoe<NoReturnValue> resolve_fields();
    rvoe<NoReturnValue> build_overlay();
    rvoe<NoReturnValue> rewrite_page();
    rvoe<FlattenResult> reassemble();

    FlattenState state() const { return current; }

private:
    rvoe<NoReturnValue> require(FlattenState expected) const;
    rvoe<int32_t> fallback_font();

    std::string_view source;
    FlattenOptions opts;
    FlattenState current = FlattenState::Start;

    ScannedDocument doc;
    int32_t page_id = -1;
    PageInfo page;
    AnnotationClassification annotations;
    AcroFormInfo acroform;
    std::string overlay;
    ObjectStore store;
};

rvoe<FlattenResult> flatten_form(std::string_view source, const FlattenOptions &opts);

} // namespace formpdf::internal
