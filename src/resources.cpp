// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#include <resources.hpp>
#include <objectformatter.hpp>
#include <objectscanner.hpp>
#include <pdfparser.hpp>

#include <fmt/core.h>

namespace formpdf::internal {

rvoe<std::string> resolve_font_dict(const ScannedDocument &doc, std::string_view resources_text) {
    if(resources_text.empty()) {
        return std::string{};
    }
    ERC(tree, parse_pdf_value(resources_text));
    auto *dict = tree.root_dict();
    if(!dict) {
        RETERR(MalformedInput);
    }
    auto *font = dict->find("Font");
    if(!font) {
        return std::string{};
    }
    if(auto ref = as_objref(font->value)) {
        auto *body = doc.find((int32_t)ref->obj);
        if(!body) {
            fmt::print(stderr, "Font resource object {} does not exist.\n", ref->obj);
            RETERR(MalformedInput);
        }
        return *body;
    }
    if(!tree.dict_of(font->value)) {
        RETERR(MalformedInput);
    }
    return std::string(font->value_span.of(resources_text));
}

rvoe<std::string> merge_resources(std::string_view resources_text,
                                  std::string_view font_dict_text,
                                  int32_t font_ref,
                                  std::string_view font_name) {
    ObjectFormatter fmt;
    fmt.begin_dict();
    fmt.add_token("/Font");
    fmt.begin_dict();
    fmt.add_token_with_slash(font_name);
    fmt.add_object_ref(font_ref);
    if(!font_dict_text.empty()) {
        ERC(fonts, parse_pdf_value(font_dict_text));
        if(!fonts.root_dict()) {
            RETERR(MalformedInput);
        }
        for(const auto &e : fonts.root_dict()->entries) {
            if(e.key == font_name) {
                continue;
            }
            fmt.add_token_pair(e.key_span.of(font_dict_text), e.value_span.of(font_dict_text));
        }
    }
    fmt.end_dict();
    if(!resources_text.empty()) {
        ERC(res, parse_pdf_value(resources_text));
        if(!res.root_dict()) {
            RETERR(MalformedInput);
        }
        if(auto *procset = res.root_dict()->find("ProcSet")) {
            fmt.add_token_pair("/ProcSet", procset->value_span.of(resources_text));
        }
        for(const auto &e : res.root_dict()->entries) {
            if(e.key == "Font" || e.key == "ProcSet") {
                continue;
            }
            fmt.add_token_pair(e.key_span.of(resources_text), e.value_span.of(resources_text));
        }
    }
    fmt.end_dict();
    return fmt.steal();
}

} // namespace formpdf::internal
