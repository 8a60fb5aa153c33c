// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#include <widgets.hpp>
#include <literalstring.hpp>
#include <objectscanner.hpp>
#include <pdfparser.hpp>

#include <fmt/core.h>

#include <algorithm>

namespace formpdf::internal {

namespace {

rvoe<std::optional<std::string>> decode_text(const PdfValueElement &value) {
    if(auto *s = std::get_if<PdfNodeString>(&value)) {
        return std::optional<std::string>{pdfstring_decode(s->value)};
    }
    if(auto *h = std::get_if<PdfNodeHexString>(&value)) {
        ERC(decoded, pdf_hexstring_decode(h->value));
        return std::optional<std::string>{std::move(decoded)};
    }
    if(auto *n = std::get_if<PdfNodeName>(&value)) {
        return std::optional<std::string>{n->value};
    }
    return std::optional<std::string>{};
}

std::optional<PdfRectangle> parse_rect(const PdfValueTree &tree, const PdfValueElement &value) {
    auto *arr = tree.array_of(value);
    if(!arr || arr->elements.size() != 4) {
        return {};
    }
    double coords[4];
    for(size_t i = 0; i < 4; ++i) {
        auto num = as_number(arr->elements[i]);
        if(!num) {
            return {};
        }
        coords[i] = *num;
    }
    // Viewers accept any two opposite corners.
    return PdfRectangle{std::min(coords[0], coords[2]),
                        std::min(coords[1], coords[3]),
                        std::max(coords[0], coords[2]),
                        std::max(coords[1], coords[3])};
}

// Follows one indirect reference if there is one.
const PdfDict *resolve_dict(const ScannedDocument &doc,
                            const PdfValueTree &tree,
                            const PdfValueElement &value,
                            std::optional<PdfValueTree> &storage) {
    if(auto ref = as_objref(value)) {
        auto *body = doc.find((int32_t)ref->obj);
        if(!body) {
            return nullptr;
        }
        auto parsed = parse_pdf_value(*body);
        if(!parsed) {
            return nullptr;
        }
        storage = std::move(*parsed);
        return storage->root_dict();
    }
    return tree.dict_of(value);
}

rvoe<AcroFormInfo> read_acroform(const ScannedDocument &doc,
                                 const PdfValueTree &tree,
                                 const PdfDict &form,
                                 std::string_view font_resource_name) {
    AcroFormInfo info;
    if(auto *e = form.find("DA")) {
        if(auto *s = std::get_if<PdfNodeString>(&e->value)) {
            info.default_appearance = s->value;
        } else if(auto *h = std::get_if<PdfNodeHexString>(&e->value)) {
            ERC(decoded, pdf_hexstring_decode(h->value));
            info.default_appearance = std::move(decoded);
        }
    }
    auto *dr = form.find("DR");
    if(!dr) {
        return info;
    }
    std::optional<PdfValueTree> dr_storage;
    auto *dr_dict = resolve_dict(doc, tree, dr->value, dr_storage);
    if(!dr_dict) {
        return info;
    }
    auto *font = dr_dict->find("Font");
    if(!font) {
        return info;
    }
    const PdfValueTree &dr_tree = dr_storage ? *dr_storage : tree;
    std::optional<PdfValueTree> font_storage;
    auto *font_dict = resolve_dict(doc, dr_tree, font->value, font_storage);
    if(!font_dict) {
        return info;
    }
    if(auto *helv = font_dict->find(font_resource_name)) {
        if(auto ref = as_objref(helv->value)) {
            info.font_ref = (int32_t)ref->obj;
        }
    }
    return info;
}

} // namespace

rvoe<std::optional<Widget>> parse_widget(std::string_view body) {
    ERC(tree, parse_pdf_value(body));
    auto *dict = tree.root_dict();
    if(!dict) {
        return std::optional<Widget>{};
    }
    auto *subtype = dict->find("Subtype");
    if(!subtype) {
        return std::optional<Widget>{};
    }
    auto *subtype_name = as_name(subtype->value);
    if(!subtype_name || *subtype_name != "Widget") {
        return std::optional<Widget>{};
    }
    Widget w;
    if(auto *e = dict->find("Rect")) {
        w.rect = parse_rect(tree, e->value);
    }
    if(auto *e = dict->find("V")) {
        ERC(value, decode_text(e->value));
        w.value = std::move(value);
    }
    if(auto *e = dict->find("DA")) {
        if(auto *s = std::get_if<PdfNodeString>(&e->value)) {
            w.default_appearance = s->value;
        } else if(auto *h = std::get_if<PdfNodeHexString>(&e->value)) {
            ERC(decoded, pdf_hexstring_decode(h->value));
            w.default_appearance = std::move(decoded);
        }
    }
    if(auto *e = dict->find("FT")) {
        if(auto *n = as_name(e->value)) {
            w.field_type = *n;
        }
    }
    if(auto *e = dict->find("Parent")) {
        if(auto ref = as_objref(e->value)) {
            w.parent = (int32_t)ref->obj;
        }
    }
    w.is_button = w.field_type && *w.field_type == "Btn";
    return std::optional<Widget>{std::move(w)};
}

std::optional<std::string> resolve_field_type(const ScannedDocument &doc, const Widget &w) {
    if(w.field_type) {
        return w.field_type;
    }
    if(!w.parent) {
        return {};
    }
    auto *parent_body = doc.find(*w.parent);
    if(!parent_body) {
        return {};
    }
    auto tree = parse_pdf_value(*parent_body);
    if(!tree || !tree->root_dict()) {
        return {};
    }
    if(auto *e = tree->root_dict()->find("FT")) {
        if(auto *n = as_name(e->value)) {
            return *n;
        }
    }
    return {};
}

rvoe<AnnotationClassification> classify_annotations(const ScannedDocument &doc,
                                                    const std::vector<int32_t> &annots) {
    AnnotationClassification result;
    for(const auto id : annots) {
        auto *body = doc.find(id);
        if(!body) {
            // Dangling reference, nothing to preserve.
            fmt::print(stderr, "Annotation object {} does not exist, dropping it.\n", id);
            continue;
        }
        auto widget = parse_widget(*body);
        if(!widget) {
            fmt::print(stderr,
                       "Could not parse annotation {}: {}\n",
                       id,
                       error_text(widget.error()));
            return std::unexpected(widget.error());
        }
        if(!*widget) {
            result.preserved.push_back(id);
            continue;
        }
        auto &w = **widget;
        w.field_type = resolve_field_type(doc, w);
        w.is_button = w.field_type && *w.field_type == "Btn";
        if(w.is_button) {
            result.preserved.push_back(id);
        } else if(w.rect && w.value && !w.value->empty()) {
            result.candidates.push_back(std::move(w));
        }
    }
    return result;
}

rvoe<AcroFormInfo> find_acroform(const ScannedDocument &doc, std::string_view font_resource_name) {
    // The catalog is the authoritative route to the form.
    auto trailer = parse_pdf_value(doc.trailer);
    if(trailer && trailer->root_dict()) {
        if(auto *root = trailer->root_dict()->find("Root")) {
            auto ref = as_objref(root->value);
            auto *catalog_body = ref ? doc.find((int32_t)ref->obj) : nullptr;
            if(catalog_body) {
                ERC(catalog, parse_pdf_value(*catalog_body));
                auto *catalog_dict = catalog.root_dict();
                auto *form_entry = catalog_dict ? catalog_dict->find("AcroForm") : nullptr;
                if(form_entry) {
                    std::optional<PdfValueTree> storage;
                    auto *form = resolve_dict(doc, catalog, form_entry->value, storage);
                    if(form) {
                        ERC(info, read_acroform(doc, storage ? *storage : catalog, *form,
                                                font_resource_name));
                        if(auto form_ref = as_objref(form_entry->value)) {
                            info.id = (int32_t)form_ref->obj;
                        }
                        return info;
                    }
                }
            }
        }
    }
    for(const auto &[id, body] : doc.objects) {
        auto tree = parse_pdf_value(body);
        if(!tree || !tree->root_dict()) {
            continue;
        }
        auto *dict = tree->root_dict();
        if(auto *form_entry = dict->find("AcroForm")) {
            std::optional<PdfValueTree> storage;
            auto *form = resolve_dict(doc, *tree, form_entry->value, storage);
            if(form) {
                ERC(info, read_acroform(doc, storage ? *storage : *tree, *form,
                                        font_resource_name));
                if(auto form_ref = as_objref(form_entry->value)) {
                    info.id = (int32_t)form_ref->obj;
                }
                return info;
            }
        } else if(dict->find("NeedAppearances") || dict->find("Fields")) {
            ERC(info, read_acroform(doc, *tree, *dict, font_resource_name));
            info.id = id;
            return info;
        }
    }
    return AcroFormInfo{};
}

} // namespace formpdf::internal
