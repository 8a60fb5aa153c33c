// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#include <objectscanner.hpp>
#include <objectformatter.hpp>
#include <objstm.hpp>
#include <pdfparser.hpp>
#include <utils.hpp>

#include <fmt/core.h>

namespace formpdf::internal {

namespace {

std::optional<int64_t> direct_integer(const PdfDict *dict, std::string_view key) {
    if(!dict) {
        return {};
    }
    if(auto *e = dict->find(key)) {
        if(auto *i = std::get_if<int64_t>(&e->value)) {
            return *i;
        }
    }
    return {};
}

const std::string *type_name(const PdfValueTree &tree) {
    auto *dict = tree.root_dict();
    if(!dict) {
        return nullptr;
    }
    auto *e = dict->find("Type");
    if(!e) {
        return nullptr;
    }
    return as_name(e->value);
}

rvoe<NoReturnValue>
scan_object(std::string_view bytes, PdfLexer &lex, int64_t number, ScannedDocument &doc) {
    const size_t obj_offset = lex.token_start();
    if(number <= 0 || number > INT32_MAX) {
        fmt::print(stderr, "Invalid object number {} at offset {}.\n", number, obj_offset);
        RETERR(MalformedInput);
    }
    PdfParser p(bytes, lex.current_offset());
    auto tree = p.parse();
    if(!tree) {
        fmt::print(stderr,
                   "Could not parse object {} at offset {}: {}\n",
                   number,
                   obj_offset,
                   error_text(tree.error()));
        return std::unexpected(tree.error());
    }
    lex.set_offset(tree->root_span.end);
    auto after = lex.next();
    auto *kw = std::get_if<PdfTokenKeyword>(&after);
    size_t body_end = tree->root_span.end;
    if(kw && kw->text == "stream") {
        auto data = lex.consume_stream(direct_integer(tree->root_dict(), "Length"));
        if(!data) {
            fmt::print(stderr,
                       "Stream of object {} at offset {} has no end.\n",
                       number,
                       obj_offset);
            return std::unexpected(data.error());
        }
        body_end = lex.current_offset();
        after = lex.next();
        kw = std::get_if<PdfTokenKeyword>(&after);
    }
    if(!kw || kw->text != "endobj") {
        fmt::print(stderr, "Object {} at offset {} is missing endobj.\n", number, obj_offset);
        RETERR(TruncatedObject);
    }
    const auto body_start = tree->root_span.start;
    doc.objects[(int32_t)number] = std::string(bytes.substr(body_start, body_end - body_start));
    doc.offsets[(int32_t)number] = obj_offset;
    RETOK;
}

rvoe<std::string> synthesize_trailer(const ScannedDocument &doc, int32_t xref_stream_id) {
    const auto &body = doc.objects.at(xref_stream_id);
    ERC(tree, parse_pdf_value(body));
    auto *dict = tree.root_dict();
    ObjectFormatter fmt;
    fmt.begin_dict();
    for(const char *key : {"Root", "Info", "ID"}) {
        if(auto *e = dict->find(key)) {
            fmt.add_token_with_slash(key);
            fmt.add_token(e->value_span.of(body));
        }
    }
    fmt.end_dict();
    return fmt.steal();
}

std::string trailer_from_catalog(const ScannedDocument &doc) {
    ObjectFormatter fmt;
    fmt.begin_dict();
    for(const auto &[id, body] : doc.objects) {
        auto tree = parse_pdf_value(body);
        if(!tree) {
            continue;
        }
        auto *type = type_name(*tree);
        if(type && *type == "Catalog") {
            fmt.add_token("/Root");
            fmt.add_object_ref(id);
            break;
        }
    }
    fmt.end_dict();
    return fmt.steal();
}

rvoe<NoReturnValue> expand_object_streams(ScannedDocument &doc, bool has_trailer) {
    std::map<int32_t, std::string> compressed;
    std::vector<int32_t> containers;
    std::optional<int32_t> xref_stream_id;
    for(const auto &[id, body] : doc.objects) {
        ERC(tree, parse_pdf_value(body));
        auto *type = type_name(tree);
        if(!type) {
            continue;
        }
        if(*type == "ObjStm") {
            containers.push_back(id);
            ERC(parts, split_stream_body(body));
            auto payload = decode_stream_data(parts.dict, parts.data);
            if(!payload) {
                fmt::print(stderr,
                           "Could not decode object stream {}: {}\n",
                           id,
                           error_text(payload.error()));
                return std::unexpected(payload.error());
            }
            ERC(members, unpack_object_stream(parts.dict, *payload));
            for(auto &[member_id, member_body] : members) {
                compressed.insert_or_assign(member_id, std::move(member_body));
            }
        } else if(*type == "XRef") {
            containers.push_back(id);
            // With incremental updates the last one is the newest.
            if(!xref_stream_id || doc.offsets.at(id) > doc.offsets.at(*xref_stream_id)) {
                xref_stream_id = id;
            }
        }
    }
    if(!has_trailer && xref_stream_id) {
        ERC(trailer, synthesize_trailer(doc, *xref_stream_id));
        doc.trailer = std::move(trailer);
    }
    for(const auto id : containers) {
        doc.objects.erase(id);
        doc.offsets.erase(id);
    }
    // Objects written out in plain form take precedence.
    for(auto &[id, body] : compressed) {
        doc.objects.try_emplace(id, std::move(body));
    }
    RETOK;
}

// Fills in the resources of a page or page tree node. Returns false if the
// dictionary has no /Resources entry.
rvoe<bool> read_resources(const ScannedDocument &doc,
                          int32_t owner_id,
                          std::string_view body,
                          const PdfValueTree &tree,
                          const PdfDict &dict,
                          PageInfo &info) {
    auto *resources = dict.find("Resources");
    if(!resources) {
        return false;
    }
    if(auto ref = as_objref(resources->value)) {
        auto *res_body = doc.find((int32_t)ref->obj);
        if(!res_body) {
            fmt::print(stderr, "Resource object {} does not exist.\n", ref->obj);
            RETERR(MalformedInput);
        }
        info.resources_ref = (int32_t)ref->obj;
        info.resources = *res_body;
    } else if(tree.dict_of(resources->value)) {
        info.resources = std::string(resources->value_span.of(body));
    } else {
        fmt::print(stderr, "Object {} has a malformed /Resources entry.\n", owner_id);
        RETERR(MalformedInput);
    }
    return true;
}

} // namespace

const std::string *ScannedDocument::find(int32_t id) const {
    auto it = objects.find(id);
    if(it == objects.end()) {
        return nullptr;
    }
    return &it->second;
}

rvoe<StreamParts> split_stream_body(std::string_view body) {
    ERC(tree, parse_pdf_value(body));
    if(!tree.root_dict()) {
        RETERR(MalformedInput);
    }
    PdfLexer lex(body, tree.root_span.end);
    auto token = lex.next();
    auto *kw = std::get_if<PdfTokenKeyword>(&token);
    if(!kw || kw->text != "stream") {
        RETERR(MalformedInput);
    }
    ERC(span, lex.consume_stream(direct_integer(tree.root_dict(), "Length")));
    return StreamParts{tree.root_span.of(body), span.of(body)};
}

rvoe<std::string> decode_stream_data(std::string_view dict_text, std::string_view data) {
    ERC(tree, parse_pdf_value(dict_text));
    auto *dict = tree.root_dict();
    if(!dict) {
        RETERR(MalformedInput);
    }
    auto *filter = dict->find("Filter");
    if(!filter) {
        return std::string(data);
    }
    const std::string *filter_name = as_name(filter->value);
    if(auto *arr = tree.array_of(filter->value)) {
        if(arr->elements.empty()) {
            return std::string(data);
        }
        filter_name = arr->elements.size() == 1 ? as_name(arr->elements.front()) : nullptr;
    }
    if(!filter_name || *filter_name != "FlateDecode") {
        fmt::print(stderr, "Unsupported stream filter: {}\n", filter->value_span.of(dict_text));
        RETERR(UnsupportedFilter);
    }
    if(auto *parms = dict->find("DecodeParms")) {
        if(auto *pdict = tree.dict_of(parms->value)) {
            auto predictor = direct_integer(pdict, "Predictor");
            if(predictor && *predictor > 1) {
                fmt::print(stderr, "Flate predictors are not supported.\n");
                RETERR(UnsupportedFilter);
            }
        }
    }
    return flate_decompress(data);
}

rvoe<ScannedDocument> scan_document(std::string_view bytes) {
    ScannedDocument doc;
    if(bytes.starts_with("%PDF-")) {
        if(auto v = parse_pdf_version(bytes.substr(5))) {
            doc.version = *v;
        }
    }
    bool has_trailer = false;
    PdfLexer lex(bytes);
    while(true) {
        auto token = lex.next();
        if(std::holds_alternative<PdfTokenFinished>(token)) {
            break;
        }
        if(auto *objname = std::get_if<PdfTokenObjName>(&token)) {
            ERCV(scan_object(bytes, lex, objname->number, doc));
        } else if(auto *kw = std::get_if<PdfTokenKeyword>(&token)) {
            if(kw->text == "trailer") {
                PdfParser p(bytes, lex.current_offset());
                auto tree = p.parse();
                if(!tree || !tree->root_dict()) {
                    fmt::print(stderr, "Malformed trailer at offset {}.\n", lex.token_start());
                    RETERR(MalformedInput);
                }
                doc.trailer = std::string(tree->root_span.of(bytes));
                lex.set_offset(tree->root_span.end);
                has_trailer = true;
            } else if(kw->text == "startxref") {
                auto offset = lex.next();
                if(auto *i = std::get_if<PdfTokenInteger>(&offset); i && i->value >= 0) {
                    doc.startxref = (uint64_t)i->value;
                }
            }
        } else if(std::holds_alternative<PdfTokenError>(token)) {
            // Junk between objects.
            lex.set_offset(lex.token_start() + 1);
        }
    }
    ERCV(expand_object_streams(doc, has_trailer));
    if(doc.trailer.empty()) {
        doc.trailer = trailer_from_catalog(doc);
    }
    return doc;
}

rvoe<int32_t> find_page_object(const ScannedDocument &doc) {
    std::vector<int32_t> pages;
    for(const auto &[id, body] : doc.objects) {
        auto tree = parse_pdf_value(body);
        if(!tree) {
            fmt::print(stderr, "Could not parse object {}: {}\n", id, error_text(tree.error()));
            return std::unexpected(tree.error());
        }
        auto *type = type_name(*tree);
        if(type && *type == "Page") {
            pages.push_back(id);
        }
    }
    if(pages.empty()) {
        fmt::print(stderr, "No page object found.\n");
        RETERR(NoPageObject);
    }
    if(pages.size() > 1) {
        fmt::print(stderr, "Document has {} pages, only single page documents are supported.\n",
                   pages.size());
        RETERR(MultiplePages);
    }
    return pages.front();
}

rvoe<PageInfo> extract_page_info(const ScannedDocument &doc, int32_t page_id) {
    auto *body = doc.find(page_id);
    if(!body) {
        RETERR(BadId);
    }
    ERC(tree, parse_pdf_value(*body));
    auto *dict = tree.root_dict();
    if(!dict) {
        fmt::print(stderr, "Page object {} is not a dictionary.\n", page_id);
        RETERR(MalformedInput);
    }
    PageInfo info;

    if(auto *annots = dict->find("Annots")) {
        info.has_annots = true;
        const PdfArray *arr = tree.array_of(annots->value);
        std::optional<PdfValueTree> indirect;
        if(auto ref = as_objref(annots->value)) {
            auto *annots_body = doc.find((int32_t)ref->obj);
            if(!annots_body) {
                fmt::print(stderr, "Annotation array object {} does not exist.\n", ref->obj);
                RETERR(MalformedInput);
            }
            ERC(annots_tree, parse_pdf_value(*annots_body));
            indirect = std::move(annots_tree);
            arr = indirect->array_of(indirect->root);
        }
        if(!arr) {
            fmt::print(stderr, "Page object {} has a malformed /Annots entry.\n", page_id);
            RETERR(MalformedInput);
        }
        for(const auto &e : arr->elements) {
            auto ref = as_objref(e);
            if(!ref) {
                fmt::print(stderr, "Inline annotations on page {} are not supported.\n", page_id);
                RETERR(UnsupportedStructure);
            }
            info.annots.push_back((int32_t)ref->obj);
        }
    }

    if(auto *contents = dict->find("Contents")) {
        if(auto ref = as_objref(contents->value)) {
            info.contents.push_back((int32_t)ref->obj);
        } else if(auto *arr = tree.array_of(contents->value)) {
            for(const auto &e : arr->elements) {
                auto ref = as_objref(e);
                if(!ref) {
                    RETERR(MissingContents);
                }
                info.contents.push_back((int32_t)ref->obj);
            }
        } else {
            fmt::print(stderr, "Page object {} has a malformed /Contents entry.\n", page_id);
            RETERR(MissingContents);
        }
    }

    ERC(found, read_resources(doc, page_id, *body, tree, *dict, info));
    if(!found) {
        // Inherited from the page tree node, one level up only.
        if(auto *parent = dict->find("Parent")) {
            auto ref = as_objref(parent->value);
            const std::string *parent_body = ref ? doc.find((int32_t)ref->obj) : nullptr;
            if(parent_body) {
                ERC(parent_tree, parse_pdf_value(*parent_body));
                if(auto *parent_dict = parent_tree.root_dict()) {
                    ERC(inherited,
                        read_resources(
                            doc, (int32_t)ref->obj, *parent_body, parent_tree, *parent_dict, info));
                    info.resources_inherited = inherited;
                }
            }
        }
    }
    return info;
}

} // namespace formpdf::internal
