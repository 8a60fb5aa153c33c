// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#include <verifier.hpp>
#include <objectscanner.hpp>
#include <objstm.hpp>
#include <pdfparser.hpp>
#include <utils.hpp>

#include <fmt/core.h>

#include <array>
#include <map>
#include <optional>

namespace formpdf::internal {

namespace {

rvoe<uint64_t> find_startxref(std::string_view bytes) {
    const auto pos = bytes.rfind("startxref");
    if(pos == std::string_view::npos) {
        RETERR(MissingStartXRef);
    }
    PdfLexer lex(bytes, pos + 9);
    auto token = lex.next();
    auto *offset = std::get_if<PdfTokenInteger>(&token);
    if(!offset || offset->value < 0 || (uint64_t)offset->value >= bytes.size()) {
        RETERR(MissingStartXRef);
    }
    return (uint64_t)offset->value;
}

struct IndirectObject {
    int64_t number;
    std::string_view body;
};

// Reads "N G obj ... endobj" at exactly the given offset.
rvoe<IndirectObject> read_object_at(std::string_view bytes, uint64_t offset) {
    PdfLexer lex(bytes, offset);
    auto token = lex.next();
    auto *objname = std::get_if<PdfTokenObjName>(&token);
    if(!objname || lex.token_start() != offset) {
        RETERR(XRefMismatch);
    }
    PdfParser p(bytes, lex.current_offset());
    ERC(tree, p.parse());
    size_t end = tree.root_span.end;
    PdfLexer after(bytes, end);
    auto kw = after.next();
    if(auto *k = std::get_if<PdfTokenKeyword>(&kw); k && k->text == "stream") {
        std::optional<int64_t> length;
        if(auto *d = tree.root_dict()) {
            if(auto *e = d->find("Length")) {
                if(auto *i = std::get_if<int64_t>(&e->value)) {
                    length = *i;
                }
            }
        }
        ERCV(after.consume_stream(length));
        end = after.current_offset();
    }
    return IndirectObject{objname->number,
                          bytes.substr(tree.root_span.start, end - tree.root_span.start)};
}

rvoe<int32_t> trailer_root(const PdfValueTree &tree) {
    auto *dict = tree.root_dict();
    if(!dict) {
        RETERR(MalformedInput);
    }
    auto *root = dict->find("Root");
    if(!root || !as_objref(root->value)) {
        RETERR(MissingRoot);
    }
    return (int32_t)as_objref(root->value)->obj;
}

rvoe<int64_t> trailer_size(const PdfValueTree &tree) {
    auto *size = tree.root_dict()->find("Size");
    if(!size || !std::get_if<int64_t>(&size->value)) {
        RETERR(MalformedInput);
    }
    return std::get<int64_t>(size->value);
}

rvoe<NoReturnValue> read_classic_section(std::string_view bytes, VerificationReport &report) {
    ERC(entries, parse_xref_table(bytes, report.xref_offset));
    report.entries = std::move(entries);
    const auto trailer_pos = bytes.find("trailer", report.xref_offset);
    if(trailer_pos == std::string_view::npos) {
        RETERR(MalformedInput);
    }
    ERC(trailer, parse_pdf_value(bytes, trailer_pos + 7));
    if(!trailer.root_dict()) {
        RETERR(MalformedInput);
    }
    ERC(root, trailer_root(trailer));
    ERC(size, trailer_size(trailer));
    report.root = root;
    report.declared_size = size;
    RETOK;
}

rvoe<NoReturnValue> read_stream_section(std::string_view bytes, VerificationReport &report) {
    report.xref_stream = true;
    ERC(obj, read_object_at(bytes, report.xref_offset));
    ERC(parts, split_stream_body(obj.body));
    ERC(tree, parse_pdf_value(parts.dict));
    auto *dict = tree.root_dict();
    auto *type = dict->find("Type");
    if(!type || !as_name(type->value) || *as_name(type->value) != "XRef") {
        fmt::print(stderr, "Object at offset {} is not an XRef stream.\n", report.xref_offset);
        RETERR(MalformedInput);
    }
    ERC(root, trailer_root(tree));
    ERC(size, trailer_size(tree));
    report.root = root;
    report.declared_size = size;

    std::array<int32_t, 3> widths{};
    auto *w = dict->find("W");
    auto *warr = w ? tree.array_of(w->value) : nullptr;
    if(!warr || warr->elements.size() != 3) {
        RETERR(MalformedInput);
    }
    for(size_t i = 0; i < 3; ++i) {
        auto *width = std::get_if<int64_t>(&warr->elements[i]);
        if(!width || *width < 0 || *width > 8) {
            RETERR(MalformedInput);
        }
        widths[i] = (int32_t)*width;
    }
    std::vector<int64_t> index{0, size};
    if(auto *idx = dict->find("Index")) {
        auto *iarr = tree.array_of(idx->value);
        if(!iarr) {
            RETERR(MalformedInput);
        }
        index.clear();
        for(const auto &e : iarr->elements) {
            auto *i = std::get_if<int64_t>(&e);
            if(!i) {
                RETERR(MalformedInput);
            }
            index.push_back(*i);
        }
    }
    ERC(data, decode_stream_data(parts.dict, parts.data));
    ERC(entries, decode_xref_stream_data(str2span(data), widths, index));
    report.entries = std::move(entries);
    RETOK;
}

// Decoded members of one object stream.
typedef std::vector<std::pair<int32_t, std::string>> StreamMembers;

rvoe<NoReturnValue> check_compressed(std::string_view bytes,
                                     const VerificationReport &report,
                                     size_t id,
                                     const XRefCompressed &e,
                                     std::map<int32_t, StreamMembers> &cache) {
    auto it = cache.find(e.stream_object);
    if(it == cache.end()) {
        if(e.stream_object <= 0 || (size_t)e.stream_object >= report.entries.size()) {
            RETERR(XRefMismatch);
        }
        auto *container = std::get_if<XRefNormal>(&report.entries[e.stream_object]);
        if(!container) {
            fmt::print(stderr, "Object stream {} is not a plain object.\n", e.stream_object);
            RETERR(XRefMismatch);
        }
        ERC(obj, read_object_at(bytes, container->offset));
        ERC(parts, split_stream_body(obj.body));
        ERC(payload, decode_stream_data(parts.dict, parts.data));
        ERC(members, unpack_object_stream(parts.dict, payload));
        it = cache.emplace(e.stream_object, std::move(members)).first;
    }
    const auto &members = it->second;
    if(e.index < 0 || (size_t)e.index >= members.size() ||
       members[e.index].first != (int32_t)id) {
        fmt::print(stderr,
                   "Entry {} does not match slot {} of object stream {}.\n",
                   id,
                   e.index,
                   e.stream_object);
        RETERR(XRefMismatch);
    }
    RETOK;
}

} // namespace

rvoe<VerificationReport> verify_document(std::string_view bytes) {
    VerificationReport report;
    ERC(xref_offset, find_startxref(bytes));
    report.xref_offset = xref_offset;
    if(bytes.substr(xref_offset).starts_with("xref")) {
        ERCV(read_classic_section(bytes, report));
    } else {
        ERCV(read_stream_section(bytes, report));
    }
    if(report.declared_size != (int64_t)report.entries.size()) {
        fmt::print(stderr,
                   "Trailer /Size is {} but there are {} entries.\n",
                   report.declared_size,
                   report.entries.size());
        RETERR(XRefMismatch);
    }
    if(report.entries.empty() || !std::holds_alternative<XRefFree>(report.entries.front())) {
        RETERR(XRefMismatch);
    }
    std::map<int32_t, StreamMembers> cache;
    for(size_t id = 0; id < report.entries.size(); ++id) {
        const auto &entry = report.entries[id];
        if(auto *normal = std::get_if<XRefNormal>(&entry)) {
            ++report.num_normal;
            auto obj = read_object_at(bytes, normal->offset);
            if(!obj || obj->number != (int64_t)id) {
                fmt::print(stderr,
                           "Entry {} points to offset {} which does not hold that object.\n",
                           id,
                           normal->offset);
                RETERR(XRefMismatch);
            }
        } else if(auto *compressed = std::get_if<XRefCompressed>(&entry)) {
            ++report.num_compressed;
            ERCV(check_compressed(bytes, report, id, *compressed, cache));
        } else {
            ++report.num_free;
        }
    }
    if(report.root <= 0 || (size_t)report.root >= report.entries.size() ||
       std::holds_alternative<XRefFree>(report.entries[report.root])) {
        fmt::print(stderr, "Root object {} is not in use.\n", report.root);
        RETERR(MissingRoot);
    }
    return report;
}

} // namespace formpdf::internal
