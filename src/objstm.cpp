// SPDX-License-Identifier: Apache-2.0
// Copyright 2024-2025 Jussi Pakkanen

#include <objstm.hpp>
#include <objectformatter.hpp>
#include <objectstore.hpp>
#include <pdfparser.hpp>
#include <utils.hpp>

#include <fmt/core.h>

#include <algorithm>
#include <iterator>

namespace formpdf::internal {

namespace {

std::string_view trim(std::string_view s) {
    while(!s.empty() && is_pdf_whitespace(s.front())) {
        s.remove_prefix(1);
    }
    while(!s.empty() && is_pdf_whitespace(s.back())) {
        s.remove_suffix(1);
    }
    return s;
}

rvoe<int64_t> integer_entry(const PdfValueTree &tree, std::string_view key) {
    auto *dict = tree.root_dict();
    if(!dict) {
        RETERR(MalformedObjectStream);
    }
    auto *e = dict->find(key);
    if(!e) {
        RETERR(MalformedObjectStream);
    }
    auto *i = std::get_if<int64_t>(&e->value);
    if(!i || *i < 0) {
        RETERR(MalformedObjectStream);
    }
    return *i;
}

} // namespace

std::optional<int32_t> PackedObjectStream::index_of(int32_t id) const {
    auto it = std::lower_bound(ids.begin(), ids.end(), id);
    if(it == ids.end() || *it != id) {
        return {};
    }
    return (int32_t)(it - ids.begin());
}

rvoe<PackedObjectStream>
pack_object_stream(const std::map<int32_t, std::string> &members, int32_t stream_id, bool compress) {
    PackedObjectStream result;
    result.stream_id = stream_id;
    std::string header;
    std::string bodies;
    auto app = std::back_inserter(header);
    for(const auto &[id, body] : members) {
        if(is_stream_body(body)) {
            fmt::print(stderr, "Object {} is a stream and can not go in an object stream.\n", id);
            RETERR(StreamInObjectStream);
        }
        if(!header.empty()) {
            header += ' ';
        }
        fmt::format_to(app, "{} {}", id, bodies.size());
        bodies += body;
        bodies += ' ';
        result.ids.push_back(id);
    }
    header += ' ';
    const auto first = header.size();
    const std::string raw_stream = header + bodies;

    ObjectFormatter objstm;
    objstm.begin_dict();
    objstm.add_token_pair("/Type", "/ObjStm");
    objstm.add_token_pair("/N", result.ids.size());
    objstm.add_token_pair("/First", first);
    if(compress) {
        ERC(compressed_stream, flate_compress(raw_stream));
        objstm.add_token_pair("/Length", compressed_stream.size());
        objstm.add_token_pair("/Filter", "/FlateDecode");
        objstm.end_dict();
        result.body = objstm.steal();
        result.body += "stream\n";
        result.body += span2sv(compressed_stream);
    } else {
        objstm.add_token_pair("/Length", raw_stream.size());
        objstm.end_dict();
        result.body = objstm.steal();
        result.body += "stream\n";
        result.body += raw_stream;
    }
    result.body += "\nendstream";
    return result;
}

rvoe<std::vector<std::pair<int32_t, std::string>>>
unpack_object_stream(std::string_view dict_text, std::string_view payload) {
    ERC(tree, parse_pdf_value(dict_text));
    ERC(n, integer_entry(tree, "N"));
    ERC(first, integer_entry(tree, "First"));
    if((size_t)first > payload.size()) {
        RETERR(MalformedObjectStream);
    }
    std::vector<std::pair<int32_t, size_t>> offsets;
    PdfLexer lex(payload.substr(0, first));
    for(int64_t i = 0; i < n; ++i) {
        auto idtok = lex.next();
        auto offtok = lex.next();
        auto *id = std::get_if<PdfTokenInteger>(&idtok);
        auto *off = std::get_if<PdfTokenInteger>(&offtok);
        if(!id || !off || id->value <= 0 || off->value < 0 ||
           (size_t)(first + off->value) > payload.size()) {
            RETERR(MalformedObjectStream);
        }
        offsets.emplace_back((int32_t)id->value, (size_t)(first + off->value));
    }
    std::vector<std::pair<int32_t, std::string>> result;
    result.reserve(offsets.size());
    for(size_t i = 0; i < offsets.size(); ++i) {
        const auto start = offsets[i].second;
        const auto end = i + 1 < offsets.size() ? offsets[i + 1].second : payload.size();
        if(end < start) {
            RETERR(MalformedObjectStream);
        }
        result.emplace_back(offsets[i].first,
                            std::string(trim(payload.substr(start, end - start))));
    }
    return result;
}

} // namespace formpdf::internal
