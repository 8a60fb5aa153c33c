// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2025 Jussi Pakkanen

#include <objectstore.hpp>
#include <pdfparser.hpp>

#include <limits>

namespace formpdf::internal {

int32_t ObjectStore::add(std::string body) {
    const auto id = reserve_id();
    objects[id] = std::move(body);
    return id;
}

rvoe<NoReturnValue> ObjectStore::set(int32_t id, std::string body) {
    // The next free number must still fit.
    if(id <= 0 || id == std::numeric_limits<int32_t>::max()) {
        RETERR(BadId);
    }
    objects[id] = std::move(body);
    if(id >= next_id) {
        next_id = id + 1;
    }
    RETOK;
}

rvoe<const std::string *> ObjectStore::get(int32_t id) const {
    auto it = objects.find(id);
    if(it == objects.end()) {
        RETERR(BadId);
    }
    return &it->second;
}

bool is_stream_body(std::string_view body) {
    PdfParser p(body);
    auto tree = p.parse();
    if(!tree) {
        return false;
    }
    PdfLexer lex(body, tree->root_span.end);
    auto token = lex.next();
    auto *kw = std::get_if<PdfTokenKeyword>(&token);
    return kw && kw->text == "stream";
}

} // namespace formpdf::internal
