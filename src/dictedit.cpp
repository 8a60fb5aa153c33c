// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#include <dictedit.hpp>
#include <pdfparser.hpp>

namespace formpdf::internal {

namespace {

rvoe<PdfValueTree> parse_body_dict(std::string_view body) {
    ERC(tree, parse_pdf_value(body));
    if(!tree.root_dict()) {
        RETERR(MalformedInput);
    }
    return std::move(tree);
}

} // namespace

rvoe<std::string>
set_dict_entry(std::string_view body, std::string_view key, std::string_view value_text) {
    ERC(tree, parse_body_dict(body));
    const auto *dict = tree.root_dict();
    std::string result;
    result.reserve(body.size() + key.size() + value_text.size() + 4);
    if(auto *e = dict->find(key)) {
        result += body.substr(0, e->value_span.start);
        result += value_text;
        result += body.substr(e->value_span.end);
        return result;
    }
    // Closing ">>" is the last two bytes of the dictionary span.
    const auto insert_point = dict->span.end - 2;
    result += body.substr(0, insert_point);
    if(insert_point > 0 && !is_pdf_whitespace(body[insert_point - 1])) {
        result += ' ';
    }
    result += '/';
    result += key;
    result += ' ';
    result += value_text;
    result += ' ';
    result += body.substr(insert_point);
    return result;
}

rvoe<std::string> remove_dict_entry(std::string_view body, std::string_view key) {
    ERC(tree, parse_body_dict(body));
    const auto *e = tree.root_dict()->find(key);
    if(!e) {
        return std::string(body);
    }
    size_t end = e->value_span.end;
    while(end < body.size() && is_pdf_whitespace(body[end])) {
        ++end;
    }
    std::string result(body.substr(0, e->key_span.start));
    result += body.substr(end);
    return result;
}

} // namespace formpdf::internal
