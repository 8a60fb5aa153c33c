/*
 * Copyright 2023-2025 Jussi Pakkanen
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <pdfparser.hpp>
#include <literalstring.hpp>

#include <cstdlib>
#include <string>

namespace formpdf::internal {

namespace {

const size_t max_nesting_depth = 256;

bool is_digit(char c) { return c >= '0' && c <= '9'; }

int hexdigit(char c) {
    if(c >= '0' && c <= '9') {
        return c - '0';
    }
    if(c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if(c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

} // namespace

bool is_pdf_whitespace(char c) {
    return c == ' ' || c == '\n' || c == '\r' || c == '\t' || c == '\f' || c == '\0';
}

bool is_pdf_delimiter(char c) {
    switch(c) {
    case '(':
    case ')':
    case '<':
    case '>':
    case '[':
    case ']':
    case '{':
    case '}':
    case '/':
    case '%':
        return true;
    default:
        return false;
    }
}

void PdfLexer::skip_whitespace_and_comments() {
    while(offset < text.size()) {
        const char c = text[offset];
        if(is_pdf_whitespace(c)) {
            ++offset;
        } else if(c == '%') {
            while(offset < text.size() && text[offset] != '\n' && text[offset] != '\r') {
                ++offset;
            }
        } else {
            break;
        }
    }
}

// Checks whether "<ws> <digits> <ws>" follows pos.
bool PdfLexer::lookahead_integer_pair(size_t pos, int64_t &second, size_t &after_second) const {
    if(pos >= text.size() || !is_pdf_whitespace(text[pos])) {
        return false;
    }
    while(pos < text.size() && is_pdf_whitespace(text[pos])) {
        ++pos;
    }
    const size_t digits_start = pos;
    while(pos < text.size() && is_digit(text[pos])) {
        ++pos;
    }
    if(pos == digits_start || pos - digits_start > 10) {
        return false;
    }
    if(pos >= text.size() || !is_pdf_whitespace(text[pos])) {
        return false;
    }
    second = strtoll(std::string(text.substr(digits_start, pos - digits_start)).c_str(), nullptr, 10);
    while(pos < text.size() && is_pdf_whitespace(text[pos])) {
        ++pos;
    }
    after_second = pos;
    return true;
}

PdfToken PdfLexer::lex_number() {
    const size_t start = offset;
    size_t pos = offset;
    bool has_sign = false;
    bool has_dot = false;
    size_t num_digits = 0;
    if(text[pos] == '+' || text[pos] == '-') {
        has_sign = true;
        ++pos;
    }
    while(pos < text.size()) {
        const char c = text[pos];
        if(is_digit(c)) {
            ++num_digits;
        } else if(c == '.' && !has_dot) {
            has_dot = true;
        } else {
            break;
        }
        ++pos;
    }
    if(num_digits == 0) {
        return PdfTokenError{ErrorCode::MalformedNumber};
    }
    const std::string numtext(text.substr(start, pos - start));
    offset = pos;
    if(has_dot) {
        return PdfTokenReal{strtod(numtext.c_str(), nullptr)};
    }
    const int64_t value = strtoll(numtext.c_str(), nullptr, 10);
    if(!has_sign) {
        int64_t second;
        size_t after_second;
        if(lookahead_integer_pair(pos, second, after_second)) {
            auto rest = text.substr(after_second);
            auto keyword_ends = [&](size_t len) {
                return rest.size() == len || is_pdf_whitespace(rest[len]) ||
                       is_pdf_delimiter(rest[len]);
            };
            if(rest.starts_with("R") && keyword_ends(1)) {
                offset = after_second + 1;
                return PdfTokenObjRef(value, second);
            }
            if(rest.starts_with("obj") && keyword_ends(3)) {
                offset = after_second + 3;
                return PdfTokenObjName(value, second);
            }
        }
    }
    return PdfTokenInteger{value};
}

PdfToken PdfLexer::lex_name() {
    ++offset; // The slash.
    std::string name;
    while(offset < text.size()) {
        const char c = text[offset];
        if(is_pdf_whitespace(c) || is_pdf_delimiter(c)) {
            break;
        }
        if(c == '#' && offset + 2 < text.size() && hexdigit(text[offset + 1]) >= 0 &&
           hexdigit(text[offset + 2]) >= 0) {
            name.push_back(char(hexdigit(text[offset + 1]) * 16 + hexdigit(text[offset + 2])));
            offset += 3;
            continue;
        }
        name.push_back(c);
        ++offset;
    }
    return PdfTokenName(std::move(name));
}

PdfToken PdfLexer::next() {
    skip_whitespace_and_comments();
    last_start = offset;
    if(offset >= text.size()) {
        return PdfTokenFinished{};
    }
    const char c = text[offset];
    switch(c) {
    case '<':
        if(offset + 1 < text.size() && text[offset + 1] == '<') {
            offset += 2;
            return PdfTokenDictStart{};
        } else {
            const auto end = text.find('>', offset + 1);
            if(end == std::string_view::npos) {
                return PdfTokenError{ErrorCode::UnterminatedString};
            }
            std::string hexs(text.substr(offset + 1, end - offset - 1));
            offset = end + 1;
            return PdfTokenHexString(std::move(hexs));
        }
    case '>':
        if(offset + 1 < text.size() && text[offset + 1] == '>') {
            offset += 2;
            return PdfTokenDictEnd{};
        }
        return PdfTokenError{ErrorCode::UnbalancedDelimiters};
    case '[':
        ++offset;
        return PdfTokenArrayStart{};
    case ']':
        ++offset;
        return PdfTokenArrayEnd{};
    case '(': {
        auto end = find_literal_string_end(text, offset);
        if(!end) {
            return PdfTokenError{end.error()};
        }
        std::string temptext(text.substr(offset + 1, *end - offset - 1));
        offset = *end + 1;
        return PdfTokenString(std::move(temptext));
    }
    case ')':
        return PdfTokenError{ErrorCode::UnbalancedDelimiters};
    case '/':
        return lex_name();
    case '{':
    case '}':
        ++offset;
        return PdfTokenKeyword(std::string(1, c));
    default:
        break;
    }
    if(is_digit(c) || c == '+' || c == '-' || c == '.') {
        return lex_number();
    }
    const size_t start = offset;
    while(offset < text.size() && !is_pdf_whitespace(text[offset]) &&
          !is_pdf_delimiter(text[offset])) {
        ++offset;
    }
    return PdfTokenKeyword(std::string(text.substr(start, offset - start)));
}

rvoe<TextSpan> PdfLexer::consume_stream(std::optional<int64_t> length) {
    size_t data_start = offset;
    // The keyword is followed by CRLF or LF. A lone CR is accepted too.
    if(data_start < text.size() && text[data_start] == '\r') {
        ++data_start;
    }
    if(data_start < text.size() && text[data_start] == '\n') {
        ++data_start;
    }
    if(length && *length >= 0 && data_start + (size_t)*length <= text.size()) {
        size_t pos = data_start + *length;
        const size_t data_end = pos;
        while(pos < text.size() && is_pdf_whitespace(text[pos])) {
            ++pos;
        }
        if(text.substr(pos).starts_with("endstream")) {
            offset = pos + 9;
            return TextSpan{data_start, data_end};
        }
    }
    // Length is indirect or wrong, fall back to searching.
    const auto endstream = text.find("endstream", data_start);
    if(endstream == std::string_view::npos) {
        RETERR(TruncatedObject);
    }
    size_t data_end = endstream;
    // The EOL before endstream is not part of the data.
    if(data_end > data_start && text[data_end - 1] == '\n') {
        --data_end;
    }
    if(data_end > data_start && text[data_end - 1] == '\r') {
        --data_end;
    }
    offset = endstream + 9;
    return TextSpan{data_start, data_end};
}

const PdfDictEntry *PdfDict::find(std::string_view key) const {
    for(const auto &e : entries) {
        if(e.key == key) {
            return &e;
        }
    }
    return nullptr;
}

const PdfDict *PdfValueTree::root_dict() const { return dict_of(root); }

const PdfDict *PdfValueTree::dict_of(const PdfValueElement &e) const {
    if(auto *d = std::get_if<PdfNodeDict>(&e)) {
        return &dicts.at(d->i);
    }
    return nullptr;
}

const PdfArray *PdfValueTree::array_of(const PdfValueElement &e) const {
    if(auto *a = std::get_if<PdfNodeArray>(&e)) {
        return &arrays.at(a->i);
    }
    return nullptr;
}

std::optional<PdfNodeObjRef> as_objref(const PdfValueElement &e) {
    if(auto *r = std::get_if<PdfNodeObjRef>(&e)) {
        return *r;
    }
    return {};
}

std::optional<double> as_number(const PdfValueElement &e) {
    if(auto *i = std::get_if<int64_t>(&e)) {
        return double(*i);
    }
    if(auto *d = std::get_if<double>(&e)) {
        return *d;
    }
    return {};
}

const std::string *as_name(const PdfValueElement &e) {
    if(auto *n = std::get_if<PdfNodeName>(&e)) {
        return &n->value;
    }
    return nullptr;
}

rvoe<PdfValueTree> PdfParser::parse() {
    const auto &first = peek();
    const size_t start = pending_span.start;
    if(auto *err = std::get_if<PdfTokenError>(&first)) {
        return std::unexpected(err->code);
    }
    ERC(root, parse_value(0));
    tree.root = std::move(root);
    tree.root_span = TextSpan{start, last_span.end};
    return std::move(tree);
}

rvoe<PdfValueElement> PdfParser::parse_value(size_t depth) {
    if(depth > max_nesting_depth) {
        RETERR(MalformedInput);
    }
    if(auto intval = accept<PdfTokenInteger>(); intval) {
        return intval->value;
    }
    if(auto realval = accept<PdfTokenReal>(); realval) {
        return realval->value;
    }
    if(auto refval = accept<PdfTokenObjRef>(); refval) {
        return PdfNodeObjRef{refval->objnum, refval->version};
    }
    if(auto strval = accept<PdfTokenString>(); strval) {
        return PdfNodeString{std::move(strval->text)};
    }
    if(auto nameval = accept<PdfTokenName>(); nameval) {
        return PdfNodeName{std::move(nameval->text)};
    }
    if(auto strval = accept<PdfTokenHexString>(); strval) {
        return PdfNodeHexString{std::move(strval->text)};
    }
    if(auto dictval = accept<PdfTokenDictStart>(); dictval) {
        ERC(dict_id, parse_dict(depth, last_span.start));
        return PdfNodeDict(dict_id);
    }
    if(auto arrval = accept<PdfTokenArrayStart>(); arrval) {
        ERC(array_id, parse_array(depth, last_span.start));
        return PdfNodeArray(array_id);
    }
    if(auto kwval = accept<PdfTokenKeyword>(); kwval) {
        if(kwval->text == "endobj" || kwval->text == "stream" || kwval->text == "endstream") {
            RETERR(TruncatedObject);
        }
        return PdfNodeKeyword{std::move(kwval->text)};
    }
    if(auto *err = std::get_if<PdfTokenError>(&peek())) {
        return std::unexpected(err->code);
    }
    if(std::holds_alternative<PdfTokenFinished>(peek())) {
        RETERR(UnbalancedDelimiters);
    }
    // A stray closing bracket or an object header in the middle of a value.
    RETERR(UnbalancedDelimiters);
}

rvoe<size_t> PdfParser::parse_dict(size_t depth, size_t start) {
    PdfDict dict;
    while(true) {
        if(auto the_end = accept<PdfTokenDictEnd>(); the_end) {
            dict.span = TextSpan{start, last_span.end};
            tree.dicts.emplace_back(std::move(dict));
            return tree.dicts.size() - 1;
        }
        auto k = accept<PdfTokenName>();
        if(!k) {
            if(auto *err = std::get_if<PdfTokenError>(&peek())) {
                return std::unexpected(err->code);
            }
            if(auto *kw = std::get_if<PdfTokenKeyword>(&peek()); kw && kw->text == "endobj") {
                RETERR(TruncatedObject);
            }
            RETERR(UnbalancedDelimiters);
        }
        const TextSpan key_span = last_span;
        peek();
        const size_t value_start = pending_span.start;
        ERC(v, parse_value(depth + 1));
        dict.entries.emplace_back(PdfDictEntry{
            std::move(k->text), std::move(v), key_span, TextSpan{value_start, last_span.end}});
    }
}

rvoe<size_t> PdfParser::parse_array(size_t depth, size_t start) {
    PdfArray arr;
    while(true) {
        if(auto the_end = accept<PdfTokenArrayEnd>(); the_end) {
            arr.span = TextSpan{start, last_span.end};
            tree.arrays.emplace_back(std::move(arr));
            return tree.arrays.size() - 1;
        }
        ERC(v, parse_value(depth + 1));
        arr.elements.emplace_back(std::move(v));
    }
}

rvoe<PdfValueTree> parse_pdf_value(std::string_view text, size_t offset) {
    PdfParser p(text, offset);
    return p.parse();
}

} // namespace formpdf::internal
