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

#pragma once

#include <errorhandling.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace formpdf::internal {

// Half open byte range [start, end) in the parsed buffer.
struct TextSpan {
    size_t start = 0;
    size_t end = 0;

    size_t size() const { return end - start; }
    std::string_view of(std::string_view text) const { return text.substr(start, end - start); }
};

struct PdfTokenArrayStart {};

struct PdfTokenArrayEnd {};

struct PdfTokenDictStart {};

struct PdfTokenDictEnd {};

// Raw contents between the parentheses, escapes not yet decoded.
struct PdfTokenString {
    explicit PdfTokenString(std::string s) : text(std::move(s)) {}
    std::string text;
};

// Without leading slash, #xx escapes decoded.
struct PdfTokenName {
    explicit PdfTokenName(std::string s) : text(std::move(s)) {}
    std::string text;
};

struct PdfTokenObjName {
    PdfTokenObjName(int64_t number_, int64_t version_) : number(number_), version(version_) {}
    int64_t number;
    int64_t version;
};

struct PdfTokenHexString {
    explicit PdfTokenHexString(std::string s) : text(std::move(s)) {}
    std::string text;
};

struct PdfTokenObjRef {
    PdfTokenObjRef(int64_t o, int64_t v) {
        objnum = o;
        version = v;
    }
    int64_t objnum, version;
};

struct PdfTokenInteger {
    int64_t value;
};

struct PdfTokenReal {
    double value;
};

// Any other run of regular characters: endobj, stream, true, null, trailer etc.
struct PdfTokenKeyword {
    explicit PdfTokenKeyword(std::string s) : text(std::move(s)) {}
    std::string text;
};

struct PdfTokenFinished {};

struct PdfTokenError {
    ErrorCode code;
};

typedef std::variant<PdfTokenDictStart,
                     PdfTokenDictEnd,
                     PdfTokenArrayStart,
                     PdfTokenArrayEnd,
                     PdfTokenString,
                     PdfTokenName,
                     PdfTokenObjName,
                     PdfTokenObjRef,
                     PdfTokenHexString,
                     PdfTokenInteger,
                     PdfTokenReal,
                     PdfTokenKeyword,
                     PdfTokenError,
                     PdfTokenFinished>
    PdfToken;

bool is_pdf_whitespace(char c);
bool is_pdf_delimiter(char c);

class PdfLexer {
public:
    explicit PdfLexer(std::string_view t, size_t start_offset = 0)
        : text(t), offset(start_offset), last_start(start_offset) {}

    PdfToken next();

    // Call right after a "stream" keyword. Returns the span of the raw stream
    // data and positions the lexer after "endstream".
    rvoe<TextSpan> consume_stream(std::optional<int64_t> length);

    size_t current_offset() const { return offset; }
    size_t token_start() const { return last_start; }
    void set_offset(size_t new_offset) { offset = new_offset; }

    std::string_view buffer() const { return text; }

private:
    void skip_whitespace_and_comments();
    bool lookahead_integer_pair(size_t pos, int64_t &second, size_t &after_second) const;
    PdfToken lex_number();
    PdfToken lex_name();

    std::string_view text;
    size_t offset;
    size_t last_start;
};

struct PdfNodeArray {
    size_t i;
};
struct PdfNodeDict {
    size_t i;
};
struct PdfNodeObjRef {
    int64_t obj;
    int64_t version;
};
struct PdfNodeString {
    std::string value;
}; // Still escaped.
struct PdfNodeName {
    std::string value;
}; // Without leading slash.
struct PdfNodeHexString {
    std::string value;
};
struct PdfNodeKeyword {
    std::string value;
};

typedef std::variant<int64_t,
                     double,
                     PdfNodeArray,
                     PdfNodeDict,
                     PdfNodeObjRef,
                     PdfNodeString,
                     PdfNodeName,
                     PdfNodeHexString,
                     PdfNodeKeyword>
    PdfValueElement;

struct PdfDictEntry {
    std::string key;
    PdfValueElement value;
    TextSpan key_span;
    TextSpan value_span;
};

struct PdfDict {
    std::vector<PdfDictEntry> entries;
    TextSpan span;

    const PdfDictEntry *find(std::string_view key) const;
};

struct PdfArray {
    std::vector<PdfValueElement> elements;
    TextSpan span;
};

struct PdfValueTree {
    std::vector<PdfArray> arrays;
    std::vector<PdfDict> dicts;
    PdfValueElement root;
    TextSpan root_span;

    const PdfDict *root_dict() const;
    const PdfDict *dict_of(const PdfValueElement &e) const;
    const PdfArray *array_of(const PdfValueElement &e) const;
};

std::optional<PdfNodeObjRef> as_objref(const PdfValueElement &e);
std::optional<double> as_number(const PdfValueElement &e);
const std::string *as_name(const PdfValueElement &e);

// Parses exactly one value starting at the given offset. Nothing after the
// value is read, so trailing binary data is never touched.
class PdfParser {
public:
    explicit PdfParser(std::string_view t, size_t start_offset = 0) : lex(t, start_offset) {}

    rvoe<PdfValueTree> parse();

private:
    rvoe<PdfValueElement> parse_value(size_t depth);

    rvoe<size_t> parse_dict(size_t depth, size_t start);
    rvoe<size_t> parse_array(size_t depth, size_t start);

    PdfToken &peek() {
        if(!has_pending) {
            pending = lex.next();
            pending_span = TextSpan{lex.token_start(), lex.current_offset()};
            has_pending = true;
        }
        return pending;
    }

    template<typename T> std::optional<T> accept() {
        if(!std::holds_alternative<T>(peek())) {
            return {};
        }
        has_pending = false;
        last_span = pending_span;
        return std::move(std::get<T>(pending));
    }

    PdfLexer lex;
    PdfToken pending;
    TextSpan pending_span;
    TextSpan last_span;
    bool has_pending = false;
    PdfValueTree tree;
};

// Convenience wrapper for a standalone dictionary or object body.
rvoe<PdfValueTree> parse_pdf_value(std::string_view text, size_t offset = 0);

} // namespace formpdf::internal
