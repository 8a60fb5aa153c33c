// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2025 Jussi Pakkanen

#include <literalstring.hpp>

namespace formpdf::internal {

namespace {

bool is_octal(char c) { return c >= '0' && c <= '7'; }

int hexvalue(char c) {
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

std::string pdfstring_escape(std::string_view raw_string) {
    std::string result;
    result.reserve(raw_string.size() + raw_string.size() / 8 + 2);
    for(const char c : raw_string) {
        switch(c) {
        case '(':
        case ')':
        case '\\':
            result.push_back('\\');
            break;
        default:
            break;
        }
        result.push_back(c);
    }
    return result;
}

std::string pdfstring_quote(std::string_view raw_string) {
    std::string result;
    result.reserve(raw_string.size() * 2 + 2);
    result.push_back('(');
    result += pdfstring_escape(raw_string);
    result.push_back(')');
    return result;
}

std::string pdfstring_decode(std::string_view escaped) {
    std::string out;
    out.reserve(escaped.size());
    size_t i = 0;
    const size_t L = escaped.size();
    while(i < L) {
        const char c = escaped[i];
        if(c != '\\') {
            out.push_back(c);
            ++i;
            continue;
        }
        ++i;
        if(i >= L) {
            // Dangling backslash.
            break;
        }
        const char e = escaped[i];
        switch(e) {
        case 'n':
            out.push_back('\n');
            ++i;
            break;
        case 'r':
            out.push_back('\r');
            ++i;
            break;
        case 't':
            out.push_back('\t');
            ++i;
            break;
        case 'b':
            out.push_back('\b');
            ++i;
            break;
        case 'f':
            out.push_back('\f');
            ++i;
            break;
        case '(':
        case ')':
        case '\\':
            out.push_back(e);
            ++i;
            break;
        default:
            if(is_octal(e)) {
                int value = 0;
                int digits = 0;
                while(digits < 3 && i < L && is_octal(escaped[i])) {
                    value = value * 8 + (escaped[i] - '0');
                    ++i;
                    ++digits;
                }
                // High order overflow is ignored.
                out.push_back(char(value & 0xFF));
            } else {
                out.push_back(e);
                ++i;
            }
            break;
        }
    }
    return out;
}

rvoe<std::string> pdf_hexstring_decode(std::string_view hex) {
    std::string out;
    out.reserve(hex.size() / 2 + 1);
    int pending = -1;
    for(const char c : hex) {
        if(c == ' ' || c == '\n' || c == '\r' || c == '\t' || c == '\f' || c == '\0') {
            continue;
        }
        const int v = hexvalue(c);
        if(v < 0) {
            RETERR(MalformedInput);
        }
        if(pending < 0) {
            pending = v;
        } else {
            out.push_back(char(pending * 16 + v));
            pending = -1;
        }
    }
    // Odd digit count means a trailing zero.
    if(pending >= 0) {
        out.push_back(char(pending * 16));
    }
    return out;
}

rvoe<size_t> find_literal_string_end(std::string_view text, size_t open_paren) {
    if(open_paren >= text.size() || text[open_paren] != '(') {
        RETERR(MalformedInput);
    }
    int num_parens = 1;
    size_t i = open_paren + 1;
    while(i < text.size()) {
        switch(text[i]) {
        case '\\':
            // Skip whatever is escaped.
            ++i;
            break;
        case '(':
            ++num_parens;
            break;
        case ')':
            if(--num_parens == 0) {
                return i;
            }
            break;
        default:
            break;
        }
        ++i;
    }
    RETERR(UnterminatedString);
}

} // namespace formpdf::internal
