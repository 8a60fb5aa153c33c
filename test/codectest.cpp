// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#include "testcommon.hpp"

#include <commandstreamformatter.hpp>
#include <dictedit.hpp>
#include <literalstring.hpp>
#include <pdfparser.hpp>

#include <string>
#include <variant>

using namespace formpdf::internal;

namespace {

int test_escape() {
    TEST_CHECK(pdfstring_escape("plain text") == "plain text");
    TEST_CHECK(pdfstring_escape("a(b)c") == "a\\(b\\)c");
    TEST_CHECK(pdfstring_escape("back\\slash") == "back\\\\slash");
    // Line feeds are not escaped.
    TEST_CHECK(pdfstring_escape("two\nlines") == "two\nlines");
    TEST_CHECK(pdfstring_quote("Acme (PPO)") == "(Acme \\(PPO\\))");
    return 0;
}

int test_decode() {
    TEST_CHECK(pdfstring_decode("John Doe") == "John Doe");
    TEST_CHECK(pdfstring_decode("a\\(b\\)c") == "a(b)c");
    TEST_CHECK(pdfstring_decode("\\n\\r\\t\\b\\f") == "\n\r\t\b\f");
    TEST_CHECK(pdfstring_decode("\\\\") == "\\");
    TEST_CHECK(pdfstring_decode("\\101\\102C") == "ABC");
    TEST_CHECK(pdfstring_decode("\\7") == std::string(1, '\7'));
    // At most three octal digits form one character.
    TEST_CHECK(pdfstring_decode("\\1010") == "A0");
    // 8 and 9 are not octal digits.
    TEST_CHECK(pdfstring_decode("\\8") == "8");
    TEST_CHECK(pdfstring_decode("\\q") == "q");
    TEST_CHECK(pdfstring_decode("dangling\\") == "dangling");
    return 0;
}

int test_multiline_note() {
    const std::string note = "Patient reports high fever for 3 days.\nPrescribed antibiotics.";
    TEST_CHECK(pdfstring_decode(pdfstring_escape(note)) == note);
    const std::string tricky = "(nested (parens)) and \\ backslash\r\n";
    TEST_CHECK(pdfstring_decode(pdfstring_escape(tricky)) == tricky);
    return 0;
}

int test_hexstring() {
    TEST_UNWRAP(john, pdf_hexstring_decode("4A6F686E"));
    TEST_CHECK(john == "John");
    TEST_UNWRAP(spaced, pdf_hexstring_decode("4a 6f\n68 6e"));
    TEST_CHECK(spaced == "John");
    TEST_UNWRAP(odd, pdf_hexstring_decode("414"));
    TEST_CHECK(odd == std::string("A@"));
    TEST_ERROR(pdf_hexstring_decode("4G"), MalformedInput);
    return 0;
}

int test_string_end() {
    const std::string_view text = "/V (a (b) \\) c) /DA (x)";
    TEST_UNWRAP(end, find_literal_string_end(text, 3));
    TEST_CHECK(end == 14);
    TEST_ERROR(find_literal_string_end("(never closed", 0), UnterminatedString);
    TEST_ERROR(find_literal_string_end("no paren", 0), MalformedInput);
    return 0;
}

int test_lexer() {
    PdfLexer lex("12 0 obj << /Name#20X 3 0 R -1.5 (str) <41> >> % comment\nendobj");
    auto t = lex.next();
    auto *objname = std::get_if<PdfTokenObjName>(&t);
    TEST_CHECK(objname && objname->number == 12 && objname->version == 0);
    TEST_CHECK(std::holds_alternative<PdfTokenDictStart>(lex.next()));
    t = lex.next();
    auto *name = std::get_if<PdfTokenName>(&t);
    TEST_CHECK(name && name->text == "Name X");
    t = lex.next();
    auto *ref = std::get_if<PdfTokenObjRef>(&t);
    TEST_CHECK(ref && ref->objnum == 3 && ref->version == 0);
    t = lex.next();
    auto *real = std::get_if<PdfTokenReal>(&t);
    TEST_CHECK(real && real->value == -1.5);
    t = lex.next();
    auto *str = std::get_if<PdfTokenString>(&t);
    TEST_CHECK(str && str->text == "str");
    t = lex.next();
    auto *hex = std::get_if<PdfTokenHexString>(&t);
    TEST_CHECK(hex && hex->text == "41");
    TEST_CHECK(std::holds_alternative<PdfTokenDictEnd>(lex.next()));
    t = lex.next();
    auto *kw = std::get_if<PdfTokenKeyword>(&t);
    TEST_CHECK(kw && kw->text == "endobj");
    TEST_CHECK(std::holds_alternative<PdfTokenFinished>(lex.next()));
    return 0;
}

int test_lexer_plain_integers() {
    // Two integers not followed by R or obj stay separate.
    PdfLexer lex("[150 700 350 720]");
    TEST_CHECK(std::holds_alternative<PdfTokenArrayStart>(lex.next()));
    for(const int64_t expected : {150, 700, 350, 720}) {
        auto t = lex.next();
        auto *i = std::get_if<PdfTokenInteger>(&t);
        TEST_CHECK(i && i->value == expected);
    }
    TEST_CHECK(std::holds_alternative<PdfTokenArrayEnd>(lex.next()));
    return 0;
}

int test_parser() {
    const std::string_view body =
        "<< /Type /Page /Rect [1 2.5 3 4] /Resources << /Font << /F1 8 0 R >> >> /V (x) >>";
    TEST_UNWRAP(tree, parse_pdf_value(body));
    auto *dict = tree.root_dict();
    TEST_CHECK(dict);
    TEST_CHECK(dict->entries.size() == 4);
    auto *type = dict->find("Type");
    TEST_CHECK(type && as_name(type->value) && *as_name(type->value) == "Page");
    auto *rect = dict->find("Rect");
    TEST_CHECK(rect);
    auto *arr = tree.array_of(rect->value);
    TEST_CHECK(arr && arr->elements.size() == 4);
    TEST_CHECK(as_number(arr->elements[1]) == 2.5);
    TEST_CHECK(rect->value_span.of(body) == "[1 2.5 3 4]");
    TEST_CHECK(rect->key_span.of(body) == "/Rect");
    auto *res = dict->find("Resources");
    TEST_CHECK(res && res->value_span.of(body) == "<< /Font << /F1 8 0 R >> >>");
    auto *resdict = tree.dict_of(res->value);
    TEST_CHECK(resdict);
    auto *fonts = tree.dict_of(resdict->find("Font")->value);
    TEST_CHECK(fonts);
    auto ref = as_objref(fonts->find("F1")->value);
    TEST_CHECK(ref && ref->obj == 8);
    TEST_CHECK(tree.root_span.of(body) == body);
    return 0;
}

int test_parser_errors() {
    TEST_ERROR(parse_pdf_value("<< /A [1 2 >> >>"), UnbalancedDelimiters);
    TEST_ERROR(parse_pdf_value("<< /A 1"), UnbalancedDelimiters);
    TEST_ERROR(parse_pdf_value("<< /A endobj"), TruncatedObject);
    TEST_ERROR(parse_pdf_value("<< /A (open"), UnterminatedString);
    std::string deep;
    for(int i = 0; i < 300; ++i) {
        deep += '[';
    }
    TEST_ERROR(parse_pdf_value(deep), MalformedInput);
    return 0;
}

int test_dict_edit() {
    TEST_UNWRAP(replaced, set_dict_entry("<< /A 1 /B 2 >>", "B", "3"));
    TEST_CHECK(replaced == "<< /A 1 /B 3 >>");
    TEST_UNWRAP(appended, set_dict_entry("<< /A 1 >>", "C", "[ 4 0 R ]"));
    TEST_CHECK(appended == "<< /A 1 /C [ 4 0 R ] >>");
    TEST_UNWRAP(removed, remove_dict_entry("<< /A 1 /B [1 2] /C 3 >>", "B"));
    TEST_CHECK(removed == "<< /A 1 /C 3 >>");
    TEST_UNWRAP(untouched, remove_dict_entry("<< /A 1 >>", "Z"));
    TEST_CHECK(untouched == "<< /A 1 >>");
    // Stream data after the dictionary is not touched.
    const std::string stream_body = "<< /Length 3 >>\nstream\n>>)\nendstream";
    TEST_UNWRAP(with_filter, set_dict_entry(stream_body, "Length", "4"));
    TEST_CHECK(with_filter == "<< /Length 4 >>\nstream\n>>)\nendstream");
    TEST_ERROR(set_dict_entry("[1 2]", "A", "1"), MalformedInput);
    return 0;
}

int test_command_stream() {
    CommandStreamFormatter cmds;
    TEST_CHECK(cmds.q());
    TEST_CHECK(cmds.BT());
    cmds.append("/Helv 10 Tf");
    cmds.append_command(1.5, 2.0, "Td");
    cmds.append_command("(x)", "Tj");
    TEST_CHECK(cmds.ET());
    TEST_CHECK(cmds.Q());
    TEST_UNWRAP(text, cmds.steal());
    TEST_CHECK(text == "q\n  BT\n    /Helv 10 Tf\n    1.500000 2.000000 Td\n    (x) Tj\n  ET\nQ\n");

    CommandStreamFormatter nested;
    TEST_CHECK(nested.BT());
    TEST_ERROR(nested.BT(), DrawStateEndMismatch);
    TEST_ERROR(nested.Q(), DrawStateEndMismatch);
    TEST_ERROR(nested.steal(), DrawStateEndMismatch);
    return 0;
}

} // namespace

int main() {
    int failures = 0;
    RUN_TEST(test_escape);
    RUN_TEST(test_decode);
    RUN_TEST(test_multiline_note);
    RUN_TEST(test_hexstring);
    RUN_TEST(test_string_end);
    RUN_TEST(test_lexer);
    RUN_TEST(test_lexer_plain_integers);
    RUN_TEST(test_parser);
    RUN_TEST(test_parser_errors);
    RUN_TEST(test_dict_edit);
    RUN_TEST(test_command_stream);
    return failures == 0 ? 0 : 1;
}
