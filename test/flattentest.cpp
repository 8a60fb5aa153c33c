// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#include "testcommon.hpp"

#include <flattener.hpp>
#include <objectformatter.hpp>
#include <objectscanner.hpp>
#include <overlay.hpp>
#include <pdfwriter.hpp>
#include <resources.hpp>
#include <verifier.hpp>
#include <widgets.hpp>

#include <string>
#include <vector>

using namespace formpdf::internal;

namespace {

std::string stream_object(std::string_view data) {
    ObjectFormatter fmt;
    fmt.begin_dict();
    fmt.add_token_pair("/Length", data.size());
    fmt.end_dict();
    auto body = fmt.steal();
    body += "stream\n";
    body += data;
    body += "\nendstream";
    return body;
}

// Object n is bodies[n-1], the catalog is object 1.
rvoe<std::string> make_document(const std::vector<std::string> &bodies, bool xref_stream) {
    ObjectStore store;
    for(const auto &b : bodies) {
        store.add(b);
    }
    DocumentProperties props;
    if(!xref_stream) {
        props.version = PdfVersion::v14;
        props.use_xref_stream = false;
    }
    return build_document(store, 1, props);
}

const char widget_john[] = "<< /Type /Annot /Subtype /Widget /FT /Tx /T (patient_name) "
                           "/Rect [150 700 350 720] /V (John Doe) /DA (/Helv 10 Tf 0 g) "
                           "/P 3 0 R >>";

const char john_overlay_line[] = "BT /Helv 10 Tf 0 0 0 rg 152.000 705.000 Td (John Doe) Tj ET";

std::vector<std::string> single_field_form(std::string_view annots, std::string_view widget) {
    return {
        "<< /Type /Catalog /Pages 2 0 R /AcroForm 6 0 R >>",
        "<< /Type /Pages /Kids [3 0 R] /Count 1 >>",
        std::string("<< /Type /Page /Parent 2 0 R /MediaBox [0 0 595 842] /Contents 4 0 R "
                    "/Resources << /Font 7 0 R /ProcSet [/PDF /Text] >> /Annots ") +
            std::string(annots) + " >>",
        stream_object("BT /F1 12 Tf 70 705 Td (Patient Name:) Tj ET"),
        std::string(widget),
        "<< /Fields [5 0 R] /NeedAppearances true /DA (/Helv 0 Tf 0 g) "
        "/DR << /Font << /Helv 8 0 R >> >> >>",
        "<< /F1 8 0 R >>",
        "<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica >>",
    };
}

bool contains(std::string_view haystack, std::string_view needle) {
    return haystack.find(needle) != std::string_view::npos;
}

const char raw_document[] = R"(%PDF-1.5
% hand written
1 0 obj
<< /Type /Catalog /Pages 2 0 R >>
endobj
2 0 obj << /Type /Pages /Kids [3 0 R] /Count 1 >> endobj
3 0 obj
<< /Type /Page /Parent 2 0 R /Contents [4 0 R 5 0 R] /Resources 6 0 R >>
endobj
4 0 obj
<< /Length 5 >>
stream
BT ET
endstream
endobj
5 0 obj
<< /Length 99 >>
stream
q Q
endstream
endobj
6 0 obj
<< /Font << /F1 7 0 R >> >>
endobj
xref
0 1
0000000000 65535 f 
trailer
<< /Size 7 /Root 1 0 R >>
startxref
0
%%EOF
3 0 obj
<< /Type /Page /Parent 2 0 R /Contents [4 0 R 5 0 R] /Resources 6 0 R /Annots [] >>
endobj
trailer
<< /Size 7 /Root 1 0 R /Prev 0 >>
startxref
12
%%EOF
)";

int test_scan_raw() {
    const std::string_view raw(raw_document);
    TEST_UNWRAP(doc, scan_document(raw));
    TEST_CHECK(doc.version == PdfVersion::v15);
    TEST_CHECK(doc.objects.size() == 6);
    TEST_CHECK(doc.offsets.at(1) == raw.find("1 0 obj"));
    // The incremental update replaces the first definition.
    TEST_CHECK(contains(doc.objects.at(3), "/Annots []"));
    TEST_CHECK(contains(doc.trailer, "/Prev 0"));
    TEST_CHECK(doc.startxref == 12u);

    // Wrong /Length falls back to searching for endstream.
    TEST_UNWRAP(parts, split_stream_body(doc.objects.at(5)));
    TEST_CHECK(parts.data == "q Q");
    TEST_UNWRAP(plain, decode_stream_data(parts.dict, parts.data));
    TEST_CHECK(plain == "q Q");

    TEST_UNWRAP(page_id, find_page_object(doc));
    TEST_CHECK(page_id == 3);
    TEST_UNWRAP(info, extract_page_info(doc, page_id));
    TEST_CHECK(info.has_annots);
    TEST_CHECK(info.annots.empty());
    TEST_CHECK(info.contents == (std::vector<int32_t>{4, 5}));
    TEST_CHECK(info.resources_ref == 6);
    TEST_CHECK(info.resources == "<< /Font << /F1 7 0 R >> >>");
    return 0;
}

int test_scan_errors() {
    TEST_ERROR(scan_document("%PDF-1.4\n1 0 obj\n<< /Type /Catalog >>\n"), TruncatedObject);
    TEST_ERROR(scan_document("%PDF-1.4\n1 0 obj\n<< /A [1 2 >>\nendobj\n"), UnbalancedDelimiters);
    TEST_ERROR(scan_document("%PDF-1.4\n1 0 obj\n<< /Length 3 >>\nstream\nabc"), TruncatedObject);

    TEST_UNWRAP(no_page, scan_document("%PDF-1.4\n1 0 obj\n<< /Type /Catalog >>\nendobj\n"));
    TEST_ERROR(find_page_object(no_page), NoPageObject);
    // Without a trailer the catalog becomes the root.
    TEST_CHECK(contains(no_page.trailer, "/Root 1 0 R"));

    TEST_UNWRAP(two_pages,
                scan_document("1 0 obj << /Type /Page >> endobj 2 0 obj << /Type /Page >> endobj"));
    TEST_ERROR(find_page_object(two_pages), MultiplePages);

    TEST_UNWRAP(inline_annot,
                scan_document("1 0 obj << /Type /Page /Annots [<< /Subtype /Widget >>] >> endobj"));
    TEST_ERROR(extract_page_info(inline_annot, 1), UnsupportedStructure);

    TEST_UNWRAP(bad_contents, scan_document("1 0 obj << /Type /Page /Contents 12 >> endobj"));
    TEST_ERROR(extract_page_info(bad_contents, 1), MissingContents);

    TEST_ERROR(decode_stream_data("<< /Filter /LZWDecode >>", "x"), UnsupportedFilter);
    TEST_ERROR(decode_stream_data("<< /Filter [/FlateDecode] /DecodeParms << /Predictor 12 >> >>",
                                  "x"),
               UnsupportedFilter);
    return 0;
}

int test_parse_widget() {
    TEST_UNWRAP(w1,
                parse_widget("<< /Type /Annot /Subtype /Widget /Rect [350 720 150 700] "
                             "/V <4A6F686E> /DA (/Helv 9 Tf 0 g) /FT /Tx >>"));
    TEST_CHECK(w1.has_value());
    TEST_CHECK(w1->rect && w1->rect->x1 == 150 && w1->rect->y1 == 700);
    TEST_CHECK(w1->rect->w() == 200 && w1->rect->h() == 20);
    TEST_CHECK(w1->value == "John");
    TEST_CHECK(w1->default_appearance == "/Helv 9 Tf 0 g");
    TEST_CHECK(w1->field_type == "Tx");
    TEST_CHECK(!w1->is_button);

    TEST_UNWRAP(w2, parse_widget("<< /Subtype /Widget /V (A\\(B\\) \\101) /Parent 10 0 R >>"));
    TEST_CHECK(w2->value == "A(B) A");
    TEST_CHECK(!w2->rect);
    TEST_CHECK(!w2->field_type);
    TEST_CHECK(w2->parent == 10);

    TEST_UNWRAP(button, parse_widget("<< /Subtype /Widget /FT /Btn /V /Yes >>"));
    TEST_CHECK(button->is_button);
    TEST_CHECK(button->value == "Yes");

    TEST_UNWRAP(link, parse_widget("<< /Type /Annot /Subtype /Link /Rect [0 0 1 1] >>"));
    TEST_CHECK(!link.has_value());
    TEST_UNWRAP(not_dict, parse_widget("[1 2 3]"));
    TEST_CHECK(!not_dict.has_value());
    return 0;
}

int test_classify() {
    ScannedDocument doc;
    doc.objects[5] = widget_john;
    doc.objects[9] = "<< /Type /Annot /Subtype /Widget /FT /Btn /Rect [150 550 165 565] /V /Yes >>";
    doc.objects[10] = "<< /FT /Btn /T (gender) /Kids [11 0 R] /V /Male >>";
    doc.objects[11] = "<< /Type /Annot /Subtype /Widget /Parent 10 0 R /Rect [150 580 165 595] >>";
    doc.objects[12] = "<< /Type /Annot /Subtype /Widget /FT /Tx /Rect [150 640 350 660] >>";
    doc.objects[13] = "<< /Type /Annot /Subtype /Widget /Parent 14 0 R /Rect [100 100 200 110] "
                      "/V (Inherited) >>";
    doc.objects[14] = "<< /FT /Tx /T (notes) /Kids [13 0 R] >>";
    doc.objects[15] = "<< /Type /Annot /Subtype /Link /Rect [0 0 10 10] >>";
    doc.objects[16] = "<< /Type /Annot /Subtype /Widget /FT /Tx /Rect [0 0 10 10] /V () >>";

    TEST_UNWRAP(kid, parse_widget(doc.objects[11]));
    TEST_CHECK(resolve_field_type(doc, *kid) == "Btn");

    TEST_UNWRAP(result, classify_annotations(doc, {5, 9, 11, 12, 13, 15, 16, 99}));
    TEST_CHECK(result.preserved == (std::vector<int32_t>{9, 11, 15}));
    TEST_CHECK(result.candidates.size() == 2);
    TEST_CHECK(result.candidates[0].value == "John Doe");
    TEST_CHECK(result.candidates[1].value == "Inherited");
    TEST_CHECK(result.candidates[1].field_type == "Tx");
    return 0;
}

int test_find_acroform() {
    ScannedDocument doc;
    doc.trailer = "<< /Root 1 0 R >>";
    doc.objects[1] = "<< /Type /Catalog /AcroForm << /Fields [] /DA (/Helv 11 Tf 0 g) "
                     "/DR << /Font 7 0 R >> >> >>";
    doc.objects[7] = "<< /ZaDb 9 0 R /Helv 8 0 R >>";
    TEST_UNWRAP(inline_form, find_acroform(doc, "Helv"));
    TEST_CHECK(!inline_form.id);
    TEST_CHECK(inline_form.default_appearance == "/Helv 11 Tf 0 g");
    TEST_CHECK(inline_form.font_ref == 8);

    // No usable catalog, the form is found by its keys.
    ScannedDocument loose;
    loose.objects[4] = "<< /NeedAppearances true /DA (/Helv 10 Tf 0 g) >>";
    TEST_UNWRAP(found, find_acroform(loose, "Helv"));
    TEST_CHECK(found.id == 4);
    TEST_CHECK(found.default_appearance == "/Helv 10 Tf 0 g");
    TEST_CHECK(!found.font_ref);

    ScannedDocument none;
    none.objects[1] = "<< /Type /Catalog >>";
    TEST_UNWRAP(missing, find_acroform(none, "Helv"));
    TEST_CHECK(!missing.id && !missing.default_appearance);
    return 0;
}

int test_font_size() {
    TEST_CHECK(font_size_from_da("/Helv 10 Tf 0 g") == 10.0);
    TEST_CHECK(font_size_from_da("0 g /Helv 9.5 Tf") == 9.5);
    TEST_CHECK(!font_size_from_da("/Helv 0 Tf 0 g"));
    TEST_CHECK(!font_size_from_da("0 g"));
    TEST_CHECK(!font_size_from_da(""));
    return 0;
}

int test_overlay() {
    FlattenOptions opts;
    TEST_UNWRAP(empty, build_overlay({}, {}, opts));
    TEST_CHECK(empty.empty());

    TEST_UNWRAP(john, parse_widget(widget_john));
    TEST_UNWRAP(overlay, build_overlay({*john}, {}, opts));
    TEST_CHECK(overlay == std::string("q\n  ") + john_overlay_line + "\nQ\n");

    Widget fallback;
    fallback.rect = PdfRectangle{100, 100, 200, 110};
    fallback.value = "Acme (PPO)";
    TEST_UNWRAP(form_size, build_overlay({fallback}, std::string("/Helv 11 Tf 0 g"), opts));
    // Rect is shorter than the font, no negative offset.
    TEST_CHECK(contains(form_size, "BT /Helv 11 Tf 0 0 0 rg 102.000 100.000 Td (Acme \\(PPO\\)) Tj ET"));
    TEST_UNWRAP(default_size, build_overlay({fallback}, std::string("/Helv 0 Tf 0 g"), opts));
    TEST_CHECK(contains(default_size, "BT /Helv 12 Tf"));

    Widget tall;
    tall.rect = PdfRectangle{100, 350, 500, 480};
    tall.value = "Notes";
    tall.default_appearance = "/Helv 9.5 Tf 0 g";
    TEST_UNWRAP(centered, build_overlay({tall}, {}, opts));
    TEST_CHECK(contains(centered, "BT /Helv 9.5 Tf 0 0 0 rg 102.000 410.250 Td (Notes) Tj ET"));
    return 0;
}

int test_resources() {
    TEST_UNWRAP(merged,
                merge_resources("<< /Font 7 0 R /ProcSet [/PDF /Text] /XObject << /Im1 12 0 R >> >>",
                                "<< /F1 8 0 R /Helv 99 0 R >>",
                                8));
    TEST_CHECK(merged == "<<\n"
                         "  /Font <<\n"
                         "    /Helv 8 0 R\n"
                         "    /F1 8 0 R\n"
                         "  >>\n"
                         "  /ProcSet [/PDF /Text]\n"
                         "  /XObject << /Im1 12 0 R >>\n"
                         ">>\n");
    TEST_UNWRAP(bare, merge_resources("", "", 5));
    TEST_CHECK(bare == "<<\n  /Font <<\n    /Helv 5 0 R\n  >>\n>>\n");

    ScannedDocument doc;
    doc.objects[7] = "<< /F1 8 0 R >>";
    TEST_UNWRAP(indirect, resolve_font_dict(doc, "<< /Font 7 0 R >>"));
    TEST_CHECK(indirect == "<< /F1 8 0 R >>");
    TEST_UNWRAP(direct, resolve_font_dict(doc, "<< /Font << /F2 9 0 R >> >>"));
    TEST_CHECK(direct == "<< /F2 9 0 R >>");
    TEST_UNWRAP(no_font, resolve_font_dict(doc, "<< /ProcSet [/PDF] >>"));
    TEST_CHECK(no_font.empty());
    TEST_ERROR(resolve_font_dict(doc, "<< /Font 70 0 R >>"), MalformedInput);
    return 0;
}

int test_single_field(bool xref_stream) {
    TEST_UNWRAP(source, make_document(single_field_form("[5 0 R]", widget_john), xref_stream));
    TEST_UNWRAP(result, flatten_form(source, FlattenOptions{}));
    TEST_CHECK(result.modified);
    TEST_CHECK(result.num_flattened == 1);
    TEST_CHECK(result.num_preserved == 0);
    TEST_CHECK(result.bytes.starts_with(xref_stream ? "%PDF-1.6\n" : "%PDF-1.4\n"));

    TEST_UNWRAP(report, verify_document(result.bytes));
    TEST_CHECK(!report.xref_stream);
    TEST_CHECK(report.declared_size == 10);
    TEST_CHECK(report.root == 1);

    TEST_UNWRAP(doc, scan_document(result.bytes));
    const auto &page = doc.objects.at(3);
    TEST_CHECK(!contains(page, "/Annots"));
    TEST_CHECK(contains(page, "/Contents [ 4 0 R 9 0 R ]"));
    TEST_CHECK(contains(page, "/Helv 8 0 R"));
    TEST_CHECK(contains(page, "/F1 8 0 R"));
    TEST_CHECK(contains(page, "/ProcSet [/PDF /Text]"));
    TEST_CHECK(contains(doc.objects.at(9), john_overlay_line));
    TEST_CHECK(contains(doc.trailer, "/Size 10"));
    TEST_CHECK(contains(doc.trailer, "/Root 1 0 R"));
    // Untouched objects are copied verbatim.
    TEST_CHECK(doc.objects.at(5) == widget_john);

    // Nothing left to flatten, the second pass is a no-op.
    TEST_UNWRAP(again, flatten_form(result.bytes, FlattenOptions{}));
    TEST_CHECK(!again.modified);
    TEST_CHECK(again.bytes == result.bytes);
    return 0;
}

int test_flatten_classic() { return test_single_field(false); }

int test_flatten_compressed_source() { return test_single_field(true); }

int test_buttons_kept() {
    auto bodies = single_field_form("[5 0 R 9 0 R 11 0 R 12 0 R 13 0 R 15 0 R]", widget_john);
    bodies.push_back(
        "<< /Type /Annot /Subtype /Widget /FT /Btn /T (fever) /Rect [150 550 165 565] /V /Yes "
        "/AS /Yes /P 3 0 R >>");
    bodies.push_back("<< /FT /Btn /T (gender) /Kids [11 0 R] /V /Male >>");
    bodies.push_back(
        "<< /Type /Annot /Subtype /Widget /Parent 10 0 R /Rect [150 580 165 595] /AS /Male >>");
    bodies.push_back("<< /Type /Annot /Subtype /Widget /FT /Tx /T (email) /Rect [150 640 350 660] >>");
    bodies.push_back("<< /Type /Annot /Subtype /Widget /Parent 14 0 R /Rect [100 100 200 110] "
                     "/V (Inherited) >>");
    bodies.push_back("<< /FT /Tx /T (notes) /Kids [13 0 R] >>");
    bodies.push_back("<< /Type /Annot /Subtype /Link /Rect [0 0 10 10] >>");
    TEST_UNWRAP(source, make_document(bodies, false));
    TEST_UNWRAP(result, flatten_form(source, FlattenOptions{}));
    TEST_CHECK(result.num_flattened == 2);
    TEST_CHECK(result.num_preserved == 3);
    TEST_UNWRAP(doc, scan_document(result.bytes));
    const auto &page = doc.objects.at(3);
    TEST_CHECK(contains(page, "/Annots [ 9 0 R 11 0 R 15 0 R ]"));
    TEST_CHECK(contains(page, "/Contents [ 4 0 R 16 0 R ]"));
    TEST_CHECK(doc.objects.at(9) == bodies[8]);
    const auto &overlay = doc.objects.at(16);
    TEST_CHECK(contains(overlay, john_overlay_line));
    TEST_CHECK(contains(overlay, "BT /Helv 12 Tf 0 0 0 rg 102.000 100.000 Td (Inherited) Tj ET"));
    TEST_CHECK(overlay.find("John Doe") < overlay.find("Inherited"));
    TEST_UNWRAP(report, verify_document(result.bytes));
    TEST_CHECK(report.declared_size == 17);
    return 0;
}

int test_inherited_resources() {
    auto bodies = single_field_form("[5 0 R]", widget_john);
    bodies[1] = "<< /Type /Pages /Kids [3 0 R] /Count 1 "
                "/Resources << /Font << /F1 8 0 R >> /ProcSet [/PDF /Text] >> >>";
    bodies[2] = "<< /Type /Page /Parent 2 0 R /MediaBox [0 0 595 842] /Contents 4 0 R "
                "/Annots [5 0 R] >>";
    TEST_UNWRAP(source, make_document(bodies, false));

    TEST_UNWRAP(source_doc, scan_document(source));
    TEST_UNWRAP(info, extract_page_info(source_doc, 3));
    TEST_CHECK(info.resources_inherited);
    TEST_CHECK(contains(info.resources, "/F1 8 0 R"));

    TEST_UNWRAP(result, flatten_form(source, FlattenOptions{}));
    TEST_CHECK(result.num_flattened == 1);
    TEST_UNWRAP(doc, scan_document(result.bytes));
    const auto &page = doc.objects.at(3);
    TEST_CHECK(contains(page, "/Helv 8 0 R"));
    TEST_CHECK(contains(page, "/F1 8 0 R"));
    TEST_CHECK(contains(page, "/ProcSet [/PDF /Text]"));
    // The page tree node is left as it was.
    TEST_CHECK(doc.objects.at(2) == bodies[1]);
    return 0;
}

int test_pass_through() {
    const char empty_widget[] = "<< /Type /Annot /Subtype /Widget /FT /Tx /T (patient_name) "
                                "/Rect [150 700 350 720] /DA (/Helv 10 Tf 0 g) >>";
    TEST_UNWRAP(source, make_document(single_field_form("[5 0 R]", empty_widget), false));
    TEST_UNWRAP(result, flatten_form(source, FlattenOptions{}));
    TEST_CHECK(!result.modified);
    TEST_CHECK(result.bytes == source);
    return 0;
}

int test_fallback_font() {
    // The form has no /DR so a Helvetica font object gets added.
    auto bodies = single_field_form("[5 0 R]", widget_john);
    bodies[5] = "<< /Fields [5 0 R] /DA (/Helv 0 Tf 0 g) >>";
    TEST_UNWRAP(source, make_document(bodies, false));
    FlattenOptions opts;
    opts.compress_overlay = true;
    TEST_UNWRAP(result, flatten_form(source, opts));
    TEST_UNWRAP(doc, scan_document(result.bytes));
    TEST_CHECK(doc.objects.size() == 10);
    TEST_CHECK(contains(doc.objects.at(10), "/BaseFont /Helvetica"));
    TEST_CHECK(contains(doc.objects.at(3), "/Helv 10 0 R"));
    TEST_UNWRAP(parts, split_stream_body(doc.objects.at(9)));
    TEST_UNWRAP(overlay, decode_stream_data(parts.dict, parts.data));
    TEST_CHECK(contains(overlay, john_overlay_line));
    return 0;
}

int test_flatten_errors() {
    TEST_UNWRAP(no_page,
                make_document({"<< /Type /Catalog >>", "<< /Type /Pages /Kids [] /Count 0 >>"},
                              false));
    TEST_ERROR(flatten_form(no_page, FlattenOptions{}), NoPageObject);
    TEST_UNWRAP(two_pages,
                make_document({"<< /Type /Catalog /Pages 2 0 R >>",
                               "<< /Type /Pages /Kids [3 0 R 4 0 R] /Count 2 >>",
                               "<< /Type /Page /Parent 2 0 R >>",
                               "<< /Type /Page /Parent 2 0 R >>"},
                              false));
    TEST_ERROR(flatten_form(two_pages, FlattenOptions{}), MultiplePages);
    TEST_ERROR(flatten_form("%PDF-1.4\n1 0 obj\n<< /Type /Page\nendobj\n", FlattenOptions{}),
               TruncatedObject);

    // No free object number would be left for the overlay.
    const std::string huge_id = std::string("1 0 obj << /Type /Catalog /Pages 2 0 R >> endobj\n"
                                            "2 0 obj << /Type /Pages /Kids [3 0 R] /Count 1 >> "
                                            "endobj\n"
                                            "3 0 obj << /Type /Page /Parent 2 0 R /Annots [5 0 R] "
                                            ">> endobj\n5 0 obj ") +
                                widget_john + " endobj\n2147483647 0 obj null endobj\n";
    TEST_ERROR(flatten_form(huge_id, FlattenOptions{}), BadId);
    return 0;
}

int test_step_order() {
    TEST_UNWRAP(source, make_document(single_field_form("[5 0 R]", widget_john), false));
    FormFlattener f(source, FlattenOptions{});
    TEST_CHECK(f.state() == FlattenState::Start);
    TEST_ERROR(f.build_overlay(), WrongFlattenState);
    TEST_ERROR(f.reassemble(), WrongFlattenState);
    TEST_CHECK(f.scan());
    TEST_CHECK(f.state() == FlattenState::Scanned);
    TEST_ERROR(f.scan(), WrongFlattenState);
    TEST_CHECK(f.resolve_fields());
    TEST_CHECK(f.build_overlay());
    TEST_ERROR(f.reassemble(), WrongFlattenState);
    TEST_CHECK(f.rewrite_page());
    TEST_UNWRAP(result, f.reassemble());
    TEST_CHECK(result.modified);
    TEST_CHECK(f.state() == FlattenState::Reassembled);
    TEST_ERROR(f.run(), WrongFlattenState);
    return 0;
}

} // namespace

int main() {
    int failures = 0;
    RUN_TEST(test_scan_raw);
    RUN_TEST(test_scan_errors);
    RUN_TEST(test_parse_widget);
    RUN_TEST(test_classify);
    RUN_TEST(test_find_acroform);
    RUN_TEST(test_font_size);
    RUN_TEST(test_overlay);
    RUN_TEST(test_resources);
    RUN_TEST(test_flatten_classic);
    RUN_TEST(test_flatten_compressed_source);
    RUN_TEST(test_buttons_kept);
    RUN_TEST(test_inherited_resources);
    RUN_TEST(test_pass_through);
    RUN_TEST(test_fallback_font);
    RUN_TEST(test_flatten_errors);
    RUN_TEST(test_step_order);
    return failures == 0 ? 0 : 1;
}
