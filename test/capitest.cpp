// SPDX-License-Identifier: Apache-2.0
// Copyright 2023-2025 Jussi Pakkanen

#include <formpdf.hpp>
#include <stdio.h>
#include <string.h>
#include <string>
#ifndef _WIN32
#include <unistd.h>
#endif

namespace {

const char catalog[] = "<< /Type /Catalog /Pages 2 0 R /AcroForm 6 0 R >>";
const char pages[] = "<< /Type /Pages /Kids [3 0 R] /Count 1 >>";
const char page[] = "<< /Type /Page /Parent 2 0 R /MediaBox [0 0 595 842] /Contents 4 0 R "
                    "/Resources << /Font << /Helv 7 0 R >> >> /Annots [5 0 R] >>";
const char contents[] = "<< /Length 5 >>\nstream\nBT ET\nendstream";
const char widget[] = "<< /Type /Annot /Subtype /Widget /FT /Tx /Rect [150 700 350 720] "
                      "/V (John Doe) /DA (/Helv 10 Tf 0 g) /P 3 0 R >>";
const char acroform[] = "<< /Fields [5 0 R] /DA (/Helv 0 Tf 0 g) /DR << /Font << /Helv 7 0 R >> >> >>";
const char font[] = "<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica >>";

int test_c_api() {
    FormPDF_ObjectStore *store;
    FormPDF_DocumentProperties *props;
    FormPDF_Buffer *buf;
    if(formpdf_object_store_new(&store) != 0 || formpdf_document_properties_new(&props) != 0) {
        fprintf(stderr, "Could not create objects.\n");
        return 1;
    }
    int32_t root;
    int32_t id;
    formpdf_object_store_reserve_id(store, &root);
    formpdf_object_store_add_object(store, "<< /Type /Pages /Kids [] /Count 0 >>", -1, &id);
    formpdf_object_store_set_object(store, root, "<< /Type /Catalog /Pages 2 0 R >>", -1);
    if(formpdf_object_store_add_object(store, nullptr, -1, &id) == 0) {
        fprintf(stderr, "Null body was accepted.\n");
        return 1;
    }
    if(formpdf_object_store_add_object(store, "<< >>", -2, &id) == 0) {
        fprintf(stderr, "Negative size was accepted.\n");
        return 1;
    }
    if(formpdf_document_properties_set_xref_stream(props, 2) == 0) {
        fprintf(stderr, "Non-boolean was accepted.\n");
        return 1;
    }
    formpdf_document_properties_set_version(props, FORMPDF_PDF_1_4);
    auto rc = formpdf_build_document(store, root, props, &buf);
    if(rc == 0) {
        fprintf(stderr, "Object streams were accepted for PDF 1.4.\n");
        return 1;
    }
    if(strlen(formpdf_error_message(rc)) == 0) {
        fprintf(stderr, "Empty error message.\n");
        return 1;
    }
    formpdf_document_properties_set_xref_stream(props, 0);
    rc = formpdf_build_document(store, root, props, &buf);
    if(rc != 0) {
        fprintf(stderr, "%s\n", formpdf_error_message(rc));
        return 1;
    }
    const char *data;
    int64_t size;
    formpdf_buffer_get_data(buf, &data, &size);
    if(size < 9 || strncmp(data, "%PDF-1.4\n", 9) != 0) {
        fprintf(stderr, "Bad header.\n");
        return 1;
    }
    rc = formpdf_verify_document(data, size);
    if(rc != 0) {
        fprintf(stderr, "%s\n", formpdf_error_message(rc));
        return 1;
    }
    formpdf_buffer_destroy(buf);
    formpdf_document_properties_destroy(props);
    formpdf_object_store_destroy(store);
    return 0;
}

int test_cpp_wrapper() {
    const char *fname = "formpdf_capitest.pdf";
    unlink(fname);

    formpdf::ObjectStore store;
    for(const std::string body : {catalog, pages, page, contents, widget, acroform, font}) {
        store.add_object(body);
    }
    formpdf::DocumentProperties props;
    props.set_version(FORMPDF_PDF_1_7);
    auto source = store.build_document(1, props);
    formpdf::verify_document(source.bytes());

    formpdf::FlattenOptions opts;
    opts.set_default_font_size(11);
    opts.set_compress_overlay(true);
    auto flat = formpdf::flatten_form(source.bytes(), opts);
    formpdf::verify_document(flat.bytes());
    if(flat.bytes().find("/Annots") != std::string_view::npos) {
        fprintf(stderr, "Widget was not flattened.\n");
        return 1;
    }
    flat.write_to_file(fname);
    FILE *f = fopen(fname, "rb");
    if(!f) {
        fprintf(stderr, "Output file not created.\n");
        return 1;
    }
    fclose(f);
    unlink(fname);

    try {
        formpdf::flatten_form("%PDF-1.4\n1 0 obj\n<< /Type /Catalog >>\nendobj\n", opts);
        fprintf(stderr, "Flattening a document without pages succeeded.\n");
        return 1;
    } catch(const formpdf::PdfException &e) {
        if(std::string(e.what()) != "Document has no page object.") {
            fprintf(stderr, "Unexpected error: %s\n", e.what());
            return 1;
        }
    }
    return 0;
}

} // namespace

int main() {
    if(test_c_api() != 0) {
        return 1;
    }
    if(test_cpp_wrapper() != 0) {
        return 1;
    }
    return 0;
}
