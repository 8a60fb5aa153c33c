// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

// Writes a single page medical intake form with an AcroForm. The result
// is meant as input for formflatten.

#include <commandstreamformatter.hpp>
#include <literalstring.hpp>
#include <objectformatter.hpp>
#include <objectstore.hpp>
#include <pdfwriter.hpp>
#include <utils.hpp>

#include <fmt/core.h>

#include <array>
#include <cstring>
#include <string_view>
#include <vector>

using namespace formpdf::internal;

namespace {

struct FieldDefinition {
    const char *name;
    const char *type;
    std::array<double, 4> rect;
    const char *label;
    std::array<double, 2> label_pos;
    int32_t flags;
    // Only used with --fill.
    const char *value;
};

// clang-format off
const std::array<FieldDefinition, 11> intake_fields{{
    {"patient_name", "Tx", {150, 700, 350, 720}, "Patient Name:", {70, 705}, 0, "John Doe"},
    {"dob", "Tx", {150, 670, 250, 690}, "DOB:", {70, 675}, 0, "1980-02-29"},
    {"phone", "Tx", {350, 670, 500, 690}, "Phone:", {280, 675}, 0, "555-0100"},
    {"email", "Tx", {150, 640, 350, 660}, "Email:", {70, 645}, 0, "john.doe@example.com"},
    {"insurance", "Tx", {150, 610, 350, 630}, "Insurance:", {70, 615}, 0, "Acme Health (PPO)"},
    {"gender", "Btn", {150, 580, 165, 595}, "Male", {170, 583}, 49152, nullptr},
    {"gender", "Btn", {220, 580, 235, 595}, "Female", {240, 583}, 49152, nullptr},
    {"fever", "Btn", {150, 550, 165, 565}, "Fever", {170, 553}, 0, "Yes"},
    {"cough", "Btn", {150, 530, 165, 545}, "Cough", {170, 533}, 0, nullptr},
    {"headache", "Btn", {150, 510, 165, 525}, "Headache", {170, 513}, 0, nullptr},
    {"doctor_notes", "Tx", {100, 350, 500, 480}, "Doctor Notes:", {100, 485}, 4096,
     "Mild fever since Monday, no known allergies"},
}};
// clang-format on

struct GeneratorOptions {
    bool fill = false;
    bool classic = false;
};

std::string field_body(const FieldDefinition &f, int32_t page_id, bool fill) {
    ObjectFormatter fmt;
    fmt.begin_dict();
    fmt.add_token_pair("/Type", "/Annot");
    fmt.add_token_pair("/Subtype", "/Widget");
    fmt.add_token("/FT");
    fmt.add_token_with_slash(f.type);
    fmt.add_token("/T");
    fmt.add_pdfstring(f.name);
    fmt.add_token("/Rect");
    fmt.add_array(f.rect);
    fmt.add_token("/P");
    fmt.add_object_ref(page_id);
    fmt.add_token("/DA");
    fmt.add_pdfstring("/Helv 10 Tf 0 g");
    if(f.flags) {
        fmt.add_token_pair("/Ff", f.flags);
    }
    if(fill && f.value) {
        fmt.add_token("/V");
        if(strcmp(f.type, "Btn") == 0) {
            fmt.add_token_with_slash(f.value);
            fmt.add_token("/AS");
            fmt.add_token_with_slash(f.value);
        } else {
            fmt.add_pdfstring(f.value);
        }
    }
    fmt.end_dict();
    return fmt.steal();
}

rvoe<std::string> page_content_stream() {
    CommandStreamFormatter cmds;
    ERCV(cmds.BT());
    cmds.append("/F1 18 Tf");
    cmds.append_command(100.0, 750.0, "Td");
    cmds.append_command(pdfstring_quote("Medical Intake Form"), "Tj");
    cmds.append("/F1 12 Tf");
    cmds.append_command(0.0, -25.0, "Td");
    cmds.append_command(pdfstring_quote("Please provide your details below:"), "Tj");
    ERCV(cmds.ET());
    ERCV(cmds.BT());
    cmds.append("/F1 10 Tf");
    for(const auto &f : intake_fields) {
        cmds.append(fmt::format("1 0 0 1 {:f} {:f} Tm", f.label_pos[0], f.label_pos[1]));
        cmds.append_command(pdfstring_quote(f.label), "Tj");
    }
    ERCV(cmds.ET());
    return cmds.steal();
}

rvoe<std::string> generate_form(const GeneratorOptions &gopts) {
    ObjectStore store;
    const int32_t catalog_id = store.reserve_id();
    const int32_t pages_id = store.reserve_id();
    const int32_t page_id = store.reserve_id();
    const int32_t font_id = store.reserve_id();
    const int32_t content_id = store.reserve_id();
    const int32_t acroform_id = store.reserve_id();

    std::vector<int32_t> field_ids;
    for(const auto &f : intake_fields) {
        field_ids.push_back(store.add(field_body(f, page_id, gopts.fill)));
    }

    {
        ObjectFormatter fmt;
        fmt.begin_dict();
        fmt.add_token("/Fields");
        fmt.begin_array();
        for(const auto id : field_ids) {
            fmt.add_object_ref(id);
        }
        fmt.end_array();
        fmt.add_token_pair("/NeedAppearances", "true");
        fmt.add_token("/DA");
        fmt.add_pdfstring("/Helv 10 Tf 0 g");
        fmt.add_token("/DR");
        fmt.begin_dict();
        fmt.add_token("/Font");
        fmt.begin_dict();
        fmt.add_token("/Helv");
        fmt.add_object_ref(font_id);
        fmt.end_dict();
        fmt.end_dict();
        fmt.end_dict();
        ERCV(store.set(acroform_id, fmt.steal()));
    }
    {
        ObjectFormatter fmt;
        fmt.begin_dict();
        fmt.add_token_pair("/Type", "/Catalog");
        fmt.add_token("/Pages");
        fmt.add_object_ref(pages_id);
        fmt.add_token("/AcroForm");
        fmt.add_object_ref(acroform_id);
        fmt.end_dict();
        ERCV(store.set(catalog_id, fmt.steal()));
    }
    {
        ObjectFormatter fmt;
        fmt.begin_dict();
        fmt.add_token_pair("/Type", "/Pages");
        fmt.add_token("/Kids");
        fmt.begin_array();
        fmt.add_object_ref(page_id);
        fmt.end_array();
        fmt.add_token_pair("/Count", 1);
        fmt.end_dict();
        ERCV(store.set(pages_id, fmt.steal()));
    }
    {
        ObjectFormatter fmt;
        fmt.begin_dict();
        fmt.add_token_pair("/Type", "/Font");
        fmt.add_token_pair("/Subtype", "/Type1");
        fmt.add_token_pair("/BaseFont", "/Helvetica");
        fmt.end_dict();
        ERCV(store.set(font_id, fmt.steal()));
    }
    {
        ObjectFormatter fmt;
        fmt.begin_dict();
        fmt.add_token_pair("/Type", "/Page");
        fmt.add_token("/Parent");
        fmt.add_object_ref(pages_id);
        fmt.add_token("/MediaBox");
        fmt.add_array(std::array<int32_t, 4>{0, 0, 595, 842});
        fmt.add_token("/Contents");
        fmt.add_object_ref(content_id);
        fmt.add_token("/Resources");
        fmt.begin_dict();
        fmt.add_token("/Font");
        fmt.begin_dict();
        fmt.add_token("/F1");
        fmt.add_object_ref(font_id);
        fmt.add_token("/Helv");
        fmt.add_object_ref(font_id);
        fmt.end_dict();
        fmt.end_dict();
        fmt.add_token("/Annots");
        fmt.begin_array();
        for(const auto id : field_ids) {
            fmt.add_object_ref(id);
        }
        fmt.end_array();
        fmt.end_dict();
        ERCV(store.set(page_id, fmt.steal()));
    }
    {
        ERC(contents, page_content_stream());
        ERC(compressed, flate_compress(contents));
        ObjectFormatter fmt;
        fmt.begin_dict();
        fmt.add_token_pair("/Length", compressed.size());
        fmt.add_token_pair("/Filter", "/FlateDecode");
        fmt.end_dict();
        auto body = fmt.steal();
        body += "stream\n";
        body += span2sv(compressed);
        body += "\nendstream";
        ERCV(store.set(content_id, std::move(body)));
    }

    DocumentProperties props;
    if(gopts.classic) {
        props.version = PdfVersion::v14;
        props.use_xref_stream = false;
    }
    return build_document(store, catalog_id, props);
}

} // namespace

int main(int argc, char **argv) {
    if(argc < 2) {
        fmt::print(stderr, "Usage: {} <output.pdf> [--fill] [--classic]\n", argv[0]);
        return 1;
    }
    GeneratorOptions gopts;
    for(int i = 2; i < argc; ++i) {
        const std::string_view arg(argv[i]);
        if(arg == "--fill") {
            gopts.fill = true;
        } else if(arg == "--classic") {
            gopts.classic = true;
        } else {
            fmt::print(stderr, "Unknown argument: {}\n", arg);
            return 1;
        }
    }
    auto bytes = generate_form(gopts);
    if(!bytes) {
        fmt::print(stderr, "Generating the form failed: {}\n", error_text(bytes.error()));
        return 1;
    }
    auto rc = write_file(argv[1], *bytes);
    if(!rc) {
        fmt::print(stderr, "Could not write {}: {}\n", argv[1], error_text(rc.error()));
        return 1;
    }
    fmt::print("Wrote {} ({} bytes)\n", argv[1], bytes->size());
    return 0;
}
