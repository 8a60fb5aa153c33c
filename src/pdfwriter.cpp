// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2025 Jussi Pakkanen

#include <pdfwriter.hpp>
#include <dictedit.hpp>
#include <objectformatter.hpp>
#include <objstm.hpp>
#include <utils.hpp>

#include <fmt/core.h>

#include <array>
#include <iterator>

namespace formpdf::internal {

namespace {

const std::array<const char *, 6> PDF_header_strings = {"%PDF-1.3\n%\xe5\xf6\xc4\xd6\n",
                                                        "%PDF-1.4\n%\xe5\xf6\xc4\xd6\n",
                                                        "%PDF-1.5\n%\xe5\xf6\xc4\xd6\n",
                                                        "%PDF-1.6\n%\xe5\xf6\xc4\xd6\n",
                                                        "%PDF-1.7\n%\xe5\xf6\xc4\xd6\n",
                                                        "%PDF-2.0\n%\xe5\xf6\xc4\xd6\n"};

const char *null_object_body = "<< /Type /Null >>";

} // namespace

PdfWriter::PdfWriter(const DocumentProperties &props_) : props(props_) {}

rvoe<std::string>
PdfWriter::assemble(const ObjectStore &store, int32_t root, const TrailerEntries &trailer_extra) {
    if(!store.contains(root)) {
        RETERR(MissingRoot);
    }
    use_xref = props.use_xref_stream;
    if(use_xref && !supports_xref_streams(props.version)) {
        RETERR(UnsupportedVersion);
    }
    write_header();
    ERCV(write_objects(store));
    if(use_xref) {
        int32_t xref_id = store.highest_id() + 1;
        if(!objstm_members.empty()) {
            ERCV(write_main_objstm(xref_id));
            ++xref_id;
        }
        const uint64_t xref_offset = out.size();
        ERCV(write_cross_reference_stream(xref_id, root, trailer_extra));
        write_newstyle_trailer(xref_offset);
    } else {
        const uint64_t xref_offset = out.size();
        ERCV(write_cross_reference_table());
        ObjectFormatter fmt;
        const auto documentid = create_trailer_id();
        fmt.begin_dict();
        fmt.add_token_pair("/Size", entries.size());
        fmt.add_token("/Root");
        fmt.add_object_ref(root);
        for(const auto &[key, value] : trailer_extra) {
            fmt.add_token_pair(key, value);
        }
        fmt.add_token("/ID");
        fmt.begin_array();
        fmt.add_token(documentid);
        fmt.add_token(documentid);
        fmt.end_array();
        fmt.end_dict();
        write_oldstyle_trailer(fmt.steal(), xref_offset);
    }
    std::string result;
    result.swap(out);
    return result;
}

rvoe<std::string> PdfWriter::assemble_classic(const ObjectStore &store,
                                              std::string_view trailer_dict) {
    use_xref = false;
    write_header();
    ERCV(write_objects(store));
    const uint64_t xref_offset = out.size();
    ERCV(write_cross_reference_table());
    ERC(trailer, set_dict_entry(trailer_dict, "Size", fmt::format("{}", entries.size())));
    write_oldstyle_trailer(trailer, xref_offset);
    std::string result;
    result.swap(out);
    return result;
}

void PdfWriter::write_header() {
    out.clear();
    entries.clear();
    objstm_members.clear();
    out += PDF_header_strings.at((int)props.version);
}

rvoe<NoReturnValue> PdfWriter::write_objects(const ObjectStore &store) {
    entries.emplace_back(XRefFree{});
    const auto &objects = store.entries();
    for(int32_t i = 1; i <= store.highest_id(); ++i) {
        auto it = objects.find(i);
        const std::string_view body =
            it == objects.end() ? std::string_view(null_object_body) : std::string_view(it->second);
        if(use_xref && !is_stream_body(body)) {
            // The real entry is filled in once the object stream has been packed.
            entries.emplace_back(XRefFree{0, 0});
            objstm_members[i] = std::string(body);
        } else {
            write_finished_object(i, body);
        }
    }
    RETOK;
}

void PdfWriter::write_finished_object(int32_t object_number, std::string_view body) {
    if(entries.size() <= (size_t)object_number) {
        entries.resize(object_number + 1, XRefFree{0, 0});
    }
    entries[object_number] = XRefNormal{out.size()};
    fmt::format_to(std::back_inserter(out), "{} 0 obj\n", object_number);
    out += body;
    if(out.back() != '\n') {
        out += '\n';
    }
    out += "endobj\n";
}

rvoe<NoReturnValue> PdfWriter::write_main_objstm(int32_t objstm_id) {
    ERC(packed, pack_object_stream(objstm_members, objstm_id, props.compress_streams));
    for(const auto &[id, body] : objstm_members) {
        auto index = packed.index_of(id);
        if(!index) {
            RETERR(Unreachable);
        }
        entries.at(id) = XRefCompressed{objstm_id, *index};
    }
    write_finished_object(objstm_id, packed.body);
    RETOK;
}

rvoe<NoReturnValue> PdfWriter::write_cross_reference_table() {
    ERC(table, encode_xref_table(entries));
    out += table;
    RETOK;
}

rvoe<NoReturnValue> PdfWriter::write_cross_reference_stream(int32_t xref_id,
                                                            int32_t root,
                                                            const TrailerEntries &trailer_extra) {
    // The stream contains its own entry so it must exist before encoding.
    const uint64_t this_object_offset = out.size();
    entries.resize(xref_id, XRefFree{0, 0});
    entries.emplace_back(XRefNormal{this_object_offset});
    ERC(stream, encode_xref_stream_data(entries));
    ERC(compressed_stream, flate_compress(span2sv(stream)));

    const auto documentid = create_trailer_id();
    ObjectFormatter fmt;
    fmt.begin_dict();
    fmt.add_token_pair("/Type", "/XRef");
    fmt.add_token("/W");
    fmt.add_array(xref_stream_widths);
    fmt.add_token_pair("/Size", entries.size());
    fmt.add_token("/Root");
    fmt.add_object_ref(root);
    for(const auto &[key, value] : trailer_extra) {
        fmt.add_token_pair(key, value);
    }
    fmt.add_token("/ID");
    fmt.begin_array();
    fmt.add_token(documentid);
    fmt.add_token(documentid);
    fmt.end_array();
    fmt.add_token_pair("/Filter", "/FlateDecode");
    fmt.add_token_pair("/Length", compressed_stream.size());
    fmt.end_dict();

    fmt::format_to(std::back_inserter(out), "{} 0 obj\n", xref_id);
    out += fmt.steal();
    out += "stream\n";
    out += span2sv(compressed_stream);
    out += "\nendstream\nendobj\n";
    RETOK;
}

void PdfWriter::write_oldstyle_trailer(std::string_view trailer_dict, uint64_t xref_offset) {
    out += "trailer\n";
    out += trailer_dict;
    if(out.back() != '\n') {
        out += '\n';
    }
    fmt::format_to(std::back_inserter(out),
                   R"(startxref
{}
%%EOF
)",
                   xref_offset);
}

void PdfWriter::write_newstyle_trailer(uint64_t xref_offset) {
    fmt::format_to(std::back_inserter(out),
                   R"(startxref
{}
%%EOF
)",
                   xref_offset);
}

rvoe<std::string>
build_document(const ObjectStore &store, int32_t root_id, const DocumentProperties &props) {
    PdfWriter w(props);
    return w.assemble(store, root_id);
}

} // namespace formpdf::internal
