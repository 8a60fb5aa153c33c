// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#include <flattener.hpp>
#include <dictedit.hpp>
#include <objectformatter.hpp>
#include <overlay.hpp>
#include <pdfwriter.hpp>
#include <resources.hpp>
#include <utils.hpp>

#include <fmt/core.h>

#include <iterator>

namespace formpdf::internal {

namespace {

std::string reference_array(const std::vector<int32_t> &ids) {
    std::string arr("[");
    auto app = std::back_inserter(arr);
    for(const auto id : ids) {
        fmt::format_to(app, " {} 0 R", id);
    }
    arr += " ]";
    return arr;
}

} // namespace

FormFlattener::FormFlattener(std::string_view source_, const FlattenOptions &opts_)
    : source(source_), opts(opts_) {}

rvoe<NoReturnValue> FormFlattener::require(FlattenState expected) const {
    if(current != expected) {
        RETERR(WrongFlattenState);
    }
    RETOK;
}

rvoe<NoReturnValue> FormFlattener::scan() {
    ERCV(require(FlattenState::Start));
    ERC(scanned, scan_document(source));
    doc = std::move(scanned);
    ERC(pid, find_page_object(doc));
    page_id = pid;
    ERC(info, extract_page_info(doc, page_id));
    page = std::move(info);
    current = FlattenState::Scanned;
    RETOK;
}

rvoe<NoReturnValue> FormFlattener::resolve_fields() {
    ERCV(require(FlattenState::Scanned));
    ERC(classified, classify_annotations(doc, page.annots));
    annotations = std::move(classified);
    ERC(form, find_acroform(doc, opts.font_resource_name));
    acroform = std::move(form);
    current = FlattenState::FieldsResolved;
    RETOK;
}

rvoe<NoReturnValue> FormFlattener::build_overlay() {
    ERCV(require(FlattenState::FieldsResolved));
    ERC(content, internal::build_overlay(annotations.candidates, acroform.default_appearance, opts));
    overlay = std::move(content);
    current = FlattenState::OverlayBuilt;
    RETOK;
}

rvoe<int32_t> FormFlattener::fallback_font() {
    if(acroform.font_ref && doc.find(*acroform.font_ref)) {
        return *acroform.font_ref;
    }
    ObjectFormatter fmt;
    fmt.begin_dict();
    fmt.add_token_pair("/Type", "/Font");
    fmt.add_token_pair("/Subtype", "/Type1");
    fmt.add_token_pair("/BaseFont", "/Helvetica");
    fmt.add_token_pair("/Encoding", "/WinAnsiEncoding");
    fmt.end_dict();
    return store.add(fmt.steal());
}

rvoe<NoReturnValue> FormFlattener::rewrite_page() {
    ERCV(require(FlattenState::OverlayBuilt));
    if(overlay.empty()) {
        current = FlattenState::PageRewritten;
        RETOK;
    }
    for(const auto &[id, body] : doc.objects) {
        ERCV(store.set(id, body));
    }

    ObjectFormatter stream_dict;
    stream_dict.begin_dict();
    std::string stream_data;
    if(opts.compress_overlay) {
        ERC(compressed, flate_compress(overlay));
        stream_data = span2sv(compressed);
        stream_dict.add_token_pair("/Filter", "/FlateDecode");
    } else {
        stream_data = overlay;
    }
    stream_dict.add_token_pair("/Length", stream_data.size());
    stream_dict.end_dict();
    std::string overlay_body = stream_dict.steal();
    overlay_body += "stream\n";
    overlay_body += stream_data;
    overlay_body += "\nendstream";
    const int32_t overlay_id = store.add(std::move(overlay_body));
    ERC(font_ref, fallback_font());

    ERC(original_page, store.get(page_id));
    std::string page_body = *original_page;
    if(annotations.preserved.empty()) {
        ERC(edited, remove_dict_entry(page_body, "Annots"));
        page_body = std::move(edited);
    } else {
        ERC(edited, set_dict_entry(page_body, "Annots", reference_array(annotations.preserved)));
        page_body = std::move(edited);
    }
    auto contents = page.contents;
    contents.push_back(overlay_id);
    {
        ERC(edited, set_dict_entry(page_body, "Contents", reference_array(contents)));
        page_body = std::move(edited);
    }
    ERC(font_dict, resolve_font_dict(doc, page.resources));
    ERC(merged, merge_resources(page.resources, font_dict, font_ref, opts.font_resource_name));
    {
        ERC(edited, set_dict_entry(page_body, "Resources", merged));
        page_body = std::move(edited);
    }
    ERCV(store.set(page_id, std::move(page_body)));
    current = FlattenState::PageRewritten;
    RETOK;
}

rvoe<FlattenResult> FormFlattener::reassemble() {
    ERCV(require(FlattenState::PageRewritten));
    FlattenResult result;
    if(overlay.empty()) {
        result.bytes = std::string(source);
        result.num_preserved = annotations.preserved.size();
        current = FlattenState::Reassembled;
        return result;
    }
    // The rebuilt file has a single cross reference section.
    ERC(no_prev, remove_dict_entry(doc.trailer, "Prev"));
    ERC(trailer, remove_dict_entry(no_prev, "XRefStm"));
    DocumentProperties props;
    props.version = doc.version;
    props.use_xref_stream = false;
    PdfWriter w(props);
    ERC(bytes, w.assemble_classic(store, trailer));
    result.bytes = std::move(bytes);
    result.modified = true;
    result.num_flattened = annotations.candidates.size();
    result.num_preserved = annotations.preserved.size();
    current = FlattenState::Reassembled;
    return result;
}

rvoe<FlattenResult> FormFlattener::run() {
    ERCV(scan());
    ERCV(resolve_fields());
    ERCV(build_overlay());
    ERCV(rewrite_page());
    return reassemble();
}

rvoe<FlattenResult> flatten_form(std::string_view source, const FlattenOptions &opts) {
    FormFlattener f(source, opts);
    return f.run();
}

} // namespace formpdf::internal
