// SPDX-License-Identifier: Apache-2.0
// Copyright 2024-2025 Jussi Pakkanen

#pragma once

#include <docproperties.hpp>
#include <objectstore.hpp>
#include <xref.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace formpdf::internal {

typedef std::vector<std::pair<std::string, std::string>> TrailerEntries;

// Serializes an object store into a complete file in memory.
class PdfWriter {
public:
    explicit PdfWriter(const DocumentProperties &props);

    // Trailer (or XRef stream dictionary) gets /Size, /Root, /ID and the extra entries.
    rvoe<std::string>
    assemble(const ObjectStore &store, int32_t root, const TrailerEntries &trailer_extra = {});

    // Everything written as plain objects with a classic table. The given trailer
    // dictionary is written as is apart from /Size.
    rvoe<std::string> assemble_classic(const ObjectStore &store, std::string_view trailer_dict);

    const std::vector<XRefEntry> &cross_reference() const { return entries; }

private:
    void write_header();
    rvoe<NoReturnValue> write_objects(const ObjectStore &store);
    void write_finished_object(int32_t object_number, std::string_view body);
    rvoe<NoReturnValue> write_main_objstm(int32_t objstm_id);
    rvoe<NoReturnValue> write_cross_reference_table();
    rvoe<NoReturnValue> write_cross_reference_stream(int32_t xref_id,
                                                     int32_t root,
                                                     const TrailerEntries &trailer_extra);
    void write_oldstyle_trailer(std::string_view trailer_dict, uint64_t xref_offset);
    void write_newstyle_trailer(uint64_t xref_offset);

    DocumentProperties props;
    bool use_xref = true;
    std::string out;
    std::vector<XRefEntry> entries;
    std::map<int32_t, std::string> objstm_members;
};

rvoe<std::string>
build_document(const ObjectStore &store, int32_t root_id, const DocumentProperties &props);

} // namespace formpdf::internal
