// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#include <utils.hpp>
#include <verifier.hpp>

#include <fmt/core.h>

using namespace formpdf::internal;

int main(int argc, char **argv) {
    if(argc != 2) {
        fmt::print(stderr, "Usage: {} <file.pdf>\n", argv[0]);
        return 1;
    }
    auto contents = load_file_as_string(argv[1]);
    if(!contents) {
        fmt::print(stderr, "Could not read {}: {}\n", argv[1], error_text(contents.error()));
        return 1;
    }
    auto report = verify_document(*contents);
    if(!report) {
        fmt::print(stderr, "{}: {}\n", argv[1], error_text(report.error()));
        return 1;
    }
    fmt::print("Cross reference {} at offset {}\n",
               report->xref_stream ? "stream" : "table",
               report->xref_offset);
    fmt::print("Size {}, root object {}\n", report->declared_size, report->root);
    fmt::print("{} free, {} in use, {} compressed\n",
               report->num_free,
               report->num_normal,
               report->num_compressed);
    for(size_t i = 0; i < report->entries.size(); ++i) {
        std::visit(overloaded{
                       [&](const XRefFree &e) {
                           fmt::print("{:>6}  free        next {} gen {}\n",
                                      i,
                                      e.next_free,
                                      e.generation);
                       },
                       [&](const XRefNormal &e) {
                           fmt::print("{:>6}  offset      {:010}\n", i, e.offset);
                       },
                       [&](const XRefCompressed &e) {
                           fmt::print("{:>6}  compressed  stream {} index {}\n",
                                      i,
                                      e.stream_object,
                                      e.index);
                       }},
                   report->entries[i]);
    }
    fmt::print("All entries OK.\n");
    return 0;
}
