// SPDX-License-Identifier: Apache-2.0
// Copyright 2024-2025 Jussi Pakkanen

#include <xref.hpp>
#include <bitfiddling.hpp>
#include <pdfparser.hpp>
#include <utils.hpp>

#include <fmt/core.h>

#include <iterator>

namespace formpdf::internal {

rvoe<std::string> encode_xref_table(const std::vector<XRefEntry> &entries) {
    std::string buf;
    auto app = std::back_inserter(buf);
    fmt::format_to(app,
                   R"(xref
0 {}
)",
                   entries.size());
    for(size_t i = 0; i < entries.size(); ++i) {
        // The end of line whitespace is significant.
        auto visitor = overloaded{
            [&](const XRefFree &e) -> rvoe<NoReturnValue> {
                fmt::format_to(app, "{:010} {:05} f \n", e.next_free, e.generation);
                RETOK;
            },
            [&](const XRefNormal &e) -> rvoe<NoReturnValue> {
                if(e.offset > 9999999999ull) {
                    RETERR(XRefFieldOverflow);
                }
                fmt::format_to(app, "{:010} {:05} n \n", e.offset, e.generation);
                RETOK;
            },
            [&](const XRefCompressed &) -> rvoe<NoReturnValue> {
                fmt::print(stderr, "Object {} is compressed, it can not go in a classic table.\n", i);
                RETERR(XRefMismatch);
            },
        };
        ERCV(std::visit(visitor, entries[i]));
    }
    return buf;
}

rvoe<std::vector<XRefEntry>> parse_xref_table(std::string_view text, size_t xref_offset) {
    PdfLexer lex(text, xref_offset);
    auto kw = lex.next();
    if(auto *k = std::get_if<PdfTokenKeyword>(&kw); !k || k->text != "xref") {
        RETERR(MalformedInput);
    }
    std::vector<XRefEntry> entries;
    while(true) {
        const auto subsection_start = lex.current_offset();
        auto first = lex.next();
        if(auto *k = std::get_if<PdfTokenKeyword>(&first); k && k->text == "trailer") {
            lex.set_offset(subsection_start);
            break;
        }
        auto count = lex.next();
        auto *first_num = std::get_if<PdfTokenInteger>(&first);
        auto *count_num = std::get_if<PdfTokenInteger>(&count);
        if(!first_num || !count_num || first_num->value < 0 || count_num->value < 0) {
            RETERR(MalformedInput);
        }
        if(entries.size() < (size_t)(first_num->value + count_num->value)) {
            entries.resize(first_num->value + count_num->value, XRefFree{0, 0});
        }
        for(int64_t i = 0; i < count_num->value; ++i) {
            auto field1 = lex.next();
            auto field2 = lex.next();
            auto type = lex.next();
            auto *offset = std::get_if<PdfTokenInteger>(&field1);
            auto *gen = std::get_if<PdfTokenInteger>(&field2);
            auto *t = std::get_if<PdfTokenKeyword>(&type);
            if(!offset || !gen || !t || offset->value < 0 || gen->value < 0) {
                RETERR(MalformedInput);
            }
            auto &e = entries[first_num->value + i];
            if(t->text == "n") {
                e = XRefNormal{(uint64_t)offset->value, (uint16_t)gen->value};
            } else if(t->text == "f") {
                e = XRefFree{(int32_t)offset->value, (uint16_t)gen->value};
            } else {
                RETERR(MalformedInput);
            }
        }
    }
    return entries;
}

rvoe<std::vector<std::byte>> encode_xref_stream_data(const std::vector<XRefEntry> &entries) {
    std::vector<std::byte> stream;
    for(const auto &entry : entries) {
        auto visitor = overloaded{
            [&](const XRefFree &e) -> rvoe<NoReturnValue> {
                ERCV(append_be_field(stream, 0, xref_stream_widths[0]));
                ERCV(append_be_field(stream, e.next_free, xref_stream_widths[1]));
                ERCV(append_be_field(stream, e.generation, xref_stream_widths[2]));
                RETOK;
            },
            [&](const XRefNormal &e) -> rvoe<NoReturnValue> {
                ERCV(append_be_field(stream, 1, xref_stream_widths[0]));
                ERCV(append_be_field(stream, e.offset, xref_stream_widths[1]));
                ERCV(append_be_field(stream, e.generation, xref_stream_widths[2]));
                RETOK;
            },
            [&](const XRefCompressed &e) -> rvoe<NoReturnValue> {
                ERCV(append_be_field(stream, 2, xref_stream_widths[0]));
                ERCV(append_be_field(stream, e.stream_object, xref_stream_widths[1]));
                ERCV(append_be_field(stream, e.index, xref_stream_widths[2]));
                RETOK;
            },
        };
        ERCV(std::visit(visitor, entry));
    }
    return stream;
}

rvoe<std::vector<XRefEntry>> decode_xref_stream_data(std::span<const std::byte> data,
                                                     const std::array<int32_t, 3> &widths,
                                                     const std::vector<int64_t> &index) {
    const size_t entry_size = widths[0] + widths[1] + widths[2];
    if(entry_size == 0 || data.size() % entry_size != 0 || index.size() % 2 != 0) {
        RETERR(MalformedInput);
    }
    std::vector<XRefEntry> entries;
    size_t offset = 0;
    for(size_t s = 0; s < index.size(); s += 2) {
        const auto first = index[s];
        const auto count = index[s + 1];
        if(first < 0 || count < 0) {
            RETERR(MalformedInput);
        }
        if(entries.size() < (size_t)(first + count)) {
            entries.resize(first + count, XRefFree{0, 0});
        }
        for(int64_t i = 0; i < count; ++i) {
            uint64_t type = 1; // Default when the field is omitted.
            if(widths[0] > 0) {
                ERC(t, read_be_field(data, offset, widths[0]));
                type = t;
            }
            offset += widths[0];
            ERC(f2, read_be_field(data, offset, widths[1]));
            offset += widths[1];
            ERC(f3, read_be_field(data, offset, widths[2]));
            offset += widths[2];
            auto &e = entries[first + i];
            switch(type) {
            case 0:
                e = XRefFree{(int32_t)f2, (uint16_t)f3};
                break;
            case 1:
                e = XRefNormal{f2, (uint16_t)f3};
                break;
            case 2:
                e = XRefCompressed{(int32_t)f2, (int32_t)f3};
                break;
            default:
                RETERR(MalformedInput);
            }
        }
    }
    return entries;
}

} // namespace formpdf::internal
