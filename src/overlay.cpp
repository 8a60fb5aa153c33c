// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#include <overlay.hpp>
#include <commandstreamformatter.hpp>
#include <literalstring.hpp>
#include <pdfparser.hpp>

#include <fmt/core.h>

#include <algorithm>

namespace formpdf::internal {

std::optional<double> font_size_from_da(std::string_view da) {
    PdfLexer lex(da);
    std::optional<double> previous;
    while(true) {
        auto token = lex.next();
        if(std::holds_alternative<PdfTokenFinished>(token)) {
            return {};
        }
        if(auto *i = std::get_if<PdfTokenInteger>(&token)) {
            previous = double(i->value);
            continue;
        }
        if(auto *r = std::get_if<PdfTokenReal>(&token)) {
            previous = r->value;
            continue;
        }
        if(std::holds_alternative<PdfTokenError>(token)) {
            lex.set_offset(lex.token_start() + 1);
        } else if(auto *kw = std::get_if<PdfTokenKeyword>(&token); kw && kw->text == "Tf") {
            // Size 0 means autosize which we can not do.
            if(previous && *previous > 0) {
                return previous;
            }
            return {};
        }
        previous.reset();
    }
}

rvoe<std::string> build_overlay(const std::vector<Widget> &candidates,
                                const std::optional<std::string> &acroform_da,
                                const FlattenOptions &opts) {
    if(candidates.empty()) {
        return std::string{};
    }
    std::optional<double> form_size;
    if(acroform_da) {
        form_size = font_size_from_da(*acroform_da);
    }
    CommandStreamFormatter cmds;
    ERCV(cmds.q());
    for(const auto &c : candidates) {
        if(!c.rect || !c.value) {
            continue;
        }
        std::optional<double> size;
        if(c.default_appearance) {
            size = font_size_from_da(*c.default_appearance);
        }
        const double font_size = size.value_or(form_size.value_or(opts.default_font_size));
        const auto &r = *c.rect;
        const double x = r.x1 + opts.left_padding;
        const double y = r.y1 + std::max(0.0, (r.h() - font_size) / 2.0);
        cmds.append(fmt::format("BT /{} {} Tf 0 0 0 rg {:.3f} {:.3f} Td {} Tj ET",
                                opts.font_resource_name,
                                font_size,
                                x,
                                y,
                                pdfstring_quote(*c.value)));
    }
    ERCV(cmds.Q());
    return cmds.steal();
}

} // namespace formpdf::internal
