// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#include <commandstreamformatter.hpp>

#include <fmt/core.h>

#include <iterator>

namespace formpdf::internal {

CommandStreamFormatter::CommandStreamFormatter() {}

void CommandStreamFormatter::append(std::string_view line_of_text) {
    if(!line_of_text.empty()) {
        buf += lead;
        buf += line_of_text;
        if(buf.back() != '\n') {
            buf += '\n';
        }
    }
}

void CommandStreamFormatter::append_command(std::string_view arg, const char *command) {
    buf += lead;
    buf += arg;
    buf += ' ';
    buf += command;
    buf += '\n';
}

void CommandStreamFormatter::append_command(double arg1, double arg2, const char *command) {
    fmt::format_to(std::back_inserter(buf), "{}{:f} {:f} {}\n", lead, arg1, arg2, command);
}

rvoe<NoReturnValue> CommandStreamFormatter::BT() {
    append("BT");
    ERCV(indent(DrawStateType::Text));
    RETOK;
}

rvoe<NoReturnValue> CommandStreamFormatter::ET() {
    ERCV(dedent(DrawStateType::Text));
    append("ET");
    RETOK;
}

rvoe<NoReturnValue> CommandStreamFormatter::q() {
    append("q");
    ERCV(indent(DrawStateType::SaveState));
    RETOK;
}

rvoe<NoReturnValue> CommandStreamFormatter::Q() {
    ERCV(dedent(DrawStateType::SaveState));
    append("Q");
    RETOK;
}

rvoe<NoReturnValue> CommandStreamFormatter::indent(DrawStateType stype) {
    // Text objects can not nest.
    if(stype == DrawStateType::Text && has_state(stype)) {
        RETERR(DrawStateEndMismatch);
    }
    stack.push_back(stype);
    lead += "  ";
    RETOK;
}

rvoe<NoReturnValue> CommandStreamFormatter::dedent(DrawStateType stype) {
    if(stack.empty() || stack.back() != stype) {
        RETERR(DrawStateEndMismatch);
    }
    stack.pop_back();
    lead.pop_back();
    lead.pop_back();
    RETOK;
}

bool CommandStreamFormatter::has_state(DrawStateType stype) const {
    for(const auto e : stack) {
        if(e == stype)
            return true;
    }
    return false;
}

rvoe<std::string> CommandStreamFormatter::steal() {
    if(!stack.empty()) {
        RETERR(DrawStateEndMismatch);
    }
    std::string tmpres;
    tmpres.swap(buf);
    return tmpres;
}

} // namespace formpdf::internal
