// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#pragma once

#include <errorhandling.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace formpdf::internal {

enum class DrawStateType : uint8_t {
    SaveState,
    Text,
};

class CommandStreamFormatter {

public:
    CommandStreamFormatter();

    void append(std::string_view line_of_text);
    void append_command(std::string_view arg, const char *command);
    void append_command(double arg1, double arg2, const char *command);

    rvoe<NoReturnValue> BT();
    rvoe<NoReturnValue> ET();

    rvoe<NoReturnValue> q();
    rvoe<NoReturnValue> Q();

    rvoe<std::string> steal();

private:
    rvoe<NoReturnValue> indent(DrawStateType stype);
    rvoe<NoReturnValue> dedent(DrawStateType stype);
    bool has_state(DrawStateType stype) const;

    std::string lead;
    std::vector<DrawStateType> stack;
    std::string buf;
};

} // namespace formpdf::internal
