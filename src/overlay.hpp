// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#pragma once

#include <docproperties.hpp>
#include <errorhandling.hpp>
#include <widgets.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace formpdf::internal {

// The operand of the first Tf operator in a default appearance string.
std::optional<double> font_size_from_da(std::string_view da);

// Content stream that paints the values of the given widgets. Returns an
// empty string if there is nothing to draw.
rvoe<std::string> build_overlay(const std::vector<Widget> &candidates,
                                const std::optional<std::string> &acroform_da,
                                const FlattenOptions &opts);

} // namespace formpdf::internal
