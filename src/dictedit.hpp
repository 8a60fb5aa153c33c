// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#pragma once

#include <errorhandling.hpp>

#include <string>
#include <string_view>

namespace formpdf::internal {

// In place edits of the outermost dictionary of an object body. Text outside
// the edited entry, including any stream data, is kept byte for byte.

// Replaces the value of an existing key or appends the pair at the end of the dictionary.
rvoe<std::string>
set_dict_entry(std::string_view body, std::string_view key, std::string_view value_text);

// Returns the body unchanged if the key is not present.
rvoe<std::string> remove_dict_entry(std::string_view body, std::string_view key);

} // namespace formpdf::internal
