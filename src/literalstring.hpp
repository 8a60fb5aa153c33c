// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2025 Jussi Pakkanen

#pragma once

#include <errorhandling.hpp>

#include <string>
#include <string_view>

namespace formpdf::internal {

// As in ISO 32000-2 section 7.3.4.2. Input is treated as raw bytes,
// re-encoding (e.g. to PDFDocEncoding) is the caller's job.
std::string pdfstring_escape(std::string_view raw_string);

// Same as above but with the surrounding parentheses.
std::string pdfstring_quote(std::string_view raw_string);

// Decodes the bytes between the parentheses of a literal string.
// Unknown escapes keep the escaped character, they are not an error.
std::string pdfstring_decode(std::string_view escaped);

// Decodes the contents of a hex string without the angle brackets.
rvoe<std::string> pdf_hexstring_decode(std::string_view hex);

// Given the offset of an opening parenthesis, returns the offset of the
// closing one. Escaped and balanced inner parentheses are skipped.
rvoe<size_t> find_literal_string_end(std::string_view text, size_t open_paren);

} // namespace formpdf::internal
