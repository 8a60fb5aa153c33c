// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2025 Jussi Pakkanen

#include <errorhandling.hpp>
#include <array>
#include <cstddef>

namespace formpdf::internal {

// clang-format off

const std::array<const char *, (std::size_t)ErrorCode::NumErrors> error_texts{
"No error.",
"Unexpected error, the real error message should be in stdout or stderr.",
"Required argument is NULL.",
"Bad ID number.",
"Index out of bounds.",
"Index is negative.",
"Invalid buffer size.",
"Could not open file.",
"Failed to load data from file.",
"Writing to file failed.",
"File does not exist.",
"Compression failure.",
"Decompression failure.",
"Requested PDF version does not support this feature.",
"Flattening steps were called out of order.",
"Root object is not defined.",
"Stream objects can not be stored in an object stream.",
"Value does not fit in the cross reference field width.",
"Cross reference entry does not point to the expected object.",
"Malformed PDF input.",
"Document has no page object.",
"Unbalanced dictionary or array delimiters.",
"Object is missing its endobj keyword.",
"Unterminated string.",
"Malformed number.",
"File has no startxref entry.",
"Malformed object stream.",
"Unsupported document structure.",
"Documents with more than one page are not supported.",
"Unsupported stream filter.",
"Page has no content stream reference.",
"Draw state end mismatch.",
"Bad enum value.",
"Boolean value must be 0 or 1.",
"Font size must be positive.",
"Unreachable code.",
};

// clang-format on

const char *error_text(ErrorCode ec) noexcept {
    const int index = (int32_t)ec;
    if(index < 0 || (std::size_t)index >= error_texts.size()) {
        return "Invalid error code.";
    }
    return error_texts[index];
}

} // namespace formpdf::internal
