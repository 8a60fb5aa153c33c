// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#pragma once

#include <errorhandling.hpp>
#include <xref.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace formpdf::internal {

struct VerificationReport {
    bool xref_stream = false;
    uint64_t xref_offset = 0;
    int64_t declared_size = 0;
    int32_t root = 0;
    size_t num_free = 0;
    size_t num_normal = 0;
    size_t num_compressed = 0;
    std::vector<XRefEntry> entries;
};

// Walks the cross reference data pointed to by startxref and checks that every
// in-use entry leads to the object it claims to. Only the newest section is checked.
rvoe<VerificationReport> verify_document(std::string_view bytes);

} // namespace formpdf::internal
