// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#include <flattener.hpp>
#include <utils.hpp>

#include <fmt/core.h>

using namespace formpdf::internal;

int main(int argc, char **argv) {
    if(argc != 3) {
        fmt::print(stderr, "Usage: {} <input.pdf> <output.pdf>\n", argv[0]);
        return 1;
    }
    auto source = load_file_as_string(argv[1]);
    if(!source) {
        fmt::print(stderr, "Could not read {}: {}\n", argv[1], error_text(source.error()));
        return 1;
    }
    FlattenOptions opts;
    auto result = flatten_form(*source, opts);
    if(!result) {
        fmt::print(stderr, "Flattening failed: {}\n", error_text(result.error()));
        return 1;
    }
    if(result->modified) {
        fmt::print("Flattened {} field(s), kept {} annotation(s).\n",
                   result->num_flattened,
                   result->num_preserved);
    } else {
        fmt::print("No field values to flatten, copying input unchanged.\n");
    }
    auto rc = write_file(argv[2], result->bytes);
    if(!rc) {
        fmt::print(stderr, "Could not write {}: {}\n", argv[2], error_text(rc.error()));
        return 1;
    }
    fmt::print("Wrote flattened PDF to {}\n", argv[2]);
    return 0;
}
