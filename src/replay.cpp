// SPDX-License-Identifier: Apache-2.0
// Copyright 2024-2026 Jussi Pakkanen

#include <probe.hpp>
#include <mmapper.hpp>

#include <cstdio>
#include <cstring>
#include <optional>
#include <string>

using namespace fontprobe::internal;

namespace {

std::string or_absent(std::optional<std::string_view> s) {
    if(!s) {
        return "(absent)";
    }
    return std::string(*s);
}

void print_details(std::span<const std::byte> data) {
    auto face = FontFace::load(data);
    if(!face) {
        printf("  %s\n", error_text(face.error()));
        return;
    }
    printf("  format: %s\n", or_absent(face->font_format()).c_str());
    printf("  faces: %lld\n", (long long)face->num_faces());
    printf("  family: %s\n", or_absent(face->family_name()).c_str());
    printf("  postscript: %s\n", or_absent(face->postscript_name()).c_str());
    printf("  names: %u\n", (unsigned)face->num_names());
}

} // namespace

int main(int argc, char **argv) {
    bool verbose = false;
    int first_file = 1;
    if(argc > 1 && strcmp(argv[1], "-v") == 0) {
        verbose = true;
        ++first_file;
    }
    if(first_file >= argc) {
        printf("%s [-v] <input> [<input> ...]\n", argv[0]);
        return 1;
    }
    int rc = 0;
    for(int i = first_file; i < argc; ++i) {
        auto mm = mmap_file(argv[i]);
        if(!mm) {
            fprintf(stderr, "%s: %s\n", argv[i], error_text(mm.error()));
            rc = 1;
            continue;
        }
        const auto data = mm->span();
        const auto result = run_trial(data);
        printf("%s: %s\n", argv[i], fontprobe::trial_result_text(result));
        if(verbose && result == fontprobe::TrialResult::Probed) {
            print_details(data);
        }
    }
    return rc;
}
