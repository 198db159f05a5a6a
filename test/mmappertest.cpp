// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 Jussi Pakkanen

#include <mmapper.hpp>

#include <cstdio>
#include <cstring>
#include <unistd.h>

using namespace fontprobe::internal;

namespace {

bool write_test_file(const char *fname, const char *contents, size_t size) {
    FILE *f = fopen(fname, "wb");
    if(!f) {
        fprintf(stderr, "Could not create %s.\n", fname);
        return false;
    }
    const bool ok = fwrite(contents, 1, size, f) == size;
    fclose(f);
    return ok;
}

} // namespace

int main() {
    const char *fname = "fontprobe_mmaptest.bin";
    const char *empty_fname = "fontprobe_mmaptest_empty.bin";
    const char contents[] = "\x00\x01\x00\x00 some font-like bytes";
    const size_t size = sizeof(contents) - 1;

    if(!write_test_file(fname, contents, size) || !write_test_file(empty_fname, "", 0)) {
        return 1;
    }

    int rc = 0;
    {
        auto mm = mmap_file(fname);
        if(!mm) {
            fprintf(stderr, "Mapping failed: %s\n", error_text(mm.error()));
            rc = 1;
        } else if(mm->span().size() != size || memcmp(mm->span().data(), contents, size) != 0) {
            fprintf(stderr, "Mapped contents differ from the file.\n");
            rc = 1;
        }
    }
    {
        auto mm = mmap_file(empty_fname);
        if(!mm) {
            fprintf(stderr, "Mapping an empty file failed: %s\n", error_text(mm.error()));
            rc = 1;
        } else if(!mm->span().empty()) {
            fprintf(stderr, "Empty file mapped to a non-empty view.\n");
            rc = 1;
        }
    }
    {
        auto mm = mmap_file("this_file_does_not_exist.ttf");
        if(mm || mm.error() != ErrorCode::CouldNotOpenFile) {
            fprintf(stderr, "Missing file was not reported.\n");
            rc = 1;
        }
    }
    {
        auto mm = mmap_file(nullptr);
        if(mm || mm.error() != ErrorCode::ArgIsNull) {
            fprintf(stderr, "Null file name was not reported.\n");
            rc = 1;
        }
    }

    unlink(fname);
    unlink(empty_fname);
    return rc;
}
