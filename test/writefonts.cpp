// SPDX-License-Identifier: Apache-2.0
// Copyright 2023-2026 Jussi Pakkanen

#include <fontbuilder.hpp>

#include <cstdio>
#include <vector>

using namespace fontprobe::testing;

namespace {

bool write_file(const char *fname, const std::vector<std::byte> &data) {
    FILE *f = fopen(fname, "wb");
    if(!f) {
        fprintf(stderr, "Could not open %s for writing.\n", fname);
        return false;
    }
    bool ok = fwrite(data.data(), 1, data.size(), f) == data.size();
    ok &= fclose(f) == 0;
    if(!ok) {
        fprintf(stderr, "Could not write %s.\n", fname);
    }
    return ok;
}

} // namespace

// Writes the input files the replay tool tests run on into the current directory.
int main() {
    FontBuilder fb;
    fb.set_names({windows_name(1, "Replay Sans"),
                  windows_name(4, "Replay Sans Regular"),
                  windows_name(6, "ReplaySans-Regular")});
    bool ok = write_file("named.ttf", fb.build());
    ok &= write_file("empty.bin", {});
    const char text[] = "Not a font at all.\n";
    std::vector<std::byte> junk((const std::byte *)text, (const std::byte *)text + sizeof(text) - 1);
    ok &= write_file("junk.txt", junk);
    return ok ? 0 : 1;
}
