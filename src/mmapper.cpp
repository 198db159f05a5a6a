// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 Jussi Pakkanen

#include <mmapper.hpp>

#include <cstdio>
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fontprobe::internal {

class MMapperPrivate {
public:
    MMapperPrivate(const std::byte *buf_, size_t bufsize_) : buf{buf_}, bufsize{bufsize_} {};
    ~MMapperPrivate() {
        if(!buf) {
            return;
        }
        if(munmap((void *)buf, bufsize) != 0) {
            perror(nullptr);
            return;
        }
    }

    std::span<const std::byte> span() const { return std::span<const std::byte>(buf, bufsize); }

private:
    const std::byte *buf;
    size_t bufsize;
};

namespace {

struct FdCloser {
    int fd;
    ~FdCloser() {
        if(fd >= 0) {
            close(fd);
        }
    }
};

} // namespace

MMapper::MMapper(MMapperPrivate *priv) : d{priv} {}

MMapper::~MMapper() = default;

MMapper::MMapper(MMapper &&o) noexcept = default;

MMapper &MMapper::operator=(MMapper &&o) noexcept = default;

std::span<const std::byte> MMapper::span() const {
    if(!d) {
        return {};
    }
    return d->span();
}

rvoe<MMapper> mmap_file(const char *fname) {
    if(!fname) {
        RETERR(ArgIsNull);
    }
    FdCloser fc{open(fname, O_RDONLY)};
    if(fc.fd < 0) {
        RETERR(CouldNotOpenFile);
    }
    struct stat st;
    if(fstat(fc.fd, &st) != 0) {
        RETERR(FileReadError);
    }
    if(!S_ISREG(st.st_mode)) {
        RETERR(FileReadError);
    }
    const auto bufsize = (size_t)st.st_size;
    if(bufsize == 0) {
        // mmap refuses zero length mappings.
        return MMapper(new MMapperPrivate(nullptr, 0));
    }
    auto *buf = mmap(nullptr, bufsize, PROT_READ, MAP_PRIVATE, fc.fd, 0);
    if(buf == MAP_FAILED) {
        RETERR(MMapFail);
    }
    return MMapper(new MMapperPrivate((const std::byte *)buf, bufsize));
}

} // namespace fontprobe::internal
