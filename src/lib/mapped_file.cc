/********************************************************************
 * linelookup -- mapped_file.cc
 * Copyright (c) 2011-2013 Nelson Elhage
 *
 * This program is free software. You may use, redistribute, and/or
 * modify it under the terms listed in the COPYING file.
 ********************************************************************/
#include "src/lib/mapped_file.h"
#include "src/lib/debug.h"

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

mapped_file::mapped_file(const std::string &path)
    : fd_(-1), map_(NULL), size_(0) {
    fd_ = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ == -1)
        throw mapping_error(strprintf("open('%s'): %s",
                                      path.c_str(), strerror(errno)));

    struct stat st;
    if (fstat(fd_, &st) != 0) {
        int err = errno;
        close(fd_);
        throw mapping_error(strprintf("fstat('%s'): %s",
                                      path.c_str(), strerror(err)));
    }
    if (st.st_size == 0) {
        close(fd_);
        throw mapping_error(strprintf("mmap('%s'): cannot map an empty file",
                                      path.c_str()));
    }
    size_ = st.st_size;

    void *map = mmap(NULL, size_, PROT_READ, MAP_PRIVATE, fd_, 0);
    if (map == MAP_FAILED) {
        int err = errno;
        close(fd_);
        throw mapping_error(strprintf("mmap('%s'): %s",
                                      path.c_str(), strerror(err)));
    }
    map_ = static_cast<uint8_t*>(map);
}

mapped_file::~mapped_file() {
    munmap(map_, size_);
    close(fd_);
}
