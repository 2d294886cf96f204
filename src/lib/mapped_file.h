/********************************************************************
 * linelookup -- mapped_file.h
 * Copyright (c) 2011-2013 Nelson Elhage
 *
 * This program is free software. You may use, redistribute, and/or
 * modify it under the terms listed in the COPYING file.
 ********************************************************************/
#ifndef LINELOOKUP_MAPPED_FILE_H
#define LINELOOKUP_MAPPED_FILE_H

#include <stddef.h>
#include <stdint.h>
#include <stdexcept>
#include <string>

class mapping_error : public std::runtime_error {
public:
    explicit mapping_error(const std::string &what)
        : std::runtime_error(what) {}
};

// A read-only, private mapping of a whole file. The mapping is released
// when the object is destroyed. Throws mapping_error if the file cannot
// be opened, is empty, or cannot be mapped.
class mapped_file {
public:
    explicit mapped_file(const std::string &path);
    ~mapped_file();

    const uint8_t *data() const { return map_; }
    size_t size() const { return size_; }

private:
    int fd_;
    uint8_t *map_;
    size_t size_;

    mapped_file(const mapped_file&);
    void operator=(const mapped_file&);
};

#endif
