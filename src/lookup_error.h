/********************************************************************
 * linelookup -- lookup_error.h
 * Copyright (c) 2011-2013 Nelson Elhage
 *
 * This program is free software. You may use, redistribute, and/or
 * modify it under the terms listed in the COPYING file.
 ********************************************************************/
#ifndef LINELOOKUP_LOOKUP_ERROR_H
#define LINELOOKUP_LOOKUP_ERROR_H

#include <stdexcept>
#include <string>

// Errors raised while building a lookup. Queries never throw.
class lookup_error : public std::runtime_error {
public:
    lookup_error(const std::string &path, const std::string &what)
        : std::runtime_error(what), path_(path) {}

    const std::string &path() const { return path_; }
private:
    std::string path_;
};

// The lookup file does not exist.
class file_missing_error : public lookup_error {
public:
    explicit file_missing_error(const std::string &path)
        : lookup_error(path, "Lookup file not found: " + path) {}
};

// Any other failure to read the lookup file.
class read_failure : public lookup_error {
public:
    read_failure(const std::string &path, const std::string &why)
        : lookup_error(path, "Error reading lookup file " + path + ": " + why) {}
};

#endif /* LINELOOKUP_LOOKUP_ERROR_H */
