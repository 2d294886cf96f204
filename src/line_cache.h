/********************************************************************
 * linelookup -- line_cache.h
 * Copyright (c) 2011-2013 Nelson Elhage
 *
 * This program is free software. You may use, redistribute, and/or
 * modify it under the terms listed in the COPYING file.
 ********************************************************************/
#ifndef LINELOOKUP_LINE_CACHE_H
#define LINELOOKUP_LINE_CACHE_H

#include <string>

#include "absl/container/flat_hash_set.h"

// The set of trimmed lines of a lookup file, as of the moment it was
// built. Read-only once built, so concurrent lookups are safe.
class line_cache {
public:
    // Throws file_missing_error if `path' does not exist and
    // read_failure on any other error.
    static line_cache build(const std::string &path);

    bool contains(const std::string &key) const {
        return lines_.contains(key);
    }

    size_t size() const {
        return lines_.size();
    }

protected:
    line_cache() {}

    absl::flat_hash_set<std::string> lines_;
};

#endif /* LINELOOKUP_LINE_CACHE_H */
