/********************************************************************
 * linelookup -- file_lookup.h
 * Copyright (c) 2011-2013 Nelson Elhage
 *
 * This program is free software. You may use, redistribute, and/or
 * modify it under the terms listed in the COPYING file.
 ********************************************************************/
#ifndef LINELOOKUP_FILE_LOOKUP_H
#define LINELOOKUP_FILE_LOOKUP_H

#include <memory>
#include <string>

#include "re2/re2.h"

#include "src/line_cache.h"
#include "src/search_strategy.h"

using re2::StringPiece;

class command_runner;

// Whole-line lookups against a single text file.
//
// In cached mode (reread_on_query == false) the file is read once, at
// construction, and find_match() consults that snapshot. In fresh-read
// mode nothing is read up front and every find_match() maps the file
// again, so it always sees the current contents.
//
// Construction in cached mode throws file_missing_error or read_failure.
// Queries never throw.
class file_lookup {
public:
    file_lookup(const std::string &path, bool reread_on_query,
                command_runner *runner = nullptr);
    ~file_lookup();

    bool find_match(StringPiece raw_query) const;

    bool linear_search(StringPiece raw_query) const;
    bool readlines_search(StringPiece raw_query) const;
    bool mmap_search(StringPiece raw_query) const;
    bool grep_search(StringPiece raw_query) const;
    bool grep_search_first(StringPiece raw_query) const;
    bool awk_search(StringPiece raw_query) const;
    // False for every query when no cache was built.
    bool cache_lookup(StringPiece raw_query) const;

    bool search(strategy_kind kind, StringPiece raw_query) const;

    const std::string &path() const { return path_; }
    bool reread_on_query() const { return reread_on_query_; }
    bool cached() const { return cache_.get() != nullptr; }
    const line_cache *cache() const { return cache_.get(); }

private:
    std::string path_;
    bool reread_on_query_;
    std::unique_ptr<line_cache> cache_;
    std::unique_ptr<search_strategy> strategies_[kStrategyCache + 1];

    file_lookup(const file_lookup&);
    void operator=(const file_lookup&);
};

#endif /* LINELOOKUP_FILE_LOOKUP_H */
