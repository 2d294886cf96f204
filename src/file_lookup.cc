/********************************************************************
 * linelookup -- file_lookup.cc
 * Copyright (c) 2011-2013 Nelson Elhage
 *
 * This program is free software. You may use, redistribute, and/or
 * modify it under the terms listed in the COPYING file.
 ********************************************************************/
#include "src/file_lookup.h"

#include "src/lib/command_runner.h"
#include "src/lib/debug.h"

using std::string;

file_lookup::file_lookup(const string &path, bool reread_on_query,
                         command_runner *runner)
    : path_(path), reread_on_query_(reread_on_query) {
    if (runner == nullptr)
        runner = default_command_runner();

    if (!reread_on_query_)
        cache_.reset(new line_cache(line_cache::build(path_)));
    debug(kDebugLookup, "%s: opened in %s mode", path_.c_str(),
          reread_on_query_ ? "fresh-read" : "cached");

    for (int k = kStrategyLinear; k < kStrategyCache; ++k)
        strategies_[k] = make_strategy(static_cast<strategy_kind>(k), path_, runner);
    strategies_[kStrategyCache].reset(new cache_strategy(cache_.get()));
}

file_lookup::~file_lookup() {
}

bool file_lookup::search(strategy_kind kind, StringPiece raw_query) const {
    return strategies_[kind]->search(raw_query);
}

bool file_lookup::find_match(StringPiece raw_query) const {
    if (reread_on_query_)
        return search(kStrategyMmap, raw_query);
    return search(kStrategyCache, raw_query);
}

bool file_lookup::linear_search(StringPiece raw_query) const {
    return search(kStrategyLinear, raw_query);
}

bool file_lookup::readlines_search(StringPiece raw_query) const {
    return search(kStrategyBulk, raw_query);
}

bool file_lookup::mmap_search(StringPiece raw_query) const {
    return search(kStrategyMmap, raw_query);
}

bool file_lookup::grep_search(StringPiece raw_query) const {
    return search(kStrategyGrep, raw_query);
}

bool file_lookup::grep_search_first(StringPiece raw_query) const {
    return search(kStrategyGrepFirst, raw_query);
}

bool file_lookup::awk_search(StringPiece raw_query) const {
    return search(kStrategyAwk, raw_query);
}

bool file_lookup::cache_lookup(StringPiece raw_query) const {
    return search(kStrategyCache, raw_query);
}
