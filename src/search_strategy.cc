/********************************************************************
 * linelookup -- search_strategy.cc
 * Copyright (c) 2011-2013 Nelson Elhage
 *
 * This program is free software. You may use, redistribute, and/or
 * modify it under the terms listed in the COPYING file.
 ********************************************************************/
#include "src/search_strategy.h"
#include "src/strategy_metrics.h"
#include "src/line_cache.h"
#include "src/sanitize.h"

#include "src/lib/command_runner.h"
#include "src/lib/debug.h"

using std::string;
using std::unique_ptr;

namespace {
    struct strategy_entry {
        strategy_kind kind;
        const char *name;
    } strategies[] = {
        {kStrategyLinear,    "linear"},
        {kStrategyBulk,      "bulk"},
        {kStrategyMmap,      "mmap"},
        {kStrategyGrep,      "grep"},
        {kStrategyGrepFirst, "grep_first"},
        {kStrategyAwk,       "awk"},
        {kStrategyCache,     "cache"},
    };
};

const char *strategy_name(strategy_kind kind) {
    for (auto &s : strategies) {
        if (s.kind == kind)
            return s.name;
    }
    return "unknown";
}

bool parse_strategy(const string &name, strategy_kind *out) {
    for (auto &s : strategies) {
        if (name == s.name) {
            *out = s.kind;
            return true;
        }
    }
    return false;
}

strategy_metrics &metrics_for(strategy_kind kind) {
    static strategy_metrics linear("linear");
    static strategy_metrics bulk("bulk");
    static strategy_metrics mapped("mmap");
    static strategy_metrics grep("grep");
    static strategy_metrics grep_first("grep_first");
    static strategy_metrics awk("awk");
    static strategy_metrics cache("cache");

    switch (kind) {
    case kStrategyLinear:    return linear;
    case kStrategyBulk:      return bulk;
    case kStrategyMmap:      return mapped;
    case kStrategyGrep:      return grep;
    case kStrategyGrepFirst: return grep_first;
    case kStrategyAwk:       return awk;
    case kStrategyCache:     return cache;
    }
    return cache;
}

bool cache_strategy::search(StringPiece raw_query) const {
    query_recorder rec(kind());
    string key = sanitize_payload(raw_query, true);
    debug(kDebugLookup, "cache: '%s'", key.c_str());
    if (cache_ == nullptr)
        return rec.found(false);
    return rec.found(cache_->contains(key));
}

unique_ptr<search_strategy> make_strategy(strategy_kind kind,
                                          const string &path,
                                          command_runner *runner) {
    if (runner == nullptr)
        runner = default_command_runner();
    switch (kind) {
    case kStrategyLinear:
        return unique_ptr<search_strategy>(new linear_scan_strategy(path));
    case kStrategyBulk:
        return unique_ptr<search_strategy>(new bulk_read_strategy(path));
    case kStrategyMmap:
        return unique_ptr<search_strategy>(new mmap_scan_strategy(path));
    case kStrategyGrep:
        return unique_ptr<search_strategy>(new grep_strategy(path, runner, false));
    case kStrategyGrepFirst:
        return unique_ptr<search_strategy>(new grep_strategy(path, runner, true));
    case kStrategyAwk:
        return unique_ptr<search_strategy>(new awk_strategy(path, runner));
    case kStrategyCache:
        break;
    }
    return unique_ptr<search_strategy>();
}
