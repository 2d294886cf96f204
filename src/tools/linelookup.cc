/********************************************************************
 * linelookup -- tools/linelookup.cc
 * Copyright (c) 2011-2014 Nelson Elhage
 *
 * This program is free software. You may use, redistribute, and/or
 * modify it under the terms listed in the COPYING file.
 ********************************************************************/
#include "src/lib/timer.h"
#include "src/lib/metrics.h"
#include "src/lib/debug.h"

#include "src/file_lookup.h"
#include "src/lookup_error.h"
#include "src/search_strategy.h"
#include "src/proto/config.pb.h"

#include <stdio.h>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <gflags/gflags.h>

#include <boost/filesystem.hpp>
#include "google/protobuf/util/json_util.h"

DEFINE_string(config, "", "Read a LookupSpec from this JSON file");
DEFINE_string(file, "", "Lookup file");
DEFINE_bool(reread_on_query, false, "Re-read the lookup file for every query instead of caching it");
DEFINE_string(strategy, "find_match", "Search strategy: find_match, linear, bulk, mmap, grep, grep_first, awk or cache");
DEFINE_int32(repeat, 1, "Run every query this many times");
DEFINE_bool(quiet, false, "Do the lookups, but don't print results.");
DEFINE_bool(metrics, false, "Dump metrics to stderr before exiting");

using namespace std;
namespace fs = boost::filesystem;

static const char kFindMatch[] = "find_match";

void load_spec(const string &path, LookupSpec *spec) {
    std::string json_text;
    try {
        fs::load_string_file(fs::path(path), json_text);
    } catch (const fs::filesystem_error &e) {
        die("Reading %s: %s", path.c_str(), e.what());
    }

    auto status = google::protobuf::util::JsonStringToMessage(
        json_text, spec, google::protobuf::util::JsonParseOptions());
    if (!status.ok())
        die("Parsing %s: %s", path.c_str(), status.ToString().c_str());
}

bool flag_set(const char *name) {
    return !gflags::GetCommandLineFlagInfoOrDie(name).is_default;
}

// Settings from --config, overridden by any flag given explicitly.
LookupSpec resolve_spec() {
    LookupSpec spec;
    if (FLAGS_config.size())
        load_spec(FLAGS_config, &spec);
    if (flag_set("file") || spec.path().empty())
        spec.set_path(FLAGS_file);
    if (flag_set("reread_on_query"))
        spec.set_reread_on_query(FLAGS_reread_on_query);
    if (flag_set("strategy") || spec.strategy().empty())
        spec.set_strategy(FLAGS_strategy);
    return spec;
}

int main(int argc, char **argv) {
    gflags::SetUsageMessage("Usage: " + string(argv[0]) + " <options> [QUERY...]\n"
                            "Reads queries from stdin, one per line, when none are given.");
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    LookupSpec spec = resolve_spec();
    if (spec.path().empty())
        die("Usage: %s --file=PATH [QUERY...] (or --config=SPEC.json)",
            gflags::GetArgv0());
    if (FLAGS_repeat < 1)
        die("--repeat must be at least 1");

    bool use_find_match = spec.strategy() == kFindMatch;
    strategy_kind kind = kStrategyCache;
    if (!use_find_match && !parse_strategy(spec.strategy(), &kind))
        die("Unknown strategy: %s", spec.strategy().c_str());

    unique_ptr<file_lookup> lookup;
    {
        timer tm;
        try {
            lookup.reset(new file_lookup(spec.path(), spec.reread_on_query()));
        } catch (const lookup_error &e) {
            die("%s", e.what());
        }
        debug(kDebugProfile, "opened %s in %ldms", spec.path().c_str(),
              timeval_ms(tm.elapsed()));
    }

    if (!use_find_match && kind == kStrategyCache && !lookup->cached())
        log("Warning: --strategy=cache without a cache; every lookup will miss");

    vector<string> queries;
    for (int i = 1; i < argc; ++i)
        queries.push_back(argv[i]);
    if (queries.empty()) {
        string line;
        while (getline(cin, line))
            queries.push_back(line);
    }

    int matched = 0;
    for (auto &q : queries) {
        bool found = false;
        timer tm;
        for (int i = 0; i < FLAGS_repeat; ++i) {
            found = use_find_match ? lookup->find_match(q)
                                   : lookup->search(kind, q);
        }
        tm.pause();
        debug(kDebugProfile, "%s: %d lookups in %ldus", q.c_str(),
              FLAGS_repeat, timeval_us(tm.elapsed()));

        if (found)
            ++matched;
        if (!FLAGS_quiet)
            printf("%s\t%s\n", q.c_str(), found ? "match" : "no match");
    }

    if (FLAGS_metrics)
        metric::dump_all();

    return matched > 0 ? 0 : 1;
}
