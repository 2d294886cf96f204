/********************************************************************
 * linelookup -- line_cache.cc
 * Copyright (c) 2011-2013 Nelson Elhage
 *
 * This program is free software. You may use, redistribute, and/or
 * modify it under the terms listed in the COPYING file.
 ********************************************************************/
#include "src/line_cache.h"
#include "src/line_reader.h"
#include "src/lookup_error.h"
#include "src/sanitize.h"

#include "src/lib/debug.h"
#include "src/lib/timer.h"

#include <errno.h>
#include <string.h>

#include <fstream>
#include <string>

#include <boost/filesystem.hpp>

using namespace std;
namespace fs = boost::filesystem;

line_cache line_cache::build(const string &path) {
    boost::system::error_code ec;
    fs::file_status st = fs::status(path, ec);
    if (st.type() == fs::file_not_found) {
        log("Lookup file not found: %s", path.c_str());
        throw file_missing_error(path);
    }
    if (ec) {
        log("Error reading lookup file %s: %s", path.c_str(), ec.message().c_str());
        throw read_failure(path, ec.message());
    }
    if (fs::is_directory(st)) {
        log("Error reading lookup file %s: is a directory", path.c_str());
        throw read_failure(path, "is a directory");
    }

    ifstream in(path.c_str(), ios::in | ios::binary);
    if (!in.is_open()) {
        string why = strerror(errno);
        log("Error reading lookup file %s: %s", path.c_str(), why.c_str());
        throw read_failure(path, why);
    }

    timer tm;
    line_cache cache;
    line_reader lines(in);
    string line;
    while (lines.next(&line)) {
        cache.lines_.insert(trim_whitespace(decode_utf8_lossy(line)));
    }
    if (in.bad()) {
        string why = strerror(errno);
        log("Error reading lookup file %s: %s", path.c_str(), why.c_str());
        throw read_failure(path, why);
    }

    debug(kDebugCache, "cached %zu distinct lines from %s in %ldms",
          cache.size(), path.c_str(), timeval_ms(tm.elapsed()));
    return cache;
}
