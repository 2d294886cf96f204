/********************************************************************
 * linelookup -- exec_strategies.cc
 * Copyright (c) 2011-2013 Nelson Elhage
 *
 * This program is free software. You may use, redistribute, and/or
 * modify it under the terms listed in the COPYING file.
 ********************************************************************/
#include "src/search_strategy.h"
#include "src/strategy_metrics.h"
#include "src/sanitize.h"

#include "src/lib/command_runner.h"
#include "src/lib/debug.h"

#include <exception>
#include <string>
#include <vector>

#include <gflags/gflags.h>

DEFINE_string(grep_binary, "grep", "grep executable used by the grep strategies");
DEFINE_string(awk_binary, "awk", "awk executable used by the awk strategy");

using namespace std;

vector<string> grep_strategy::command(const string &key) const {
    vector<string> argv = {FLAGS_grep_binary, "-F", "-x", "-q"};
    if (stop_after_first_) {
        argv.push_back("-m");
        argv.push_back("1");
    }
    // -e keeps a key that starts with '-' from being read as an option.
    argv.push_back("-e");
    argv.push_back(key);
    argv.push_back("--");
    argv.push_back(path_);
    return argv;
}

bool grep_strategy::search(StringPiece raw_query) const {
    query_recorder rec(kind());
    string key = sanitize_payload(raw_query, true);
    debug(kDebugLookup, "%s: '%s' in %s", name(), key.c_str(), path_.c_str());

    try {
        command_result res = runner_->run(command(key), false);
        // 1 is "no lines selected"; anything else is an error.
        if (res.exit_code != 0 && res.exit_code != 1)
            debug(kDebugExec, "%s exited with %d", FLAGS_grep_binary.c_str(),
                  res.exit_code);
        return rec.found(res.exit_code == 0);
    } catch (const exception &e) {
        log("Error: %s", e.what());
        return rec.failed();
    }
}

string awk_strategy::awk_quote(const string &key) {
    string out = "\"";
    for (char c : key) {
        if (c == '\\' || c == '"')
            out += '\\';
        out += c;
    }
    out += '"';
    return out;
}

vector<string> awk_strategy::command(const string &key) const {
    // awk reads an operand like "a=b" as an assignment and one like "-f"
    // as an option; "./a=b" is always a file.
    string file = path_;
    if (file.empty() || file[0] != '/')
        file = "./" + file;
    return {FLAGS_awk_binary, "$0 == " + awk_quote(key), file};
}

bool awk_strategy::search(StringPiece raw_query) const {
    query_recorder rec(kind());
    string key = sanitize_payload(raw_query, true);
    debug(kDebugLookup, "awk: '%s' in %s", key.c_str(), path_.c_str());

    try {
        command_result res = runner_->run(command(key), true);
        if (res.exit_code != 0)
            debug(kDebugExec, "%s exited with %d", FLAGS_awk_binary.c_str(),
                  res.exit_code);
        return rec.found(!trim_whitespace(decode_utf8_lossy(res.output)).empty());
    } catch (const exception &e) {
        log("Error: %s", e.what());
        return rec.failed();
    }
}
