/********************************************************************
 * linelookup -- search_strategy.h
 * Copyright (c) 2011-2013 Nelson Elhage
 *
 * This program is free software. You may use, redistribute, and/or
 * modify it under the terms listed in the COPYING file.
 ********************************************************************/
#ifndef LINELOOKUP_SEARCH_STRATEGY_H
#define LINELOOKUP_SEARCH_STRATEGY_H

#include <memory>
#include <string>
#include <vector>

#include "re2/re2.h"

using re2::StringPiece;

class command_runner;
class line_cache;

enum strategy_kind {
    kStrategyLinear = 0,
    kStrategyBulk,
    kStrategyMmap,
    kStrategyGrep,
    kStrategyGrepFirst,
    kStrategyAwk,
    kStrategyCache,
};

const char *strategy_name(strategy_kind kind);
// Returns false if `name' is not a known strategy.
bool parse_strategy(const std::string &name, strategy_kind *out);

// A whole-line membership test against one lookup file. Every
// implementation sanitizes the raw query (see sanitize.h) and reports
// true only if some line of the file equals the canonical key.
//
// search() never throws: I/O, mapping and process failures are logged
// and reported as "no match".
class search_strategy {
public:
    virtual ~search_strategy() {}

    virtual bool search(StringPiece raw_query) const = 0;
    virtual strategy_kind kind() const = 0;

    const char *name() const {
        return strategy_name(kind());
    }
};

// Reads the file with getline() and compares each trimmed line.
class linear_scan_strategy : public search_strategy {
public:
    explicit linear_scan_strategy(const std::string &path) : path_(path) {}
    virtual bool search(StringPiece raw_query) const;
    virtual strategy_kind kind() const { return kStrategyLinear; }
protected:
    std::string path_;
};

// Slurps the file into a vector of newline-terminated lines and looks
// for "key\n" in it. A last line without a newline never matches.
class bulk_read_strategy : public search_strategy {
public:
    explicit bulk_read_strategy(const std::string &path) : path_(path) {}
    virtual bool search(StringPiece raw_query) const;
    virtual strategy_kind kind() const { return kStrategyBulk; }

    // Splits `contents' into lines, each keeping its "\n". CRLF and lone
    // CR terminators are translated to "\n"; a final unterminated line is
    // kept as-is.
    static std::vector<std::string> split_lines(StringPiece contents);
protected:
    std::string path_;
};

// Maps the file for the duration of one query and searches the raw
// bytes for the key anchored at a line start and ending at "\n", "\r"
// or the end of the file.
class mmap_scan_strategy : public search_strategy {
public:
    explicit mmap_scan_strategy(const std::string &path) : path_(path) {}
    virtual bool search(StringPiece raw_query) const;
    virtual strategy_kind kind() const { return kStrategyMmap; }

    static bool contains_line(const char *data, size_t len,
                              const std::string &key);
protected:
    std::string path_;
};

// `grep -F -x -q [-m 1] -e KEY -- PATH`.
class grep_strategy : public search_strategy {
public:
    grep_strategy(const std::string &path, command_runner *runner,
                  bool stop_after_first)
        : path_(path), runner_(runner), stop_after_first_(stop_after_first) {}
    virtual bool search(StringPiece raw_query) const;
    virtual strategy_kind kind() const {
        return stop_after_first_ ? kStrategyGrepFirst : kStrategyGrep;
    }

    std::vector<std::string> command(const std::string &key) const;
protected:
    std::string path_;
    command_runner *runner_;
    bool stop_after_first_;
};

// `awk '$0 == "KEY"' PATH`, with a relative PATH written as ./PATH;
// any output means a match.
class awk_strategy : public search_strategy {
public:
    awk_strategy(const std::string &path, command_runner *runner)
        : path_(path), runner_(runner) {}
    virtual bool search(StringPiece raw_query) const;
    virtual strategy_kind kind() const { return kStrategyAwk; }

    std::vector<std::string> command(const std::string &key) const;
    // Quotes `key' as an awk string literal.
    static std::string awk_quote(const std::string &key);
protected:
    std::string path_;
    command_runner *runner_;
};

// Membership in a prebuilt line_cache. The cache must outlive the
// strategy.
class cache_strategy : public search_strategy {
public:
    explicit cache_strategy(const line_cache *cache) : cache_(cache) {}
    virtual bool search(StringPiece raw_query) const;
    virtual strategy_kind kind() const { return kStrategyCache; }
protected:
    const line_cache *cache_;
};

// Builds one of the file-based strategies. `runner' is only used by the
// external-process strategies and must outlive the result; NULL means
// default_command_runner(). Returns NULL for kStrategyCache, which
// needs a line_cache.
std::unique_ptr<search_strategy> make_strategy(strategy_kind kind,
                                               const std::string &path,
                                               command_runner *runner);

#endif /* LINELOOKUP_SEARCH_STRATEGY_H */
