/********************************************************************
 * linelookup -- scan_strategies.cc
 * Copyright (c) 2011-2013 Nelson Elhage
 *
 * This program is free software. You may use, redistribute, and/or
 * modify it under the terms listed in the COPYING file.
 ********************************************************************/
#include "src/search_strategy.h"
#include "src/line_reader.h"
#include "src/strategy_metrics.h"
#include "src/sanitize.h"

#include "src/lib/debug.h"
#include "src/lib/mapped_file.h"

#include <errno.h>
#include <string.h>

#include <algorithm>
#include <exception>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace std;

bool linear_scan_strategy::search(StringPiece raw_query) const {
    query_recorder rec(kind());
    string key = sanitize_payload(raw_query, true);
    debug(kDebugLookup, "linear: '%s' in %s", key.c_str(), path_.c_str());

    try {
        ifstream in(path_.c_str(), ios::in | ios::binary);
        if (!in.is_open()) {
            log("Error: open('%s'): %s", path_.c_str(), strerror(errno));
            return rec.failed();
        }
        line_reader lines(in);
        string line;
        while (lines.next(&line)) {
            if (key == trim_whitespace(decode_utf8_lossy(line)))
                return rec.found(true);
        }
        if (in.bad()) {
            log("Error: read('%s'): %s", path_.c_str(), strerror(errno));
            return rec.failed();
        }
        return rec.found(false);
    } catch (const exception &e) {
        log("Error: %s", e.what());
        return rec.failed();
    }
}

vector<string> bulk_read_strategy::split_lines(StringPiece contents) {
    vector<string> lines;
    string cur;
    const char *p = contents.data();
    const char *end = contents.data() + contents.size();
    for (; p != end; ++p) {
        if (*p == '\n' || *p == '\r') {
            if (*p == '\r' && p + 1 != end && p[1] == '\n')
                ++p;
            cur += '\n';
            lines.push_back(cur);
            cur.clear();
        } else {
            cur += *p;
        }
    }
    if (!cur.empty())
        lines.push_back(cur);
    return lines;
}

bool bulk_read_strategy::search(StringPiece raw_query) const {
    query_recorder rec(kind());
    string key = sanitize_payload(raw_query, true);
    debug(kDebugLookup, "bulk: '%s' in %s", key.c_str(), path_.c_str());

    try {
        ifstream in(path_.c_str(), ios::in | ios::binary);
        if (!in.is_open()) {
            log("Error: open('%s'): %s", path_.c_str(), strerror(errno));
            return rec.failed();
        }
        stringstream contents;
        contents << in.rdbuf();
        if (in.bad()) {
            log("Error: read('%s'): %s", path_.c_str(), strerror(errno));
            return rec.failed();
        }

        vector<string> lines = split_lines(decode_utf8_lossy(contents.str()));
        string needle = key + "\n";
        return rec.found(find(lines.begin(), lines.end(), needle) != lines.end());
    } catch (const exception &e) {
        log("Error: %s", e.what());
        return rec.failed();
    }
}

namespace {

// Byte length of a UTF-8 sequence given its lead byte, or 0 if `c'
// cannot start one.
size_t utf8_seq_len(unsigned char c) {
    if (c < 0x80)
        return 1;
    if (c >= 0xC2 && c <= 0xDF)
        return 2;
    if (c >= 0xE0 && c <= 0xEF)
        return 3;
    if (c >= 0xF0 && c <= 0xF4)
        return 4;
    return 0;
}

// If [p, p+len) is exactly one UTF-8 encoded code point that counts as
// intra-line whitespace, returns true.
bool whitespace_seq(const char *p, size_t len) {
    const unsigned char *u = reinterpret_cast<const unsigned char*>(p);
    if (utf8_seq_len(u[0]) != len)
        return false;
    uint32_t cp = (len == 1) ? u[0] : (u[0] & (0xFF >> (len + 1)));
    for (size_t i = 1; i < len; ++i) {
        if ((u[i] & 0xC0) != 0x80)
            return false;
        cp = (cp << 6) | (u[i] & 0x3F);
    }
    return cp != '\n' && cp != '\r' && is_whitespace(cp);
}

// Length of the whitespace code point starting at p, or 0.
size_t whitespace_after(const char *p, const char *end) {
    if (p == end)
        return 0;
    size_t len = utf8_seq_len(static_cast<unsigned char>(*p));
    if (len == 0 || len > size_t(end - p))
        return 0;
    return whitespace_seq(p, len) ? len : 0;
}

// Length of the whitespace code point ending just before p, or 0.
size_t whitespace_before(const char *begin, const char *p) {
    for (size_t len = 1; len <= 4 && len <= size_t(p - begin); ++len) {
        if (whitespace_seq(p - len, len))
            return len;
    }
    return 0;
}

// A line starts at the beginning of the data, after "\n", or after a
// "\r" that is not the first half of "\r\n".
bool at_line_start(const char *data, const char *end, const char *p) {
    if (p == data)
        return true;
    if (p[-1] == '\n')
        return true;
    return p[-1] == '\r' && (p == end || *p != '\n');
}

};

bool mmap_scan_strategy::contains_line(const char *data, size_t len,
                                       const string &key) {
    const char *end = data + len;
    const char *p = data;
    while (p <= end) {
        const char *hit = static_cast<const char*>(
            memmem(p, end - p, key.data(), key.size()));
        if (hit == NULL)
            return false;

        const char *first = hit;
        while (!at_line_start(data, end, first)) {
            size_t n = whitespace_before(data, first);
            if (n == 0)
                break;
            first -= n;
        }
        const char *last = hit + key.size();
        while (size_t n = whitespace_after(last, end))
            last += n;

        // An empty key may only match a real line, never the position
        // just past the final terminator.
        if (at_line_start(data, end, first) && first != end &&
            (last == end || *last == '\n' || *last == '\r'))
            return true;

        if (hit == end)
            return false;
        p = hit + 1;
    }
    return false;
}

bool mmap_scan_strategy::search(StringPiece raw_query) const {
    query_recorder rec(kind());
    string key = sanitize_payload(raw_query, true);
    debug(kDebugLookup, "mmap: '%s' in %s", key.c_str(), path_.c_str());

    try {
        mapped_file mapping(path_);
        return rec.found(contains_line(reinterpret_cast<const char*>(mapping.data()),
                                       mapping.size(), key));
    } catch (const exception &e) {
        log("Error: %s", e.what());
        return rec.failed();
    }
}
