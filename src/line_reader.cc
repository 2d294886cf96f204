/********************************************************************
 * linelookup -- line_reader.cc
 * Copyright (c) 2011-2013 Nelson Elhage
 *
 * This program is free software. You may use, redistribute, and/or
 * modify it under the terms listed in the COPYING file.
 ********************************************************************/
#include "src/line_reader.h"

#include <utility>

using namespace std;

bool line_reader::next(string *line) {
    while (pending_.empty()) {
        string raw;
        if (!getline(in_, raw))
            return false;
        if (!raw.empty() && raw.back() == '\r')
            raw.pop_back();

        size_t off = 0;
        for (;;) {
            size_t cr = raw.find('\r', off);
            if (cr == string::npos) {
                pending_.push_back(raw.substr(off));
                break;
            }
            pending_.push_back(raw.substr(off, cr - off));
            off = cr + 1;
        }
    }
    *line = std::move(pending_.front());
    pending_.pop_front();
    return true;
}
