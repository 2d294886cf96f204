/********************************************************************
 * linelookup -- debug.cc
 * Copyright (c) 2011-2013 Nelson Elhage
 *
 * This program is free software. You may use, redistribute, and/or
 * modify it under the terms listed in the COPYING file.
 ********************************************************************/
#include "debug.h"

#include <gflags/gflags.h>

#include <string>
#include <stdlib.h>
#include <stdarg.h>
#include <stdio.h>
#include <errno.h>
#include <string.h>

using std::string;

debug_mode debug_enabled;

DEFINE_string(debug, "", "Enable debugging for selected subsystems "
              "(lookup,profile,cache,exec,all)");

struct debug_flag {
    const char *flag;
    debug_mode bits;
} debug_flags[] = {
    {"lookup",    kDebugLookup},
    {"profile",   kDebugProfile},
    {"cache",     kDebugCache},
    {"exec",      kDebugExec},
    {"all",       (debug_mode)-1}
};

bool enable_debug(const string &value) {
    size_t off = 0;
    while (off < value.size()) {
        size_t comma = value.find(',', off);
        if (comma == string::npos)
            comma = value.size();
        string opt = value.substr(off, comma - off);
        off = comma + 1;

        bool found = false;
        for (size_t i = 0; i < sizeof(debug_flags)/sizeof(*debug_flags); ++i) {
            if (opt == debug_flags[i].flag) {
                found = true;
                debug_enabled = static_cast<debug_mode>(debug_enabled | debug_flags[i].bits);
                break;
            }
        }

        if (!found) {
            return false;
        }
    }

    return true;
}

static bool validate_debug(const char *flagname, const string& value) {
    return enable_debug(value);
}

static const bool dummy = gflags::RegisterFlagValidator(&FLAGS_debug,
                                                        validate_debug);


string vstrprintf(const char *fmt, va_list ap) {
    char *buf = NULL;
    int err = vasprintf(&buf, fmt, ap);
    if (err < 0) {
        fprintf(stderr, "unable to log: fmt='%s' err=%s\n",
                fmt, strerror(errno));
        return "";
    }

    string out(buf, err);
    free(buf);
    return out;
}

string strprintf(const char *fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    string out = vstrprintf(fmt, ap);
    va_end(ap);
    return out;
}

void ll_debug(const char *file, int lno, const char *fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    string buf = strprintf("[%s:%d] %s\n",
                           file, lno, vstrprintf(fmt, ap).c_str());
    va_end(ap);

    fputs(buf.c_str(), stderr);
}


void die(const char *fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    vfprintf(stderr, fmt, ap);
    fprintf(stderr, "\n");
    va_end(ap);
    exit(2);
}

void log(const char *fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    string buf = vstrprintf(fmt, ap);
    va_end(ap);

    fprintf(stderr, "%s\n", buf.c_str());
}
