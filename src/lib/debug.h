/********************************************************************
 * linelookup -- debug.h
 * Copyright (c) 2011-2013 Nelson Elhage
 *
 * This program is free software. You may use, redistribute, and/or
 * modify it under the terms listed in the COPYING file.
 ********************************************************************/
#ifndef LINELOOKUP_DEBUG_H
#define LINELOOKUP_DEBUG_H

#include <string>

enum debug_mode {
    kDebugLookup        = 0x0001,
    kDebugProfile       = 0x0002,
    kDebugCache         = 0x0004,
    kDebugExec          = 0x0008,
};

extern debug_mode debug_enabled;

#define debug(which, ...) do {                          \
    if (debug_enabled & (which))                        \
        ll_debug(__FILE__, __LINE__, ##__VA_ARGS__);    \
    } while (0)                                         \

void ll_debug(const char *file, int lno, const char *fmt, ...)
    __attribute__((format (printf, 3, 4)));

std::string strprintf(const char *fmt, ...)
    __attribute__((format (printf, 1, 2)));

void die(const char *fmt, ...)
    __attribute__((format (printf, 1, 2), noreturn));

void log(const char *fmt, ...)
    __attribute__((format (printf, 1, 2)));

// Enables the comma-separated debug channels in `spec'. Returns false
// if any channel name is unknown.
bool enable_debug(const std::string &spec);

#endif
