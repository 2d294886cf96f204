/********************************************************************
 * linelookup -- sanitize.h
 * Copyright (c) 2011-2013 Nelson Elhage
 *
 * This program is free software. You may use, redistribute, and/or
 * modify it under the terms listed in the COPYING file.
 ********************************************************************/
#ifndef LINELOOKUP_SANITIZE_H
#define LINELOOKUP_SANITIZE_H

#include <stdint.h>
#include <string>

#include "re2/re2.h"

using re2::StringPiece;

// Turns an untrusted byte payload into the canonical key used for every
// comparison:
//
//  1. decode as UTF-8, dropping bytes that are not part of a valid
//     sequence;
//  2. strip trailing NUL, CR and LF;
//  3. if strip_ctrl, remove every non-printable code point;
//  4. strip leading and trailing whitespace.
//
// The result is always valid UTF-8. Never throws.
std::string sanitize_payload(StringPiece raw, bool strip_ctrl = true);

// Step 1 of sanitize_payload on its own.
std::string decode_utf8_lossy(StringPiece raw);

// Step 4 of sanitize_payload on its own. `text' must be valid UTF-8.
std::string trim_whitespace(StringPiece text);

bool is_printable(uint32_t cp);
bool is_whitespace(uint32_t cp);

#endif /* LINELOOKUP_SANITIZE_H */
