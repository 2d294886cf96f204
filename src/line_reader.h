/********************************************************************
 * linelookup -- line_reader.h
 * Copyright (c) 2011-2013 Nelson Elhage
 *
 * This program is free software. You may use, redistribute, and/or
 * modify it under the terms listed in the COPYING file.
 ********************************************************************/
#ifndef LINELOOKUP_LINE_READER_H
#define LINELOOKUP_LINE_READER_H

#include <deque>
#include <istream>
#include <string>

// Reads lines from a stream, accepting "\n", "\r\n" and a lone "\r" as
// terminators. Lines are returned without their terminator. A
// terminator at the very end of the stream does not start another,
// empty, line.
class line_reader {
public:
    explicit line_reader(std::istream &in) : in_(in) {}

    bool next(std::string *line);

private:
    std::istream &in_;
    std::deque<std::string> pending_;
};

#endif /* LINELOOKUP_LINE_READER_H */
