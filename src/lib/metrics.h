/********************************************************************
 * linelookup -- metrics.h
 * Copyright (c) 2011-2013 Nelson Elhage
 *
 * This program is free software. You may use, redistribute, and/or
 * modify it under the terms listed in the COPYING file.
 ********************************************************************/
#ifndef LINELOOKUP_METRICS_H
#define LINELOOKUP_METRICS_H

#include "timer.h"

#include <stdio.h>
#include <atomic>
#include <string>

// A named process-wide counter. Metrics register themselves on
// construction and are expected to live for the whole process, so
// define them at namespace scope.
class metric {
public:
    metric(const std::string &name);
    void inc() {++val_;}
    void inc(long i) {val_ += i;}

    static void dump_all(FILE *out = stderr);
    // Returns the current value of the metric called `name', or -1 if
    // no such metric exists.
    static long lookup(const std::string &name);

    // Adds the microseconds spent between construction
    // and pause() (or destruction) to the metric.
    class timer {
    public:
        timer(metric &m) : m_(&m) {}

        void pause() {
            tm_.pause();
            m_->inc(timeval_us(tm_.elapsed()));
            tm_.reset();
        }

        ~timer() {
            if (tm_.running())
                pause();
        }
    private:
        metric *m_;
        ::timer tm_;
    };

private:
    std::atomic_long val_;

    metric(const metric&);
    void operator=(const metric&);
};

#endif
