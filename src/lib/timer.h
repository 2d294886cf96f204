/********************************************************************
 * linelookup -- timer.h
 * Copyright (c) 2011-2013 Nelson Elhage
 *
 * This program is free software. You may use, redistribute, and/or
 * modify it under the terms listed in the COPYING file.
 ********************************************************************/
#ifndef LINELOOKUP_TIMER_H
#define LINELOOKUP_TIMER_H
#include <sys/time.h>
#include <mutex>

/* Wall-clock stopwatch. Accumulates across start()/pause() pairs. */
class timer {
public:
    timer(bool startnow = true)
        : running_(false), elapsed_({0,0}) {
        if (startnow)
            start();
    }

    void start() {
        std::unique_lock<std::mutex> locked(lock_);
        if (running_)
            return;
        running_ = true;
        gettimeofday(&start_, NULL);
    }

    void pause() {
        std::unique_lock<std::mutex> locked(lock_);
        if (!running_)
            return;
        running_ = false;
        accumulate();
    }

    void reset() {
        std::unique_lock<std::mutex> locked(lock_);
        running_ = false;
        elapsed_ = (struct timeval){0,0};
    }

    bool running() {
        std::unique_lock<std::mutex> locked(lock_);
        return running_;
    }

    struct timeval elapsed() {
        std::unique_lock<std::mutex> locked(lock_);
        if (running_)
            accumulate();
        return elapsed_;
    }

protected:
    // Caller holds lock_. Folds [start_, now) into elapsed_.
    void accumulate() {
        struct timeval now;
        gettimeofday(&now, NULL);
        long usec = (now.tv_sec - start_.tv_sec) * 1000000L
            + (now.tv_usec - start_.tv_usec);
        usec += elapsed_.tv_usec;
        elapsed_.tv_sec += usec / 1000000L;
        elapsed_.tv_usec = usec % 1000000L;
        start_ = now;
    }

    bool running_;
    struct timeval start_;
    struct timeval elapsed_;
    std::mutex lock_;

    timer(const timer& rhs);
    timer operator=(const timer& rhs);
};

inline static long timeval_ms(struct timeval tv) {
    return tv.tv_sec * 1000 + tv.tv_usec / 1000;
}

inline static long timeval_us(struct timeval tv) {
    return tv.tv_sec * 1000000L + tv.tv_usec;
}

#endif
