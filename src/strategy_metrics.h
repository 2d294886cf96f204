/********************************************************************
 * linelookup -- strategy_metrics.h
 * Copyright (c) 2011-2013 Nelson Elhage
 *
 * This program is free software. You may use, redistribute, and/or
 * modify it under the terms listed in the COPYING file.
 ********************************************************************/
#ifndef LINELOOKUP_STRATEGY_METRICS_H
#define LINELOOKUP_STRATEGY_METRICS_H

#include <string>

#include "src/search_strategy.h"
#include "src/lib/metrics.h"

// search.<strategy>.{queries,matches,errors,usec}
struct strategy_metrics {
    explicit strategy_metrics(const std::string &name)
        : queries("search." + name + ".queries"),
          matches("search." + name + ".matches"),
          errors("search." + name + ".errors"),
          usec("search." + name + ".usec") {}

    metric queries;
    metric matches;
    metric errors;
    metric usec;
};

strategy_metrics &metrics_for(strategy_kind kind);

// Counts and times one query against a strategy.
class query_recorder {
public:
    explicit query_recorder(strategy_kind kind)
        : m_(metrics_for(kind)), tm_(m_.usec) {
        m_.queries.inc();
    }

    bool found(bool matched) {
        if (matched)
            m_.matches.inc();
        return matched;
    }

    bool failed() {
        m_.errors.inc();
        return false;
    }
private:
    strategy_metrics &m_;
    metric::timer tm_;
};

#endif /* LINELOOKUP_STRATEGY_METRICS_H */
