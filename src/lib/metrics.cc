/********************************************************************
 * linelookup -- metrics.cc
 * Copyright (c) 2011-2013 Nelson Elhage
 *
 * This program is free software. You may use, redistribute, and/or
 * modify it under the terms listed in the COPYING file.
 ********************************************************************/
#include "metrics.h"

#include <stdlib.h>
#include <map>
#include <mutex>

namespace {
    std::mutex metrics_mtx;
    std::map<std::string, metric*> *metrics;
};


metric::metric(const std::string &name) : val_(0) {
    std::unique_lock<std::mutex> locked(metrics_mtx);
    if (metrics == 0)
        metrics = new std::map<std::string, metric*>;
    (*metrics)[name] = this;
}


void metric::dump_all(FILE *out) {
    std::unique_lock<std::mutex> locked(metrics_mtx);
    fprintf(out, "== begin metrics ==\n");
    if (metrics != 0) {
        for (auto it = metrics->begin(); it != metrics->end(); ++it) {
            fprintf(out, "%s %ld\n", it->first.c_str(), it->second->val_.load());
        }
    }
    fprintf(out, "== end metrics ==\n");
}

long metric::lookup(const std::string &name) {
    std::unique_lock<std::mutex> locked(metrics_mtx);
    if (metrics == 0)
        return -1;
    auto it = metrics->find(name);
    if (it == metrics->end())
        return -1;
    return it->second->val_.load();
}
