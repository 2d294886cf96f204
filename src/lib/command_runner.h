/********************************************************************
 * linelookup -- command_runner.h
 * Copyright (c) 2011-2013 Nelson Elhage
 *
 * This program is free software. You may use, redistribute, and/or
 * modify it under the terms listed in the COPYING file.
 ********************************************************************/
#ifndef LINELOOKUP_COMMAND_RUNNER_H
#define LINELOOKUP_COMMAND_RUNNER_H

#include <stdexcept>
#include <string>
#include <vector>

struct command_result {
    // The child's exit status, or minus the signal number if it was
    // killed by a signal.
    int exit_code;
    // Standard output, only filled in when capture was requested.
    std::string output;
};

// Raised when a command could not be spawned or reaped.
class command_error : public std::runtime_error {
public:
    explicit command_error(const std::string &what)
        : std::runtime_error(what) {}
};

// Runs an argument vector as a child process and blocks until it
// exits. argv[0] is looked up on $PATH. No shell is involved.
class command_runner {
public:
    virtual ~command_runner() {}

    // Throws command_error if the process cannot be started.
    virtual command_result run(const std::vector<std::string> &argv,
                               bool capture_output) = 0;
};

// posix_spawn based runner. stdin is /dev/null, stderr is discarded,
// and stdout is either captured or discarded.
class spawn_command_runner : public command_runner {
public:
    virtual command_result run(const std::vector<std::string> &argv,
                               bool capture_output);
};

// Process-wide spawn_command_runner.
command_runner *default_command_runner();

#endif /* !defined(LINELOOKUP_COMMAND_RUNNER_H) */
