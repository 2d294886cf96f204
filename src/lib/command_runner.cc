/********************************************************************
 * linelookup -- command_runner.cc
 * Copyright (c) 2011-2013 Nelson Elhage
 *
 * This program is free software. You may use, redistribute, and/or
 * modify it under the terms listed in the COPYING file.
 ********************************************************************/
#include "src/lib/command_runner.h"
#include "src/lib/debug.h"

#include <errno.h>
#include <fcntl.h>
#include <spawn.h>
#include <string.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

using std::string;
using std::vector;

namespace {

class spawn_actions {
public:
    spawn_actions() {
        int err = posix_spawn_file_actions_init(&actions_);
        if (err != 0)
            throw command_error(strprintf("posix_spawn_file_actions_init: %s",
                                          strerror(err)));
    }
    ~spawn_actions() {
        posix_spawn_file_actions_destroy(&actions_);
    }

    void open(int fd, const char *path, int flags) {
        check(posix_spawn_file_actions_addopen(&actions_, fd, path, flags, 0));
    }

    void dup2(int from, int to) {
        check(posix_spawn_file_actions_adddup2(&actions_, from, to));
    }

    void close(int fd) {
        check(posix_spawn_file_actions_addclose(&actions_, fd));
    }

    posix_spawn_file_actions_t *get() {
        return &actions_;
    }
private:
    void check(int err) {
        if (err != 0)
            throw command_error(strprintf("posix_spawn_file_actions: %s",
                                          strerror(err)));
    }

    posix_spawn_file_actions_t actions_;

    spawn_actions(const spawn_actions&);
    void operator=(const spawn_actions&);
};

class scoped_fd {
public:
    scoped_fd(int fd = -1) : fd_(fd) {}
    ~scoped_fd() { reset(); }

    void reset(int fd = -1) {
        if (fd_ >= 0)
            ::close(fd_);
        fd_ = fd;
    }
    int get() const { return fd_; }
private:
    int fd_;

    scoped_fd(const scoped_fd&);
    void operator=(const scoped_fd&);
};

int wait_child(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR)
            throw command_error(strprintf("waitpid(%d): %s",
                                          (int)pid, strerror(errno)));
    }
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return -WTERMSIG(status);
    return -1;
}

string join_argv(const vector<string> &argv) {
    string out;
    for (auto it = argv.begin(); it != argv.end(); ++it) {
        if (it != argv.begin())
            out += ' ';
        out += *it;
    }
    return out;
}

}

command_result spawn_command_runner::run(const vector<string> &argv,
                                         bool capture_output) {
    if (argv.empty())
        throw command_error("empty argument vector");

    vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (auto &arg : argv)
        cargv.push_back(const_cast<char*>(arg.c_str()));
    cargv.push_back(nullptr);

    scoped_fd read_end, write_end;
    if (capture_output) {
        int fds[2];
        if (pipe2(fds, O_CLOEXEC) != 0)
            throw command_error(strprintf("pipe: %s", strerror(errno)));
        read_end.reset(fds[0]);
        write_end.reset(fds[1]);
    }

    spawn_actions actions;
    actions.open(STDIN_FILENO, "/dev/null", O_RDONLY);
    if (capture_output)
        actions.dup2(write_end.get(), STDOUT_FILENO);
    else
        actions.open(STDOUT_FILENO, "/dev/null", O_WRONLY);
    actions.open(STDERR_FILENO, "/dev/null", O_WRONLY);

    debug(kDebugExec, "spawn: %s", join_argv(argv).c_str());

    pid_t pid = 0;
    int err = posix_spawnp(&pid, cargv[0], actions.get(), nullptr,
                           cargv.data(), environ);
    if (err != 0)
        throw command_error(strprintf("posix_spawnp(%s): %s",
                                      argv[0].c_str(), strerror(err)));

    command_result result;
    result.exit_code = -1;
    if (capture_output) {
        write_end.reset();
        char buf[4096];
        while (true) {
            ssize_t n = read(read_end.get(), buf, sizeof buf);
            if (n > 0) {
                result.output.append(buf, n);
            } else if (n == 0) {
                break;
            } else if (errno != EINTR) {
                int saved = errno;
                read_end.reset();
                wait_child(pid);
                throw command_error(strprintf("read from %s: %s",
                                              argv[0].c_str(), strerror(saved)));
            }
        }
    }

    result.exit_code = wait_child(pid);
    debug(kDebugExec, "exit: %s => %d (%zu bytes)",
          argv[0].c_str(), result.exit_code, result.output.size());
    return result;
}

command_runner *default_command_runner() {
    static spawn_command_runner runner;
    return &runner;
}
