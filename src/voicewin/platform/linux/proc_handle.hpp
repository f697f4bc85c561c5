#pragma once

#include "window_error.hpp"

#include <string>

// Directory handle on /proc/<pid>. Pins the process entry so that every
// lookup made through it refers to the same process.
class ProcHandle {
public:
    explicit ProcHandle(int pid);
    // Any directory laid out like /proc/<pid>.
    explicit ProcHandle(const std::string& dir);
    ~ProcHandle();

    ProcHandle(const ProcHandle&) = delete;
    ProcHandle& operator=(const ProcHandle&) = delete;

    bool is_open() const { return fd_ >= 0; }
    int fd() const { return fd_; }

private:
    int fd_ = -1;
};

// Target of the `exe` link.
WindowResult<std::string> read_exe_link(const ProcHandle& proc);

// First NUL-separated field of `cmdline`.
WindowResult<std::string> read_cmdline_argv0(const ProcHandle& proc);

// `exe` link, falling back to argv[0] when the link cannot be read.
WindowResult<std::string> read_image_path(const ProcHandle& proc);
