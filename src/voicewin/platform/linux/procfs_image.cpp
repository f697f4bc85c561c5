#include "platform/linux/proc_handle.hpp"
#include "platform/process_image.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <unistd.h>

ProcHandle::ProcHandle(int pid) : ProcHandle(std::format("/proc/{}", pid)) {}

ProcHandle::ProcHandle(const std::string& dir) {
    fd_ = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
}

ProcHandle::~ProcHandle() {
    if (fd_ >= 0) ::close(fd_);
}

// /proc/<pid>/exe: the resolved image path. Needs ptrace access to the
// target, so it fails for other users' processes.
WindowResult<std::string> read_exe_link(const ProcHandle& proc) {
    char buf[4096];
    ssize_t n = ::readlinkat(proc.fd(), "exe", buf, sizeof(buf));
    if (n < 0) {
        return std::unexpected(WindowError{WindowErrc::native_call_failed,
            std::format("readlink exe: {}", std::strerror(errno))});
    }
    if (static_cast<size_t>(n) == sizeof(buf)) {
        return std::unexpected(WindowError{WindowErrc::native_call_failed, "readlink exe: path truncated"});
    }
    return std::string(buf, static_cast<size_t>(n));
}

// /proc/<pid>/cmdline: argv[0] as the process was started. World-readable,
// but empty for kernel threads and zombies.
WindowResult<std::string> read_cmdline_argv0(const ProcHandle& proc) {
    int fd = ::openat(proc.fd(), "cmdline", O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return std::unexpected(WindowError{WindowErrc::native_call_failed,
            std::format("open cmdline: {}", std::strerror(errno))});
    }

    std::string cmdline;
    char buf[4096];
    ssize_t n;
    while ((n = ::read(fd, buf, sizeof(buf))) > 0) {
        cmdline.append(buf, static_cast<size_t>(n));
        if (cmdline.find('\0') != std::string::npos) break;
    }
    int read_errno = errno;
    ::close(fd);

    if (n < 0) {
        return std::unexpected(WindowError{WindowErrc::native_call_failed,
            std::format("read cmdline: {}", std::strerror(read_errno))});
    }

    auto argv0 = cmdline.substr(0, cmdline.find('\0'));
    if (argv0.empty()) {
        return std::unexpected(WindowError{WindowErrc::native_call_failed, "cmdline is empty"});
    }
    return argv0;
}

WindowResult<std::string> read_image_path(const ProcHandle& proc) {
    if (auto path = read_exe_link(proc)) return path;
    return read_cmdline_argv0(proc);
}

WindowResult<std::string> process_image_path(int pid) {
    if (pid <= 0) {
        return std::unexpected(WindowError{WindowErrc::native_call_failed,
            std::format("invalid pid {}", pid)});
    }

    ProcHandle proc(pid);
    if (!proc.is_open()) {
        return std::unexpected(WindowError{WindowErrc::native_call_failed,
            std::format("open /proc/{}: {}", pid, std::strerror(errno))});
    }

    return read_image_path(proc);
}
