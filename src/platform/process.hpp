#pragma once

#include <string>
#include <vector>
#include <map>
#include <core/types.hpp>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#endif

namespace platform {

struct SpawnOptions {
    std::map<std::string, std::string> env;   // added to / overriding the parent environment
    std::vector<std::string> unset_env;       // removed from the child environment
};

// How a child process ended.
struct ExitStatus {
    bool exited = false;    // true if the child returned an exit code
    int code = -1;          // exit code when exited
    int signal = 0;         // terminating signal otherwise (Unix)
};

// Opaque handle to a spawned child process.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // Wait indefinitely and report exactly how the process ended.
    // Interrupted waits are resumed.
    ExitStatus wait_status();

    // Get the raw pid/handle.
#ifdef _WIN32
    HANDLE native_handle() const { return handle_; }
#else
    int native_handle() const { return pid_; }
#endif

private:
#ifdef _WIN32
    HANDLE handle_ = INVALID_HANDLE_VALUE;
    HANDLE thread_ = INVALID_HANDLE_VALUE;
#else
    int pid_ = -1;
    bool reaped_ = false;
    ExitStatus status_;
#endif
    friend Result<ProcessHandle> spawn(const std::string& program,
                                       const std::vector<std::string>& args,
                                       const SpawnOptions& options);
};

// Spawn a child process. Standard input, output and error are inherited.
// Fails with ErrorKind::Spawn if the program could not be started at all
// (missing, not executable, exec failure), as opposed to running and failing.
Result<ProcessHandle> spawn(const std::string& program,
                            const std::vector<std::string>& args,
                            const SpawnOptions& options = SpawnOptions{});

// While alive, SIGINT/SIGTERM/SIGHUP/SIGQUIT delivered to this process are
// forwarded to the child instead of terminating us. Install it before spawn()
// and attach() the child afterwards; a signal caught in between is held and
// delivered on attach(), or re-raised on destruction if no child was attached.
// Previous handlers are restored on destruction. One forwarder at a time.
class SignalForwarder {
public:
    SignalForwarder();
    ~SignalForwarder();

    SignalForwarder(const SignalForwarder&) = delete;
    SignalForwarder& operator=(const SignalForwarder&) = delete;

    void attach(const ProcessHandle& child);

private:
#ifndef _WIN32
    struct Saved;
    Saved* saved_ = nullptr;
#endif
};

// Whether a caught signal should be relayed. A signal sent by the kernel on
// behalf of the terminal (sender pid 0) already reached a child that shares
// our process group, so relaying it would deliver it twice.
bool should_forward_signal(int sender_pid, bool child_in_our_group);

} // namespace platform
