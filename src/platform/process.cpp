#include "process.hpp"
#include <fmt/format.h>

#ifdef _WIN32
#  include <windows.h>
#else
#  include <unistd.h>
#  include <sys/wait.h>
#  include <signal.h>
#  include <fcntl.h>
#  include <cerrno>
extern char** environ;
#endif

#include <sstream>
#include <set>
#include <cstring>

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
#ifdef _WIN32
    if (handle_ != INVALID_HANDLE_VALUE) CloseHandle(handle_);
    if (thread_ != INVALID_HANDLE_VALUE) CloseHandle(thread_);
#endif
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept {
#ifdef _WIN32
    handle_ = other.handle_;
    thread_ = other.thread_;
    other.handle_ = INVALID_HANDLE_VALUE;
    other.thread_ = INVALID_HANDLE_VALUE;
#else
    pid_ = other.pid_;
    reaped_ = other.reaped_;
    status_ = other.status_;
    other.pid_ = -1;
#endif
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
#ifdef _WIN32
        if (handle_ != INVALID_HANDLE_VALUE) CloseHandle(handle_);
        if (thread_ != INVALID_HANDLE_VALUE) CloseHandle(thread_);
        handle_ = other.handle_;
        thread_ = other.thread_;
        other.handle_ = INVALID_HANDLE_VALUE;
        other.thread_ = INVALID_HANDLE_VALUE;
#else
        pid_ = other.pid_;
        reaped_ = other.reaped_;
        status_ = other.status_;
        other.pid_ = -1;
#endif
    }
    return *this;
}

bool ProcessHandle::valid() const {
#ifdef _WIN32
    return handle_ != INVALID_HANDLE_VALUE;
#else
    return pid_ > 0;
#endif
}

#ifdef _WIN32

ExitStatus ProcessHandle::wait_status() {
    ExitStatus st;
    if (handle_ == INVALID_HANDLE_VALUE) return st;
    WaitForSingleObject(handle_, INFINITE);
    DWORD code = 1;
    if (GetExitCodeProcess(handle_, &code)) {
        st.exited = true;
        st.code = static_cast<int>(code);
    }
    return st;
}

#else

static ExitStatus decode_status(int status) {
    ExitStatus st;
    if (WIFEXITED(status)) {
        st.exited = true;
        st.code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        st.signal = WTERMSIG(status);
    }
    return st;
}

ExitStatus ProcessHandle::wait_status() {
    if (pid_ <= 0) return ExitStatus{};
    if (reaped_) return status_;
    int status = 0;
    pid_t ret;
    do {
        ret = waitpid(pid_, &status, 0);
    } while (ret < 0 && errno == EINTR);
    if (ret == pid_) {
        reaped_ = true;
        status_ = decode_status(status);
    }
    return status_;
}

#endif

// ── spawn ────────────────────────────────────────────────────

#ifdef _WIN32

// Environment block: sorted "KEY=VALUE\0" entries followed by a final "\0".
static std::string build_env_block(const SpawnOptions& options) {
    std::map<std::string, std::string> vars;
    LPCH block = GetEnvironmentStringsA();
    if (block) {
        for (LPCH p = block; *p; p += strlen(p) + 1) {
            std::string entry(p);
            auto eq = entry.find('=', 1);
            if (eq == std::string::npos) continue;
            vars[entry.substr(0, eq)] = entry.substr(eq + 1);
        }
        FreeEnvironmentStringsA(block);
    }
    for (const auto& name : options.unset_env) vars.erase(name);
    for (const auto& [k, v] : options.env) vars[k] = v;

    std::string out;
    for (const auto& [k, v] : vars) {
        out += k + "=" + v;
        out.push_back('\0');
    }
    out.push_back('\0');
    return out;
}

Result<ProcessHandle> spawn(const std::string& program,
                            const std::vector<std::string>& args,
                            const SpawnOptions& options) {
    ProcessHandle handle;

    // Build command line
    std::ostringstream cmdline;
    cmdline << "\"" << program << "\"";
    for (const auto& arg : args) {
        cmdline << " \"" << arg << "\"";
    }
    std::string cmd_str = cmdline.str();
    std::string env_block = build_env_block(options);

    STARTUPINFOA si = {};
    si.cb = sizeof(si);
    PROCESS_INFORMATION pi = {};

    si.dwFlags |= STARTF_USESTDHANDLES;
    si.hStdInput = GetStdHandle(STD_INPUT_HANDLE);
    si.hStdOutput = GetStdHandle(STD_OUTPUT_HANDLE);
    si.hStdError = GetStdHandle(STD_ERROR_HANDLE);

    BOOL ok = CreateProcessA(nullptr, cmd_str.data(), nullptr, nullptr, TRUE,
                             0, env_block.data(), nullptr, &si, &pi);
    DWORD err = GetLastError();
    if (!ok) {
        return Result<ProcessHandle>::Err(ErrorKind::Spawn,
            fmt::format("Failed to start {} (error {})", program, static_cast<unsigned long>(err)));
    }
    handle.handle_ = pi.hProcess;
    handle.thread_ = pi.hThread;
    return Result<ProcessHandle>::Ok(std::move(handle));
}

SignalForwarder::SignalForwarder() {}
SignalForwarder::~SignalForwarder() {}
void SignalForwarder::attach(const ProcessHandle&) {}

#else // Unix

static std::vector<std::string> build_environment(const SpawnOptions& options) {
    std::set<std::string> drop(options.unset_env.begin(), options.unset_env.end());
    for (const auto& kv : options.env) drop.insert(kv.first);

    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        std::string key = eq == std::string::npos ? entry : entry.substr(0, eq);
        if (drop.count(key)) continue;
        env.push_back(entry);
    }
    for (const auto& [k, v] : options.env) {
        env.push_back(k + "=" + v);
    }
    return env;
}

Result<ProcessHandle> spawn(const std::string& program,
                            const std::vector<std::string>& args,
                            const SpawnOptions& options) {
    ProcessHandle handle;

    // Everything the child needs is prepared before fork()
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    std::vector<std::string> env_strings = build_environment(options);
    std::vector<const char*> envp;
    for (const auto& e : env_strings) envp.push_back(e.c_str());
    envp.push_back(nullptr);

    // exec failures are reported through a close-on-exec pipe: EOF means exec succeeded
    int err_pipe[2];
    if (pipe(err_pipe) != 0) {
        return Result<ProcessHandle>::Err(ErrorKind::Spawn,
            fmt::format("Failed to start {}: pipe: {}", program, std::strerror(errno)));
    }
    fcntl(err_pipe[0], F_SETFD, FD_CLOEXEC);
    fcntl(err_pipe[1], F_SETFD, FD_CLOEXEC);

    pid_t pid = fork();
    if (pid < 0) {
        int e = errno;
        close(err_pipe[0]);
        close(err_pipe[1]);
        return Result<ProcessHandle>::Err(ErrorKind::Spawn,
            fmt::format("Failed to start {}: fork: {}", program, std::strerror(e)));
    }

    if (pid == 0) {
        // Child process
        close(err_pipe[0]);

        // Handlers installed by a SignalForwarder must not survive into the child
        for (int sig : {SIGINT, SIGTERM, SIGHUP, SIGQUIT}) {
            signal(sig, SIG_DFL);
        }

        if (program.find('/') != std::string::npos) {
            execve(program.c_str(), const_cast<char* const*>(argv.data()),
                   const_cast<char* const*>(envp.data()));
        } else {
            environ = const_cast<char**>(envp.data());
            execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        }
        int e = errno;
        ssize_t w = write(err_pipe[1], &e, sizeof(e));
        (void)w;
        _exit(127);  // exec failed
    }

    // Parent
    close(err_pipe[1]);
    int child_errno = 0;
    ssize_t n;
    do {
        n = read(err_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(err_pipe[0]);

    handle.pid_ = pid;
    if (n > 0) {
        handle.wait_status();
        return Result<ProcessHandle>::Err(ErrorKind::Spawn,
            fmt::format("Failed to start {}: {}", program, std::strerror(child_errno)));
    }
    return Result<ProcessHandle>::Ok(std::move(handle));
}

// ── SignalForwarder ─────────────────────────────────────────

static volatile sig_atomic_t g_forward_pid = 0;
static volatile sig_atomic_t g_same_group = 0;
static volatile sig_atomic_t g_pending_signal = 0;

static void forward_signal(int sig, siginfo_t* info, void*) {
    pid_t pid = static_cast<pid_t>(g_forward_pid);
    if (pid <= 0) {
        g_pending_signal = sig;
        return;
    }
    int sender = info ? static_cast<int>(info->si_pid) : -1;
    if (should_forward_signal(sender, g_same_group != 0)) kill(pid, sig);
}

static const int kForwardedSignals[] = {SIGINT, SIGTERM, SIGHUP, SIGQUIT};
constexpr size_t kForwardedCount = sizeof(kForwardedSignals) / sizeof(kForwardedSignals[0]);

struct SignalForwarder::Saved {
    struct sigaction previous[kForwardedCount];
    bool attached = false;
};

SignalForwarder::SignalForwarder() {
    saved_ = new Saved();
    g_forward_pid = 0;
    g_same_group = 0;
    g_pending_signal = 0;

    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_sigaction = forward_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_SIGINFO;  // no SA_RESTART: waitpid sees EINTR and resumes

    for (size_t i = 0; i < kForwardedCount; ++i) {
        sigaction(kForwardedSignals[i], &sa, &saved_->previous[i]);
    }
}

void SignalForwarder::attach(const ProcessHandle& child) {
    if (!child.valid()) return;
    pid_t pid = child.native_handle();
    g_same_group = getpgid(pid) == getpgrp() ? 1 : 0;
    g_forward_pid = pid;
    saved_->attached = true;

    int pending = g_pending_signal;
    if (pending != 0) {
        g_pending_signal = 0;
        kill(pid, pending);
    }
}

SignalForwarder::~SignalForwarder() {
    for (size_t i = 0; i < kForwardedCount; ++i) {
        sigaction(kForwardedSignals[i], &saved_->previous[i], nullptr);
    }
    int pending = saved_->attached ? 0 : static_cast<int>(g_pending_signal);
    g_forward_pid = 0;
    g_same_group = 0;
    g_pending_signal = 0;
    delete saved_;
    if (pending != 0) raise(pending);
}

#endif

bool should_forward_signal(int sender_pid, bool child_in_our_group) {
    return !(sender_pid == 0 && child_in_our_group);
}

} // namespace platform
