/**
 * @file sandbox_process.cpp
 * @brief fork/execve supervisor: isolation setup, rlimits, poll-based capture.
 * @author Dimitris Kafetzis
 *
 * Only async-signal-safe calls are made between fork() and execve(); every
 * buffer the child touches is prepared by the parent beforehand. Setup
 * failures in the child travel back over a close-on-exec pipe, so EOF on
 * that pipe means execve succeeded.
 *
 * Private root, built in the child's own mount namespace:
 *   1. map the caller's uid/gid to a non-root id (capabilities end at execve)
 *   2. tmpfs on `root_dir`, skeleton directories, symlinks, mount points
 *   3. bind `visible_paths` read-only, the working directory read-write
 *   4. remount the tmpfs read-only, pivot_root into it, detach the old root
 */

#include "runner/sandbox_process.hpp"

#include "runner/bootstrap.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <optional>
#include <string_view>
#include <poll.h>
#include <sched.h>
#include <signal.h>
#include <sys/mount.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace code_sandbox {

namespace {

using Clock = std::chrono::steady_clock;

constexpr int kSetupFd = kStatusFd + 1;
constexpr int kFirstUnusedFd = kSetupFd + 1;
constexpr uint64_t kMaxStatusBytes = 64 * 1024;
constexpr size_t kReadsPerDrain = 16;
constexpr auto kPollSlice = std::chrono::milliseconds(50);
constexpr auto kDrainGrace = std::chrono::milliseconds(200);
constexpr uid_t kOverflowId = 65534;

enum class SetupStage : int {
    Session,
    Descriptors,
    Privileges,
    Isolation,
    Filesystem,
    Limits,
    WorkingDir,
    Exec
};

constexpr std::string_view to_string(SetupStage stage) noexcept {
    switch (stage) {
        case SetupStage::Session:     return "setsid";
        case SetupStage::Descriptors: return "descriptor setup";
        case SetupStage::Privileges:  return "prctl";
        case SetupStage::Isolation:   return "namespace isolation";
        case SetupStage::Filesystem:  return "filesystem isolation";
        case SetupStage::Limits:      return "setrlimit";
        case SetupStage::WorkingDir:  return "chdir";
        case SetupStage::Exec:        return "execve";
    }
    return "setup";
}

struct SetupFailure {
    SetupStage stage;
    int error;
};

std::string errno_message(std::string_view what) {
    return std::format("{}: {}", what, std::strerror(errno));
}

// ─────────────────────────────────────────────
// Descriptor ownership
// ─────────────────────────────────────────────

class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) noexcept : fd_(fd) {}
    UniqueFd(UniqueFd&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) reset(std::exchange(other.fd_, -1));
        return *this;
    }
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    [[nodiscard]] int get() const noexcept { return fd_; }
    explicit operator bool() const noexcept { return fd_ >= 0; }

    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) ::close(fd_);
        fd_ = fd;
    }

private:
    int fd_{-1};
};

struct FdPair {
    UniqueFd parent;
    UniqueFd child;
};

/// Move `fd` to a number the child's dup2 targets cannot collide with.
Result<void> lift(UniqueFd& fd) {
    if (fd.get() >= kFirstUnusedFd) return Result<void>{};
    int lifted = ::fcntl(fd.get(), F_DUPFD_CLOEXEC, kFirstUnusedFd);
    if (lifted < 0) return Error{ErrorCode::Io, errno_message("fcntl(F_DUPFD_CLOEXEC)")};
    fd.reset(lifted);
    return Result<void>{};
}

/// Pipe whose parent end reads and child end writes (or the reverse).
Result<FdPair> make_pipe(bool parent_reads) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) return Error{ErrorCode::Io, errno_message("pipe2")};
    FdPair pair = parent_reads
        ? FdPair{UniqueFd(fds[0]), UniqueFd(fds[1])}
        : FdPair{UniqueFd(fds[1]), UniqueFd(fds[0])};
    if (auto lifted = lift(pair.child); !lifted) return lifted.error();
    return pair;
}

/// stdin is a socket so writes can use MSG_NOSIGNAL when the child is gone.
Result<FdPair> make_stdin_channel() {
    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) != 0) {
        return Error{ErrorCode::Io, errno_message("socketpair")};
    }
    FdPair pair{UniqueFd(fds[0]), UniqueFd(fds[1])};
    if (auto lifted = lift(pair.child); !lifted) return lifted.error();
    return pair;
}

void set_nonblocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

// ─────────────────────────────────────────────
// Private root layout (planned by the parent)
// ─────────────────────────────────────────────

struct RootLayout {
    struct Link {
        std::string path;
        std::string target;
    };
    struct Bind {
        std::string source;
        std::string target;
        unsigned long flags;    ///< Remount flags: MS_RDONLY plus whatever the source mount locks
    };

    std::string root;
    std::vector<std::string> directories;   ///< Created in order, parents first
    std::vector<std::string> files;         ///< Empty mount points for bound files
    std::vector<Link> links;
    std::vector<Bind> binds;
    std::string uid_map;
    std::string gid_map;
};

/// Flags a bind remount must keep, or the kernel refuses it inside a user namespace.
unsigned long locked_flags(const std::filesystem::path& source) {
    struct statvfs info{};
    if (::statvfs(source.c_str(), &info) != 0) return MS_NOSUID | MS_NODEV;
    unsigned long flags = MS_NOSUID | MS_NODEV;
    if (info.f_flag & ST_NOEXEC) flags |= MS_NOEXEC;
    if (info.f_flag & ST_RDONLY) flags |= MS_RDONLY;
    return flags;
}

RootLayout plan_root(const SandboxSpec& spec) {
    namespace fs = std::filesystem;
    RootLayout layout;
    layout.root = spec.root_dir.string();

    auto add_directories = [&](const fs::path& absolute) {
        fs::path current;
        for (const auto& part : absolute.relative_path()) {
            current /= part;
            auto target = (spec.root_dir / current).string();
            if (std::find(layout.directories.begin(), layout.directories.end(), target)
                == layout.directories.end()) {
                layout.directories.push_back(std::move(target));
            }
        }
    };

    for (const auto& visible : spec.visible_paths) {
        if (!visible.is_absolute()) continue;
        std::error_code ec;
        auto status = fs::symlink_status(visible, ec);
        if (ec || !fs::exists(status)) continue;   // absent on this host

        const auto target = (spec.root_dir / visible.relative_path()).string();
        add_directories(visible.parent_path());
        if (fs::is_symlink(status)) {
            auto link = fs::read_symlink(visible, ec);
            if (!ec) layout.links.push_back({.path = target, .target = link.string()});
            continue;
        }
        if (fs::is_directory(status)) {
            add_directories(visible);
        } else {
            layout.files.push_back(target);
        }
        layout.binds.push_back({.source = visible.string(), .target = target,
                                .flags = locked_flags(visible) | MS_RDONLY});
    }

    add_directories(spec.working_dir);
    layout.binds.push_back({.source = spec.working_dir.string(),
                            .target = (spec.root_dir / spec.working_dir.relative_path()).string(),
                            .flags = locked_flags(spec.working_dir) | MS_NOEXEC});

    const uid_t uid = ::getuid();
    const gid_t gid = ::getgid();
    layout.uid_map = std::format("{} {} 1\n", uid == 0 ? kOverflowId : uid, uid);
    layout.gid_map = std::format("{} {} 1\n", gid == 0 ? static_cast<gid_t>(kOverflowId) : gid, gid);
    return layout;
}

// ─────────────────────────────────────────────
// Child side (async-signal-safe only)
// ─────────────────────────────────────────────

struct ChildPlan {
    const char* executable;
    char* const* argv;
    char* const* envp;
    const char* working_dir;
    int stdin_fd;
    int stdout_fd;
    int stderr_fd;
    int status_fd;
    int setup_fd;
    ProcessLimits limits;
    uint64_t cpu_seconds;
    bool require_isolation;
    const RootLayout* root;     ///< nullptr keeps the host root
};

[[noreturn]] void fail_setup(SetupStage stage) {
    SetupFailure failure{.stage = stage, .error = errno};
    [[maybe_unused]] auto written = ::write(kSetupFd, &failure, sizeof(failure));
    ::_exit(127);
}

bool lower_limit(int resource, rlim_t soft, rlim_t hard) {
    rlimit current{};
    if (::getrlimit(resource, &current) != 0) return false;
    if (current.rlim_max != RLIM_INFINITY) {
        hard = std::min(hard, current.rlim_max);
        soft = std::min(soft, hard);
    }
    rlimit wanted{.rlim_cur = soft, .rlim_max = hard};
    return ::setrlimit(resource, &wanted) == 0;
}

bool write_proc_file(const char* path, std::string_view content) {
    int fd = ::open(path, O_WRONLY | O_CLOEXEC);
    if (fd < 0) return false;
    bool ok = ::write(fd, content.data(), content.size()) == static_cast<ssize_t>(content.size());
    ::close(fd);
    return ok;
}

bool map_identity(const RootLayout& root) {
    // Absent on kernels before 3.19, where gid_map needs no setgroups lock
    if (!write_proc_file("/proc/self/setgroups", "deny") && errno != ENOENT) return false;
    return write_proc_file("/proc/self/uid_map", root.uid_map)
        && write_proc_file("/proc/self/gid_map", root.gid_map);
}

bool enter_private_root(const RootLayout& root) {
    if (::mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) != 0) return false;
    if (::mount("tmpfs", root.root.c_str(), "tmpfs", MS_NOSUID | MS_NODEV,
                "mode=0755,size=1m") != 0) {
        return false;
    }

    for (const auto& dir : root.directories) {
        if (::mkdir(dir.c_str(), 0755) != 0 && errno != EEXIST) return false;
    }
    for (const auto& file : root.files) {
        int fd = ::open(file.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
        if (fd < 0) return false;
        ::close(fd);
    }
    for (const auto& link : root.links) {
        if (::symlink(link.target.c_str(), link.path.c_str()) != 0) return false;
    }
    for (const auto& bind : root.binds) {
        if (::mount(bind.source.c_str(), bind.target.c_str(), nullptr, MS_BIND | MS_REC, nullptr) != 0
            || ::mount(nullptr, bind.target.c_str(), nullptr, MS_BIND | MS_REMOUNT | bind.flags, nullptr) != 0) {
            return false;
        }
    }

    if (::mount(nullptr, root.root.c_str(), nullptr,
                MS_REMOUNT | MS_RDONLY | MS_NOSUID | MS_NODEV, nullptr) != 0) {
        return false;
    }
    if (::chdir(root.root.c_str()) != 0) return false;
    if (::syscall(SYS_pivot_root, ".", ".") != 0) return false;
    // The old root is stacked on "/" now; detaching it leaves the new one
    if (::umount2(".", MNT_DETACH) != 0) return false;
    return ::chdir("/") == 0;
}

void close_inherited_descriptors() {
#ifdef SYS_close_range
    if (::syscall(SYS_close_range, kFirstUnusedFd, ~0U, 0) == 0) return;
#endif
    long max_fd = ::sysconf(_SC_OPEN_MAX);
    if (max_fd < 0 || max_fd > 65536) max_fd = 65536;
    for (int fd = kFirstUnusedFd; fd < max_fd; ++fd) ::close(fd);
}

[[noreturn]] void run_child(const ChildPlan& plan) {
    if (::dup2(plan.setup_fd, kSetupFd) < 0) ::_exit(127);
    if (::fcntl(kSetupFd, F_SETFD, FD_CLOEXEC) < 0) ::_exit(127);

    sigset_t none;
    ::sigemptyset(&none);
    ::sigprocmask(SIG_SETMASK, &none, nullptr);

    if (::setsid() < 0) fail_setup(SetupStage::Session);

    if (::dup2(plan.stdin_fd, STDIN_FILENO) < 0
        || ::dup2(plan.stdout_fd, STDOUT_FILENO) < 0
        || ::dup2(plan.stderr_fd, STDERR_FILENO) < 0
        || ::dup2(plan.status_fd, kStatusFd) < 0) {
        fail_setup(SetupStage::Descriptors);
    }
    close_inherited_descriptors();

    if (::prctl(PR_SET_PDEATHSIG, SIGKILL) != 0
        || ::prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
        fail_setup(SetupStage::Privileges);
    }

    const int namespaces = CLONE_NEWUSER | CLONE_NEWNET | (plan.root ? CLONE_NEWNS : 0);
    if (::unshare(namespaces) != 0) {
        if (plan.require_isolation) fail_setup(SetupStage::Isolation);
    } else if (plan.root && !(map_identity(*plan.root) && enter_private_root(*plan.root))) {
        if (plan.require_isolation) fail_setup(SetupStage::Filesystem);
    }

    const auto& lim = plan.limits;
    if (!lower_limit(RLIMIT_AS, lim.memory_bytes, lim.memory_bytes)
        || !lower_limit(RLIMIT_CPU, plan.cpu_seconds, plan.cpu_seconds + 1)
        || !lower_limit(RLIMIT_FSIZE, 0, 0)
        || !lower_limit(RLIMIT_NPROC, lim.max_processes, lim.max_processes)
        || !lower_limit(RLIMIT_NOFILE, lim.max_open_files, lim.max_open_files)
        || !lower_limit(RLIMIT_CORE, 0, 0)) {
        fail_setup(SetupStage::Limits);
    }

    if (::chdir(plan.working_dir) != 0) fail_setup(SetupStage::WorkingDir);

    ::execve(plan.executable, plan.argv, plan.envp);
    fail_setup(SetupStage::Exec);
}

// ─────────────────────────────────────────────
// Parent side
// ─────────────────────────────────────────────

struct Capture {
    UniqueFd fd;
    std::string* sink;
    uint64_t cap;
    bool overflowed = false;
};

void drain(Capture& capture) {
    if (!capture.fd) return;

    char buffer[4096];
    for (size_t i = 0; i < kReadsPerDrain; ++i) {
        ssize_t n = ::read(capture.fd.get(), buffer, sizeof(buffer));
        if (n > 0) {
            uint64_t room = capture.cap > capture.sink->size() ? capture.cap - capture.sink->size() : 0;
            auto take = std::min<uint64_t>(room, static_cast<uint64_t>(n));
            capture.sink->append(buffer, take);
            if (static_cast<uint64_t>(n) > take) capture.overflowed = true;
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
        capture.fd.reset();
        return;
    }
}

void kill_group(pid_t pid) {
    if (::kill(-pid, SIGKILL) != 0) ::kill(pid, SIGKILL);
}

std::vector<char*> pointer_table(std::vector<std::string>& storage) {
    std::vector<char*> table;
    table.reserve(storage.size() + 1);
    for (auto& s : storage) table.push_back(s.data());
    table.push_back(nullptr);
    return table;
}

}  // namespace

// ─────────────────────────────────────────────
// ScratchDirectory
// ─────────────────────────────────────────────

Result<ScratchDirectory> ScratchDirectory::create(const std::filesystem::path& parent) {
    std::error_code ec;
    auto base = parent.empty() ? std::filesystem::temp_directory_path(ec) : parent;
    if (ec) return Error{ErrorCode::Io, "No temporary directory: " + ec.message()};

    std::filesystem::create_directories(base, ec);
    if (ec) return Error{ErrorCode::Io, "Cannot create " + base.string() + ": " + ec.message()};

    std::string pattern = (base / "code_sandbox-XXXXXX").string();
    if (::mkdtemp(pattern.data()) == nullptr) {
        return Error{ErrorCode::Io, errno_message("mkdtemp in " + base.string())};
    }
    return ScratchDirectory(std::filesystem::path(pattern));
}

ScratchDirectory::ScratchDirectory(ScratchDirectory&& other) noexcept
    : path_(std::move(other.path_)) {
    other.path_.clear();
}

ScratchDirectory& ScratchDirectory::operator=(ScratchDirectory&& other) noexcept {
    if (this != &other) {
        remove();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

ScratchDirectory::~ScratchDirectory() {
    remove();
}

void ScratchDirectory::remove() noexcept {
    if (path_.empty()) return;
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    path_.clear();
}

// ─────────────────────────────────────────────
// run_sandboxed
// ─────────────────────────────────────────────

Result<ProcessReport> run_sandboxed(const SandboxSpec& spec) {
    auto in = make_stdin_channel();
    if (!in) return in.error();
    auto out = make_pipe(/*parent_reads=*/true);
    if (!out) return out.error();
    auto err = make_pipe(true);
    if (!err) return err.error();
    auto status = make_pipe(true);
    if (!status) return status.error();
    auto setup = make_pipe(true);
    if (!setup) return setup.error();

    std::vector<std::string> argv_storage;
    argv_storage.reserve(spec.arguments.size() + 1);
    argv_storage.push_back(spec.executable.string());
    argv_storage.insert(argv_storage.end(), spec.arguments.begin(), spec.arguments.end());
    std::vector<std::string> env_storage = spec.environment;
    auto argv = pointer_table(argv_storage);
    auto envp = pointer_table(env_storage);
    const std::string executable = spec.executable.string();
    const std::string working_dir = spec.working_dir.string();
    std::optional<RootLayout> root;
    if (!spec.root_dir.empty()) root = plan_root(spec);

    auto timeout_s = std::chrono::ceil<std::chrono::seconds>(spec.wall_timeout).count();
    ChildPlan plan{
        .executable = executable.c_str(),
        .argv = argv.data(),
        .envp = envp.data(),
        .working_dir = working_dir.c_str(),
        .stdin_fd = in->child.get(),
        .stdout_fd = out->child.get(),
        .stderr_fd = err->child.get(),
        .status_fd = status->child.get(),
        .setup_fd = setup->child.get(),
        .limits = spec.limits,
        .cpu_seconds = std::max<uint64_t>(spec.limits.cpu_seconds, static_cast<uint64_t>(timeout_s) + 1),
        .require_isolation = spec.require_isolation,
        .root = root ? &*root : nullptr,
    };

    const auto started = Clock::now();
    const pid_t pid = ::fork();
    if (pid < 0) return Error{ErrorCode::SandboxSetup, errno_message("fork")};
    if (pid == 0) run_child(plan);

    in->child.reset();
    out->child.reset();
    err->child.reset();
    status->child.reset();
    setup->child.reset();

    // EOF here means execve succeeded (the write end is close-on-exec)
    SetupFailure failure{};
    ssize_t got;
    do {
        got = ::read(setup->parent.get(), &failure, sizeof(failure));
    } while (got < 0 && errno == EINTR);
    if (got == static_cast<ssize_t>(sizeof(failure))) {
        int wstatus = 0;
        while (::waitpid(pid, &wstatus, 0) < 0 && errno == EINTR) {}
        return Error{ErrorCode::SandboxSetup,
                     std::format("{} failed: {}", to_string(failure.stage), std::strerror(failure.error))};
    }

    ProcessReport report;
    std::array<Capture, 3> captures{{
        {std::move(out->parent), &report.stdout_text, spec.limits.max_output_bytes},
        {std::move(err->parent), &report.stderr_text, spec.limits.max_output_bytes},
        {std::move(status->parent), &report.status_text, kMaxStatusBytes},
    }};
    for (auto& capture : captures) set_nonblocking(capture.fd.get());

    UniqueFd input = std::move(in->parent);
    set_nonblocking(input.get());
    size_t input_offset = 0;
    if (spec.stdin_data.empty()) input.reset();

    const auto deadline = started + spec.wall_timeout;
    bool reaped = false;
    int wstatus = 0;
    rusage usage{};
    auto reaped_at = started;

    while (true) {
        auto now = Clock::now();
        if (!reaped && !report.timed_out && now >= deadline) {
            report.timed_out = true;
            kill_group(pid);
        }

        std::array<pollfd, 4> fds{};
        nfds_t count = 0;
        if (input) fds[count++] = pollfd{.fd = input.get(), .events = POLLOUT, .revents = 0};
        for (auto& capture : captures) {
            if (capture.fd) fds[count++] = pollfd{.fd = capture.fd.get(), .events = POLLIN, .revents = 0};
        }

        auto slice = kPollSlice;
        if (!reaped && !report.timed_out) {
            auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - now);
            slice = std::clamp(remaining, std::chrono::milliseconds(0), kPollSlice);
        } else {
            slice = std::chrono::milliseconds(10);
        }

        if (count > 0) {
            if (::poll(fds.data(), count, static_cast<int>(slice.count())) < 0 && errno != EINTR) {
                auto message = errno_message("poll");
                kill_group(pid);
                while (::waitpid(pid, &wstatus, 0) < 0 && errno == EINTR) {}
                return Error{ErrorCode::Io, message};
            }
        } else {
            std::this_thread::sleep_for(slice);
        }

        if (input) {
            ssize_t sent = ::send(input.get(), spec.stdin_data.data() + input_offset,
                                  spec.stdin_data.size() - input_offset, MSG_NOSIGNAL | MSG_DONTWAIT);
            if (sent > 0) {
                input_offset += static_cast<size_t>(sent);
                if (input_offset >= spec.stdin_data.size()) input.reset();
            } else if (sent < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                input.reset();
            }
        }

        for (auto& capture : captures) drain(capture);

        if (!report.output_overflow && (captures[0].overflowed || captures[1].overflowed)) {
            report.output_overflow = true;
            kill_group(pid);
        }
        if (captures[2].overflowed) captures[2].fd.reset();

        if (!reaped) {
            pid_t waited = ::wait4(pid, &wstatus, WNOHANG, &usage);
            if (waited == pid || (waited < 0 && errno == ECHILD)) {
                reaped = true;
                reaped_at = Clock::now();
            }
        }

        bool all_closed = std::none_of(captures.begin(), captures.end(),
                                       [](const Capture& c) { return static_cast<bool>(c.fd); });
        if (reaped && (all_closed || Clock::now() - reaped_at > kDrainGrace)) break;
    }

    // Descendants that escaped the wait still share the group
    ::kill(-pid, SIGKILL);

    if (WIFEXITED(wstatus)) {
        report.exited = true;
        report.exit_code = WEXITSTATUS(wstatus);
    } else if (WIFSIGNALED(wstatus)) {
        report.term_signal = WTERMSIG(wstatus);
    }
    report.elapsed = std::chrono::duration_cast<Duration>(reaped_at - started);
    report.peak_rss_kb = usage.ru_maxrss;
    return report;
}

}  // namespace code_sandbox
