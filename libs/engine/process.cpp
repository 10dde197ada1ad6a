/**
 * @file process.cpp
 * @brief fork/exec supervision: pipes, rlimits, process group kill, reaping
 */

#include "process.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <format>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/time.h>
#include <sys/wait.h>
#include <unistd.h>

namespace secbox::engine {

namespace {

using Clock = std::chrono::steady_clock;

constexpr std::size_t kMaxErrorBytes = 64uz * 1024;
constexpr std::size_t kMaxControlLineBytes = 8uz * 1024 * 1024;
constexpr std::size_t kReadChunk = 64uz * 1024;
constexpr int kPollIntervalMs = 10;
constexpr auto kKillGrace = std::chrono::milliseconds(1'000);
constexpr long kMaxInheritedFd = 4'096;

/**
 * @brief Owning file descriptor
 */
class Fd
{
public:
    Fd() = default;
    explicit Fd(int fd) noexcept
        : m_fd(fd)
    {}
    ~Fd() { reset(); }

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;
    Fd(Fd&& other) noexcept
        : m_fd(std::exchange(other.m_fd, -1))
    {}
    Fd& operator=(Fd&& other) noexcept
    {
        if (this != &other) {
            reset();
            m_fd = std::exchange(other.m_fd, -1);
        }
        return *this;
    }

    [[nodiscard]] int get() const noexcept { return m_fd; }

    void reset() noexcept
    {
        if (m_fd >= 0) {
            ::close(m_fd);
            m_fd = -1;
        }
    }

private:
    int m_fd = -1;
};

struct Pipe
{
    Fd read;
    Fd write;
};

[[nodiscard]] secbox::Error spawn_error(std::string_view what, int error_number)
{
    return Error::make("SpawnFailed", std::format("{}: {}", what, std::strerror(error_number)));
}

[[nodiscard]] secbox::Result<Pipe> make_pipe()
{
    std::array<int, 2> fds{};
    if (::pipe2(fds.data(), O_CLOEXEC) != 0) {
        return std::unexpected(spawn_error("pipe2 failed", errno));
    }
    return Pipe{.read = Fd(fds[0]), .write = Fd(fds[1])};
}

void set_nonblocking(int fd)
{
    const int flags = ::fcntl(fd, F_GETFL);
    if (flags >= 0) {
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

/// Everything the child needs, prepared before fork so the child only makes async-signal-safe calls
struct ChildPlan
{
    int stdin_fd = -1;
    int stdout_fd = -1;
    int stderr_fd = -1;
    int control_fd = -1;
    int error_fd = -1;
    long max_fd = 1'024;
    const char* path = nullptr;
    char* const* argv = nullptr;
    char* const* envp = nullptr;
    const char* working_dir = nullptr;
    rlim_t cpu_seconds = 0;
    rlim_t address_space = 0;
};

bool move_fd(int from, int to)
{
    if (from == to) {
        return ::fcntl(to, F_SETFD, 0) == 0;
    }
    return ::dup2(from, to) == to;
}

bool set_limit(int resource, rlim_t soft, rlim_t hard)
{
    const rlimit limit{.rlim_cur = soft, .rlim_max = hard};
    return ::setrlimit(resource, &limit) == 0;
}

[[noreturn]] void fail_child(int error_fd)
{
    const int error_number = errno;
    [[maybe_unused]] const auto written = ::write(error_fd, &error_number, sizeof error_number);
    ::_exit(127);
}

[[noreturn]] void exec_child(const ChildPlan& plan)
{
    ::setpgid(0, 0);
    if (!move_fd(plan.stdin_fd, STDIN_FILENO) || !move_fd(plan.stdout_fd, STDOUT_FILENO)
        || !move_fd(plan.stderr_fd, STDERR_FILENO) || !move_fd(plan.control_fd, kControlFd)) {
        fail_child(plan.error_fd);
    }
    for (int fd = kControlFd + 1; fd < plan.max_fd; ++fd) {
        if (fd != plan.error_fd) {
            ::close(fd);
        }
    }
    if (plan.working_dir != nullptr && ::chdir(plan.working_dir) != 0) {
        fail_child(plan.error_fd);
    }
    if (!set_limit(RLIMIT_CORE, 0, 0) || !set_limit(RLIMIT_FSIZE, 0, 0)) {
        fail_child(plan.error_fd);
    }
    if (plan.cpu_seconds > 0 && !set_limit(RLIMIT_CPU, plan.cpu_seconds, plan.cpu_seconds + 1)) {
        fail_child(plan.error_fd);
    }
    if (plan.address_space > 0 && !set_limit(RLIMIT_AS, plan.address_space, plan.address_space)) {
        fail_child(plan.error_fd);
    }
    ::execve(plan.path, plan.argv, plan.envp);
    fail_child(plan.error_fd);
}

[[nodiscard]] std::vector<char*> pointers(std::vector<std::string>& strings)
{
    std::vector<char*> result;
    result.reserve(strings.size() + 1);
    for (auto& s : strings) {
        result.push_back(s.data());
    }
    result.push_back(nullptr);
    return result;
}

[[nodiscard]] double to_ms(const timeval& tv)
{
    return static_cast<double>(tv.tv_sec) * 1'000.0 + static_cast<double>(tv.tv_usec) / 1'000.0;
}

/**
 * @brief Reads the three child pipes until they all close
 */
class Supervisor
{
public:
    Supervisor(const LaunchOptions& launch,
               const ProcessCallbacks& callbacks,
               CancellationToken* cancellation,
               pid_t pid,
               ProcessOutcome& outcome)
        : m_launch(launch)
        , m_callbacks(callbacks)
        , m_cancellation(cancellation)
        , m_pid(pid)
        , m_outcome(outcome)
        , m_started(Clock::now())
    {}

    void pump(Fd& out, Fd& err, Fd& control)
    {
        std::array<pollfd, 3> fds = {
            {{.fd = out.get(), .events = POLLIN, .revents = 0},
             {.fd = err.get(), .events = POLLIN, .revents = 0},
             {.fd = control.get(), .events = POLLIN, .revents = 0}}
        };
        for (auto& entry : fds) {
            set_nonblocking(entry.fd);
        }
        std::size_t open_streams = fds.size();
        std::optional<Clock::time_point> killed_at;

        while (open_streams > 0) {
            enforce();
            if (m_killed && !killed_at) {
                killed_at = Clock::now();
            }
            if (killed_at && Clock::now() - *killed_at > kKillGrace) {
                // Something outside the process group still holds a pipe
                break;
            }
            const int ready = ::poll(fds.data(), fds.size(), kPollIntervalMs);
            if (ready < 0) {
                if (errno == EINTR) {
                    continue;
                }
                kill_group(FaultKind::kRuntimeFault, std::format("poll failed: {}", std::strerror(errno)));
                break;
            }
            for (std::size_t i = 0; i < fds.size(); ++i) {
                if (fds[i].fd < 0 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                    continue;
                }
                if (!drain(fds[i].fd, i)) {
                    fds[i].fd = -1;
                    --open_streams;
                }
            }
        }
        flush_control();
        out.reset();
        err.reset();
        control.reset();
    }

    void reap()
    {
        int status = 0;
        rusage usage{};
        while (true) {
            const pid_t waited = ::wait4(m_pid, &status, WNOHANG, &usage);
            if (waited == m_pid) {
                break;
            }
            if (waited < 0 && errno != EINTR) {
                return;
            }
            enforce();
            std::this_thread::sleep_for(std::chrono::milliseconds(kPollIntervalMs));
        }
        m_outcome.wall_time_ms =
            std::chrono::duration<double, std::milli>(Clock::now() - m_started).count();
        m_outcome.cpu_time_ms = to_ms(usage.ru_utime) + to_ms(usage.ru_stime);
        m_outcome.max_rss_mb = static_cast<double>(usage.ru_maxrss) / 1'024.0;
        if (WIFEXITED(status)) {
            m_outcome.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            m_outcome.term_signal = WTERMSIG(status);
            if (m_outcome.term_signal == SIGXCPU && !m_outcome.kill_kind) {
                m_outcome.kill_kind = FaultKind::kResourceExceeded;
                m_outcome.kill_reason = "Execution time limit exceeded";
            }
        }
    }

private:
    void enforce()
    {
        if (m_killed) {
            return;
        }
        if (m_cancellation != nullptr && m_cancellation->is_cancelled()) {
            kill_group(m_cancellation->kind(), m_cancellation->reason());
        } else if (Clock::now() - m_started >= m_launch.wall_clock) {
            kill_group(FaultKind::kResourceExceeded, "Wall-clock time limit exceeded");
        }
    }

    void kill_group(FaultKind kind, std::string reason)
    {
        if (m_killed) {
            return;
        }
        ::kill(-m_pid, SIGKILL);
        m_killed = true;
        m_outcome.kill_kind = kind;
        m_outcome.kill_reason = std::move(reason);
    }

    /// @return False once the stream reached end of file
    bool drain(int fd, std::size_t stream)
    {
        std::array<char, kReadChunk> buffer{};
        while (true) {
            const auto n = ::read(fd, buffer.data(), buffer.size());
            if (n > 0) {
                consume(stream, std::string_view(buffer.data(), static_cast<std::size_t>(n)));
                continue;
            }
            if (n == 0) {
                return false;
            }
            if (errno == EINTR) {
                continue;
            }
            return errno == EAGAIN || errno == EWOULDBLOCK;
        }
    }

    void consume(std::size_t stream, std::string_view data)
    {
        switch (stream) {
            case 0: {
                if (m_callbacks.on_output) {
                    m_callbacks.on_output(data.size());
                }
                const auto room = m_launch.max_output_bytes > m_outcome.output.size()
                                      ? m_launch.max_output_bytes - m_outcome.output.size()
                                      : 0;
                // Keep one byte past the cap so truncation is detectable later
                const auto keep = std::min(data.size(), room + 1);
                m_outcome.output.append(data.substr(0, keep));
                if (keep < data.size()) {
                    m_outcome.output_truncated = true;
                }
                break;
            }
            case 1: {
                const auto room =
                    kMaxErrorBytes > m_outcome.errors.size() ? kMaxErrorBytes - m_outcome.errors.size() : 0;
                m_outcome.errors.append(data.substr(0, std::min(room, data.size())));
                break;
            }
            default:
                m_control.append(data);
                split_control();
                break;
        }
    }

    void split_control()
    {
        std::size_t newline = 0;
        while ((newline = m_control.find('\n')) != std::string::npos) {
            if (m_callbacks.on_control) {
                m_callbacks.on_control(std::string_view(m_control).substr(0, newline));
            }
            m_control.erase(0, newline + 1);
        }
        if (m_control.size() > kMaxControlLineBytes) {
            m_control.clear();
        }
    }

    void flush_control()
    {
        if (!m_control.empty() && m_callbacks.on_control) {
            m_callbacks.on_control(m_control);
        }
        m_control.clear();
    }

    const LaunchOptions& m_launch;
    const ProcessCallbacks& m_callbacks;
    CancellationToken* m_cancellation;
    pid_t m_pid;
    ProcessOutcome& m_outcome;
    Clock::time_point m_started;
    bool m_killed = false;
    std::string m_control;
};

}  // namespace

secbox::Result<ProcessOutcome> run_process(const LaunchOptions& launch,
                                           const ProcessCallbacks& callbacks,
                                           CancellationToken* cancellation)
{
    Fd null_fd(::open("/dev/null", O_RDONLY | O_CLOEXEC));
    if (null_fd.get() < 0) {
        return std::unexpected(spawn_error("open /dev/null failed", errno));
    }
    auto out = make_pipe();
    auto err = make_pipe();
    auto control = make_pipe();
    auto exec_status = make_pipe();
    for (const auto* pipe : {&out, &err, &control, &exec_status}) {
        if (!*pipe) {
            return std::unexpected(pipe->error());
        }
    }

    auto argv = launch.argv;
    auto env = launch.env;
    const auto argv_ptrs = pointers(argv);
    const auto env_ptrs = pointers(env);
    const std::string path = launch.executable.string();
    const std::string working_dir = launch.working_dir.string();
    const long open_max = ::sysconf(_SC_OPEN_MAX);

    const ChildPlan plan{.stdin_fd = null_fd.get(),
                         .stdout_fd = out->write.get(),
                         .stderr_fd = err->write.get(),
                         .control_fd = control->write.get(),
                         .error_fd = exec_status->write.get(),
                         .max_fd = open_max > 0 ? std::min(open_max, kMaxInheritedFd) : 1'024,
                         .path = path.c_str(),
                         .argv = argv_ptrs.data(),
                         .envp = env_ptrs.data(),
                         .working_dir = working_dir.empty() ? nullptr : working_dir.c_str(),
                         .cpu_seconds = launch.cpu_seconds,
                         .address_space = launch.address_space_bytes};

    const pid_t pid = ::fork();
    if (pid < 0) {
        return std::unexpected(spawn_error("fork failed", errno));
    }
    if (pid == 0) {
        exec_child(plan);
    }
    ::setpgid(pid, pid);

    null_fd.reset();
    out->write.reset();
    err->write.reset();
    control->write.reset();
    exec_status->write.reset();

    int child_errno = 0;
    ssize_t status_bytes = 0;
    do {
        status_bytes = ::read(exec_status->read.get(), &child_errno, sizeof child_errno);
    } while (status_bytes < 0 && errno == EINTR);
    if (status_bytes == static_cast<ssize_t>(sizeof child_errno)) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        return std::unexpected(spawn_error(std::format("Failed to start {}", path), child_errno));
    }

    if (callbacks.on_started) {
        callbacks.on_started(static_cast<int>(pid));
    }

    ProcessOutcome outcome;
    Supervisor supervisor(launch, callbacks, cancellation, pid, outcome);
    supervisor.pump(out->read, err->read, control->read);
    supervisor.reap();
    return outcome;
}

secbox::Result<std::filesystem::path> find_executable(std::string_view name)
{
    auto usable = [](const std::filesystem::path& candidate) {
        std::error_code ec;
        return std::filesystem::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0;
    };
    if (name.find('/') != std::string_view::npos) {
        const std::filesystem::path candidate(name);
        if (usable(candidate)) {
            return candidate;
        }
        return std::unexpected(Error::make("InterpreterNotFound", std::format("{} is not executable", name)));
    }
    const char* env_path = std::getenv("PATH");
    const std::string_view search = env_path != nullptr ? env_path : "/usr/local/bin:/usr/bin:/bin";
    std::size_t start = 0;
    while (start <= search.size()) {
        auto end = search.find(':', start);
        if (end == std::string_view::npos) {
            end = search.size();
        }
        const auto dir = search.substr(start, end - start);
        if (!dir.empty()) {
            auto candidate = std::filesystem::path(dir) / name;
            if (usable(candidate)) {
                return candidate;
            }
        }
        start = end + 1;
    }
    return std::unexpected(Error::make("InterpreterNotFound", std::format("{} not found on PATH", name)));
}

secbox::Result<std::string> capture_output(const std::filesystem::path& executable,
                                           const std::vector<std::string>& argv,
                                           std::chrono::milliseconds timeout)
{
    const LaunchOptions launch{.executable = executable,
                           .argv = argv,
                           .env = {"PATH=/usr/local/bin:/usr/bin:/bin", "LANG=C.UTF-8"},
                           .working_dir = {},
                           .cpu_seconds = 0,
                           .address_space_bytes = 0,
                           .wall_clock = timeout,
                           .max_output_bytes = 4'096};
    auto outcome = run_process(launch, ProcessCallbacks{}, nullptr);
    if (!outcome) {
        return std::unexpected(outcome.error());
    }
    if (outcome->kill_kind || outcome->exit_code != 0) {
        return std::unexpected(Error::make(
            "InterpreterProbeFailed",
            std::format("{} exited with code {}", executable.string(), outcome->exit_code)));
    }
    auto text = outcome->output.empty() ? outcome->errors : outcome->output;
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' ')) {
        text.pop_back();
    }
    return text;
}

}  // namespace secbox::engine
