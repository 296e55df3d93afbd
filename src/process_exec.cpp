#include "mkp/process_exec.hpp"

#include "mkp/log.hpp"
#include "mkp/utility.hpp"

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <expected>
#include <filesystem>
#include <format>
#include <fstream>
#include <limits>
#include <optional>
#include <reproc++/drain.hpp>
#include <reproc++/reproc.hpp>
#include <string>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include <csignal>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace makeport {

namespace {

constexpr auto REAP_TIMEOUT = reproc::milliseconds(5000);

std::optional<pid_t> parent_of(const std::filesystem::path &proc_entry) {
    std::ifstream stat(proc_entry / "stat");
    if (!stat.is_open())
        return std::nullopt;
    std::string line;
    std::getline(stat, line);

    // "pid (comm) state ppid ..." where comm may itself contain ") "
    size_t close = line.rfind(')');
    if (close == std::string::npos || close + 4 >= line.size())
        return std::nullopt;
    std::string_view rest = std::string_view(line).substr(close + 4);
    pid_t ppid = 0;
    auto [ptr, ec] = std::from_chars(rest.data(), rest.data() + rest.size(), ppid);
    if (ec != std::errc())
        return std::nullopt;
    return ppid;
}

std::unordered_map<pid_t, std::vector<pid_t>> snapshot_children() {
    std::unordered_map<pid_t, std::vector<pid_t>> children;
    std::error_code ec;
    for (const auto &entry : std::filesystem::directory_iterator("/proc", ec)) {
        const std::string name = entry.path().filename().string();
        pid_t pid = 0;
        auto [ptr, parse_ec] = std::from_chars(name.data(), name.data() + name.size(), pid);
        if (parse_ec != std::errc() || ptr != name.data() + name.size())
            continue;
        if (auto ppid = parent_of(entry.path()))
            children[*ppid].push_back(pid);
    }
    return children;
}

reproc::milliseconds to_reproc(std::chrono::milliseconds d) {
    using rep = reproc::milliseconds::rep;
    // the two largest values are reproc's `infinite` and `deadline` sentinels
    constexpr auto max = static_cast<long long>(std::numeric_limits<rep>::max() - 2);
    return reproc::milliseconds(static_cast<rep>(std::clamp<long long>(d.count(), 1, max)));
}

constexpr auto EXIT_POLL_INTERVAL = std::chrono::milliseconds(10);
constexpr int MAX_CLOSED_FD = 1 << 16;

bool is_executable(const std::filesystem::path &path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec) && access(path.c_str(), X_OK) == 0;
}

bool find_program(const std::string &name) {
    if (name.find('/') != std::string::npos)
        return is_executable(name);

    const char *env_path = std::getenv("PATH");
    std::string_view search = env_path ? env_path : "/usr/bin:/bin";
    while (true) {
        size_t sep = search.find(':');
        std::string_view dir = search.substr(0, sep);
        if (is_executable(std::filesystem::path(dir.empty() ? "." : dir) / name))
            return true;
        if (sep == std::string_view::npos)
            return false;
        search.remove_prefix(sep + 1);
    }
}

// Everything the forked child touches is prepared here; after fork only
// async-signal-safe calls are allowed.
struct ChildLaunch {
    std::vector<char *> argv;
    std::vector<std::string> env_storage;
    std::vector<char *> envp;
    std::string working_dir;
    std::string exec_error;
    int fd_limit = 0;

    explicit ChildLaunch(const ProcessSpec &spec) {
        for (const auto &arg : spec.args)
            argv.push_back(const_cast<char *>(arg.c_str()));
        argv.push_back(nullptr);

        for (char **entry = environ; entry && *entry; ++entry) {
            std::string_view binding = *entry;
            std::string_view key = binding.substr(0, binding.find('='));
            if (!spec.env.contains(std::string(key)))
                env_storage.emplace_back(binding);
        }
        for (const auto &[key, value] : spec.env)
            env_storage.push_back(key + "=" + value);
        for (auto &binding : env_storage)
            envp.push_back(binding.data());
        envp.push_back(nullptr);

        if (spec.working_dir)
            working_dir = spec.working_dir->string();
        exec_error = std::format("makeport: failed to execute {}\n", spec.args.front());

        long open_max = sysconf(_SC_OPEN_MAX);
        fd_limit = open_max > 0 && open_max < MAX_CLOSED_FD ? static_cast<int>(open_max) : MAX_CLOSED_FD;
    }
};

void close_inherited(int limit) {
#ifdef SYS_close_range
    if (syscall(SYS_close_range, 3U, ~0U, 0U) == 0)
        return;
#endif
    for (int fd = 3; fd < limit; ++fd)
        close(fd);
}

[[noreturn]] void report_and_exit(const std::string &message) {
    ssize_t written = write(STDOUT_FILENO, message.data(), message.size());
    static_cast<void>(written);
    _exit(127);
}

/// Runs in the forked child: new session, clean descriptor table, exec.
[[noreturn]] void exec_child(const ChildLaunch &launch) {
    sigset_t none;
    sigemptyset(&none);
    sigprocmask(SIG_SETMASK, &none, nullptr);

    setsid();
    if (!launch.working_dir.empty() && chdir(launch.working_dir.c_str()) == -1)
        report_and_exit(launch.exec_error);

    // Descendants must not keep reproc's exit pipe or a sibling run's pipes open.
    close_inherited(launch.fd_limit);

    execvpe(launch.argv[0], launch.argv.data(), launch.envp.data());
    report_and_exit(launch.exec_error);
}

/// Exit status of a terminated child without reaping it, or nullopt once `deadline` passes.
Result<std::optional<int>> await_exit(pid_t pid, std::chrono::steady_clock::time_point deadline) {
    while (true) {
        siginfo_t info{};
        if (waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) == -1) {
            return std::unexpected(std::format("waitid({}) failed: {}", pid, std::strerror(errno)));
        }
        if (info.si_pid == pid) {
            if (info.si_code == CLD_EXITED)
                return info.si_status;
            return 128 + info.si_status;
        }
        if (std::chrono::steady_clock::now() >= deadline)
            return std::nullopt;
        std::this_thread::sleep_for(EXIT_POLL_INTERVAL);
    }
}

} // namespace

void kill_process_tree(int pid) {
    if (pid <= 0)
        return;

    if (getpgid(pid) == pid) {
        if (killpg(pid, SIGKILL) == -1)
            log::debug("killpg({}) failed: {}", pid, std::strerror(errno));
        return;
    }

    // Stop every process we find so nothing forks behind our back, repeat
    // until a pass finds no new descendants, then kill them all.
    std::vector<pid_t> victims{pid};
    kill(pid, SIGSTOP);
    for (bool grew = true; grew;) {
        grew = false;
        auto children = snapshot_children();
        for (size_t i = 0; i < victims.size(); ++i) {
            auto it = children.find(victims[i]);
            if (it == children.end())
                continue;
            for (pid_t child : it->second) {
                if (std::ranges::find(victims, child) == victims.end()) {
                    kill(child, SIGSTOP);
                    victims.push_back(child);
                    grew = true;
                }
            }
        }
    }

    for (pid_t victim : victims) {
        kill(victim, SIGKILL);
    }
    log::debug("Killed process tree of {} ({} processes)", pid, victims.size());
}

Result<ProcessOutput> process_exec(const ProcessSpec &spec,
                                   const std::function<void(int)> &on_start,
                                   const std::function<void(std::string_view)> &on_output) {
    if (spec.args.empty()) {
        return std::unexpected("Cannot execute empty command");
    }
    if (!find_program(spec.args.front())) {
        return std::unexpected(std::format("Failed to start '{}': program not found", spec.args.front()));
    }

    reproc::options options;
    options.redirect.in.type = reproc::redirect::discard;
    options.redirect.out.type = reproc::redirect::pipe;
    options.redirect.err.type = reproc::redirect::stdout_;
    options.deadline = to_reproc(spec.timeout);
    options.stop.first = {reproc::stop::kill, REAP_TIMEOUT};

    const ChildLaunch launch(spec);

    reproc::process process;
    auto [is_child, start_ec] = process.fork(options);
    if (is_child) {
        exec_child(launch);
    }
    if (start_ec) {
        return std::unexpected(std::format("Failed to start '{}': {}", spec.args.front(), start_ec.message()));
    }
    const auto deadline = std::chrono::steady_clock::now() + spec.timeout;

    auto [pid, pid_ec] = process.pid();
    if (pid_ec) {
        pid = -1;
    }
    if (on_start) {
        on_start(pid);
    }

    ProcessOutput result;
    auto sink = [&](reproc::stream, const uint8_t *buffer, size_t size) -> std::error_code {
        std::string_view chunk(reinterpret_cast<const char *>(buffer), size);
        result.output.append(chunk);
        if (on_output) {
            on_output(chunk);
        }
        return {};
    };

    auto reap = [&]() {
        if (auto [status, wait_ec] = process.wait(REAP_TIMEOUT); wait_ec) {
            log::warn("Process {} was not reaped within {}ms: {}", pid, REAP_TIMEOUT.count(), wait_ec.message());
        }
    };

    auto expire = [&]() {
        kill_process_tree(pid);
        if (auto ec = process.kill(); ec) {
            log::debug("kill({}) after deadline: {}", pid, ec.message());
        }
        reap();
        result.timed_out = true;
        return result;
    };

    std::error_code ec = reproc::drain(process, sink, reproc::sink::null);
    if (ec == std::errc::timed_out) {
        return expire();
    }
    if (ec) {
        kill_process_tree(pid);
        reap();
        return std::unexpected(std::format("Failed to read output of '{}': {}", spec.args.front(), ec.message()));
    }

    // Background jobs may outlive the child; only the child's own exit counts.
    auto exited = await_exit(pid, deadline);
    if (!exited) {
        kill_process_tree(pid);
        reap();
        return std::unexpected(std::format("Failed to wait for '{}': {}", spec.args.front(), exited.error()));
    }
    if (!*exited) {
        return expire();
    }

    reap();
    result.exit_code = **exited;
    return result;
}

} // namespace makeport
