#pragma once

#include "mkp/domain.hpp"
#include "mkp/utility.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace makeport {

struct ProcessSpec {
    std::vector<std::string> args; ///< First argument is the executable, looked up in PATH.
    std::optional<std::filesystem::path> working_dir;
    Variables env; ///< Extends the parent environment.
    std::chrono::milliseconds timeout{0};
};

struct ProcessOutput {
    bool timed_out = false;
    int exit_code = -1; ///< Meaningless when `timed_out`.
    std::string output; ///< stdout with stderr redirected into it.
};

/**
 * @brief Runs a subprocess to completion or until its deadline expires.
 *
 * stderr is redirected into stdout so the captured text keeps the order in
 * which the child wrote it. stdin is closed. The child leads a new session and
 * inherits no descriptors beyond the standard three, so background jobs it
 * leaves behind neither delay nor change its exit status. When the deadline
 * expires the child's process group is killed and the child reaped; whatever
 * was read up to that point is kept.
 *
 * @param spec The command, environment, working directory and deadline.
 * @param on_start Called with the child's pid right after a successful spawn.
 * @param on_output Called with every chunk as it is read.
 * @return The captured output and exit status, or an error if the child could not be started.
 */
Result<ProcessOutput> process_exec(const ProcessSpec &spec,
                                   const std::function<void(int)> &on_start = {},
                                   const std::function<void(std::string_view)> &on_output = {});

/**
 * @brief SIGKILLs `pid` together with its process group or descendant tree.
 *
 * Children started by `process_exec` lead their own group, which is killed as
 * a whole. Otherwise descendants are found through /proc, stopped, then killed.
 */
void kill_process_tree(int pid);

} // namespace makeport
