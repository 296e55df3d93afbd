#pragma once

#include "mkp/catalog.hpp"
#include "mkp/domain.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace makeport {

struct ExecutorConfig {
    std::filesystem::path makefile = "Makefile";
    std::optional<std::filesystem::path> working_dir; ///< Defaults to the Makefile's directory.
    std::string make_program = "make";
    std::chrono::milliseconds default_timeout = DEFAULT_TIMEOUT;
};

/// Timeouts above this are accepted but logged.
constexpr std::chrono::seconds RECOMMENDED_MAX_TIMEOUT{3600};

enum class EventKind { started, output, completed, failed, timed_out };

std::string_view to_string(EventKind kind);

struct ExecutionEvent {
    EventKind kind;
    std::string_view target;
    std::string_view chunk;       ///< Set for `output`.
    std::optional<int> exit_code; ///< Set for `completed` and `failed` after exit.
    int pid = -1;
};

/**
 * @brief Progress side channel.
 *
 * Invoked on the worker thread: `started` once after spawn, `output` per
 * chunk, then exactly one terminal event. A spawn failure publishes only
 * `failed`; requests rejected by the catalog or by validation publish nothing.
 * Exceptions thrown by the sink are logged and otherwise ignored.
 */
using EventSink = std::function<void(const ExecutionEvent &)>;

/**
 * @brief Runs catalog targets through make.
 *
 * Every request yields an `ExecutionResult`; failures are reported through
 * its status and never thrown.
 */
class Executor {
public:
    Executor(std::shared_ptr<const Catalog> catalog, ExecutorConfig config = {});

    /**
     * @brief Starts a request on its own worker thread.
     * @param request The target, variables, timeout and working directory.
     * @param sink Optional progress observer.
     * @return A future that always becomes ready with a result.
     */
    std::future<ExecutionResult> submit(ExecutionRequest request, EventSink sink = {}) const;

    /// Blocking form of `submit`.
    ExecutionResult execute(ExecutionRequest request, EventSink sink = {}) const;

    const Catalog &catalog() const {
        return *catalog_;
    }
    const ExecutorConfig &config() const {
        return config_;
    }

private:
    ExecutionResult run(const ExecutionRequest &request, const EventSink &sink) const;
    std::filesystem::path resolve_working_dir(const ExecutionRequest &request) const;

    std::shared_ptr<const Catalog> catalog_;
    ExecutorConfig config_;
};

} // namespace makeport
