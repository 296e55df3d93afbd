#include "mkp/executor.hpp"

#include "mkp/catalog.hpp"
#include "mkp/log.hpp"
#include "mkp/process_exec.hpp"
#include "mkp/utility.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <filesystem>
#include <format>
#include <future>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace makeport {

namespace {

void publish(const EventSink &sink, const ExecutionEvent &event) {
    if (!sink)
        return;
    try {
        sink(event);
    } catch (const std::exception &err) {
        log::debug("Dropped {} notification for '{}': {}", to_string(event.kind), event.target, err.what());
    }
}

std::string available_targets(const Catalog &catalog) {
    std::vector<std::string> names;
    for (const Declaration *decl : catalog.exposed())
        names.push_back(decl->name);
    std::ranges::sort(names);

    std::string out;
    for (const auto &name : names) {
        if (!out.empty())
            out += ", ";
        out += name;
    }
    return out.empty() ? "none" : out;
}

std::string rejection_reason(const Catalog &catalog, const std::string &target) {
    const Declaration *decl = catalog.declarations().find(target);
    if (!decl->documented()) {
        return std::format("Cannot execute target '{}': it has no '## description' and is not exposed.", target);
    }
    if (decl->visibility != Visibility::public_) {
        return std::format("Cannot execute target '{}': marked as internal (@internal or @skip). "
                           "This target is not available for remote execution.",
                           target);
    }
    return std::format("Target '{}' is not in the allowlist. Allowed targets: {}", target, available_targets(catalog));
}

} // namespace

std::string_view to_string(EventKind kind) {
    switch (kind) {
    case EventKind::started:
        return "started";
    case EventKind::output:
        return "output";
    case EventKind::completed:
        return "completed";
    case EventKind::failed:
        return "failed";
    case EventKind::timed_out:
        return "timed_out";
    }
    return "unknown";
}

Executor::Executor(std::shared_ptr<const Catalog> catalog, ExecutorConfig config)
    : catalog_(std::move(catalog)), config_(std::move(config)) {
    std::error_code ec;
    if (auto abs = std::filesystem::absolute(config_.makefile, ec); !ec) {
        config_.makefile = abs;
    }
}

std::filesystem::path Executor::resolve_working_dir(const ExecutionRequest &request) const {
    if (!request.working_directory.empty())
        return request.working_directory;
    if (config_.working_dir)
        return *config_.working_dir;
    return config_.makefile.parent_path();
}

std::future<ExecutionResult> Executor::submit(ExecutionRequest request, EventSink sink) const {
    std::string target = request.target;
    try {
        return std::async(std::launch::async, [self = *this, request = std::move(request), sink = std::move(sink)]() {
            return self.run(request, sink);
        });
    } catch (const std::system_error &err) {
        log::error("Could not start a worker for '{}': {}", target, err.what());
        std::promise<ExecutionResult> failed;
        ExecutionResult result;
        result.target = std::move(target);
        result.status = ExecutionStatus::failed;
        result.raw_output = std::format("Could not start a worker thread: {}", err.what());
        result.started_at = std::chrono::system_clock::now();
        failed.set_value(std::move(result));
        return failed.get_future();
    }
}

ExecutionResult Executor::execute(ExecutionRequest request, EventSink sink) const {
    return submit(std::move(request), std::move(sink)).get();
}

ExecutionResult Executor::run(const ExecutionRequest &request, const EventSink &sink) const {
    const auto clock_start = std::chrono::steady_clock::now();

    ExecutionResult result;
    result.target = request.target;
    result.started_at = std::chrono::system_clock::now();

    auto finish = [&](ExecutionStatus status, std::string output, std::optional<int> exit_code = std::nullopt) {
        result.status = status;
        result.raw_output = std::move(output);
        result.exit_code = exit_code;
        result.duration =
            std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - clock_start);
        return result;
    };

    const std::string &target = request.target;

    switch (catalog_->authorize(target)) {
    case Access::not_found:
        log::warn("Rejected '{}': no such target", target);
        return finish(ExecutionStatus::not_found,
                      std::format("Target '{}' not found. Available targets: {}", target, available_targets(*catalog_)));
    case Access::not_allowed: {
        std::string reason = rejection_reason(*catalog_, target);
        log::warn("Rejected '{}': {}", target, reason);
        return finish(ExecutionStatus::not_allowed, std::move(reason));
    }
    case Access::allowed:
        break;
    }

    try {
        if (!is_target_identifier(target)) {
            return finish(ExecutionStatus::failed, std::format("Invalid target name: {}", target));
        }
        for (const auto &[key, value] : request.variables) {
            if (!is_variable_identifier(key)) {
                return finish(ExecutionStatus::failed, std::format("Invalid variable name: {}", key));
            }
        }

        const std::chrono::milliseconds timeout = request.timeout.value_or(config_.default_timeout);
        if (timeout.count() <= 0) {
            return finish(ExecutionStatus::failed, std::format("Timeout must be positive, got: {}", timeout));
        }
        if (timeout > RECOMMENDED_MAX_TIMEOUT) {
            log::warn("Very long timeout specified: {} (max recommended: {})", timeout, RECOMMENDED_MAX_TIMEOUT);
        }

        const std::filesystem::path work_dir = resolve_working_dir(request);
        std::error_code ec;
        if (!std::filesystem::is_directory(work_dir, ec)) {
            return finish(ExecutionStatus::failed,
                          std::format("Working directory does not exist or is not a directory: {}", work_dir.string()));
        }
        if (!std::filesystem::is_regular_file(config_.makefile, ec)) {
            return finish(ExecutionStatus::failed, std::format("Makefile not found: {}", config_.makefile.string()));
        }

        ProcessSpec spec{.args = {config_.make_program, "-f", config_.makefile.string(), target},
                         .working_dir = work_dir,
                         .env = request.variables,
                         .timeout = timeout};

        log::info("Executing: {} -f {} {} in {} (timeout {})",
                  config_.make_program,
                  config_.makefile.string(),
                  target,
                  work_dir.string(),
                  timeout);

        int child = -1;
        auto on_start = [&](int pid) {
            child = pid;
            publish(sink, {.kind = EventKind::started, .target = target, .chunk = {}, .exit_code = {}, .pid = pid});
        };
        auto on_output = [&](std::string_view chunk) {
            publish(sink, {.kind = EventKind::output, .target = target, .chunk = chunk, .exit_code = {}, .pid = child});
        };

        auto out = process_exec(spec, on_start, on_output);
        if (!out) {
            log::error("Failed to execute target '{}': {}", target, out.error());
            finish(ExecutionStatus::failed, out.error());
            publish(sink, {.kind = EventKind::failed, .target = target, .chunk = {}, .exit_code = {}, .pid = child});
            return result;
        }

        if (out->timed_out) {
            finish(ExecutionStatus::timed_out, std::move(out->output));
            log::error("Target '{}' timed out after {}", target, timeout);
            publish(sink, {.kind = EventKind::timed_out, .target = target, .chunk = {}, .exit_code = {}, .pid = child});
            return result;
        }

        const int code = out->exit_code;
        finish(code == 0 ? ExecutionStatus::succeeded : ExecutionStatus::failed, std::move(out->output), code);
        log::info("Target '{}' completed in {} with exit code {}", target, result.duration, code);
        publish(sink,
                {.kind = code == 0 ? EventKind::completed : EventKind::failed,
                 .target = target,
                 .chunk = {},
                 .exit_code = code,
                 .pid = child});
        return result;
    } catch (const std::exception &err) {
        log::error("Unexpected error executing target '{}': {}", target, err.what());
        return finish(ExecutionStatus::failed, std::format("Unexpected error during execution: {}", err.what()));
    }
}

} // namespace makeport
