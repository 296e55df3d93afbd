#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace makeport {

enum class Visibility { public_, internal, skip };

std::string_view to_string(Visibility v);

struct Declaration {
    std::string name;
    std::optional<std::string> description; ///< Absent for rule headers without a `##` comment.
    std::optional<std::string> category;
    std::vector<std::string> dependencies;
    Visibility visibility = Visibility::public_;
    bool phony = false;

    bool documented() const {
        return description.has_value();
    }
    bool exposable() const {
        return documented() && visibility == Visibility::public_;
    }
};

using Variables = std::map<std::string, std::string>;

constexpr std::chrono::seconds DEFAULT_TIMEOUT{300};

struct ExecutionRequest {
    std::string target;
    Variables variables;                             ///< Exported to make's environment.
    std::optional<std::chrono::milliseconds> timeout; ///< Unset selects the configured default.
    std::filesystem::path working_directory;         ///< Empty selects the configured directory.
};

enum class ExecutionStatus { succeeded, failed, timed_out, not_found, not_allowed };

std::string_view to_string(ExecutionStatus s);

struct ExecutionResult {
    std::string target;
    ExecutionStatus status = ExecutionStatus::failed;
    std::optional<int> exit_code; ///< Only set for `succeeded` and `failed` runs that reached exit.
    std::string raw_output;       ///< Merged stdout/stderr, or a diagnostic when nothing ran.
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point started_at;

    bool ok() const {
        return status == ExecutionStatus::succeeded;
    }
};

struct OutputArtifact {
    std::filesystem::path path;
};

} // namespace makeport
