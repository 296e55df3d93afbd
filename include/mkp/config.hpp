#pragma once

#include "mkp/catalog.hpp"
#include "mkp/domain.hpp"
#include "mkp/executor.hpp"
#include "mkp/log.hpp"
#include "mkp/output.hpp"
#include "mkp/utility.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace makeport {

/**
 * @brief Everything a makeport front end needs, with its defaults.
 *
 * | field            | default                  | environment                 |
 * |------------------|--------------------------|-----------------------------|
 * | makefile         | Makefile                 | MAKEPORT_MAKEFILE           |
 * | working_dir      | the Makefile's directory | MAKEPORT_WORKDIR            |
 * | allowed_targets  | all public targets       | MAKEPORT_ALLOWED_TARGETS    |
 * | max_output_chars | 0 (unlimited)            | MAKEPORT_MAX_OUTPUT_CHARS   |
 * | write_to_file    | false                    | MAKEPORT_WRITE_TO_FILE      |
 * | temp_dir         | system temp directory    | MAKEPORT_TEMP_DIR           |
 * | default_timeout  | 300s                     | MAKEPORT_TIMEOUT (seconds)  |
 * | make_program     | make                     | MAKEPORT_MAKE               |
 * | log_level        | info                     | MAKEPORT_LOG_LEVEL          |
 */
struct ServerConfig {
    std::filesystem::path makefile = "Makefile";
    std::optional<std::filesystem::path> working_dir;
    AllowList allowed_targets;
    size_t max_output_chars = 0;
    bool write_to_file = false;
    std::filesystem::path temp_dir;
    std::chrono::seconds default_timeout = DEFAULT_TIMEOUT;
    std::string make_program = "make";
    log::Level log_level = log::Level::info;

    ExecutorConfig executor_config() const;
    OutputConfig output_config() const;
};

using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

/// Reads the real process environment.
std::optional<std::string> process_env(std::string_view name);

/**
 * @brief Overlays `MAKEPORT_*` variables onto `base`.
 * @return The merged configuration, or an error naming the malformed variable.
 */
Result<ServerConfig> load_config(const EnvLookup &lookup = process_env, ServerConfig base = {});

Result<void> validate(const ServerConfig &config);

Result<bool> parse_bool(std::string_view value);
Result<size_t> parse_count(std::string_view value);

/// Splits a comma separated list, trimming blanks and dropping empty entries.
AllowList parse_target_list(std::string_view value);

} // namespace makeport
