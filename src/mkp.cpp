#include "mkp/catalog.hpp"
#include "mkp/config.hpp"
#include "mkp/executor.hpp"
#include "mkp/log.hpp"
#include "mkp/output.hpp"
#include "mkp/parser.hpp"
#include "mkp/report.hpp"

#include <charconv>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <print>
#include <string>
#include <string_view>
#include <vector>

namespace {

void print_help() {
    std::println("Usage: mkp [options] <command> [args]");
    std::println("Commands:");
    std::println("  preview [Makefile]        Show the targets that would be exposed, grouped by category");
    std::println("  list [Makefile]           Print exposed target names");
    std::println("  run <target> [Makefile]   Execute one exposed target");
    std::println("Options:");
    std::println("  -h, --help                Show this help message");
    std::println("  -v, --version             Show version");
    std::println("  -f <file>                 Use <file> as the Makefile (default: Makefile)");
    std::println("  -C <dir>                  Run make in <dir> (default: the Makefile's directory)");
    std::println("  -D KEY=VALUE              Pass a variable to make (repeatable, run only)");
    std::println("  --timeout <seconds>       Timeout for run (default: 300)");
    std::println("  --allowed-targets a,b     Only expose the listed targets");
    std::println("  --max-output <N>          Truncate returned output to N characters (0: unlimited)");
    std::println("  --write-to-file           Persist full output under the temp directory");
    std::println("  --temp-dir <dir>          Root for persisted output (default: system temp)");
    std::println("  --make <program>          Make program to invoke (default: make)");
    std::println("  --log-level <level>       debug, info, warn, error or off (default: info)");
    std::println("  --json                    Emit JSON (list, run)");
    std::println("Environment: MAKEPORT_MAKEFILE, MAKEPORT_WORKDIR, MAKEPORT_ALLOWED_TARGETS,");
    std::println("  MAKEPORT_MAX_OUTPUT_CHARS, MAKEPORT_WRITE_TO_FILE, MAKEPORT_TEMP_DIR,");
    std::println("  MAKEPORT_TIMEOUT, MAKEPORT_MAKE, MAKEPORT_LOG_LEVEL");
}

void print_version() {
    std::println("mkp {}", MAKEPORT_PROJ_VER);
}

std::optional<size_t> to_count(const char *arg) {
    size_t value = 0;
    auto res = std::from_chars(arg, arg + strlen(arg), value);
    if (res.ec != std::errc() || res.ptr != arg + strlen(arg))
        return std::nullopt;
    return value;
}

void report_event(const makeport::ExecutionEvent &event) {
    using makeport::EventKind;
    switch (event.kind) {
    case EventKind::started:
        makeport::log::info("[{}] started (pid {})", event.target, event.pid);
        break;
    case EventKind::output:
        makeport::log::debug("[{}] {} bytes of output", event.target, event.chunk.size());
        break;
    case EventKind::completed:
    case EventKind::failed:
    case EventKind::timed_out:
        makeport::log::info("[{}] {}", event.target, makeport::to_string(event.kind));
        break;
    }
}

} // namespace

int main(const int argc, const char *const *argv) {
    auto loaded = makeport::load_config();
    if (!loaded) {
        std::println(std::cerr, "{}", loaded.error());
        return 1;
    }
    makeport::ServerConfig config = std::move(*loaded);

    std::vector<std::string_view> positional;
    makeport::Variables variables;
    std::optional<std::chrono::seconds> timeout;
    bool json = false;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        auto next = [&]() -> const char * {
            if (i + 1 < argc)
                return argv[++i];
            std::println(std::cerr, "Missing argument for {}", arg);
            return nullptr;
        };

        if (arg == "-h" || arg == "--help") {
            print_help();
            return 0;
        } else if (arg == "-v" || arg == "--version") {
            print_version();
            return 0;
        } else if (arg == "-f") {
            const char *v = next();
            if (!v)
                return 1;
            config.makefile = v;
        } else if (arg == "-C") {
            const char *v = next();
            if (!v)
                return 1;
            config.working_dir = std::filesystem::path(v);
        } else if (arg == "-D") {
            const char *v = next();
            if (!v)
                return 1;
            std::string_view binding = v;
            size_t eq = binding.find('=');
            if (eq == std::string_view::npos || eq == 0) {
                std::println(std::cerr, "Expected KEY=VALUE for -D, got: {}", binding);
                return 1;
            }
            variables[std::string(binding.substr(0, eq))] = std::string(binding.substr(eq + 1));
        } else if (arg == "--timeout") {
            const char *v = next();
            if (!v)
                return 1;
            auto n = to_count(v);
            if (!n || *n == 0) {
                std::println(std::cerr, "Invalid timeout: {}", v);
                return 1;
            }
            timeout = std::chrono::seconds(*n);
        } else if (arg == "--allowed-targets") {
            const char *v = next();
            if (!v)
                return 1;
            config.allowed_targets = makeport::parse_target_list(v);
        } else if (arg == "--max-output") {
            const char *v = next();
            if (!v)
                return 1;
            auto n = to_count(v);
            if (!n) {
                std::println(std::cerr, "Invalid output limit: {}", v);
                return 1;
            }
            config.max_output_chars = *n;
        } else if (arg == "--write-to-file") {
            config.write_to_file = true;
        } else if (arg == "--temp-dir") {
            const char *v = next();
            if (!v)
                return 1;
            config.temp_dir = v;
        } else if (arg == "--make") {
            const char *v = next();
            if (!v)
                return 1;
            config.make_program = v;
        } else if (arg == "--log-level") {
            const char *v = next();
            if (!v)
                return 1;
            auto level = makeport::log::parse_level(v);
            if (!level) {
                std::println(std::cerr, "{}", level.error());
                return 1;
            }
            config.log_level = *level;
        } else if (arg == "--json") {
            json = true;
        } else if (arg.starts_with("-")) {
            std::println(std::cerr, "Unknown argument: {}", arg);
            print_help();
            return 1;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        print_help();
        return 1;
    }

    const std::string_view command = positional[0];
    std::string target;
    size_t makefile_arg = 1;
    if (command == "run") {
        if (positional.size() < 2) {
            std::println(std::cerr, "run requires a target name");
            return 1;
        }
        target = std::string(positional[1]);
        makefile_arg = 2;
    } else if (command != "preview" && command != "list") {
        std::println(std::cerr, "Unknown command: {}", command);
        print_help();
        return 1;
    }
    if (positional.size() > makefile_arg + 1) {
        std::println(std::cerr, "Too many arguments for {}", command);
        return 1;
    }
    if (positional.size() == makefile_arg + 1) {
        config.makefile = positional[makefile_arg];
    }
    if (timeout) {
        config.default_timeout = *timeout;
    }

    makeport::log::set_level(config.log_level);

    if (auto res = makeport::validate(config); !res) {
        std::println(std::cerr, "Invalid configuration: {}", res.error());
        return 1;
    }

    if (!std::filesystem::exists(config.makefile)) {
        std::println(std::cerr, "Error: Makefile not found: {}", config.makefile.string());
        return 1;
    }

    auto parsed = makeport::parse_file(config.makefile);
    if (!parsed) {
        std::println(std::cerr, "Failed to parse: {}", parsed.error());
        return 1;
    }

    auto catalog = std::make_shared<const makeport::Catalog>(std::move(*parsed), config.allowed_targets);

    if (command == "preview") {
        std::print("{}", makeport::render_preview(*catalog, config.makefile));
        return 0;
    }

    if (command == "list") {
        if (json) {
            std::println("{}", makeport::catalog_json(*catalog).dump(4));
        } else {
            for (const makeport::Declaration *decl : catalog->exposed())
                std::println("{}", decl->name);
        }
        return 0;
    }

    if (auto res = catalog->check_allow_list(); !res) {
        std::println(std::cerr, "{}", res.error());
        return 1;
    }

    makeport::Executor executor{catalog, config.executor_config()};
    makeport::OutputManager output_manager{config.output_config(),
                                           makeport::SessionDirectory::create(config.temp_dir)};

    makeport::ExecutionResult result =
        executor.execute({.target = target, .variables = std::move(variables), .timeout = {}, .working_directory = {}},
                         report_event);
    // rejected names come straight from the caller and never reach the session directory
    const bool rejected = result.status == makeport::ExecutionStatus::not_found ||
                          result.status == makeport::ExecutionStatus::not_allowed;
    makeport::ProcessedOutput output =
        rejected ? makeport::ProcessedOutput{.text = result.raw_output,
                                             .artifact = {},
                                             .truncated = false,
                                             .original_length = result.raw_output.size()}
                 : output_manager.process(result.target, result.raw_output);

    if (json) {
        std::println("{}", makeport::result_json(result, output).dump(4));
    } else {
        std::print("{}", makeport::render_result(result, output));
    }
    return result.ok() ? 0 : 1;
}
