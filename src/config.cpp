#include "mkp/config.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <format>
#include <string>

namespace makeport {

ExecutorConfig ServerConfig::executor_config() const {
    return {.makefile = makefile,
            .working_dir = working_dir,
            .make_program = make_program,
            .default_timeout = default_timeout};
}

OutputConfig ServerConfig::output_config() const {
    return {.max_output_chars = max_output_chars, .write_to_file = write_to_file, .temp_dir_root = temp_dir};
}

std::optional<std::string> process_env(std::string_view name) {
    if (const char *value = std::getenv(std::string(name).c_str()))
        return std::string(value);
    return std::nullopt;
}

Result<bool> parse_bool(std::string_view value) {
    std::string lowered;
    for (unsigned char c : trim(value))
        lowered.push_back(static_cast<char>(std::tolower(c)));

    if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on")
        return true;
    if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off" || lowered.empty())
        return false;
    return std::unexpected(std::format("Not a boolean: '{}'", value));
}

Result<size_t> parse_count(std::string_view value) {
    std::string_view v = trim(value);
    size_t out = 0;
    auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), out);
    if (v.empty() || ec != std::errc() || ptr != v.data() + v.size())
        return std::unexpected(std::format("Not a non-negative integer: '{}'", value));
    return out;
}

AllowList parse_target_list(std::string_view value) {
    AllowList out;
    size_t start = 0;
    while (start <= value.size()) {
        size_t comma = value.find(',', start);
        if (comma == std::string_view::npos)
            comma = value.size();
        std::string_view item = trim(value.substr(start, comma - start));
        if (!item.empty())
            out.emplace_back(item);
        start = comma + 1;
    }
    return out;
}

Result<ServerConfig> load_config(const EnvLookup &lookup, ServerConfig base) {
    auto bad = [](std::string_view var, const std::string &why) {
        return std::unexpected(std::format("Invalid {}: {}", var, why));
    };

    if (auto v = lookup("MAKEPORT_MAKEFILE"); v && !v->empty())
        base.makefile = *v;
    if (auto v = lookup("MAKEPORT_WORKDIR"); v && !v->empty())
        base.working_dir = *v;
    if (auto v = lookup("MAKEPORT_ALLOWED_TARGETS"))
        base.allowed_targets = parse_target_list(*v);
    if (auto v = lookup("MAKEPORT_MAX_OUTPUT_CHARS")) {
        auto n = parse_count(*v);
        if (!n)
            return bad("MAKEPORT_MAX_OUTPUT_CHARS", n.error());
        base.max_output_chars = *n;
    }
    if (auto v = lookup("MAKEPORT_WRITE_TO_FILE")) {
        auto b = parse_bool(*v);
        if (!b)
            return bad("MAKEPORT_WRITE_TO_FILE", b.error());
        base.write_to_file = *b;
    }
    if (auto v = lookup("MAKEPORT_TEMP_DIR"); v && !v->empty())
        base.temp_dir = *v;
    if (auto v = lookup("MAKEPORT_TIMEOUT")) {
        auto n = parse_count(*v);
        if (!n)
            return bad("MAKEPORT_TIMEOUT", n.error());
        base.default_timeout = std::chrono::seconds(*n);
    }
    if (auto v = lookup("MAKEPORT_MAKE"); v && !v->empty())
        base.make_program = *v;
    if (auto v = lookup("MAKEPORT_LOG_LEVEL"); v && !v->empty()) {
        auto level = log::parse_level(*v);
        if (!level)
            return bad("MAKEPORT_LOG_LEVEL", level.error());
        base.log_level = *level;
    }
    return base;
}

Result<void> validate(const ServerConfig &config) {
    if (config.default_timeout.count() <= 0)
        return std::unexpected(std::format("Timeout must be positive, got: {}", config.default_timeout));
    if (config.makefile.empty())
        return std::unexpected("Makefile path must not be empty");
    if (config.make_program.empty())
        return std::unexpected("Make program must not be empty");
    for (const auto &name : config.allowed_targets) {
        if (!is_target_identifier(name))
            return std::unexpected(std::format("Invalid target name in allowed targets: {}", name));
    }
    return {};
}

} // namespace makeport
