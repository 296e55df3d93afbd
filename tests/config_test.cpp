#include <gtest/gtest.h>

#include "mkp/config.hpp"

#include <map>
#include <optional>
#include <string>

using namespace makeport;

namespace {

EnvLookup from(std::map<std::string, std::string> vars) {
    return [vars = std::move(vars)](std::string_view name) -> std::optional<std::string> {
        if (auto it = vars.find(std::string(name)); it != vars.end())
            return it->second;
        return std::nullopt;
    };
}

} // namespace

TEST(Config, DefaultsWithEmptyEnvironment) {
    auto config = load_config(from({}));
    ASSERT_TRUE(config) << config.error();

    EXPECT_EQ(config->makefile.string(), "Makefile");
    EXPECT_FALSE(config->working_dir.has_value());
    EXPECT_TRUE(config->allowed_targets.empty());
    EXPECT_EQ(config->max_output_chars, 0u);
    EXPECT_FALSE(config->write_to_file);
    EXPECT_TRUE(config->temp_dir.empty());
    EXPECT_EQ(config->default_timeout, std::chrono::seconds(300));
    EXPECT_EQ(config->make_program, "make");
    EXPECT_EQ(config->log_level, log::Level::info);
    EXPECT_TRUE(validate(*config));
}

TEST(Config, EnvironmentOverridesEveryField) {
    auto config = load_config(from({{"MAKEPORT_MAKEFILE", "/src/Makefile"},
                                    {"MAKEPORT_WORKDIR", "/src"},
                                    {"MAKEPORT_ALLOWED_TARGETS", " test, build ,,lint "},
                                    {"MAKEPORT_MAX_OUTPUT_CHARS", "4096"},
                                    {"MAKEPORT_WRITE_TO_FILE", "yes"},
                                    {"MAKEPORT_TEMP_DIR", "/var/tmp"},
                                    {"MAKEPORT_TIMEOUT", "60"},
                                    {"MAKEPORT_MAKE", "gmake"},
                                    {"MAKEPORT_LOG_LEVEL", "WARNING"}}));
    ASSERT_TRUE(config) << config.error();

    EXPECT_EQ(config->makefile.string(), "/src/Makefile");
    ASSERT_TRUE(config->working_dir.has_value());
    EXPECT_EQ(config->working_dir->string(), "/src");
    EXPECT_EQ(config->allowed_targets, (AllowList{"test", "build", "lint"}));
    EXPECT_EQ(config->max_output_chars, 4096u);
    EXPECT_TRUE(config->write_to_file);
    EXPECT_EQ(config->temp_dir.string(), "/var/tmp");
    EXPECT_EQ(config->default_timeout, std::chrono::seconds(60));
    EXPECT_EQ(config->make_program, "gmake");
    EXPECT_EQ(config->log_level, log::Level::warn);

    ExecutorConfig exec = config->executor_config();
    EXPECT_EQ(exec.default_timeout, std::chrono::milliseconds(60000));
    EXPECT_EQ(exec.make_program, "gmake");
    OutputConfig out = config->output_config();
    EXPECT_EQ(out.max_output_chars, 4096u);
    EXPECT_TRUE(out.write_to_file);
}

TEST(Config, MalformedValuesAreErrors) {
    EXPECT_FALSE(load_config(from({{"MAKEPORT_MAX_OUTPUT_CHARS", "lots"}})));
    EXPECT_FALSE(load_config(from({{"MAKEPORT_MAX_OUTPUT_CHARS", "-1"}})));
    EXPECT_FALSE(load_config(from({{"MAKEPORT_WRITE_TO_FILE", "maybe"}})));
    EXPECT_FALSE(load_config(from({{"MAKEPORT_TIMEOUT", "5m"}})));
    EXPECT_FALSE(load_config(from({{"MAKEPORT_LOG_LEVEL", "chatty"}})));

    auto res = load_config(from({{"MAKEPORT_TIMEOUT", "soon"}}));
    ASSERT_FALSE(res);
    EXPECT_NE(res.error().find("MAKEPORT_TIMEOUT"), std::string::npos);
}

TEST(Config, ValidateRejectsBadValues) {
    ServerConfig zero_timeout;
    zero_timeout.default_timeout = std::chrono::seconds(0);
    EXPECT_FALSE(validate(zero_timeout));

    ServerConfig bad_target;
    bad_target.allowed_targets = {"ok", "rm -rf /"};
    EXPECT_FALSE(validate(bad_target));

    ServerConfig no_make;
    no_make.make_program.clear();
    EXPECT_FALSE(validate(no_make));
}

TEST(Config, ParseHelpers) {
    EXPECT_EQ(parse_bool("TRUE"), true);
    EXPECT_EQ(parse_bool("off"), false);
    EXPECT_EQ(parse_bool(""), false);
    EXPECT_FALSE(parse_bool("2"));
    EXPECT_EQ(parse_count(" 42 "), 42u);
    EXPECT_FALSE(parse_count(""));
    EXPECT_TRUE(parse_target_list("").empty());
    EXPECT_EQ(parse_target_list("a"), (AllowList{"a"}));
}

TEST(Log, ParseLevel) {
    EXPECT_EQ(log::parse_level("debug"), log::Level::debug);
    EXPECT_EQ(log::parse_level("Error"), log::Level::error);
    EXPECT_FALSE(log::parse_level("verbose"));
}
