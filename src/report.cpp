#include "mkp/report.hpp"

#include <chrono>
#include <format>
#include <string>

namespace makeport {

namespace {

constexpr std::string_view RULE =
    "======================================================================";

std::string join(const std::vector<std::string> &items) {
    std::string out;
    for (const auto &item : items) {
        if (!out.empty())
            out += ", ";
        out += item;
    }
    return out;
}

double seconds(std::chrono::milliseconds d) {
    return std::chrono::duration<double>(d).count();
}

} // namespace

std::string describe(const Declaration &decl) {
    std::string out;
    if (decl.category)
        out += std::format("[{}] ", *decl.category);
    out += decl.description.value_or("");
    if (!decl.dependencies.empty())
        out += std::format(" (depends on: {})", join(decl.dependencies));
    return out;
}

nlohmann::json to_json(const Declaration &decl) {
    nlohmann::json j;
    j["name"] = decl.name;
    j["description"] = decl.description ? nlohmann::json(*decl.description) : nlohmann::json(nullptr);
    j["category"] = decl.category ? nlohmann::json(*decl.category) : nlohmann::json(nullptr);
    j["dependencies"] = decl.dependencies;
    j["visibility"] = to_string(decl.visibility);
    j["phony"] = decl.phony;
    return j;
}

nlohmann::json catalog_json(const Catalog &catalog) {
    nlohmann::json groups = nlohmann::json::array();
    for (const auto &group : catalog.list()) {
        nlohmann::json targets = nlohmann::json::array();
        for (const Declaration *decl : group.entries)
            targets.push_back(to_json(*decl));
        nlohmann::json entry;
        entry["category"] = group.category ? nlohmann::json(*group.category) : nlohmann::json(nullptr);
        entry["targets"] = std::move(targets);
        groups.push_back(std::move(entry));
    }
    nlohmann::json j;
    j["groups"] = std::move(groups);
    return j;
}

nlohmann::json result_json(const ExecutionResult &result, const ProcessedOutput &output) {
    nlohmann::json j;
    j["target"] = result.target;
    j["status"] = to_string(result.status);
    j["exit_code"] = result.exit_code ? nlohmann::json(*result.exit_code) : nlohmann::json(nullptr);
    j["duration"] = seconds(result.duration);
    j["timestamp"] = std::format("{:%FT%T}", std::chrono::floor<std::chrono::seconds>(result.started_at));
    j["output"] = output.text;
    j["truncated"] = output.truncated;
    j["artifact"] = output.artifact ? nlohmann::json(output.artifact->path.string()) : nlohmann::json(nullptr);
    return j;
}

std::string render_result(const ExecutionResult &result, const ProcessedOutput &output) {
    if (result.status == ExecutionStatus::not_found || result.status == ExecutionStatus::not_allowed) {
        return std::format("Error: {}\n", output.text);
    }

    std::string out = std::format("Target: {}\n", result.target);
    out += std::format("Status: {}\n", to_string(result.status));
    if (result.exit_code)
        out += std::format("Exit Code: {}\n", *result.exit_code);
    out += std::format("Duration: {:.2f}s\n", seconds(result.duration));
    if (output.artifact)
        out += std::format("Full output written to: {}\n", output.artifact->path.string());
    out += "\n";
    if (result.status == ExecutionStatus::timed_out)
        out += std::format("Execution timed out after {:.2f}s; output captured so far:\n", seconds(result.duration));
    out += output.text;
    if (!output.text.empty() && output.text.back() != '\n')
        out += "\n";
    return out;
}

std::string render_preview(const Catalog &catalog, const std::filesystem::path &makefile) {
    const auto exposed = catalog.exposed();
    const auto hidden = catalog.hidden();

    std::string out = std::format("Makefile: {}\n", makefile.string());
    out += std::format("Total targets: {}\n", catalog.declarations().documented_count());
    out += std::format("Exposed: {}\n", exposed.size());
    out += std::format("Internal (hidden): {}\n", hidden.size());

    if (exposed.empty()) {
        out += "\nNo targets would be exposed.\nAdd '## Description' comments to your Makefile targets.\n";
        return out;
    }

    for (const auto &group : catalog.list()) {
        out += std::format("\n{}\n  {}\n{}\n", RULE, group.category.value_or("Uncategorized"), RULE);
        for (const Declaration *decl : group.entries) {
            out += std::format("\n  {}\n    {}", decl->name, decl->description.value_or(""));
            if (!decl->dependencies.empty())
                out += std::format(" -> depends on: {}", join(decl->dependencies));
            out += "\n";
        }
    }

    if (!hidden.empty()) {
        out += std::format("\n{}\n  Internal Targets (NOT exposed)\n{}\n", RULE, RULE);
        for (const Declaration *decl : hidden)
            out += std::format("  {} - {}\n", decl->name, describe(*decl));
    }

    out += std::format("\n{}\n  Summary\n{}\n", RULE, RULE);
    out += std::format("{} targets can be invoked from this Makefile\n", exposed.size());
    out += "Each target accepts optional variables and a timeout\n";
    return out;
}

} // namespace makeport
