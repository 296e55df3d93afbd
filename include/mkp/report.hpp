#pragma once

#include "mkp/catalog.hpp"
#include "mkp/domain.hpp"
#include "mkp/output.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

namespace makeport {

/// One-line tool description: `[Category] description (depends on: a, b)`.
std::string describe(const Declaration &decl);

nlohmann::json to_json(const Declaration &decl);

/// `{"groups": [{"category": ..., "targets": [...]}, ...]}` in listing order.
nlohmann::json catalog_json(const Catalog &catalog);

nlohmann::json result_json(const ExecutionResult &result, const ProcessedOutput &output);

/**
 * @brief Human readable result.
 *
 * Rejected requests render as a single error line and never show an exit
 * code or output section.
 */
std::string render_result(const ExecutionResult &result, const ProcessedOutput &output);

std::string render_preview(const Catalog &catalog, const std::filesystem::path &makefile);

} // namespace makeport
