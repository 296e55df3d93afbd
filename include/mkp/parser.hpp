#pragma once

#include "mkp/declarations.hpp"
#include "mkp/utility.hpp"

#include <filesystem>
#include <string_view>

namespace makeport {

/**
 * @brief Parses Makefile text into declarations and category labels.
 *
 * Recognizes `## Category: <label>` headers, rule headers with a trailing
 * `## description` comment (optionally tagged `@internal` or `@skip`), plain
 * rule headers, and `.PHONY:` lists. Anything else is skipped.
 *
 * @param content The Makefile text.
 * @return The declarations in file order.
 */
DeclarationSet parse(std::string_view content);

/**
 * @brief Maps and parses a Makefile.
 *
 * @param path The path to the Makefile.
 * @return The declarations, or an error if the file cannot be read.
 */
Result<DeclarationSet> parse_file(const std::filesystem::path &path);

} // namespace makeport
