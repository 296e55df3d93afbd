#include "mkp/parser.hpp"

#include "mkp/declarations.hpp"
#include "mkp/log.hpp"
#include "mkp/mmap.hpp"
#include "mkp/utility.hpp"

#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace makeport {

namespace {

constexpr std::string_view DOC_MARKER = "##";
constexpr std::string_view CATEGORY_KEY = "Category:";
constexpr std::string_view PHONY_KEY = ".PHONY";

std::vector<std::string_view> split_ws(std::string_view s) {
    std::vector<std::string_view> out;
    size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i])))
            i++;
        size_t start = i;
        while (i < s.size() && !std::isspace(static_cast<unsigned char>(s[i])))
            i++;
        if (i > start)
            out.push_back(s.substr(start, i - start));
    }
    return out;
}

// Prerequisite tokens that are not plain names: `VAR=value` target-specific
// assignments, `$(...)` references and the order-only separator.
bool is_dependency_name(std::string_view token) {
    return token != "|" && token.find('=') == std::string_view::npos && token.find('$') == std::string_view::npos;
}

std::optional<std::string_view> parse_category(std::string_view line) {
    std::string_view rest = line;
    while (rest.starts_with('#'))
        rest.remove_prefix(1);
    rest = trim(rest);
    if (!rest.starts_with(CATEGORY_KEY))
        return std::nullopt;

    std::string_view label = trim(rest.substr(CATEGORY_KEY.size()));
    if (label.empty())
        return std::nullopt;
    return label;
}

bool parse_phony(std::string_view line, DeclarationSet &set) {
    if (!line.starts_with(PHONY_KEY))
        return false;
    std::string_view rest = trim(line.substr(PHONY_KEY.size()));
    if (!rest.starts_with(':'))
        return false;

    rest.remove_prefix(1);
    if (size_t hash = rest.find('#'); hash != std::string_view::npos)
        rest = rest.substr(0, hash);
    for (auto name : split_ws(rest))
        set.mark_phony(name);
    return true;
}

void apply_visibility_tag(Declaration &decl, std::string_view description) {
    auto strip_tag = [&](std::string_view tag, Visibility v) {
        if (!description.starts_with(tag))
            return false;
        std::string_view rest = description.substr(tag.size());
        if (!rest.empty() && !std::isspace(static_cast<unsigned char>(rest.front())))
            return false;
        decl.visibility = v;
        description = trim(rest);
        return true;
    };

    if (!strip_tag("@internal", Visibility::internal))
        strip_tag("@skip", Visibility::skip);
    decl.description = std::string(description);
}

void parse_rule(std::string_view line, const std::optional<std::string> &category, DeclarationSet &set) {
    std::string_view head = line;
    std::optional<std::string_view> doc;
    if (size_t hash = line.find('#'); hash != std::string_view::npos) {
        head = line.substr(0, hash);
        if (line.substr(hash).starts_with(DOC_MARKER))
            doc = trim(line.substr(hash + DOC_MARKER.size()));
    }

    size_t colon = head.find(':');
    if (colon == std::string_view::npos)
        return;

    std::string_view name = head.substr(0, colon);
    while (!name.empty() && (name.back() == ' ' || name.back() == '\t'))
        name.remove_suffix(1);
    if (!is_target_identifier(name))
        return;

    std::string_view rest = head.substr(colon + 1);
    // double-colon rule
    if (rest.starts_with(':'))
        rest.remove_prefix(1);
    // `:=` and `::=` are assignments
    if (rest.starts_with('='))
        return;

    std::vector<std::string> dependencies;
    for (auto token : split_ws(rest)) {
        if (is_dependency_name(token))
            dependencies.emplace_back(token);
    }

    if (!doc) {
        set.note_undocumented(name, std::move(dependencies));
        return;
    }

    Declaration decl;
    decl.name = std::string(name);
    decl.category = category;
    decl.dependencies = std::move(dependencies);
    apply_visibility_tag(decl, *doc);

    std::string replaced_name = decl.name;
    if (set.upsert(std::move(decl))) {
        log::debug("Target '{}' redefined; keeping the last definition", replaced_name);
    }
}

} // namespace

DeclarationSet parse(std::string_view content) {
    DeclarationSet set;
    std::optional<std::string> category;

    size_t start = 0;
    while (start < content.size()) {
        size_t end = content.find('\n', start);
        // last line of the file
        if (end == std::string_view::npos) {
            end = content.size();
        }

        std::string_view line = content.substr(start, end - start);
        // windows CRLF handling
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        start = end + 1;

        if (line.empty() || line.front() == '\t') {
            // blank or recipe
            continue;
        }

        if (line.starts_with('#')) {
            if (auto label = parse_category(line)) {
                category = std::string(*label);
                set.add_category(*label);
            }
            continue;
        }

        if (parse_phony(line, set)) {
            continue;
        }

        parse_rule(line, category, set);
    }

    return set;
}

Result<DeclarationSet> parse_file(const std::filesystem::path &path) {
    auto file = MappedFile::open(path);
    if (!file) {
        return std::unexpected(file.error());
    }

    DeclarationSet set = parse((*file)->content());

    size_t documented = set.documented_count();
    size_t exposable = set.exposable_count();
    log::info("Parsed {}: {} targets ({} exposed, {} internal, {} undocumented)",
              path.string(),
              set.size(),
              exposable,
              documented - exposable,
              set.size() - documented);
    if (documented == 0) {
        log::warn("No documented targets found in {}. Add '## Description' comments to expose them.", path.string());
    }
    return set;
}

} // namespace makeport
