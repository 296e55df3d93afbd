#include "mkp/catalog.hpp"

#include "mkp/log.hpp"

#include <algorithm>
#include <format>
#include <string>
#include <utility>

namespace makeport {

namespace {

std::string join(const std::vector<std::string> &names) {
    std::string out;
    for (const auto &name : names) {
        if (!out.empty())
            out += ", ";
        out += name;
    }
    return out;
}

} // namespace

Catalog::Catalog(DeclarationSet declarations, AllowList allow_list)
    : declarations_(std::move(declarations)), allow_list_(std::move(allow_list)),
      allowed_(allow_list_.begin(), allow_list_.end()) {
}

bool Catalog::permitted_by_list(std::string_view name) const {
    return allowed_.empty() || allowed_.contains(name);
}

Access Catalog::authorize(std::string_view name) const {
    const Declaration *decl = declarations_.find(name);
    if (!decl)
        return Access::not_found;
    if (!decl->exposable() || !permitted_by_list(name))
        return Access::not_allowed;
    return Access::allowed;
}

std::vector<const Declaration *> Catalog::exposed() const {
    std::vector<const Declaration *> out;
    for (const auto &decl : declarations_.declarations()) {
        if (decl.exposable() && permitted_by_list(decl.name))
            out.push_back(&decl);
    }
    return out;
}

std::vector<const Declaration *> Catalog::hidden() const {
    std::vector<const Declaration *> out;
    for (const auto &decl : declarations_.declarations()) {
        if (decl.documented() && decl.visibility != Visibility::public_)
            out.push_back(&decl);
    }
    return out;
}

std::vector<Catalog::Group> Catalog::list() const {
    std::vector<Group> groups;
    for (const auto &label : declarations_.categories()) {
        groups.push_back({label, {}});
    }
    Group uncategorized{std::nullopt, {}};

    for (const Declaration *decl : exposed()) {
        if (!decl->category) {
            uncategorized.entries.push_back(decl);
            continue;
        }
        auto it = std::ranges::find_if(groups, [&](const Group &g) { return g.category == decl->category; });
        if (it == groups.end()) {
            groups.push_back({decl->category, {decl}});
        } else {
            it->entries.push_back(decl);
        }
    }

    std::erase_if(groups, [](const Group &g) { return g.entries.empty(); });
    if (!uncategorized.entries.empty())
        groups.push_back(std::move(uncategorized));
    return groups;
}

Result<void> Catalog::check_allow_list() const {
    if (allow_list_.empty()) {
        if (declarations_.exposable_count() == 0)
            log::warn("No exposed targets found. Add '## Description' comments to targets to expose them.");
        return {};
    }

    log::info("Allowed targets filter: {} targets", allowed_.size());

    std::vector<std::string> missing;
    std::vector<std::string> hidden_listed;
    for (const auto &name : allowed_) {
        const Declaration *decl = declarations_.find(name);
        if (!decl)
            missing.push_back(name);
        else if (decl->documented() && decl->visibility != Visibility::public_)
            hidden_listed.push_back(name);
    }

    if (!missing.empty()) {
        std::vector<std::string> available;
        for (const auto &decl : declarations_.declarations())
            available.push_back(decl.name);
        std::ranges::sort(available);
        return std::unexpected(std::format(
            "Allowed targets not found in Makefile: {}. Available targets: {}", join(missing), join(available)));
    }

    if (!hidden_listed.empty()) {
        log::warn("Allowed targets includes internal targets (marked @internal/@skip): {}. These will not be exposed.",
                  join(hidden_listed));
    }
    if (exposed().empty()) {
        log::warn("No targets will be exposed after applying the allowed targets filter: {}", join(allow_list_));
    }
    return {};
}

} // namespace makeport
