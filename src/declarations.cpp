#include "mkp/declarations.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace makeport {

std::string_view to_string(Visibility v) {
    switch (v) {
    case Visibility::public_:
        return "public";
    case Visibility::internal:
        return "internal";
    case Visibility::skip:
        return "skip";
    }
    return "unknown";
}

std::string_view to_string(ExecutionStatus s) {
    switch (s) {
    case ExecutionStatus::succeeded:
        return "succeeded";
    case ExecutionStatus::failed:
        return "failed";
    case ExecutionStatus::timed_out:
        return "timed_out";
    case ExecutionStatus::not_found:
        return "not_found";
    case ExecutionStatus::not_allowed:
        return "not_allowed";
    }
    return "unknown";
}

void DeclarationSet::reindex_from(size_t first) {
    for (size_t i = first; i < declarations_.size(); ++i) {
        index_[declarations_[i].name] = i;
    }
}

bool DeclarationSet::upsert(Declaration &&decl) {
    decl.phony = decl.phony || phony_.contains(decl.name);

    bool replaced = false;
    if (auto it = index_.find(decl.name); it != index_.end()) {
        size_t pos = it->second;
        declarations_.erase(declarations_.begin() + static_cast<std::ptrdiff_t>(pos));
        index_.erase(it);
        reindex_from(pos);
        replaced = true;
    }

    index_.emplace(decl.name, declarations_.size());
    declarations_.push_back(std::move(decl));
    return replaced;
}

void DeclarationSet::note_undocumented(std::string_view name, std::vector<std::string> dependencies) {
    if (index_.contains(std::string(name)))
        return;

    Declaration decl;
    decl.name = std::string(name);
    decl.dependencies = std::move(dependencies);
    upsert(std::move(decl));
}

void DeclarationSet::add_category(std::string_view label) {
    if (std::ranges::find(categories_, label) == categories_.end()) {
        categories_.emplace_back(label);
    }
}

void DeclarationSet::mark_phony(std::string_view name) {
    phony_.emplace(name);
    if (auto it = index_.find(std::string(name)); it != index_.end()) {
        declarations_[it->second].phony = true;
    }
}

const Declaration *DeclarationSet::find(std::string_view name) const {
    if (auto it = index_.find(std::string(name)); it != index_.end()) {
        return &declarations_[it->second];
    }
    return nullptr;
}

size_t DeclarationSet::documented_count() const {
    return static_cast<size_t>(std::ranges::count_if(declarations_, &Declaration::documented));
}

size_t DeclarationSet::exposable_count() const {
    return static_cast<size_t>(std::ranges::count_if(declarations_, &Declaration::exposable));
}

} // namespace makeport
