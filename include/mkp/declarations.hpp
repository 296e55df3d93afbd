#pragma once

#include "mkp/domain.hpp"

#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace makeport {

/**
 * @brief Ordered collection of the declarations found in one Makefile.
 *
 * Keeps file order and a name index. A documented redefinition moves the name
 * to the position of its latest occurrence; an undocumented rule header never
 * displaces an existing entry.
 */
class DeclarationSet {
public:
    /**
     * @brief Inserts or replaces a declaration.
     * @param decl The declaration to store.
     * @return `true` if an earlier declaration with the same name was replaced.
     */
    bool upsert(Declaration &&decl);

    /**
     * @brief Records a rule header without a description.
     *
     * Does nothing if the name is already known.
     */
    void note_undocumented(std::string_view name, std::vector<std::string> dependencies);

    /**
     * @brief Records a category label, keeping first-seen order without duplicates.
     */
    void add_category(std::string_view label);

    void mark_phony(std::string_view name);

    const Declaration *find(std::string_view name) const;

    bool contains(std::string_view name) const {
        return find(name) != nullptr;
    }

    const std::vector<Declaration> &declarations() const {
        return declarations_;
    }
    const std::vector<std::string> &categories() const {
        return categories_;
    }
    size_t size() const {
        return declarations_.size();
    }
    size_t documented_count() const;
    size_t exposable_count() const;

private:
    void reindex_from(size_t first);

    std::vector<Declaration> declarations_;
    std::vector<std::string> categories_;
    std::unordered_map<std::string, size_t> index_;
    std::unordered_set<std::string> phony_;
};

} // namespace makeport
