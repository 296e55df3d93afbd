#pragma once

#include "mkp/declarations.hpp"
#include "mkp/domain.hpp"
#include "mkp/utility.hpp"

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace makeport {

/// Ordered set of target names; empty means every public target is allowed.
using AllowList = std::vector<std::string>;

enum class Access { allowed, not_found, not_allowed };

/**
 * @brief Policy-filtered view of one parsed Makefile.
 *
 * Immutable after construction and safe to share between concurrent
 * executions.
 */
class Catalog {
public:
    struct Group {
        std::optional<std::string> category; ///< `std::nullopt` for the trailing uncategorized group.
        std::vector<const Declaration *> entries;
    };

    Catalog(DeclarationSet declarations, AllowList allow_list = {});

    /**
     * @brief Decides whether `name` may be executed.
     * @return `not_found` if no rule of that name was parsed at all,
     *         `not_allowed` if it exists but is undocumented, hidden or outside the allow-list.
     */
    Access authorize(std::string_view name) const;

    bool is_allowed(std::string_view name) const {
        return authorize(name) == Access::allowed;
    }

    /**
     * @brief Exposed declarations grouped by category in first-seen order.
     *
     * Uncategorized entries form a final group. Empty groups are omitted.
     */
    std::vector<Group> list() const;

    /// Every exposed declaration in file order.
    std::vector<const Declaration *> exposed() const;

    /// Documented declarations tagged `@internal` or `@skip`.
    std::vector<const Declaration *> hidden() const;

    /**
     * @brief Validates the allow-list against the parsed declarations.
     *
     * Fails if a listed name is not declared at all. Warns about listed
     * internal targets and about a policy that exposes nothing.
     */
    Result<void> check_allow_list() const;

    const DeclarationSet &declarations() const {
        return declarations_;
    }
    const AllowList &allow_list() const {
        return allow_list_;
    }

private:
    bool permitted_by_list(std::string_view name) const;

    DeclarationSet declarations_;
    AllowList allow_list_;
    std::set<std::string, std::less<>> allowed_;
};

} // namespace makeport
