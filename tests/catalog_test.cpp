#include <gtest/gtest.h>

#include "mkp/catalog.hpp"
#include "mkp/parser.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace makeport;

namespace {

constexpr const char *MIXED = "test: ## Run tests\n"
                              "clean: ## Clean build artifacts\n"
                              "internal-helper:\n"
                              "deploy-dangerous: ## @internal Deploy without safety checks\n"
                              "cleanup-prod: ## @skip Clean production database\n"
                              "deploy: test ## Deploy to production\n";

std::vector<std::string> names(const std::vector<const Declaration *> &decls) {
    std::vector<std::string> out;
    for (const Declaration *decl : decls)
        out.push_back(decl->name);
    return out;
}

} // namespace

TEST(Catalog, DefaultPolicyExposesEveryPublicDocumentedTarget) {
    Catalog catalog(parse(MIXED));

    EXPECT_EQ(names(catalog.exposed()), (std::vector<std::string>{"test", "clean", "deploy"}));
    EXPECT_TRUE(catalog.is_allowed("test"));
    EXPECT_TRUE(catalog.is_allowed("deploy"));
    EXPECT_FALSE(catalog.is_allowed("deploy-dangerous"));
    EXPECT_FALSE(catalog.is_allowed("cleanup-prod"));
    EXPECT_FALSE(catalog.is_allowed("internal-helper"));
    EXPECT_FALSE(catalog.is_allowed("missing"));
}

TEST(Catalog, AuthorizeDistinguishesMissingFromFiltered) {
    Catalog catalog(parse(MIXED), {"test"});

    EXPECT_EQ(catalog.authorize("test"), Access::allowed);
    EXPECT_EQ(catalog.authorize("clean"), Access::not_allowed);
    EXPECT_EQ(catalog.authorize("deploy-dangerous"), Access::not_allowed);
    EXPECT_EQ(catalog.authorize("internal-helper"), Access::not_allowed);
    EXPECT_EQ(catalog.authorize("nope"), Access::not_found);
}

TEST(Catalog, AllowListCannotExposeHiddenTargets) {
    Catalog catalog(parse(MIXED), {"deploy-dangerous", "internal-helper", "deploy"});

    EXPECT_EQ(names(catalog.exposed()), (std::vector<std::string>{"deploy"}));
    EXPECT_FALSE(catalog.is_allowed("deploy-dangerous"));
    EXPECT_FALSE(catalog.is_allowed("internal-helper"));
    EXPECT_TRUE(catalog.is_allowed("deploy"));
}

TEST(Catalog, IsAllowedMatchesPolicyForEveryCombination) {
    const DeclarationSet set = parse(MIXED);
    const std::vector<AllowList> policies = {{}, {"test"}, {"test", "cleanup-prod"}, {"internal-helper"}};
    const std::vector<std::string> candidates = {
        "test", "clean", "internal-helper", "deploy-dangerous", "cleanup-prod", "deploy", "absent"};

    for (const auto &policy : policies) {
        Catalog catalog(set, policy);
        for (const auto &name : candidates) {
            const Declaration *decl = set.find(name);
            bool listed = policy.empty() || std::ranges::find(policy, name) != policy.end();
            bool expected = decl && decl->exposable() && listed;
            EXPECT_EQ(catalog.is_allowed(name), expected) << name;
        }
    }
}

TEST(Catalog, ListGroupsByFirstSeenCategoryWithUncategorizedLast) {
    Catalog catalog(parse("loose: ## No category\n"
                          "## Category: Testing\n"
                          "test: ## Run tests\n"
                          "## Category: Empty\n"
                          "hidden: ## @skip nothing public here\n"
                          "## Category: Building\n"
                          "build: ## Build\n"
                          "## Category: Testing\n"
                          "lint: ## Lint\n"));

    auto groups = catalog.list();
    ASSERT_EQ(groups.size(), 3u);
    EXPECT_EQ(groups[0].category, "Testing");
    EXPECT_EQ(names(groups[0].entries), (std::vector<std::string>{"test", "lint"}));
    EXPECT_EQ(groups[1].category, "Building");
    EXPECT_EQ(names(groups[1].entries), (std::vector<std::string>{"build"}));
    EXPECT_FALSE(groups[2].category.has_value());
    EXPECT_EQ(names(groups[2].entries), (std::vector<std::string>{"loose"}));
}

TEST(Catalog, HiddenListsInternalAndSkip) {
    Catalog catalog(parse(MIXED));
    EXPECT_EQ(names(catalog.hidden()), (std::vector<std::string>{"deploy-dangerous", "cleanup-prod"}));
}

TEST(Catalog, CheckAllowListRejectsUnknownNames) {
    Catalog catalog(parse(MIXED), {"test", "ghost"});
    auto res = catalog.check_allow_list();
    ASSERT_FALSE(res);
    EXPECT_NE(res.error().find("ghost"), std::string::npos);
    EXPECT_NE(res.error().find("Available targets"), std::string::npos);
}

TEST(Catalog, CheckAllowListAcceptsHiddenNamesWithWarning) {
    Catalog catalog(parse(MIXED), {"deploy-dangerous"});
    EXPECT_TRUE(catalog.check_allow_list());
    EXPECT_TRUE(catalog.exposed().empty());
}

TEST(Catalog, InternalScenarioExposesNothing) {
    Catalog catalog(parse("deploy-dangerous: ## @internal Deploy without checks\n"));
    EXPECT_TRUE(catalog.exposed().empty());
    EXPECT_TRUE(catalog.list().empty());
    EXPECT_EQ(catalog.authorize("deploy-dangerous"), Access::not_allowed);
}

TEST(Catalog, NamesOutsideIdentifierPatternResolveAsNotFound) {
    Catalog catalog(parse("build.docs: ## Build docs\n2fa-setup: ## Set up 2FA\nall: ## Everything\n"));

    EXPECT_EQ(catalog.authorize("build.docs"), Access::not_found);
    EXPECT_EQ(catalog.authorize("2fa-setup"), Access::not_found);
    EXPECT_EQ(catalog.authorize("all"), Access::allowed);
}
