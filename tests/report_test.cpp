#include <gtest/gtest.h>

#include "mkp/catalog.hpp"
#include "mkp/parser.hpp"
#include "mkp/report.hpp"

#include <string>

using namespace makeport;

TEST(Report, DescribeAddsCategoryAndDependencies) {
    auto set = parse("## Category: Release\ndeploy: test build ## Deploy to production\nplain: ## Plain\n");
    EXPECT_EQ(describe(*set.find("deploy")), "[Release] Deploy to production (depends on: test, build)");
    EXPECT_EQ(describe(*set.find("plain")), "[Release] Plain");
}

TEST(Report, CatalogJsonFollowsListing) {
    Catalog catalog(parse("loose: ## Loose\n## Category: Testing\ntest: ## Run tests\n"));
    auto j = catalog_json(catalog);

    ASSERT_EQ(j["groups"].size(), 2u);
    EXPECT_EQ(j["groups"][0]["category"], "Testing");
    EXPECT_EQ(j["groups"][0]["targets"][0]["name"], "test");
    EXPECT_EQ(j["groups"][0]["targets"][0]["visibility"], "public");
    EXPECT_TRUE(j["groups"][1]["category"].is_null());
    EXPECT_EQ(j["groups"][1]["targets"][0]["description"], "Loose");
}

TEST(Report, RejectedResultsNeverLookExecuted) {
    ExecutionResult result;
    result.target = "deploy-dangerous";
    result.status = ExecutionStatus::not_allowed;
    result.raw_output = "Cannot execute target 'deploy-dangerous'";
    ProcessedOutput output{.text = result.raw_output, .artifact = {}, .truncated = false, .original_length = 0};

    std::string text = render_result(result, output);
    EXPECT_TRUE(text.starts_with("Error: "));
    EXPECT_EQ(text.find("Exit Code"), std::string::npos);
    EXPECT_EQ(text.find("Duration"), std::string::npos);

    auto j = result_json(result, output);
    EXPECT_EQ(j["status"], "not_allowed");
    EXPECT_TRUE(j["exit_code"].is_null());
}

TEST(Report, CompletedResultShowsExitCodeAndOutput) {
    ExecutionResult result;
    result.target = "test";
    result.status = ExecutionStatus::succeeded;
    result.exit_code = 0;
    result.raw_output = "ok\n";
    result.duration = std::chrono::milliseconds(1500);
    ProcessedOutput output{.text = "ok\n", .artifact = {}, .truncated = false, .original_length = 3};

    std::string text = render_result(result, output);
    EXPECT_NE(text.find("Target: test\n"), std::string::npos);
    EXPECT_NE(text.find("Status: succeeded\n"), std::string::npos);
    EXPECT_NE(text.find("Exit Code: 0\n"), std::string::npos);
    EXPECT_NE(text.find("Duration: 1.50s\n"), std::string::npos);
    EXPECT_TRUE(text.ends_with("\nok\n"));

    auto j = result_json(result, output);
    EXPECT_EQ(j["exit_code"], 0);
    EXPECT_EQ(j["output"], "ok\n");
    EXPECT_DOUBLE_EQ(j["duration"].get<double>(), 1.5);
}

TEST(Report, PreviewListsExposedAndHidden) {
    Catalog catalog(parse("## Category: Testing\ntest: ## Run tests\nsecret: test ## @internal Hidden thing\n"));
    std::string text = render_preview(catalog, "Makefile");

    EXPECT_NE(text.find("Exposed: 1"), std::string::npos);
    EXPECT_NE(text.find("Internal (hidden): 1"), std::string::npos);
    EXPECT_NE(text.find("Testing"), std::string::npos);
    EXPECT_NE(text.find("secret - [Testing] Hidden thing (depends on: test)"), std::string::npos);
}
