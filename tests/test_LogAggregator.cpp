#include <gtest/gtest.h>
#include "logs/LogAggregator.h"
#include "core/Errors.h"
#include "TestDoubles.h"

namespace {
LogPage page(std::optional<std::string> logs, std::optional<std::string> next) {
    return {std::move(logs), std::move(next)};
}
} // namespace

TEST(LogAggregatorTest, JoinsPagesInFetchOrder) {
    FakeLogPageSource source;
    source.pages = {page("a", "t1"), page("b", std::nullopt)};
    LogAggregator aggregator(source);

    EXPECT_EQ(aggregator.fetchAllLogs("p", "r", "svc"), "a\nb");
    EXPECT_EQ(source.callCount, 2);
}

TEST(LogAggregatorTest, PassesCursorFromPreviousPage) {
    FakeLogPageSource source;
    source.pages = {page("a", "t1"), page("b", "t2"), page("c", std::nullopt)};
    LogAggregator aggregator(source);

    aggregator.fetchAllLogs("proj", "europe-west1", "svc");

    ASSERT_EQ(source.tokens.size(), 3u);
    EXPECT_FALSE(source.tokens[0].has_value());
    EXPECT_EQ(source.tokens[1], std::optional<std::string>("t1"));
    EXPECT_EQ(source.tokens[2], std::optional<std::string>("t2"));
    EXPECT_EQ(source.lastProject, "proj");
    EXPECT_EQ(source.lastRegion, "europe-west1");
    EXPECT_EQ(source.lastService, "svc");
}

TEST(LogAggregatorTest, SkipsEmptyAndMissingBlocks) {
    FakeLogPageSource source;
    source.pages = {page("a", "t1"), page(std::nullopt, "t2"), page("", "t3"), page("d", std::nullopt)};
    LogAggregator aggregator(source);

    EXPECT_EQ(aggregator.fetchAllLogs("p", "r", "svc"), "a\nd");
    EXPECT_EQ(source.callCount, 4);
}

TEST(LogAggregatorTest, SinglePageWithoutToken) {
    FakeLogPageSource source;
    source.pages = {page("only", std::nullopt)};
    LogAggregator aggregator(source);

    EXPECT_EQ(aggregator.fetchAllLogs("p", "r", "svc"), "only");
    EXPECT_EQ(source.callCount, 1);
}

TEST(LogAggregatorTest, NoLogsAtAllIsEmpty) {
    FakeLogPageSource source;
    source.pages = {page(std::nullopt, std::nullopt)};
    LogAggregator aggregator(source);

    EXPECT_EQ(aggregator.fetchAllLogs("p", "r", "svc"), "");
}

TEST(LogAggregatorTest, FailureOnLaterPageDiscardsEverything) {
    FakeLogPageSource source;
    source.pages = {page("a", "t1"), page("b", std::nullopt)};
    source.throwAt = 2;
    LogAggregator aggregator(source);

    try {
        aggregator.fetchAllLogs("p", "r", "svc");
        FAIL() << "expected PageFetchError";
    } catch (const PageFetchError& e) {
        EXPECT_EQ(std::string(e.what()), "quota exceeded");
    }
    // No retry
    EXPECT_EQ(source.callCount, 2);
}
