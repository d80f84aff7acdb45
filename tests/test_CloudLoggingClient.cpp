#include <gtest/gtest.h>
#include "gcp/CloudLoggingClient.h"
#include "logs/LogAggregator.h"
#include "core/Errors.h"
#include "TestDoubles.h"

TEST(CloudLoggingClientTest, FormatsTextJsonAndHttpPayloads) {
    EXPECT_EQ(CloudLoggingClient::formatEntry({
        {"timestamp", "2025-01-01T00:00:00Z"}, {"severity", "INFO"}, {"textPayload", "started"}
    }), "[2025-01-01T00:00:00Z] [INFO] started");

    EXPECT_EQ(CloudLoggingClient::formatEntry({
        {"timestamp", "t"}, {"severity", "ERROR"}, {"jsonPayload", {{"message", "boom"}, {"code", 5}}}
    }), "[t] [ERROR] boom");

    EXPECT_EQ(CloudLoggingClient::formatEntry({
        {"timestamp", "t"},
        {"httpRequest", {{"requestMethod", "GET"}, {"status", 404}, {"requestUrl", "https://x/y"}}}
    }), "[t] [DEFAULT] GET 404 https://x/y");
}

TEST(CloudLoggingClientTest, FilterTargetsServiceAndRegion) {
    std::string filter = CloudLoggingClient::buildFilter("europe-west1", "svc");
    EXPECT_NE(filter.find("resource.type=\"cloud_run_revision\""), std::string::npos);
    EXPECT_NE(filter.find("resource.labels.service_name=\"svc\""), std::string::npos);
    EXPECT_NE(filter.find("resource.labels.location=\"europe-west1\""), std::string::npos);
}

TEST(CloudLoggingClientTest, FilterEscapesQuotesAndBackslashes) {
    std::string filter = CloudLoggingClient::buildFilter("europe-west1", R"(svc" OR resource.type="gce_instance)");
    EXPECT_EQ(filter,
              R"(resource.type="cloud_run_revision" AND )"
              R"(resource.labels.service_name="svc\" OR resource.type=\"gce_instance" AND )"
              R"(resource.labels.location="europe-west1")");

    EXPECT_NE(CloudLoggingClient::buildFilter(R"(a\b)", "svc").find(R"(location="a\\b")"), std::string::npos);
}

TEST(CloudLoggingClientTest, PageCarriesTokenAndJoinedEntries) {
    FakeGoogleApi api;
    api.responses = {{
        {"entries", {{{"timestamp", "t1"}, {"severity", "INFO"}, {"textPayload", "a"}},
                     {{"timestamp", "t2"}, {"severity", "INFO"}, {"textPayload", "b"}}}},
        {"nextPageToken", "next"}
    }};
    CloudLoggingClient client(api, 50);

    LogPage page = client.fetchPage("proj", "r", "svc", std::optional<std::string>("prev"));

    ASSERT_TRUE(page.logs.has_value());
    EXPECT_EQ(*page.logs, "[t1] [INFO] a\n[t2] [INFO] b");
    EXPECT_EQ(page.nextPageToken, std::optional<std::string>("next"));

    ASSERT_EQ(api.requests.size(), 1u);
    const auto& body = api.requests[0].body;
    EXPECT_EQ(api.requests[0].method, "POST");
    EXPECT_EQ(body["resourceNames"][0], "projects/proj");
    EXPECT_EQ(body["pageSize"], 50);
    EXPECT_EQ(body["pageToken"], "prev");
}

TEST(CloudLoggingClientTest, EmptyTokenEndsPagination) {
    FakeGoogleApi api;
    api.responses = {{{"nextPageToken", ""}}};
    CloudLoggingClient client(api);

    LogPage page = client.fetchPage("p", "r", "svc", std::nullopt);

    EXPECT_FALSE(page.logs.has_value());
    EXPECT_FALSE(page.nextPageToken.has_value());
    EXPECT_FALSE(api.requests[0].body.contains("pageToken"));
}

TEST(CloudLoggingClientTest, DrivesAggregatorAcrossPages) {
    FakeGoogleApi api;
    api.responses = {
        {{"entries", {{{"timestamp", "t1"}, {"textPayload", "first"}}}}, {"nextPageToken", "p2"}},
        {{"entries", {{{"timestamp", "t2"}, {"textPayload", "second"}}}}}
    };
    CloudLoggingClient client(api);
    LogAggregator aggregator(client);

    EXPECT_EQ(aggregator.fetchAllLogs("p", "r", "svc"), "[t1] [DEFAULT] first\n[t2] [DEFAULT] second");
    EXPECT_EQ(api.requests.size(), 2u);
}

TEST(CloudLoggingClientTest, ApiErrorBecomesPageFetchError) {
    FakeGoogleApi api;
    api.failStatus = 403;
    CloudLoggingClient client(api);
    LogAggregator aggregator(client);

    EXPECT_THROW(aggregator.fetchAllLogs("p", "r", "svc"), PageFetchError);
}
