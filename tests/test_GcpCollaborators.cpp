#include <gtest/gtest.h>
#include "gcp/CloudRunServices.h"
#include "gcp/ProjectService.h"
#include "gcp/AccessTokenProvider.h"
#include "proxy/CapabilityProbe.h"
#include "TestDoubles.h"
#include <cctype>

TEST(CloudRunServicesTest, ListFollowsPagesAndShortensNames) {
    FakeGoogleApi api;
    api.responses = {
        {{"services", {{{"name", "projects/p/locations/r/services/web"}, {"uri", "https://web"}}}},
         {"nextPageToken", "n1"}},
        {{"services", {{{"name", "projects/p/locations/r/services/api"}, {"uri", "https://api"}}}}}
    };
    CloudRunServices services(api);

    auto list = services.listServices("p", "r");

    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0].name, "web");
    EXPECT_EQ(list[1].name, "api");
    EXPECT_EQ(api.requests[0].url, "https://run.googleapis.com/v2/projects/p/locations/r/services");
    EXPECT_EQ(api.requests[1].url, "https://run.googleapis.com/v2/projects/p/locations/r/services?pageToken=n1");
}

TEST(CloudRunServicesTest, GetServiceMapsNotFoundToEmpty) {
    FakeGoogleApi api;
    api.failStatus = 404;
    CloudRunServices services(api);
    EXPECT_FALSE(services.getService("p", "r", "ghost").has_value());

    api.failStatus = 500;
    EXPECT_THROW(services.getService("p", "r", "ghost"), GoogleApiError);
}

TEST(ProjectServiceTest, GeneratedIdsFollowThePattern) {
    std::string id = ProjectService::generateProjectId();
    ASSERT_EQ(id.size(), 16u);
    EXPECT_EQ(id.substr(0, 8), "mcp-cvb-");
    for (char c : id.substr(8)) {
        EXPECT_TRUE(std::islower(static_cast<unsigned char>(c)) || std::isdigit(static_cast<unsigned char>(c)));
    }
}

TEST(ProjectServiceTest, CreatesProjectAndLinksFirstBillingAccount) {
    FakeGoogleApi api;
    FakeCommandRunner runner;
    runner.results = {
        FakeCommandRunner::result(0, ""),
        FakeCommandRunner::result(0, "billingAccounts/0123-4567-89AB\nbillingAccounts/other\n"),
        FakeCommandRunner::result(0, "")
    };
    ProjectService projects(api, runner, "gcloud");

    CreatedProject created = projects.createProjectAndAttachBilling(std::string("my-proj"));

    EXPECT_EQ(created.projectId, "my-proj");
    ASSERT_EQ(runner.calls.size(), 3u);
    EXPECT_EQ(runner.calls[0].args, (std::vector<std::string>{"projects", "create", "my-proj", "--quiet"}));
    EXPECT_EQ(runner.calls[2].args.back(), "--billing-account=0123-4567-89AB");
}

TEST(ProjectServiceTest, NoBillingAccountStillCreatesProject) {
    FakeGoogleApi api;
    FakeCommandRunner runner;
    runner.results = {FakeCommandRunner::result(0, ""), FakeCommandRunner::result(0, "")};
    ProjectService projects(api, runner, "gcloud");

    CreatedProject created = projects.createProjectAndAttachBilling(std::nullopt);

    EXPECT_EQ(created.projectId.substr(0, 8), "mcp-cvb-");
    EXPECT_NE(created.billingMessage.find("manually"), std::string::npos);
    EXPECT_EQ(runner.calls.size(), 2u);
}

TEST(ProjectServiceTest, ListsActiveProjects) {
    FakeGoogleApi api;
    api.responses = {{{"projects", {{{"projectId", "p1"}, {"name", "One"}}}}}};
    FakeCommandRunner runner;
    ProjectService projects(api, runner, "gcloud");

    auto list = projects.listProjects();
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0].id, "p1");
    EXPECT_NE(api.requests[0].url.find("lifecycleState:ACTIVE"), std::string::npos);
}

TEST(AccessTokenProviderTest, CachesToken) {
    FakeCommandRunner runner;
    runner.results = {FakeCommandRunner::result(0, "ya29.token\n")};
    GcloudAccessTokenProvider tokens(runner, "gcloud");

    EXPECT_EQ(tokens.getAccessToken(), "ya29.token");
    EXPECT_EQ(tokens.getAccessToken(), "ya29.token");
    EXPECT_EQ(runner.calls.size(), 1u);
    EXPECT_TRUE(ensureGcpCredentials(tokens));
}

TEST(AccessTokenProviderTest, MissingCredentialsAreReported) {
    FakeCommandRunner runner;
    runner.results = {FakeCommandRunner::result(1, "", "ERROR: Your default credentials were not found.")};
    GcloudAccessTokenProvider tokens(runner, "gcloud");

    EXPECT_FALSE(ensureGcpCredentials(tokens));
}

TEST(CapabilityProbeTest, RequiresZeroExitAndComponentId) {
    FakeCommandRunner runner;
    runner.results = {
        FakeCommandRunner::result(0, "bq\ncloud-run-proxy\ncore\n"),
        FakeCommandRunner::result(0, "bq\ncore\n"),
        FakeCommandRunner::result(1, "cloud-run-proxy\n", "boom")
    };
    GcloudComponentProbe probe(runner, "gcloud");

    EXPECT_TRUE(probe.isInstalled("cloud-run-proxy"));
    EXPECT_FALSE(probe.isInstalled("cloud-run-proxy"));
    EXPECT_FALSE(probe.isInstalled("cloud-run-proxy"));
    EXPECT_EQ(runner.calls[0].args, (std::vector<std::string>{"components", "list", "--format=value(id)"}));
}
