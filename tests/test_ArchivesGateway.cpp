#include <gtest/gtest.h>
#include "services/archives/ArchivesGateway.hpp"

using namespace ssd;

TEST(ArchivesGatewayTest, RefFromJsonId) {
    EXPECT_EQ(gatewayRefFromResponse(200, R"({"id": 1234})"), "1234");
    EXPECT_EQ(gatewayRefFromResponse(200, R"({"task_id": "abc-1"})"), "abc-1");
    EXPECT_EQ(gatewayRefFromResponse(201, R"({"status": "ok", "edit_id": 9})"), "9");
}

TEST(ArchivesGatewayTest, RefFallsBackToStatus) {
    EXPECT_EQ(gatewayRefFromResponse(200, ""), "HTTP 200");
    EXPECT_EQ(gatewayRefFromResponse(202, "queued"), "HTTP 202");
    EXPECT_EQ(gatewayRefFromResponse(200, "[1, 2]"), "HTTP 200");
    EXPECT_EQ(gatewayRefFromResponse(200, R"({"id": null})"), "HTTP 200");
}

TEST(ArchivesGatewayTest, BareHostDefaultsToHttps) {
    ArchivesGateway gw({"archives.example.edu", "u", "p"});
    EXPECT_EQ(gw.baseUrl(), "https://archives.example.edu");
}

TEST(ArchivesGatewayTest, KeepsSchemeAndPort) {
    ArchivesGateway gw({"http://localhost:8080", "u", "p"});
    EXPECT_EQ(gw.baseUrl(), "http://localhost:8080");
}

TEST(ArchivesGatewayTest, PathComponentIsNotPartOfBaseUrl) {
    ArchivesGateway gw({"https://intranet.example.edu/archives/", "u", "p"});
    EXPECT_EQ(gw.baseUrl(), "https://intranet.example.edu");
}

TEST(ArchivesGatewayTest, UnreachableServerIsAFailureNotAnException) {
    ArchivesAppConfig cfg{"http://127.0.0.1:1", "u", "p"};
    cfg.timeoutSeconds = 1;
    ArchivesGateway gw(cfg);
    const DeletionResult r = gw.requestDeletion(1, "/mnt/records/A/f.pdf");
    EXPECT_FALSE(r.success);
    EXPECT_FALSE(r.error_message.empty());
    EXPECT_TRUE(r.gateway_ref.empty());
}
