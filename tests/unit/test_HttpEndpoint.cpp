#include <gtest/gtest.h>
#include "remote/HttpEndpoint.hpp"
#include "util/curlWrappers.hpp"
#include "support/TestEnv.hpp"

#include <fstream>

using namespace es::remote;
using namespace es::util;
using namespace es::test;
using Status = EndpointReply::Status;

namespace {

HttpResponse httpReply(const long code, std::string body = {}) {
    HttpResponse r;
    r.http = code;
    r.body = std::move(body);
    return r;
}

// Nothing listens on the discard port of the loopback interface.
es::config::RemoteConfig unreachableRemote() {
    es::config::RemoteConfig cfg;
    cfg.base_url = "http://127.0.0.1:9/";
    cfg.connect_timeout = std::chrono::seconds(2);
    cfg.initiate_timeout = std::chrono::seconds(2);
    cfg.chunk_timeout = std::chrono::seconds(2);
    cfg.complete_timeout = std::chrono::seconds(2);
    return cfg;
}

}

TEST(HttpEndpointClassify, SuccessCodes) {
    EXPECT_TRUE(HttpEndpoint::classify(httpReply(200), false).ok());
    EXPECT_TRUE(HttpEndpoint::classify(httpReply(201), true).ok());
    EXPECT_TRUE(HttpEndpoint::classify(httpReply(204), false).ok());
}

TEST(HttpEndpointClassify, TransientFailuresAreNetworkFaults) {
    HttpResponse refused;
    refused.curl = CURLE_COULDNT_CONNECT;
    EXPECT_EQ(HttpEndpoint::classify(refused, true).status, Status::NetworkError);

    for (const long code : {0L, 408L, 429L, 500L, 502L, 503L, 504L})
        EXPECT_EQ(HttpEndpoint::classify(httpReply(code), false).status, Status::NetworkError) << code;
}

TEST(HttpEndpointClassify, DigestComplaintsOnlyCountForChunks) {
    EXPECT_EQ(HttpEndpoint::classify(httpReply(422), true).status, Status::ChecksumMismatch);
    EXPECT_EQ(HttpEndpoint::classify(httpReply(400, R"({"detail":"Chunk HASH mismatch"})"), true).status,
              Status::ChecksumMismatch);
    EXPECT_EQ(HttpEndpoint::classify(httpReply(400, "checksum does not match"), true).status, Status::ChecksumMismatch);

    EXPECT_EQ(HttpEndpoint::classify(httpReply(400, "missing upload_id"), true).status, Status::Rejected);
    EXPECT_EQ(HttpEndpoint::classify(httpReply(422), false).status, Status::Rejected);
}

TEST(HttpEndpointClassify, OtherClientErrorsAreRejections) {
    for (const long code : {400L, 401L, 403L, 404L, 409L, 410L}) {
        const auto reply = HttpEndpoint::classify(httpReply(code, "nope"), false);
        EXPECT_EQ(reply.status, Status::Rejected) << code;
        EXPECT_NE(reply.message.find(std::to_string(code)), std::string::npos);
    }
}

TEST(HttpEndpoint, RejectsEmptyBaseUrl) {
    es::config::RemoteConfig cfg;
    cfg.base_url = "///";
    EXPECT_THROW(HttpEndpoint{cfg}, std::invalid_argument);
}

TEST(HttpEndpoint, TokenFileMustHoldAToken) {
    TempDir tmp;
    auto cfg = unreachableRemote();

    cfg.auth_token_file = tmp / "missing";
    EXPECT_ANY_THROW(HttpEndpoint{cfg});

    cfg.auth_token_file = tmp / "blank";
    std::ofstream(cfg.auth_token_file) << "  \n";
    EXPECT_THROW(HttpEndpoint{cfg}, std::runtime_error);

    cfg.auth_token_file = tmp / "token";
    std::ofstream(cfg.auth_token_file) << "s3cret\n";
    EXPECT_NO_THROW(HttpEndpoint{cfg});
}

TEST(HttpEndpoint, UnreachableRemoteIsANetworkFault) {
    HttpEndpoint ep(unreachableRemote());

    EXPECT_EQ(ep.initiate("SLIDE_1", 100, 1, {}).status, Status::NetworkError);
    EXPECT_EQ(ep.uploadChunk("UPL_1", 0, "abc", "900150983cd24fb0d6963f7d28e17f72").status, Status::NetworkError);
    EXPECT_EQ(ep.complete("UPL_1", "SLIDE_1").status, Status::NetworkError);

    const auto probe = ep.probe(1024, std::chrono::seconds(2));
    EXPECT_FALSE(probe.ok);
    EXPECT_EQ(probe.bytes, 0u);
    EXPECT_FALSE(probe.message.empty());
}
