/// @file test_integration.cpp
/// End-to-end tests: RestClient over BeastTransport against the in-process
/// mock server.

#include "mock_server.hpp"
#include "rest_client.hpp"
#include "transport.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <string>
#include <vector>

using namespace rest_retry;
using rest_retry::testing::MockServer;
using rest_retry::testing::ReceivedRequest;
using rest_retry::testing::Reply;
using json = nlohmann::json;
using std::chrono::milliseconds;

class IntegrationTest : public ::testing::Test {
protected:
    NullEventSink             sink;
    BeastTransport            transport;
    std::vector<milliseconds> waits;

    /// Client whose backoff waits are recorded instead of slept.
    RestClient recordingClient() {
        return RestClient(transport, sink,
            [this](const CallContext&, milliseconds wait) {
                waits.push_back(wait);
                return true;
            });
    }

    static RequestConfig::Builder builderFor(const std::string& url) {
        return RequestConfig::Builder()
            .withMethod("GET")
            .withUrl(url)
            .withHeader("Content-Type", "application/json");
    }
};

// ============================================================================
// Immediate success
// ============================================================================

TEST_F(IntegrationTest, SuccessReturnsDecodedBodyAfterOneCall) {
    MockServer server(MockServer::always({200, R"({"message": "success"})"}));
    RestClient client = recordingClient();

    auto cfg = builderFor(server.url())
        .withMaxAttempts(3)
        .withIntervalSeconds(1)
        .withBackoffRate(2)
        .build();

    json response;
    auto outcome = client.execute(CallContext{}, cfg, json(), response);

    ASSERT_TRUE(outcome.ok()) << errorMessage(*outcome.error);
    EXPECT_EQ(outcome.status, 200);
    EXPECT_EQ(response, json({{"message", "success"}}));
    EXPECT_EQ(server.hits(), 1);
    EXPECT_TRUE(waits.empty());
}

TEST_F(IntegrationTest, ChunkedSuccessIsDecoded) {
    Reply reply{200, R"({"message": "success"})"};
    reply.chunked = true;
    MockServer server(MockServer::always(reply));
    RestClient client = recordingClient();

    auto cfg = builderFor(server.url()).withMaxAttempts(3).build();

    json response;
    auto outcome = client.execute(CallContext{}, cfg, json(), response);

    ASSERT_TRUE(outcome.ok()) << errorMessage(*outcome.error);
    EXPECT_EQ(outcome.status, 200);
    EXPECT_EQ(response, json({{"message", "success"}}));
    EXPECT_EQ(server.hits(), 1);
}

// ============================================================================
// Per-attempt timeout
// ============================================================================

TEST_F(IntegrationTest, SlowBackendWithTinyTimeoutReportsDeadlineExceeded) {
    Reply slow{200, R"({"message": "success"})"};
    slow.delay = milliseconds(100);
    MockServer server(MockServer::always(slow));
    RestClient client(transport, sink);

    auto cfg = builderFor(server.url())
        .withMaxAttempts(1)
        .withTimeout(milliseconds(1))
        .build();

    json response;
    auto outcome = client.execute(CallContext{}, cfg, json(), response);

    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.status, kInternalFailureStatus);
    EXPECT_EQ(errorKind(*outcome.error), ErrorKind::Transport);
    EXPECT_NE(errorMessage(*outcome.error).find("deadline exceeded"), std::string::npos);
    EXPECT_TRUE(response.is_null());
}

// ============================================================================
// Server keeps failing
// ============================================================================

TEST_F(IntegrationTest, PersistentServerErrorExhaustsAttemptsWithGrowingWaits) {
    MockServer server(MockServer::always({503, R"({"error": "unavailable"})"}));
    RestClient client = recordingClient();

    auto cfg = builderFor(server.url())
        .withMaxAttempts(3)
        .withIntervalSeconds(1)
        .withBackoffRate(2)
        .build();

    json response;
    auto outcome = client.execute(CallContext{}, cfg, json(), response);

    EXPECT_EQ(server.hits(), 3);
    EXPECT_EQ(waits, (std::vector<milliseconds>{milliseconds(2000), milliseconds(4000)}));
    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.status, 503);
    EXPECT_EQ(errorKind(*outcome.error), ErrorKind::RetriesExhausted);
}

TEST_F(IntegrationTest, BackoffReallySleepsBetweenAttempts) {
    MockServer server(MockServer::always({500, "{}"}));
    RestClient client(transport, sink);

    // 0.05 * 2^1 = 100 ms, then 0.05 * 2^2 = 200 ms.
    auto cfg = builderFor(server.url())
        .withMaxAttempts(3)
        .withIntervalSeconds(0.05)
        .withBackoffRate(2)
        .build();

    auto start = std::chrono::steady_clock::now();
    json response;
    auto outcome = client.execute(CallContext{}, cfg, json(), response);
    auto elapsedMs = std::chrono::duration_cast<milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    EXPECT_EQ(server.hits(), 3);
    EXPECT_EQ(outcome.totalWait, milliseconds(300));
    EXPECT_GE(elapsedMs, 290);
    EXPECT_LE(elapsedMs, 2000);
}

TEST_F(IntegrationTest, SingleAttemptNeverRetriesServerError) {
    MockServer server(MockServer::always({503, "{}"}));
    RestClient client = recordingClient();

    auto cfg = builderFor(server.url()).withMaxAttempts(1).withIntervalSeconds(1).build();

    json response;
    auto outcome = client.execute(CallContext{}, cfg, json(), response);

    EXPECT_EQ(server.hits(), 1);
    EXPECT_TRUE(waits.empty());
    EXPECT_EQ(outcome.status, 503);
}

// ============================================================================
// Recovery, round trip and idempotence
// ============================================================================

TEST_F(IntegrationTest, RecoversOnceBackendComesBack) {
    std::atomic<int> seen{0};
    MockServer server([&seen](const ReceivedRequest&) {
        if (++seen < 3) return Reply{502, R"({"error": "bad gateway"})"};
        return Reply{200, R"({"status": "ok"})"};
    });
    RestClient client = recordingClient();

    auto cfg = builderFor(server.url()).withMaxAttempts(5).withIntervalSeconds(1).withBackoffRate(2).build();

    json response;
    auto outcome = client.execute(CallContext{}, cfg, json(), response);

    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.status, 200);
    EXPECT_EQ(response["status"], "ok");
    EXPECT_EQ(server.hits(), 3);
    EXPECT_EQ(outcome.retries, 2);
    EXPECT_EQ(waits.size(), 2u);
}

TEST_F(IntegrationTest, EchoedPayloadRoundTripsIntact) {
    MockServer server([](const ReceivedRequest& req) {
        return Reply{200, req.body};
    });
    RestClient client(transport, sink);

    const json payload = {
        {"id", 42},
        {"name", "widget é"},
        {"price", 19.5},
        {"tags", {"a", "b"}},
        {"nested", {{"flag", true}, {"none", nullptr}}},
    };
    auto cfg = builderFor(server.url()).withMethod("POST").build();

    json response;
    auto outcome = client.execute(CallContext{}, cfg, payload, response);

    ASSERT_TRUE(outcome.ok()) << errorMessage(*outcome.error);
    EXPECT_EQ(response, payload);
}

TEST_F(IntegrationTest, RepeatedIdenticalCallsGiveIdenticalResults) {
    MockServer server(MockServer::always({200, R"({"message": "success", "n": [1, 2]})"}));
    RestClient client(transport, sink);
    auto cfg = builderFor(server.url()).withMaxAttempts(3).build();

    json first, second;
    auto a = client.execute(CallContext{}, cfg, json(), first);
    auto b = client.execute(CallContext{}, cfg, json(), second);

    EXPECT_EQ(a.status, 200);
    EXPECT_EQ(b.status, 200);
    EXPECT_EQ(first, second);
    EXPECT_EQ(server.hits(), 2);
}

TEST_F(IntegrationTest, NonJsonSuccessBodyIsDecodeError) {
    MockServer server(MockServer::always({200, "plain text"}));
    RestClient client(transport, sink);
    auto cfg = builderFor(server.url()).withMaxAttempts(3).build();

    json response;
    auto outcome = client.execute(CallContext{}, cfg, json(), response);

    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.status, kInternalFailureStatus);
    EXPECT_EQ(errorKind(*outcome.error), ErrorKind::Decode);
    EXPECT_EQ(server.hits(), 1);
}

TEST_F(IntegrationTest, ExpiredContextFailsEveryAttemptFast) {
    MockServer server(MockServer::always({200, "{}"}));
    RestClient client(transport, sink);
    auto cfg = builderFor(server.url()).withMaxAttempts(3).withIntervalSeconds(10).withBackoffRate(2).build();

    auto ctx = CallContext::withDeadline(std::chrono::steady_clock::now() - milliseconds(1));

    auto start = std::chrono::steady_clock::now();
    json response;
    auto outcome = client.execute(ctx, cfg, json(), response);
    auto elapsedMs = std::chrono::duration_cast<milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.attempts, 3);
    EXPECT_TRUE(std::get<TransportError>(*outcome.error).deadlineExceeded);
    EXPECT_EQ(server.hits(), 0);
    EXPECT_LT(elapsedMs, 1000);
}
