// SPDX-License-Identifier: Apache-2.0
#include <net/Compression.hpp>
#include <net/NullBackend.hpp>
#include <net/Transport.hpp>

#include "ScriptedBackend.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <future>
#include <thread>

using namespace toolmesh;
using namespace toolmesh::test;
using namespace std::chrono_literals;

namespace
{

auto makeTransport(std::shared_ptr<ScriptedBackend::State> state, TransportConfig config = fastRetryConfig())
    -> std::unique_ptr<Transport>
{
    return std::make_unique<Transport>(
        "svc", "http://svc.test:9000", std::move(config), std::make_unique<ScriptedBackend>(std::move(state)));
}

auto postEnvelope(std::string body = R"({"x":1})") -> CallEnvelope
{
    return CallEnvelope {
        .method = "POST",
        .url = "http://svc.test:9000/invoke/op",
        .headers = { { "Content-Type", "application/json" } },
        .body = std::move(body),
        .timeout = std::nullopt,
    };
}

} // namespace

TEST_CASE("Transport retries retryable statuses until success", "[transport]")
{
    auto state = std::make_shared<ScriptedBackend::State>();
    state->handler = sequence({ statusResponse(503), statusResponse(503), jsonResponse({ { "ok", true } }) });

    auto transport = makeTransport(state);
    auto response = transport->request(postEnvelope());

    REQUIRE(response.has_value());
    CHECK(response->status == 200);
    CHECK(response->isJson());
    CHECK(response->body()["ok"] == true);

    auto const stats = transport->stats();
    CHECK(stats.requestsSent == 3);
    CHECK(stats.retriedRequests == 2);
    CHECK(stats.requestsSucceeded == 1);
    CHECK(stats.requestsFailed == 0);
    CHECK(state->requestCount() == 3);
}

TEST_CASE("Transport fails immediately on a non-retryable status", "[transport]")
{
    auto state = std::make_shared<ScriptedBackend::State>();
    state->handler = sequence({ statusResponse(404) });

    auto transport = makeTransport(state);
    auto response = transport->request(postEnvelope());

    REQUIRE(!response.has_value());
    CHECK(response.error().code == ErrorCode::RequestFailed);
    CHECK(response.error().status == 404);
    CHECK(response.error().attempts == 1);
    CHECK(state->requestCount() == 1);
    CHECK(transport->stats().retriedRequests == 0);
    CHECK(transport->stats().requestsFailed == 1);
}

TEST_CASE("Transport reports exhausted retries with the last status", "[transport]")
{
    auto state = std::make_shared<ScriptedBackend::State>();
    state->handler = sequence({ statusResponse(500) });

    auto transport = makeTransport(state, fastRetryConfig(2));
    auto response = transport->request(postEnvelope());

    REQUIRE(!response.has_value());
    CHECK(response.error().code == ErrorCode::RequestFailed);
    CHECK(response.error().status == 500);
    CHECK(response.error().attempts == 3);
    CHECK(state->requestCount() == 3);
    CHECK(transport->stats().retriedRequests == 2);
}

TEST_CASE("Transport keeps the last connection error as cause", "[transport]")
{
    auto state = std::make_shared<ScriptedBackend::State>();
    state->handler = sequence({ makeError(ErrorCode::ConnectionError, "Connection refused") });

    auto transport = makeTransport(state, fastRetryConfig(1));
    auto response = transport->request(postEnvelope());

    REQUIRE(!response.has_value());
    CHECK(response.error().code == ErrorCode::RequestFailed);
    REQUIRE(response.error().cause);
    CHECK(response.error().cause->code == ErrorCode::ConnectionError);
    CHECK(response.error().rootCause().message == "Connection refused");
    CHECK(transport->stats().connectionErrors == 2);
    CHECK(transport->stats().avgLatencyMs == 0.0);
}

TEST_CASE("Transport counts backend timeouts separately", "[transport]")
{
    auto state = std::make_shared<ScriptedBackend::State>();
    state->handler = sequence({ makeError(ErrorCode::RequestTimeout, "Operation timed out"),
                                jsonResponse(nlohmann::json::object()) });

    auto transport = makeTransport(state);
    auto response = transport->request(postEnvelope());

    REQUIRE(response.has_value());
    CHECK(transport->stats().timeoutErrors == 1);
    CHECK(transport->stats().connectionErrors == 0);
}

TEST_CASE("Transport honors a caller-supplied retryable status set", "[transport]")
{
    auto state = std::make_shared<ScriptedBackend::State>();
    state->handler = sequence({ statusResponse(503), jsonResponse(nlohmann::json::object()) });

    auto transport = makeTransport(state);
    auto response = transport->request(postEnvelope(), StatusSet {});

    REQUIRE(!response.has_value());
    CHECK(response.error().status == 503);
    CHECK(state->requestCount() == 1);
}

TEST_CASE("Transport without retries sends exactly one attempt", "[transport]")
{
    auto state = std::make_shared<ScriptedBackend::State>();
    state->handler = sequence({ statusResponse(503) });

    auto config = TransportConfig {};
    config.retryStrategy = RetryStrategy::None;
    auto transport = makeTransport(state, config);

    auto response = transport->request(postEnvelope());
    REQUIRE(!response.has_value());
    CHECK(state->requestCount() == 1);
    CHECK(transport->stats().retriedRequests == 0);
}

TEST_CASE("Transport times out while sleeping in backoff", "[transport]")
{
    auto state = std::make_shared<ScriptedBackend::State>();
    state->handler = sequence({ statusResponse(503) });

    auto config = TransportConfig {};
    config.retryStrategy = RetryStrategy::Linear;
    config.retryBaseDelay = 2s;
    auto transport = makeTransport(state, config);

    auto envelope = postEnvelope();
    envelope.timeout = 100ms;

    auto const startedAt = std::chrono::steady_clock::now();
    auto response = transport->request(envelope);
    auto const elapsed = std::chrono::steady_clock::now() - startedAt;

    REQUIRE(!response.has_value());
    CHECK(response.error().code == ErrorCode::RequestTimeout);
    CHECK(response.error().status == 503);
    CHECK(elapsed < 1s);
    CHECK(state->requestCount() == 1);
}

TEST_CASE("Transport bounds each attempt by the remaining call deadline", "[transport]")
{
    auto state = std::make_shared<ScriptedBackend::State>();
    state->handler = sequence({ jsonResponse(nlohmann::json::object()) });

    auto transport = makeTransport(state);
    auto envelope = postEnvelope();
    envelope.timeout = 250ms;

    REQUIRE(transport->request(envelope).has_value());
    auto const sent = state->request(0);
    CHECK(sent.timeout <= 250ms);
    CHECK(sent.connectTimeout <= sent.timeout);

    REQUIRE(transport->request(postEnvelope()).has_value());
    CHECK(state->request(1).timeout == transport->config().requestTimeout);
}

TEST_CASE("Transport decodes JSON and raw responses", "[transport]")
{
    auto state = std::make_shared<ScriptedBackend::State>();
    auto transport = makeTransport(state);

    SECTION("json content type")
    {
        state->handler = sequence({ jsonResponse({ { "value", 42 } }) });
        auto response = transport->request(postEnvelope());
        REQUIRE(response.has_value());
        CHECK(response->isJson());
        CHECK(response->body()["value"] == 42);
    }

    SECTION("json with charset parameter")
    {
        state->handler = sequence({ WireResponse {
            .status = 200,
            .headers = { { "content-type", "Application/JSON; charset=utf-8" } },
            .body = "[1,2]",
        } });
        auto response = transport->request(postEnvelope());
        REQUIRE(response.has_value());
        CHECK(response->body().size() == 2);
    }

    SECTION("plain text stays raw")
    {
        state->handler = sequence({ WireResponse {
            .status = 200,
            .headers = { { "content-type", "text/plain" } },
            .body = "hello",
        } });
        auto response = transport->request(postEnvelope());
        REQUIRE(response.has_value());
        CHECK(!response->isJson());
        CHECK(response->rawBody == "hello");
        CHECK(response->body() == "hello");
    }

    SECTION("empty body without content type is null")
    {
        state->handler = sequence({ statusResponse(204) });
        auto response = transport->request(postEnvelope());
        REQUIRE(response.has_value());
        CHECK(response->body().is_null());
    }

    SECTION("malformed json")
    {
        state->handler = sequence({ WireResponse {
            .status = 200,
            .headers = { { "content-type", "application/json" } },
            .body = "{not json",
        } });
        auto response = transport->request(postEnvelope());
        REQUIRE(!response.has_value());
        CHECK(response.error().code == ErrorCode::InvalidResponse);
    }
}

TEST_CASE("Transport compresses bodies at or above the threshold", "[transport]")
{
    auto state = std::make_shared<ScriptedBackend::State>();
    state->handler = sequence({ jsonResponse(nlohmann::json::object()) });

    auto config = fastRetryConfig();
    config.compressionThresholdBytes = 1024;
    auto transport = makeTransport(state, config);

    auto const large = std::string(R"({"data":")") + std::string(4000, 'z') + "\"}";
    REQUIRE(transport->request(postEnvelope(large)).has_value());

    auto const sent = state->request(0);
    REQUIRE(sent.headers.contains("Content-Encoding"));
    CHECK(sent.headers.at("Content-Encoding") == "gzip");
    CHECK(sent.body.size() < large.size());

    auto inflated = gzipDecompress(sent.body);
    REQUIRE(inflated.has_value());
    CHECK(*inflated == large);

    auto const stats = transport->stats();
    CHECK(stats.compressionRatio > 1.0);
    CHECK(stats.bytesSent == sent.body.size());
}

TEST_CASE("Transport leaves small bodies uncompressed", "[transport]")
{
    auto state = std::make_shared<ScriptedBackend::State>();
    state->handler = sequence({ jsonResponse(nlohmann::json::object()) });

    auto transport = makeTransport(state);
    REQUIRE(transport->request(postEnvelope(R"({"small":true})")).has_value());

    auto const sent = state->request(0);
    CHECK(!sent.headers.contains("Content-Encoding"));
    CHECK(sent.body == R"({"small":true})");
    CHECK(transport->stats().compressionRatio == 1.0);
}

TEST_CASE("Transport never compresses when compression is disabled", "[transport]")
{
    auto state = std::make_shared<ScriptedBackend::State>();
    state->handler = sequence({ jsonResponse(nlohmann::json::object()) });

    auto config = fastRetryConfig();
    config.compressionEnabled = false;
    auto transport = makeTransport(state, config);

    auto const large = std::string(8192, 'q');
    REQUIRE(transport->request(postEnvelope(large)).has_value());
    CHECK(state->request(0).body == large);
}

TEST_CASE("Transport initialize is idempotent and tolerates DNS failures", "[transport]")
{
    auto state = std::make_shared<ScriptedBackend::State>();
    state->resolveFails = true;

    auto transport = makeTransport(state);
    REQUIRE(transport->initialize().has_value());
    REQUIRE(transport->initialize().has_value());
    CHECK(transport->isInitialized());
    CHECK(state->opened == 1);
}

TEST_CASE("Transport shutdown is idempotent and rejects later requests", "[transport]")
{
    auto state = std::make_shared<ScriptedBackend::State>();
    state->handler = sequence({ jsonResponse(nlohmann::json::object()) });

    auto transport = makeTransport(state);
    REQUIRE(transport->request(postEnvelope()).has_value());

    transport->shutdown();
    transport->shutdown();
    CHECK(transport->isClosed());
    CHECK(state->closed == 1);

    auto response = transport->request(postEnvelope());
    REQUIRE(!response.has_value());
    CHECK(response.error().code == ErrorCode::TransportClosed);

    auto initialized = transport->initialize();
    REQUIRE(!initialized.has_value());
    CHECK(initialized.error().code == ErrorCode::TransportClosed);
}

TEST_CASE("Transport shutdown waits for in-flight requests", "[transport]")
{
    auto state = std::make_shared<ScriptedBackend::State>();
    state->handler = sequence({ jsonResponse(nlohmann::json::object()) });
    state->latency = 150ms;

    auto transport = makeTransport(state);
    REQUIRE(transport->initialize().has_value());

    auto pending = std::async(std::launch::async, [&] { return transport->request(postEnvelope()); });
    while (state->requestCount() == 0)
        std::this_thread::sleep_for(1ms);

    transport->shutdown();
    CHECK(state->inFlight == 0);

    auto response = pending.get();
    CHECK(response.has_value());
}

TEST_CASE("Transport shutdown interrupts retry backoff", "[transport]")
{
    auto state = std::make_shared<ScriptedBackend::State>();
    state->handler = sequence({ statusResponse(503) });

    auto config = TransportConfig {};
    config.retryStrategy = RetryStrategy::Linear;
    config.retryBaseDelay = 5s;
    config.retryMaxDelay = 10s;
    auto transport = makeTransport(state, config);

    auto const startedAt = std::chrono::steady_clock::now();
    auto pending = std::async(std::launch::async, [&] { return transport->request(postEnvelope()); });
    while (state->requestCount() == 0)
        std::this_thread::sleep_for(1ms);
    std::this_thread::sleep_for(20ms);

    transport->shutdown();
    auto response = pending.get();

    REQUIRE(!response.has_value());
    CHECK(response.error().code == ErrorCode::TransportClosed);
    CHECK(std::chrono::steady_clock::now() - startedAt < 4s);
}

TEST_CASE("Transport statistics reset to zero", "[transport]")
{
    auto state = std::make_shared<ScriptedBackend::State>();
    state->handler = sequence({ jsonResponse({ { "a", 1 } }) });

    auto transport = makeTransport(state);
    REQUIRE(transport->request(postEnvelope()).has_value());
    CHECK(transport->stats().bytesReceived > 0);

    transport->resetStats();
    auto const stats = transport->stats();
    CHECK(stats.requestsSent == 0);
    CHECK(stats.bytesSent == 0);
    CHECK(stats.bytesReceived == 0);
    CHECK(stats.compressionRatio == 1.0);
}

TEST_CASE("Transport over NullBackend answers with an empty object", "[transport]")
{
    auto backend = std::make_unique<NullBackend>();
    auto* null = backend.get();
    auto transport = Transport("null", "http://null.invalid", TransportConfig {}, std::move(backend));

    auto response = transport.request(postEnvelope());
    REQUIRE(response.has_value());
    CHECK(response->body() == nlohmann::json::object());
    CHECK(null->requestCount() == 1);
}
