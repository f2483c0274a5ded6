// SPDX-License-Identifier: Apache-2.0
#include <net/RetryPolicy.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace toolmesh;
using namespace std::chrono_literals;

TEST_CASE("fibonacci starts with 1, 1", "[retry]")
{
    CHECK(fibonacci(0) == 0);
    CHECK(fibonacci(1) == 1);
    CHECK(fibonacci(2) == 1);
    CHECK(fibonacci(3) == 2);
    CHECK(fibonacci(4) == 3);
    CHECK(fibonacci(5) == 5);
    CHECK(fibonacci(10) == 55);
}

TEST_CASE("RetryPolicy base delays follow the strategy", "[retry]")
{
    SECTION("linear")
    {
        auto const policy = RetryPolicy(RetryStrategy::Linear, 5, 100ms, 10s);
        CHECK(policy.baseDelay(1).count() == Catch::Approx(100.0));
        CHECK(policy.baseDelay(2).count() == Catch::Approx(200.0));
        CHECK(policy.baseDelay(3).count() == Catch::Approx(300.0));
    }

    SECTION("exponential")
    {
        auto const policy = RetryPolicy(RetryStrategy::Exponential, 5, 100ms, 10s);
        CHECK(policy.baseDelay(1).count() == Catch::Approx(100.0));
        CHECK(policy.baseDelay(2).count() == Catch::Approx(200.0));
        CHECK(policy.baseDelay(3).count() == Catch::Approx(400.0));
        CHECK(policy.baseDelay(4).count() == Catch::Approx(800.0));
    }

    SECTION("fibonacci")
    {
        auto const policy = RetryPolicy(RetryStrategy::Fibonacci, 5, 100ms, 10s);
        CHECK(policy.baseDelay(1).count() == Catch::Approx(100.0));
        CHECK(policy.baseDelay(2).count() == Catch::Approx(100.0));
        CHECK(policy.baseDelay(3).count() == Catch::Approx(200.0));
        CHECK(policy.baseDelay(4).count() == Catch::Approx(300.0));
        CHECK(policy.baseDelay(5).count() == Catch::Approx(500.0));
    }

    SECTION("none")
    {
        auto const policy = RetryPolicy(RetryStrategy::None, 5, 100ms, 10s);
        CHECK(policy.baseDelay(1).count() == 0.0);
    }
}

TEST_CASE("RetryPolicy applies jitter within 0.8 to 1.2", "[retry]")
{
    auto const policy = RetryPolicy(RetryStrategy::Exponential, 3, 100ms, 10s);

    CHECK(policy.delayWithJitter(2, 0.8).count() == Catch::Approx(160.0));
    CHECK(policy.delayWithJitter(2, 1.2).count() == Catch::Approx(240.0));

    // Out-of-range factors are clamped
    CHECK(policy.delayWithJitter(2, 0.1).count() == Catch::Approx(160.0));
    CHECK(policy.delayWithJitter(2, 5.0).count() == Catch::Approx(240.0));

    for (auto i = 0; i < 200; ++i)
    {
        auto const delay = policy.delay(3).count();
        CHECK(delay >= 320.0);
        CHECK(delay <= 480.0);
    }
}

TEST_CASE("RetryPolicy caps delays at the maximum", "[retry]")
{
    auto const policy = RetryPolicy(RetryStrategy::Exponential, 20, 100ms, 1s);
    CHECK(policy.delayWithJitter(10, 1.2).count() == Catch::Approx(1000.0));
    CHECK(policy.delay(15).count() <= 1000.0);
}

TEST_CASE("RetryPolicy attempts include the first one", "[retry]")
{
    CHECK(RetryPolicy(RetryStrategy::Exponential, 3, 100ms, 10s).maxAttempts() == 4);
    CHECK(RetryPolicy(RetryStrategy::Linear, 0, 100ms, 10s).maxAttempts() == 1);
    CHECK(RetryPolicy(RetryStrategy::None, 5, 100ms, 10s).maxAttempts() == 1);
    CHECK(RetryPolicy(RetryStrategy::Linear, -2, 100ms, 10s).maxAttempts() == 1);
}

TEST_CASE("RetryPolicy reads its settings from a TransportConfig", "[retry]")
{
    auto config = TransportConfig {};
    config.retryStrategy = RetryStrategy::Fibonacci;
    config.maxRetries = 6;
    config.retryBaseDelay = 50ms;

    auto const policy = RetryPolicy(config);
    CHECK(policy.strategy() == RetryStrategy::Fibonacci);
    CHECK(policy.maxAttempts() == 7);
    CHECK(policy.baseDelay(6).count() == Catch::Approx(400.0));
}

TEST_CASE("retryStrategyFromString parses names", "[retry]")
{
    CHECK(retryStrategyFromString("none") == RetryStrategy::None);
    CHECK(retryStrategyFromString("linear") == RetryStrategy::Linear);
    CHECK(retryStrategyFromString("fibonacci") == RetryStrategy::Fibonacci);
    CHECK(retryStrategyFromString("exponential") == RetryStrategy::Exponential);
    CHECK(retryStrategyFromString("bogus") == RetryStrategy::Exponential);
    CHECK(retryStrategyName(RetryStrategy::Linear) == "linear");
}
