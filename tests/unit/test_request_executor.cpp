/*
 * Unit tests for the request executor
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <catch2/catch_test_macros.hpp>
#include "RequestExecutor.hpp"
#include "TestHelpers.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

namespace {

HttpRequest sample_request()
{
    HttpRequest request;
    request.url = "https://api.example.test/v1/chat";
    request.body = "{}";
    return request;
}

} // namespace

// =============================================================================
// Timeout presets
// =============================================================================

TEST_CASE("TimeoutPolicy selects the extended budget for large payloads") {
    REQUIRE(TimeoutPolicy::for_payload(100).overall_timeout == TimeoutPolicy::standard().overall_timeout);
    REQUIRE(TimeoutPolicy::for_payload(10001).overall_timeout == std::chrono::seconds(500));
    REQUIRE(TimeoutPolicy::for_payload(10001).connect_timeout == std::chrono::seconds(500));
    REQUIRE(TimeoutPolicy::with_tools().overall_timeout == std::chrono::seconds(180));
}

// =============================================================================
// Retry behaviour
// =============================================================================

TEST_CASE("RequestExecutor rejects a missing transport") {
    REQUIRE_THROWS_AS(RequestExecutor(nullptr), std::invalid_argument);
}

TEST_CASE("RequestExecutor returns success without retrying") {
    auto transport = std::make_shared<FakeTransport>();
    transport->push_json(200, "ok");
    RequestExecutor executor(transport, fast_retries());

    auto outcome = executor.execute(sample_request(), TimeoutPolicy::standard(), CancellationToken());

    REQUIRE(outcome.kind == OutcomeKind::Success);
    REQUIRE(outcome.body == "ok");
    REQUIRE(transport->calls() == 1);
}

TEST_CASE("RequestExecutor retries connection failures up to the limit") {
    auto transport = std::make_shared<FakeTransport>();
    transport->push(RequestOutcome::connection_error("reset"));
    transport->push(RequestOutcome::connection_error("reset"));
    transport->push_json(200, "finally");
    RequestExecutor executor(transport, fast_retries(2));

    auto outcome = executor.execute(sample_request(), TimeoutPolicy::standard(), CancellationToken());

    REQUIRE(outcome.kind == OutcomeKind::Success);
    REQUIRE(outcome.body == "finally");
    REQUIRE(transport->calls() == 3);
}

TEST_CASE("RequestExecutor surfaces the connection error after exhausting retries") {
    auto transport = std::make_shared<FakeTransport>();
    for (int i = 0; i < 5; ++i) {
        transport->push(RequestOutcome::connection_error("Could not resolve host"));
    }
    RequestExecutor executor(transport, fast_retries(2));

    auto outcome = executor.execute(sample_request(), TimeoutPolicy::standard(), CancellationToken());

    REQUIRE(outcome.kind == OutcomeKind::ConnectionError);
    REQUIRE(outcome.detail == "Could not resolve host");
    REQUIRE(transport->calls() == 3);
}

TEST_CASE("RequestExecutor never retries HTTP errors") {
    auto transport = std::make_shared<FakeTransport>();
    transport->push_json(429, R"({"error":{"message":"rate limited"}})");
    transport->push_json(200, "should not be used");
    RequestExecutor executor(transport, fast_retries(2));

    auto outcome = executor.execute(sample_request(), TimeoutPolicy::standard(), CancellationToken());

    REQUIRE(outcome.kind == OutcomeKind::HttpError);
    REQUIRE(outcome.status_code == 429);
    REQUIRE(transport->calls() == 1);
}

TEST_CASE("RequestExecutor does not retry once streamed data was delivered") {
    auto transport = std::make_shared<FakeTransport>();
    FakeTransport::Reply reply;
    reply.outcome = RequestOutcome::connection_error("connection reset mid-stream");
    reply.stream_chunks = {"data: partial\n\n"};
    transport->push(reply);
    transport->push_json(200, "retry");
    RequestExecutor executor(transport, fast_retries(2));

    std::string received;
    auto outcome = executor.execute(sample_request(), TimeoutPolicy::standard(), CancellationToken(),
                                    [&received](const char* data, std::size_t length) {
                                        received.append(data, length);
                                    });

    REQUIRE(outcome.kind == OutcomeKind::ConnectionError);
    REQUIRE(received == "data: partial\n\n");
    REQUIRE(transport->calls() == 1);
}

// =============================================================================
// Cancellation
// =============================================================================

TEST_CASE("RequestExecutor returns Cancelled when cancelled before dispatch") {
    auto transport = std::make_shared<FakeTransport>();
    transport->push_json(200, "ok");
    RequestExecutor executor(transport, fast_retries());
    CancellationToken cancel;
    cancel.cancel();

    auto outcome = executor.execute(sample_request(), TimeoutPolicy::standard(), cancel);

    REQUIRE(outcome.kind == OutcomeKind::Cancelled);
    REQUIRE(transport->calls() == 0);
}

TEST_CASE("RequestExecutor cancellation interrupts the retry delay") {
    auto transport = std::make_shared<FakeTransport>();
    transport->push(RequestOutcome::connection_error("down"));
    transport->push_json(200, "ok");
    RetryPolicy slow;
    slow.max_retries = 2;
    slow.retry_delay = std::chrono::seconds(30);
    RequestExecutor executor(transport, slow);
    CancellationToken cancel;

    std::thread canceller([cancel]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        cancel.cancel();
    });
    const auto started = std::chrono::steady_clock::now();
    auto outcome = executor.execute(sample_request(), TimeoutPolicy::standard(), cancel);
    const auto elapsed = std::chrono::steady_clock::now() - started;
    canceller.join();

    REQUIRE(outcome.kind == OutcomeKind::Cancelled);
    REQUIRE(elapsed < std::chrono::seconds(5));
    REQUIRE(transport->calls() == 1);
}

TEST_CASE("RequestExecutor cancellation interrupts an in-flight transport call") {
    auto transport = std::make_shared<FakeTransport>();
    FakeTransport::Reply hang;
    hang.hang_until_cancelled = true;
    transport->push(hang);
    RequestExecutor executor(transport, fast_retries());
    CancellationToken cancel;

    std::thread canceller([cancel]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        cancel.cancel();
    });
    auto outcome = executor.execute(sample_request(), TimeoutPolicy::standard(), cancel);
    canceller.join();

    REQUIRE(outcome.kind == OutcomeKind::Cancelled);
}
