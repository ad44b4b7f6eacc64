/*
 * Unit tests for the curl subprocess transport
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <catch2/catch_test_macros.hpp>
#include "ProcessTransport.hpp"
#include "TestHelpers.hpp"

#include <algorithm>
#include <thread>

using namespace std::chrono_literals;

namespace {

HttpRequest sample_request()
{
    HttpRequest request;
    request.url = "https://api.example.com/v1/chat/completions";
    request.body = R"({"model":"m","messages":[{"role":"user","content":"hi"}]})";
    request.set_header("Content-Type", "application/json");
    request.set_header("Authorization", "Bearer sk-process-secret");
    return request;
}

ProcessTransport make_transport(const std::filesystem::path& script, const TempDir& scratch)
{
    ProcessTransport::Options options;
    options.curl_executable = script.string();
    options.temp_dir = scratch.path();
    options.poll_interval = 10ms;
    return ProcessTransport(options);
}

} // namespace

// =============================================================================
// Argument construction
// =============================================================================

TEST_CASE("ProcessTransport passes headers and body through files") {
    ProcessTransport transport;
    auto args = transport.build_arguments(sample_request(), TimeoutPolicy::standard(),
                                          "/tmp/h", "/tmp/b", "/tmp/r");

    REQUIRE(args.front() == "curl");
    REQUIRE(args.back() == "https://api.example.com/v1/chat/completions");
    REQUIRE(std::find(args.begin(), args.end(), "@/tmp/h") != args.end());
    REQUIRE(std::find(args.begin(), args.end(), "@/tmp/b") != args.end());
    REQUIRE(std::find(args.begin(), args.end(), "30.000") != args.end());
    REQUIRE(std::find(args.begin(), args.end(), "90.000") != args.end());
    REQUIRE(std::find(args.begin(), args.end(), "-k") == args.end());

    for (const auto& arg : args) {
        REQUIRE(arg.find("sk-process-secret") == std::string::npos);
    }
}

TEST_CASE("ProcessTransport adds -k when TLS verification is disabled") {
    ProcessTransport::Options options;
    options.verify_tls = false;
    ProcessTransport transport(options);

    auto args = transport.build_arguments(sample_request(), TimeoutPolicy::extended(), "h", "b", "r");

    REQUIRE(std::find(args.begin(), args.end(), "-k") != args.end());
    REQUIRE(std::find(args.begin(), args.end(), "500.000") != args.end());
}

// =============================================================================
// Running the child process
// =============================================================================

TEST_CASE("ProcessTransport returns the response body and cleans up temp files") {
    TempDir script_dir;
    TempDir scratch;
    auto script = write_fake_curl(script_dir.path(), R"({"choices":[{"message":{"content":"4"}}]})", 200);
    auto transport = make_transport(script, scratch);

    std::string streamed;
    auto outcome = transport.send(sample_request(), TimeoutPolicy::standard(), CancellationToken(),
                                  [&](const char* data, std::size_t length) { streamed.append(data, length); });

    REQUIRE(outcome.kind == OutcomeKind::Success);
    REQUIRE(outcome.status_code == 200);
    REQUIRE(outcome.body == R"({"choices":[{"message":{"content":"4"}}]})");
    REQUIRE(streamed == outcome.body);
    REQUIRE(scratch.file_count() == 0);

    SECTION("the body file carries the request body") {
        REQUIRE(read_file(script_dir.path() / "body.txt") == sample_request().body);
    }

    SECTION("credentials travel in the header file, never on the command line") {
        REQUIRE(read_file(script_dir.path() / "headers.txt").find("Authorization: Bearer sk-process-secret")
                != std::string::npos);
        REQUIRE(read_file(script_dir.path() / "args.txt").find("sk-process-secret") == std::string::npos);
    }
}

TEST_CASE("ProcessTransport reports HTTP error statuses") {
    TempDir script_dir;
    TempDir scratch;
    auto script = write_fake_curl(script_dir.path(), R"({"error":{"message":"rate limited"}})", 429);
    auto transport = make_transport(script, scratch);

    auto outcome = transport.send(sample_request(), TimeoutPolicy::standard(), CancellationToken());

    REQUIRE(outcome.kind == OutcomeKind::HttpError);
    REQUIRE(outcome.status_code == 429);
    REQUIRE(outcome.body.find("rate limited") != std::string::npos);
    REQUIRE(scratch.file_count() == 0);
}

TEST_CASE("ProcessTransport maps curl exit codes to connection errors") {
    TempDir script_dir;
    TempDir scratch;
    auto script = write_fake_curl(script_dir.path(), "", 0, 7,
                                  "curl: (7) Failed to connect, token sk-process-secret");
    auto transport = make_transport(script, scratch);

    auto outcome = transport.send(sample_request(), TimeoutPolicy::standard(), CancellationToken());

    REQUIRE(outcome.kind == OutcomeKind::ConnectionError);
    REQUIRE(outcome.detail.find("code 7") != std::string::npos);
    REQUIRE(outcome.detail.find("Failed to connect") != std::string::npos);
    REQUIRE(outcome.detail.find("sk-process-secret") == std::string::npos);
    REQUIRE(scratch.file_count() == 0);
}

TEST_CASE("ProcessTransport reports a missing curl executable") {
    TempDir scratch;
    ProcessTransport::Options options;
    options.curl_executable = (scratch.path() / "no-such-curl").string();
    options.temp_dir = scratch.path();
    ProcessTransport transport(options);

    auto outcome = transport.send(sample_request(), TimeoutPolicy::standard(), CancellationToken());

    REQUIRE(outcome.kind == OutcomeKind::ConnectionError);
    REQUIRE(outcome.detail.find("Failed to execute") != std::string::npos);
    REQUIRE(scratch.file_count() == 0);
}

TEST_CASE("ProcessTransport kills the child on cancellation") {
    TempDir script_dir;
    TempDir scratch;
    auto script = write_fake_curl(script_dir.path(), "{}", 200, 0, "", "exec sleep 10");
    auto transport = make_transport(script, scratch);

    CancellationToken cancel;
    std::thread canceller([cancel]() mutable {
        std::this_thread::sleep_for(200ms);
        cancel.cancel();
    });

    const auto started = std::chrono::steady_clock::now();
    auto outcome = transport.send(sample_request(), TimeoutPolicy::standard(), cancel);
    const auto elapsed = std::chrono::steady_clock::now() - started;
    canceller.join();

    REQUIRE(outcome.kind == OutcomeKind::Cancelled);
    REQUIRE(elapsed < 5s);
    REQUIRE(scratch.file_count() == 0);
}

TEST_CASE("ProcessTransport kills and reaps a child that outlives its deadline") {
    TempDir script_dir;
    TempDir scratch;
    auto script = write_fake_curl(script_dir.path(), "{}", 200, 0, "", "exec sleep 10");

    ProcessTransport::Options options;
    options.curl_executable = script.string();
    options.temp_dir = scratch.path();
    options.poll_interval = 10ms;
    options.deadline_grace = 0ms;
    ProcessTransport transport(options);

    TimeoutPolicy timeouts;
    timeouts.overall_timeout = 200ms;

    const auto started = std::chrono::steady_clock::now();
    auto outcome = transport.send(sample_request(), timeouts, CancellationToken());
    const auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(outcome.kind == OutcomeKind::ConnectionError);
    REQUIRE(outcome.detail.find("exceeded the overall timeout") != std::string::npos);
    REQUIRE(elapsed < 5s);
    REQUIRE(scratch.file_count() == 0);
}

TEST_CASE("ProcessTransport does not start when already cancelled") {
    TempDir script_dir;
    TempDir scratch;
    auto script = write_fake_curl(script_dir.path(), "{}", 200);
    auto transport = make_transport(script, scratch);

    CancellationToken cancel;
    cancel.cancel();
    auto outcome = transport.send(sample_request(), TimeoutPolicy::standard(), cancel);

    REQUIRE(outcome.kind == OutcomeKind::Cancelled);
    REQUIRE_FALSE(std::filesystem::exists(script_dir.path() / "args.txt"));
}
