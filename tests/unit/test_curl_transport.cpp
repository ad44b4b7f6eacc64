/*
 * Unit tests for the libcurl transport against local sockets
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <catch2/catch_test_macros.hpp>
#include "CurlTransport.hpp"

#include <chrono>
#include <cstdlib>
#include <string>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace std::chrono_literals;

namespace {

// Loopback TCP socket bound to an ephemeral port
class LoopbackSocket {
public:
    LoopbackSocket()
    {
        fd_ = socket(AF_INET, SOCK_STREAM, 0);
        REQUIRE(fd_ >= 0);

        sockaddr_in address{};
        address.sin_family = AF_INET;
        address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        address.sin_port = 0;
        REQUIRE(bind(fd_, reinterpret_cast<sockaddr*>(&address), sizeof(address)) == 0);

        socklen_t length = sizeof(address);
        REQUIRE(getsockname(fd_, reinterpret_cast<sockaddr*>(&address), &length) == 0);
        port_ = ntohs(address.sin_port);
    }

    ~LoopbackSocket() { close_now(); }

    LoopbackSocket(const LoopbackSocket&) = delete;
    LoopbackSocket& operator=(const LoopbackSocket&) = delete;

    void listen_without_accepting() { REQUIRE(listen(fd_, 4) == 0); }

    void close_now()
    {
        if (fd_ >= 0) {
            close(fd_);
            fd_ = -1;
        }
    }

    std::string url() const { return "http://127.0.0.1:" + std::to_string(port_) + "/v1/chat"; }

private:
    int fd_{-1};
    unsigned short port_{0};
};

HttpRequest local_request(const std::string& url)
{
    // Loopback traffic must not be routed through a proxy from the environment
    setenv("NO_PROXY", "127.0.0.1", 1);
    setenv("no_proxy", "127.0.0.1", 1);

    HttpRequest request;
    request.url = url;
    request.set_header("Content-Type", "application/json");
    request.set_header("Authorization", "Bearer sk-curl-secret");
    request.body = R"({"model":"m","messages":[]})";
    return request;
}

} // namespace

// =============================================================================
// Connection failures
// =============================================================================

TEST_CASE("CurlTransport reports a refused connection as ConnectionError") {
    std::string url;
    {
        LoopbackSocket closed;
        url = closed.url();
    }

    CurlTransport transport;
    TimeoutPolicy timeouts;
    timeouts.connect_timeout = 2s;
    timeouts.overall_timeout = 5s;

    auto outcome = transport.send(local_request(url), timeouts, CancellationToken());

    REQUIRE(outcome.kind == OutcomeKind::ConnectionError);
    REQUIRE_FALSE(outcome.detail.empty());
    REQUIRE(outcome.detail.find("sk-curl-secret") == std::string::npos);
}

// =============================================================================
// Cancellation
// =============================================================================

TEST_CASE("CurlTransport aborts a request to a silent server on cancellation") {
    LoopbackSocket silent;
    silent.listen_without_accepting();

    CurlTransport transport;
    CancellationToken cancel;
    std::thread canceller([cancel]() mutable {
        std::this_thread::sleep_for(200ms);
        cancel.cancel();
    });

    const auto started = std::chrono::steady_clock::now();
    auto outcome = transport.send(local_request(silent.url()), TimeoutPolicy::standard(), cancel);
    const auto elapsed = std::chrono::steady_clock::now() - started;
    canceller.join();

    REQUIRE(outcome.kind == OutcomeKind::Cancelled);
    REQUIRE(elapsed < 5s);
}

TEST_CASE("CurlTransport does not connect when already cancelled") {
    LoopbackSocket silent;
    silent.listen_without_accepting();

    CurlTransport transport;
    CancellationToken cancel;
    cancel.cancel();

    auto outcome = transport.send(local_request(silent.url()), TimeoutPolicy::standard(), cancel);

    REQUIRE(outcome.kind == OutcomeKind::Cancelled);
}
