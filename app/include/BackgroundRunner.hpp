/*
 * Off-thread request execution with streamed chunk delivery
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef BACKGROUND_RUNNER_HPP
#define BACKGROUND_RUNNER_HPP

#include "CancellationToken.hpp"
#include "HttpTypes.hpp"
#include "RequestExecutor.hpp"

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>

/**
 * Turns one event-stream payload into a text chunk (nullopt = nothing to show)
 */
using EventDecoder = std::function<std::optional<std::string>(const std::string& event_data)>;

/**
 * Receives decoded chunks in arrival order
 */
using ChunkCallback = std::function<void(const std::string& chunk)>;

/**
 * How the response body is consumed while it arrives
 *
 * Without a decoder the body is only returned in the final outcome.
 */
struct StreamHandler {
    EventDecoder decode;
    ChunkCallback on_chunk;
};

/**
 * The work a background task performs: send and return the outcome,
 * feeding response bytes to the sink
 */
using RequestFn = std::function<RequestOutcome(const DataSink& sink, const CancellationToken& cancel)>;

/**
 * Runs on the worker thread just before an HTTP request is sent and may
 * finish the request (credentials); a returned outcome ends the task
 * without sending
 */
using RequestHook = std::function<std::optional<RequestOutcome>(HttpRequest& request,
                                                                const CancellationToken& cancel)>;

/**
 * Handle on a request running on its own thread
 *
 * Chunks and the final outcome are reported from the worker thread, chunks
 * strictly before the outcome resolves. Once cancel() returns no further
 * chunk is delivered and the outcome resolves to Cancelled. Destroying a
 * running task cancels it and joins the worker.
 */
class BackgroundTask {
    friend class BackgroundRunner;

    struct Progress;

    struct ConstructionTag {
        explicit ConstructionTag() = default;
    };

public:
    BackgroundTask(ConstructionTag, CancellationToken cancel, std::shared_future<RequestOutcome> future,
                   std::shared_ptr<Progress> progress);
    ~BackgroundTask();

    BackgroundTask(const BackgroundTask&) = delete;
    BackgroundTask& operator=(const BackgroundTask&) = delete;

    /**
     * Idempotent; waits for a chunk that is being delivered
     */
    void cancel();
    bool is_cancelled() const { return cancel_.is_cancelled(); }

    /**
     * Block until the outcome resolves
     */
    RequestOutcome wait() const;

    /**
     * Outcome if it resolved within timeout
     */
    std::optional<RequestOutcome> wait_for(std::chrono::milliseconds timeout) const;

    std::shared_future<RequestOutcome> future() const { return future_; }

    /**
     * Chunks delivered so far
     */
    std::size_t chunk_count() const;

private:
    CancellationToken cancel_;
    std::shared_future<RequestOutcome> future_;
    std::shared_ptr<Progress> progress_;
    std::thread worker_;
};

using BackgroundTaskPtr = std::shared_ptr<BackgroundTask>;

class BackgroundRunner {
public:
    BackgroundRunner() = default;
    explicit BackgroundRunner(std::shared_ptr<const RequestExecutor> executor);

    /**
     * Run an arbitrary request function in the background
     *
     * A missing function or a thread that cannot be started resolves the
     * task immediately to ConnectionError.
     */
    BackgroundTaskPtr run(RequestFn request_fn,
                          StreamHandler handler = {},
                          CancellationToken cancel = {}) const;

    /**
     * Run an HTTP request through the executor in the background
     *
     * A malformed request (no http/https URL) resolves immediately to
     * ConnectionError without starting a thread. before_send runs on the
     * worker thread.
     */
    BackgroundTaskPtr run(HttpRequest request,
                          TimeoutPolicy timeouts,
                          StreamHandler handler = {},
                          CancellationToken cancel = {},
                          RequestHook before_send = nullptr) const;

private:
    static BackgroundTaskPtr resolved(RequestOutcome outcome, CancellationToken cancel);

    std::shared_ptr<const RequestExecutor> executor_;
};

#endif // BACKGROUND_RUNNER_HPP
