/*
 * Background runner implementation
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "BackgroundRunner.hpp"
#include "EventStreamDecoder.hpp"
#include "Logger.hpp"
#include "Redaction.hpp"

#include <atomic>
#include <mutex>
#include <system_error>

struct BackgroundTask::Progress {
    std::atomic<std::size_t> chunks{0};
    std::recursive_mutex delivery;           // Held while a chunk is handed to on_chunk
};

namespace {

bool has_http_scheme(const std::string& url)
{
    return url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0;
}

// Runs on the worker thread; everything the caller observes originates here.
RequestOutcome run_worker(const RequestFn& request_fn, const StreamHandler& handler,
                          const CancellationToken& cancel, std::atomic<std::size_t>& chunk_counter,
                          std::recursive_mutex& delivery)
{
    EventStreamDecoder decoder;

    auto deliver = [&](const std::vector<std::string>& events) {
        for (const auto& event : events) {
            if (cancel.is_cancelled()) {
                return;
            }
            auto chunk = handler.decode(event);
            if (!chunk || chunk->empty()) {
                continue;
            }
            std::lock_guard<std::recursive_mutex> lock(delivery);
            if (cancel.is_cancelled()) {
                return;
            }
            ++chunk_counter;
            if (handler.on_chunk) {
                handler.on_chunk(*chunk);
            }
        }
    };

    DataSink sink;
    if (handler.decode) {
        sink = [&](const char* data, std::size_t length) {
            if (!cancel.is_cancelled()) {
                deliver(decoder.feed(data, length));
            }
        };
    }

    RequestOutcome outcome = request_fn(sink, cancel);

    if (handler.decode && outcome.is_success() && !cancel.is_cancelled()) {
        deliver(decoder.finish());
    }
    if (cancel.is_cancelled()) {
        return RequestOutcome::cancelled();
    }
    return outcome;
}

} // namespace

BackgroundTask::BackgroundTask(ConstructionTag, CancellationToken cancel,
                               std::shared_future<RequestOutcome> future,
                               std::shared_ptr<Progress> progress)
    : cancel_(std::move(cancel))
    , future_(std::move(future))
    , progress_(std::move(progress))
{}

BackgroundTask::~BackgroundTask()
{
    if (worker_.joinable()) {
        cancel_.cancel();
        worker_.join();
    }
}

void BackgroundTask::cancel()
{
    cancel_.cancel();
    // A chunk already past the flag check finishes before we return
    if (progress_) {
        std::lock_guard<std::recursive_mutex> lock(progress_->delivery);
    }
}

RequestOutcome BackgroundTask::wait() const
{
    return future_.get();
}

std::optional<RequestOutcome> BackgroundTask::wait_for(std::chrono::milliseconds timeout) const
{
    if (future_.wait_for(timeout) != std::future_status::ready) {
        return std::nullopt;
    }
    return future_.get();
}

std::size_t BackgroundTask::chunk_count() const
{
    return progress_ ? progress_->chunks.load() : 0;
}

BackgroundRunner::BackgroundRunner(std::shared_ptr<const RequestExecutor> executor)
    : executor_(std::move(executor))
{}

BackgroundTaskPtr BackgroundRunner::resolved(RequestOutcome outcome, CancellationToken cancel)
{
    std::promise<RequestOutcome> promise;
    promise.set_value(std::move(outcome));
    return std::make_shared<BackgroundTask>(BackgroundTask::ConstructionTag(), std::move(cancel),
                                            promise.get_future().share(),
                                            std::make_shared<BackgroundTask::Progress>());
}

BackgroundTaskPtr BackgroundRunner::run(RequestFn request_fn,
                                        StreamHandler handler,
                                        CancellationToken cancel) const
{
    if (!request_fn) {
        return resolved(RequestOutcome::connection_error("Background request has no work to run"),
                        std::move(cancel));
    }

    auto promise = std::make_shared<std::promise<RequestOutcome>>();
    auto progress = std::make_shared<BackgroundTask::Progress>();
    auto task = std::make_shared<BackgroundTask>(BackgroundTask::ConstructionTag(), cancel,
                                                 promise->get_future().share(), progress);

    try {
        task->worker_ = std::thread([promise, progress, cancel,
                                     request_fn = std::move(request_fn),
                                     handler = std::move(handler)]() {
            RequestOutcome outcome;
            try {
                outcome = run_worker(request_fn, handler, cancel, progress->chunks, progress->delivery);
            } catch (const std::exception& ex) {
                outcome = cancel.is_cancelled()
                    ? RequestOutcome::cancelled()
                    : RequestOutcome::connection_error(std::string("Background request failed: ") + ex.what());
                if (auto logger = Logger::get_logger(Logger::kNetLogger)) {
                    logger->error("Background request raised: {}", ex.what());
                }
            }
            promise->set_value(std::move(outcome));
        });
    } catch (const std::system_error& ex) {
        if (auto logger = Logger::get_logger(Logger::kNetLogger)) {
            logger->error("Could not start background request: {}", ex.what());
        }
        promise->set_value(RequestOutcome::connection_error(
            std::string("Could not start background request: ") + ex.what()));
    }
    return task;
}

BackgroundTaskPtr BackgroundRunner::run(HttpRequest request,
                                        TimeoutPolicy timeouts,
                                        StreamHandler handler,
                                        CancellationToken cancel,
                                        RequestHook before_send) const
{
    if (!executor_) {
        return resolved(RequestOutcome::connection_error("Background runner has no request executor"),
                        std::move(cancel));
    }
    if (!has_http_scheme(request.url)) {
        return resolved(RequestOutcome::connection_error(
                            "Malformed request URL: '" + Redaction::redact_url(request.url) + "'"),
                        std::move(cancel));
    }

    auto executor = executor_;
    RequestFn request_fn = [executor, request = std::move(request), timeouts,
                            before_send = std::move(before_send)](
                               const DataSink& sink, const CancellationToken& token) {
        if (!before_send) {
            return executor->execute(request, timeouts, token, sink);
        }
        HttpRequest outgoing = request;
        if (auto early = before_send(outgoing, token)) {
            return *early;
        }
        return executor->execute(outgoing, timeouts, token, sink);
    };
    return run(std::move(request_fn), std::move(handler), std::move(cancel));
}
