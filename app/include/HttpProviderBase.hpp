/*
 * Shared request pipeline for HTTP provider adapters
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef HTTP_PROVIDER_BASE_HPP
#define HTTP_PROVIDER_BASE_HPP

#include "BackgroundRunner.hpp"
#include "IProvider.hpp"
#include "RequestExecutor.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

/**
 * Base class for adapters that talk JSON over HTTP POST
 *
 * query() runs: validate settings -> build_request() -> authorize() ->
 * RequestExecutor (or BackgroundRunner when streaming) -> interpret the
 * outcome. Subclasses describe the wire format only. query_async() only
 * validates and builds on the calling thread; authorization (which may
 * exchange credentials over the network) runs on the worker thread.
 *
 * Adapters must be owned by a std::shared_ptr: query_async() keeps the
 * adapter alive until the pending query is finished.
 */
class HttpProviderBase : public IProvider,
                         public std::enable_shared_from_this<HttpProviderBase> {
public:
    explicit HttpProviderBase(TransportPtr transport, RetryPolicy retry_policy = {});
    ~HttpProviderBase() override = default;

    ProviderCapability capabilities() const override;
    std::optional<std::string> validate_settings(const ProviderSettings& settings) const override;

    ProviderResult query(const std::vector<ChatMessage>& messages,
                         const ProviderSettings& settings,
                         const QueryOptions& options = {}) override;

    PendingQueryPtr query_async(const std::vector<ChatMessage>& messages,
                                const ProviderSettings& settings,
                                const QueryOptions& options = {}) override;

    /**
     * Interpret a completed request (exposed for the golden fixture tests)
     */
    ProviderResult interpret_outcome(const RequestOutcome& outcome,
                                     const ProviderSettings& settings) const;

    const std::shared_ptr<const RequestExecutor>& executor() const { return executor_; }

    static constexpr std::size_t kExcerptLength = 200;

protected:
    struct PreparedRequest {
        HttpRequest request;
        TimeoutPolicy timeouts;
        bool stream{false};
    };

    /**
     * Provider wire request (may throw on malformed additional parameters)
     */
    virtual PreparedRequest build_request(const std::vector<ChatMessage>& messages,
                                          const ProviderSettings& settings) const = 0;

    /**
     * Attach credentials; a returned result aborts the query
     *
     * May block on a credential exchange, which observes cancel.
     */
    virtual std::optional<ProviderResult> authorize(HttpRequest& request,
                                                    const ProviderSettings& settings,
                                                    const CancellationToken& cancel);

    /**
     * Message carried by an error object in a response body, or empty
     */
    virtual std::string decode_error(const Json::Value& root) const;

    /**
     * Text of a success body, or nullopt when no known shape matches
     */
    virtual std::optional<std::string> extract_text(const Json::Value& root,
                                                    const ProviderSettings& settings) const = 0;

    /**
     * Text carried by one event-stream payload
     */
    virtual std::optional<std::string> decode_stream_event(const Json::Value& event) const;

    /**
     * Called with every completed outcome before it is interpreted
     */
    virtual void observe_outcome(const RequestOutcome& outcome) const;

    /**
     * JSON POST skeleton with Content-Type and, when streaming, Accept
     */
    static HttpRequest json_request(const std::string& url, const Json::Value& body, bool stream);

    /**
     * "[code] message (type)" with absent parts omitted
     */
    static std::string format_error_parts(const std::string& code,
                                          const std::string& message,
                                          const std::string& type);

    bool streaming_requested(const ProviderSettings& settings) const;

    ProviderResult make_failure(ErrorKind kind, std::string message,
                                const ProviderSettings& settings) const;

private:
    ProviderResult interpret_body(const std::string& body, const ProviderSettings& settings) const;
    ProviderResult describe_http_error(int status_code, const std::string& body,
                                       const ProviderSettings& settings) const;
    ProviderResult unexpected_shape(const std::string& body, const ProviderSettings& settings) const;

    /**
     * Validation and request building; nullopt request on failure
     */
    std::optional<PreparedRequest> prepare(const std::vector<ChatMessage>& messages,
                                           const ProviderSettings& settings,
                                           ProviderResult& failure) const;

    /**
     * Cancellation check and authorize(); the failure to report, if any
     */
    std::optional<ProviderResult> authorize_request(HttpRequest& request,
                                                    const ProviderSettings& settings,
                                                    const CancellationToken& cancel);

    StreamHandler make_stream_handler(const ChunkCallback& on_chunk,
                                      std::shared_ptr<std::string> accumulated) const;

    ProviderResult finish(const RequestOutcome& outcome,
                          const ProviderSettings& settings,
                          const std::string& streamed_text,
                          std::size_t chunk_count,
                          std::chrono::steady_clock::time_point started) const;

    /**
     * Stamp provider, model, chunk count and latency on a result and log it
     */
    ProviderResult complete(ProviderResult result,
                            const ProviderSettings& settings,
                            std::size_t chunk_count,
                            std::chrono::steady_clock::time_point started) const;

    std::shared_ptr<const RequestExecutor> executor_;
    BackgroundRunner runner_;
};

#endif // HTTP_PROVIDER_BASE_HPP
