/*
 * Shared request pipeline for HTTP provider adapters
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "HttpProviderBase.hpp"
#include "Logger.hpp"
#include "Redaction.hpp"

#include <stdexcept>

namespace {

std::string profile_label(const ProviderSettings& settings, const std::string& fallback)
{
    return settings.name.empty() ? fallback : settings.name;
}

std::string excerpt(const std::string& body, std::size_t length)
{
    if (body.size() <= length) {
        return body;
    }
    return body.substr(0, length) + "...";
}

} // namespace

HttpProviderBase::HttpProviderBase(TransportPtr transport, RetryPolicy retry_policy)
    : executor_(std::make_shared<const RequestExecutor>(std::move(transport), retry_policy))
    , runner_(executor_)
{}

ProviderCapability HttpProviderBase::capabilities() const
{
    return ProviderCapability::RemoteInference;
}

std::optional<std::string> HttpProviderBase::validate_settings(const ProviderSettings& settings) const
{
    const std::string label = profile_label(settings, id());
    if (settings.api_key.empty()) {
        return "No API key found for provider " + label;
    }
    if (settings.base_url.empty()) {
        return "No base_url configured for provider " + label;
    }
    if (settings.model.empty()) {
        return "No model configured for provider " + label;
    }
    return std::nullopt;
}

bool HttpProviderBase::streaming_requested(const ProviderSettings& settings) const
{
    return has_capability(capabilities(), ProviderCapability::Streaming) && settings.stream_requested();
}

HttpRequest HttpProviderBase::json_request(const std::string& url, const Json::Value& body, bool stream)
{
    HttpRequest request;
    request.url = url;
    request.body = JsonSupport::to_compact_string(body);
    request.set_header("Content-Type", "application/json");
    if (stream) {
        request.set_header("Accept", "text/event-stream");
    }
    return request;
}

std::string HttpProviderBase::format_error_parts(const std::string& code,
                                                 const std::string& message,
                                                 const std::string& type)
{
    std::string text;
    auto append = [&text](const std::string& part) {
        if (!text.empty()) {
            text += ' ';
        }
        text += part;
    };
    if (!code.empty()) {
        append("[" + code + "]");
    }
    if (!message.empty()) {
        append(message);
    }
    if (!type.empty()) {
        append("(" + type + ")");
    }
    return text;
}

std::optional<ProviderResult> HttpProviderBase::authorize(HttpRequest& /*request*/,
                                                          const ProviderSettings& /*settings*/,
                                                          const CancellationToken& /*cancel*/)
{
    return std::nullopt;
}

std::string HttpProviderBase::decode_error(const Json::Value& root) const
{
    if (!root.isObject() || !root.isMember("error")) {
        return {};
    }

    const Json::Value& error = root["error"];
    if (error.isNull() || (error.isBool() && !error.asBool())) {
        return {};
    }
    if (error.isString()) {
        return error.asString();
    }
    if (error.isObject()) {
        std::string text = format_error_parts(JsonSupport::scalar_to_string(error["code"]),
                                              JsonSupport::string_member(error, "message"),
                                              JsonSupport::string_member(error, "type"));
        return text.empty() ? JsonSupport::to_compact_string(error) : text;
    }
    return JsonSupport::to_compact_string(error);
}

std::optional<std::string> HttpProviderBase::decode_stream_event(const Json::Value& event) const
{
    if (!event.isObject()) {
        return std::nullopt;
    }
    const Json::Value& choices = event["choices"];
    if (!choices.isArray() || choices.empty() || !choices[0u].isObject()) {
        return std::nullopt;
    }
    const Json::Value& delta = choices[0u]["delta"];
    if (delta.isObject() && delta["content"].isString()) {
        return delta["content"].asString();
    }
    return std::nullopt;
}

void HttpProviderBase::observe_outcome(const RequestOutcome& /*outcome*/) const
{}

ProviderResult HttpProviderBase::make_failure(ErrorKind kind, std::string message,
                                              const ProviderSettings& settings) const
{
    ProviderResult result = ProviderResult::failure(kind, std::move(message));
    result.provider_id = id();
    result.model_used = settings.model;
    return result;
}

std::optional<HttpProviderBase::PreparedRequest> HttpProviderBase::prepare(
    const std::vector<ChatMessage>& messages,
    const ProviderSettings& settings,
    ProviderResult& failure) const
{
    if (auto problem = validate_settings(settings)) {
        if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
            logger->warn("{}: configuration error: {}", id(), *problem);
        }
        failure = make_failure(ErrorKind::Configuration, *problem, settings);
        return std::nullopt;
    }

    try {
        return build_request(messages, settings);
    } catch (const std::exception& e) {
        // Json::Exception derives from std::exception
        failure = make_failure(ErrorKind::Configuration,
                               "Invalid parameters for " + display_name() + " request: " + e.what(),
                               settings);
        if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
            logger->warn("{}: {}", id(), failure.error_message);
        }
        return std::nullopt;
    }
}

std::optional<ProviderResult> HttpProviderBase::authorize_request(HttpRequest& request,
                                                                  const ProviderSettings& settings,
                                                                  const CancellationToken& cancel)
{
    if (cancel.is_cancelled()) {
        return make_failure(ErrorKind::Cancelled, "Request cancelled", settings);
    }

    if (auto failure = authorize(request, settings, cancel)) {
        failure->provider_id = id();
        failure->model_used = settings.model;
        return failure;
    }

    if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
        logger->debug("{}: {}", id(), Redaction::describe_request(request));
    }
    return std::nullopt;
}

StreamHandler HttpProviderBase::make_stream_handler(const ChunkCallback& on_chunk,
                                                    std::shared_ptr<std::string> accumulated) const
{
    StreamHandler handler;
    handler.decode = [this](const std::string& data) -> std::optional<std::string> {
        Json::Value event;
        if (!JsonSupport::parse(data, event)) {
            return std::nullopt;
        }
        try {
            return decode_stream_event(event);
        } catch (const std::exception& e) {
            if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
                logger->debug("{}: skipped undecodable stream event: {}", id(), e.what());
            }
            return std::nullopt;
        }
    };
    handler.on_chunk = [accumulated, on_chunk](const std::string& chunk) {
        accumulated->append(chunk);
        if (on_chunk) {
            on_chunk(chunk);
        }
    };
    return handler;
}

ProviderResult HttpProviderBase::query(const std::vector<ChatMessage>& messages,
                                       const ProviderSettings& settings,
                                       const QueryOptions& options)
{
    const auto started = std::chrono::steady_clock::now();

    ProviderResult failure;
    auto prepared = prepare(messages, settings, failure);
    if (!prepared) {
        return failure;
    }
    if (auto auth_failure = authorize_request(prepared->request, settings, options.cancel)) {
        return complete(std::move(*auth_failure), settings, 0, started);
    }

    if (prepared->stream) {
        auto accumulated = std::make_shared<std::string>();
        auto task = runner_.run(prepared->request, prepared->timeouts,
                                make_stream_handler(options.on_chunk, accumulated),
                                options.cancel);
        const RequestOutcome outcome = task->wait();
        return finish(outcome, settings, *accumulated, task->chunk_count(), started);
    }

    const RequestOutcome outcome = executor_->execute(prepared->request, prepared->timeouts,
                                                      options.cancel);
    return finish(outcome, settings, std::string(), 0, started);
}

PendingQueryPtr HttpProviderBase::query_async(const std::vector<ChatMessage>& messages,
                                              const ProviderSettings& settings,
                                              const QueryOptions& options)
{
    const auto started = std::chrono::steady_clock::now();

    std::shared_ptr<HttpProviderBase> self = weak_from_this().lock();
    if (!self) {
        return std::make_shared<PendingQuery>(
            make_failure(ErrorKind::Configuration,
                         display_name() + " adapter is not owned by a shared_ptr", settings));
    }

    ProviderResult failure;
    auto prepared = prepare(messages, settings, failure);
    if (!prepared) {
        return std::make_shared<PendingQuery>(std::move(failure));
    }

    auto accumulated = std::make_shared<std::string>();
    StreamHandler handler;
    if (prepared->stream) {
        handler = make_stream_handler(options.on_chunk, accumulated);
    }

    // Written on the worker thread, read by the finisher after the task resolves
    auto auth_failure = std::make_shared<std::optional<ProviderResult>>();
    RequestHook before_send = [self, settings, auth_failure](
                                  HttpRequest& request,
                                  const CancellationToken& cancel) -> std::optional<RequestOutcome> {
        *auth_failure = self->authorize_request(request, settings, cancel);
        if (!*auth_failure) {
            return std::nullopt;
        }
        if ((*auth_failure)->error_kind == ErrorKind::Cancelled) {
            return RequestOutcome::cancelled();
        }
        return RequestOutcome::connection_error((*auth_failure)->error_message);
    };

    auto task = runner_.run(std::move(prepared->request), prepared->timeouts,
                            std::move(handler), options.cancel, std::move(before_send));

    auto finisher = [self, settings, accumulated, auth_failure, started](const RequestOutcome& outcome,
                                                                         std::size_t chunk_count) {
        if (*auth_failure && outcome.kind != OutcomeKind::Cancelled) {
            return self->complete(**auth_failure, settings, 0, started);
        }
        return self->finish(outcome, settings, *accumulated, chunk_count, started);
    };
    return std::make_shared<PendingQuery>(std::move(task), std::move(finisher));
}

ProviderResult HttpProviderBase::finish(const RequestOutcome& outcome,
                                        const ProviderSettings& settings,
                                        const std::string& streamed_text,
                                        std::size_t chunk_count,
                                        std::chrono::steady_clock::time_point started) const
{
    observe_outcome(outcome);

    if (outcome.is_success() && chunk_count > 0) {
        return complete(ProviderResult::ok(streamed_text), settings, chunk_count, started);
    }
    return complete(interpret_outcome(outcome, settings), settings, chunk_count, started);
}

ProviderResult HttpProviderBase::complete(ProviderResult result,
                                          const ProviderSettings& settings,
                                          std::size_t chunk_count,
                                          std::chrono::steady_clock::time_point started) const
{
    result.provider_id = id();
    result.model_used = settings.model;
    result.chunk_count = chunk_count;
    result.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
        if (result.success) {
            logger->info("{} completed request in {}ms ({} chunks)",
                         display_name(), result.latency.count(), chunk_count);
        } else if (result.error_kind != ErrorKind::Cancelled) {
            logger->warn("{} request failed ({}): {}",
                         display_name(), to_string(result.error_kind), result.error_message);
        }
    }
    return result;
}

ProviderResult HttpProviderBase::interpret_outcome(const RequestOutcome& outcome,
                                                   const ProviderSettings& settings) const
{
    switch (outcome.kind) {
        case OutcomeKind::Success:
            return interpret_body(outcome.body, settings);
        case OutcomeKind::HttpError:
            return describe_http_error(outcome.status_code, outcome.body, settings);
        case OutcomeKind::ConnectionError:
            return make_failure(ErrorKind::Connection,
                                "Failed to connect to " + display_name() + " API - " + outcome.detail,
                                settings);
        case OutcomeKind::Cancelled:
            return make_failure(ErrorKind::Cancelled, "Request cancelled", settings);
    }
    return make_failure(ErrorKind::Connection, "Unknown request outcome", settings);
}

ProviderResult HttpProviderBase::describe_http_error(int status_code, const std::string& body,
                                                     const ProviderSettings& settings) const
{
    std::string decoded;
    Json::Value root;
    if (JsonSupport::parse(body, root)) {
        try {
            decoded = decode_error(root);
        } catch (const std::exception& e) {
            if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
                logger->debug("{}: undecodable error body: {}", id(), e.what());
            }
        }
    }

    if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
        logger->warn("{}: HTTP {} body: {}", id(), status_code, body);
    }

    const std::string code = std::to_string(status_code);
    if (decoded.empty()) {
        return make_failure(ErrorKind::Http,
                            display_name() + " API request failed with HTTP status " + code,
                            settings);
    }
    return make_failure(ErrorKind::Http,
                        display_name() + " API returned HTTP " + code + " - " + decoded,
                        settings);
}

ProviderResult HttpProviderBase::interpret_body(const std::string& body,
                                                const ProviderSettings& settings) const
{
    Json::Value root;
    std::string errors;
    if (!JsonSupport::parse(body, root, &errors)) {
        if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
            logger->debug("{}: response is not JSON: {}", id(), errors);
        }
        return unexpected_shape(body, settings);
    }

    try {
        const std::string decoded = decode_error(root);
        if (!decoded.empty()) {
            return make_failure(ErrorKind::Provider, display_name() + " API error: " + decoded, settings);
        }

        auto text = extract_text(root, settings);
        if (text && !text->empty()) {
            ProviderResult result = ProviderResult::ok(std::move(*text));
            result.provider_id = id();
            result.model_used = settings.model;
            return result;
        }
    } catch (const std::exception& e) {
        if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
            logger->debug("{}: response decoding raised: {}", id(), e.what());
        }
    }
    return unexpected_shape(body, settings);
}

ProviderResult HttpProviderBase::unexpected_shape(const std::string& body,
                                                  const ProviderSettings& settings) const
{
    if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
        logger->warn("{}: unexpected response shape: {}", id(), body);
    }
    return make_failure(ErrorKind::Parse,
                        "Could not interpret " + display_name() +
                            " API response: unexpected response shape (" +
                            excerpt(body, kExcerptLength) + ")",
                        settings);
}
