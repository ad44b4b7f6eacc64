/*
 * Provider adapter abstraction
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef I_PROVIDER_HPP
#define I_PROVIDER_HPP

#include "BackgroundRunner.hpp"
#include "CancellationToken.hpp"
#include "JsonSupport.hpp"
#include "ProviderSettings.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * Provider capabilities flags
 */
enum class ProviderCapability : uint32_t {
    None            = 0,
    RemoteInference = 1 << 0,   // Sends data to a remote server
    Streaming       = 1 << 1,   // Can deliver text/event-stream chunks
    TokenExchange   = 1 << 2,   // Needs a bearer token from a credential exchange
    WebSearch       = 1 << 3,   // Can enable a provider-side search tool
};

inline ProviderCapability operator|(ProviderCapability a, ProviderCapability b) {
    return static_cast<ProviderCapability>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline ProviderCapability operator&(ProviderCapability a, ProviderCapability b) {
    return static_cast<ProviderCapability>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

inline bool has_capability(ProviderCapability caps, ProviderCapability flag) {
    return (static_cast<uint32_t>(caps) & static_cast<uint32_t>(flag)) != 0;
}

/**
 * Chat message role
 */
enum class MessageRole {
    System,
    User,
    Assistant,
};

const char* to_string(MessageRole role);

/**
 * A single message in a conversation
 *
 * Order within a conversation is significant. Adapters never modify the
 * caller's messages; they build their own wire copies.
 */
struct ChatMessage {
    MessageRole role{MessageRole::User};
    std::string content;
    std::optional<std::string> name;
    Json::Value reasoning;                   // Structured reasoning annotation (null when absent)
    bool is_context{false};                  // Host-side marker, never sent to a provider

    ChatMessage() = default;
    ChatMessage(MessageRole r, std::string text)
        : role(r), content(std::move(text)) {}

    /**
     * Wire form with role, content and, when present, name
     */
    Json::Value to_json() const;
};

/**
 * Failure taxonomy surfaced to the host
 */
enum class ErrorKind {
    None,
    Configuration,   // Missing credential/endpoint; no network call attempted
    Connection,      // DNS/TLS/socket or curl process failure
    Http,            // Non-2xx status
    Parse,           // Body not JSON or not a recognised shape
    Provider,        // Well-formed error object from the provider
    Cancelled,       // Caller cancelled
};

const char* to_string(ErrorKind kind);

/**
 * The only shape a query returns: text on success, one message otherwise
 */
struct ProviderResult {
    bool success{false};
    std::string text;
    ErrorKind error_kind{ErrorKind::None};
    std::string error_message;

    std::string provider_id;
    std::string model_used;
    std::chrono::milliseconds latency{0};
    std::size_t chunk_count{0};              // Streamed chunks delivered

    static ProviderResult ok(std::string text);
    static ProviderResult failure(ErrorKind kind, std::string message);
};

/**
 * Per-call knobs supplied by the host
 */
struct QueryOptions {
    CancellationToken cancel;
    ChunkCallback on_chunk;                  // Streamed text, in order, before completion
};

/**
 * A query running in the background
 */
class PendingQuery {
public:
    using Finisher = std::function<ProviderResult(const RequestOutcome&, std::size_t chunk_count)>;

    /**
     * Already resolved (configuration or authentication failure)
     */
    explicit PendingQuery(ProviderResult immediate);

    PendingQuery(BackgroundTaskPtr task, Finisher finish);

    /**
     * Idempotent
     */
    void cancel();

    /**
     * Block until the result is available (computed once)
     */
    ProviderResult wait();

    bool ready() const;

private:
    Finisher finish_;
    BackgroundTaskPtr task_;                 // Joined before finish_ releases the adapter
    mutable std::mutex mutex_;
    std::optional<ProviderResult> result_;
};

using PendingQueryPtr = std::shared_ptr<PendingQuery>;

/**
 * Abstract interface for provider adapters
 *
 * One adapter per provider wire format. Adapter instances keep state that
 * must outlive a single call (the token cache), so hosts keep one instance
 * per configured profile.
 */
class IProvider {
public:
    virtual ~IProvider() = default;

    /**
     * Handler identifier ("openai", "anthropic", ...)
     */
    virtual std::string id() const = 0;

    /**
     * Human-readable provider name used in messages
     */
    virtual std::string display_name() const = 0;

    virtual ProviderCapability capabilities() const = 0;

    /**
     * Configuration problem that prevents a request, if any
     */
    virtual std::optional<std::string> validate_settings(const ProviderSettings& settings) const = 0;

    /**
     * Dispatch a conversation and wait for the canonical result
     *
     * Streams through the background runner when the settings request it;
     * chunks go to options.on_chunk.
     */
    virtual ProviderResult query(const std::vector<ChatMessage>& messages,
                                 const ProviderSettings& settings,
                                 const QueryOptions& options = {}) = 0;

    /**
     * Dispatch a conversation without blocking on network I/O
     */
    virtual PendingQueryPtr query_async(const std::vector<ChatMessage>& messages,
                                        const ProviderSettings& settings,
                                        const QueryOptions& options = {}) = 0;
};

/**
 * Type alias for provider pointers
 */
using ProviderPtr = std::shared_ptr<IProvider>;

#endif // I_PROVIDER_HPP
