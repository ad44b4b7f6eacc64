/*
 * libcurl transport implementation
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "CurlTransport.hpp"
#include "Logger.hpp"
#include "Redaction.hpp"

#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace {

struct TransferContext {
    CURL* curl{nullptr};
    const CancellationToken* cancel{nullptr};
    const DataSink* on_data{nullptr};
    std::string body;
    bool status_known{false};
    bool forward_body{false};
};

struct EasyDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

void ensure_curl_global_init()
{
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t write_callback(char* contents, size_t size, size_t nmemb, void* userdata)
{
    auto* ctx = static_cast<TransferContext*>(userdata);
    const size_t total_size = size * nmemb;

    // Returning a short count makes curl abort with CURLE_WRITE_ERROR.
    if (ctx->cancel->is_cancelled()) {
        return 0;
    }

    ctx->body.append(contents, total_size);

    if (!ctx->status_known) {
        long status = 0;
        curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &status);
        ctx->forward_body = status >= 200 && status < 300;
        ctx->status_known = true;
    }
    if (ctx->forward_body && ctx->on_data && *ctx->on_data) {
        (*ctx->on_data)(contents, total_size);
    }
    return total_size;
}

int progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t)
{
    const auto* ctx = static_cast<const TransferContext*>(clientp);
    return ctx->cancel->is_cancelled() ? 1 : 0;
}

} // namespace

CurlTransport::CurlTransport()
    : CurlTransport(Options{})
{}

CurlTransport::CurlTransport(Options options)
    : options_(std::move(options))
{
    ensure_curl_global_init();
}

RequestOutcome CurlTransport::send(const HttpRequest& request,
                                   const TimeoutPolicy& timeouts,
                                   const CancellationToken& cancel,
                                   const DataSink& on_data)
{
    if (cancel.is_cancelled()) {
        return RequestOutcome::cancelled();
    }

    std::unique_ptr<CURL, EasyDeleter> curl(curl_easy_init());
    if (!curl) {
        return RequestOutcome::connection_error("Failed to initialize cURL");
    }

    TransferContext ctx;
    ctx.curl = curl.get();
    ctx.cancel = &cancel;
    ctx.on_data = &on_data;

    std::unique_ptr<curl_slist, SlistDeleter> header_list;
    for (const auto& [key, value] : request.headers) {
        const std::string header = key + ": " + value;
        curl_slist* appended = curl_slist_append(header_list.get(), header.c_str());
        if (!appended) {
            return RequestOutcome::connection_error("Failed to build request headers");
        }
        header_list.release();
        header_list.reset(appended);
    }

    char error_buffer[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeouts.connect_timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeouts.overall_timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
    if (!options_.verify_tls) {
        curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 0L);
    }

    if (auto logger = Logger::get_logger(Logger::kNetLogger)) {
        logger->debug("CurlTransport sending {}", Redaction::describe_request(request));
    }

    const CURLcode res = curl_easy_perform(curl.get());

    if (cancel.is_cancelled()) {
        if (auto logger = Logger::get_logger(Logger::kNetLogger)) {
            logger->debug("CurlTransport transfer cancelled");
        }
        return RequestOutcome::cancelled();
    }

    if (res != CURLE_OK) {
        std::string detail = curl_easy_strerror(res);
        if (error_buffer[0] != '\0') {
            detail += std::string(": ") + error_buffer;
        }
        detail = Redaction::redact_secrets(detail, Redaction::collect_secrets(request));
        if (auto logger = Logger::get_logger(Logger::kNetLogger)) {
            logger->warn("CurlTransport connection failure: {}", detail);
        }
        return RequestOutcome::connection_error(std::move(detail));
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);

    if (auto logger = Logger::get_logger(Logger::kNetLogger)) {
        logger->debug("CurlTransport received HTTP {} ({} bytes)", status, ctx.body.size());
    }

    return RequestOutcome::from_status(static_cast<int>(status), std::move(ctx.body));
}
