/*
 * Canonical message and result types
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "IProvider.hpp"

const char* to_string(MessageRole role)
{
    switch (role) {
        case MessageRole::System: return "system";
        case MessageRole::User: return "user";
        case MessageRole::Assistant: return "assistant";
    }
    return "user";
}

const char* to_string(ErrorKind kind)
{
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::Configuration: return "configuration";
        case ErrorKind::Connection: return "connection";
        case ErrorKind::Http: return "http";
        case ErrorKind::Parse: return "parse";
        case ErrorKind::Provider: return "provider";
        case ErrorKind::Cancelled: return "cancelled";
    }
    return "unknown";
}

Json::Value ChatMessage::to_json() const
{
    Json::Value wire(Json::objectValue);
    wire["role"] = to_string(role);
    wire["content"] = content;
    if (name && !name->empty()) {
        wire["name"] = *name;
    }
    return wire;
}

ProviderResult ProviderResult::ok(std::string text)
{
    ProviderResult result;
    result.success = true;
    result.text = std::move(text);
    return result;
}

ProviderResult ProviderResult::failure(ErrorKind kind, std::string message)
{
    ProviderResult result;
    result.success = false;
    result.error_kind = kind;
    result.error_message = std::move(message);
    return result;
}

PendingQuery::PendingQuery(ProviderResult immediate)
    : result_(std::move(immediate))
{}

PendingQuery::PendingQuery(BackgroundTaskPtr task, Finisher finish)
    : finish_(std::move(finish))
    , task_(std::move(task))
{}

void PendingQuery::cancel()
{
    if (task_) {
        task_->cancel();
    }
}

ProviderResult PendingQuery::wait()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (result_) {
            return *result_;
        }
        if (!task_) {
            result_ = ProviderResult::failure(ErrorKind::Connection, "Request was never started");
            return *result_;
        }
    }

    // task_ is fixed at construction; block without holding mutex_ so ready() stays cheap
    const RequestOutcome outcome = task_->wait();

    std::lock_guard<std::mutex> lock(mutex_);
    if (result_) {
        return *result_;
    }
    if (finish_) {
        result_ = finish_(outcome, task_->chunk_count());
    } else if (outcome.is_success()) {
        result_ = ProviderResult::ok(outcome.body);
    } else {
        result_ = ProviderResult::failure(ErrorKind::Connection, outcome.detail);
    }
    return *result_;
}

bool PendingQuery::ready() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (result_) {
        return true;
    }
    return task_ && task_->wait_for(std::chrono::milliseconds(0)).has_value();
}
