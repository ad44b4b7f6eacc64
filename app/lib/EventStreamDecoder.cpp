/*
 * Server-Sent Events decoder implementation
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "EventStreamDecoder.hpp"

namespace {

constexpr const char* kDoneMarker = "[DONE]";

} // namespace

std::vector<std::string> EventStreamDecoder::feed(const char* data, std::size_t length)
{
    std::vector<std::string> events;
    if (done_) {
        return events;
    }

    buffer_.append(data, length);

    std::size_t start = 0;
    while (!done_) {
        const auto newline = buffer_.find('\n', start);
        if (newline == std::string::npos) {
            break;
        }
        std::string line = buffer_.substr(start, newline - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        start = newline + 1;
        process_line(std::move(line), events);
    }
    buffer_.erase(0, start);
    if (done_) {
        buffer_.clear();
    }
    return events;
}

std::vector<std::string> EventStreamDecoder::finish()
{
    std::vector<std::string> events;
    if (done_) {
        return events;
    }
    if (!buffer_.empty()) {
        std::string line = std::move(buffer_);
        buffer_.clear();
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        process_line(std::move(line), events);
    }
    dispatch(events);
    return events;
}

void EventStreamDecoder::process_line(std::string line, std::vector<std::string>& events)
{
    if (line.empty()) {
        dispatch(events);
        return;
    }
    if (line.front() == ':') {
        return;
    }

    const auto colon = line.find(':');
    const std::string field = colon == std::string::npos ? line : line.substr(0, colon);
    if (field != "data") {
        return;
    }

    std::string value = colon == std::string::npos ? std::string() : line.substr(colon + 1);
    if (!value.empty() && value.front() == ' ') {
        value.erase(0, 1);
    }

    if (has_data_) {
        data_ += '\n';
    }
    data_ += value;
    has_data_ = true;
}

void EventStreamDecoder::dispatch(std::vector<std::string>& events)
{
    if (!has_data_) {
        return;
    }
    std::string payload = std::move(data_);
    data_.clear();
    has_data_ = false;

    if (payload == kDoneMarker) {
        done_ = true;
        return;
    }
    ++event_count_;
    events.push_back(std::move(payload));
}
