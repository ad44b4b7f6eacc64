/*
 * Server-Sent Events framing
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef EVENT_STREAM_DECODER_HPP
#define EVENT_STREAM_DECODER_HPP

#include <cstddef>
#include <string>
#include <vector>

/**
 * Incremental text/event-stream decoder
 *
 * Bytes may be fed in arbitrary slices. Each completed event yields its
 * data payload (multiple data: lines joined by '\n'). Comment lines and
 * fields other than data are ignored. A "[DONE]" payload ends the stream;
 * later input is discarded.
 */
class EventStreamDecoder {
public:
    std::vector<std::string> feed(const char* data, std::size_t length);
    std::vector<std::string> feed(const std::string& data) { return feed(data.data(), data.size()); }

    /**
     * Flush an event left unterminated at end of input
     */
    std::vector<std::string> finish();

    bool done() const { return done_; }

    /**
     * Number of data payloads emitted so far
     */
    std::size_t event_count() const { return event_count_; }

private:
    void process_line(std::string line, std::vector<std::string>& events);
    void dispatch(std::vector<std::string>& events);

    std::string buffer_;
    std::string data_;
    bool has_data_{false};
    bool done_{false};
    std::size_t event_count_{0};
};

#endif // EVENT_STREAM_DECODER_HPP
