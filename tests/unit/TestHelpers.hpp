/*
 * Shared helpers for unit tests
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef TEST_HELPERS_HPP
#define TEST_HELPERS_HPP

#include "ITransport.hpp"
#include "JsonSupport.hpp"
#include "RequestExecutor.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <sys/stat.h>

/**
 * Unique temporary directory removed with its contents on destruction
 */
class TempDir {
public:
    TempDir()
    {
        std::string pattern = (std::filesystem::temp_directory_path() / "parley-test-XXXXXX").string();
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');
        if (!mkdtemp(buffer.data())) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = buffer.data();
    }

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    std::size_t file_count() const
    {
        std::error_code ec;
        std::size_t count = 0;
        for (auto it = std::filesystem::directory_iterator(path_, ec);
             !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
            ++count;
        }
        return count;
    }

private:
    std::filesystem::path path_;
};

inline std::string read_file(const std::filesystem::path& path)
{
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline void write_file(const std::filesystem::path& path, const std::string& contents)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << contents;
}

inline Json::Value parse_json(const std::string& text)
{
    Json::Value root;
    if (!JsonSupport::parse(text, root)) {
        throw std::runtime_error("invalid JSON in test: " + text);
    }
    return root;
}

/**
 * Executable shell script standing in for curl
 *
 * Records its arguments, header file and body file next to itself, writes
 * response_body to the -o file, prints status on stdout, writes
 * stderr_text to stderr and exits with exit_code. A non-empty
 * before_exit line runs last (e.g. "exec sleep 10").
 */
inline std::filesystem::path write_fake_curl(const std::filesystem::path& dir,
                                             const std::string& response_body,
                                             int status,
                                             int exit_code = 0,
                                             const std::string& stderr_text = "",
                                             const std::string& before_exit = "")
{
    const auto script = dir / "fake-curl.sh";
    write_file(dir / "response.txt", response_body);

    std::ostringstream text;
    text << "#!/bin/sh\n"
         << "DIR='" << dir.string() << "'\n"
         << "printf '%s\\n' \"$@\" > \"$DIR/args.txt\"\n"
         << "out=''\n"
         << "while [ $# -gt 0 ]; do\n"
         << "  case \"$1\" in\n"
         << "    -o) out=\"$2\"; shift 2 ;;\n"
         << "    -H) cp \"${2#@}\" \"$DIR/headers.txt\"; shift 2 ;;\n"
         << "    --data-binary) cp \"${2#@}\" \"$DIR/body.txt\"; shift 2 ;;\n"
         << "    *) shift ;;\n"
         << "  esac\n"
         << "done\n";
    if (!before_exit.empty()) {
        text << before_exit << "\n";
    }
    if (exit_code == 0) {
        text << "cp \"$DIR/response.txt\" \"$out\"\n"
             << "printf '%s' '" << status << "'\n";
    } else {
        text << "printf '%s' '" << stderr_text << "' >&2\n";
    }
    text << "exit " << exit_code << "\n";

    write_file(script, text.str());
    chmod(script.c_str(), 0755);
    return script;
}

/**
 * Scripted transport: records requests and replays queued replies
 */
class FakeTransport : public ITransport {
public:
    struct Reply {
        RequestOutcome outcome;
        std::vector<std::string> stream_chunks;      // Fed to the data sink before returning
        std::chrono::milliseconds delay{0};
        bool hang_until_cancelled{false};
    };

    using Responder = std::function<Reply(const HttpRequest& request)>;

    std::string name() const override { return "fake"; }

    void push(Reply reply)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        replies_.push_back(std::move(reply));
    }

    void push(RequestOutcome outcome)
    {
        Reply reply;
        reply.outcome = std::move(outcome);
        push(std::move(reply));
    }

    void push_json(int status, const std::string& body)
    {
        push(RequestOutcome::from_status(status, body));
    }

    /**
     * Dynamic replies take precedence over the queue
     */
    void set_responder(Responder responder)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        responder_ = std::move(responder);
    }

    RequestOutcome send(const HttpRequest& request,
                        const TimeoutPolicy& timeouts,
                        const CancellationToken& cancel,
                        const DataSink& on_data = nullptr) override
    {
        Reply reply;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
            timeouts_.push_back(timeouts);
            if (responder_) {
                reply = responder_(request);
            } else if (!replies_.empty()) {
                reply = std::move(replies_.front());
                replies_.pop_front();
            } else {
                reply.outcome = RequestOutcome::connection_error("no scripted reply");
            }
        }
        ++calls_;

        if (reply.hang_until_cancelled) {
            cancel.wait_for(std::chrono::seconds(10));
            return cancel.is_cancelled() ? RequestOutcome::cancelled()
                                         : RequestOutcome::connection_error("hung request not cancelled");
        }
        if (reply.delay.count() > 0 && cancel.wait_for(reply.delay)) {
            return RequestOutcome::cancelled();
        }
        if (on_data) {
            for (const auto& chunk : reply.stream_chunks) {
                if (cancel.is_cancelled()) {
                    return RequestOutcome::cancelled();
                }
                on_data(chunk.data(), chunk.size());
            }
        }
        return reply.outcome;
    }

    int calls() const { return calls_.load(); }

    std::vector<HttpRequest> requests() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    HttpRequest last_request() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.empty() ? HttpRequest{} : requests_.back();
    }

    TimeoutPolicy last_timeouts() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return timeouts_.empty() ? TimeoutPolicy{} : timeouts_.back();
    }

private:
    mutable std::mutex mutex_;
    std::deque<Reply> replies_;
    Responder responder_;
    std::vector<HttpRequest> requests_;
    std::vector<TimeoutPolicy> timeouts_;
    std::atomic<int> calls_{0};
};

/**
 * Retry policy without delays for fast tests
 */
inline RetryPolicy fast_retries(int max_retries = 2)
{
    RetryPolicy policy;
    policy.max_retries = max_retries;
    policy.retry_delay = std::chrono::milliseconds(1);
    return policy;
}

#endif // TEST_HELPERS_HPP
