/*
 * Fallback transport that shells out to the curl executable
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef PROCESS_TRANSPORT_HPP
#define PROCESS_TRANSPORT_HPP

#include "ITransport.hpp"
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

/**
 * Transport for hosts where the in-process TLS stack is unreliable
 * (e-readers with stale OpenSSL builds)
 *
 * Each send() writes the body and headers to uniquely named temporary
 * files, runs `curl` with fork/execvp (no shell involved), reads the
 * response from a third temporary file and the status code from stdout.
 * All temporary files are removed on every exit path. Cancellation kills
 * the child process.
 */
class ProcessTransport : public ITransport {
public:
    struct Options {
        std::string curl_executable{"curl"};
        std::filesystem::path temp_dir;          // empty = system temp directory
        bool verify_tls{true};
        std::chrono::milliseconds poll_interval{50};
        std::chrono::milliseconds deadline_grace{5000};  // past overall_timeout before the child is killed
    };

    ProcessTransport();
    explicit ProcessTransport(Options options);
    ~ProcessTransport() override = default;

    std::string name() const override { return "process"; }

    RequestOutcome send(const HttpRequest& request,
                        const TimeoutPolicy& timeouts,
                        const CancellationToken& cancel,
                        const DataSink& on_data = nullptr) override;

    /**
     * Argument vector for one invocation (argv[0] is the executable)
     */
    std::vector<std::string> build_arguments(const HttpRequest& request,
                                             const TimeoutPolicy& timeouts,
                                             const std::string& header_file,
                                             const std::string& body_file,
                                             const std::string& response_file) const;

    const Options& options() const { return options_; }

private:
    Options options_;
};

#endif // PROCESS_TRANSPORT_HPP
