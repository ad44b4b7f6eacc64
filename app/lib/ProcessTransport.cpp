/*
 * Process-based curl transport implementation
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "ProcessTransport.hpp"
#include "Logger.hpp"
#include "Redaction.hpp"
#include "ScopedTempFile.hpp"

#include <cerrno>
#include <cstring>
#include <iomanip>
#include <sstream>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

constexpr int kExecFailedExitCode = 127;

std::string format_seconds(std::chrono::milliseconds duration)
{
    std::ostringstream out;
    out << std::fixed << std::setprecision(3) << static_cast<double>(duration.count()) / 1000.0;
    return out.str();
}

// Header lines for `-H @file`; CR/LF inside values would split headers.
std::string serialize_headers(const HttpHeaders& headers)
{
    std::string out;
    for (const auto& [key, value] : headers) {
        std::string line = key + ": " + value;
        for (char& c : line) {
            if (c == '\r' || c == '\n') {
                c = ' ';
            }
        }
        out += line;
        out += '\n';
    }
    return out;
}

void close_fd(int& fd)
{
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

int wait_child(pid_t pid)
{
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return -1;
        }
    }
    return status;
}

struct ChildOutput {
    std::string out;
    std::string err;
    int poll_error{0};
};

enum class PumpResult {
    Finished,
    Cancelled,
    TimedOut,
    Failed,
};

// Drain stdout/stderr until both close, watching for cancellation and the deadline.
PumpResult pump_child(int out_fd, int err_fd, ChildOutput& output,
                      const CancellationToken& cancel,
                      std::chrono::steady_clock::time_point deadline,
                      std::chrono::milliseconds poll_interval)
{
    int fds[2] = {out_fd, err_fd};
    std::string* sinks[2] = {&output.out, &output.err};
    char buffer[4096];

    while (fds[0] >= 0 || fds[1] >= 0) {
        if (cancel.is_cancelled()) {
            return PumpResult::Cancelled;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return PumpResult::TimedOut;
        }

        pollfd pfds[2];
        nfds_t count = 0;
        int index_of[2] = {-1, -1};
        for (int i = 0; i < 2; ++i) {
            if (fds[i] >= 0) {
                pfds[count].fd = fds[i];
                pfds[count].events = POLLIN;
                pfds[count].revents = 0;
                index_of[count] = i;
                ++count;
            }
        }

        const int ready = poll(pfds, count, static_cast<int>(poll_interval.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            output.poll_error = errno;
            return PumpResult::Failed;
        }

        for (nfds_t p = 0; p < count; ++p) {
            if (pfds[p].revents == 0) {
                continue;
            }
            const int i = index_of[p];
            const ssize_t n = read(fds[i], buffer, sizeof(buffer));
            if (n > 0) {
                sinks[i]->append(buffer, static_cast<size_t>(n));
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                fds[i] = -1;
            }
        }
    }
    return PumpResult::Finished;
}

std::string trim(const std::string& text)
{
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

} // namespace

ProcessTransport::ProcessTransport()
    : ProcessTransport(Options{})
{}

ProcessTransport::ProcessTransport(Options options)
    : options_(std::move(options))
{}

std::vector<std::string> ProcessTransport::build_arguments(const HttpRequest& request,
                                                           const TimeoutPolicy& timeouts,
                                                           const std::string& header_file,
                                                           const std::string& body_file,
                                                           const std::string& response_file) const
{
    std::vector<std::string> args = {
        options_.curl_executable,
        "-sS",
        "-X", "POST",
        "-H", "@" + header_file,
        "--data-binary", "@" + body_file,
        "-o", response_file,
        "-w", "%{http_code}",
        "--connect-timeout", format_seconds(timeouts.connect_timeout),
        "--max-time", format_seconds(timeouts.overall_timeout),
    };
    if (!options_.verify_tls) {
        args.emplace_back("-k");
    }
    args.push_back(request.url);
    return args;
}

RequestOutcome ProcessTransport::send(const HttpRequest& request,
                                      const TimeoutPolicy& timeouts,
                                      const CancellationToken& cancel,
                                      const DataSink& on_data)
{
    if (cancel.is_cancelled()) {
        return RequestOutcome::cancelled();
    }

    const auto secrets = Redaction::collect_secrets(request);

    // Destructors remove all three files on every return below.
    ScopedTempFile body_file(options_.temp_dir, "parley-request-");
    ScopedTempFile header_file(options_.temp_dir, "parley-headers-");
    ScopedTempFile response_file(options_.temp_dir, "parley-response-");

    for (ScopedTempFile* file : {&body_file, &header_file, &response_file}) {
        if (!file->ok()) {
            return RequestOutcome::connection_error(file->error());
        }
    }
    if (!body_file.write(request.body)) {
        return RequestOutcome::connection_error(body_file.error());
    }
    if (!header_file.write(serialize_headers(request.headers))) {
        return RequestOutcome::connection_error(header_file.error());
    }

    const auto args = build_arguments(request, timeouts, header_file.path(),
                                      body_file.path(), response_file.path());
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    if (auto logger = Logger::get_logger(Logger::kNetLogger)) {
        logger->debug("ProcessTransport sending {} via {}",
                      Redaction::describe_request(request), options_.curl_executable);
    }

    // Close-on-exec: concurrent children must not inherit each other's pipe ends.
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (pipe2(out_pipe, O_CLOEXEC) != 0) {
        return RequestOutcome::connection_error(std::string("pipe() failed: ") + std::strerror(errno));
    }
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        const std::string detail = std::string("pipe() failed: ") + std::strerror(errno);
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        return RequestOutcome::connection_error(detail);
    }

    const pid_t pid = fork();
    if (pid < 0) {
        const std::string detail = std::string("fork() failed: ") + std::strerror(errno);
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        close_fd(err_pipe[0]);
        close_fd(err_pipe[1]);
        return RequestOutcome::connection_error(detail);
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only.
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(err_pipe[0]);
        close(err_pipe[1]);
        const int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        execvp(argv[0], argv.data());
        _exit(kExecFailedExitCode);
    }

    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);

    const auto deadline = std::chrono::steady_clock::now() + timeouts.overall_timeout
                          + options_.deadline_grace;
    ChildOutput output;
    const PumpResult pumped = pump_child(out_pipe[0], err_pipe[0], output, cancel,
                                         deadline, options_.poll_interval);
    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);

    if (pumped != PumpResult::Finished) {
        kill(pid, SIGKILL);
        wait_child(pid);
        if (pumped == PumpResult::Cancelled) {
            if (auto logger = Logger::get_logger(Logger::kNetLogger)) {
                logger->debug("ProcessTransport request cancelled, curl process killed");
            }
            return RequestOutcome::cancelled();
        }
        if (pumped == PumpResult::Failed) {
            return RequestOutcome::connection_error(std::string("poll() failed: ")
                                                    + std::strerror(output.poll_error));
        }
        return RequestOutcome::connection_error("curl process exceeded the overall timeout");
    }

    const int status = wait_child(pid);
    if (cancel.is_cancelled()) {
        return RequestOutcome::cancelled();
    }
    if (status < 0) {
        return RequestOutcome::connection_error(std::string("waitpid() failed: ") + std::strerror(errno));
    }
    if (!WIFEXITED(status)) {
        return RequestOutcome::connection_error("curl process terminated abnormally");
    }

    const int exit_code = WEXITSTATUS(status);
    if (exit_code == kExecFailedExitCode) {
        return RequestOutcome::connection_error("Failed to execute " + options_.curl_executable);
    }
    if (exit_code != 0) {
        std::string detail = "curl exited with code " + std::to_string(exit_code);
        const std::string stderr_text = trim(output.err);
        if (!stderr_text.empty()) {
            detail += ": " + stderr_text;
        }
        detail = Redaction::redact_secrets(detail, secrets);
        if (auto logger = Logger::get_logger(Logger::kNetLogger)) {
            logger->warn("ProcessTransport connection failure: {}", detail);
        }
        return RequestOutcome::connection_error(std::move(detail));
    }

    int http_status = 0;
    try {
        http_status = std::stoi(trim(output.out));
    } catch (const std::exception&) {
        http_status = 0;
    }
    if (http_status < 100) {
        return RequestOutcome::connection_error("curl reported no HTTP status (output: '" +
                                                trim(output.out) + "')");
    }

    std::string body;
    if (!response_file.read(body)) {
        return RequestOutcome::connection_error(response_file.error());
    }

    if (auto logger = Logger::get_logger(Logger::kNetLogger)) {
        logger->debug("ProcessTransport received HTTP {} ({} bytes)", http_status, body.size());
    }

    RequestOutcome outcome = RequestOutcome::from_status(http_status, std::move(body));
    if (outcome.is_success() && on_data && !outcome.body.empty()) {
        on_data(outcome.body.data(), outcome.body.size());
    }
    return outcome;
}
