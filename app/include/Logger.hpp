/*
 * Named spdlog loggers shared across the library
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

/**
 * Registry facade over spdlog
 *
 * Loggers exist only after setup_loggers() has been called. Library code
 * must tolerate get_logger() returning nullptr, so that embedding hosts
 * which never configure logging get a silent library.
 */
class Logger {
public:
    static constexpr const char* kCoreLogger = "core_logger";
    static constexpr const char* kNetLogger = "net_logger";

    /**
     * Create the core and net loggers
     * @param level Minimum level emitted by both loggers
     * @param log_file Optional path of a rotating log file (empty = console only)
     */
    static void setup_loggers(spdlog::level::level_enum level = spdlog::level::info,
                              const std::string& log_file = "");

    /**
     * Look up a logger by name
     * @return Logger or nullptr when logging was never set up
     */
    static std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

    /**
     * Drop all registered loggers
     */
    static void shutdown();
};

#endif // LOGGER_HPP
