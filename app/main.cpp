/*
 * Command-line front end
 * Part of Parley - a multi-provider LLM request dispatcher
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "Configuration.hpp"
#include "Logger.hpp"
#include "ProviderManager.hpp"

#include <csignal>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void handle_interrupt(int)
{
    g_interrupted = 1;
}

void print_usage()
{
    std::cerr << "Usage: parley --config <file> [options] <prompt>\n\n"
              << "Options:\n"
              << "  --config FILE      JSON configuration file\n"
              << "  --profile NAME     Profile from provider_settings (default: configured provider)\n"
              << "  --system TEXT      System message sent before the prompt\n"
              << "  --stream           Print the answer while it arrives\n"
              << "  --log-file FILE    Also write diagnostics to a rotating log file\n"
              << "  --verbose          Debug diagnostics on stderr\n";
}

struct CommandLine {
    std::string config_path;
    std::string profile;
    std::string system;
    std::string log_file;
    std::string prompt;
    bool stream{false};
    bool verbose{false};
};

bool parse_command_line(int argc, char* argv[], CommandLine& command)
{
    std::vector<std::string> args(argv + 1, argv + argc);
    std::vector<std::string> words;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];
        const bool has_value = i + 1 < args.size();
        if (arg == "--config" && has_value) {
            command.config_path = args[++i];
        } else if (arg == "--profile" && has_value) {
            command.profile = args[++i];
        } else if (arg == "--system" && has_value) {
            command.system = args[++i];
        } else if (arg == "--log-file" && has_value) {
            command.log_file = args[++i];
        } else if (arg == "--stream") {
            command.stream = true;
        } else if (arg == "--verbose") {
            command.verbose = true;
        } else if (arg.rfind("--", 0) == 0) {
            std::cerr << "Unknown or incomplete option: " << arg << "\n";
            return false;
        } else {
            words.push_back(arg);
        }
    }

    for (const auto& word : words) {
        if (!command.prompt.empty()) {
            command.prompt += ' ';
        }
        command.prompt += word;
    }
    return !command.config_path.empty() && !command.prompt.empty();
}

} // namespace

int main(int argc, char* argv[])
{
    CommandLine command;
    if (!parse_command_line(argc, argv, command)) {
        print_usage();
        return 2;
    }

    Logger::setup_loggers(command.verbose ? spdlog::level::debug : spdlog::level::warn,
                          command.log_file);

    ConfigurationLoadResult loaded = load_configuration_from_file(command.config_path);
    if (!loaded.success) {
        std::cerr << loaded.error_message << "\n";
        Logger::shutdown();
        return 1;
    }

    AssistantConfiguration configuration = std::move(loaded.configuration);
    if (!command.profile.empty()) {
        configuration.provider = command.profile;
    }
    if (command.stream) {
        for (auto& profile : configuration.profiles) {
            if (profile.name == configuration.selected_profile()) {
                profile.additional_parameters["stream"] = true;
            }
        }
    }

    ProviderManager manager(std::move(configuration));

    std::vector<ChatMessage> messages;
    if (!command.system.empty()) {
        messages.emplace_back(MessageRole::System, command.system);
    }
    messages.emplace_back(MessageRole::User, command.prompt);

    QueryOptions options;
    options.on_chunk = [](const std::string& chunk) {
        std::cout << chunk << std::flush;
    };

    std::signal(SIGINT, handle_interrupt);

    PendingQueryPtr pending = manager.query_async(messages, options);
    while (!pending->ready()) {
        if (g_interrupted) {
            pending->cancel();
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    const ProviderResult result = pending->wait();

    int exit_code = 0;
    if (result.success) {
        if (result.chunk_count == 0) {
            std::cout << result.text;
        }
        std::cout << std::endl;
    } else {
        std::cerr << result.error_message << std::endl;
        exit_code = 1;
    }

    Logger::shutdown();
    return exit_code;
}
