#include "TransportFactory.hpp"
#include "CurlTransport.hpp"
#include "Logger.hpp"
#include "ProcessTransport.hpp"

#include <system_error>

HostEnvironment HostEnvironment::detect()
{
    HostEnvironment environment;
    std::error_code ec;
    if (std::filesystem::exists("/etc/prettyversion.txt", ec)) {
        environment.native_tls_reliable = false;
        environment.verify_tls = false;
    }
    return environment;
}

TransportMode parse_transport_mode(const std::string& text)
{
    if (text == "native") {
        return TransportMode::Native;
    }
    if (text == "process") {
        return TransportMode::Process;
    }
    return TransportMode::Auto;
}

bool TransportFactory::use_process_transport(const HostEnvironment& environment)
{
    switch (environment.mode) {
        case TransportMode::Native: return false;
        case TransportMode::Process: return true;
        case TransportMode::Auto:
        default:
            return !environment.native_tls_reliable;
    }
}

TransportPtr TransportFactory::create(const HostEnvironment& environment)
{
    if (use_process_transport(environment)) {
        ProcessTransport::Options options;
        options.curl_executable = environment.curl_executable;
        options.temp_dir = environment.temp_dir;
        options.verify_tls = environment.verify_tls;

        if (auto logger = Logger::get_logger(Logger::kNetLogger)) {
            logger->info("Using process transport ({})", options.curl_executable);
        }
        return std::make_shared<ProcessTransport>(std::move(options));
    }

    CurlTransport::Options options;
    options.verify_tls = environment.verify_tls;
    if (auto logger = Logger::get_logger(Logger::kNetLogger)) {
        logger->info("Using native libcurl transport");
    }
    return std::make_shared<CurlTransport>(std::move(options));
}
