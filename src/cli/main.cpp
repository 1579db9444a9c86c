#include <csignal>
#include <cstdint>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "cxxopts.hpp"
#include "core/http_server.h"
#include "core/logger.h"
#include "core/service_config.h"
#include "core/signing_service.h"

// Splits "xhs,dy,bili" into its non-empty items.
std::vector<std::string> splitList(const std::string& text) {
    std::vector<std::string> items;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item.erase(0, item.find_first_not_of(" \t"));
        item.erase(item.find_last_not_of(" \t") + 1);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

// Command-line values override whatever the config file set.
bool applyCommandLine(const cxxopts::ParseResult& result, sign_core::ServiceConfig& config, std::string& error) {
    if (result.count("host")) config.host = result["host"].as<std::string>();
    if (result.count("port")) {
        int port = result["port"].as<int>();
        if (port < 1 || port > 65535) {
            error = "--port must be between 1 and 65535";
            return false;
        }
        config.port = static_cast<unsigned short>(port);
    }
    if (result.count("script")) config.scriptPath = result["script"].as<std::string>();
    if (result.count("rules")) config.rulesPath = result["rules"].as<std::string>();
    if (result.count("platforms")) config.platforms = splitList(result["platforms"].as<std::string>());
    if (result.count("log-level")) config.logLevel = result["log-level"].as<std::string>();
    if (result.count("log-file")) config.logFile = result["log-file"].as<std::string>();

    auto positive = [&](const char* name, long long& out) {
        if (!result.count(name)) return true;
        long long value = result[name].as<long long>();
        if (value <= 0) {
            error = std::string("--") + name + " must be positive";
            return false;
        }
        out = value;
        return true;
    };

    long long poolSize = static_cast<long long>(config.pool.size);
    long long acquireMs = config.pool.acquireTimeout.count();
    long long invokeMs = config.invocationTimeout.count();
    long long maxInvocations = static_cast<long long>(config.pool.maxInvocationsPerContext);
    if (!positive("pool-size", poolSize) || !positive("acquire-timeout-ms", acquireMs) ||
        !positive("invoke-timeout-ms", invokeMs) || !positive("max-invocations", maxInvocations)) {
        return false;
    }
    config.pool.size = static_cast<std::size_t>(poolSize);
    config.pool.acquireTimeout = std::chrono::milliseconds(acquireMs);
    config.invocationTimeout = std::chrono::milliseconds(invokeMs);
    config.pool.maxInvocationsPerContext = static_cast<std::uint64_t>(maxInvocations);

    if (result.count("memory-limit-mb")) {
        long long limitMb = result["memory-limit-mb"].as<long long>();
        if (limitMb < 0) {
            error = "--memory-limit-mb must not be negative";
            return false;
        }
        config.pool.memoryLimitBytes = static_cast<std::size_t>(limitMb) * 1024 * 1024;
    }
    return true;
}

int serve(const cxxopts::ParseResult& result) {
    sign_core::ServiceConfig config;
    std::string error;
    if (result.count("config") && !sign_core::loadConfigFile(result["config"].as<std::string>(), config, error)) {
        std::cerr << "Error: " << error << std::endl;
        return 1;
    }
    if (!applyCommandLine(result, config, error) ||
        !sign_core::loadRulesFile(config, error) ||
        !sign_core::validateConfig(config, error)) {
        std::cerr << "Error: " << error << std::endl;
        return 1;
    }
    if (config.scriptPath.empty()) {
        std::cerr << "Error: an algorithm script is required. Use --script <file> or \"script\" in the config." << std::endl;
        return 1;
    }

    sign_core::LogLevel level = sign_core::LogLevel::INFO;
    sign_core::Logger::parseLevel(config.logLevel, level);
    sign_core::Logger::setLevel(level);
    if (!config.logFile.empty() && !sign_core::Logger::openFile(config.logFile)) {
        std::cerr << "Warning: cannot open log file " << config.logFile << ", logging to stderr only" << std::endl;
    }

    std::unique_ptr<sign_core::SigningService> service;
    try {
        service = std::make_unique<sign_core::SigningService>(config);
    } catch (const sign_core::SignError& e) {
        LOG_ERROR("main", std::string("Startup failed (") + sign_core::errorKindName(e.kind()) + "): " + e.what());
        return 1;
    }

    sign_core::HttpServer server(*service, config.host, config.port);

    boost::asio::io_context signals_ioc;
    boost::asio::signal_set signals(signals_ioc, SIGINT, SIGTERM);
    signals.async_wait([&server](const boost::system::error_code& ec, int signal) {
        if (!ec) {
            LOG_INFO("main", "Signal " + std::to_string(signal) + " received, shutting down");
            server.stop();
        }
    });
    std::thread signalThread([&signals_ioc] { signals_ioc.run(); });

    bool ok = server.run();

    signals_ioc.stop();
    signalThread.join();
    return ok ? 0 : 1;
}

int main(int argc, char* argv[]) {
    cxxopts::Options options("sign-server", "Warm-sandbox request signing service\nVersion " +
                             std::string(sign_core::kServiceVersion));
    options.set_width(100);
    options.add_options()
        ("h,help", "Print usage")
        ("c,config", "JSON config file; command-line options override it", cxxopts::value<std::string>())
        ("host", "Listen address (default 0.0.0.0)", cxxopts::value<std::string>())
        ("p,port", "Listen port (default 8045)", cxxopts::value<int>())
        ("s,script", "Algorithm script (JavaScript) to load at startup", cxxopts::value<std::string>())
        ("r,rules", "Dispatch rules JSON file", cxxopts::value<std::string>())
        ("pool-size", "Number of warm sandbox contexts (default 4)", cxxopts::value<long long>())
        ("acquire-timeout-ms", "Max wait for a free context (default 2000)", cxxopts::value<long long>())
        ("invoke-timeout-ms", "Max run time of one script call (default 1000)", cxxopts::value<long long>())
        ("max-invocations", "Calls served by a context before it is rebuilt (default 10000)", cxxopts::value<long long>())
        ("memory-limit-mb", "Heap cap per sandbox context, 0 for none (default 64)", cxxopts::value<long long>())
        ("platforms", "Comma-separated platform tags, e.g. xhs,dy,bili,wb,ks", cxxopts::value<std::string>())
        ("log-level", "debug, info, warn or error", cxxopts::value<std::string>())
        ("log-file", "Also append log lines to this file", cxxopts::value<std::string>())
    ;

    try {
        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            return 0;
        }
        return serve(result);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << "Use --help for more information." << std::endl;
        return 1;
    }
}
