#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "cxxopts.hpp"
#include "core/logger.h"
#include "core/sign_client.h"

// Prints the reply body and maps it to an exit code: 0 on 2xx, 2 when the
// server answered with an error, 3 when it could not be reached.
int report(const sign_core::ClientReply& reply) {
    if (!reply.reached()) {
        std::cerr << "Error: " << reply.transportError << std::endl;
        return 3;
    }
    auto json = reply.json();
    if (json) {
        std::cout << json->dump(2) << std::endl;
    } else {
        std::cout << reply.body << std::endl;
    }
    if (reply.statusCode < 200 || reply.statusCode >= 300) {
        std::cerr << "HTTP " << reply.statusCode << std::endl;
        return 2;
    }
    return 0;
}

bool readFile(const std::string& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return false;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    out = buffer.str();
    return true;
}

int runAction(const cxxopts::ParseResult& result) {
    const std::string action = result["action"].as<std::string>();
    sign_core::SignClient client(result["server"].as<std::string>(),
                                 std::chrono::milliseconds(result["timeout-ms"].as<long long>()));

    if (action == "health") {
        return report(client.health());
    }
    if (action == "status") {
        return report(client.status());
    }
    if (action == "rollback") {
        return report(client.rollbackScript());
    }
    if (action == "push-script" || action == "push-rules") {
        if (!result.count("file")) {
            std::cerr << "Error: " << action << " needs --file <path>." << std::endl;
            return 1;
        }
        std::string content;
        const std::string path = result["file"].as<std::string>();
        if (!readFile(path, content)) {
            std::cerr << "Error: cannot read " << path << std::endl;
            return 1;
        }
        if (action == "push-script") {
            return report(client.pushScript(content));
        }
        try {
            return report(client.pushRules(nlohmann::json::parse(content)));
        } catch (const nlohmann::json::parse_error& e) {
            std::cerr << "Error: " << path << " is not valid JSON: " << e.what() << std::endl;
            return 1;
        }
    }
    if (action == "sign") {
        if (!result.count("uri") || !result.count("platform")) {
            std::cerr << "Error: sign needs --uri and --platform." << std::endl;
            return 1;
        }
        sign_core::SigningRequest request;
        request.targetUri = result["uri"].as<std::string>();
        request.platform = result["platform"].as<std::string>();
        request.clientUserAgent = result["user-agent"].as<std::string>();

        // --params is sent as an object when it parses as one, else as a string.
        const std::string params = result["params"].as<std::string>();
        try {
            auto parsed = nlohmann::json::parse(params);
            request.parameters = parsed.is_object() ? parsed : nlohmann::json(params);
        } catch (const nlohmann::json::parse_error&) {
            request.parameters = params;
        }
        return report(client.sign(request));
    }

    std::cerr << "Error: unknown action '" << action
              << "'. Use sign, push-script, push-rules, rollback, health or status." << std::endl;
    return 1;
}

int main(int argc, char* argv[]) {
    cxxopts::Options options("sign-cli", "Client for a running sign-server");
    options.set_width(100);
    options.add_options()
        ("h,help", "Print usage")
        ("a,action", "sign, push-script, push-rules, rollback, health or status", cxxopts::value<std::string>())
        ("S,server", "Server base URL", cxxopts::value<std::string>()->default_value("http://127.0.0.1:8045"))
        ("u,uri", "Target URI to sign (sign)", cxxopts::value<std::string>())
        ("p,platform", "Platform tag, e.g. dy (sign)", cxxopts::value<std::string>())
        ("params", "Query string or JSON object to sign", cxxopts::value<std::string>()->default_value(""))
        ("user-agent", "Client user agent passed to the script",
            cxxopts::value<std::string>()->default_value("Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36"))
        ("f,file", "Script or rules file (push-script, push-rules)", cxxopts::value<std::string>())
        ("timeout-ms", "Request timeout", cxxopts::value<long long>()->default_value("5000"))
        ("v,verbose", "Log requests", cxxopts::value<bool>()->default_value("false"))
    ;
    options.positional_help("<action>");
    options.parse_positional({"action"});

    try {
        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("action")) {
            std::cout << options.help() << std::endl;
            return result.count("help") ? 0 : 1;
        }
        sign_core::Logger::setLevel(result["verbose"].as<bool>() ? sign_core::LogLevel::DEBUG
                                                                 : sign_core::LogLevel::WARN);
        return runAction(result);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << "Use --help for more information." << std::endl;
        return 1;
    }
}
