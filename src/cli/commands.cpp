#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <signal.h>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "config/config_loader.hpp"
#include "httplib.h"
#include "nlohmann/json.hpp"
#include "sandbox/execution_result.hpp"
#include "sandbox/script_runner.hpp"
#include "server/http_server.hpp"
#include "server/service.hpp"
#include "utils/logging.hpp"

namespace {

std::atomic<bool> g_running{true};
volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

void PrintUsage() {
    std::cout << "Usage:\n"
              << "  scriptbox serve\n"
              << "  scriptbox run <python|r|scilab> <file> [--data <json>] [--timeout <seconds>]\n"
              << "  scriptbox validate <python|r|scilab> <file>\n"
              << "  scriptbox scripts [--category <name>] [--source-type <type>]\n"
              << "  scriptbox schema <script_id>\n"
              << "  scriptbox exec <script_id> [<input json>]\n";
}

std::optional<std::string> ReadFile(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

// Value following `flag`, if present.
std::optional<std::string> FlagValue(const std::vector<std::string>& args, const std::string& flag) {
    for (std::size_t i = 0; i + 1 < args.size(); ++i) {
        if (args[i] == flag) {
            return args[i + 1];
        }
    }
    return std::nullopt;
}

scriptbox::config::Config LoadConfigured() {
    auto config = scriptbox::config::LoadConfig();
    scriptbox::utils::LogConfig log_config{};
    log_config.min_level = scriptbox::utils::ParseLogLevel(config.logging.level);
    scriptbox::utils::SetLogConfig(log_config);
    return config;
}

int RunServe() {
    auto config = LoadConfigured();
    scriptbox::server::Service service(config);

    httplib::Server http_server;
    scriptbox::server::RegisterRoutes(http_server, service);

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    const std::string host = config.server.host;
    const int port = config.server.port;
    std::atomic<bool> listen_failed{false};
    std::thread http_thread([&http_server, &listen_failed, host, port]() {
        const bool ok = http_server.listen(host, port);
        if (!ok) {
            scriptbox::utils::Log(scriptbox::utils::LogLevel::kError, "server", "failed to listen",
                                  {{"host", host}, {"port", std::to_string(port)}});
            listen_failed.store(true);
            g_running.store(false);
        }
    });

    std::cout << "scriptbox listening on " << host << ":" << port
              << ". Press Ctrl+C to stop." << std::endl;
    bool shutdown_guard_started = false;
    while (g_running.load()) {
        if (g_signal != 0) {
            g_running.store(false);
            if (!shutdown_guard_started) {
                shutdown_guard_started = true;
                std::thread([] {
                    std::this_thread::sleep_for(std::chrono::seconds(5));
                    std::_Exit(130);
                }).detach();
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    http_server.stop();
    if (http_thread.joinable()) {
        http_thread.join();
    }
    return listen_failed.load() ? 1 : 0;
}

int RunScript(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        PrintUsage();
        return 1;
    }
    const auto content = ReadFile(args[1]);
    if (!content) {
        std::cerr << "Cannot read " << args[1] << std::endl;
        return 1;
    }

    scriptbox::sandbox::ExecutionRequest request{};
    request.language = args[0];
    request.script_text = *content;
    if (const auto data = FlagValue(args, "--data")) {
        request.data = nlohmann::json::parse(*data, nullptr, false);
        if (request.data.is_discarded()) {
            std::cerr << "--data is not valid JSON" << std::endl;
            return 1;
        }
    }
    if (const auto timeout = FlagValue(args, "--timeout")) {
        char* end = nullptr;
        const long value = std::strtol(timeout->c_str(), &end, 10);
        if (end == timeout->c_str() || *end != '\0') {
            std::cerr << "--timeout must be an integer" << std::endl;
            return 1;
        }
        request.timeout_seconds = static_cast<int>(value);
    }

    scriptbox::sandbox::ScriptRunner runner(LoadConfigured());
    const auto result = runner.Run(request);
    std::cout << scriptbox::sandbox::DumpJson(scriptbox::sandbox::ToJson(result)) << std::endl;
    return result.success ? 0 : 2;
}

int ValidateScript(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        PrintUsage();
        return 1;
    }
    const auto content = ReadFile(args[1]);
    if (!content) {
        std::cerr << "Cannot read " << args[1] << std::endl;
        return 1;
    }
    scriptbox::sandbox::ScriptRunner runner(LoadConfigured());
    const auto report = runner.Validate(*content, args[0]);
    std::cout << scriptbox::sandbox::DumpJson(report.ToJson()) << std::endl;
    return report.valid ? 0 : 2;
}

int ListScripts(const std::vector<std::string>& args) {
    scriptbox::server::Service service(LoadConfigured());
    const auto entries = service.Registry().List(FlagValue(args, "--category").value_or(""),
                                                 FlagValue(args, "--source-type").value_or(""));
    nlohmann::json scripts = nlohmann::json::array();
    for (const auto& entry : entries) {
        scripts.push_back(scriptbox::registry::ToSummaryJson(entry));
    }
    std::cout << scriptbox::sandbox::DumpJson(scripts) << std::endl;
    return 0;
}

int ShowSchema(const std::vector<std::string>& args) {
    if (args.empty()) {
        PrintUsage();
        return 1;
    }
    scriptbox::server::Service service(LoadConfigured());
    const auto schema = service.Registry().GetSchema(args[0]);
    std::cout << scriptbox::sandbox::DumpJson(schema) << std::endl;
    return schema.contains("error") ? 1 : 0;
}

int ExecuteRegistered(const std::vector<std::string>& args) {
    if (args.empty()) {
        PrintUsage();
        return 1;
    }
    nlohmann::json input = nlohmann::json::object();
    if (args.size() >= 2) {
        input = nlohmann::json::parse(args[1], nullptr, false);
        if (input.is_discarded()) {
            std::cerr << "input is not valid JSON" << std::endl;
            return 1;
        }
    }
    scriptbox::server::Service service(LoadConfigured());
    const auto outcome = service.Registry().Execute(args[0], input);
    std::cout << scriptbox::sandbox::DumpJson(outcome.ToJson()) << std::endl;
    return outcome.success ? 0 : 2;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 1;
    }
    const std::string command = argv[1];
    const std::vector<std::string> args(argv + 2, argv + argc);

    try {
        if (command == "serve") {
            return RunServe();
        }
        if (command == "run") {
            return RunScript(args);
        }
        if (command == "validate") {
            return ValidateScript(args);
        }
        if (command == "scripts") {
            return ListScripts(args);
        }
        if (command == "schema") {
            return ShowSchema(args);
        }
        if (command == "exec") {
            return ExecuteRegistered(args);
        }
    } catch (const std::exception& ex) {
        scriptbox::utils::Log(scriptbox::utils::LogLevel::kError, "cli", "command failed",
                              {{"command", command}, {"error", ex.what()}});
        return 1;
    }
    PrintUsage();
    return 1;
}
