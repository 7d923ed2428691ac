#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <thread>

#include "config/config_loader.hpp"
#include "sandbox/errors.hpp"
#include "sandbox/language_profile.hpp"
#include "sandbox/sandbox_executor.hpp"
#include "server/http_server.hpp"
#include "utils/logging.hpp"

namespace {

constexpr int kExitTimedOut = 124;
constexpr int kExitExecutionError = 1;
constexpr int kExitUsage = 2;

volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

void PrintUsage() {
    std::cout << "Usage: runbox serve | runbox languages | runbox run <language> <file|-> [timeout]"
              << std::endl;
}

runbox::config::Config LoadAndConfigure() {
    auto config = runbox::config::LoadConfig();
    runbox::utils::LogConfig log_config;
    log_config.min_level = runbox::utils::ParseLogLevel(config.logging.level);
    runbox::utils::ConfigureLogging(log_config);
    return config;
}

int Serve() {
    const auto config = LoadAndConfigure();
    runbox::sandbox::SandboxExecutor executor(config);
    runbox::server::HttpServer http_server(config, executor);

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    std::atomic<bool> listen_failed{false};
    std::thread http_thread([&http_server, &listen_failed]() {
        if (!http_server.Listen()) {
            listen_failed.store(true);
        }
    });

    std::cout << "runbox server started. Press Ctrl+C to stop." << std::endl;
    while (g_signal == 0 && !listen_failed.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    http_server.Stop();
    if (http_thread.joinable()) {
        http_thread.join();
    }
    return listen_failed.load() ? 1 : 0;
}

int ListLanguages() {
    for (const auto& name : runbox::sandbox::SupportedLanguages()) {
        std::cout << name << std::endl;
    }
    return 0;
}

bool ReadSource(const std::string& path, std::string& code) {
    if (path == "-") {
        code.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        return true;
    }
    std::ifstream input(path, std::ios::in | std::ios::binary);
    if (!input.is_open()) {
        return false;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    code = buffer.str();
    return true;
}

int RunOnce(int argc, char** argv) {
    if (argc < 4) {
        PrintUsage();
        return kExitUsage;
    }
    const auto config = LoadAndConfigure();

    runbox::sandbox::ExecutionRequest request;
    request.language = argv[2];
    if (!ReadSource(argv[3], request.code)) {
        std::cerr << "Failed to read " << argv[3] << std::endl;
        return kExitUsage;
    }
    if (argc >= 5) {
        try {
            request.timeout_seconds = std::stoi(argv[4]);
        } catch (const std::exception&) {
            std::cerr << "Invalid timeout: " << argv[4] << std::endl;
            return kExitUsage;
        }
    }

    try {
        runbox::sandbox::SandboxExecutor executor(config);
        const auto outcome = executor.Execute(request);
        std::cout << outcome.result.combined_output;
        if (!outcome.result.combined_output.empty() && outcome.result.combined_output.back() != '\n') {
            std::cout << std::endl;
        }
        if (outcome.result.timed_out) {
            return kExitTimedOut;
        }
        return outcome.result.exit_code;
    } catch (const runbox::sandbox::ValidationError& ex) {
        std::cerr << ex.what() << std::endl;
        return kExitUsage;
    } catch (const runbox::sandbox::ExecutionError& ex) {
        std::cerr << ex.what() << std::endl;
        return kExitExecutionError;
    }
}

}  // namespace

int main(int argc, char** argv) {
    if (argc >= 2 && std::string(argv[1]) == "serve") {
        return Serve();
    }

    if (argc >= 2 && std::string(argv[1]) == "languages") {
        return ListLanguages();
    }

    if (argc >= 2 && std::string(argv[1]) == "run") {
        return RunOnce(argc, argv);
    }

    PrintUsage();
    return kExitUsage;
}
