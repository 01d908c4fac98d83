#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config/config_loader.hpp"
#include "docker/docker_client.hpp"
#include "errors/errors.hpp"
#include "sandbox/sandbox_manager.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"
#include "utils/text.hpp"

namespace {

constexpr const char* kDefaultOutputPath = "/tmp/kalibox_output.txt";

constexpr int kExitOk = 0;
constexpr int kExitCommandFailed = 1;
constexpr int kExitRuntimeFailed = 2;

struct RunOptions {
    std::string command;
    std::string output_path = kDefaultOutputPath;
    std::optional<int> timeout_s;
};

void PrintUsage() {
    std::cout << "Usage:\n"
              << "  kalibox ping\n"
              << "  kalibox run [--timeout SECONDS] [--output PATH] <command...>\n"
              << "  kalibox help" << std::endl;
}

std::optional<RunOptions> ParseRunOptions(int argc, char** argv) {
    RunOptions options;
    std::vector<std::string> words;
    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (words.empty() && arg == "--timeout" && i + 1 < argc) {
            try {
                options.timeout_s = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cout << "Invalid --timeout value." << std::endl;
                return std::nullopt;
            }
            continue;
        }
        if (words.empty() && arg == "--output" && i + 1 < argc) {
            options.output_path = argv[++i];
            continue;
        }
        if (words.empty() && arg == "--") {
            continue;
        }
        words.push_back(arg);
    }
    if (words.empty()) {
        std::cout << "Missing command." << std::endl;
        return std::nullopt;
    }
    options.command = kalibox::utils::Join(words, " ");
    return options;
}

std::shared_ptr<kalibox::sandbox::SandboxManager> ConnectManager(const kalibox::config::Config& config) {
    auto runtime = std::make_shared<kalibox::docker::DockerClient>(config.docker);
    auto manager = std::make_shared<kalibox::sandbox::SandboxManager>(runtime, config);
    manager->Connect();
    return manager;
}

int RunPing(const kalibox::config::Config& config) {
    try {
        ConnectManager(config);
    } catch (const kalibox::errors::RuntimeUnavailable& ex) {
        std::cout << "Container engine unreachable: " << ex.what() << std::endl;
        return kExitRuntimeFailed;
    }
    std::cout << "Container engine reachable at " << config.docker.socket_path << std::endl;
    return kExitOk;
}

int RunCommand(const kalibox::config::Config& config, const RunOptions& options) {
    std::unique_ptr<kalibox::sandbox::Sandbox> sandbox;
    try {
        auto manager = ConnectManager(config);
        sandbox = manager->CreateSandbox();
    } catch (const kalibox::errors::SandboxError& ex) {
        std::cout << "Failed to create sandbox: " << ex.what() << std::endl;
        return kExitRuntimeFailed;
    }

    const auto timeout = std::chrono::seconds(options.timeout_s.value_or(config.sandbox.command_timeout_s));
    // Output is collected through the file, never over the session.
    const auto wrapped = kalibox::utils::RedirectOutput(options.command, options.output_path);
    int result = kExitOk;
    try {
        const int exit_status = sandbox->Execute(wrapped, timeout);
        const auto artifact = sandbox->RetrieveFile(options.output_path);
        if (artifact.present) {
            std::cout << artifact.content;
            if (!artifact.content.empty() && artifact.content.back() != '\n') {
                std::cout << std::endl;
            }
        } else {
            std::cout << "Command produced no output file at '" << options.output_path << "'." << std::endl;
        }
        std::cout << "[exit status " << exit_status << "]" << std::endl;
    } catch (const kalibox::errors::SandboxError& ex) {
        std::cout << "Command failed: " << ex.what() << std::endl;
        result = kExitCommandFailed;
    } catch (const std::runtime_error& ex) {
        std::cout << "Retrieving output failed: " << ex.what() << std::endl;
        result = kExitCommandFailed;
    }
    sandbox->Destroy();
    return result;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return kExitCommandFailed;
    }

    auto config = kalibox::config::LoadConfig();
    kalibox::utils::Configure(kalibox::utils::LogConfig{
        kalibox::utils::ParseLogLevel(config.logging.level, kalibox::utils::LogLevel::kInfo)});

    const std::string command = argv[1];
    if (command == "ping") {
        return RunPing(config);
    }
    if (command == "run") {
        const auto options = ParseRunOptions(argc, argv);
        if (!options) {
            PrintUsage();
            return kExitCommandFailed;
        }
        return RunCommand(config, *options);
    }
    if (command == "help" || command == "--help" || command == "-h") {
        PrintUsage();
        return kExitOk;
    }

    std::cout << "Unknown command: " << command << std::endl;
    PrintUsage();
    return kExitCommandFailed;
}
