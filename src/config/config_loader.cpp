#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace kalibox::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::vector<std::string> SplitWhitespace(const std::string& value) {
    std::vector<std::string> items;
    std::istringstream stream(value);
    std::string item;
    while (stream >> item) {
        items.push_back(item);
    }
    return items;
}

void ReadString(const nlohmann::json& source, const char* key, std::string& target) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

void ReadInt(const nlohmann::json& source, const char* key, int& target) {
    if (source.contains(key) && source[key].is_number_integer()) {
        target = source[key].get<int>();
    }
}

void ApplyDockerConfig(DockerConfig& target, const nlohmann::json& source) {
    ReadString(source, "socketPath", target.socket_path);
    ReadString(source, "apiVersion", target.api_version);
    ReadInt(source, "requestTimeoutS", target.request_timeout_s);
    ReadInt(source, "stopTimeoutS", target.stop_timeout_s);
}

void ApplyContainerConfig(ContainerConfig& target, const nlohmann::json& source) {
    ReadString(source, "image", target.image);
    ReadString(source, "sshPort", target.ssh_port);
    if (source.contains("command") && source["command"].is_array()) {
        std::vector<std::string> command;
        for (const auto& item : source["command"]) {
            if (item.is_string()) {
                command.push_back(item.get<std::string>());
            }
        }
        if (!command.empty()) {
            target.command = std::move(command);
        }
    }
}

void ApplySshConfig(SshConfig& target, const nlohmann::json& source) {
    ReadString(source, "binary", target.binary);
    ReadString(source, "host", target.host);
    ReadString(source, "username", target.username);
    ReadString(source, "keyPath", target.key_path);
    ReadInt(source, "connectTimeoutS", target.connect_timeout_s);
    ReadString(source, "knownHostsFile", target.known_hosts_file);
    if (source.contains("hostKeyPolicy") && source["hostKeyPolicy"].is_string()) {
        target.host_key_policy = ParseHostKeyPolicy(
            source["hostKeyPolicy"].get<std::string>(),
            target.host_key_policy);
    }
}

void ApplySandboxConfig(SandboxConfig& target, const nlohmann::json& source) {
    ReadInt(source, "commandTimeoutS", target.command_timeout_s);
    ReadInt(source, "readyTimeoutS", target.ready_timeout_s);
    ReadInt(source, "readyInitialBackoffMs", target.ready_initial_backoff_ms);
    ReadInt(source, "readyMaxBackoffMs", target.ready_max_backoff_ms);
}

}  // namespace

void ClampReadiness(SandboxConfig& sandbox) {
    // A zero backoff would respawn the ssh client in a tight loop.
    if (sandbox.ready_initial_backoff_ms < 1) {
        utils::Warn("config", "readyInitialBackoffMs must be at least 1, using 1");
        sandbox.ready_initial_backoff_ms = 1;
    }
    if (sandbox.ready_max_backoff_ms < sandbox.ready_initial_backoff_ms) {
        sandbox.ready_max_backoff_ms = sandbox.ready_initial_backoff_ms;
    }
    if (sandbox.ready_timeout_s < 0) {
        sandbox.ready_timeout_s = 0;
    }
}

std::filesystem::path GetConfigPath() {
    return utils::GetHomePath() / ".kalibox" / "config.json";
}

HostKeyPolicy ParseHostKeyPolicy(const std::string& value, HostKeyPolicy fallback) {
    const auto lowered = ToLower(value);
    if (lowered == "accept-new" || lowered == "tofu") {
        return HostKeyPolicy::kAcceptNew;
    }
    if (lowered == "strict" || lowered == "yes") {
        return HostKeyPolicy::kStrict;
    }
    return fallback;
}

std::string ToString(HostKeyPolicy policy) {
    switch (policy) {
        case HostKeyPolicy::kAcceptNew:
            return "accept-new";
        case HostKeyPolicy::kStrict:
            return "strict";
    }
    return "accept-new";
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }
    if (data.contains("docker") && data["docker"].is_object()) {
        ApplyDockerConfig(config.docker, data["docker"]);
    }
    if (data.contains("container") && data["container"].is_object()) {
        ApplyContainerConfig(config.container, data["container"]);
    }
    if (data.contains("ssh") && data["ssh"].is_object()) {
        ApplySshConfig(config.ssh, data["ssh"]);
    }
    if (data.contains("sandbox") && data["sandbox"].is_object()) {
        ApplySandboxConfig(config.sandbox, data["sandbox"]);
    }
    if (data.contains("logging") && data["logging"].is_object()) {
        ReadString(data["logging"], "level", config.logging.level);
    }
}

void ApplyConfigFromEnv(Config& config) {
    const auto socket_path = GetEnvFallback(
        "KALIBOX_DOCKER__SOCKET_PATH",
        "KALIBOX_DOCKER_SOCKET_PATH");
    if (!socket_path.empty()) {
        config.docker.socket_path = socket_path;
    }

    const auto api_version = GetEnvFallback(
        "KALIBOX_DOCKER__API_VERSION",
        "KALIBOX_DOCKER_API_VERSION");
    if (!api_version.empty()) {
        config.docker.api_version = api_version;
    }

    const auto request_timeout = GetEnvFallback(
        "KALIBOX_DOCKER__REQUEST_TIMEOUT_S",
        "KALIBOX_DOCKER_REQUEST_TIMEOUT_S");
    if (!request_timeout.empty()) {
        config.docker.request_timeout_s = ParseInt(request_timeout, config.docker.request_timeout_s);
    }

    const auto image = GetEnvFallback(
        "KALIBOX_CONTAINER__IMAGE",
        "KALIBOX_CONTAINER_IMAGE");
    if (!image.empty()) {
        config.container.image = image;
    }

    const auto command = GetEnvFallback(
        "KALIBOX_CONTAINER__COMMAND",
        "KALIBOX_CONTAINER_COMMAND");
    if (!command.empty()) {
        auto parts = SplitWhitespace(command);
        if (!parts.empty()) {
            config.container.command = std::move(parts);
        }
    }

    const auto ssh_binary = GetEnvFallback(
        "KALIBOX_SSH__BINARY",
        "KALIBOX_SSH_BINARY");
    if (!ssh_binary.empty()) {
        config.ssh.binary = ssh_binary;
    }

    const auto ssh_host = GetEnvFallback(
        "KALIBOX_SSH__HOST",
        "KALIBOX_SSH_HOST");
    if (!ssh_host.empty()) {
        config.ssh.host = ssh_host;
    }

    const auto ssh_username = GetEnvFallback(
        "KALIBOX_SSH__USERNAME",
        "KALIBOX_SSH_USERNAME");
    if (!ssh_username.empty()) {
        config.ssh.username = ssh_username;
    }

    const auto key_path = GetEnvFallback(
        "KALIBOX_SSH__KEY_PATH",
        "KALIBOX_SSH_KEY_PATH");
    if (!key_path.empty()) {
        config.ssh.key_path = key_path;
    }

    const auto connect_timeout = GetEnvFallback(
        "KALIBOX_SSH__CONNECT_TIMEOUT_S",
        "KALIBOX_SSH_CONNECT_TIMEOUT_S");
    if (!connect_timeout.empty()) {
        config.ssh.connect_timeout_s = ParseInt(connect_timeout, config.ssh.connect_timeout_s);
    }

    const auto host_key_policy = GetEnvFallback(
        "KALIBOX_SSH__HOST_KEY_POLICY",
        "KALIBOX_SSH_HOST_KEY_POLICY");
    if (!host_key_policy.empty()) {
        config.ssh.host_key_policy = ParseHostKeyPolicy(host_key_policy, config.ssh.host_key_policy);
    }

    const auto known_hosts = GetEnvFallback(
        "KALIBOX_SSH__KNOWN_HOSTS_FILE",
        "KALIBOX_SSH_KNOWN_HOSTS_FILE");
    if (!known_hosts.empty()) {
        config.ssh.known_hosts_file = known_hosts;
    }

    const auto command_timeout = GetEnvFallback(
        "KALIBOX_SANDBOX__COMMAND_TIMEOUT_S",
        "KALIBOX_SANDBOX_COMMAND_TIMEOUT_S");
    if (!command_timeout.empty()) {
        config.sandbox.command_timeout_s = ParseInt(command_timeout, config.sandbox.command_timeout_s);
    }

    const auto ready_timeout = GetEnvFallback(
        "KALIBOX_SANDBOX__READY_TIMEOUT_S",
        "KALIBOX_SANDBOX_READY_TIMEOUT_S");
    if (!ready_timeout.empty()) {
        config.sandbox.ready_timeout_s = ParseInt(ready_timeout, config.sandbox.ready_timeout_s);
    }

    const auto initial_backoff = GetEnvFallback(
        "KALIBOX_SANDBOX__READY_INITIAL_BACKOFF_MS",
        "KALIBOX_SANDBOX_READY_INITIAL_BACKOFF_MS");
    if (!initial_backoff.empty()) {
        config.sandbox.ready_initial_backoff_ms = ParseInt(initial_backoff, config.sandbox.ready_initial_backoff_ms);
    }

    const auto max_backoff = GetEnvFallback(
        "KALIBOX_SANDBOX__READY_MAX_BACKOFF_MS",
        "KALIBOX_SANDBOX_READY_MAX_BACKOFF_MS");
    if (!max_backoff.empty()) {
        config.sandbox.ready_max_backoff_ms = ParseInt(max_backoff, config.sandbox.ready_max_backoff_ms);
    }

    const auto log_level = GetEnvFallback(
        "KALIBOX_LOGGING__LEVEL",
        "KALIBOX_LOG_LEVEL");
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }
}

Config LoadConfig(const std::filesystem::path& config_path) {
    Config config{};

    if (std::filesystem::exists(config_path)) {
        try {
            std::ifstream input(config_path);
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception& ex) {
            utils::Warn("config", "ignoring malformed " + config_path.string() + ": " + ex.what());
        }
    }

    ApplyConfigFromEnv(config);
    ClampReadiness(config.sandbox);
    return config;
}

Config LoadConfig() {
    return LoadConfig(GetConfigPath());
}

}  // namespace kalibox::config
