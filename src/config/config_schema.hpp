#pragma once

#include <string>
#include <vector>

namespace kalibox::config {

struct DockerConfig {
    std::string socket_path = "/var/run/docker.sock";
    std::string api_version = "v1.41";
    int request_timeout_s = 60;
    int stop_timeout_s = 10;
};

struct ContainerConfig {
    std::string image = "dawnyawn-kali-agent";
    std::vector<std::string> command = {"/usr/sbin/sshd", "-D"};
    std::string ssh_port = "22/tcp";
};

enum class HostKeyPolicy {
    kAcceptNew,
    kStrict
};

struct SshConfig {
    std::string binary = "ssh";
    std::string host = "localhost";
    std::string username = "root";
    std::string key_path = "~/.ssh/id_ecdsa";
    int connect_timeout_s = 30;
    HostKeyPolicy host_key_policy = HostKeyPolicy::kAcceptNew;
    std::string known_hosts_file;
};

struct SandboxConfig {
    int command_timeout_s = 1800;
    int ready_timeout_s = 60;
    int ready_initial_backoff_ms = 250;
    int ready_max_backoff_ms = 2000;
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    DockerConfig docker;
    ContainerConfig container;
    SshConfig ssh;
    SandboxConfig sandbox;
    LoggingConfig logging;
};

}  // namespace kalibox::config
