#pragma once

#include <atomic>
#include <memory>

#include "config/config_schema.hpp"
#include "docker/container_runtime.hpp"
#include "sandbox/sandbox.hpp"
#include "ssh/remote_session.hpp"

namespace kalibox::sandbox {

class SandboxManager {
public:
    // An empty factory means OpenSSH sessions built from config.ssh.
    SandboxManager(std::shared_ptr<kalibox::docker::ContainerRuntime> runtime,
                   kalibox::config::Config config,
                   kalibox::ssh::SessionFactory session_factory = {});

    // Pings the engine. Throws RuntimeUnavailable when it does not answer.
    void Connect();
    bool IsConnected() const { return connected_; }

    // Creates and starts a container. Throws RuntimeUnavailable or
    // ProvisionError; a failed attempt leaves no container behind.
    std::unique_ptr<Sandbox> CreateSandbox();

private:
    std::shared_ptr<kalibox::docker::ContainerRuntime> runtime_;
    kalibox::config::Config config_;
    kalibox::ssh::SessionFactory session_factory_;
    std::atomic<bool> connected_{false};
};

}  // namespace kalibox::sandbox
