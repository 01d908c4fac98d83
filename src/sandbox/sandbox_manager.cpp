#include "sandbox/sandbox_manager.hpp"

#include "errors/errors.hpp"
#include "ssh/openssh_session.hpp"
#include "utils/logging.hpp"

namespace kalibox::sandbox {

SandboxManager::SandboxManager(std::shared_ptr<kalibox::docker::ContainerRuntime> runtime,
                               kalibox::config::Config config,
                               kalibox::ssh::SessionFactory session_factory)
    : runtime_(std::move(runtime))
    , config_(std::move(config))
    , session_factory_(std::move(session_factory)) {
    if (!session_factory_) {
        session_factory_ = [ssh_config = config_.ssh]() -> std::unique_ptr<kalibox::ssh::RemoteSession> {
            return std::make_unique<kalibox::ssh::OpenSshSession>(ssh_config);
        };
    }
}

void SandboxManager::Connect() {
    if (!runtime_ || !runtime_->Ping()) {
        connected_ = false;
        utils::Error("manager", "could not connect to the container engine. Is it running?");
        throw errors::RuntimeUnavailable("container engine at " + config_.docker.socket_path
                                         + " is unreachable");
    }
    connected_ = true;
    utils::Info("manager", "container engine reachable");
}

std::unique_ptr<Sandbox> SandboxManager::CreateSandbox() {
    if (!connected_) {
        throw errors::RuntimeUnavailable("container engine is not connected");
    }

    kalibox::docker::ContainerSpec spec;
    spec.image = config_.container.image;
    spec.command = config_.container.command;
    spec.published_ports = {config_.container.ssh_port};

    utils::Info("manager", "creating container from image '" + spec.image + "'");
    std::string id;
    try {
        id = runtime_->CreateContainer(spec);
    } catch (const kalibox::docker::NotFoundError& ex) {
        throw errors::ProvisionError("image '" + spec.image + "' is not available: " + ex.what());
    } catch (const kalibox::docker::DockerError& ex) {
        if (ex.Status() == 0) {
            connected_ = false;
            throw errors::RuntimeUnavailable(std::string("container engine unreachable: ") + ex.what());
        }
        throw errors::ProvisionError(std::string("engine rejected container: ") + ex.what());
    }

    try {
        runtime_->StartContainer(id);
    } catch (const kalibox::docker::DockerError& ex) {
        try {
            runtime_->RemoveContainer(id, true);
        } catch (const kalibox::docker::DockerError& remove_ex) {
            utils::Warn("manager", "could not remove failed container '"
                        + kalibox::docker::ShortId(id) + "': " + remove_ex.what());
        }
        throw errors::ProvisionError("container '" + kalibox::docker::ShortId(id)
                                     + "' failed to start: " + ex.what());
    }

    auto sandbox = std::make_unique<Sandbox>(
        runtime_, id, config_, session_factory_, Sandbox::Status::kRunning);
    utils::Info("manager", "container '" + sandbox->ShortId() + "' created and running");
    return sandbox;
}

}  // namespace kalibox::sandbox
