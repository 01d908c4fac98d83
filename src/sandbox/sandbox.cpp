#include "sandbox/sandbox.hpp"

#include <algorithm>
#include <filesystem>
#include <thread>

#include "errors/errors.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace kalibox::sandbox {

const char* ToString(Sandbox::Status status) {
    switch (status) {
        case Sandbox::Status::kCreated: return "created";
        case Sandbox::Status::kRunning: return "running";
        case Sandbox::Status::kStopped: return "stopped";
        case Sandbox::Status::kRemoved: return "removed";
    }
    return "unknown";
}

Sandbox::Status StatusFromEngine(const std::string& engine_status) {
    if (engine_status == "created") {
        return Sandbox::Status::kCreated;
    }
    if (engine_status == "running" || engine_status == "restarting" || engine_status == "paused") {
        return Sandbox::Status::kRunning;
    }
    return Sandbox::Status::kStopped;
}

Sandbox::Sandbox(std::shared_ptr<kalibox::docker::ContainerRuntime> runtime,
                 std::string id,
                 kalibox::config::Config config,
                 kalibox::ssh::SessionFactory session_factory,
                 Status initial_status)
    : runtime_(std::move(runtime))
    , id_(std::move(id))
    , short_id_(kalibox::docker::ShortId(id_))
    , config_(std::move(config))
    , session_factory_(std::move(session_factory))
    , status_(initial_status) {}

Sandbox::~Sandbox() {
    Destroy();
}

Sandbox::Status Sandbox::GetStatus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

void Sandbox::ThrowIfRemoved() const {
    if (status_ == Status::kRemoved) {
        throw errors::SandboxError("sandbox " + short_id_ + " has been destroyed");
    }
}

void Sandbox::EnsureRunning() {
    const auto state = runtime_->InspectContainer(id_);
    status_ = StatusFromEngine(state.status);
    if (state.status == "running") {
        return;
    }
    utils::Info("sandbox", "starting container '" + short_id_ + "' (was " + state.status + ")");
    runtime_->StartContainer(id_);
    status_ = Status::kRunning;
    // Readiness of the ssh service is established by the handshake retries
    // in EnsureConnected, not by a fixed delay here.
}

int Sandbox::ResolveHostPort() {
    const auto state = runtime_->InspectContainer(id_);
    const auto it = state.ports.find(config_.container.ssh_port);
    if (it != state.ports.end()) {
        for (const auto& binding : it->second) {
            if (binding.host_port.empty()) {
                continue;
            }
            try {
                return std::stoi(binding.host_port);
            } catch (const std::exception&) {
                break;
            }
        }
    }
    throw errors::PortMappingError(
        "no host port published for " + config_.container.ssh_port + " on container " + short_id_);
}

void Sandbox::EnsureConnected() {
    if (session_ && session_->IsAlive()) {
        return;
    }
    CloseSession();

    kalibox::ssh::SessionTarget target;
    target.host = config_.ssh.host;
    target.port = ResolveHostPort();
    target.username = config_.ssh.username;
    target.host_key_policy = config_.ssh.host_key_policy;
    target.known_hosts_file = config_.ssh.known_hosts_file;

    const auto key_path = utils::ExpandUser(config_.ssh.key_path);
    std::error_code ec;
    if (!std::filesystem::exists(key_path, ec)) {
        throw errors::CredentialMissing("ssh private key not found at " + key_path.string());
    }
    target.key_path = key_path.string();

    const auto connect_timeout = std::chrono::seconds(config_.ssh.connect_timeout_s);
    auto backoff = std::chrono::milliseconds(std::max(1, config_.sandbox.ready_initial_backoff_ms));
    const auto max_backoff = std::max(backoff, std::chrono::milliseconds(config_.sandbox.ready_max_backoff_ms));
    const auto deadline = std::chrono::steady_clock::now()
        + std::chrono::seconds(config_.sandbox.ready_timeout_s);
    int attempt = 1;
    while (true) {
        auto session = session_factory_();
        try {
            session->Connect(target, connect_timeout);
            session_ = std::move(session);
            return;
        } catch (const errors::ConnectFailure& ex) {
            if (std::chrono::steady_clock::now() + backoff >= deadline) {
                throw;
            }
            utils::Log(utils::LogMessage{
                utils::LogLevel::kWarn,
                "sandbox",
                "ssh not ready on container " + short_id_ + ": " + ex.what(),
                {{"attempt", std::to_string(attempt)},
                 {"retry_ms", std::to_string(backoff.count())}}});
        }
        std::this_thread::sleep_for(backoff);
        backoff = std::min(backoff * 2, max_backoff);
        ++attempt;
    }
}

int Sandbox::Execute(const std::string& command) {
    return Execute(command, std::chrono::seconds(config_.sandbox.command_timeout_s));
}

int Sandbox::Execute(const std::string& command, std::chrono::seconds timeout) {
    std::lock_guard<std::mutex> lock(mutex_);
    ThrowIfRemoved();
    try {
        EnsureRunning();
        EnsureConnected();
    } catch (const kalibox::docker::DockerError& ex) {
        throw errors::ConnectFailure("container " + short_id_ + " is not reachable: " + ex.what());
    }

    utils::Info("sandbox", "sending command: '" + command + "'");
    const int exit_status = session_->Run(command, timeout);
    utils::Info("sandbox", "command finished with exit status: " + std::to_string(exit_status));
    return exit_status;
}

Artifact Sandbox::RetrieveFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    ThrowIfRemoved();
    return ArtifactRetriever::Fetch(*runtime_, id_, path);
}

int Sandbox::MappedPort() {
    std::lock_guard<std::mutex> lock(mutex_);
    ThrowIfRemoved();
    return ResolveHostPort();
}

void Sandbox::CloseSession() noexcept {
    if (!session_) {
        return;
    }
    try {
        session_->Close();
    } catch (const std::exception& ex) {
        utils::Warn("sandbox", std::string("closing session: ") + ex.what());
    }
    session_.reset();
}

void Sandbox::Destroy() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ == Status::kRemoved) {
        return;
    }
    CloseSession();

    try {
        const auto state = runtime_->InspectContainer(id_);
        utils::Info("sandbox", "cleaning up container '" + short_id_ + "'");
        status_ = StatusFromEngine(state.status);
        if (state.status == "running" || state.status == "created") {
            try {
                runtime_->StopContainer(id_, std::chrono::seconds(config_.docker.stop_timeout_s));
                status_ = Status::kStopped;
            } catch (const kalibox::docker::NotFoundError&) {
                throw;
            } catch (const std::exception& ex) {
                // Force removal below still kills it.
                utils::Warn("sandbox", "stop of '" + short_id_ + "' failed: " + ex.what());
            }
        }
        runtime_->RemoveContainer(id_, true);
        status_ = Status::kRemoved;
        utils::Info("sandbox", "cleanup complete");
    } catch (const kalibox::docker::NotFoundError&) {
        status_ = Status::kRemoved;
        utils::Debug("sandbox", "container '" + short_id_ + "' already gone");
    } catch (const std::exception& ex) {
        utils::Error("sandbox", "cleanup of '" + short_id_ + "' failed, container may be leaked: " + ex.what());
    }
}

}  // namespace kalibox::sandbox
