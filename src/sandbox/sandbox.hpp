#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include "config/config_schema.hpp"
#include "docker/container_runtime.hpp"
#include "sandbox/artifact_retriever.hpp"
#include "ssh/remote_session.hpp"

namespace kalibox::sandbox {

// One disposable container plus its lazily opened remote session. All
// public operations are serialized on an internal mutex. The destructor
// destroys the container, so owning a Sandbox through a unique_ptr
// guarantees cleanup on every exit path.
class Sandbox {
public:
    enum class Status {
        kCreated,
        kRunning,
        kStopped,
        kRemoved
    };

    Sandbox(std::shared_ptr<kalibox::docker::ContainerRuntime> runtime,
            std::string id,
            kalibox::config::Config config,
            kalibox::ssh::SessionFactory session_factory,
            Status initial_status = Status::kCreated);
    ~Sandbox();

    Sandbox(const Sandbox&) = delete;
    Sandbox& operator=(const Sandbox&) = delete;

    const std::string& Id() const { return id_; }
    const std::string& ShortId() const { return short_id_; }
    Status GetStatus() const;

    // Runs `command` and returns its exit status once the remote process has
    // exited. Output is not captured: redirect it to a file and fetch that
    // with RetrieveFile. Throws PortMappingError, CredentialMissing,
    // ConnectFailure or CommandTimeout.
    int Execute(const std::string& command);
    int Execute(const std::string& command, std::chrono::seconds timeout);

    Artifact RetrieveFile(const std::string& path);

    // Host port the engine published for the in-container ssh service.
    int MappedPort();

    // Closes the session, stops and removes the container. Safe to call any
    // number of times; failures are logged, never thrown.
    void Destroy() noexcept;

private:
    void EnsureRunning();
    void EnsureConnected();
    int ResolveHostPort();
    void ThrowIfRemoved() const;
    void CloseSession() noexcept;

    std::shared_ptr<kalibox::docker::ContainerRuntime> runtime_;
    std::string id_;
    std::string short_id_;
    kalibox::config::Config config_;
    kalibox::ssh::SessionFactory session_factory_;
    std::unique_ptr<kalibox::ssh::RemoteSession> session_;
    Status status_ = Status::kCreated;
    mutable std::mutex mutex_;
};

const char* ToString(Sandbox::Status status);
Sandbox::Status StatusFromEngine(const std::string& engine_status);

}  // namespace kalibox::sandbox
