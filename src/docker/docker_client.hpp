#pragma once

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

#include "config/config_schema.hpp"
#include "docker/container_runtime.hpp"

namespace kalibox::docker {

// Docker Engine REST client over the engine's Unix-domain socket. Each call
// opens its own connection, so one instance may be shared across threads.
class DockerClient : public ContainerRuntime {
public:
    explicit DockerClient(const kalibox::config::DockerConfig& config);

    bool Ping() override;
    std::string CreateContainer(const ContainerSpec& spec) override;
    void StartContainer(const std::string& id) override;
    void StopContainer(const std::string& id, std::chrono::seconds timeout) override;
    void RemoveContainer(const std::string& id, bool force) override;
    ContainerState InspectContainer(const std::string& id) override;
    std::optional<std::string> GetArchive(const std::string& id, const std::string& path) override;

private:
    struct Response {
        int status = 0;
        std::string body;
    };

    Response Request(const std::string& method,
                     const std::string& target,
                     const std::string& body = {}) const;
    std::string Target(const std::string& path) const;

    kalibox::config::DockerConfig config_;
    std::chrono::seconds timeout_;
};

nlohmann::json BuildCreateBody(const ContainerSpec& spec);
ContainerState ParseInspectResponse(const nlohmann::json& data);
// Engine error bodies look like {"message": "..."}; falls back to the raw body.
std::string ExtractErrorMessage(const std::string& body);

}  // namespace kalibox::docker
