#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace kalibox::docker {

// Raised for any engine failure. status is the HTTP status, or 0 when the
// engine could not be reached at all (missing socket, timeout, reset).
class DockerError : public std::runtime_error {
public:
    DockerError(int status, const std::string& message)
        : std::runtime_error(message), status_(status) {}

    int Status() const { return status_; }

private:
    int status_ = 0;
};

class NotFoundError : public DockerError {
public:
    explicit NotFoundError(const std::string& message)
        : DockerError(404, message) {}
};

struct PortBinding {
    std::string host_ip;
    std::string host_port;
};

struct ContainerSpec {
    std::string image;
    std::vector<std::string> command;
    // Container ports ("22/tcp") to publish on an engine-assigned host port.
    std::vector<std::string> published_ports;
};

struct ContainerState {
    std::string id;
    std::string status;
    std::map<std::string, std::vector<PortBinding>> ports;
};

class ContainerRuntime {
public:
    virtual ~ContainerRuntime() = default;

    virtual bool Ping() = 0;
    virtual std::string CreateContainer(const ContainerSpec& spec) = 0;
    virtual void StartContainer(const std::string& id) = 0;
    virtual void StopContainer(const std::string& id, std::chrono::seconds timeout) = 0;
    virtual void RemoveContainer(const std::string& id, bool force) = 0;
    virtual ContainerState InspectContainer(const std::string& id) = 0;
    // Raw tar stream for `path`, or std::nullopt when the path does not exist.
    virtual std::optional<std::string> GetArchive(const std::string& id, const std::string& path) = 0;
};

inline std::string ShortId(const std::string& id) {
    return id.substr(0, 12);
}

}  // namespace kalibox::docker
