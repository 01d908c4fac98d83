#pragma once

#include <stdexcept>
#include <string>

namespace kalibox::errors {

class SandboxError : public std::runtime_error {
public:
    explicit SandboxError(const std::string& message)
        : std::runtime_error(message) {}
};

// The container engine cannot be reached. No sandbox can be created.
class RuntimeUnavailable : public SandboxError {
public:
    using SandboxError::SandboxError;
};

// Creating or starting a container failed (missing image, engine rejection).
class ProvisionError : public SandboxError {
public:
    using SandboxError::SandboxError;
};

// The engine has not published a host port for the in-container shell service.
class PortMappingError : public SandboxError {
public:
    using SandboxError::SandboxError;
};

class CredentialMissing : public SandboxError {
public:
    using SandboxError::SandboxError;
};

// Timeout, refusal or authentication failure while opening a session.
class ConnectFailure : public SandboxError {
public:
    using SandboxError::SandboxError;
};

class CommandTimeout : public SandboxError {
public:
    using SandboxError::SandboxError;
};

}  // namespace kalibox::errors
