#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "config/config_schema.hpp"

namespace kalibox::ssh {

struct SessionTarget {
    std::string host;
    int port = 22;
    std::string username;
    std::string key_path;
    kalibox::config::HostKeyPolicy host_key_policy = kalibox::config::HostKeyPolicy::kAcceptNew;
    // Empty: a per-session file for accept-new, the user's default for strict.
    std::string known_hosts_file;
};

// One authenticated remote-shell connection. Output of remote commands is
// never captured; callers redirect it to a file inside the sandbox.
class RemoteSession {
public:
    virtual ~RemoteSession() = default;

    // Throws errors::ConnectFailure on timeout, refusal or authentication failure.
    virtual void Connect(const SessionTarget& target, std::chrono::seconds timeout) = 0;
    virtual bool IsAlive() = 0;
    // Blocks until the remote exit status is known. Throws errors::CommandTimeout.
    // A timeout abandons the command without killing it on the remote side, so
    // it may keep running and still write files after Run has thrown.
    virtual int Run(const std::string& command, std::chrono::seconds timeout) = 0;
    virtual void Close() = 0;
};

using SessionFactory = std::function<std::unique_ptr<RemoteSession>()>;

}  // namespace kalibox::ssh
