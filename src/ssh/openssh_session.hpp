#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "ssh/remote_session.hpp"

namespace kalibox::ssh {

// RemoteSession backed by the system OpenSSH client. Connect() starts a
// ControlMaster process; every Run() is a short-lived client multiplexed over
// that master, so the authenticated connection is reused across commands.
class OpenSshSession : public RemoteSession {
public:
    explicit OpenSshSession(kalibox::config::SshConfig config);
    ~OpenSshSession() override;

    OpenSshSession(const OpenSshSession&) = delete;
    OpenSshSession& operator=(const OpenSshSession&) = delete;

    void Connect(const SessionTarget& target, std::chrono::seconds timeout) override;
    bool IsAlive() override;
    int Run(const std::string& command, std::chrono::seconds timeout) override;
    void Close() override;

private:
    struct MasterProcess;

    std::string ResolveBinary() const;
    bool RunControl(const std::string& operation);
    void PrepareWorkDir();
    void RemoveWorkDir();
    std::filesystem::path ControlPath() const { return work_dir_ / "ctl"; }
    std::filesystem::path KnownHostsPath() const;

    kalibox::config::SshConfig config_;
    SessionTarget target_;
    std::string binary_;
    std::filesystem::path work_dir_;
    std::unique_ptr<MasterProcess> master_;
};

std::vector<std::string> BuildMasterArgs(const SessionTarget& target,
                                         const std::filesystem::path& control_path,
                                         const std::filesystem::path& known_hosts,
                                         std::chrono::seconds connect_timeout);
std::vector<std::string> BuildControlArgs(const SessionTarget& target,
                                          const std::filesystem::path& control_path,
                                          const std::string& operation);
std::vector<std::string> BuildExecArgs(const SessionTarget& target,
                                       const std::filesystem::path& control_path,
                                       const std::string& command);

}  // namespace kalibox::ssh
