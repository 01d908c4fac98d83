#include "ssh/openssh_session.hpp"

#include <boost/process.hpp>
#include <fstream>
#include <sstream>
#include <thread>

#include "errors/errors.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace kalibox::ssh {
namespace bp = boost::process;

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(200);
constexpr auto kControlTimeout = std::chrono::seconds(5);
constexpr auto kConnectGrace = std::chrono::seconds(5);
// OpenSSH reports its own failures (refused, auth, lost master) as 255.
constexpr int kSshFailureStatus = 255;

bool WaitForExit(bp::child& child, std::chrono::steady_clock::time_point deadline) {
    while (std::chrono::steady_clock::now() < deadline) {
        std::error_code ec;
        if (!child.running(ec)) {
            return true;
        }
        std::this_thread::sleep_for(kPollInterval);
    }
    std::error_code ec;
    return !child.running(ec);
}

void Kill(bp::child& child) {
    std::error_code ec;
    if (child.running(ec)) {
        child.terminate(ec);
    }
    child.wait(ec);
}

std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        return {};
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    auto text = buffer.str();
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
    return text;
}

std::string Destination(const SessionTarget& target) {
    return target.username + "@" + target.host;
}

}  // namespace

struct OpenSshSession::MasterProcess {
    bp::child child;
    std::filesystem::path log_path;
};

std::vector<std::string> BuildMasterArgs(const SessionTarget& target,
                                         const std::filesystem::path& control_path,
                                         const std::filesystem::path& known_hosts,
                                         std::chrono::seconds connect_timeout) {
    std::vector<std::string> args = {
        "-M",
        "-N",
        "-S", control_path.string(),
        "-p", std::to_string(target.port),
        "-i", target.key_path,
        "-o", "BatchMode=yes",
        "-o", "IdentitiesOnly=yes",
        "-o", "ConnectTimeout=" + std::to_string(connect_timeout.count()),
        "-o", "ServerAliveInterval=15",
        "-o", "ServerAliveCountMax=3",
        "-o", "LogLevel=ERROR",
    };
    switch (target.host_key_policy) {
        case kalibox::config::HostKeyPolicy::kAcceptNew:
            args.push_back("-o");
            args.push_back("StrictHostKeyChecking=accept-new");
            break;
        case kalibox::config::HostKeyPolicy::kStrict:
            args.push_back("-o");
            args.push_back("StrictHostKeyChecking=yes");
            break;
    }
    if (!known_hosts.empty()) {
        args.push_back("-o");
        args.push_back("UserKnownHostsFile=" + known_hosts.string());
    }
    args.push_back(Destination(target));
    return args;
}

std::vector<std::string> BuildControlArgs(const SessionTarget& target,
                                          const std::filesystem::path& control_path,
                                          const std::string& operation) {
    return {
        "-S", control_path.string(),
        "-O", operation,
        "-p", std::to_string(target.port),
        Destination(target),
    };
}

std::vector<std::string> BuildExecArgs(const SessionTarget& target,
                                       const std::filesystem::path& control_path,
                                       const std::string& command) {
    return {
        "-S", control_path.string(),
        "-o", "ControlMaster=no",
        "-o", "BatchMode=yes",
        "-p", std::to_string(target.port),
        "-T",
        Destination(target),
        command,
    };
}

OpenSshSession::OpenSshSession(kalibox::config::SshConfig config)
    : config_(std::move(config)) {}

OpenSshSession::~OpenSshSession() {
    Close();
}

std::string OpenSshSession::ResolveBinary() const {
    if (config_.binary.find('/') != std::string::npos) {
        return config_.binary;
    }
    const auto resolved = bp::search_path(config_.binary);
    if (resolved.empty()) {
        throw errors::ConnectFailure("ssh client '" + config_.binary + "' not found on PATH");
    }
    return resolved.string();
}

std::filesystem::path OpenSshSession::KnownHostsPath() const {
    if (!target_.known_hosts_file.empty()) {
        return utils::ExpandUser(target_.known_hosts_file);
    }
    if (target_.host_key_policy == kalibox::config::HostKeyPolicy::kAcceptNew) {
        // Sandboxes reuse host ports with fresh host keys; a private file per
        // session keeps first-use acceptance from colliding with stale entries.
        return work_dir_ / "known_hosts";
    }
    return {};
}

void OpenSshSession::PrepareWorkDir() {
    work_dir_ = std::filesystem::temp_directory_path() / ("kalibox-ssh-" + utils::RandomHex(8));
    std::filesystem::create_directories(work_dir_);
    std::filesystem::permissions(work_dir_, std::filesystem::perms::owner_all,
                                 std::filesystem::perm_options::replace);
}

void OpenSshSession::RemoveWorkDir() {
    if (work_dir_.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove_all(work_dir_, ec);
    work_dir_.clear();
}

bool OpenSshSession::RunControl(const std::string& operation) {
    try {
        bp::child control(
            bp::exe = binary_,
            bp::args = BuildControlArgs(target_, ControlPath(), operation),
            bp::std_in < bp::null,
            bp::std_out > bp::null,
            bp::std_err > bp::null);
        if (!WaitForExit(control, std::chrono::steady_clock::now() + kControlTimeout)) {
            Kill(control);
            return false;
        }
        return control.exit_code() == 0;
    } catch (const bp::process_error& ex) {
        utils::Warn("ssh", "control '" + operation + "' failed: " + ex.what());
        return false;
    }
}

void OpenSshSession::Connect(const SessionTarget& target, std::chrono::seconds timeout) {
    Close();
    target_ = target;
    binary_ = ResolveBinary();
    try {
        PrepareWorkDir();
    } catch (const std::filesystem::filesystem_error& ex) {
        throw errors::ConnectFailure(std::string("cannot prepare ssh control directory: ") + ex.what());
    }

    const auto args = BuildMasterArgs(target_, ControlPath(), KnownHostsPath(), timeout);
    const auto log_path = work_dir_ / "master.log";
    utils::Debug("ssh", binary_ + " " + utils::Join(args, " "));

    try {
        master_ = std::make_unique<MasterProcess>(MasterProcess{
            bp::child(
                bp::exe = binary_,
                bp::args = args,
                bp::std_in < bp::null,
                bp::std_out > bp::null,
                bp::std_err > log_path.string()),
            log_path});
    } catch (const bp::process_error& ex) {
        RemoveWorkDir();
        throw errors::ConnectFailure(std::string("failed to launch ssh: ") + ex.what());
    }

    const auto endpoint = Destination(target_) + ":" + std::to_string(target_.port);
    const auto deadline = std::chrono::steady_clock::now() + timeout + kConnectGrace;
    while (std::chrono::steady_clock::now() < deadline) {
        std::error_code ec;
        if (!master_->child.running(ec)) {
            const auto exit_code = master_->child.exit_code();
            auto reason = ReadFile(master_->log_path);
            master_.reset();
            RemoveWorkDir();
            if (reason.empty()) {
                reason = "ssh exited with status " + std::to_string(exit_code);
            }
            throw errors::ConnectFailure("cannot connect to " + endpoint + ": " + reason);
        }
        if (RunControl("check")) {
            utils::Info("ssh", "connected to " + endpoint);
            return;
        }
        std::this_thread::sleep_for(kPollInterval);
    }

    Close();
    throw errors::ConnectFailure("timed out connecting to " + endpoint);
}

bool OpenSshSession::IsAlive() {
    if (!master_) {
        return false;
    }
    std::error_code ec;
    if (!master_->child.running(ec)) {
        return false;
    }
    return RunControl("check");
}

int OpenSshSession::Run(const std::string& command, std::chrono::seconds timeout) {
    if (!master_) {
        throw errors::ConnectFailure("session is not connected");
    }
    int exit_code = -1;
    try {
        bp::child child(
            bp::exe = binary_,
            bp::args = BuildExecArgs(target_, ControlPath(), command),
            bp::std_in < bp::null,
            bp::std_out > bp::null,
            bp::std_err > bp::null);
        if (!WaitForExit(child, std::chrono::steady_clock::now() + timeout)) {
            // Only the local client dies; without a tty the remote process
            // gets no hangup and runs on inside the container.
            Kill(child);
            throw errors::CommandTimeout(
                "command exceeded " + std::to_string(timeout.count()) + "s: " + command);
        }
        exit_code = child.exit_code();
    } catch (const bp::process_error& ex) {
        throw errors::ConnectFailure(std::string("failed to launch ssh: ") + ex.what());
    }
    if (exit_code == kSshFailureStatus && !IsAlive()) {
        throw errors::ConnectFailure("connection to " + Destination(target_) + " was lost");
    }
    return exit_code;
}

void OpenSshSession::Close() {
    if (master_) {
        std::error_code ec;
        if (master_->child.running(ec)) {
            RunControl("exit");
            if (!WaitForExit(master_->child, std::chrono::steady_clock::now() + std::chrono::seconds(2))) {
                Kill(master_->child);
            }
        }
        master_->child.wait(ec);
        master_.reset();
        utils::Debug("ssh", "closed session to " + Destination(target_));
    }
    RemoveWorkDir();
}

}  // namespace kalibox::ssh
