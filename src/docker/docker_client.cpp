#include "docker/docker_client.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "utils/logging.hpp"
#include "utils/text.hpp"

namespace kalibox::docker {
namespace {

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace net = boost::asio;

using UnixStream = beast::basic_stream<net::local::stream_protocol>;

// Archives of single command outputs are small; this only guards against a
// runaway response filling memory.
constexpr std::uint64_t kMaxResponseBytes = 256ull * 1024 * 1024;

bool IsSuccess(int status) {
    return status >= 200 && status < 300;
}

[[noreturn]] void ThrowForStatus(int status, const std::string& what, const std::string& body) {
    const auto message = what + ": " + ExtractErrorMessage(body);
    if (status == 404) {
        throw NotFoundError(message);
    }
    throw DockerError(status, message + " (HTTP " + std::to_string(status) + ")");
}

}  // namespace

nlohmann::json BuildCreateBody(const ContainerSpec& spec) {
    nlohmann::json body = nlohmann::json::object();
    body["Image"] = spec.image;
    if (!spec.command.empty()) {
        body["Cmd"] = spec.command;
    }
    body["Tty"] = false;
    body["AttachStdin"] = false;
    body["AttachStdout"] = false;
    body["AttachStderr"] = false;

    nlohmann::json exposed = nlohmann::json::object();
    nlohmann::json bindings = nlohmann::json::object();
    for (const auto& port : spec.published_ports) {
        exposed[port] = nlohmann::json::object();
        // An empty HostPort asks the engine to pick a free ephemeral port.
        nlohmann::json binding = nlohmann::json::object();
        binding["HostPort"] = "";
        bindings[port] = nlohmann::json::array();
        bindings[port].push_back(binding);
    }
    body["ExposedPorts"] = exposed;
    body["HostConfig"] = {{"PortBindings", bindings}};
    return body;
}

ContainerState ParseInspectResponse(const nlohmann::json& data) {
    ContainerState state;
    if (!data.is_object()) {
        return state;
    }
    state.id = data.value("Id", "");
    if (data.contains("State") && data["State"].is_object()) {
        state.status = data["State"].value("Status", "");
    }
    if (!data.contains("NetworkSettings") || !data["NetworkSettings"].is_object()) {
        return state;
    }
    const auto& settings = data["NetworkSettings"];
    if (!settings.contains("Ports") || !settings["Ports"].is_object()) {
        return state;
    }
    for (const auto& [port, bindings] : settings["Ports"].items()) {
        auto& target = state.ports[port];
        if (!bindings.is_array()) {
            continue;
        }
        for (const auto& item : bindings) {
            if (!item.is_object()) {
                continue;
            }
            PortBinding binding;
            binding.host_ip = item.value("HostIp", "");
            binding.host_port = item.value("HostPort", "");
            target.push_back(std::move(binding));
        }
    }
    return state;
}

std::string ExtractErrorMessage(const std::string& body) {
    auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_object() && json.contains("message") && json["message"].is_string()) {
        return json["message"].get<std::string>();
    }
    return body;
}

DockerClient::DockerClient(const kalibox::config::DockerConfig& config)
    : config_(config)
    , timeout_(std::chrono::seconds(config.request_timeout_s)) {}

std::string DockerClient::Target(const std::string& path) const {
    if (config_.api_version.empty()) {
        return path;
    }
    return "/" + config_.api_version + path;
}

DockerClient::Response DockerClient::Request(const std::string& method,
                                             const std::string& target,
                                             const std::string& body) const {
    net::io_context ioc;
    UnixStream stream(ioc);

    http::request<http::string_body> request{http::string_to_verb(method), target, 11};
    request.set(http::field::host, "localhost");
    request.set(http::field::user_agent, "kalibox");
    if (!body.empty()) {
        request.set(http::field::content_type, "application/json");
        request.body() = body;
    }
    request.prepare_payload();

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(kMaxResponseBytes);
    beast::error_code result;

    // One deadline covers connect, write and read.
    stream.expires_after(timeout_);
    stream.async_connect(
        net::local::stream_protocol::endpoint(config_.socket_path),
        [&](beast::error_code ec) {
            if (ec) {
                result = ec;
                return;
            }
            http::async_write(stream, request, [&](beast::error_code write_ec, std::size_t) {
                if (write_ec) {
                    result = write_ec;
                    return;
                }
                http::async_read(stream, buffer, parser, [&](beast::error_code read_ec, std::size_t) {
                    result = read_ec;
                });
            });
        });
    ioc.run();

    beast::error_code ignored;
    stream.socket().shutdown(net::local::stream_protocol::socket::shutdown_both, ignored);

    if (result) {
        throw DockerError(0, method + " " + target + " failed: " + result.message());
    }

    Response response;
    response.status = static_cast<int>(parser.get().result_int());
    response.body = std::move(parser.get().body());
    utils::Debug("docker", method + " " + target + " -> " + std::to_string(response.status));
    return response;
}

bool DockerClient::Ping() {
    try {
        const auto response = Request("GET", Target("/_ping"));
        return response.status == 200;
    } catch (const DockerError& ex) {
        utils::Warn("docker", std::string("engine ping failed: ") + ex.what());
        return false;
    }
}

std::string DockerClient::CreateContainer(const ContainerSpec& spec) {
    const auto response = Request("POST", Target("/containers/create"), BuildCreateBody(spec).dump());
    if (!IsSuccess(response.status)) {
        ThrowForStatus(response.status, "create container from image '" + spec.image + "'", response.body);
    }
    auto json = nlohmann::json::parse(response.body, nullptr, false);
    if (!json.is_object() || !json.contains("Id") || !json["Id"].is_string()) {
        throw DockerError(response.status, "create container returned no id");
    }
    if (json.contains("Warnings") && json["Warnings"].is_array()) {
        for (const auto& warning : json["Warnings"]) {
            if (warning.is_string()) {
                utils::Warn("docker", warning.get<std::string>());
            }
        }
    }
    return json["Id"].get<std::string>();
}

void DockerClient::StartContainer(const std::string& id) {
    const auto response = Request("POST", Target("/containers/" + id + "/start"));
    // 304: already started.
    if (!IsSuccess(response.status) && response.status != 304) {
        ThrowForStatus(response.status, "start container " + ShortId(id), response.body);
    }
}

void DockerClient::StopContainer(const std::string& id, std::chrono::seconds timeout) {
    const auto response = Request(
        "POST",
        Target("/containers/" + id + "/stop?t=" + std::to_string(timeout.count())));
    // 304: already stopped.
    if (!IsSuccess(response.status) && response.status != 304) {
        ThrowForStatus(response.status, "stop container " + ShortId(id), response.body);
    }
}

void DockerClient::RemoveContainer(const std::string& id, bool force) {
    const auto response = Request(
        "DELETE",
        Target("/containers/" + id + (force ? "?force=true" : "?force=false")));
    if (!IsSuccess(response.status)) {
        ThrowForStatus(response.status, "remove container " + ShortId(id), response.body);
    }
}

ContainerState DockerClient::InspectContainer(const std::string& id) {
    const auto response = Request("GET", Target("/containers/" + id + "/json"));
    if (!IsSuccess(response.status)) {
        ThrowForStatus(response.status, "inspect container " + ShortId(id), response.body);
    }
    auto json = nlohmann::json::parse(response.body, nullptr, false);
    if (json.is_discarded()) {
        throw DockerError(response.status, "inspect container " + ShortId(id) + ": malformed response");
    }
    return ParseInspectResponse(json);
}

std::optional<std::string> DockerClient::GetArchive(const std::string& id, const std::string& path) {
    const auto response = Request(
        "GET",
        Target("/containers/" + id + "/archive?path=" + utils::UrlEncode(path)));
    if (response.status == 404) {
        const auto message = ExtractErrorMessage(response.body);
        // The same status is used for a vanished container; only a missing path is a normal result.
        if (message.find("No such container") != std::string::npos) {
            throw NotFoundError(message);
        }
        return std::nullopt;
    }
    if (!IsSuccess(response.status)) {
        ThrowForStatus(response.status, "archive " + path + " from " + ShortId(id), response.body);
    }
    return response.body;
}

}  // namespace kalibox::docker
