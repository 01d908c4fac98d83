#include "docker/docker_client.hpp"

#include <chrono>
#include <thread>

#include <gtest/gtest.h>

#include "fake_engine.hpp"
#include "tar_builder.hpp"

using namespace kalibox::docker;
using kalibox::testing::FakeEngine;
using kalibox::testing::TarBuilder;

namespace {

kalibox::config::DockerConfig ConfigFor(const FakeEngine& engine) {
    kalibox::config::DockerConfig config;
    config.socket_path = engine.SocketPath();
    config.request_timeout_s = 5;
    return config;
}

constexpr const char* kId = "4f1c2a9be0d3aa00112233445566778899aabbccddeeff001122334455667788";

}  // namespace

TEST(DockerClientTests, PingUsesVersionedPath) {
    FakeEngine engine([](const FakeEngine::Request&) { return FakeEngine::Reply(200, "OK", "text/plain"); });
    DockerClient client(ConfigFor(engine));

    EXPECT_TRUE(client.Ping());
    const auto requests = engine.Requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0], "GET /v1.41/_ping");
}

TEST(DockerClientTests, UnversionedApiOmitsPrefix) {
    FakeEngine engine([](const FakeEngine::Request&) { return FakeEngine::Reply(200, "OK", "text/plain"); });
    auto config = ConfigFor(engine);
    config.api_version.clear();
    DockerClient client(config);

    EXPECT_TRUE(client.Ping());
    EXPECT_EQ(engine.Requests().at(0), "GET /_ping");
}

TEST(DockerClientTests, PingFailsWhenSocketIsMissing) {
    kalibox::config::DockerConfig config;
    config.socket_path = "/nonexistent/kalibox/docker.sock";
    config.request_timeout_s = 2;
    DockerClient client(config);

    EXPECT_FALSE(client.Ping());
    try {
        client.InspectContainer(kId);
        FAIL() << "expected DockerError";
    } catch (const DockerError& ex) {
        EXPECT_EQ(ex.Status(), 0);
    }
}

TEST(DockerClientTests, CreatePublishesPortOnEngineAssignedHostPort) {
    FakeEngine engine([](const FakeEngine::Request&) {
        return FakeEngine::Reply(201, std::string(R"({"Id":")") + kId + R"(","Warnings":[]})");
    });
    DockerClient client(ConfigFor(engine));

    ContainerSpec spec;
    spec.image = "dawnyawn-kali-agent";
    spec.command = {"/usr/sbin/sshd", "-D"};
    spec.published_ports = {"22/tcp"};
    EXPECT_EQ(client.CreateContainer(spec), kId);

    EXPECT_EQ(engine.Requests().at(0), "POST /v1.41/containers/create");
    const auto body = nlohmann::json::parse(engine.LastBody());
    EXPECT_EQ(body["Image"], "dawnyawn-kali-agent");
    EXPECT_EQ(body["Cmd"], nlohmann::json::array({"/usr/sbin/sshd", "-D"}));
    EXPECT_TRUE(body["ExposedPorts"].contains("22/tcp"));
    EXPECT_EQ(body["HostConfig"]["PortBindings"]["22/tcp"][0]["HostPort"], "");
}

TEST(DockerClientTests, CreateWithMissingImageThrowsNotFound) {
    FakeEngine engine([](const FakeEngine::Request&) {
        return FakeEngine::Reply(404, R"({"message":"No such image: dawnyawn-kali-agent:latest"})");
    });
    DockerClient client(ConfigFor(engine));

    ContainerSpec spec;
    spec.image = "dawnyawn-kali-agent";
    try {
        client.CreateContainer(spec);
        FAIL() << "expected NotFoundError";
    } catch (const NotFoundError& ex) {
        EXPECT_NE(std::string(ex.what()).find("No such image"), std::string::npos);
    }
}

TEST(DockerClientTests, ServerErrorCarriesStatus) {
    FakeEngine engine([](const FakeEngine::Request&) {
        return FakeEngine::Reply(500, R"({"message":"driver failed"})");
    });
    DockerClient client(ConfigFor(engine));

    try {
        client.StartContainer(kId);
        FAIL() << "expected DockerError";
    } catch (const NotFoundError&) {
        FAIL() << "500 is not a NotFoundError";
    } catch (const DockerError& ex) {
        EXPECT_EQ(ex.Status(), 500);
        EXPECT_NE(std::string(ex.what()).find("driver failed"), std::string::npos);
    }
}

TEST(DockerClientTests, StartAndStopAcceptNotModified) {
    FakeEngine engine([](const FakeEngine::Request&) { return FakeEngine::Reply(304); });
    DockerClient client(ConfigFor(engine));

    EXPECT_NO_THROW(client.StartContainer(kId));
    EXPECT_NO_THROW(client.StopContainer(kId, std::chrono::seconds(7)));
    const auto requests = engine.Requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[0], std::string("POST /v1.41/containers/") + kId + "/start");
    EXPECT_EQ(requests[1], std::string("POST /v1.41/containers/") + kId + "/stop?t=7");
}

TEST(DockerClientTests, RemoveForcesAndReportsMissingContainer) {
    FakeEngine engine([](const FakeEngine::Request&) {
        return FakeEngine::Reply(404, R"({"message":"No such container: abc"})");
    });
    DockerClient client(ConfigFor(engine));

    EXPECT_THROW(client.RemoveContainer(kId, true), NotFoundError);
    EXPECT_EQ(engine.Requests().at(0), std::string("DELETE /v1.41/containers/") + kId + "?force=true");
}

TEST(DockerClientTests, InspectReadsStatusAndPorts) {
    FakeEngine engine([](const FakeEngine::Request&) {
        return FakeEngine::Reply(200, std::string(R"({"Id":")") + kId + R"(",
            "State":{"Status":"running"},
            "NetworkSettings":{"Ports":{
                "22/tcp":[{"HostIp":"0.0.0.0","HostPort":"49154"},{"HostIp":"::","HostPort":"49154"}],
                "80/tcp":null}}})");
    });
    DockerClient client(ConfigFor(engine));

    const auto state = client.InspectContainer(kId);
    EXPECT_EQ(state.id, kId);
    EXPECT_EQ(state.status, "running");
    ASSERT_EQ(state.ports.at("22/tcp").size(), 2u);
    EXPECT_EQ(state.ports.at("22/tcp")[0].host_port, "49154");
    EXPECT_TRUE(state.ports.at("80/tcp").empty());
}

TEST(DockerClientTests, ArchiveReturnsTarBytes) {
    const auto tar = TarBuilder().AddFile("out.txt", "hello\n").Finish();
    FakeEngine engine([tar](const FakeEngine::Request&) {
        return FakeEngine::Reply(200, tar, "application/x-tar");
    });
    DockerClient client(ConfigFor(engine));

    const auto bytes = client.GetArchive(kId, "/tmp/out file.txt");
    ASSERT_TRUE(bytes.has_value());
    EXPECT_EQ(*bytes, tar);
    EXPECT_EQ(engine.Requests().at(0),
              std::string("GET /v1.41/containers/") + kId + "/archive?path=/tmp/out%20file.txt");
}

TEST(DockerClientTests, ArchiveOfMissingPathIsNullopt) {
    FakeEngine engine([](const FakeEngine::Request&) {
        return FakeEngine::Reply(404, R"({"message":"Could not find the file /tmp/missing.txt in container abc"})");
    });
    DockerClient client(ConfigFor(engine));

    EXPECT_FALSE(client.GetArchive(kId, "/tmp/missing.txt").has_value());
}

TEST(DockerClientTests, ArchiveOfMissingContainerThrows) {
    FakeEngine engine([](const FakeEngine::Request&) {
        return FakeEngine::Reply(404, R"({"message":"No such container: abc"})");
    });
    DockerClient client(ConfigFor(engine));

    EXPECT_THROW(client.GetArchive(kId, "/tmp/out.txt"), NotFoundError);
}

TEST(DockerClientTests, SlowEngineTimesOut) {
    FakeEngine engine([](const FakeEngine::Request&) {
        std::this_thread::sleep_for(std::chrono::milliseconds(2500));
        return FakeEngine::Reply(200, "OK", "text/plain");
    });
    auto config = ConfigFor(engine);
    config.request_timeout_s = 1;
    DockerClient client(config);

    const auto started = std::chrono::steady_clock::now();
    try {
        client.InspectContainer(kId);
        FAIL() << "expected DockerError";
    } catch (const DockerError& ex) {
        EXPECT_EQ(ex.Status(), 0);
    }
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(2400));
}

TEST(DockerClientTests, ExtractErrorMessageFallsBackToBody) {
    EXPECT_EQ(ExtractErrorMessage(R"({"message":"boom"})"), "boom");
    EXPECT_EQ(ExtractErrorMessage("plain failure"), "plain failure");
}
