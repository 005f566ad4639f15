#include "repoprobe/utils/container_client.hpp"
#include "fake_command_runner.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>

using namespace repoprobe::utils;
using repoprobe::test::FakeCommandRunner;

namespace {

bool Contains(const std::vector<std::string>& args, const std::string& value) {
    return std::find(args.begin(), args.end(), value) != args.end();
}

TEST(ContainerClientTest, ConstructorProbesDaemon) {
    auto runner = std::make_shared<FakeCommandRunner>();
    ContainerClient client(runner);

    EXPECT_EQ(client.GetServerVersion(), "24.0.7");
    ASSERT_EQ(runner->calls.size(), 1u);
    EXPECT_EQ(runner->calls[0][0], "docker");
    EXPECT_EQ(runner->calls[0][1], "version");
    EXPECT_EQ(runner->call_options[0].timeout, std::chrono::milliseconds(300000));
}

TEST(ContainerClientTest, ConstructorThrowsWhenDaemonUnavailable) {
    auto runner = std::make_shared<FakeCommandRunner>();
    runner->behavior.daemon_available = false;

    try {
        ContainerClient client(runner);
        FAIL() << "expected std::runtime_error";
    }
    catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("Cannot connect"), std::string::npos);
    }
}

TEST(ContainerClientTest, BuildRunArgsAppliesCapsAndNeverPrivileged) {
    ContainerConfig config;
    config.name = "probe-ctr";
    config.image = "probe:1";
    config.cpu_limit = 0.5;
    config.memory_limit = "512m";
    config.environment_vars = {{"PORT", "3000"}};
    config.labels = {{"repoprobe.run", "probe"}};

    auto args = ContainerClient::BuildRunArgs(config);

    EXPECT_EQ(args.front(), "run");
    EXPECT_EQ(args.back(), "probe:1");
    EXPECT_TRUE(Contains(args, "-d"));
    EXPECT_TRUE(Contains(args, "--publish-all"));
    EXPECT_TRUE(Contains(args, "0.5"));
    EXPECT_TRUE(Contains(args, "512m"));
    EXPECT_TRUE(Contains(args, "PORT=3000"));
    EXPECT_TRUE(Contains(args, "repoprobe.run=probe"));
    EXPECT_FALSE(Contains(args, "--privileged"));
    EXPECT_FALSE(Contains(args, "-v"));
}

TEST(ContainerClientTest, ParseInspectOutput) {
    const std::string doc = R"([{
        "Id": "abc123",
        "Name": "/probe-ctr",
        "State": {"Status": "exited", "Running": false, "ExitCode": 3},
        "NetworkSettings": {"Ports": {
            "8080/tcp": [{"HostIp": "0.0.0.0", "HostPort": "49160"}],
            "3000/tcp": [{"HostIp": "0.0.0.0", "HostPort": "49161"}],
            "3000/udp": null
        }}
    }])";

    auto info = ContainerClient::ParseInspectOutput(doc);
    EXPECT_EQ(info.id, "abc123");
    EXPECT_EQ(info.name, "probe-ctr");
    EXPECT_EQ(info.state, ContainerState::EXITED);
    EXPECT_FALSE(info.running);
    ASSERT_TRUE(info.exit_code.has_value());
    EXPECT_EQ(*info.exit_code, 3);
    EXPECT_EQ(info.exposed_ports, (std::vector<int>{3000, 8080}));
    EXPECT_EQ(info.port_mappings.at(8080), 49160);
    EXPECT_EQ(ContainerClient::FormatPortMappings(info), "3000->49161, 8080->49160");
}

TEST(ContainerClientTest, ParseInspectOutputWithoutPorts) {
    auto info = ContainerClient::ParseInspectOutput(
        R"({"Id": "x", "State": {"Status": "running", "Running": true, "ExitCode": 0},
            "NetworkSettings": {"Ports": null}})");
    EXPECT_TRUE(info.running);
    EXPECT_TRUE(info.exposed_ports.empty());
    EXPECT_EQ(ContainerClient::FormatPortMappings(info), "none");
}

TEST(ContainerClientTest, ParseStateMapping) {
    EXPECT_EQ(ContainerClient::ParseState("running"), ContainerState::RUNNING);
    EXPECT_EQ(ContainerClient::ParseState("restarting"), ContainerState::RUNNING);
    EXPECT_EQ(ContainerClient::ParseState("dead"), ContainerState::DEAD);
    EXPECT_EQ(ContainerClient::ParseState("weird"), ContainerState::UNKNOWN);
    EXPECT_EQ(ContainerClient::StateToString(ContainerState::EXITED), "exited");
}

TEST(ContainerClientTest, LifecycleAgainstFakeDaemon) {
    auto runner = std::make_shared<FakeCommandRunner>();
    ContainerClient client(runner);

    auto build = client.BuildImage("/tmp/repo", "probe-tag");
    EXPECT_TRUE(build.success);
    EXPECT_EQ(runner->images.count("probe-tag"), 1u);
    EXPECT_EQ(runner->call_options.back().timeout, std::chrono::milliseconds(900000));
    EXPECT_TRUE(runner->call_options.back().merge_output);

    ContainerConfig config;
    config.name = "probe-tag-ctr";
    config.image = "probe-tag";
    auto started = client.RunDetached(config);
    ASSERT_TRUE(started.success);
    EXPECT_FALSE(started.container_id.empty());

    auto info = client.InspectContainer(started.container_id);
    ASSERT_TRUE(info.has_value());
    EXPECT_TRUE(info->running);

    EXPECT_TRUE(client.StopContainer(started.container_id, std::chrono::seconds(1)));
    EXPECT_TRUE(client.RemoveContainer(started.container_id, true));
    EXPECT_TRUE(client.RemoveImage("probe-tag", true));
    EXPECT_TRUE(runner->images.empty());
    EXPECT_TRUE(runner->containers.empty());
    EXPECT_TRUE(client.ListImages("probe-tag").empty());
}

TEST(ContainerClientTest, FailedRunReportsDaemonMessage) {
    auto runner = std::make_shared<FakeCommandRunner>();
    runner->behavior.run_succeeds = false;
    ContainerClient client(runner);

    ContainerConfig config;
    config.image = "probe-tag";
    auto started = client.RunDetached(config);
    EXPECT_FALSE(started.success);
    EXPECT_NE(started.error.find("Error response from daemon"), std::string::npos);
}

TEST(ContainerClientTest, RunWithoutImageIsRejected) {
    auto runner = std::make_shared<FakeCommandRunner>();
    ContainerClient client(runner);

    auto started = client.RunDetached(ContainerConfig{});
    EXPECT_FALSE(started.success);
    EXPECT_EQ(runner->CountCalls("run"), 0);
}

} // namespace
