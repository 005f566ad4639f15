#include "repoprobe/reporters/json_reporter.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace repoprobe::core;
using repoprobe::reporters::JsonReporter;
using repoprobe::reporters::JsonReporterConfig;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

SandboxResult HealthyResult() {
    SandboxResult result;
    result.dockerfile_source = DockerfileSource::GENERATED;
    result.build.image_built = true;
    result.build.build_time_ms = 5120;
    result.execution.status = "running";
    result.execution.exit_code = 0;
    result.execution.startup_time_ms = 8034;
    result.execution.stdout_log = "Listening on port 3000\n";
    result.health.process_alive = true;
    result.health.port_opened = true;
    result.health.detected_app_port = 3000;
    result.health.docker_exposed_ports = {3000, 8080};
    result.health.severity = Severity::OK;
    result.classification = Classification::HEALTHY_VERIFIED_PORT;
    result.env_injected = {"NODE_ENV", "PORT"};
    result.image_tag = "repoprobe-analysis-1-0-abcd1234";
    return result;
}

TEST(JsonReporterTest, DocumentLayout) {
    JsonReporter reporter;
    const auto j = reporter.ToJson(HealthyResult());

    EXPECT_EQ(j["dockerfile_source"], "generated");
    EXPECT_EQ(j["build"]["image_built"], true);
    EXPECT_EQ(j["build"]["build_time_ms"], 5120);
    EXPECT_TRUE(j["build"]["build_errors"].is_array());
    EXPECT_EQ(j["execution"]["status"], "running");
    EXPECT_EQ(j["execution"]["exit_code"], 0);
    EXPECT_EQ(j["execution"]["logs"]["stdout"], "Listening on port 3000\n");
    EXPECT_EQ(j["execution"]["logs"]["stderr"], "");
    EXPECT_EQ(j["health"]["detected_app_port"], 3000);
    EXPECT_EQ(j["health"]["docker_exposed_ports"], json::array({3000, 8080}));
    EXPECT_EQ(j["health"]["port_mismatch"], false);
    EXPECT_EQ(j["health"]["severity"], "ok");
    EXPECT_EQ(j["classification"], "healthy_verified_port");
    EXPECT_TRUE(j["errors"].empty());
    EXPECT_EQ(j["env_injected"], json::array({"NODE_ENV", "PORT"}));
    EXPECT_FALSE(j.contains("image_tag"));
}

TEST(JsonReporterTest, AbsentValuesAreNull) {
    SandboxResult result;
    result.classification = Classification::BUILD_FAILURE;
    result.health.severity = Severity::CRITICAL;
    result.errors = {"Docker build failed"};

    JsonReporter reporter;
    const auto j = reporter.ToJson(result);

    EXPECT_TRUE(j["execution"]["exit_code"].is_null());
    EXPECT_TRUE(j["health"]["detected_app_port"].is_null());
    EXPECT_EQ(j["execution"]["status"], "pending");
    EXPECT_EQ(j["classification"], "build_failure");
    EXPECT_EQ(j["health"]["severity"], "critical");
    EXPECT_EQ(j["errors"][0], "Docker build failed");
}

TEST(JsonReporterTest, ImageTagIsOptIn) {
    JsonReporterConfig config;
    config.include_image_tag = true;
    JsonReporter reporter(config);

    const auto j = reporter.ToJson(HealthyResult());
    EXPECT_EQ(j["image_tag"], "repoprobe-analysis-1-0-abcd1234");
}

TEST(JsonReporterTest, InvalidUtf8DoesNotThrow) {
    auto result = HealthyResult();
    result.execution.stdout_log = "bad \xC3\x28 bytes";

    JsonReporter reporter;
    std::string text;
    EXPECT_NO_THROW(text = reporter.GenerateJsonString(result));
    EXPECT_TRUE(JsonReporter::ValidateSyntax(text));
}

TEST(JsonReporterTest, CompactOutputHasNoNewlines) {
    JsonReporterConfig config;
    config.pretty_print = false;
    JsonReporter reporter(config);

    const auto text = reporter.GenerateJsonString(HealthyResult());
    EXPECT_EQ(text.find("\n{"), std::string::npos);
    EXPECT_EQ(text.front(), '{');
    EXPECT_EQ(json::parse(text)["classification"], "healthy_verified_port");
}

TEST(JsonReporterTest, GenerateReportCreatesDirectories) {
    const auto dir = fs::temp_directory_path() / "repoprobe_json_reporter_test";
    fs::remove_all(dir);
    const auto path = dir / "nested" / "result.json";

    JsonReporter reporter;
    ASSERT_TRUE(reporter.GenerateReport(HealthyResult(), path));

    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    const auto j = json::parse(buffer.str());
    EXPECT_EQ(j["classification"], "healthy_verified_port");

    fs::remove_all(dir);
}

TEST(JsonReporterTest, ValidateSyntaxRejectsGarbage) {
    EXPECT_FALSE(JsonReporter::ValidateSyntax("{\"unterminated\": "));
    EXPECT_TRUE(JsonReporter::ValidateSyntax("{}"));
}

} // namespace
