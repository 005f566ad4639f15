#include "repoprobe/analyzers/log_analyzer.hpp"

#include <gtest/gtest.h>

using repoprobe::analyzers::LogAnalyzer;

namespace {

class LogAnalyzerTest : public ::testing::Test {
protected:
    LogAnalyzer analyzer_;
};

TEST_F(LogAnalyzerTest, EmptyInputYieldsNothing) {
    auto analysis = analyzer_.Analyze("");
    EXPECT_TRUE(analysis.findings.empty());
    EXPECT_FALSE(analysis.detected_port.has_value());
}

TEST_F(LogAnalyzerTest, MissingPythonModule) {
    auto analysis = analyzer_.Analyze(
        "Traceback (most recent call last):\n"
        "  File \"/app/app.py\", line 1, in <module>\n"
        "ModuleNotFoundError: No module named 'flask'\n");

    ASSERT_EQ(analysis.findings.size(), 3u);
    EXPECT_EQ(analysis.findings[0].label, "Missing Python Dependency");
    EXPECT_EQ(analysis.findings[0].detail, "ModuleNotFoundError: No module named 'flask'");
    EXPECT_EQ(analysis.findings[1].label, "Python Crash Trace");
    EXPECT_EQ(analysis.findings[1].detail, "Traceback (most recent call last):");
    // "Error:" also fires inside "ModuleNotFoundError:"
    EXPECT_EQ(analysis.findings[2].label, "Generic Error");
    EXPECT_EQ(analysis.findings[2].detail, "Error: No module named 'flask'");
}

TEST_F(LogAnalyzerTest, FindingsFollowTableOrderNotLogOrder) {
    auto analysis = analyzer_.Analyze(
        "Error: Cannot find module 'express'\n"
        "MongooseError: connect ECONNREFUSED\n");

    ASSERT_EQ(analysis.findings.size(), 3u);
    EXPECT_EQ(analysis.findings[0].label, "Database Connection Fail");
    EXPECT_EQ(analysis.findings[1].label, "Missing Node Module");
    EXPECT_EQ(analysis.findings[2].label, "Generic Error");
    EXPECT_EQ(analysis.findings[2].detail, "Error: Cannot find module 'express'");
}

TEST_F(LogAnalyzerTest, SignaturesAreCaseInsensitive) {
    auto analysis = analyzer_.Analyze("warning: typeerror: x is undefined\n");
    ASSERT_FALSE(analysis.findings.empty());
    EXPECT_EQ(analysis.findings[0].label, "Type Mismatch");
    EXPECT_EQ(analysis.findings[0].detail, "typeerror: x is undefined");
}

TEST_F(LogAnalyzerTest, OneFindingPerSignature) {
    auto analysis = analyzer_.Analyze("CRITICAL: one\nCRITICAL: two\n");
    ASSERT_EQ(analysis.findings.size(), 1u);
    EXPECT_EQ(analysis.findings[0].detail, "CRITICAL: one");
}

TEST_F(LogAnalyzerTest, DetailIsTruncatedTo150Characters) {
    auto analysis = analyzer_.Analyze("SyntaxError: " + std::string(400, 'x') + "\n");
    ASSERT_FALSE(analysis.findings.empty());
    EXPECT_EQ(analysis.findings[0].detail.size(), LogAnalyzer::kMaxDetailChars);
}

TEST_F(LogAnalyzerTest, DetectsFlaskPort) {
    auto analysis = analyzer_.Analyze(
        " * Serving Flask app 'app'\n"
        " * Running on http://127.0.0.1:5000\n");
    ASSERT_TRUE(analysis.detected_port.has_value());
    EXPECT_EQ(*analysis.detected_port, 5000);
    EXPECT_TRUE(analysis.findings.empty());
}

TEST_F(LogAnalyzerTest, PortPatternOrderWins) {
    // localhost:4000 appears first in the log, but "Listening on port" ranks higher
    auto analysis = analyzer_.Analyze(
        "proxy at localhost:4000\n"
        "Listening on port 3000\n");
    ASSERT_TRUE(analysis.detected_port.has_value());
    EXPECT_EQ(*analysis.detected_port, 3000);
}

TEST_F(LogAnalyzerTest, PortPatternsAreCaseSensitive) {
    auto analysis = analyzer_.Analyze("LISTENING ON PORT 3000\n");
    EXPECT_FALSE(analysis.detected_port.has_value());
}

TEST_F(LogAnalyzerTest, OutOfRangePortsAreIgnored) {
    auto analysis = analyzer_.Analyze("Listening on port 99999\nListening on port 0\n");
    EXPECT_FALSE(analysis.detected_port.has_value());

    analysis = analyzer_.Analyze("Listening on port 99999\nserver at 0.0.0.0:8000\n");
    ASSERT_TRUE(analysis.detected_port.has_value());
    EXPECT_EQ(*analysis.detected_port, 8000);
}

TEST_F(LogAnalyzerTest, ToleratesInvalidUtf8AndNulBytes) {
    std::string logs = "boot\xFF\xFE";
    logs.push_back('\0');
    logs += "ok\nImportError: cannot import name 'x'\n";
    auto analysis = analyzer_.Analyze(logs);
    ASSERT_EQ(analysis.findings.size(), 2u);
    EXPECT_EQ(analysis.findings[0].label, "Import Error");
    EXPECT_EQ(analysis.findings[1].label, "Generic Error");
}

TEST_F(LogAnalyzerTest, HandlesVeryLongLines) {
    std::string logs(200000, 'a');
    logs += " Exception: boom\n";
    auto analysis = analyzer_.Analyze(logs);
    ASSERT_EQ(analysis.findings.size(), 1u);
    EXPECT_EQ(analysis.findings[0].label, "Generic Exception");
}

TEST_F(LogAnalyzerTest, SignatureAcrossSegmentEdge) {
    // "ModuleNotFoundError" starts a few bytes before the 4096-byte edge
    auto analysis = analyzer_.Analyze(
        std::string(4090, 'x') + " ModuleNotFoundError: No module named 'flask'");

    ASSERT_EQ(analysis.findings.size(), 2u);
    EXPECT_EQ(analysis.findings[0].label, "Missing Python Dependency");
    EXPECT_EQ(analysis.findings[0].detail, "ModuleNotFoundError: No module named 'flask'");
    EXPECT_EQ(analysis.findings[1].label, "Generic Error");
}

TEST_F(LogAnalyzerTest, PortAnnouncementAcrossSegmentEdge) {
    auto analysis = analyzer_.Analyze(std::string(4085, 'y') + " Listening on port 3000");
    ASSERT_TRUE(analysis.detected_port.has_value());
    EXPECT_EQ(*analysis.detected_port, 3000);
}

TEST_F(LogAnalyzerTest, PortDigitsSplitAtSegmentEdge) {
    // The first window ends right after "port 30"
    const std::string phrase = "Listening on port 30";
    auto analysis = analyzer_.Analyze(
        std::string(LogAnalyzer::kSegmentBytes - phrase.size(), 'z') + phrase + "00 ok");
    ASSERT_TRUE(analysis.detected_port.has_value());
    EXPECT_EQ(*analysis.detected_port, 3000);
}

TEST_F(LogAnalyzerTest, DetailFromLongLineIsNotCutAtSegmentEdge) {
    const std::string message = "SyntaxError: " + std::string(200, 'q');
    auto analysis = analyzer_.Analyze(std::string(4000, ' ') + "x" + message);
    ASSERT_FALSE(analysis.findings.empty());
    EXPECT_EQ(analysis.findings[0].label, "Syntax Error");
    EXPECT_EQ(analysis.findings[0].detail, message.substr(0, LogAnalyzer::kMaxDetailChars));
}

TEST_F(LogAnalyzerTest, AnalyzeIsDeterministic) {
    const std::string logs = "unhandledRejection\nAddress already in use :::3000\n";
    auto first = analyzer_.Analyze(logs);
    auto second = analyzer_.Analyze(logs);
    EXPECT_EQ(first.findings, second.findings);
    EXPECT_EQ(first.detected_port, second.detected_port);
}

} // namespace
