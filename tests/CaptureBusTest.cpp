// © 2026 Beatrix Zselezny. All rights reserved.
// Rnd-Sequencer Token Randomness Framework

#include "core/CaptureBus.hpp"
#include "core/Scheduler.hpp"
#include "core/TokenSession.hpp"
#include "modules/CaptureFileModule.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "gtest/gtest.h"

namespace {

namespace fs = std::filesystem;

using namespace Sequencer::Core;
using Sequencer::Modules::CaptureFileModule;

TokenCapture failure(CaptureStatus status, const std::string& detail) {
    TokenCapture capture;
    capture.status = status;
    capture.failureDetail = detail;
    return capture;
}

// Tesztenként külön munkakönyvtár a rendszer temp alatt
fs::path scratchDir() {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    fs::path dir = fs::temp_directory_path() /
                   (std::string("rndsequencer_") + info->test_suite_name() + "_" + info->name());
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

void writeFile(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

// --- TokenCapture ---

TEST(TokenCaptureTest, LegacySentinelsBecomeStatuses) {
    auto notFound = classifyLegacyToken("Not found");
    EXPECT_EQ(notFound.status, CaptureStatus::NotFound);
    EXPECT_FALSE(notFound.isValidToken());
    EXPECT_EQ(notFound.displayToken(), "Not found");

    auto failed = classifyLegacyToken("Request failed: connection reset");
    EXPECT_EQ(failed.status, CaptureStatus::RequestFailed);
    EXPECT_EQ(failed.failureDetail, "connection reset");
    EXPECT_EQ(failed.displayToken(), "Request failed");

    auto parse = classifyLegacyToken("Parse Error: bad template");
    EXPECT_EQ(parse.status, CaptureStatus::ParseError);
    EXPECT_EQ(parse.displayToken(), "Parse Error: bad template");

    auto token = classifyLegacyToken("f00dcafe");
    EXPECT_EQ(token.status, CaptureStatus::Found);
    EXPECT_TRUE(token.isValidToken());
    EXPECT_EQ(token.extractedFrom, "Token file");
}

TEST(TokenCaptureTest, FoundCaptureKeepsLiteralSentinelText) {
    auto capture = makeFoundCapture("Not found", "JSON response");
    EXPECT_TRUE(capture.isValidToken());
    EXPECT_EQ(capture.displayToken(), "Not found");
    EXPECT_STREQ(toString(capture.status), "FOUND");
}

// --- CaptureBus ---

TEST(CaptureBusTest, PublishedCapturesReachSession) {
    TokenSession session;
    CaptureBus bus(session, LogLevel::SILENT);
    Scheduler scheduler;
    scheduler.start(bus);
    EXPECT_TRUE(scheduler.isRunning());

    bus.publish(makeFoundCapture("abc123", "test"));
    bus.publish(makeFoundCapture("def456", "test"));
    bus.publish(failure(CaptureStatus::RequestFailed, "timeout"));
    bus.publish(failure(CaptureStatus::NotFound, ""));

    ASSERT_EQ(session.size(), 4u);
    auto captures = session.snapshot();
    EXPECT_EQ(captures[0].token, "abc123");
    EXPECT_EQ(captures[2].status, CaptureStatus::RequestFailed);

    auto snap = bus.getTelemetrySnapshot();
    EXPECT_EQ(snap.total, 4u);
    EXPECT_EQ(snap.found, 2u);
    EXPECT_EQ(snap.request_failed, 1u);
    EXPECT_EQ(snap.not_found, 1u);
    EXPECT_EQ(snap.dropped, 0u);
    EXPECT_EQ(snap.state, BusState::UP);
    EXPECT_DOUBLE_EQ(snap.success_rate, 0.5);

    scheduler.stop();
    EXPECT_FALSE(scheduler.isRunning());
}

TEST(CaptureBusTest, PublishWithoutPipelineIsDropped) {
    TokenSession session;
    CaptureBus bus(session, LogLevel::SILENT);

    bus.publish(makeFoundCapture("lost", "test"));

    EXPECT_EQ(session.size(), 0u);
    auto snap = bus.getTelemetrySnapshot();
    EXPECT_EQ(snap.total, 1u);
    EXPECT_EQ(snap.dropped, 1u);
    EXPECT_DOUBLE_EQ(snap.success_rate, 0.0);
}

TEST(CaptureBusTest, CompletedBusRejectsCaptures) {
    TokenSession session;
    CaptureBus bus(session, LogLevel::SILENT);
    Scheduler scheduler;
    scheduler.start(bus);

    bus.publish(makeFoundCapture("first", "test"));
    bus.complete();
    bus.publish(makeFoundCapture("late", "test"));

    EXPECT_EQ(session.size(), 1u);
    auto snap = bus.getTelemetrySnapshot();
    EXPECT_EQ(snap.state, BusState::COMPLETED);
    EXPECT_EQ(snap.dropped, 1u);
}

TEST(CaptureBusTest, LiveObserversSeeCaptures) {
    TokenSession session;
    CaptureBus bus(session, LogLevel::SILENT);
    Scheduler scheduler;
    scheduler.start(bus);

    std::vector<std::string> seen;
    bool completed = false;
    bus.captures().subscribe(
        [&seen](const TokenCapture& capture) { seen.push_back(capture.token); },
        [&completed]() { completed = true; });

    bus.publish(makeFoundCapture("live", "test"));
    bus.complete();

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], "live");
    EXPECT_TRUE(completed);
}

TEST(TokenSessionTest, ClearEmptiesSession) {
    TokenSession session;
    session.append(makeFoundCapture("a", "test"));
    session.append(makeFoundCapture("b", "test"));
    EXPECT_EQ(session.size(), 2u);

    auto copy = session.snapshot();
    session.clear();
    EXPECT_EQ(session.size(), 0u);
    EXPECT_EQ(copy.size(), 2u);
}

// --- CaptureFileModule ---

TEST(CaptureFileModuleTest, TokenFileWithLegacySentinels) {
    const fs::path dir = scratchDir();
    writeFile(dir / "tokens.txt", "abc123\n\n  def456  \nNot found\nRequest failed: 503\n");

    TokenSession session;
    CaptureBus bus(session, LogLevel::SILENT);
    Scheduler scheduler;
    scheduler.start(bus);

    CaptureFileModule collector(bus);
    EXPECT_EQ(collector.getName(), "CaptureFileModule");
    ASSERT_TRUE(collector.loadTokenFile((dir / "tokens.txt").string(), false));
    EXPECT_EQ(collector.publishedCount(), 4u);

    auto captures = session.snapshot();
    ASSERT_EQ(captures.size(), 4u);
    EXPECT_EQ(captures[1].token, "def456");
    EXPECT_EQ(captures[2].status, CaptureStatus::NotFound);
    EXPECT_EQ(captures[3].status, CaptureStatus::RequestFailed);
    EXPECT_EQ(captures[3].failureDetail, "503");

    fs::remove_all(dir);
}

TEST(CaptureFileModuleTest, LiteralTokenFileKeepsSentinelText) {
    const fs::path dir = scratchDir();
    writeFile(dir / "tokens.txt", "Not found\nRequest failed\n");

    TokenSession session;
    CaptureBus bus(session, LogLevel::SILENT);
    Scheduler scheduler;
    scheduler.start(bus);

    CaptureFileModule collector(bus);
    ASSERT_TRUE(collector.loadTokenFile((dir / "tokens.txt").string(), true));

    auto captures = session.snapshot();
    ASSERT_EQ(captures.size(), 2u);
    for (const auto& capture : captures) {
        EXPECT_EQ(capture.status, CaptureStatus::Found);
        EXPECT_TRUE(capture.isValidToken());
    }
    fs::remove_all(dir);
}

TEST(CaptureFileModuleTest, MissingTokenFileFails) {
    TokenSession session;
    CaptureBus bus(session, LogLevel::SILENT);
    CaptureFileModule collector(bus);
    EXPECT_FALSE(collector.loadTokenFile("/nonexistent/rndsequencer/tokens.txt", false));
    EXPECT_EQ(collector.publishedCount(), 0u);
}

TEST(CaptureFileModuleTest, ResponseDirectoryIsScannedInNameOrder) {
    const fs::path dir = scratchDir();
    writeFile(dir / "01.http", "HTTP/1.1 200 OK\r\nSet-Cookie: sid=aaa111; Path=/\r\n\r\n<html></html>");
    writeFile(dir / "02.http", "HTTP/1.1 200 OK\r\nContent-Type: application/json\r\n\r\n{\"other\":1}");
    writeFile(dir / "03.http", "");

    TokenSession session;
    CaptureBus bus(session, LogLevel::SILENT);
    Scheduler scheduler;
    scheduler.start(bus);

    CaptureFileModule collector(bus);
    ASSERT_TRUE(collector.loadResponseDirectory(dir.string(), "sid"));

    auto captures = session.snapshot();
    ASSERT_EQ(captures.size(), 3u);
    EXPECT_EQ(captures[0].status, CaptureStatus::Found);
    EXPECT_EQ(captures[0].token, "aaa111");
    EXPECT_EQ(captures[0].extractedFrom, "Set-Cookie header");
    EXPECT_TRUE(captures[0].requestSent.empty());
    EXPECT_EQ(captures[1].status, CaptureStatus::NotFound);
    EXPECT_EQ(captures[2].status, CaptureStatus::RequestFailed);

    EXPECT_FALSE(collector.loadResponseDirectory((dir / "01.http").string(), "sid"));
    fs::remove_all(dir);
}

} // namespace
