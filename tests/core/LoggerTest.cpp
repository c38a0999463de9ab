#include <gtest/gtest.h>
#include <laneflow/common/Logger.h>
#include <laneflow/core/Graph.h>
#include <laneflow/layout/NodeSizer.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "TestDiagrams.h"

using namespace laneflow;

namespace {

class RecordingBackend : public ILoggerBackend {
public:
    explicit RecordingBackend(std::vector<std::pair<LogLevel, std::string>>* sink) : sink_(sink) {}

    void log(LogLevel level, const std::string& message, const std::source_location&) override {
        sink_->emplace_back(level, message);
    }
    void setLevel(LogLevel) override {}
    void flush() override {}

private:
    std::vector<std::pair<LogLevel, std::string>>* sink_;
};

}  // namespace

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::setBackend(std::make_unique<RecordingBackend>(&records_));
        Logger::clearCapturedLogs();
        Logger::enableCapture(true);
    }

    void TearDown() override {
        Logger::enableCapture(false);
        Logger::clearCapturedLogs();
        Logger::setBackend(nullptr);
    }

    std::vector<std::pair<LogLevel, std::string>> records_;
};

TEST_F(LoggerTest, MessagesReachInjectedBackend) {
    LOG_WARN("lane {} is empty", 3);

    ASSERT_EQ(records_.size(), 1u);
    EXPECT_EQ(records_[0].first, LogLevel::Warn);
    EXPECT_NE(records_[0].second.find("lane 3 is empty"), std::string::npos);
    EXPECT_NE(records_[0].second.find("() - "), std::string::npos);
}

TEST_F(LoggerTest, CaptureFiltersByPattern) {
    LOG_INFO("first");
    LOG_DEBUG("second");
    LOG_INFO("third");

    auto all = Logger::getCapturedLogs();
    EXPECT_EQ(all.size(), 3u);

    auto infos = Logger::getCapturedLogs("[info]");
    ASSERT_EQ(infos.size(), 2u);
    EXPECT_NE(infos[1].find("third"), std::string::npos);

    auto last = Logger::getCapturedLogs("", 1);
    ASSERT_EQ(last.size(), 1u);
    EXPECT_NE(last[0].find("third"), std::string::npos);
}

TEST_F(LoggerTest, CaptureDisabledRecordsNothing) {
    Logger::enableCapture(false);
    LOG_ERROR("not captured");
    EXPECT_TRUE(Logger::getCapturedLogs().empty());
    EXPECT_EQ(records_.size(), 1u);
}

TEST_F(LoggerTest, LayoutPassesLogSummaries) {
    Graph graph = Graph::fromDescriptor(test::DiagramBuilder().node("a", "", "event").node("b").build());
    NodeSizer().apply(graph);

    auto logs = Logger::getCapturedLogs("Sized");
    ASSERT_EQ(logs.size(), 1u);
    EXPECT_NE(logs[0].find("2 nodes (1 with bottom labels)"), std::string::npos);
}
