#include <gtest/gtest.h>
#include <utils/logger.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <spdlog/sinks/ostream_sink.h>

namespace socks5chain::logger {

namespace {

class LoggerTest : public ::testing::Test {
 protected:
  ~LoggerTest() override { SetLogger(MakeStdoutLogger(Level::info)); }

  void UseStreamLogger(Level lvl) {
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out_);
    SetLogger(std::make_shared<Logger>(
        std::make_shared<spdlog::logger>("logger_test", std::move(sink)),
        lvl));
  }

  std::ostringstream out_;
};

}  // namespace

TEST_F(LoggerTest, WritesRecordsAtOrAboveLevel) {
  UseStreamLogger(Level::info);
  EXPECT_EQ(GetLevel(), Level::info);

  SOCKS5CHAIN_LOG(info, "Listening on port {}", 1080);
  SOCKS5CHAIN_LOG(debug, "Not written");
  SOCKS5CHAIN_LOG(error, "Failed");

  const auto text = out_.str();
  EXPECT_NE(text.find("[info] Listening on port 1080"), std::string::npos);
  EXPECT_NE(text.find("[error] Failed"), std::string::npos);
  EXPECT_EQ(text.find("Not written"), std::string::npos);
}

TEST_F(LoggerTest, LevelOffDropsEverything) {
  UseStreamLogger(Level::off);
  SOCKS5CHAIN_LOG(critical, "Dropped");
  EXPECT_TRUE(out_.str().empty());
}

TEST_F(LoggerTest, ReplacingLoggerUpdatesLevel) {
  UseStreamLogger(Level::trace);
  EXPECT_EQ(GetLevel(), Level::trace);
  SetLogger(MakeStdoutLogger(Level::warn));
  EXPECT_EQ(GetLevel(), Level::warn);
}

TEST_F(LoggerTest, NullLoggerIsRejected) {
  EXPECT_THROW(SetLogger(nullptr), std::invalid_argument);
}

}  // namespace socks5chain::logger
