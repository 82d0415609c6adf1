#include <utils/logger.hpp>
#include <atomic>
#include <cstdio>
#include <stdexcept>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace socks5chain::logger {

namespace {

constexpr Level kDefaultLevel{Level::info};
constexpr const char* kStdoutLoggerName{"stdout"};
constexpr const char* kFileLoggerName{"file"};

spdlog::level::level_enum ToSpdlog(Level lvl) noexcept {
  return static_cast<spdlog::level::level_enum>(lvl);
}

std::atomic<Level>& ActiveLevel() noexcept {
  static std::atomic<Level> level{kDefaultLevel};
  return level;
}

std::atomic<LoggerPtr>& ActiveLogger() {
  static std::atomic<LoggerPtr> logger{MakeStdoutLogger(kDefaultLevel)};
  return logger;
}

// Every stdout logger writes through one registry entry.
std::shared_ptr<spdlog::logger> StdoutSpdlog() {
  if (auto logger = spdlog::get(kStdoutLoggerName)) {
    return logger;
  }
  return spdlog::stdout_color_mt(kStdoutLoggerName);
}

}  // namespace

const std::string Logger::kPattern{"[%Y-%m-%d %T.%e][%t][%l] %v"};

Logger::Logger(std::shared_ptr<spdlog::logger> logger, Level lvl)
    : logger_{std::move(logger)}, level_{lvl} {
  logger_->set_pattern(kPattern);
  logger_->set_level(ToSpdlog(lvl));
}

Level Logger::GetLevel() const noexcept { return level_; }

void Logger::Write(const spdlog::source_loc& loc, Level lvl,
                   std::string_view msg) noexcept {
  try {
    logger_->log(loc, ToSpdlog(lvl), msg);
  } catch (const std::exception& ex) {
    std::fprintf(stderr, "Logging failure: %s\n", ex.what());
  }
}

LoggerPtr Current() noexcept { return ActiveLogger().load(); }

void SetLogger(LoggerPtr logger) {
  if (!logger) {
    throw std::invalid_argument{"Logger must not be null"};
  }
  ActiveLevel() = logger->GetLevel();
  ActiveLogger().store(std::move(logger));
}

LoggerPtr MakeFileLogger(const std::string& log_path, Level lvl) {
  spdlog::drop(kFileLoggerName);
  auto logger =
      spdlog::basic_logger_mt<spdlog::async_factory>(kFileLoggerName, log_path);
  logger->flush_on(spdlog::level::err);
  return std::make_shared<Logger>(std::move(logger), lvl);
}

LoggerPtr MakeStdoutLogger(Level lvl) {
  auto logger = StdoutSpdlog();
  logger->flush_on(spdlog::level::trace);
  return std::make_shared<Logger>(std::move(logger), lvl);
}

Level GetLevel() noexcept { return ActiveLevel().load(std::memory_order_relaxed); }

}  // namespace socks5chain::logger
