#pragma once

#include <exception>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <socks5chain/utils/logger_fwd.hpp>
#include <socks5chain/utils/non_copyable.hpp>

namespace socks5chain::logger {

class Logger final : utils::NonCopyable {
 public:
  static const std::string kPattern;

  Logger(std::shared_ptr<spdlog::logger> logger, Level lvl);

  Level GetLevel() const noexcept;
  void Write(const spdlog::source_loc& loc, Level lvl,
             std::string_view msg) noexcept;

 private:
  std::shared_ptr<spdlog::logger> logger_;
  Level level_;
};

LoggerPtr Current() noexcept;

// A record that fails to format is logged as the formatting error.
template <typename... Args>
void Log(const spdlog::source_loc& loc, Level lvl,
         fmt::format_string<Args...> format, Args&&... args) noexcept {
  const auto logger = Current();
  try {
    logger->Write(loc, lvl,
                  fmt::format(format, std::forward<Args>(args)...));
  } catch (const std::exception& ex) {
    logger->Write(loc, lvl, ex.what());
  }
}

#define SOCKS5CHAIN_LOG(LEVEL, ...)                                        \
  do {                                                                     \
    if (socks5chain::logger::Level::LEVEL >=                               \
        socks5chain::logger::GetLevel()) {                                 \
      socks5chain::logger::Log(                                            \
          spdlog::source_loc{__FILE__, __LINE__, __func__},                \
          socks5chain::logger::Level::LEVEL, __VA_ARGS__);                 \
    }                                                                      \
  } while (0)

}  // namespace socks5chain::logger
