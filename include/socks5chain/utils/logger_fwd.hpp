#pragma once

#include <memory>
#include <string>
#include <socks5chain/common/api_macro.hpp>

namespace socks5chain::logger {

// Same numbering as spdlog::level::level_enum.
enum SOCKS5CHAIN_API Level : int {
  trace = 0,
  debug,
  info,
  warn,
  error,
  critical,
  off,
};

class Logger;
using LoggerPtr = std::shared_ptr<Logger>;

/**
 * @brief Route log records to the logger. Records below the logger's level
 * are dropped before they are formatted. Thread-safe.
 *
 * @throws std::invalid_argument if logger is null.
 */
SOCKS5CHAIN_API void SetLogger(LoggerPtr logger);

/**
 * @brief Logger appending to a file from a background thread. Records of
 * level error and above are flushed immediately.
 *
 * @throws std::exception if the file cannot be opened.
 */
SOCKS5CHAIN_API LoggerPtr MakeFileLogger(const std::string& log_path,
                                         Level lvl);

/**
 * @brief Logger writing to stdout. Until SetLogger() is called records go to
 * a stdout logger with level info.
 */
SOCKS5CHAIN_API LoggerPtr MakeStdoutLogger(Level lvl);

SOCKS5CHAIN_API Level GetLevel() noexcept;

}  // namespace socks5chain::logger
