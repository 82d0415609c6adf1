#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace socks5chain::cli {

// Print the prompt and read one line from stdin. nullopt on EOF.
std::optional<std::string> ReadLine(std::string_view prompt);

// Same as ReadLine(), with terminal echo disabled while reading.
std::optional<std::string> ReadPassword(std::string_view prompt);

}  // namespace socks5chain::cli
