#include <cli/prompt.hpp>
#include <iostream>
#include <termios.h>
#include <unistd.h>

namespace socks5chain::cli {

namespace {

// Restores the terminal attributes on scope exit.
class EchoGuard final {
 public:
  EchoGuard() noexcept {
    if (!isatty(STDIN_FILENO) || tcgetattr(STDIN_FILENO, &saved_) != 0) {
      return;
    }
    termios attr = saved_;
    attr.c_lflag &= ~static_cast<tcflag_t>(ECHO);
    enabled_ = tcsetattr(STDIN_FILENO, TCSAFLUSH, &attr) == 0;
  }

  ~EchoGuard() {
    if (enabled_) {
      tcsetattr(STDIN_FILENO, TCSAFLUSH, &saved_);
    }
  }

  EchoGuard(const EchoGuard&) = delete;
  EchoGuard& operator=(const EchoGuard&) = delete;

 private:
  termios saved_{};
  bool enabled_{false};
};

std::optional<std::string> GetLine() {
  std::string line;
  if (!std::getline(std::cin, line)) {
    return std::nullopt;
  }
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  return line;
}

}  // namespace

std::optional<std::string> ReadLine(std::string_view prompt) {
  std::cout << prompt << std::flush;
  auto line = GetLine();
  if (line) {
    const auto begin = line->find_first_not_of(" \t");
    const auto end = line->find_last_not_of(" \t");
    *line = begin == std::string::npos ? std::string{}
                                       : line->substr(begin, end - begin + 1);
  }
  return line;
}

std::optional<std::string> ReadPassword(std::string_view prompt) {
  std::cout << prompt << std::flush;
  std::optional<std::string> password;
  {
    EchoGuard echo_guard;
    password = GetLine();
  }
  // The newline typed by the user was not echoed.
  std::cout << std::endl;
  return password;
}

}  // namespace socks5chain::cli
