#pragma once

#include <cstddef>
#include <functional>
#include <thread>
#include <vector>
#include <socks5chain/utils/non_copyable.hpp>

namespace socks5chain::utils {

/**
 * @brief Fixed number of threads all running the same body, typically
 * io_context::run(). Threads still running are joined on destruction.
 */
class ThreadPool final : NonCopyable {
 public:
  // @throws std::invalid_argument if size is 0.
  explicit ThreadPool(size_t size);

  size_t Size() const noexcept { return size_; }

  // @throws std::logic_error if threads of a previous Run() are not joined.
  void Run(const std::function<void()>& body);
  void JoinAll();

 private:
  std::vector<std::jthread> threads_;
  size_t size_;
};

}  // namespace socks5chain::utils
