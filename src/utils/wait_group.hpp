#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <socks5chain/utils/non_copyable.hpp>

namespace socks5chain::utils {

/**
 * @brief Counter of in-flight tasks. Wait() blocks until every Add() is
 * matched by a Done(). Thread-safe.
 */
class WaitGroup final : NonCopyable {
 public:
  void Add(size_t count = 1);
  void Done();
  size_t Count() const;
  void Wait();

  // Returns false if the counter did not reach zero within the timeout.
  bool WaitFor(std::chrono::steady_clock::duration timeout);

 private:
  mutable std::mutex mtx_;
  std::condition_variable cv_;
  size_t count_{};
};

}  // namespace socks5chain::utils
