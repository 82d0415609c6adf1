#pragma once

#include <socks5chain/common/asio.hpp>
#include <socks5chain/utils/non_copyable.hpp>

namespace socks5chain::utils {

/**
 * @brief One-shot event for coroutines sharing a strand. Wait() completes
 * once Set() has been called. Not thread-safe.
 */
class AsyncEvent final : utils::NonCopyable {
 public:
  explicit AsyncEvent(const asio::any_io_executor& executor);

  void Set() noexcept;
  bool IsSet() const noexcept;
  VoidAwait Wait() noexcept;

 private:
  asio::steady_timer timer_;
  bool is_set_{false};
};

/**
 * @brief Sets the event after the given number of Done() calls.
 */
class AsyncCountdown final : utils::NonCopyable {
 public:
  AsyncCountdown(const asio::any_io_executor& executor, size_t count);

  void Done() noexcept;
  VoidAwait Wait() noexcept;

 private:
  AsyncEvent event_;
  size_t count_;
};

}  // namespace socks5chain::utils
