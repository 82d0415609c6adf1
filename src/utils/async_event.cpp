#include <utils/async_event.hpp>
#include <utils/logger.hpp>

namespace socks5chain::utils {

AsyncEvent::AsyncEvent(const asio::any_io_executor& executor)
    : timer_{executor, asio::steady_timer::time_point::max()} {}

void AsyncEvent::Set() noexcept {
  is_set_ = true;
  try {
    timer_.cancel();
  } catch (const std::exception& ex) {
    SOCKS5CHAIN_LOG(error, "Async event cancel exception. {}", ex.what());
  }
}

bool AsyncEvent::IsSet() const noexcept { return is_set_; }

VoidAwait AsyncEvent::Wait() noexcept {
  try {
    // The timer never expires, it completes with operation_aborted on Set().
    while (!is_set_) {
      boost::system::error_code err;
      co_await timer_.async_wait(UseNothrowAwaitable(err));
    }
  } catch (const std::exception& ex) {
    SOCKS5CHAIN_LOG(error, "Async event exception. {}", ex.what());
  }
}

AsyncCountdown::AsyncCountdown(const asio::any_io_executor& executor,
                               size_t count)
    : event_{executor}, count_{count} {
  if (count_ == 0) {
    event_.Set();
  }
}

void AsyncCountdown::Done() noexcept {
  if (count_ != 0 && --count_ == 0) {
    event_.Set();
  }
}

VoidAwait AsyncCountdown::Wait() noexcept { co_await event_.Wait(); }

}  // namespace socks5chain::utils
