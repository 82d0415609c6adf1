#include <utils/wait_group.hpp>
#include <stdexcept>

namespace socks5chain::utils {

void WaitGroup::Add(size_t count) {
  std::lock_guard lk{mtx_};
  count_ += count;
}

void WaitGroup::Done() {
  {
    std::lock_guard lk{mtx_};
    if (count_ == 0) {
      throw std::logic_error{"WaitGroup::Done() called more times than Add()"};
    }
    if (--count_ != 0) {
      return;
    }
  }
  cv_.notify_all();
}

size_t WaitGroup::Count() const {
  std::lock_guard lk{mtx_};
  return count_;
}

void WaitGroup::Wait() {
  std::unique_lock lk{mtx_};
  cv_.wait(lk, [this] { return count_ == 0; });
}

bool WaitGroup::WaitFor(std::chrono::steady_clock::duration timeout) {
  std::unique_lock lk{mtx_};
  return cv_.wait_for(lk, timeout, [this] { return count_ == 0; });
}

}  // namespace socks5chain::utils
