#include <utils/thread_pool.hpp>
#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace socks5chain::utils {

ThreadPool::ThreadPool(size_t size) : size_{size} {
  if (size_ == 0) {
    throw std::invalid_argument{"Thread pool size must be greater than 0"};
  }
}

void ThreadPool::Run(const std::function<void()>& body) {
  if (!threads_.empty()) {
    throw std::logic_error{"Thread pool is already running"};
  }
  threads_.reserve(size_);
  std::generate_n(std::back_inserter(threads_), size_,
                  [&body] { return std::jthread{body}; });
}

void ThreadPool::JoinAll() {
  // jthread joins in its destructor.
  threads_.clear();
}

}  // namespace socks5chain::utils
