#include <gtest/gtest.h>
#include <utils/thread_pool.hpp>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

namespace socks5chain::utils {

TEST(ThreadPoolTest, InvalidThreadCountOnCreation) {
  EXPECT_THROW(ThreadPool pool(0), std::invalid_argument);
}

TEST(ThreadPoolTest, RunTasks) {
  constexpr size_t kThreadCount{4};
  ThreadPool pool{kThreadCount};
  EXPECT_EQ(pool.Size(), kThreadCount);

  std::atomic<size_t> counter{};
  pool.Run([&counter] { counter.fetch_add(1, std::memory_order_relaxed); });
  pool.JoinAll();

  EXPECT_EQ(counter.load(), kThreadCount);
}

TEST(ThreadPoolTest, RunAgainAfterJoin) {
  ThreadPool pool{3};

  std::atomic<int> first_counter{};
  pool.Run([&first_counter] { first_counter.fetch_add(1); });
  pool.JoinAll();
  EXPECT_EQ(first_counter.load(), 3);

  std::atomic<int> second_counter{};
  pool.Run([&second_counter] { second_counter.fetch_add(1); });
  pool.JoinAll();
  EXPECT_EQ(second_counter.load(), 3);
}

TEST(ThreadPoolTest, RunWhileRunningThrows) {
  ThreadPool pool{1};
  pool.Run([] {});
  EXPECT_THROW(pool.Run([] {}), std::logic_error);
  pool.JoinAll();
}

TEST(ThreadPoolTest, JoinAllWithoutRun) {
  ThreadPool pool{2};
  pool.JoinAll();
  pool.JoinAll();
}

TEST(ThreadPoolTest, JoinsThreadsOnDestruction) {
  std::atomic<bool> task_finished{false};
  {
    ThreadPool pool{1};
    pool.Run([&task_finished] {
      std::this_thread::sleep_for(std::chrono::milliseconds{50});
      task_finished = true;
    });
  }
  EXPECT_TRUE(task_finished);
}

}  // namespace socks5chain::utils
