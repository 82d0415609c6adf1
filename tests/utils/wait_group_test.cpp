#include <gtest/gtest.h>
#include <utils/wait_group.hpp>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

namespace socks5chain::utils {

using namespace std::chrono_literals;

TEST(WaitGroupTest, EmptyGroupDoesNotBlock) {
  WaitGroup wait_group;
  EXPECT_EQ(wait_group.Count(), 0);
  wait_group.Wait();
  EXPECT_TRUE(wait_group.WaitFor(0ms));
}

TEST(WaitGroupTest, WaitForTimesOutWhileTasksRun) {
  WaitGroup wait_group;
  wait_group.Add(2);
  wait_group.Done();

  const auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(wait_group.WaitFor(50ms));
  EXPECT_GE(std::chrono::steady_clock::now() - start, 50ms);
  EXPECT_EQ(wait_group.Count(), 1);

  wait_group.Done();
  EXPECT_TRUE(wait_group.WaitFor(0ms));
}

TEST(WaitGroupTest, WaitReturnsWhenAllTasksAreDone) {
  constexpr size_t kTasks{8};
  WaitGroup wait_group;
  std::atomic<size_t> finished{};
  std::vector<std::jthread> threads;

  wait_group.Add(kTasks);
  for (size_t i = 0; i < kTasks; ++i) {
    threads.emplace_back([&] {
      std::this_thread::sleep_for(10ms);
      ++finished;
      wait_group.Done();
    });
  }

  EXPECT_TRUE(wait_group.WaitFor(5s));
  EXPECT_EQ(finished.load(), kTasks);
}

TEST(WaitGroupTest, DoneWithoutAddThrows) {
  WaitGroup wait_group;
  EXPECT_THROW(wait_group.Done(), std::logic_error);
}

}  // namespace socks5chain::utils
