#include <unistd.h>

#include <atomic>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "threads/semaphore.h"

namespace dxfer {
namespace threads {
namespace tests {

TEST(Semaphore, RejectsNoPermits) {
  EXPECT_THROW(Semaphore(0), std::invalid_argument);
}

TEST(Semaphore, AcquireRelease) {
  Semaphore s(2);

  s.Acquire();
  s.Acquire();
  EXPECT_EQ(0, s.available());
  s.Release();
  EXPECT_EQ(1, s.available());
  s.Release();
  EXPECT_EQ(2, s.available());
}

TEST(Semaphore, BlocksUntilReleased) {
  Semaphore s(1);
  std::atomic_bool acquired(false);

  s.Acquire();

  std::thread t([&]() {
    s.Acquire();
    acquired = true;
  });

  usleep(100000);
  EXPECT_FALSE(acquired);

  s.Release();
  t.join();
  EXPECT_TRUE(acquired);
}

TEST(Semaphore, BoundsConcurrentHolders) {
  constexpr int PERMITS = 3;
  constexpr int THREADS = 12;

  Semaphore s(PERMITS);
  std::atomic_int holders(0), max_holders(0);
  std::vector<std::thread> threads;

  for (int i = 0; i < THREADS; i++) {
    threads.emplace_back([&]() {
      s.Acquire();
      int now = ++holders;
      int prev = max_holders;
      while (now > prev && !max_holders.compare_exchange_weak(prev, now)) {
      }
      usleep(20000);
      --holders;
      s.Release();
    });
  }

  for (auto &t : threads) t.join();

  EXPECT_LE(max_holders, PERMITS);
  EXPECT_EQ(PERMITS, s.available());
}

}  // namespace tests
}  // namespace threads
}  // namespace dxfer
