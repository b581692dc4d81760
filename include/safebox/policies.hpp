#ifndef SAFEBOX_POLICIES_HPP
#define SAFEBOX_POLICIES_HPP

#include <atomic>
#include <mutex>
#include <shared_mutex>
#include <thread>

#if defined(__x86_64__) || defined(__i386__)
#include <emmintrin.h>
#define SAFEBOX_CPU_PAUSE() _mm_pause()
#elif defined(__aarch64__)
#define SAFEBOX_CPU_PAUSE() asm volatile("yield" ::: "memory")
#else
#define SAFEBOX_CPU_PAUSE() ((void)0)
#endif

namespace safebox {

class dispatch_queue;
class serial_queue;
class concurrent_queue;

// =============================================================================
// Spinlock - Lightweight, non-reentrant, unfair
// =============================================================================
//
// Test-and-test-and-set with exponential back-off. Once the back-off is
// saturated every failed attempt yields the thread so the holder can run.
// Relocking from the owning thread deadlocks; never hold it across anything
// that can block.

class spinlock {
public:
  static constexpr unsigned max_backoff = 1024;
  static constexpr unsigned spins_before_yield = 16;

  spinlock() noexcept = default;
  spinlock(const spinlock &) = delete;
  spinlock &operator=(const spinlock &) = delete;

  void lock() noexcept {
    bool expected = false;
    if (flag_.compare_exchange_weak(expected, true, std::memory_order_acquire,
                                    std::memory_order_relaxed)) {
      return;
    }

    unsigned backoff = 1;
    unsigned rounds = 0;
    for (;;) {
      while (flag_.load(std::memory_order_relaxed)) {
        if (rounds >= spins_before_yield) {
          std::this_thread::yield();
          continue;
        }
        for (unsigned i = 0; i < backoff; ++i) {
          SAFEBOX_CPU_PAUSE();
        }
        backoff = backoff < max_backoff ? backoff << 1 : max_backoff;
        ++rounds;
      }

      expected = false;
      if (flag_.compare_exchange_weak(expected, true, std::memory_order_acquire,
                                      std::memory_order_relaxed)) {
        return;
      }
    }
  }

  bool try_lock() noexcept {
    bool expected = false;
    return flag_.compare_exchange_strong(expected, true, std::memory_order_acquire,
                                         std::memory_order_relaxed);
  }

  void unlock() noexcept { flag_.store(false, std::memory_order_release); }

  bool is_locked() const noexcept {
    return flag_.load(std::memory_order_relaxed);
  }

private:
  std::atomic<bool> flag_{false};
};

// =============================================================================
// Lock Policies
// =============================================================================

// Every access is exclusive.
struct mutex_lock_policy {
  using mutex_type = std::mutex;
  using lock_type = std::unique_lock<std::mutex>;
};

// Reads share, writes are exclusive.
struct shared_mutex_lock_policy {
  using mutex_type = std::shared_mutex;
  using lock_type = std::unique_lock<std::shared_mutex>;
  using shared_lock_type = std::shared_lock<std::shared_mutex>;
};

// Short critical sections only.
struct spinlock_policy {
  using mutex_type = spinlock;
  using lock_type = std::unique_lock<spinlock>;
};

// =============================================================================
// Queue Policies
// =============================================================================

// One worker, strict FIFO.
struct serial_queue_policy {
  using queue_type = serial_queue;
};

// Several workers; reads overlap, writes run as barriers.
struct concurrent_queue_policy {
  using queue_type = concurrent_queue;
};

} // namespace safebox

#endif // SAFEBOX_POLICIES_HPP
