#include <atomic>
#include <chrono>
#include <iostream>
#include <memory_resource>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "safebox.hpp"
#include "safebox/allocator.hpp"

using namespace safebox;
using namespace std::chrono_literals;

// Spins until pred() holds or two seconds pass; returns the last pred().
template <typename Pred> bool wait_briefly(Pred pred) {
  auto deadline = std::chrono::steady_clock::now() + 2s;
  while (!pred()) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return pred();
    }
    std::this_thread::yield();
  }
  return true;
}

int main() {
  int failures = 0;

  // Test 1: Serial queue keeps FIFO order
  std::cout << "Test 1: Serial queue FIFO order... ";
  {
    serial_queue queue;
    std::vector<int> seen; // only touched on the queue

    for (int i = 0; i < 1000; ++i) {
      queue.async([&seen, i]() { seen.push_back(i); });
    }
    auto snapshot = queue.sync([&seen]() { return seen; });

    bool pass = snapshot.size() == 1000;
    for (std::size_t i = 0; pass && i < snapshot.size(); ++i) {
      pass = snapshot[i] == static_cast<int>(i);
    }
    if (pass && queue.worker_count() == 1 && queue.kind() == queue_kind::serial) {
      std::cout << "PASS" << std::endl;
    } else {
      std::cout << "FAIL (order or worker count wrong)" << std::endl;
      failures++;
    }
  }

  // Test 2: Labels and worker counts
  std::cout << "Test 2: Labels and worker counts... ";
  {
    serial_queue unnamed;
    serial_queue named(queue_options{"ledger", 6});
    concurrent_queue sized(queue_options{"", 3});

    if (unnamed.label() == "safebox.serial" && named.label() == "ledger" &&
        named.worker_count() == 1 && sized.worker_count() == 3 &&
        sized.label() == "safebox.concurrent") {
      std::cout << "PASS" << std::endl;
    } else {
      std::cout << "FAIL (unexpected label or worker count)" << std::endl;
      failures++;
    }
  }

  // Test 3: Ordinary items on a concurrent queue overlap
  std::cout << "Test 3: Concurrent items overlap... ";
  {
    concurrent_queue queue(queue_options{"overlap", 4});
    std::atomic<int> inside{0};
    std::atomic<int> overlapped{0};

    for (int i = 0; i < 2; ++i) {
      queue.async([&]() {
        inside.fetch_add(1);
        if (wait_briefly([&] { return inside.load() >= 2; })) {
          overlapped.fetch_add(1);
        }
      });
    }
    queue.barrier_sync([] {});

    if (overlapped.load() == 2) {
      std::cout << "PASS" << std::endl;
    } else {
      std::cout << "FAIL (items ran one at a time)" << std::endl;
      failures++;
    }
  }

  // Test 4: Barrier items run alone
  std::cout << "Test 4: Barrier exclusivity... ";
  {
    concurrent_queue queue(queue_options{"barrier", 4});
    std::atomic<int> active{0};
    std::atomic<bool> barrier_active{false};
    std::atomic<int> violations{0};

    for (int i = 0; i < 400; ++i) {
      if (i % 10 == 0) {
        queue.barrier_async([&]() {
          if (active.load() != 0) {
            violations.fetch_add(1);
          }
          barrier_active.store(true);
          std::this_thread::sleep_for(50us);
          barrier_active.store(false);
        });
      } else {
        queue.async([&]() {
          active.fetch_add(1);
          if (barrier_active.load()) {
            violations.fetch_add(1);
          }
          std::this_thread::sleep_for(20us);
          if (barrier_active.load()) {
            violations.fetch_add(1);
          }
          active.fetch_sub(1);
        });
      }
    }
    queue.barrier_sync([] {});

    if (violations.load() == 0) {
      std::cout << "PASS" << std::endl;
    } else {
      std::cout << "FAIL (" << violations.load() << " overlaps with a barrier)"
                << std::endl;
      failures++;
    }
  }

  // Test 5: A barrier sees everything submitted before it, nothing after
  std::cout << "Test 5: Barrier ordering... ";
  {
    concurrent_queue queue(queue_options{"ordering", 4});
    std::atomic<int> before{0};
    std::atomic<int> after{0};
    int seen_before = -1;
    int seen_after = -1;

    for (int i = 0; i < 50; ++i) {
      queue.async([&]() {
        std::this_thread::sleep_for(10us);
        before.fetch_add(1);
      });
    }
    queue.barrier_async([&]() {
      seen_before = before.load();
      seen_after = after.load();
    });
    for (int i = 0; i < 50; ++i) {
      queue.async([&]() { after.fetch_add(1); });
    }
    queue.barrier_sync([] {});

    if (seen_before == 50 && seen_after == 0 && after.load() == 50) {
      std::cout << "PASS" << std::endl;
    } else {
      std::cout << "FAIL (barrier saw " << seen_before << " before, "
                << seen_after << " after)" << std::endl;
      failures++;
    }
  }

  // Test 6: sync results and exceptions reach the caller
  std::cout << "Test 6: Exception propagation... ";
  {
    concurrent_queue queue(queue_options{"errors", 2});
    bool pass = queue.sync([]() { return 7; }) == 7;

    try {
      queue.barrier_sync([]() -> int { throw std::runtime_error("test error"); });
      pass = false;
    } catch (const std::runtime_error &e) {
      pass = pass && std::string(e.what()) == "test error";
    }
    pass = pass && queue.barrier_sync([]() { return 8; }) == 8;

    if (pass) {
      std::cout << "PASS" << std::endl;
    } else {
      std::cout << "FAIL (result or exception lost)" << std::endl;
      failures++;
    }
  }

  // Test 7: A failing fire-and-forget item does not stop the worker
  std::cout << "Test 7: Failed async item is contained... ";
  {
    serial_queue queue(queue_options{"contained"});
    queue.async([]() { throw std::runtime_error("expected failure (logged)"); });
    queue.barrier_async([]() { throw std::logic_error("expected failure (logged)"); });
    queue.async([]() { throw 42; });
    queue.barrier_async([]() { throw 'x'; });

    if (queue.sync([]() { return 1; }) == 1) {
      std::cout << "PASS" << std::endl;
    } else {
      std::cout << "FAIL (queue stopped)" << std::endl;
      failures++;
    }
  }

  // Test 8: Destruction drains pending work
  std::cout << "Test 8: Destructor drains pending work... ";
  {
    std::atomic<int> serial_done{0};
    std::atomic<int> concurrent_done{0};
    {
      serial_queue serial;
      concurrent_queue concurrent(queue_options{"drain", 3});
      for (int i = 0; i < 100; ++i) {
        serial.async([&]() {
          std::this_thread::sleep_for(10us);
          serial_done.fetch_add(1);
        });
        concurrent.async([&]() { concurrent_done.fetch_add(1); });
        if (i % 25 == 0) {
          concurrent.barrier_async([&]() { concurrent_done.fetch_add(1); });
        }
      }
    }

    if (serial_done.load() == 100 && concurrent_done.load() == 104) {
      std::cout << "PASS" << std::endl;
    } else {
      std::cout << "FAIL (" << serial_done.load() << "/100, "
                << concurrent_done.load() << "/104)" << std::endl;
      failures++;
    }
  }

  // Test 9: Configuration parsing
  std::cout << "Test 9: Configuration parsing... ";
  {
    bool pass = parse_worker_count("4") == std::optional<std::size_t>(4) &&
                !parse_worker_count("0") && !parse_worker_count("four") &&
                !parse_worker_count("4x") && !parse_worker_count("") &&
                !parse_worker_count("-2");
    pass = pass && parse_log_level("debug") == spdlog::level::debug &&
           parse_log_level("off") == spdlog::level::off &&
           !parse_log_level("loud");
    pass = pass && default_worker_count() >= 1;

    if (pass) {
      std::cout << "PASS" << std::endl;
    } else {
      std::cout << "FAIL (parser accepted or rejected the wrong input)"
                << std::endl;
      failures++;
    }
  }

  // Test 10: Library logger and task memory
  std::cout << "Test 10: Logger and task memory resource... ";
  {
    auto log = logger();
    bool pass = log != nullptr && log->name() == logger_name && logger() == log;

    std::pmr::vector<long> scratch(task_memory_resource());
    for (long i = 0; i < 4096; ++i) {
      scratch.push_back(i);
    }
    pass = pass && scratch.size() == 4096 && scratch.back() == 4095;
    pass = pass && task_memory_resource()->is_equal(*task_memory_resource());

    if (pass) {
      std::cout << "PASS" << std::endl;
    } else {
      std::cout << "FAIL (logger or memory resource misbehaved)" << std::endl;
      failures++;
    }
  }

  // Summary
  std::cout << std::endl;
  if (failures == 0) {
    std::cout << "All tests passed!" << std::endl;
    return 0;
  } else {
    std::cout << failures << " test(s) failed!" << std::endl;
    return 1;
  }
}
