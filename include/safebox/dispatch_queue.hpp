#ifndef SAFEBOX_DISPATCH_QUEUE_HPP
#define SAFEBOX_DISPATCH_QUEUE_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <memory_resource>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include "config.hpp"

/*
  A dispatch queue is a FIFO of work items drained by a fixed pool of kernel
  threads. Items leave the queue strictly from the head. An ordinary item may
  start as soon as no barrier is running; a barrier item additionally waits
  until nothing at all is running and then runs alone, so everything submitted
  before it has finished and nothing submitted after it starts until it is done.
  With a single worker the two kinds collapse into plain FIFO execution.

  sync() and barrier_sync() block the caller until the item ran and hand back
  its result or rethrow its exception. Calling either from an item already
  running on the same queue deadlocks.
*/

namespace safebox {

enum class queue_kind { serial, concurrent };

const char *to_string(queue_kind kind) noexcept;

class dispatch_queue {
public:
  dispatch_queue(queue_kind kind, queue_options options = {});

  // Runs everything already submitted, then joins the workers.
  ~dispatch_queue();

  dispatch_queue(const dispatch_queue &) = delete;
  dispatch_queue &operator=(const dispatch_queue &) = delete;
  dispatch_queue(dispatch_queue &&) = delete;
  dispatch_queue &operator=(dispatch_queue &&) = delete;

  template <typename F> auto sync(F &&f) -> std::invoke_result_t<F> {
    return submit_sync(std::forward<F>(f), false);
  }

  template <typename F> auto barrier_sync(F &&f) -> std::invoke_result_t<F> {
    return submit_sync(std::forward<F>(f), true);
  }

  // Fire-and-forget. Anything thrown by the work is logged and dropped.
  void async(std::function<void()> work);
  void barrier_async(std::function<void()> work);

  queue_kind kind() const noexcept { return kind_; }
  const std::string &label() const noexcept { return label_; }
  std::size_t worker_count() const noexcept { return workers_.size(); }

private:
  struct work_item {
    std::function<void()> work;
    bool barrier;
  };

  template <typename F>
  auto submit_sync(F &&f, bool barrier) -> std::invoke_result_t<F>;

  void enqueue(std::function<void()> work, bool barrier);
  bool can_start_front() const;
  void worker_loop(std::size_t worker_id);
  void run(work_item &item);
  void stop_and_join();

  queue_kind kind_;
  std::string label_;

  std::mutex mutex_;
  std::condition_variable work_cv_;
  std::pmr::deque<work_item> pending_;
  std::size_t running_{0};
  bool barrier_running_{false};
  bool shutting_down_{false};

  std::vector<std::thread> workers_;
};

template <typename F>
auto dispatch_queue::submit_sync(F &&f, bool barrier) -> std::invoke_result_t<F> {
  using result_type = std::invoke_result_t<F>;

  auto promise = std::make_shared<std::promise<result_type>>();
  std::future<result_type> future = promise->get_future();

  // f outlives the item: the caller stays blocked on the future until the
  // promise is satisfied, and the item never touches f after that.
  enqueue(
      [promise, &f]() {
        try {
          if constexpr (std::is_void_v<result_type>) {
            std::invoke(f);
            promise->set_value();
          } else {
            promise->set_value(std::invoke(f));
          }
        } catch (...) {
          promise->set_exception(std::current_exception());
        }
      },
      barrier);

  return future.get();
}

class serial_queue : public dispatch_queue {
public:
  explicit serial_queue(queue_options options = {})
      : dispatch_queue(queue_kind::serial, std::move(options)) {}
};

class concurrent_queue : public dispatch_queue {
public:
  explicit concurrent_queue(queue_options options = {})
      : dispatch_queue(queue_kind::concurrent, std::move(options)) {}
};

} // namespace safebox

#endif // SAFEBOX_DISPATCH_QUEUE_HPP
