#include <exception>
#include <thread>
#include <utility>

#include "safebox/allocator.hpp"
#include "safebox/dispatch_queue.hpp"
#include "safebox/log.hpp"

namespace safebox {

const char *to_string(queue_kind kind) noexcept {
  switch (kind) {
  case queue_kind::serial:
    return "serial";
  case queue_kind::concurrent:
    return "concurrent";
  }
  return "unknown";
}

dispatch_queue::dispatch_queue(queue_kind kind, queue_options options)
    : kind_(kind), label_(std::move(options.label)),
      pending_(task_memory_resource()) {
  if (label_.empty()) {
    label_ = std::string("safebox.") + to_string(kind_);
  }

  std::size_t worker_total = 1;
  if (kind_ == queue_kind::concurrent) {
    worker_total = options.worker_count != 0 ? options.worker_count
                                             : default_worker_count();
  }

  workers_.reserve(worker_total);
  try {
    for (std::size_t id = 0; id < worker_total; ++id) {
      workers_.emplace_back(&dispatch_queue::worker_loop, this, id);
    }
  } catch (...) {
    // Threads already started must not outlive a half-built queue.
    stop_and_join();
    throw;
  }

  logger()->debug("queue '{}' started: {} with {} worker(s)", label_,
                  to_string(kind_), workers_.size());
}

dispatch_queue::~dispatch_queue() {
  stop_and_join();
  logger()->debug("queue '{}' stopped", label_);
}

void dispatch_queue::async(std::function<void()> work) {
  enqueue(std::move(work), false);
}

void dispatch_queue::barrier_async(std::function<void()> work) {
  enqueue(std::move(work), true);
}

void dispatch_queue::enqueue(std::function<void()> work, bool barrier) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.push_back(work_item{std::move(work), barrier});
  }
  work_cv_.notify_one();
}

// Requires mutex_ held.
bool dispatch_queue::can_start_front() const {
  if (pending_.empty() || barrier_running_) {
    return false;
  }
  return !pending_.front().barrier || running_ == 0;
}

void dispatch_queue::worker_loop(std::size_t /*worker_id*/) {
  for (;;) {
    work_item item;
    bool more_startable = false;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      work_cv_.wait(lock, [this] {
        return can_start_front() || (shutting_down_ && pending_.empty());
      });

      if (pending_.empty()) {
        return;
      }

      item = std::move(pending_.front());
      pending_.pop_front();
      ++running_;
      if (item.barrier) {
        barrier_running_ = true;
      }
      more_startable = can_start_front();
    }

    if (more_startable) {
      work_cv_.notify_one();
    }

    run(item);

    bool drained = false;
    bool startable = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      --running_;
      if (item.barrier) {
        barrier_running_ = false;
      }
      drained = shutting_down_ && pending_.empty();
      startable = can_start_front();
    }

    // Whoever takes the next item wakes the one after it, so one wake-up is
    // enough unless idle workers are waiting to exit.
    if (drained) {
      work_cv_.notify_all();
    } else if (startable) {
      work_cv_.notify_one();
    }
  }
}

void dispatch_queue::run(work_item &item) {
  try {
    item.work();
  } catch (const std::exception &e) {
    logger()->error("queue '{}': {} task failed: {}", label_,
                    item.barrier ? "barrier" : "async", e.what());
  } catch (...) {
    logger()->error("queue '{}': {} task failed: unknown exception", label_,
                    item.barrier ? "barrier" : "async");
  }
}

void dispatch_queue::stop_and_join() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shutting_down_ = true;
  }
  work_cv_.notify_all();

  for (auto &worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

} // namespace safebox
