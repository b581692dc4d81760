#ifndef SAFEBOX_PRIMITIVE_BASE_HPP
#define SAFEBOX_PRIMITIVE_BASE_HPP

#include <utility>

#include "concepts.hpp"
#include "config.hpp"
#include "dispatch_queue.hpp"
#include "policies.hpp"

namespace safebox {

// =============================================================================
// Sync Primitive Base - Owns the mutex named by a lock policy
// =============================================================================

template <typename LockPolicy = mutex_lock_policy>
class sync_primitive_base {
protected:
  using mutex_type = typename LockPolicy::mutex_type;
  using lock_type = typename LockPolicy::lock_type;

  mutable mutex_type mutex_;

public:
  sync_primitive_base() = default;
  ~sync_primitive_base() = default;

  sync_primitive_base(const sync_primitive_base &) = delete;
  sync_primitive_base &operator=(const sync_primitive_base &) = delete;
  sync_primitive_base(sync_primitive_base &&) = delete;
  sync_primitive_base &operator=(sync_primitive_base &&) = delete;
};

// =============================================================================
// Queue Primitive Base - Owns the dispatch queue named by a queue policy
// =============================================================================

template <typename QueuePolicy = serial_queue_policy>
class queue_primitive_base {
protected:
  using queue_type = typename QueuePolicy::queue_type;

  // Mutable so that const reads can still submit work.
  mutable queue_type queue_;

public:
  queue_primitive_base() = default;
  explicit queue_primitive_base(queue_options options)
      : queue_(std::move(options)) {}
  ~queue_primitive_base() = default;

  queue_primitive_base(const queue_primitive_base &) = delete;
  queue_primitive_base &operator=(const queue_primitive_base &) = delete;
  queue_primitive_base(queue_primitive_base &&) = delete;
  queue_primitive_base &operator=(queue_primitive_base &&) = delete;
};

} // namespace safebox

#endif // SAFEBOX_PRIMITIVE_BASE_HPP
