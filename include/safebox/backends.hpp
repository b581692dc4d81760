#ifndef SAFEBOX_BACKENDS_HPP
#define SAFEBOX_BACKENDS_HPP

#include <functional>
#include <type_traits>
#include <utility>

#include "concepts.hpp"
#include "primitive_base.hpp"
#include "policies.hpp"

namespace safebox {

// =============================================================================
// Lock Backend - Guards access with the policy's mutex
// =============================================================================
//
// Shared access takes the policy's shared lock when it has one and falls back
// to the exclusive lock otherwise. Guards release on every exit path.

template <LockPolicy Policy>
class lock_backend : public sync_primitive_base<Policy> {
  using base_type = sync_primitive_base<Policy>;

public:
  using lock_policy = Policy;

  lock_backend() = default;

  template <typename F> auto shared(F &&f) const -> std::invoke_result_t<F> {
    if constexpr (requires { typename Policy::shared_lock_type; }) {
      typename Policy::shared_lock_type lock(this->mutex_);
      return std::invoke(std::forward<F>(f));
    } else {
      typename base_type::lock_type lock(this->mutex_);
      return std::invoke(std::forward<F>(f));
    }
  }

  template <typename F> auto exclusive(F &&f) -> std::invoke_result_t<F> {
    typename base_type::lock_type lock(this->mutex_);
    return std::invoke(std::forward<F>(f));
  }
};

// =============================================================================
// Queue Backend - Runs access as work items on a dispatch queue
// =============================================================================
//
// Reads are ordinary items, writes are barrier items. On a serial queue the
// distinction disappears and every access is totally ordered.

template <QueuePolicy Policy>
class queue_backend : public queue_primitive_base<Policy> {
  using base_type = queue_primitive_base<Policy>;

public:
  using queue_policy = Policy;

  queue_backend() = default;
  explicit queue_backend(queue_options options) : base_type(std::move(options)) {}

  template <typename F> auto shared(F &&f) const -> std::invoke_result_t<F> {
    return this->queue_.sync(std::forward<F>(f));
  }

  template <typename F> auto exclusive(F &&f) -> std::invoke_result_t<F> {
    return this->queue_.barrier_sync(std::forward<F>(f));
  }

  void exclusive_async(std::function<void()> work) {
    this->queue_.barrier_async(std::move(work));
  }
};

// =============================================================================
// Backend Selection
// =============================================================================

template <typename Policy> struct backend_traits;

template <LockPolicy Policy> struct backend_traits<Policy> {
  using type = lock_backend<Policy>;
};

template <QueuePolicy Policy> struct backend_traits<Policy> {
  using type = queue_backend<Policy>;
};

template <typename Policy>
using backend_for = typename backend_traits<Policy>::type;

static_assert(ValueBackend<lock_backend<mutex_lock_policy>>);
static_assert(ValueBackend<lock_backend<shared_mutex_lock_policy>>);
static_assert(ValueBackend<lock_backend<spinlock_policy>>);
static_assert(AsyncValueBackend<queue_backend<serial_queue_policy>>);
static_assert(AsyncValueBackend<queue_backend<concurrent_queue_policy>>);

} // namespace safebox

#endif // SAFEBOX_BACKENDS_HPP
