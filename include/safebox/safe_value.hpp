#ifndef SAFEBOX_SAFE_VALUE_HPP
#define SAFEBOX_SAFE_VALUE_HPP

#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

#include "backends.hpp"
#include "concepts.hpp"
#include "config.hpp"
#include "policies.hpp"

namespace safebox {

// =============================================================================
// Safe Value - A single value behind a synchronization backend
// =============================================================================
//
// Every access to the value goes through get, set, mutate, read or exchange.
// Each is one acquisition of the backend, so none of them can be observed
// half-applied.
//
// Reading with get() and then writing with set() is two acquisitions: another
// thread can write in between and that write is lost. Anything that computes
// the new value from the old one belongs in mutate().
//
// No operation may be nested inside the callable of another on the same
// container. Every backend deadlocks on it.

template <typename T, BackendPolicy Policy = mutex_lock_policy>
class safe_value {
public:
  using value_type = T;
  using policy_type = Policy;
  using backend_type = backend_for<Policy>;

  static constexpr bool is_queue_backed = QueuePolicy<Policy>;

private:
  // Declared before the backend: a queue backend drains its pending writes
  // into value_ while it is destroyed.
  T value_;
  backend_type backend_;

public:
  explicit safe_value(T initial = T{}) : value_(std::move(initial)) {}

  safe_value(T initial, queue_options options)
    requires QueuePolicy<Policy>
      : value_(std::move(initial)), backend_(std::move(options)) {}

  template <typename... Args>
  explicit safe_value(std::in_place_t, Args &&...args)
      : value_(std::forward<Args>(args)...) {}

  safe_value(const safe_value &) = delete;
  safe_value &operator=(const safe_value &) = delete;
  safe_value(safe_value &&) = delete;
  safe_value &operator=(safe_value &&) = delete;

  // Copy of the current value.
  T get() const {
    return backend_.shared([this]() -> T { return value_; });
  }

  // Runs func on the current value under read access and returns its result
  // by value, so nothing referring into the container escapes the lock.
  template <typename Func>
    requires std::invocable<Func, const T &>
  auto read(Func &&func) const
      -> std::remove_cvref_t<std::invoke_result_t<Func, const T &>> {
    using result_type = std::remove_cvref_t<std::invoke_result_t<Func, const T &>>;
    return backend_.shared([this, &func]() -> result_type {
      return std::invoke(std::forward<Func>(func), std::as_const(value_));
    });
  }

  void set(T value) {
    backend_.exclusive([this, &value] { value_ = std::move(value); });
  }

  // Queue backends only: the write is queued as a barrier and the call returns
  // at once. Later operations on this container still observe it.
  void set_async(T value)
    requires QueuePolicy<Policy>
  {
    auto boxed = std::make_shared<T>(std::move(value));
    backend_.exclusive_async([this, boxed] { value_ = std::move(*boxed); });
  }

  T exchange(T value) {
    return backend_.exclusive(
        [this, &value]() -> T { return std::exchange(value_, std::move(value)); });
  }

  // Runs func exactly once with exclusive access and returns its result. If
  // func throws, access is released and the exception reaches the caller
  // unchanged; whatever func already did to the value stays.
  template <typename Func>
    requires std::invocable<Func, T &>
  auto mutate(Func &&func)
      -> std::remove_cvref_t<std::invoke_result_t<Func, T &>> {
    using result_type = std::remove_cvref_t<std::invoke_result_t<Func, T &>>;
    return backend_.exclusive([this, &func]() -> result_type {
      return std::invoke(std::forward<Func>(func), value_);
    });
  }
};

// =============================================================================
// Type Aliases
// =============================================================================

template <typename T>
using mutex_value = safe_value<T, mutex_lock_policy>;

template <typename T>
using rw_value = safe_value<T, shared_mutex_lock_policy>;

template <typename T>
using spin_value = safe_value<T, spinlock_policy>;

template <typename T>
using serial_queue_value = safe_value<T, serial_queue_policy>;

template <typename T>
using barrier_queue_value = safe_value<T, concurrent_queue_policy>;

} // namespace safebox

#endif // SAFEBOX_SAFE_VALUE_HPP
