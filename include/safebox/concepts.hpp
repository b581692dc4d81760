#ifndef SAFEBOX_CONCEPTS_HPP
#define SAFEBOX_CONCEPTS_HPP

#include <concepts>

namespace safebox {

// =============================================================================
// Lockable Concepts (std::mutex-like)
// =============================================================================

template <typename T>
concept BasicLockable = requires(T m) {
  { m.lock() } -> std::same_as<void>;
  { m.unlock() } -> std::same_as<void>;
};

template <typename T>
concept Lockable = BasicLockable<T> && requires(T m) {
  { m.try_lock() } -> std::convertible_to<bool>;
};

template <typename T>
concept SharedLockable = Lockable<T> && requires(T m) {
  { m.lock_shared() } -> std::same_as<void>;
  { m.unlock_shared() } -> std::same_as<void>;
  { m.try_lock_shared() } -> std::convertible_to<bool>;
};

// =============================================================================
// Policy Concepts
// =============================================================================

template <typename P>
concept LockPolicy = requires {
  typename P::mutex_type;
  typename P::lock_type;
} && Lockable<typename P::mutex_type>;

template <typename P>
concept SharedLockPolicy = LockPolicy<P> && requires {
  typename P::shared_lock_type;
} && SharedLockable<typename P::mutex_type>;

template <typename P>
concept QueuePolicy = requires { typename P::queue_type; };

template <typename P>
concept BackendPolicy = LockPolicy<P> || QueuePolicy<P>;

// =============================================================================
// Backend Concept
// =============================================================================

namespace detail {
struct sample_access {
  void operator()() const noexcept {}
};

struct sample_mutation {
  template <typename T> void operator()(T &) const noexcept {}
};

struct sample_transform {
  template <typename T> T operator()(T &value) const { return value; }
};
} // namespace detail

// A backend runs a callable under shared (read) or exclusive (write) access.
template <typename B>
concept ValueBackend = requires(B b, const B cb, detail::sample_access f) {
  { cb.shared(f) } -> std::same_as<void>;
  { b.exclusive(f) } -> std::same_as<void>;
};

template <typename B>
concept AsyncValueBackend = ValueBackend<B> && requires(B b, detail::sample_access f) {
  { b.exclusive_async(f) } -> std::same_as<void>;
};

// =============================================================================
// Container Concept
// =============================================================================

template <typename S, typename T>
concept SafeValue = requires(S s, const S cs, T value, detail::sample_mutation m,
                             detail::sample_transform t) {
  { cs.get() } -> std::convertible_to<T>;
  { s.set(value) } -> std::same_as<void>;
  { s.mutate(m) } -> std::same_as<void>;
  { s.mutate(t) } -> std::convertible_to<T>;
};

} // namespace safebox

#endif // SAFEBOX_CONCEPTS_HPP
