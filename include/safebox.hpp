#ifndef SAFEBOX_HPP
#define SAFEBOX_HPP

// =============================================================================
// safebox
// =============================================================================
//
// Thread-safe single-value containers. One container template, safe_value,
// takes its synchronization from a policy:
//
// - mutex_lock_policy:        std::mutex, every access exclusive
// - shared_mutex_lock_policy: std::shared_mutex, reads shared
// - spinlock_policy:          unfair non-reentrant spinlock, every access exclusive
// - serial_queue_policy:      one-worker dispatch queue, strict FIFO
// - concurrent_queue_policy:  multi-worker dispatch queue, writes as barriers
//
// =============================================================================

#include "safebox/concepts.hpp"
#include "safebox/config.hpp"
#include "safebox/policies.hpp"

#include "safebox/dispatch_queue.hpp"
#include "safebox/backends.hpp"
#include "safebox/safe_value.hpp"

#include "safebox/log.hpp"

#endif // SAFEBOX_HPP
