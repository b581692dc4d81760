#pragma once

#include <mimalloc.h>
#include <cstddef>
#include <memory_resource>

namespace safebox {

// PMR memory_resource backed by mimalloc (mi_malloc_aligned / mi_free_aligned)
class mi_memory_resource : public std::pmr::memory_resource {
  void* do_allocate(std::size_t bytes, std::size_t alignment) override;
  void do_deallocate(void* p, std::size_t bytes, std::size_t alignment) override;
  bool do_is_equal(const memory_resource& other) const noexcept override;
};

// Process-wide resource that dispatch queues draw their pending-task storage
// from. Never destroyed before the last queue.
std::pmr::memory_resource* task_memory_resource() noexcept;

}  // namespace safebox
