#pragma once

#include <cstddef>
#include <memory_resource>

namespace knxbridge::memory {

/**
 * @brief Process-wide arena backing buffer cell storage.
 *
 * Initialised once before bridge assembly; never reinitialised. Allocations are
 * bump-allocated from a fixed block and throw std::bad_alloc once the block is
 * exhausted. Until init_arena() succeeds, resource() returns the default pmr
 * resource.
 */
bool init_arena(size_t bytes);
bool arena_initialized();

std::pmr::memory_resource *resource();

size_t arena_capacity();
size_t arena_used();

} // namespace knxbridge::memory
