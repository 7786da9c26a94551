#include "memory/arena.hpp"

#include "logger.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <new>
#include <vector>

namespace knxbridge::memory {
namespace {

const char *TAG = "arena";

class ArenaResource final : public std::pmr::memory_resource {
public:
    explicit ArenaResource(size_t bytes)
        : block_(bytes),
          bump_(block_.data(), block_.size(), std::pmr::null_memory_resource()) {}

    size_t capacity() const { return block_.size(); }

    size_t used() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return used_;
    }

private:
    void *do_allocate(size_t bytes, size_t alignment) override {
        std::lock_guard<std::mutex> lock(mutex_);
        // null_memory_resource upstream: throws std::bad_alloc when the block is spent.
        void *p = bump_.allocate(bytes, alignment);
        used_ += bytes;
        return p;
    }

    // Monotonic: memory is only returned when the process exits.
    void do_deallocate(void *p, size_t bytes, size_t alignment) override {
        std::lock_guard<std::mutex> lock(mutex_);
        bump_.deallocate(p, bytes, alignment);
    }

    bool do_is_equal(const memory_resource &other) const noexcept override {
        return this == &other;
    }

    std::vector<std::byte> block_;
    std::pmr::monotonic_buffer_resource bump_;
    mutable std::mutex mutex_;
    size_t used_ = 0;
};

std::mutex init_mutex;
std::unique_ptr<ArenaResource> arena;
std::atomic<ArenaResource *> active{nullptr};

} // namespace

bool init_arena(size_t bytes) {
    std::lock_guard<std::mutex> lock(init_mutex);
    if (arena) {
        KNXB_LOGW(TAG, "Arena already initialised (%zu bytes), ignoring re-init", arena->capacity());
        return false;
    }
    if (bytes == 0) {
        KNXB_LOGE(TAG, "Arena size must be non-zero");
        return false;
    }
    arena = std::make_unique<ArenaResource>(bytes);
    active = arena.get();
    KNXB_LOGI(TAG, "Arena initialised with %zu bytes", bytes);
    return true;
}

bool arena_initialized() {
    return active.load() != nullptr;
}

std::pmr::memory_resource *resource() {
    ArenaResource *current = active.load();
    if (current) {
        return current;
    }
    return std::pmr::get_default_resource();
}

size_t arena_capacity() {
    ArenaResource *current = active.load();
    return current ? current->capacity() : 0;
}

size_t arena_used() {
    ArenaResource *current = active.load();
    return current ? current->used() : 0;
}

} // namespace knxbridge::memory
