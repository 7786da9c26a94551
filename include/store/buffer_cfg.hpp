#pragma once

#include <cstddef>
#include <cstdint>

namespace knxbridge::store {

enum class BufferKind : uint8_t {
    Latest,
    SpmcRing,
};

constexpr size_t kDefaultMaxSubscribers = 8;
constexpr size_t kDefaultRingCapacity = 50;

/**
 * @brief Buffering discipline of one record cell, fixed at registration.
 *
 * Latest keeps a single value that each write overwrites. SpmcRing keeps the
 * last `capacity` values with one cursor per subscriber; the writer overwrites
 * the oldest slot and never waits for slow readers.
 */
struct BufferCfg {
    BufferKind kind = BufferKind::Latest;
    size_t capacity = 1;
    size_t max_subscribers = kDefaultMaxSubscribers;

    static BufferCfg latest(size_t max_subscribers = kDefaultMaxSubscribers) {
        return BufferCfg{BufferKind::Latest, 1, max_subscribers};
    }

    static BufferCfg spmc_ring(size_t capacity, size_t max_subscribers = kDefaultMaxSubscribers) {
        return BufferCfg{BufferKind::SpmcRing, capacity, max_subscribers};
    }

    bool valid() const {
        if (max_subscribers == 0) {
            return false;
        }
        return kind == BufferKind::Latest ? capacity == 1 : capacity > 0;
    }
};

const char *to_string(BufferKind kind);

} // namespace knxbridge::store
