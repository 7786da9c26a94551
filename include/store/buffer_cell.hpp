#pragma once

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <memory_resource>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "store/buffer_cfg.hpp"

namespace knxbridge::store {

struct CellStatistics {
    BufferKind kind = BufferKind::Latest;
    size_t capacity = 0;
    uint64_t writes = 0;
    size_t subscribers = 0;
    size_t max_subscribers = 0;
    bool closed = false;
};

/**
 * @brief Type-independent part of a cell, used by the store for teardown and
 * diagnostics.
 */
class CellBase {
public:
    virtual ~CellBase() = default;
    virtual void close() = 0;
    virtual CellStatistics statistics() const = 0;
};

template <typename T>
class BufferReader;

/**
 * @brief Storage of one record type: a latest-value slot or an SPMC ring.
 *
 * Every write gets a sequence number. A slot is `seq % capacity`, so the ring
 * overwrites its oldest entry and the latest cell (capacity 1) overwrites its
 * only one. Readers keep their own cursor and never mutate the cell.
 */
template <typename T>
class BufferCell : public CellBase, public std::enable_shared_from_this<BufferCell<T>> {
public:
    BufferCell(const BufferCfg &cfg, std::pmr::memory_resource *resource);

    BufferCell(const BufferCell &) = delete;
    BufferCell &operator=(const BufferCell &) = delete;

    // Never blocks on readers. Returns false once the cell is closed.
    bool write(T value);

    // Blocks until the cell holds a value, then returns the newest one.
    SubscriptionError get(T &out) const;
    SubscriptionError try_get(T &out) const;

    SubscriptionError subscribe(std::unique_ptr<BufferReader<T>> &out);

    void close() override;
    CellStatistics statistics() const override;

    const BufferCfg &config() const { return cfg_; }

private:
    friend class BufferReader<T>;

    enum class Wait { Block, Poll };

    SubscriptionError read_next(uint64_t &cursor, uint64_t &skipped, T &out, Wait wait);
    void release_subscriber();

    BufferCfg cfg_;
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::pmr::vector<std::optional<T>> slots_;
    uint64_t write_seq_ = 0;
    size_t subscribers_ = 0;
    bool closed_ = false;
};

/**
 * @brief Read handle on a cell. Holds one subscriber slot until destroyed.
 *
 * Latest cells deliver a change stream: next() waits for a write newer than
 * the last one seen and coalesces writes the reader missed. Ring cells
 * deliver every value in order; a reader that fell more than `capacity`
 * writes behind skips to the oldest surviving entry.
 */
template <typename T>
class BufferReader {
public:
    ~BufferReader();

    BufferReader(const BufferReader &) = delete;
    BufferReader &operator=(const BufferReader &) = delete;

    SubscriptionError next(T &out);
    SubscriptionError try_next(T &out);

    // Entries lost to ring overflow since subscription.
    uint64_t skipped() const { return skipped_; }

private:
    friend class BufferCell<T>;

    BufferReader(std::shared_ptr<BufferCell<T>> cell, uint64_t cursor)
        : cell_(std::move(cell)), cursor_(cursor) {}

    std::shared_ptr<BufferCell<T>> cell_;
    uint64_t cursor_;
    uint64_t skipped_ = 0;
};

} // namespace knxbridge::store

#include "store/buffer_cell.tpp"
