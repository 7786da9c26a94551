#pragma once

#include <memory>
#include <memory_resource>
#include <mutex>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <vector>

#include "errors.hpp"
#include "store/buffer_cell.hpp"

namespace knxbridge::store {

struct CellSnapshot {
    std::string record;
    CellStatistics stats;
};

/**
 * @brief Owns one buffer cell per record type, keyed by the C++ type.
 *
 * Cells are allocated from the given memory resource (the process arena in
 * production). The store hands out shared ownership so readers outlive a
 * store teardown without dangling.
 */
class RecordStore {
public:
    explicit RecordStore(std::pmr::memory_resource *resource = nullptr);
    ~RecordStore();

    RecordStore(const RecordStore &) = delete;
    RecordStore &operator=(const RecordStore &) = delete;

    template <typename T>
    BindingError create_cell(const BufferCfg &cfg, const std::string &name = std::string());

    template <typename T>
    std::shared_ptr<BufferCell<T>> cell() const;

    template <typename T>
    bool contains() const;

    template <typename T>
    SubscriptionError subscribe(std::unique_ptr<BufferReader<T>> &out);

    template <typename T>
    bool write(T value);

    template <typename T>
    SubscriptionError get(T &out) const;

    size_t size() const;
    std::vector<CellSnapshot> snapshot() const;

    // Wakes every blocked reader with SubscriptionError::Closed.
    void close_all();

private:
    struct Entry {
        std::string name;
        std::shared_ptr<CellBase> cell;
    };

    std::shared_ptr<CellBase> find(std::type_index type) const;

    std::pmr::memory_resource *resource_;
    mutable std::mutex mutex_;
    std::unordered_map<std::type_index, Entry> cells_;
};

} // namespace knxbridge::store

#include "store/record_store.tpp"
