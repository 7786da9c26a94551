#include "store/record_store.hpp"

#include "memory/arena.hpp"

namespace knxbridge::store {

const char *to_string(BufferKind kind) {
    switch (kind) {
        case BufferKind::Latest:
            return "latest";
        case BufferKind::SpmcRing:
            return "spmc_ring";
        default:
            return "unknown";
    }
}

RecordStore::RecordStore(std::pmr::memory_resource *resource)
    : resource_(resource ? resource : memory::resource()) {}

RecordStore::~RecordStore() {
    close_all();
}

size_t RecordStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cells_.size();
}

std::vector<CellSnapshot> RecordStore::snapshot() const {
    std::vector<CellSnapshot> result;
    std::lock_guard<std::mutex> lock(mutex_);
    result.reserve(cells_.size());
    for (const auto &item : cells_) {
        result.push_back(CellSnapshot{item.second.name, item.second.cell->statistics()});
    }
    return result;
}

void RecordStore::close_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto &item : cells_) {
        item.second.cell->close();
    }
}

std::shared_ptr<CellBase> RecordStore::find(std::type_index type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cells_.find(type);
    if (it == cells_.end()) {
        return nullptr;
    }
    return it->second.cell;
}

} // namespace knxbridge::store
