#pragma once

#include <new>
#include <typeinfo>
#include <utility>

namespace knxbridge::store {

template <typename T>
BindingError RecordStore::create_cell(const BufferCfg &cfg, const std::string &name) {
    if (!cfg.valid()) {
        return BindingError::InvalidBuffer;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const std::type_index key(typeid(T));
    if (cells_.count(key) != 0) {
        return BindingError::DuplicateRecord;
    }

    try {
        std::pmr::polymorphic_allocator<BufferCell<T>> alloc(resource_);
        auto created = std::allocate_shared<BufferCell<T>>(alloc, cfg, resource_);
        cells_.emplace(key, Entry{name.empty() ? std::string(typeid(T).name()) : name,
                                  std::move(created)});
    } catch (const std::bad_alloc &) {
        return BindingError::OutOfMemory;
    }
    return BindingError::None;
}

template <typename T>
std::shared_ptr<BufferCell<T>> RecordStore::cell() const {
    return std::static_pointer_cast<BufferCell<T>>(find(std::type_index(typeid(T))));
}

template <typename T>
bool RecordStore::contains() const {
    return find(std::type_index(typeid(T))) != nullptr;
}

template <typename T>
SubscriptionError RecordStore::subscribe(std::unique_ptr<BufferReader<T>> &out) {
    auto target = cell<T>();
    if (!target) {
        return SubscriptionError::CellNotFound;
    }
    return target->subscribe(out);
}

template <typename T>
bool RecordStore::write(T value) {
    auto target = cell<T>();
    if (!target) {
        return false;
    }
    return target->write(std::move(value));
}

template <typename T>
SubscriptionError RecordStore::get(T &out) const {
    auto target = cell<T>();
    if (!target) {
        return SubscriptionError::CellNotFound;
    }
    return target->get(out);
}

} // namespace knxbridge::store
