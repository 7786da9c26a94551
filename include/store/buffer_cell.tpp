#pragma once

#include <utility>

namespace knxbridge::store {

template <typename T>
BufferCell<T>::BufferCell(const BufferCfg &cfg, std::pmr::memory_resource *resource)
    : cfg_(cfg), slots_(resource) {
    slots_.resize(cfg_.kind == BufferKind::Latest ? 1 : cfg_.capacity);
}

template <typename T>
bool BufferCell<T>::write(T value) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        slots_[write_seq_ % slots_.size()] = std::move(value);
        ++write_seq_;
    }
    cv_.notify_all();
    return true;
}

template <typename T>
SubscriptionError BufferCell<T>::get(T &out) const {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return closed_ || write_seq_ > 0; });
    if (closed_) {
        return SubscriptionError::Closed;
    }
    out = *slots_[(write_seq_ - 1) % slots_.size()];
    return SubscriptionError::None;
}

template <typename T>
SubscriptionError BufferCell<T>::try_get(T &out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return SubscriptionError::Closed;
    }
    if (write_seq_ == 0) {
        return SubscriptionError::Empty;
    }
    out = *slots_[(write_seq_ - 1) % slots_.size()];
    return SubscriptionError::None;
}

template <typename T>
SubscriptionError BufferCell<T>::subscribe(std::unique_ptr<BufferReader<T>> &out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return SubscriptionError::Closed;
    }
    if (subscribers_ >= cfg_.max_subscribers) {
        return SubscriptionError::SubscriberLimit;
    }
    ++subscribers_;
    out.reset(new BufferReader<T>(this->shared_from_this(), write_seq_));
    return SubscriptionError::None;
}

template <typename T>
void BufferCell<T>::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

template <typename T>
CellStatistics BufferCell<T>::statistics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CellStatistics stats{};
    stats.kind = cfg_.kind;
    stats.capacity = slots_.size();
    stats.writes = write_seq_;
    stats.subscribers = subscribers_;
    stats.max_subscribers = cfg_.max_subscribers;
    stats.closed = closed_;
    return stats;
}

template <typename T>
SubscriptionError BufferCell<T>::read_next(uint64_t &cursor, uint64_t &skipped, T &out,
                                           Wait wait) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (wait == Wait::Block) {
        cv_.wait(lock, [this, &cursor]() { return closed_ || write_seq_ > cursor; });
    }
    if (closed_) {
        return SubscriptionError::Closed;
    }
    if (write_seq_ <= cursor) {
        return SubscriptionError::Empty;
    }

    if (cfg_.kind == BufferKind::Latest) {
        skipped += write_seq_ - cursor - 1;
        out = *slots_[0];
        cursor = write_seq_;
        return SubscriptionError::None;
    }

    const uint64_t capacity = slots_.size();
    if (write_seq_ - cursor > capacity) {
        const uint64_t oldest = write_seq_ - capacity;
        skipped += oldest - cursor;
        cursor = oldest;
    }
    out = *slots_[cursor % capacity];
    ++cursor;
    return SubscriptionError::None;
}

template <typename T>
void BufferCell<T>::release_subscriber() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (subscribers_ > 0) {
        --subscribers_;
    }
}

template <typename T>
BufferReader<T>::~BufferReader() {
    if (cell_) {
        cell_->release_subscriber();
    }
}

template <typename T>
SubscriptionError BufferReader<T>::next(T &out) {
    return cell_->read_next(cursor_, skipped_, out, BufferCell<T>::Wait::Block);
}

template <typename T>
SubscriptionError BufferReader<T>::try_next(T &out) {
    return cell_->read_next(cursor_, skipped_, out, BufferCell<T>::Wait::Poll);
}

} // namespace knxbridge::store
