#include "connector/loopback_connector.hpp"

#include "codec/group_address.hpp"
#include "connector/endpoint.hpp"
#include "logger.hpp"

#include <algorithm>
#include <utility>

namespace knxbridge::connector {
namespace {
const char *TAG = "loopback";
} // namespace

LoopbackConnector::LoopbackConnector(std::string scheme) : scheme_(std::move(scheme)) {}

LoopbackConnector::~LoopbackConnector() {
    stop();
}

Status LoopbackConnector::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!available_) {
        KNXB_LOGW(TAG, "%s connector unavailable", scheme_.c_str());
        return Status::Unavailable;
    }
    running_ = true;
    return Status::Ok;
}

void LoopbackConnector::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
}

bool LoopbackConnector::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

Status LoopbackConnector::send(const std::string &path,
                               const codec::Bytes &payload,
                               const DeliveryOptions &options) {
    SendHook hook;
    SentMessage message{path, payload, options};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_ || !available_) {
            ++failed_sends_;
            return Status::Unavailable;
        }
        if (failing_paths_.count(path) != 0) {
            ++failed_sends_;
            return Status::Failed;
        }
        sent_.push_back(message);
        hook = send_hook_;
    }
    sent_cv_.notify_all();

    if (hook) {
        hook(message);
    }
    return Status::Ok;
}

Status LoopbackConnector::on_receive(const std::string &path,
                                     ReceiveCallback callback,
                                     Subscription &out) {
    if (!callback) {
        return Status::Rejected;
    }
    Status valid = validate(path, Direction::Inbound);
    if (valid != Status::Ok) {
        return valid;
    }

    auto receiver = std::make_shared<Receiver>();
    receiver->filter = path;
    receiver->callback = std::move(callback);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!available_) {
            return Status::Unavailable;
        }
        receivers_.push_back(receiver);
    }

    out = Subscription([this, receiver]() {
        std::lock_guard<std::mutex> lock(mutex_);
        receivers_.erase(std::remove(receivers_.begin(), receivers_.end(), receiver),
                         receivers_.end());
    });
    return Status::Ok;
}

size_t LoopbackConnector::inject(const std::string &path, const codec::Bytes &payload) {
    std::vector<std::shared_ptr<Receiver>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            KNXB_LOGW(TAG, "Dropping %s://%s, connector stopped", scheme_.c_str(), path.c_str());
            return 0;
        }
        for (const auto &receiver : receivers_) {
            if (matches(receiver->filter, path)) {
                targets.push_back(receiver);
            }
        }
    }

    for (const auto &receiver : targets) {
        receiver->callback(payload);
    }
    if (targets.empty()) {
        KNXB_LOGD(TAG, "No receiver for %s://%s", scheme_.c_str(), path.c_str());
    }
    return targets.size();
}

std::vector<SentMessage> LoopbackConnector::sent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sent_;
}

std::vector<SentMessage> LoopbackConnector::sent_to(const std::string &path) const {
    std::vector<SentMessage> result;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &message : sent_) {
        if (message.path == path) {
            result.push_back(message);
        }
    }
    return result;
}

bool LoopbackConnector::wait_for_sent(size_t count, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return sent_cv_.wait_for(lock, timeout, [this, count]() { return sent_.size() >= count; });
}

void LoopbackConnector::clear_sent() {
    std::lock_guard<std::mutex> lock(mutex_);
    sent_.clear();
}

void LoopbackConnector::set_available(bool available) {
    std::lock_guard<std::mutex> lock(mutex_);
    available_ = available;
}

void LoopbackConnector::fail_sends_to(const std::string &path, bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail) {
        failing_paths_.insert(path);
    } else {
        failing_paths_.erase(path);
    }
}

void LoopbackConnector::set_send_hook(SendHook hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    send_hook_ = std::move(hook);
}

size_t LoopbackConnector::receiver_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return receivers_.size();
}

uint32_t LoopbackConnector::failed_sends() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failed_sends_;
}

bool LoopbackConnector::matches(const std::string &filter, const std::string &path) const {
    if (scheme_ == kMqttScheme) {
        return topic_matches(filter, path);
    }
    if (scheme_ == kKnxScheme) {
        codec::GroupAddress wanted;
        codec::GroupAddress seen;
        return codec::parse_group_address(filter, wanted) && codec::parse_group_address(path, seen) &&
               wanted.raw() == seen.raw();
    }
    return filter == path;
}

} // namespace knxbridge::connector
