#include "bridge/monitor.hpp"

#include <utility>

namespace knxbridge::bridge {

MonitorHandle::MonitorHandle(std::string name,
                             std::shared_ptr<std::atomic<bool>> running,
                             std::thread thread)
    : name_(std::move(name)), running_(std::move(running)), thread_(std::move(thread)) {}

MonitorHandle::~MonitorHandle() {
    join();
}

void MonitorHandle::join() {
    if (thread_.joinable()) {
        thread_.join();
    }
}

} // namespace knxbridge::bridge
