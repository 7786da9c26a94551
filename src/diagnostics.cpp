#include "diagnostics.hpp"

#include "clock.hpp"
#include "logger.hpp"

#include <functional>

namespace knxbridge::diagnostics {
namespace {
constexpr const char *TAG = "bridge-diag";

void with_lock(const LinkHealth &health, const std::function<void()> &fn) {
    std::lock_guard<std::mutex> guard(health.lock);
    fn();
}

} // namespace

void init(LinkHealth &health, const std::string &record, const std::string &endpoint, bool inbound) {
    with_lock(health, [&]() {
        health.record = record;
        health.endpoint = endpoint;
        health.inbound = inbound;
        health.last_activity_ms = now_ms();
        health.received = 0;
        health.decoded = 0;
        health.decode_errors = 0;
        health.published = 0;
        health.encode_errors = 0;
        health.send_failures = 0;
    });
}

void note_received(LinkHealth &health) {
    with_lock(health, [&]() {
        health.received++;
        health.last_activity_ms = now_ms();
    });
}

void note_decoded(LinkHealth &health) {
    with_lock(health, [&]() { health.decoded++; });
}

void note_decode_error(LinkHealth &health, codec::DecodeError) {
    with_lock(health, [&]() { health.decode_errors++; });
}

void note_published(LinkHealth &health) {
    with_lock(health, [&]() {
        health.published++;
        health.last_activity_ms = now_ms();
    });
}

void note_encode_error(LinkHealth &health, codec::EncodeError) {
    with_lock(health, [&]() { health.encode_errors++; });
}

void note_send_failure(LinkHealth &health) {
    with_lock(health, [&]() { health.send_failures++; });
}

LinkHealthSnapshot snapshot(const LinkHealth &health) {
    LinkHealthSnapshot snap{};
    with_lock(health, [&]() {
        snap.record = health.record;
        snap.endpoint = health.endpoint;
        snap.inbound = health.inbound;
        snap.last_activity_delta_ms = now_ms() - health.last_activity_ms;
        snap.received = health.received;
        snap.decoded = health.decoded;
        snap.decode_errors = health.decode_errors;
        snap.published = health.published;
        snap.encode_errors = health.encode_errors;
        snap.send_failures = health.send_failures;
    });
    return snap;
}

void log_snapshot(const BridgeHealthSnapshot &snapshot, const char *tag) {
    const char *log_tag = tag ? tag : TAG;
    for (const auto &link : snapshot.links) {
        if (link.inbound) {
            KNXB_LOGI(log_tag, "diag: %s <- %s received=%u decoded=%u decode_errors=%u idle=%llu ms",
                      link.record.c_str(), link.endpoint.c_str(), link.received, link.decoded,
                      link.decode_errors, static_cast<unsigned long long>(link.last_activity_delta_ms));
        } else {
            KNXB_LOGI(log_tag, "diag: %s -> %s published=%u encode_errors=%u send_failures=%u idle=%llu ms",
                      link.record.c_str(), link.endpoint.c_str(), link.published, link.encode_errors,
                      link.send_failures, static_cast<unsigned long long>(link.last_activity_delta_ms));
        }
    }
    for (const auto &cell : snapshot.cells) {
        KNXB_LOGI(log_tag, "diag: cell %s (%s/%zu) writes=%llu subscribers=%zu/%zu",
                  cell.record.c_str(), store::to_string(cell.stats.kind), cell.stats.capacity,
                  static_cast<unsigned long long>(cell.stats.writes), cell.stats.subscribers,
                  cell.stats.max_subscribers);
    }
    KNXB_LOGI(log_tag, "diag: monitors running=%zu", snapshot.monitors_running);
}

} // namespace knxbridge::diagnostics
