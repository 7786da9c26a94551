#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "codec/codec_types.hpp"
#include "store/record_store.hpp"

namespace knxbridge::diagnostics {

/**
 * @brief Counters of one link. Updated from the connector's receive context
 * (inbound) or the link's own thread (outbound).
 */
struct LinkHealth {
    std::string record;
    std::string endpoint;
    bool inbound = false;
    uint64_t last_activity_ms = 0;
    uint32_t received = 0;
    uint32_t decoded = 0;
    uint32_t decode_errors = 0;
    uint32_t published = 0;
    uint32_t encode_errors = 0;
    uint32_t send_failures = 0;
    mutable std::mutex lock;
};

struct LinkHealthSnapshot {
    std::string record;
    std::string endpoint;
    bool inbound = false;
    uint64_t last_activity_delta_ms = 0;
    uint32_t received = 0;
    uint32_t decoded = 0;
    uint32_t decode_errors = 0;
    uint32_t published = 0;
    uint32_t encode_errors = 0;
    uint32_t send_failures = 0;
};

struct BridgeHealthSnapshot {
    std::vector<LinkHealthSnapshot> links;
    std::vector<store::CellSnapshot> cells;
    size_t monitors_running = 0;
};

void init(LinkHealth &health, const std::string &record, const std::string &endpoint, bool inbound);
void note_received(LinkHealth &health);
void note_decoded(LinkHealth &health);
void note_decode_error(LinkHealth &health, codec::DecodeError err);
void note_published(LinkHealth &health);
void note_encode_error(LinkHealth &health, codec::EncodeError err);
void note_send_failure(LinkHealth &health);

LinkHealthSnapshot snapshot(const LinkHealth &health);
void log_snapshot(const BridgeHealthSnapshot &snapshot, const char *tag);

} // namespace knxbridge::diagnostics
