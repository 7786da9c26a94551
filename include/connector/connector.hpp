#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <string>

#include "codec/codec_types.hpp"
#include "connector/subscription.hpp"

namespace knxbridge::connector {

enum class Status : uint8_t {
    Ok = 0,
    Unavailable,
    Rejected,
    Failed,
};

enum class Direction : uint8_t {
    Inbound,
    Outbound,
};

/**
 * @brief Per-link delivery options. `qos` and `retain` are understood by the
 * MQTT connector; everything else set through with_config() lands in `extra`.
 */
struct DeliveryOptions {
    uint8_t qos = 0;
    bool retain = false;
    std::map<std::string, std::string> extra;
};

using ReceiveCallback = std::function<void(const codec::Bytes &)>;

/**
 * @brief Transport plug-in routed by URL scheme.
 *
 * Implementations deliver inbound payloads on their own context by calling
 * the registered callbacks. send() may block; the bridge calls it from the
 * outbound link's own thread only.
 */
class Connector {
public:
    virtual ~Connector() = default;

    virtual const std::string &scheme() const = 0;

    virtual Status start() = 0;
    virtual void stop() = 0;
    virtual bool running() const = 0;

    // Checks that `path` is a usable endpoint for this transport and direction.
    virtual Status validate(const std::string &path, Direction direction) const;

    virtual Status send(const std::string &path,
                        const codec::Bytes &payload,
                        const DeliveryOptions &options) = 0;

    virtual Status on_receive(const std::string &path,
                              ReceiveCallback callback,
                              Subscription &out) = 0;
};

// Shared endpoint rules: group addresses for knx, topic (filter) syntax for mqtt.
Status validate_path(const std::string &scheme, const std::string &path, Direction direction);

const char *to_string(Status status);
const char *to_string(Direction direction);

} // namespace knxbridge::connector
