#pragma once

#include <cstdint>

namespace knxbridge {

/**
 * @brief Fatal assembly failures. Any of these aborts bridge startup.
 */
enum class BindingError : uint8_t {
    None = 0,
    ConnectorUnavailable,
    UnknownScheme,
    InvalidEndpoint,
    DuplicateInbound,
    DuplicateRecord,
    MissingBuffer,
    InvalidBuffer,
    MissingCodec,
    InvalidOption,
    SubscriberLimit,
    EndpointRejected,
    OutOfMemory,
};

/**
 * @brief Reasons a cell subscription or read cannot proceed. Ends the
 * dependent consumer only.
 */
enum class SubscriptionError : uint8_t {
    None = 0,
    CellNotFound,
    SubscriberLimit,
    Closed,
    Empty,
};

const char *to_string(BindingError error);
const char *to_string(SubscriptionError error);

} // namespace knxbridge
