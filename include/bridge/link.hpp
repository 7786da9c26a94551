#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>

#include "codec/codec_types.hpp"
#include "connector/connector.hpp"
#include "diagnostics.hpp"
#include "errors.hpp"
#include "store/buffer_cell.hpp"

namespace knxbridge::bridge {

template <typename T>
using Deserializer = std::function<codec::DecodeError(const codec::Bytes &, T &)>;

template <typename T>
using Serializer = std::function<codec::EncodeError(const T &, codec::Bytes &)>;

using LinkConfig = std::map<std::string, std::string>;

template <typename T>
struct InboundLinkSpec {
    std::string url;
    Deserializer<T> deserializer;
    LinkConfig config;
};

template <typename T>
struct OutboundLinkSpec {
    std::string url;
    Serializer<T> serializer;
    LinkConfig config;
};

// `qos` (0..2) and `retain` (true/false/1/0) are parsed; other keys are kept
// verbatim in `extra`.
BindingError make_delivery_options(const LinkConfig &config, connector::DeliveryOptions &out);

// Maps a connector status seen while binding to the assembly error.
BindingError binding_error_from(connector::Status status);

/**
 * @brief Receive path of an inbound link: decode, then write the cell.
 * A failed decode leaves the cell untouched.
 */
template <typename T>
connector::ReceiveCallback make_inbound_handler(std::shared_ptr<store::BufferCell<T>> cell,
                                                Deserializer<T> deserializer,
                                                std::shared_ptr<diagnostics::LinkHealth> health);

/**
 * @brief Body of an outbound link thread: one encode and one send per value
 * read from the cell, until the cell closes.
 */
template <typename T>
void run_outbound_link(std::unique_ptr<store::BufferReader<T>> reader,
                       std::shared_ptr<connector::Connector> connector,
                       std::string path,
                       Serializer<T> serializer,
                       connector::DeliveryOptions options,
                       std::shared_ptr<diagnostics::LinkHealth> health);

} // namespace knxbridge::bridge

#include "bridge/link.tpp"
