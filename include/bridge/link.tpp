#pragma once

#include <utility>

#include "logger.hpp"

namespace knxbridge::bridge {

template <typename T>
connector::ReceiveCallback make_inbound_handler(std::shared_ptr<store::BufferCell<T>> cell,
                                                Deserializer<T> deserializer,
                                                std::shared_ptr<diagnostics::LinkHealth> health) {
    return [cell, deserializer, health](const codec::Bytes &payload) {
        diagnostics::note_received(*health);

        T value{};
        codec::DecodeError err = deserializer(payload, value);
        if (err != codec::DecodeError::None) {
            diagnostics::note_decode_error(*health, err);
            KNXB_LOGW("link-in", "Discarding %zu byte payload from %s: %s", payload.size(),
                      health->endpoint.c_str(), codec::to_string(err));
            return;
        }

        if (!cell->write(std::move(value))) {
            KNXB_LOGD("link-in", "Cell closed, dropping value from %s", health->endpoint.c_str());
            return;
        }
        diagnostics::note_decoded(*health);
    };
}

template <typename T>
void run_outbound_link(std::unique_ptr<store::BufferReader<T>> reader,
                       std::shared_ptr<connector::Connector> connector,
                       std::string path,
                       Serializer<T> serializer,
                       connector::DeliveryOptions options,
                       std::shared_ptr<diagnostics::LinkHealth> health) {
    T value{};
    while (true) {
        SubscriptionError sub_err = reader->next(value);
        if (sub_err != SubscriptionError::None) {
            KNXB_LOGD("link-out", "Outbound link %s stopping: %s", health->endpoint.c_str(),
                      to_string(sub_err));
            break;
        }

        codec::Bytes payload;
        codec::EncodeError enc_err = serializer(value, payload);
        if (enc_err != codec::EncodeError::None) {
            diagnostics::note_encode_error(*health, enc_err);
            KNXB_LOGW("link-out", "Dropping publish to %s: %s", health->endpoint.c_str(),
                      codec::to_string(enc_err));
            continue;
        }

        connector::Status status = connector->send(path, payload, options);
        if (status != connector::Status::Ok) {
            diagnostics::note_send_failure(*health);
            KNXB_LOGW("link-out", "Send to %s failed: %s", health->endpoint.c_str(),
                      connector::to_string(status));
            continue;
        }
        diagnostics::note_published(*health);
    }
}

} // namespace knxbridge::bridge
