#include "errors.hpp"

namespace knxbridge {

const char *to_string(BindingError error) {
    switch (error) {
        case BindingError::None:
            return "none";
        case BindingError::ConnectorUnavailable:
            return "connector unavailable";
        case BindingError::UnknownScheme:
            return "no connector for endpoint scheme";
        case BindingError::InvalidEndpoint:
            return "invalid endpoint";
        case BindingError::DuplicateInbound:
            return "record already has an inbound link";
        case BindingError::DuplicateRecord:
            return "record registered twice";
        case BindingError::MissingBuffer:
            return "record has no buffer";
        case BindingError::InvalidBuffer:
            return "invalid buffer configuration";
        case BindingError::MissingCodec:
            return "link has no codec";
        case BindingError::InvalidOption:
            return "invalid link option";
        case BindingError::SubscriberLimit:
            return "subscriber limit reached";
        case BindingError::EndpointRejected:
            return "connector rejected endpoint";
        case BindingError::OutOfMemory:
            return "out of memory";
        default:
            return "unknown";
    }
}

const char *to_string(SubscriptionError error) {
    switch (error) {
        case SubscriptionError::None:
            return "none";
        case SubscriptionError::CellNotFound:
            return "cell not found";
        case SubscriptionError::SubscriberLimit:
            return "subscriber limit reached";
        case SubscriptionError::Closed:
            return "cell closed";
        case SubscriptionError::Empty:
            return "no value available";
        default:
            return "unknown";
    }
}

} // namespace knxbridge
