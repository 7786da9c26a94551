#include <cassert>
#include <string>

#include "connector/connector.hpp"
#include "connector/endpoint.hpp"

using knxbridge::connector::Direction;
using knxbridge::connector::Endpoint;
using knxbridge::connector::Status;
using knxbridge::connector::is_valid_publish_topic;
using knxbridge::connector::is_valid_topic_filter;
using knxbridge::connector::parse_endpoint;
using knxbridge::connector::sanitize_topic_path;
using knxbridge::connector::topic_matches;
using knxbridge::connector::validate_path;

int main() {
    {
        Endpoint endpoint;
        assert(parse_endpoint("knx://1/0/7", endpoint));
        assert(endpoint.scheme == "knx");
        assert(endpoint.path == "1/0/7");
        assert(endpoint.url() == "knx://1/0/7");

        // Group addresses are stored in canonical form.
        assert(parse_endpoint("knx://01/0/007", endpoint));
        assert(endpoint.path == "1/0/7");
        assert(endpoint.url() == "knx://1/0/7");
        assert(parse_endpoint("knx://lights", endpoint));
        assert(endpoint.path == "lights");

        assert(parse_endpoint("MQTT://knx/lights/state", endpoint));
        assert(endpoint.scheme == "mqtt");
        assert(endpoint.path == "knx/lights/state");

        Endpoint untouched{"keep", "me"};
        assert(!parse_endpoint("knx:/1/0/7", untouched));
        assert(!parse_endpoint("://1/0/7", untouched));
        assert(!parse_endpoint("knx://", untouched));
        assert(!parse_endpoint("k-x://1/0/7", untouched));
        assert(!parse_endpoint("1/0/7", untouched));
        assert(untouched.scheme == "keep" && untouched.path == "me");
    }

    {
        assert(topic_matches("knx/lights/state", "knx/lights/state"));
        assert(!topic_matches("knx/lights/state", "knx/lights/control"));
        assert(topic_matches("knx/+/state", "knx/lights/state"));
        assert(!topic_matches("knx/+/state", "knx/lights/kitchen/state"));
        assert(topic_matches("knx/#", "knx/lights/kitchen/state"));
        assert(topic_matches("knx/#", "knx"));
        assert(topic_matches("#", "anything/at/all"));
        assert(!topic_matches("knx/lights", "knx/lights/state"));
        assert(!topic_matches("knx/lights/state/extra", "knx/lights/state"));
        assert(!topic_matches("knx/#/state", "knx/lights/state"));
        assert(!topic_matches("knx/+", "knx/+"));
    }

    {
        assert(is_valid_topic_filter("knx/+/state"));
        assert(is_valid_topic_filter("knx/#"));
        assert(!is_valid_topic_filter(""));
        assert(!is_valid_topic_filter("knx/li+ghts"));
        assert(!is_valid_topic_filter("knx/#/state"));

        assert(is_valid_publish_topic("knx/lights/state"));
        assert(!is_valid_publish_topic("knx/+/state"));
        assert(!is_valid_publish_topic("knx/#"));
        assert(!is_valid_publish_topic(""));
    }

    {
        assert(sanitize_topic_path(" KNX / Living Room-Lights ") == "knx/living_room_lights");
        assert(sanitize_topic_path("//knx//lights//") == "knx/lights");
        assert(sanitize_topic_path("knx/+/State") == "knx/+/state");
        assert(sanitize_topic_path("Home/#") == "home/#");
        assert(sanitize_topic_path("").empty());
        assert(sanitize_topic_path("///").empty());
    }

    {
        assert(validate_path("knx", "1/0/7", Direction::Inbound) == Status::Ok);
        assert(validate_path("knx", "1/0/7", Direction::Outbound) == Status::Ok);
        assert(validate_path("knx", "knx/lights", Direction::Outbound) == Status::Rejected);
        assert(validate_path("mqtt", "knx/+/state", Direction::Inbound) == Status::Ok);
        assert(validate_path("mqtt", "knx/+/state", Direction::Outbound) == Status::Rejected);
        assert(validate_path("mqtt", "knx/lights/state", Direction::Outbound) == Status::Ok);
        assert(validate_path("mqtt", "", Direction::Inbound) == Status::Rejected);
    }

    return 0;
}
