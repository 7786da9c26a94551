#include "connector/endpoint.hpp"

#include "codec/group_address.hpp"

#include <cctype>
#include <string_view>
#include <utility>
#include <vector>

namespace knxbridge::connector {
namespace {

std::vector<std::string_view> split_levels(std::string_view topic) {
    std::vector<std::string_view> levels;
    size_t start = 0;
    while (true) {
        size_t slash = topic.find('/', start);
        if (slash == std::string_view::npos) {
            levels.push_back(topic.substr(start));
            break;
        }
        levels.push_back(topic.substr(start, slash - start));
        start = slash + 1;
    }
    return levels;
}

std::string sanitize_segment(std::string_view segment) {
    if (segment == "+" || segment == "#") {
        return std::string(segment);
    }

    std::string sanitized;
    sanitized.reserve(segment.size());
    bool last_was_separator = false;

    for (char ch : segment) {
        unsigned char uc = static_cast<unsigned char>(ch);
        if (std::isalnum(uc)) {
            sanitized.push_back(static_cast<char>(std::tolower(uc)));
            last_was_separator = false;
        } else if (ch == ' ' || ch == '-' || ch == '_' || ch == '.') {
            if (!sanitized.empty() && !last_was_separator) {
                sanitized.push_back('_');
                last_was_separator = true;
            }
        }
    }

    if (!sanitized.empty() && last_was_separator) {
        sanitized.pop_back();
    }

    return sanitized;
}

} // namespace

bool parse_endpoint(const std::string &url, Endpoint &out) {
    const size_t separator = url.find("://");
    if (separator == std::string::npos || separator == 0) {
        return false;
    }
    std::string scheme = url.substr(0, separator);
    std::string path = url.substr(separator + 3);
    if (path.empty()) {
        return false;
    }
    for (char &ch : scheme) {
        unsigned char uc = static_cast<unsigned char>(ch);
        if (!std::isalnum(uc)) {
            return false;
        }
        ch = static_cast<char>(std::tolower(uc));
    }
    if (scheme == kKnxScheme) {
        codec::GroupAddress address;
        if (codec::parse_group_address(path, address)) {
            path = codec::format_group_address(address);
        }
    }
    out.scheme = std::move(scheme);
    out.path = std::move(path);
    return true;
}

bool topic_matches(const std::string &filter, const std::string &topic) {
    if (!is_valid_topic_filter(filter) || !is_valid_publish_topic(topic)) {
        return false;
    }
    const auto filter_levels = split_levels(filter);
    const auto topic_levels = split_levels(topic);

    size_t i = 0;
    for (; i < filter_levels.size(); ++i) {
        if (filter_levels[i] == "#") {
            return true;
        }
        if (i >= topic_levels.size()) {
            return false;
        }
        if (filter_levels[i] != "+" && filter_levels[i] != topic_levels[i]) {
            return false;
        }
    }
    return i == topic_levels.size();
}

bool is_valid_topic_filter(const std::string &filter) {
    if (filter.empty()) {
        return false;
    }
    const auto levels = split_levels(filter);
    for (size_t i = 0; i < levels.size(); ++i) {
        const std::string_view level = levels[i];
        if (level == "#") {
            if (i + 1 != levels.size()) {
                return false;
            }
            continue;
        }
        if (level == "+") {
            continue;
        }
        if (level.find_first_of("+#") != std::string_view::npos) {
            return false;
        }
    }
    return true;
}

bool is_valid_publish_topic(const std::string &topic) {
    return !topic.empty() && topic.find_first_of("+#") == std::string::npos;
}

std::string sanitize_topic_path(const std::string &raw) {
    std::string topic;
    if (raw.empty()) {
        return topic;
    }
    for (std::string_view level : split_levels(raw)) {
        std::string sanitized = sanitize_segment(level);
        if (sanitized.empty()) {
            continue;
        }
        if (!topic.empty()) {
            topic.push_back('/');
        }
        topic += sanitized;
    }
    return topic;
}

} // namespace knxbridge::connector
