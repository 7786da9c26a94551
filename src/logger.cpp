#include "logger.hpp"

#include "clock.hpp"

#if defined(ESP_PLATFORM)
#include "esp_log.h"
#endif

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <deque>
#include <iterator>
#include <mutex>

namespace knxbridge::log {
namespace {
constexpr size_t kMaxEntries = 256;
std::mutex log_lock;
std::deque<Entry> entries;
std::atomic<Level> global_level{Level::Info};

char level_prefix(Level level) {
    switch (level) {
        case Level::Error:
            return 'E';
        case Level::Warn:
            return 'W';
        case Level::Info:
            return 'I';
        case Level::Debug:
            return 'D';
        case Level::Verbose:
            return 'V';
        default:
            return '?';
    }
}

#if defined(ESP_PLATFORM)
esp_log_level_t to_esp(Level level) {
    switch (level) {
        case Level::Error:
            return ESP_LOG_ERROR;
        case Level::Warn:
            return ESP_LOG_WARN;
        case Level::Info:
            return ESP_LOG_INFO;
        case Level::Debug:
            return ESP_LOG_DEBUG;
        case Level::Verbose:
            return ESP_LOG_VERBOSE;
        default:
            return ESP_LOG_NONE;
    }
}
#endif

bool enabled(Level level) {
    return level != Level::None &&
           static_cast<uint8_t>(level) <= static_cast<uint8_t>(global_level.load());
}

void emit(Level level, const char *tag, const char *message, uint64_t timestamp_ms) {
#if defined(ESP_PLATFORM)
    (void)timestamp_ms;
    esp_log_write(to_esp(level), tag, "%c (%lu) %s: %s\n", level_prefix(level),
                  static_cast<unsigned long>(esp_log_timestamp()), tag, message);
#else
    std::fprintf(stderr, "%c (%llu) %s: %s\n", level_prefix(level),
                 static_cast<unsigned long long>(timestamp_ms), tag, message);
#endif
}

} // namespace

void init() {
    std::lock_guard<std::mutex> lock(log_lock);
    entries.clear();
    global_level = Level::Info;
}

void shutdown() {
    std::lock_guard<std::mutex> lock(log_lock);
    entries.clear();
}

void append(Level level, const char *tag, const char *message) {
    if (!enabled(level)) {
        return;
    }
    if (!tag || !tag[0]) {
        tag = "knxbridge";
    }
    if (!message) {
        message = "";
    }

    Entry entry{};
    entry.timestamp_ms = now_ms();
    entry.level = level;
    entry.tag = tag;
    entry.message = message;
    entry.message.erase(std::remove(entry.message.begin(), entry.message.end(), '\r'),
                        entry.message.end());
    entry.message.erase(std::remove(entry.message.begin(), entry.message.end(), '\n'),
                        entry.message.end());

    {
        std::lock_guard<std::mutex> lock(log_lock);
        entries.push_back(entry);
        while (entries.size() > kMaxEntries) {
            entries.pop_front();
        }
    }

    emit(level, entry.tag.c_str(), entry.message.c_str(), entry.timestamp_ms);
}

void write(Level level, const char *tag, const char *fmt, ...) {
    if (!enabled(level) || !fmt) {
        return;
    }
    char buffer[512];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);
    append(level, tag, buffer);
}

std::vector<Entry> recent(size_t max_entries) {
    std::vector<Entry> snapshot;
    std::lock_guard<std::mutex> lock(log_lock);
    size_t count = std::min(max_entries, entries.size());
    snapshot.reserve(count);
    auto begin = entries.size() > count ? entries.end() - static_cast<std::ptrdiff_t>(count)
                                        : entries.begin();
    for (auto it = begin; it != entries.end(); ++it) {
        snapshot.push_back(*it);
    }
    return snapshot;
}

Level level_from_string(const std::string &value) {
    std::string lower;
    lower.reserve(value.size());
    std::transform(value.begin(), value.end(), std::back_inserter(lower), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lower == "none") {
        return Level::None;
    }
    if (lower == "error") {
        return Level::Error;
    }
    if (lower == "warn" || lower == "warning") {
        return Level::Warn;
    }
    if (lower == "debug") {
        return Level::Debug;
    }
    if (lower == "verbose" || lower == "trace") {
        return Level::Verbose;
    }
    return Level::Info;
}

std::string level_to_string(Level level) {
    switch (level) {
        case Level::None:
            return "none";
        case Level::Error:
            return "error";
        case Level::Warn:
            return "warn";
        case Level::Info:
            return "info";
        case Level::Debug:
            return "debug";
        case Level::Verbose:
            return "verbose";
        default:
            return "info";
    }
}

void set_global_level(Level level) {
    global_level = level;
#if defined(ESP_PLATFORM)
    esp_log_level_set("*", to_esp(level));
#endif
}

Level current_level() {
    return global_level;
}

} // namespace knxbridge::log
