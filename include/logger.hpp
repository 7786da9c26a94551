#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace knxbridge::log {

enum class Level : uint8_t {
    None = 0,
    Error,
    Warn,
    Info,
    Debug,
    Verbose,
};

struct Entry {
    uint64_t timestamp_ms;
    Level level;
    std::string tag;
    std::string message;
};

void init();
void shutdown();
void append(Level level, const char *tag, const char *message);
void write(Level level, const char *tag, const char *fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;
std::vector<Entry> recent(size_t max_entries);

Level level_from_string(const std::string &value);
std::string level_to_string(Level level);

void set_global_level(Level level);
Level current_level();

} // namespace knxbridge::log

#define KNXB_LOGE(tag, ...) ::knxbridge::log::write(::knxbridge::log::Level::Error, tag, __VA_ARGS__)
#define KNXB_LOGW(tag, ...) ::knxbridge::log::write(::knxbridge::log::Level::Warn, tag, __VA_ARGS__)
#define KNXB_LOGI(tag, ...) ::knxbridge::log::write(::knxbridge::log::Level::Info, tag, __VA_ARGS__)
#define KNXB_LOGD(tag, ...) ::knxbridge::log::write(::knxbridge::log::Level::Debug, tag, __VA_ARGS__)
#define KNXB_LOGV(tag, ...) ::knxbridge::log::write(::knxbridge::log::Level::Verbose, tag, __VA_ARGS__)
