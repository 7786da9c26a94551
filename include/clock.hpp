#pragma once

#include <cstdint>

#if defined(ESP_PLATFORM)
#include "esp_timer.h"
#else
#include <chrono>
#endif

namespace knxbridge {

// Milliseconds since boot (ESP-IDF) or since an arbitrary steady epoch (host).
inline uint64_t now_ms() {
#if defined(ESP_PLATFORM)
    return static_cast<uint64_t>(esp_timer_get_time()) / 1000ULL;
#else
    using namespace std::chrono;
    return static_cast<uint64_t>(
        duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count());
#endif
}

} // namespace knxbridge
