#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace gpudash::tui {

// One device's readings at one point in time. Every reading is optional:
// an absent value means the sensor was unavailable, never zero.
struct MetricSample {
    std::string name;

    std::optional<float> temperature_c;
    std::optional<float> junction_temp_c;
    std::optional<float> mem_temp_c;

    // Not clamped at capture time
    std::optional<float> utilization_pct;

    // used can exceed total when the sensor misreports
    std::optional<uint64_t> vram_used_mb;
    std::optional<uint64_t> vram_total_mb;

    std::optional<float> power_w;
    std::optional<uint32_t> fan_rpm;
    std::optional<uint32_t> core_clock_mhz;
    std::optional<uint32_t> mem_clock_mhz;

    std::chrono::system_clock::time_point timestamp;
};

} // namespace gpudash::tui
