#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace gpudash::tui {

// Severity of a single reading. Unknown applies exactly when the reading is absent.
enum class Tier {
    Unknown,
    Normal,
    Warning,
    Critical
};

// Display colors, independent of any terminal library
enum class Color {
    Gray,
    Green,
    Yellow,
    Red
};

inline constexpr std::string_view kPlaceholder = "--";

// Classifiers
Tier temperature_tier(std::optional<float> celsius);
Tier junction_tier(std::optional<float> celsius);
Tier mem_temp_tier(std::optional<float> celsius);
Tier power_tier(std::optional<float> watts);

// Shared by the utilization and VRAM gauges; ratio is expected in [0, 1]
Tier ratio_tier(float ratio);

// The one place tiers become colors
Color tier_color(Tier tier);

// Gauge fill levels. Both return 0 for missing data.
float vram_ratio(std::optional<uint64_t> used_mb, std::optional<uint64_t> total_mb);
float pct_ratio(std::optional<float> pct);

// Formatting. Absent values become kPlaceholder, without a unit.
std::string format_value(std::optional<float> value, std::string_view unit);
std::string format_value(std::optional<uint32_t> value, std::string_view unit);
std::string format_value(std::optional<uint64_t> value, std::string_view unit);

std::string format_pct(std::optional<float> pct);
std::string format_vram(std::optional<uint64_t> used_mb, std::optional<uint64_t> total_mb);
std::string format_clocks(std::optional<uint32_t> core_mhz, std::optional<uint32_t> mem_mhz);

} // namespace gpudash::tui
