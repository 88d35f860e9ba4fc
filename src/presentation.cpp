#include "presentation.hpp"
#include <algorithm>
#include <format>

namespace gpudash::tui {

namespace {

Tier threshold_tier(std::optional<float> value, float warning, float critical) {
    if (!value) return Tier::Unknown;
    if (*value >= critical) return Tier::Critical;
    if (*value >= warning) return Tier::Warning;
    return Tier::Normal;
}

template <typename T>
std::string format_integer(std::optional<T> value, std::string_view unit) {
    if (!value) {
        return std::string(kPlaceholder);
    }
    if (unit.empty()) {
        return std::to_string(*value);
    }
    return std::format("{} {}", *value, unit);
}

} // namespace

Tier temperature_tier(std::optional<float> celsius) {
    return threshold_tier(celsius, 80.0f, 90.0f);
}

Tier junction_tier(std::optional<float> celsius) {
    return threshold_tier(celsius, 95.0f, 105.0f);
}

Tier mem_temp_tier(std::optional<float> celsius) {
    return threshold_tier(celsius, 85.0f, 95.0f);
}

Tier power_tier(std::optional<float> watts) {
    return threshold_tier(watts, 220.0f, 300.0f);
}

Tier ratio_tier(float ratio) {
    if (ratio >= 0.90f) return Tier::Critical;
    if (ratio >= 0.75f) return Tier::Warning;
    return Tier::Normal;
}

Color tier_color(Tier tier) {
    switch (tier) {
        case Tier::Critical: return Color::Red;
        case Tier::Warning:  return Color::Yellow;
        case Tier::Normal:   return Color::Green;
        case Tier::Unknown:  return Color::Gray;
    }
    return Color::Gray;
}

float vram_ratio(std::optional<uint64_t> used_mb, std::optional<uint64_t> total_mb) {
    if (!used_mb || !total_mb || *total_mb == 0) {
        return 0.0f;
    }
    double ratio = static_cast<double>(*used_mb) / static_cast<double>(*total_mb);
    return static_cast<float>(std::clamp(ratio, 0.0, 1.0));
}

float pct_ratio(std::optional<float> pct) {
    if (!pct) {
        return 0.0f;
    }
    // NaN compares false everywhere and would slip through clamp
    if (*pct != *pct) {
        return 0.0f;
    }
    return std::clamp(*pct, 0.0f, 100.0f) / 100.0f;
}

std::string format_value(std::optional<float> value, std::string_view unit) {
    if (!value) {
        return std::string(kPlaceholder);
    }
    if (unit.empty()) {
        return std::format("{:.1f}", *value);
    }
    return std::format("{:.1f} {}", *value, unit);
}

std::string format_value(std::optional<uint32_t> value, std::string_view unit) {
    return format_integer(value, unit);
}

std::string format_value(std::optional<uint64_t> value, std::string_view unit) {
    return format_integer(value, unit);
}

std::string format_pct(std::optional<float> pct) {
    if (!pct) {
        return std::string(kPlaceholder);
    }
    return std::format("{:.1f}%", pct_ratio(pct) * 100.0f);
}

std::string format_vram(std::optional<uint64_t> used_mb, std::optional<uint64_t> total_mb) {
    if (used_mb && total_mb) {
        return std::format("{} / {} MB", *used_mb, *total_mb);
    }
    if (used_mb) {
        return std::format("{} MB / ? MB", *used_mb);
    }
    return std::string(kPlaceholder);
}

std::string format_clocks(std::optional<uint32_t> core_mhz, std::optional<uint32_t> mem_mhz) {
    return std::format("core {} / mem {}",
                       format_value(core_mhz, "MHz"),
                       format_value(mem_mhz, "MHz"));
}

} // namespace gpudash::tui
