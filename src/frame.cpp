#include "frame.hpp"
#include <format>

namespace gpudash::tui {

namespace {

constexpr const char* kTitle = "gpudash - GPU telemetry";
constexpr const char* kInstructions = "Press 'q' or Esc to quit";

StyledLine styled(std::string text, Tier tier) {
    return StyledLine{.text = std::move(text), .color = tier_color(tier)};
}

StyledLine plain(std::string text) {
    return StyledLine{.text = std::move(text), .color = std::nullopt};
}

} // namespace

std::vector<StyledLine> device_lines(size_t index, const MetricSample& s) {
    return {
        plain(std::format("[{}] {}", index, s.name)),
        styled("Temperature: " + format_value(s.temperature_c, "°C"),
               temperature_tier(s.temperature_c)),
        styled("Junction:    " + format_value(s.junction_temp_c, "°C"),
               junction_tier(s.junction_temp_c)),
        styled("Memory temp: " + format_value(s.mem_temp_c, "°C"),
               mem_temp_tier(s.mem_temp_c)),
        styled("Power:       " + format_value(s.power_w, "W"),
               power_tier(s.power_w)),
        plain("Clocks:      " + format_clocks(s.core_clock_mhz, s.mem_clock_mhz)),
        plain("Fan:         " + format_value(s.fan_rpm, "RPM")),
    };
}

Gauge utilization_gauge(const MetricSample* device) {
    std::optional<float> pct = device ? device->utilization_pct : std::nullopt;
    float ratio = pct_ratio(pct);

    return Gauge{
        .title = "Utilization",
        .ratio = ratio,
        .color = tier_color(ratio_tier(ratio)),
        .label = format_pct(pct)
    };
}

Gauge vram_gauge(const MetricSample* device) {
    std::optional<uint64_t> used = device ? device->vram_used_mb : std::nullopt;
    std::optional<uint64_t> total = device ? device->vram_total_mb : std::nullopt;
    float ratio = vram_ratio(used, total);

    return Gauge{
        .title = "VRAM",
        .ratio = ratio,
        .color = tier_color(ratio_tier(ratio)),
        .label = format_vram(used, total)
    };
}

Frame render(const AppState& state) {
    Frame frame;
    frame.header = HeaderBlock{.title = kTitle, .instructions = kInstructions};

    const auto& metrics = state.metrics();
    for (size_t i = 0; i < metrics.size(); ++i) {
        if (i > 0) {
            frame.body.lines.push_back(plain(""));
        }
        auto lines = device_lines(i, metrics[i]);
        frame.body.lines.insert(frame.body.lines.end(), lines.begin(), lines.end());
    }

    // Only the first device feeds the gauges
    const MetricSample* focus = metrics.empty() ? nullptr : &metrics.front();
    frame.body.utilization = utilization_gauge(focus);
    frame.body.vram = vram_gauge(focus);

    frame.footer.text = std::format("Tick: {}", state.tick());
    auto note = data_note(state.sampler());
    if (!note.empty()) {
        frame.footer.text += " | " + note;
    }

    return frame;
}

} // namespace gpudash::tui
