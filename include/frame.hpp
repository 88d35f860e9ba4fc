#pragma once

#include "app_state.hpp"
#include "presentation.hpp"
#include <optional>
#include <string>
#include <vector>

namespace gpudash::tui {

struct StyledLine {
    std::string text;
    std::optional<Color> color;  // nullopt draws with the default text color
};

struct Gauge {
    std::string title;
    float ratio = 0.0f;  // always in [0, 1]
    Color color = Color::Green;
    std::string label;
};

struct HeaderBlock {
    std::string title;
    std::string instructions;
};

struct BodyBlock {
    std::vector<StyledLine> lines;
    Gauge utilization;
    Gauge vram;
};

struct FooterBlock {
    std::string text;
};

// Everything needed to draw one screen, without any terminal types
struct Frame {
    HeaderBlock header;
    BodyBlock body;
    FooterBlock footer;
};

// Pure; never throws on missing or inconsistent readings
Frame render(const AppState& state);

// Lines for one device, without the separating blank line
std::vector<StyledLine> device_lines(size_t index, const MetricSample& sample);

Gauge utilization_gauge(const MetricSample* device);
Gauge vram_gauge(const MetricSample* device);

} // namespace gpudash::tui
