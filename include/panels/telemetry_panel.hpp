#pragma once

#include "base_panel.hpp"
#include "frame.hpp"
#include "layout.hpp"

namespace gpudash::tui {

// Bordered body of the dashboard: device text on top, utilization and VRAM gauges below
class TelemetryPanel : public BasePanel {
public:
    TelemetryPanel();
    ~TelemetryPanel() override = default;

    void set_layout(const LayoutDimensions& layout);
    void set_content(const BodyBlock& body) { body_ = body; }

    void render(WINDOW* window) override;

private:
    BodyBlock body_;
    Region text_;
    Region utilization_;
    Region vram_;

    void render_lines(WINDOW* window);
    void render_gauge(WINDOW* window, const Region& area, const Gauge& gauge);

    // Screen coordinates to window coordinates
    Region to_local(const Region& r) const;
};

} // namespace gpudash::tui
