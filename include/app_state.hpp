#pragma once

#include "metric_sample.hpp"
#include "sampler.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace gpudash::tui {

enum class RunState {
    RUNNING,
    STOPPED
};

inline constexpr int kQuitKey = 'q';
inline constexpr int kEscapeKey = 27;

// Dashboard state, owned by the event loop. Not thread-safe; it never leaves
// the loop's thread.
class AppState {
public:
    explicit AppState(Sampler sampler);

    // Builds a state with the first tick already applied, so the first frame is populated
    static AppState start(Sampler sampler);

    bool running() const { return run_state_ == RunState::RUNNING; }
    RunState run_state() const { return run_state_; }
    uint64_t tick() const { return tick_; }
    const std::vector<MetricSample>& metrics() const { return metrics_; }
    const Sampler& sampler() const { return sampler_; }

    // Replace metrics with a fresh sample for the current tick, then advance the tick.
    // Ignored once stopped.
    void on_tick();

    // 'q' and Escape stop the dashboard; every other key is a no-op
    void on_key(int code);

    static std::string run_state_to_string(RunState state);

private:
    Sampler sampler_;
    RunState run_state_ = RunState::RUNNING;
    uint64_t tick_ = 0;
    std::vector<MetricSample> metrics_;
};

} // namespace gpudash::tui
