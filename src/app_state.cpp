#include "app_state.hpp"
#include "utils/logger.hpp"
#include <format>

namespace gpudash::tui {

AppState::AppState(Sampler sampler)
    : sampler_(std::move(sampler)) {
    LOG_INFO("AppState", "Initialized with sampler: " + sampler_name(sampler_));
}

AppState AppState::start(Sampler sampler) {
    AppState state(std::move(sampler));
    state.on_tick();
    return state;
}

void AppState::on_tick() {
    if (run_state_ != RunState::RUNNING) {
        LOG_DEBUG("AppState", "Tick ignored, dashboard stopped");
        return;
    }

    metrics_ = sample(sampler_, tick_);
    ++tick_;

    LOG_DEBUG("AppState", std::format("Tick {} sampled {} devices", tick_, metrics_.size()));
}

void AppState::on_key(int code) {
    if (run_state_ != RunState::RUNNING) {
        return;
    }

    if (code == kQuitKey || code == kEscapeKey) {
        run_state_ = RunState::STOPPED;
        LOG_INFO("AppState", "User quit");
    }
}

std::string AppState::run_state_to_string(RunState state) {
    switch (state) {
        case RunState::RUNNING: return "RUNNING";
        case RunState::STOPPED: return "STOPPED";
    }
    return "UNKNOWN";
}

} // namespace gpudash::tui
