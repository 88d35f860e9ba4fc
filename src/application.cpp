#include "application.hpp"
#include "frame.hpp"
#include "utils/logger.hpp"
#include <format>
#include <stdexcept>

namespace gpudash::tui {

DispatchResult dispatch(AppState& state, const InputEvent& event) {
    switch (event.kind) {
        case InputKind::TIMEOUT:
            state.on_tick();
            return DispatchResult::TICKED;

        case InputKind::KEY:
            LOG_DEBUG("input", std::format("Key: {}", event.code));
            state.on_key(event.code);
            return DispatchResult::KEY_HANDLED;

        case InputKind::RESIZE:
            return DispatchResult::RELAYOUT;

        case InputKind::OTHER:
            break;
    }
    LOG_DEBUG("input", std::format("Ignored {} event ({})",
              input_kind_to_string(event.kind), event.code));
    return DispatchResult::IGNORED;
}

Sampler make_sampler(const Config& config) {
    if (!config.replay_file.empty()) {
        return ScriptedSampler::load_file(config.replay_file);
    }
    return MockSampler(static_cast<size_t>(config.mock_device_count));
}

Application::Application(Config config, TerminalDevice device)
    : config_(std::move(config)), device_(device) {
}

Application::~Application() {
    shutdown();
}

void Application::init() {
    LOG_INFO("Application", "Initializing gpudash...");

    // Sampler problems surface before the terminal is taken over
    state_.emplace(AppState::start(make_sampler(config_)));

    ui_manager_ = std::make_unique<UIManager>();
    ui_manager_->init(device_);

    LOG_INFO("Application", std::format("Initialization complete, polling every {} ms",
             config_.poll_interval_ms));
}

void Application::run() {
    if (!ui_manager_ || !state_) {
        throw std::logic_error("Application::run() called before init()");
    }

    LOG_INFO("Application", "Entering main loop");

    while (state_->running()) {
        ui_manager_->draw(render(*state_));

        auto event = ui_manager_->poll_input(config_.poll_interval_ms);
        if (dispatch(*state_, event) == DispatchResult::RELAYOUT) {
            ui_manager_->update_layout();
            LOG_INFO("Application", "Terminal resized");
        }
    }

    LOG_INFO("Application", std::format("Main loop exited after {} ticks", state_->tick()));
}

void Application::shutdown() {
    if (ui_manager_) {
        ui_manager_->shutdown();
        ui_manager_.reset();
        LOG_INFO("Application", "Shutdown complete");
    }
}

} // namespace gpudash::tui
