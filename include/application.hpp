#pragma once

#include "app_state.hpp"
#include "config.hpp"
#include "input.hpp"
#include "sampler.hpp"
#include "ui_manager.hpp"
#include <memory>
#include <optional>

namespace gpudash::tui {

enum class DispatchResult {
    TICKED,
    KEY_HANDLED,
    RELAYOUT,
    IGNORED
};

// One loop iteration's state update: timeouts tick, key presses go to on_key,
// resizes ask for a new layout and everything else is dropped
DispatchResult dispatch(AppState& state, const InputEvent& event);

// Picks the sampling backend named by the config. Throws if a replay file can't be loaded.
Sampler make_sampler(const Config& config);

class Application {
public:
    explicit Application(Config config, TerminalDevice device = {});
    ~Application();

    // Initialize and run
    void init();
    void run();
    void shutdown();

    const AppState* state() const { return state_ ? &*state_ : nullptr; }

private:
    Config config_;
    TerminalDevice device_;
    std::unique_ptr<UIManager> ui_manager_;
    std::optional<AppState> state_;
};

} // namespace gpudash::tui
