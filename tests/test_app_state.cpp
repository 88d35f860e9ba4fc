#include "app_state.hpp"
#include <gtest/gtest.h>
#include <ncurses.h>
#include <initializer_list>

namespace gpudash::tui {
namespace {

TEST(AppStateTest, StartsRunningWithNothingSampled) {
    AppState state(MockSampler{});
    EXPECT_TRUE(state.running());
    EXPECT_EQ(state.tick(), 0u);
    EXPECT_TRUE(state.metrics().empty());
}

TEST(AppStateTest, StartForcesFirstTick) {
    auto state = AppState::start(MockSampler{});
    EXPECT_TRUE(state.running());
    EXPECT_EQ(state.tick(), 1u);
    EXPECT_EQ(state.metrics().size(), 1u);
}

TEST(AppStateTest, TickIncrementsByOneAndKeepsRunning) {
    AppState state(MockSampler{});
    for (uint64_t i = 1; i <= 5; ++i) {
        state.on_tick();
        EXPECT_EQ(state.tick(), i);
        EXPECT_TRUE(state.running());
    }
}

TEST(AppStateTest, TickReplacesMetricsEntirely) {
    std::vector<std::vector<MetricSample>> frames(2);
    frames[0] = {MetricSample{.name = "old-0"}, MetricSample{.name = "old-1"}};
    frames[1] = {MetricSample{.name = "new"}};
    AppState state(ScriptedSampler(std::move(frames)));

    state.on_tick();
    ASSERT_EQ(state.metrics().size(), 2u);

    state.on_tick();
    ASSERT_EQ(state.metrics().size(), 1u);
    EXPECT_EQ(state.metrics()[0].name, "new");
}

TEST(AppStateTest, SamplesCurrentCounterBeforeIncrement) {
    std::vector<std::vector<MetricSample>> frames(3);
    frames[0] = {MetricSample{.name = "counter-0"}};
    frames[1] = {MetricSample{.name = "counter-1"}};
    frames[2] = {MetricSample{.name = "counter-2"}};
    AppState state(ScriptedSampler(std::move(frames)));

    state.on_tick();
    EXPECT_EQ(state.metrics()[0].name, "counter-0");
    EXPECT_EQ(state.tick(), 1u);

    state.on_tick();
    EXPECT_EQ(state.metrics()[0].name, "counter-1");
    EXPECT_EQ(state.tick(), 2u);
}

TEST(AppStateTest, QuitKeysStop) {
    {
        AppState state(MockSampler{});
        state.on_key('q');
        EXPECT_FALSE(state.running());
        EXPECT_EQ(state.run_state(), RunState::STOPPED);
    }
    {
        AppState state(MockSampler{});
        state.on_key(kEscapeKey);
        EXPECT_FALSE(state.running());
    }
}

TEST(AppStateTest, OtherKeysAreIgnored) {
    AppState state(MockSampler{});
    for (int key : std::initializer_list<int>{'Q', 'a', ' ', '\n', '\t', KEY_UP, KEY_F(1), KEY_BACKSPACE}) {
        state.on_key(key);
        EXPECT_TRUE(state.running()) << key;
    }
    EXPECT_EQ(state.tick(), 0u);
}

TEST(AppStateTest, StoppedIsTerminal) {
    auto state = AppState::start(MockSampler{});
    state.on_key('q');
    ASSERT_FALSE(state.running());

    state.on_tick();
    EXPECT_EQ(state.tick(), 1u);

    state.on_key('a');
    state.on_key('q');
    EXPECT_FALSE(state.running());
}

TEST(AppStateTest, RunStateNames) {
    EXPECT_EQ(AppState::run_state_to_string(RunState::RUNNING), "RUNNING");
    EXPECT_EQ(AppState::run_state_to_string(RunState::STOPPED), "STOPPED");
}

} // namespace
} // namespace gpudash::tui
