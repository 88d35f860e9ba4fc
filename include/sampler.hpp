#pragma once

#include "metric_sample.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace gpudash::tui {

using json = nlohmann::json;

/**
 * Synthetic backend. Every reading is derived from the tick counter with
 * periodic arithmetic, so the same counter always yields the same values
 * (apart from the timestamp).
 */
class MockSampler {
public:
    explicit MockSampler(size_t device_count = 1);

    std::vector<MetricSample> sample(uint64_t counter) const;

    size_t device_count() const { return device_count_; }

private:
    size_t device_count_;
};

/**
 * Replays a fixed list of frames. Frame i is returned for every counter
 * with counter % frames == i.
 */
class ScriptedSampler {
public:
    ScriptedSampler() = default;
    explicit ScriptedSampler(std::vector<std::vector<MetricSample>> frames);

    std::vector<MetricSample> sample(uint64_t counter) const;

    size_t frame_count() const { return frames_.size(); }

    // Accepts either {"frames": [[...], ...]} or a bare array of frames.
    // Throws std::runtime_error on malformed input.
    static ScriptedSampler from_json(const json& doc);
    static ScriptedSampler load_file(const std::string& path);

private:
    std::vector<std::vector<MetricSample>> frames_;
};

using Sampler = std::variant<MockSampler, ScriptedSampler>;

// Backend-agnostic entry point used by the loop
std::vector<MetricSample> sample(const Sampler& sampler, uint64_t counter);

// Footer annotation describing where the data comes from; empty for real hardware
std::string data_note(const Sampler& sampler);

std::string sampler_name(const Sampler& sampler);

} // namespace gpudash::tui
