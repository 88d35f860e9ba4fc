#include "sampler.hpp"
#include "utils/logger.hpp"
#include <format>
#include <cmath>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <type_traits>

namespace gpudash::tui {

namespace {

template <typename T>
std::optional<T> optional_field(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return std::nullopt;
    }

    if constexpr (std::is_floating_point_v<T>) {
        if (!it->is_number()) {
            throw std::runtime_error(std::format("field '{}' must be a number", key));
        }
        // Narrowing an out-of-range double to float is undefined
        const double value = it->get<double>();
        if (!std::isfinite(value) || std::fabs(value) > std::numeric_limits<T>::max()) {
            throw std::runtime_error(std::format("field '{}' out of range", key));
        }
        return static_cast<T>(value);
    } else {
        if (!it->is_number_unsigned()) {
            throw std::runtime_error(
                std::format("field '{}' must be a non-negative integer", key));
        }
        const uint64_t value = it->get<uint64_t>();
        if (value > std::numeric_limits<T>::max()) {
            throw std::runtime_error(std::format("field '{}' out of range", key));
        }
        return static_cast<T>(value);
    }
}

MetricSample parse_sample(const json& obj) {
    if (!obj.is_object()) {
        throw std::runtime_error("sample must be an object");
    }

    auto name = obj.find("name");
    if (name == obj.end() || !name->is_string() || name->get<std::string>().empty()) {
        throw std::runtime_error("sample requires a non-empty 'name'");
    }

    return MetricSample{
        .name = name->get<std::string>(),
        .temperature_c = optional_field<float>(obj, "temperature_c"),
        .junction_temp_c = optional_field<float>(obj, "junction_temp_c"),
        .mem_temp_c = optional_field<float>(obj, "mem_temp_c"),
        .utilization_pct = optional_field<float>(obj, "utilization_pct"),
        .vram_used_mb = optional_field<uint64_t>(obj, "vram_used_mb"),
        .vram_total_mb = optional_field<uint64_t>(obj, "vram_total_mb"),
        .power_w = optional_field<float>(obj, "power_w"),
        .fan_rpm = optional_field<uint32_t>(obj, "fan_rpm"),
        .core_clock_mhz = optional_field<uint32_t>(obj, "core_clock_mhz"),
        .mem_clock_mhz = optional_field<uint32_t>(obj, "mem_clock_mhz"),
        .timestamp = {}
    };
}

} // namespace

// ==================================================================
// MockSampler
// ==================================================================

MockSampler::MockSampler(size_t device_count)
    : device_count_(device_count == 0 ? 1 : device_count) {
}

std::vector<MetricSample> MockSampler::sample(uint64_t counter) const {
    const auto now = std::chrono::system_clock::now();

    std::vector<MetricSample> samples;
    samples.reserve(device_count_);

    for (size_t i = 0; i < device_count_; ++i) {
        // Offset each device so they don't move in lockstep
        const uint64_t c = counter + i * 3;
        const float temp = 45.0f + static_cast<float>(c % 10);

        samples.push_back(MetricSample{
            .name = std::format("Mock GPU {}", i),
            .temperature_c = temp,
            .junction_temp_c = temp + 10.0f,
            .mem_temp_c = temp + 6.0f,
            .utilization_pct = static_cast<float>((c * 7) % 100),
            .vram_used_mb = 1200 + (c * 37) % 800,
            .vram_total_mb = 16384,
            .power_w = 120.0f + static_cast<float>((c * 13) % 100),
            .fan_rpm = static_cast<uint32_t>(1000 + (c * 50) % 1500),
            .core_clock_mhz = static_cast<uint32_t>(1500 + (c * 10) % 500),
            .mem_clock_mhz = 1000,
            .timestamp = now
        });
    }

    return samples;
}

// ==================================================================
// ScriptedSampler
// ==================================================================

ScriptedSampler::ScriptedSampler(std::vector<std::vector<MetricSample>> frames)
    : frames_(std::move(frames)) {
}

std::vector<MetricSample> ScriptedSampler::sample(uint64_t counter) const {
    if (frames_.empty()) {
        return {};
    }

    auto frame = frames_[counter % frames_.size()];
    const auto now = std::chrono::system_clock::now();
    for (auto& s : frame) {
        s.timestamp = now;
    }
    return frame;
}

ScriptedSampler ScriptedSampler::from_json(const json& doc) {
    const json* frames = &doc;
    if (doc.is_object()) {
        auto it = doc.find("frames");
        if (it == doc.end()) {
            throw std::runtime_error("replay document has no 'frames' array");
        }
        frames = &*it;
    }

    if (!frames->is_array()) {
        throw std::runtime_error("'frames' must be an array");
    }

    std::vector<std::vector<MetricSample>> parsed;
    parsed.reserve(frames->size());

    for (size_t f = 0; f < frames->size(); ++f) {
        const auto& frame = (*frames)[f];
        if (!frame.is_array()) {
            throw std::runtime_error(std::format("frame {} must be an array of samples", f));
        }

        std::vector<MetricSample> samples;
        for (const auto& obj : frame) {
            try {
                samples.push_back(parse_sample(obj));
            } catch (const std::runtime_error& e) {
                throw std::runtime_error(std::format("frame {}: {}", f, e.what()));
            }
        }
        parsed.push_back(std::move(samples));
    }

    return ScriptedSampler(std::move(parsed));
}

ScriptedSampler ScriptedSampler::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open replay file: " + path);
    }

    json doc;
    try {
        doc = json::parse(in);
    } catch (const json::exception& e) {
        throw std::runtime_error(std::format("Invalid JSON in {}: {}", path, e.what()));
    }

    try {
        auto sampler = from_json(doc);
        LOG_INFO("ScriptedSampler", std::format("Loaded {} frames from {}",
                 sampler.frame_count(), path));
        return sampler;
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(std::format("Invalid replay file {}: {}", path, e.what()));
    }
}

// ==================================================================
// Sampler variant
// ==================================================================

std::vector<MetricSample> sample(const Sampler& sampler, uint64_t counter) {
    return std::visit([counter](const auto& s) { return s.sample(counter); }, sampler);
}

std::string data_note(const Sampler& sampler) {
    if (std::holds_alternative<MockSampler>(sampler)) {
        return "simulated data";
    }
    return "replayed data";
}

std::string sampler_name(const Sampler& sampler) {
    if (const auto* mock = std::get_if<MockSampler>(&sampler)) {
        return std::format("mock ({} devices)", mock->device_count());
    }
    return std::format("replay ({} frames)", std::get<ScriptedSampler>(sampler).frame_count());
}

} // namespace gpudash::tui
