// ==============================================================================
// Serialization - Sample <-> JSON Implementation
// ==============================================================================

#include "sample_json.h"

#include <array>
#include <cstdio>
#include <exception>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace Usfx {
namespace DSP {

namespace {

constexpr std::array<std::pair<OscillatorType, const char*>, kNumOscillatorTypes> kOscillatorNames{{
    {OscillatorType::Sine, "sine"},
    {OscillatorType::Saw, "saw"},
    {OscillatorType::Triangle, "triangle"},
    {OscillatorType::Square, "square"},
    {OscillatorType::Noise, "noise"},
}};

constexpr std::array<std::pair<DutyCycle, const char*>, 4> kDutyCycleNames{{
    {DutyCycle::Eighth, "eighth"},
    {DutyCycle::Quarter, "quarter"},
    {DutyCycle::Third, "third"},
    {DutyCycle::Half, "half"},
}};

/// Apply an optional numeric field through a Sample setter.
template <typename Setter>
void readFloat(const nlohmann::json& j, const char* key, Sample& sample, Setter setter) {
    const auto it = j.find(key);
    if (it != j.end()) {
        (sample.*setter)(it->get<float>());
    }
}

} // anonymous namespace

// =============================================================================
// Enum Names
// =============================================================================

const char* oscillatorTypeName(OscillatorType type) noexcept {
    for (const auto& [value, name] : kOscillatorNames) {
        if (value == type) return name;
    }
    return "sine";
}

std::optional<OscillatorType> oscillatorTypeFromName(std::string_view name) noexcept {
    for (const auto& [value, entry] : kOscillatorNames) {
        if (name == entry) return value;
    }
    return std::nullopt;
}

const char* dutyCycleName(DutyCycle duty) noexcept {
    for (const auto& [value, name] : kDutyCycleNames) {
        if (value == duty) return name;
    }
    return "half";
}

std::optional<DutyCycle> dutyCycleFromName(std::string_view name) noexcept {
    for (const auto& [value, entry] : kDutyCycleNames) {
        if (name == entry) return value;
    }
    return std::nullopt;
}

// =============================================================================
// nlohmann ADL Hooks
// =============================================================================

void to_json(nlohmann::json& j, OscillatorType type) {
    j = oscillatorTypeName(type);
}

void from_json(const nlohmann::json& j, OscillatorType& type) {
    const auto name = j.get<std::string>();
    const auto parsed = oscillatorTypeFromName(name);
    if (!parsed) {
        throw std::invalid_argument("unknown oscillator type '" + name + "'");
    }
    type = *parsed;
}

void to_json(nlohmann::json& j, DutyCycle duty) {
    j = dutyCycleName(duty);
}

void from_json(const nlohmann::json& j, DutyCycle& duty) {
    const auto name = j.get<std::string>();
    const auto parsed = dutyCycleFromName(name);
    if (!parsed) {
        throw std::invalid_argument("unknown duty cycle '" + name + "'");
    }
    duty = *parsed;
}

void to_json(nlohmann::json& j, const Sample& sample) {
    j = nlohmann::json{
        {"osc_type", sample.getOscType()},
        {"osc_frequency", sample.getOscFrequency()},
        {"osc_duty_cycle", sample.getOscDutyCycle()},
        {"volume", sample.getVolume()},
        {"env_attack", sample.getEnvAttack()},
        {"env_decay", sample.getEnvDecay()},
        {"env_sustain", sample.getEnvSustain()},
        {"env_hold", sample.getEnvHold()},
        {"env_release", sample.getEnvRelease()},
        {"dis_crunch", sample.getDisCrunch()},
        {"dis_drive", sample.getDisDrive()},
    };
}

void from_json(const nlohmann::json& j, Sample& sample) {
    if (!j.is_object()) {
        throw std::invalid_argument("sample must be a JSON object");
    }

    if (const auto it = j.find("osc_type"); it != j.end()) {
        sample.setOscType(it->get<OscillatorType>());
    }
    if (const auto it = j.find("osc_duty_cycle"); it != j.end()) {
        sample.setOscDutyCycle(it->get<DutyCycle>());
    }

    readFloat(j, "osc_frequency", sample, &Sample::setOscFrequency);
    readFloat(j, "volume", sample, &Sample::setVolume);
    readFloat(j, "env_attack", sample, &Sample::setEnvAttack);
    readFloat(j, "env_decay", sample, &Sample::setEnvDecay);
    readFloat(j, "env_sustain", sample, &Sample::setEnvSustain);
    readFloat(j, "env_hold", sample, &Sample::setEnvHold);
    readFloat(j, "env_release", sample, &Sample::setEnvRelease);
    readFloat(j, "dis_crunch", sample, &Sample::setDisCrunch);
    readFloat(j, "dis_drive", sample, &Sample::setDisDrive);
}

// =============================================================================
// Non-throwing Helpers
// =============================================================================

std::optional<Sample> sampleFromJsonText(std::string_view text) {
    try {
        const auto j = nlohmann::json::parse(text.begin(), text.end());
        return j.get<Sample>();
    } catch (const std::exception& e) {
        std::fprintf(stderr, "usfx: invalid sample JSON: %s\n", e.what());
        return std::nullopt;
    }
}

std::string sampleToJsonText(const Sample& sample, int indent) {
    const nlohmann::json j = sample;
    return j.dump(indent);
}

std::optional<Sample> loadSampleFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::fprintf(stderr, "usfx: cannot open '%s' for reading\n", path.c_str());
        return std::nullopt;
    }

    try {
        nlohmann::json j;
        file >> j;
        return j.get<Sample>();
    } catch (const std::exception& e) {
        std::fprintf(stderr, "usfx: error loading '%s': %s\n", path.c_str(), e.what());
        return std::nullopt;
    }
}

bool saveSampleFile(const std::string& path, const Sample& sample) {
    std::ofstream file(path);
    if (!file.is_open()) {
        std::fprintf(stderr, "usfx: cannot open '%s' for writing\n", path.c_str());
        return false;
    }

    file << sampleToJsonText(sample, 2) << '\n';
    if (!file) {
        std::fprintf(stderr, "usfx: error writing '%s'\n", path.c_str());
        return false;
    }
    return true;
}

} // namespace DSP
} // namespace Usfx
