// ==============================================================================
// Serialization - Sample <-> JSON
// ==============================================================================
// Optional persistence layer on top of the plain blueprint types. The DSP
// headers never include a JSON library; this target is only built when
// nlohmann/json is available.
//
// JSON layout (every key optional on input, missing keys keep defaults):
//
//   {
//     "osc_type": "square",       "osc_frequency": 440.0,
//     "osc_duty_cycle": "quarter","volume": 0.8,
//     "env_attack": 0.01,         "env_decay": 0.1,
//     "env_sustain": 0.5,         "env_hold": 0.0,
//     "env_release": 0.5,
//     "dis_crunch": 0.0,          "dis_drive": 0.0
//   }
//
// Values pass through the Sample setters, so out-of-range numbers are
// clamped exactly as they would be in code.
// ==============================================================================

#pragma once

#include <usfx/dsp/primitives/oscillator.h>
#include <usfx/dsp/systems/sample.h>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace Usfx {
namespace DSP {

// =============================================================================
// Enum Names
// =============================================================================

/// @brief Lower-case JSON name of an oscillator type ("sine", "saw", ...).
[[nodiscard]] const char* oscillatorTypeName(OscillatorType type) noexcept;

/// @brief Parse an oscillator type name; empty when unknown.
[[nodiscard]] std::optional<OscillatorType> oscillatorTypeFromName(std::string_view name) noexcept;

/// @brief Lower-case JSON name of a duty cycle ("eighth", "quarter", ...).
[[nodiscard]] const char* dutyCycleName(DutyCycle duty) noexcept;

/// @brief Parse a duty cycle name; empty when unknown.
[[nodiscard]] std::optional<DutyCycle> dutyCycleFromName(std::string_view name) noexcept;

// =============================================================================
// nlohmann ADL Hooks
// =============================================================================
// from_json throws nlohmann::json::exception for wrong JSON types and
// std::invalid_argument for unknown enum names.

void to_json(nlohmann::json& j, OscillatorType type);
void from_json(const nlohmann::json& j, OscillatorType& type);

void to_json(nlohmann::json& j, DutyCycle duty);
void from_json(const nlohmann::json& j, DutyCycle& duty);

void to_json(nlohmann::json& j, const Sample& sample);
void from_json(const nlohmann::json& j, Sample& sample);

// =============================================================================
// Non-throwing Helpers
// =============================================================================
// Failures are reported on stderr and signalled through the return value.

/// @brief Parse a blueprint from JSON text.
[[nodiscard]] std::optional<Sample> sampleFromJsonText(std::string_view text);

/// @brief Serialize a blueprint to JSON text.
/// @param indent Pretty-print indent; negative for compact output
[[nodiscard]] std::string sampleToJsonText(const Sample& sample, int indent = 2);

/// @brief Load a blueprint from a JSON file.
[[nodiscard]] std::optional<Sample> loadSampleFile(const std::string& path);

/// @brief Save a blueprint to a JSON file (pretty-printed).
/// @return true if the file was written
[[nodiscard]] bool saveSampleFile(const std::string& path, const Sample& sample);

} // namespace DSP
} // namespace Usfx
