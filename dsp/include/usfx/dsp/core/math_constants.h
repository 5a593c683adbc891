// ==============================================================================
// Layer 0: Core Utility - Math Constants
// ==============================================================================
// Centralized mathematical constants for the synthesis pipeline.
// Oscillators, envelopes and shapers import these instead of defining locally.
//
// Constants are inline constexpr so there is a single definition across all
// translation units.
// ==============================================================================

#pragma once

namespace Usfx {
namespace DSP {

// =============================================================================
// Mathematical Constants
// =============================================================================

/// Pi constant, full float precision: 3.14159265358979323846
inline constexpr float kPi = 3.14159265358979323846f;

/// Two times Pi (one full oscillator cycle in radians)
/// Used for sine evaluation: sin(kTwoPi * phase)
inline constexpr float kTwoPi = 2.0f * kPi;

// =============================================================================
// Audio Defaults
// =============================================================================

/// Sample rate used when none (or an invalid one) is supplied
inline constexpr float kDefaultSampleRate = 44100.0f;

} // namespace DSP
} // namespace Usfx
