// ==============================================================================
// Layer 0: Core Utility - Phase Accumulator Utilities
// ==============================================================================
// Phase accumulator and helper functions for the oscillator.
//
// Design decisions:
// - PhaseAccumulator is a value type (struct with public members) for
//   lightweight composition into oscillator classes.
// - Phase and increment use double precision to prevent accumulated rounding
//   error over long playback durations.
// - wrapPhase() uses floor() so that increments >= 1.0 (frequency above the
//   sample rate) still wrap in constant time.
// ==============================================================================

#pragma once

#include <cmath>

namespace Usfx {
namespace DSP {

// =============================================================================
// Phase Utility Functions
// =============================================================================

/// @brief Calculate normalized phase increment from frequency and sample rate.
///
/// @param frequency Oscillator frequency in Hz
/// @param sampleRate Sample rate in Hz
/// @return Normalized phase increment (frequency / sampleRate).
///         Returns 0.0 when either argument is not strictly positive or NaN,
///         so a degenerate oscillator simply stops advancing.
///
/// @example
/// @code
/// double inc = calculatePhaseIncrement(441.0f, 44100.0f);  // 0.01
/// @endcode
[[nodiscard]] constexpr double calculatePhaseIncrement(
    float frequency,
    float sampleRate
) noexcept {
    if (!(sampleRate > 0.0f) || !(frequency > 0.0f)) {
        return 0.0;
    }
    return static_cast<double>(frequency) / static_cast<double>(sampleRate);
}

/// @brief Wrap phase to [0, 1).
///
/// @param phase Phase value to wrap (any finite double value)
/// @return Phase wrapped to [0, 1)
///
/// @example
/// @code
/// double a = wrapPhase(1.3);   // returns 0.3
/// double b = wrapPhase(-0.2);  // returns 0.8
/// @endcode
[[nodiscard]] inline double wrapPhase(double phase) noexcept {
    phase -= std::floor(phase);
    // floor() of values just below an integer can round the result up to 1.0
    return (phase >= 1.0) ? 0.0 : phase;
}

// =============================================================================
// PhaseAccumulator Struct
// =============================================================================

/// @brief Lightweight phase accumulator for oscillator phase management.
///
/// @example
/// @code
/// PhaseAccumulator acc;
/// acc.setFrequency(441.0f, 44100.0f);
/// for (int i = 0; i < numSamples; ++i) {
///     output[i] = 2.0f * static_cast<float>(acc.phase) - 1.0f;
///     (void)acc.advance();
/// }
/// @endcode
struct PhaseAccumulator {
    double phase = 0.0;       ///< Current phase position [0, 1)
    double increment = 0.0;   ///< Phase advance per sample

    /// @brief Advance phase by one sample and wrap if necessary.
    /// @return true if the phase wrapped around (crossed 1.0), false otherwise.
    [[nodiscard]] bool advance() noexcept {
        phase += increment;
        if (phase >= 1.0) {
            phase = wrapPhase(phase);
            return true;
        }
        return false;
    }

    /// @brief Reset phase to 0.0. Preserves increment.
    void reset() noexcept {
        phase = 0.0;
    }

    /// @brief Set the phase increment from frequency and sample rate.
    void setFrequency(float frequency, float sampleRate) noexcept {
        increment = calculatePhaseIncrement(frequency, sampleRate);
    }
};

} // namespace DSP
} // namespace Usfx
