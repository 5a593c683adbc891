// ==============================================================================
// Layer 1: DSP Primitive - Oscillator
// ==============================================================================
// Naive (non band-limited) waveform generator for procedural sound effects:
// Sine, Saw, Triangle, Square (variable duty cycle) and seeded white Noise.
//
// The waveform set is a closed enum dispatched by one switch in
// waveformSample(); there is no virtual dispatch.
//
// Real-time safe: noexcept, zero allocations, value semantics.
// Layer 1: depends only on Layer 0.
// ==============================================================================

#pragma once

#include <usfx/dsp/core/db_utils.h>
#include <usfx/dsp/core/math_constants.h>
#include <usfx/dsp/core/phase_utils.h>
#include <usfx/dsp/core/random.h>

#include <cmath>
#include <cstddef>
#include <cstdint>

namespace Usfx {
namespace DSP {

// =============================================================================
// Enumerations
// =============================================================================

/// @brief Waveform generated by an Oscillator.
enum class OscillatorType : uint8_t {
    Sine = 0,   ///< Continuous pure tone
    Saw,        ///< Strong, buzzing ramp from -1 to +1
    Triangle,   ///< Smooth, between sine and square
    Square,     ///< Rich pulse; width set by DutyCycle
    Noise       ///< White noise; not a function of phase
};

inline constexpr size_t kNumOscillatorTypes = 5;

/// @brief Pulse width of the Square waveform.
enum class DutyCycle : uint8_t {
    Eighth = 0,  ///< 12.5% high
    Quarter,     ///< 25% high
    Third,       ///< 33% high
    Half         ///< 50% high (symmetric square)
};

/// @brief Fraction of the period the Square waveform spends at +1.
[[nodiscard]] constexpr float dutyCycleFraction(DutyCycle duty) noexcept {
    switch (duty) {
        case DutyCycle::Eighth:  return 0.125f;
        case DutyCycle::Quarter: return 0.25f;
        case DutyCycle::Third:   return 0.33f;
        case DutyCycle::Half:    return 0.5f;
    }
    return 0.5f;
}

// =============================================================================
// Waveform Dispatch
// =============================================================================

/// @brief Evaluate one waveform sample.
///
/// | Type     | Output at phase p                            |
/// |----------|----------------------------------------------|
/// | Sine     | sin(2*pi*p)                                  |
/// | Saw      | 2p - 1                                       |
/// | Triangle | 4p - 1 for p < 0.5, 3 - 4p otherwise         |
/// | Square   | +1 for p < duty fraction, -1 otherwise       |
/// | Noise    | next uniform value of @p noise in [-1, 1]    |
///
/// @param type  Waveform to evaluate
/// @param phase Normalized phase in [0, 1)
/// @param duty  Square pulse width (ignored by other types)
/// @param noise Generator consumed by Noise only
/// @return Sample in [-1, 1]
[[nodiscard]] inline float waveformSample(OscillatorType type, double phase,
                                          DutyCycle duty, Pcg32& noise) noexcept {
    const auto p = static_cast<float>(phase);
    switch (type) {
        case OscillatorType::Sine:
            return std::sin(kTwoPi * p);

        case OscillatorType::Saw:
            return 2.0f * p - 1.0f;

        case OscillatorType::Triangle:
            return (p < 0.5f) ? (4.0f * p - 1.0f) : (3.0f - 4.0f * p);

        case OscillatorType::Square:
            return (p < dutyCycleFraction(duty)) ? 1.0f : -1.0f;

        case OscillatorType::Noise:
            return noise.nextFloat();
    }
    return 0.0f;
}

// =============================================================================
// Oscillator Class
// =============================================================================

/// @brief Phase-accumulating oscillator over the waveform set above.
///
/// @par Degenerate frequency
/// A frequency <= 0 (or NaN) makes every periodic type output exactly 0.0 and
/// leaves the phase where it is. Noise keeps producing noise.
///
/// @par Thread Safety
/// Single-threaded model. All methods called from the audio thread.
///
/// @par Usage
/// @code
/// Oscillator osc;
/// osc.prepare(44100.0f);
/// osc.setType(OscillatorType::Triangle);
/// osc.setFrequency(220.0f);
/// for (size_t i = 0; i < numSamples; ++i) {
///     output[i] = osc.process();
/// }
/// @endcode
class Oscillator {
public:
    Oscillator() noexcept = default;
    ~Oscillator() = default;

    Oscillator(const Oscillator&) noexcept = default;
    Oscillator& operator=(const Oscillator&) noexcept = default;
    Oscillator(Oscillator&&) noexcept = default;
    Oscillator& operator=(Oscillator&&) noexcept = default;

    // =========================================================================
    // Configuration
    // =========================================================================

    /// @brief Set the sample rate used to derive the phase increment.
    /// @note Non-positive or NaN sample rates are ignored.
    void prepare(float sampleRate) noexcept {
        if (!(sampleRate > 0.0f)) return;
        sampleRate_ = sampleRate;
        phase_.setFrequency(frequency_, sampleRate_);
    }

    /// @brief Restart at phase 0 and rewind the noise sequence to its seed.
    void reset() noexcept {
        phase_.reset();
        rng_.seed(seed_);
    }

    void setType(OscillatorType type) noexcept { type_ = type; }

    /// @brief Set the frequency in Hz. Negative values clamp to 0, NaN is ignored.
    void setFrequency(float hz) noexcept {
        if (detail::isNaN(hz)) return;
        frequency_ = (hz > 0.0f) ? hz : 0.0f;
        phase_.setFrequency(frequency_, sampleRate_);
    }

    void setDutyCycle(DutyCycle duty) noexcept { duty_ = duty; }

    /// @brief Reseed the noise generator (also rewinds it).
    void setSeed(uint64_t seed) noexcept {
        seed_ = seed;
        rng_.seed(seed_);
    }

    // =========================================================================
    // Processing
    // =========================================================================

    /// @brief Return the sample at the current phase, then advance the phase.
    [[nodiscard]] float process() noexcept {
        float output = 0.0f;
        if (type_ == OscillatorType::Noise || phase_.increment > 0.0) {
            output = waveformSample(type_, phase_.phase, duty_, rng_);
        }
        (void)phase_.advance();
        return output;
    }

    void processBlock(float* output, size_t numSamples) noexcept {
        for (size_t i = 0; i < numSamples; ++i) {
            output[i] = process();
        }
    }

    // =========================================================================
    // State Queries
    // =========================================================================

    [[nodiscard]] OscillatorType getType() const noexcept { return type_; }
    [[nodiscard]] DutyCycle getDutyCycle() const noexcept { return duty_; }
    [[nodiscard]] float getFrequency() const noexcept { return frequency_; }
    [[nodiscard]] double getPhase() const noexcept { return phase_.phase; }
    [[nodiscard]] double getPhaseIncrement() const noexcept { return phase_.increment; }

private:
    float sampleRate_ = kDefaultSampleRate;
    float frequency_ = 0.0f;
    OscillatorType type_ = OscillatorType::Sine;
    DutyCycle duty_ = DutyCycle::Half;
    PhaseAccumulator phase_;
    uint64_t seed_ = 0;
    Pcg32 rng_{0};
};

} // namespace DSP
} // namespace Usfx
