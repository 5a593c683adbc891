// ==============================================================================
// Layer 3: System Component - Sample (sound-effect blueprint)
// ==============================================================================
// Declarative description of one sound effect: oscillator, envelope,
// distortion and volume. A Sample is a plain value: Mixer::play() copies it
// into a new Voice, so one blueprint can be replayed any number of times
// concurrently and later edits never reach voices that are already playing.
//
// Every setter sanitizes its input (clamp to the documented range, NaN is
// ignored and keeps the previous value), so nothing downstream needs a
// failure path.
// ==============================================================================

#pragma once

#include <usfx/dsp/core/db_utils.h>
#include <usfx/dsp/primitives/adsr_envelope.h>
#include <usfx/dsp/primitives/distortion.h>
#include <usfx/dsp/primitives/oscillator.h>

#include <type_traits>

namespace Usfx {
namespace DSP {

/// Highest accepted oscillator frequency in Hz (four times Nyquist at 44.1 kHz).
inline constexpr float kMaxOscillatorFrequency = 88200.0f;

/// @brief Sound-effect blueprint.
///
/// | Parameter      | Default | Range             |
/// |----------------|---------|-------------------|
/// | oscType        | Sine    | OscillatorType    |
/// | oscFrequency   | 441 Hz  | [0, 88200]        |
/// | oscDutyCycle   | Half    | DutyCycle         |
/// | volume         | 1.0     | [0, 1]            |
/// | envAttack      | 0.01 s  | [0, 86400]        |
/// | envDecay       | 0.1 s   | [0, 86400]        |
/// | envSustain     | 0.5     | [0, 1] (level)    |
/// | envHold        | 0.0 s   | [0, 86400]        |
/// | envRelease     | 0.5 s   | [0, 86400]        |
/// | disCrunch      | 0.0     | [0, 100]          |
/// | disDrive       | 0.0     | [0, 100]          |
///
/// With the defaults the distortion is an identity, so an unconfigured
/// blueprint plays a short plain sine blip.
///
/// For OscillatorType::Noise the integer part of the frequency seeds the
/// noise generator.
///
/// @par Usage
/// @code
/// Sample laser;
/// laser.setOscType(OscillatorType::Saw);
/// laser.setOscFrequency(880.0f);
/// laser.setEnvAttack(0.0f);
/// laser.setEnvRelease(0.2f);
/// laser.setDisCrunch(2.0f);
/// mixer.play(laser);
/// @endcode
class Sample {
public:
    // =========================================================================
    // Oscillator
    // =========================================================================

    void setOscType(OscillatorType type) noexcept { oscType_ = type; }

    void setOscFrequency(float hz) noexcept {
        if (detail::isNaN(hz)) return;
        oscFrequency_ = clampParameter(hz, 0.0f, kMaxOscillatorFrequency);
    }

    void setOscDutyCycle(DutyCycle duty) noexcept { oscDutyCycle_ = duty; }

    // =========================================================================
    // Volume
    // =========================================================================

    void setVolume(float volume) noexcept {
        if (detail::isNaN(volume)) return;
        volume_ = clampParameter(volume, 0.0f, 1.0f);
    }

    // =========================================================================
    // Envelope (seconds; sustain is a level)
    // =========================================================================

    void setEnvAttack(float seconds) noexcept { setTime(envAttack_, seconds); }
    void setEnvDecay(float seconds) noexcept { setTime(envDecay_, seconds); }
    void setEnvHold(float seconds) noexcept { setTime(envHold_, seconds); }
    void setEnvRelease(float seconds) noexcept { setTime(envRelease_, seconds); }

    void setEnvSustain(float level) noexcept {
        if (detail::isNaN(level)) return;
        envSustain_ = clampParameter(level, 0.0f, 1.0f);
    }

    // =========================================================================
    // Distortion
    // =========================================================================

    void setDisCrunch(float crunch) noexcept {
        if (detail::isNaN(crunch)) return;
        disCrunch_ = clampParameter(crunch, 0.0f, kMaxCrunch);
    }

    void setDisDrive(float drive) noexcept {
        if (detail::isNaN(drive)) return;
        disDrive_ = clampParameter(drive, 0.0f, kMaxDrive);
    }

    // =========================================================================
    // Getters
    // =========================================================================

    [[nodiscard]] OscillatorType getOscType() const noexcept { return oscType_; }
    [[nodiscard]] float getOscFrequency() const noexcept { return oscFrequency_; }
    [[nodiscard]] DutyCycle getOscDutyCycle() const noexcept { return oscDutyCycle_; }
    [[nodiscard]] float getVolume() const noexcept { return volume_; }
    [[nodiscard]] float getEnvAttack() const noexcept { return envAttack_; }
    [[nodiscard]] float getEnvDecay() const noexcept { return envDecay_; }
    [[nodiscard]] float getEnvSustain() const noexcept { return envSustain_; }
    [[nodiscard]] float getEnvHold() const noexcept { return envHold_; }
    [[nodiscard]] float getEnvRelease() const noexcept { return envRelease_; }
    [[nodiscard]] float getDisCrunch() const noexcept { return disCrunch_; }
    [[nodiscard]] float getDisDrive() const noexcept { return disDrive_; }

    /// @brief Total duration from play() to silence, in seconds.
    [[nodiscard]] float getDuration() const noexcept {
        return envAttack_ + envDecay_ + envHold_ + envRelease_;
    }

    bool operator==(const Sample&) const noexcept = default;

private:
    static void setTime(float& target, float seconds) noexcept {
        if (detail::isNaN(seconds)) return;
        target = clampParameter(seconds, kMinEnvelopeTimeSeconds, kMaxEnvelopeTimeSeconds);
    }

    OscillatorType oscType_ = OscillatorType::Sine;
    float oscFrequency_ = 441.0f;
    DutyCycle oscDutyCycle_ = DutyCycle::Half;
    float volume_ = 1.0f;

    float envAttack_ = 0.01f;
    float envDecay_ = 0.1f;
    float envSustain_ = 0.5f;
    float envHold_ = 0.0f;
    float envRelease_ = 0.5f;

    float disCrunch_ = 0.0f;
    float disDrive_ = 0.0f;
};

static_assert(std::is_trivially_copyable_v<Sample>,
              "Sample must stay a plain value so it can cross threads by copy");

} // namespace DSP
} // namespace Usfx
