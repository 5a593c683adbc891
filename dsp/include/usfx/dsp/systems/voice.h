// ==============================================================================
// Layer 3: System Component - Voice
// ==============================================================================
// One playing instance of a Sample blueprint.
//
// Per-sample signal flow:
//   Oscillator -> Distortion -> x Envelope -> x Volume
//
// A Voice owns all of its mutable state (phase, noise generator, envelope
// position) plus a copy of the blueprint parameters it still needs. It is
// created by Mixer::play() and owned exclusively by the Mixer.
//
// Real-time safe: noexcept, zero allocations.
// ==============================================================================

#pragma once

#include <usfx/dsp/core/db_utils.h>
#include <usfx/dsp/primitives/adsr_envelope.h>
#include <usfx/dsp/primitives/distortion.h>
#include <usfx/dsp/primitives/oscillator.h>
#include <usfx/dsp/systems/sample.h>

#include <cstddef>
#include <cstdint>

namespace Usfx {
namespace DSP {

class Voice {
public:
    /// @brief Instantiate a voice from a blueprint; starts at phase 0 with
    ///        the envelope triggered.
    Voice(const Sample& sample, float sampleRate) noexcept
        : volume_(sample.getVolume())
    {
        oscillator_.prepare(sampleRate);
        oscillator_.setType(sample.getOscType());
        oscillator_.setFrequency(sample.getOscFrequency());
        oscillator_.setDutyCycle(sample.getOscDutyCycle());
        oscillator_.setSeed(static_cast<uint64_t>(sample.getOscFrequency()));

        distortion_.setCrunch(sample.getDisCrunch());
        distortion_.setDrive(sample.getDisDrive());

        envelope_.prepare(sampleRate);
        envelope_.setAttack(sample.getEnvAttack());
        envelope_.setDecay(sample.getEnvDecay());
        envelope_.setSustain(sample.getEnvSustain());
        envelope_.setHold(sample.getEnvHold());
        envelope_.setRelease(sample.getEnvRelease());
        envelope_.trigger();
    }

    // =========================================================================
    // Processing
    // =========================================================================

    /// @brief Generate one output sample and advance all internal state.
    [[nodiscard]] float process() noexcept {
        if (envelope_.isDone()) {
            return 0.0f;
        }
        const float raw = oscillator_.process();
        const float shaped = distortion_.process(raw);
        const float amplitude = envelope_.process();
        return shaped * amplitude * volume_;
    }

    /// @brief Add this voice's next @p numSamples samples into @p output.
    ///
    /// Stops early once the envelope is Done; the rest of the buffer is left
    /// untouched.
    void processBlock(float* output, size_t numSamples) noexcept {
        for (size_t i = 0; i < numSamples && !envelope_.isDone(); ++i) {
            output[i] += flushNonFinite(process());
        }
    }

    // =========================================================================
    // State Queries
    // =========================================================================

    [[nodiscard]] bool isFinished() const noexcept { return envelope_.isDone(); }
    [[nodiscard]] ADSRStage getStage() const noexcept { return envelope_.getStage(); }
    [[nodiscard]] double getPhase() const noexcept { return oscillator_.getPhase(); }
    [[nodiscard]] float getVolume() const noexcept { return volume_; }
    [[nodiscard]] const ADSREnvelope& getEnvelope() const noexcept { return envelope_; }

private:
    Oscillator oscillator_;
    Distortion distortion_;
    ADSREnvelope envelope_;
    float volume_ = 1.0f;
};

} // namespace DSP
} // namespace Usfx
