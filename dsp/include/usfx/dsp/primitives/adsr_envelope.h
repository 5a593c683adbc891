// ==============================================================================
// Layer 1: DSP Primitive - ADSR Envelope Generator
// ==============================================================================
// Six-state linear ADSR envelope for fire-and-forget sound effects.
//
// Stage durations are converted to whole sample counts at prepare()/set*()
// time, so every segment is exact: Attack ends at 1.0, Decay ends at the
// sustain level, Release ends at 0.0, independent of floating-point drift.
//
// Stages only move forward: Idle -> Attack -> Decay -> Sustain -> Release
// -> Done. A stage whose duration rounds to zero samples is skipped within
// the same sample, so no segment ever divides by a zero length.
//
// Release modes:
// - OneShot: release starts by itself after `hold` seconds in Sustain.
// - Gated:   Sustain lasts until release() is called.
//
// Real-time safe: noexcept, zero allocations in process().
// Layer 1: depends only on Layer 0.
// ==============================================================================

#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>

#include <usfx/dsp/core/db_utils.h>
#include <usfx/dsp/core/math_constants.h>

namespace Usfx {
namespace DSP {

// =============================================================================
// Compiler Compatibility Macros
// =============================================================================

#ifndef USFX_NOINLINE
#if defined(_MSC_VER)
#define USFX_NOINLINE __declspec(noinline)
#elif defined(__GNUC__) || defined(__clang__)
#define USFX_NOINLINE __attribute__((noinline))
#else
#define USFX_NOINLINE
#endif
#endif

// =============================================================================
// Constants
// =============================================================================

inline constexpr float kMinEnvelopeTimeSeconds = 0.0f;
/// One day per stage. Stage lengths also saturate at kMaxStageSamples.
inline constexpr float kMaxEnvelopeTimeSeconds = 86400.0f;
inline constexpr double kMaxStageSamples = 4294967295.0;

// =============================================================================
// Enumerations
// =============================================================================

enum class ADSRStage : uint8_t {
    Idle = 0,
    Attack,
    Decay,
    Sustain,
    Release,
    Done
};

enum class ReleaseMode : uint8_t {
    OneShot = 0,
    Gated
};

// =============================================================================
// ADSREnvelope Class
// =============================================================================

class ADSREnvelope {
public:
    ADSREnvelope() noexcept = default;
    ~ADSREnvelope() = default;

    ADSREnvelope(const ADSREnvelope&) noexcept = default;
    ADSREnvelope& operator=(const ADSREnvelope&) noexcept = default;
    ADSREnvelope(ADSREnvelope&&) noexcept = default;
    ADSREnvelope& operator=(ADSREnvelope&&) noexcept = default;

    // =========================================================================
    // Initialization
    // =========================================================================

    void prepare(float sampleRate) noexcept {
        if (!(sampleRate > 0.0f)) return;
        sampleRate_ = sampleRate;
        recalcAllLengths();
    }

    void reset() noexcept {
        output_ = 0.0f;
        releaseStartLevel_ = 0.0f;
        position_ = 0;
        stage_ = ADSRStage::Idle;
    }

    // =========================================================================
    // Triggers
    // =========================================================================

    /// @brief Start the envelope. Only valid from Idle; ignored otherwise.
    void trigger() noexcept {
        if (stage_ != ADSRStage::Idle) return;
        output_ = 0.0f;
        enterAttack();
    }

    /// @brief External release trigger.
    ///
    /// From Attack, Decay or Sustain, ramps from the current level to zero
    /// over the release time. Ignored in Idle, Release and Done.
    void release() noexcept {
        if (stage_ == ADSRStage::Attack || stage_ == ADSRStage::Decay ||
            stage_ == ADSRStage::Sustain) {
            enterRelease();
        }
    }

    // =========================================================================
    // Parameter Setters (seconds; sustain is a level)
    // =========================================================================

    USFX_NOINLINE void setAttack(float seconds) noexcept {
        if (detail::isNaN(seconds)) return;
        attackTime_ = std::clamp(seconds, kMinEnvelopeTimeSeconds, kMaxEnvelopeTimeSeconds);
        attackSamples_ = secondsToSamples(attackTime_);
        completeFinishedStages();
    }

    USFX_NOINLINE void setDecay(float seconds) noexcept {
        if (detail::isNaN(seconds)) return;
        decayTime_ = std::clamp(seconds, kMinEnvelopeTimeSeconds, kMaxEnvelopeTimeSeconds);
        decaySamples_ = secondsToSamples(decayTime_);
        completeFinishedStages();
    }

    USFX_NOINLINE void setSustain(float level) noexcept {
        if (detail::isNaN(level)) return;
        sustainLevel_ = std::clamp(level, 0.0f, 1.0f);
    }

    /// @brief Time spent at the sustain level before an automatic release.
    /// @note Only used in ReleaseMode::OneShot.
    USFX_NOINLINE void setHold(float seconds) noexcept {
        if (detail::isNaN(seconds)) return;
        holdTime_ = std::clamp(seconds, kMinEnvelopeTimeSeconds, kMaxEnvelopeTimeSeconds);
        holdSamples_ = secondsToSamples(holdTime_);
        completeFinishedStages();
    }

    USFX_NOINLINE void setRelease(float seconds) noexcept {
        if (detail::isNaN(seconds)) return;
        releaseTime_ = std::clamp(seconds, kMinEnvelopeTimeSeconds, kMaxEnvelopeTimeSeconds);
        releaseSamples_ = secondsToSamples(releaseTime_);
        completeFinishedStages();
    }

    void setReleaseMode(ReleaseMode mode) noexcept {
        releaseMode_ = mode;
        completeFinishedStages();
    }

    // =========================================================================
    // Processing
    // =========================================================================

    /// @brief Return the amplitude for the current sample, then advance.
    /// @return Amplitude multiplier in [0, 1]; 0 in Idle and Done
    [[nodiscard]] float process() noexcept {
        switch (stage_) {
            case ADSRStage::Idle:
            case ADSRStage::Done:
                return 0.0f;

            case ADSRStage::Attack:
                output_ = static_cast<float>(position_) / static_cast<float>(attackSamples_);
                break;

            case ADSRStage::Decay:
                output_ = 1.0f - (1.0f - sustainLevel_) *
                    (static_cast<float>(position_) / static_cast<float>(decaySamples_));
                break;

            case ADSRStage::Sustain:
                output_ = sustainLevel_;
                break;

            case ADSRStage::Release:
                output_ = releaseStartLevel_ *
                    (1.0f - static_cast<float>(position_) / static_cast<float>(releaseSamples_));
                break;
        }

        const float current = output_;
        ++position_;
        completeFinishedStages();
        return current;
    }

    void processBlock(float* output, size_t numSamples) noexcept {
        for (size_t i = 0; i < numSamples; ++i) {
            output[i] = process();
        }
    }

    // =========================================================================
    // State Queries
    // =========================================================================

    [[nodiscard]] ADSRStage getStage() const noexcept { return stage_; }
    [[nodiscard]] bool isActive() const noexcept {
        return stage_ != ADSRStage::Idle && stage_ != ADSRStage::Done;
    }
    [[nodiscard]] bool isReleasing() const noexcept { return stage_ == ADSRStage::Release; }
    [[nodiscard]] bool isDone() const noexcept { return stage_ == ADSRStage::Done; }
    [[nodiscard]] float getOutput() const noexcept { return output_; }
    [[nodiscard]] ReleaseMode getReleaseMode() const noexcept { return releaseMode_; }

    [[nodiscard]] uint32_t getAttackSamples() const noexcept { return attackSamples_; }
    [[nodiscard]] uint32_t getDecaySamples() const noexcept { return decaySamples_; }
    [[nodiscard]] uint32_t getHoldSamples() const noexcept { return holdSamples_; }
    [[nodiscard]] uint32_t getReleaseSamples() const noexcept { return releaseSamples_; }

    /// @brief Number of process() calls from trigger() to Done in OneShot mode.
    [[nodiscard]] uint64_t totalLengthSamples() const noexcept {
        return static_cast<uint64_t>(attackSamples_) + decaySamples_ +
               holdSamples_ + releaseSamples_;
    }

private:
    // =========================================================================
    // Stage Transitions
    // =========================================================================

    /// Leave every stage whose sample count has been reached. Zero-length
    /// stages chain through here within the same call.
    void completeFinishedStages() noexcept {
        switch (stage_) {
            case ADSRStage::Attack:
                if (position_ >= attackSamples_) enterDecay();
                break;
            case ADSRStage::Decay:
                if (position_ >= decaySamples_) enterSustain();
                break;
            case ADSRStage::Sustain:
                if (releaseMode_ == ReleaseMode::OneShot && position_ >= holdSamples_) {
                    enterRelease();
                }
                break;
            case ADSRStage::Release:
                if (position_ >= releaseSamples_) enterDone();
                break;
            case ADSRStage::Idle:
            case ADSRStage::Done:
                break;
        }
    }

    void enterAttack() noexcept {
        stage_ = ADSRStage::Attack;
        position_ = 0;
        completeFinishedStages();
    }

    void enterDecay() noexcept {
        stage_ = ADSRStage::Decay;
        position_ = 0;
        output_ = 1.0f;
        completeFinishedStages();
    }

    void enterSustain() noexcept {
        stage_ = ADSRStage::Sustain;
        position_ = 0;
        output_ = sustainLevel_;
        completeFinishedStages();
    }

    void enterRelease() noexcept {
        stage_ = ADSRStage::Release;
        position_ = 0;
        releaseStartLevel_ = output_;
        completeFinishedStages();
    }

    void enterDone() noexcept {
        stage_ = ADSRStage::Done;
        position_ = 0;
        output_ = 0.0f;
    }

    // =========================================================================
    // Length Calculation
    // =========================================================================

    [[nodiscard]] uint32_t secondsToSamples(float seconds) const noexcept {
        const double samples = std::round(static_cast<double>(seconds) * sampleRate_);
        if (!(samples < kMaxStageSamples)) {
            return static_cast<uint32_t>(kMaxStageSamples);
        }
        return static_cast<uint32_t>(samples);
    }

    void recalcAllLengths() noexcept {
        attackSamples_ = secondsToSamples(attackTime_);
        decaySamples_ = secondsToSamples(decayTime_);
        holdSamples_ = secondsToSamples(holdTime_);
        releaseSamples_ = secondsToSamples(releaseTime_);
        completeFinishedStages();
    }

    // =========================================================================
    // Member Fields
    // =========================================================================

    float sampleRate_ = kDefaultSampleRate;
    float output_ = 0.0f;
    float releaseStartLevel_ = 0.0f;
    ADSRStage stage_ = ADSRStage::Idle;
    ReleaseMode releaseMode_ = ReleaseMode::OneShot;

    float attackTime_ = 0.01f;
    float decayTime_ = 0.1f;
    float sustainLevel_ = 0.5f;
    float holdTime_ = 0.0f;
    float releaseTime_ = 0.5f;

    uint32_t attackSamples_ = 441;
    uint32_t decaySamples_ = 4410;
    uint32_t holdSamples_ = 0;
    uint32_t releaseSamples_ = 22050;

    uint32_t position_ = 0;
};

} // namespace DSP
} // namespace Usfx
