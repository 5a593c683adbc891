// ==============================================================================
// Layer 1: DSP Primitive - Distortion
// ==============================================================================
// Stateless crunch/drive waveshaper applied to each generated sample.
//
// Algorithm:
// 1. Drive: pre-gain of (1 + drive)
// 2. Crunch: steepness-normalized tanh curve, tanh(k*x) / tanh(k) with
//    k = crunch. Small crunch is near-linear, large crunch approaches a
//    square wave.
// 3. Hard clip to [-1, 1]
//
// crunch = drive = 0 skips the curve entirely and is an exact identity for
// inputs in [-1, 1].
//
// Real-time safe: noexcept, zero allocations, no state.
// Layer 1: depends only on Layer 0.
// ==============================================================================

#pragma once

#include <usfx/dsp/core/db_utils.h>
#include <usfx/dsp/core/sigmoid.h>

#include <cstddef>

namespace Usfx {
namespace DSP {

// =============================================================================
// Constants
// =============================================================================

inline constexpr float kMaxCrunch = 100.0f;
inline constexpr float kMaxDrive = 100.0f;

/// Below this steepness the tanh curve is indistinguishable from a straight
/// line and tanh(k) approaches zero, so the curve is bypassed.
inline constexpr float kMinCrunchSteepness = 1e-4f;

// =============================================================================
// Distortion Function
// =============================================================================

/// @brief Apply crunch/drive waveshaping to one sample.
///
/// @param sample Input sample (normally in [-1, 1])
/// @param crunch Curve steepness >= 0 (NaN/negative treated as 0, capped at kMaxCrunch)
/// @param drive  Pre-gain amount >= 0 (NaN/negative treated as 0, capped at kMaxDrive)
/// @return Shaped sample, always in [-1, 1]; NaN input returns 0
///
/// @example
/// @code
/// float clean = distort(0.5f, 0.0f, 0.0f);  // 0.5 (identity)
/// float hot   = distort(0.5f, 4.0f, 3.0f);  // ~1.0 (saturated)
/// @endcode
[[nodiscard]] constexpr float distort(float sample, float crunch, float drive) noexcept {
    if (detail::isNaN(sample)) {
        return 0.0f;
    }

    const float safeCrunch = clampParameter(crunch, 0.0f, kMaxCrunch);
    const float safeDrive = clampParameter(drive, 0.0f, kMaxDrive);

    float shaped = sample * (1.0f + safeDrive);
    if (safeCrunch > kMinCrunchSteepness) {
        shaped = Sigmoid::tanhNormalized(shaped, safeCrunch);
    }
    return Sigmoid::hardClip(shaped);
}

// =============================================================================
// Distortion Class
// =============================================================================

/// @brief Distortion stage holding its crunch/drive parameters.
///
/// @par Usage
/// @code
/// Distortion dist;
/// dist.setCrunch(2.0f);
/// dist.setDrive(0.5f);
/// dist.processBlock(buffer, numSamples);
/// @endcode
class Distortion {
public:
    Distortion() noexcept = default;

    void setCrunch(float crunch) noexcept {
        if (detail::isNaN(crunch)) return;
        crunch_ = clampParameter(crunch, 0.0f, kMaxCrunch);
    }

    void setDrive(float drive) noexcept {
        if (detail::isNaN(drive)) return;
        drive_ = clampParameter(drive, 0.0f, kMaxDrive);
    }

    [[nodiscard]] float getCrunch() const noexcept { return crunch_; }
    [[nodiscard]] float getDrive() const noexcept { return drive_; }

    /// @brief True when the stage leaves [-1, 1] input untouched.
    [[nodiscard]] bool isIdentity() const noexcept {
        return crunch_ <= kMinCrunchSteepness && drive_ == 0.0f;
    }

    [[nodiscard]] float process(float sample) const noexcept {
        return distort(sample, crunch_, drive_);
    }

    /// @brief Shape a buffer in place.
    void processBlock(float* buffer, size_t numSamples) const noexcept {
        for (size_t i = 0; i < numSamples; ++i) {
            buffer[i] = distort(buffer[i], crunch_, drive_);
        }
    }

private:
    float crunch_ = 0.0f;
    float drive_ = 0.0f;
};

} // namespace DSP
} // namespace Usfx
