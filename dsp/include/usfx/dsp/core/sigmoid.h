// ==============================================================================
// Layer 0: Core Utility - Sigmoid Transfer Functions
// ==============================================================================
// Soft- and hard-clipping transfer functions shared by the distortion stage
// and the mixer output clip. All functions here are point-symmetric around
// the origin, f(-x) = -f(x), so they only add odd harmonics.
//
// Real-time safe: noexcept, no allocations.
// ==============================================================================

#pragma once

#include <algorithm>

#include <usfx/dsp/core/db_utils.h>
#include <usfx/dsp/core/fast_math.h>

namespace Usfx {
namespace DSP {
namespace Sigmoid {

// -----------------------------------------------------------------------------
// tanh - Hyperbolic Tangent
// -----------------------------------------------------------------------------

/// @brief Fast hyperbolic tangent for saturation/waveshaping.
///
/// Wraps FastMath::fastTanh() (Padé (5,4) approximant).
///
/// @param x Input value (unbounded)
/// @return Saturated output in range [-1, 1]
///
/// @note NaN propagates, +/-Inf returns +/-1
[[nodiscard]] constexpr float tanh(float x) noexcept {
    return FastMath::fastTanh(x);
}

/// @brief Steepness-normalized tanh: tanh(k * x) / tanh(k).
///
/// Maps +/-1 to exactly +/-1 for every steepness, so the curve only changes
/// shape inside the unit range. Small k is near-linear, large k approaches
/// a square (sign) function.
///
/// @param x Input value
/// @param steepness Curve steepness k, must be > 0
/// @return Shaped value; |x| <= 1 gives a result in [-1, 1]
[[nodiscard]] constexpr float tanhNormalized(float x, float steepness) noexcept {
    return FastMath::fastTanh(steepness * x) / FastMath::fastTanh(steepness);
}

// -----------------------------------------------------------------------------
// softClipCubic - Cubic Polynomial Soft Clipper
// -----------------------------------------------------------------------------

/// @brief Cubic polynomial soft clipper: 1.5x - 0.5x^3
///
/// Smooth transition into clipping, f'(+/-1) = 0. No transcendentals.
///
/// @param x Input value (unbounded, clipped outside [-1, 1])
/// @return Soft-clipped output in range [-1, 1]
[[nodiscard]] constexpr float softClipCubic(float x) noexcept {
    // NaN propagates (NaN comparisons are false)
    if (detail::isNaN(x)) return x;
    if (x <= -1.0f) return -1.0f;
    if (x >= 1.0f) return 1.0f;
    return 1.5f * x - 0.5f * x * x * x;
}

// -----------------------------------------------------------------------------
// hardClip - Hard Clipper
// -----------------------------------------------------------------------------

/// @brief Hard clip to threshold (default +/-1).
///
/// @param x Input value
/// @param threshold Clipping threshold (default 1.0)
/// @return Clipped output in range [-threshold, threshold]
[[nodiscard]] constexpr float hardClip(float x, float threshold = 1.0f) noexcept {
    return std::clamp(x, -threshold, threshold);
}

} // namespace Sigmoid
} // namespace DSP
} // namespace Usfx
