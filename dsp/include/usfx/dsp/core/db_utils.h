// ==============================================================================
// Layer 0: Core Utilities
// db_utils.h - Float Guards and Gain Conversion
// ==============================================================================
// Real-time safe: no allocation, no locks, no exceptions, no I/O.
// Layer 0: no dependencies on higher layers.
//
// Every parameter entering the synthesis pipeline passes through these
// guards, so NaN or infinite values never reach an output buffer.
// ==============================================================================

#pragma once

#include <algorithm>
#include <bit>
#include <cmath>
#include <cstdint>

namespace Usfx {
namespace DSP {

/// Floor value for silence in decibels (approximately 24-bit dynamic range).
inline constexpr float kSilenceFloorDb = -144.0f;

namespace detail {

/// Constexpr-safe NaN check using the IEEE 754 bit pattern.
///
/// NaN: exponent = all 1s (0xFF) AND mantissa != 0.
///
/// std::isnan() is optimized away under -ffast-math; operating on the integer
/// bits keeps the check reliable regardless of floating-point flags.
constexpr bool isNaN(float x) noexcept {
    const auto bits = std::bit_cast<std::uint32_t>(x);
    return ((bits & 0x7F800000u) == 0x7F800000u) && ((bits & 0x007FFFFFu) != 0);
}

/// Constexpr-safe infinity check (exponent all 1s, mantissa zero).
constexpr bool isInf(float x) noexcept {
    const auto bits = std::bit_cast<std::uint32_t>(x);
    return (bits & 0x7FFFFFFFu) == 0x7F800000u;
}

/// True for any value that is neither NaN nor +/-Inf.
constexpr bool isFinite(float x) noexcept {
    const auto bits = std::bit_cast<std::uint32_t>(x);
    return (bits & 0x7F800000u) != 0x7F800000u;
}

} // namespace detail

// ==============================================================================
// Sanitizing
// ==============================================================================

/// Replace NaN/Inf with 0.0f.
///
/// @note Used as the last line of defence before a sample is written to a
///       caller-owned buffer.
[[nodiscard]] constexpr float flushNonFinite(float x) noexcept {
    return detail::isFinite(x) ? x : 0.0f;
}

/// Clamp a parameter into [minValue, maxValue], mapping NaN to minValue.
///
/// @param value    Incoming value (may be NaN or +/-Inf)
/// @param minValue Lower bound
/// @param maxValue Upper bound
/// @return Value in [minValue, maxValue]; +Inf maps to maxValue
[[nodiscard]] constexpr float clampParameter(float value, float minValue,
                                             float maxValue) noexcept {
    if (detail::isNaN(value)) {
        return minValue;
    }
    return std::clamp(value, minValue, maxValue);
}

// ==============================================================================
// Gain Conversion
// ==============================================================================

/// Convert decibels to linear gain.
///
/// @note NaN input returns 0.0f
///
/// @example dbToGain(0.0f)    -> 1.0f
/// @example dbToGain(-6.02f)  -> ~0.5f
[[nodiscard]] inline float dbToGain(float dB) noexcept {
    if (detail::isNaN(dB)) {
        return 0.0f;
    }
    return std::pow(10.0f, dB / 20.0f);
}

/// Convert linear gain to decibels, clamped to kSilenceFloorDb.
///
/// @note Zero/negative/NaN input returns kSilenceFloorDb
[[nodiscard]] inline float gainToDb(float gain) noexcept {
    if (detail::isNaN(gain) || gain <= 0.0f) {
        return kSilenceFloorDb;
    }
    const float result = 20.0f * std::log10(gain);
    return (result < kSilenceFloorDb) ? kSilenceFloorDb : result;
}

} // namespace DSP
} // namespace Usfx
