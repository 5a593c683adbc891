// ==============================================================================
// Layer 0: Core Utilities
// random.h - Deterministic Pseudo-Random Number Generation
// ==============================================================================
// Real-time safe: no allocation, no locks, no exceptions, no I/O.
// constexpr where possible, value semantics.
// Layer 0: no dependencies on higher layers.
// ==============================================================================

#pragma once

#include <cstdint>

namespace Usfx {
namespace DSP {

// ==============================================================================
// PCG32 PRNG
// ==============================================================================

/// Permuted congruential generator (PCG-XSH-RR, 64-bit state, 32-bit output).
///
/// Used by the noise oscillator. Two generators built from the same seed and
/// stream produce the same sequence, which keeps noise voices reproducible
/// across runs and lets identical blueprints mix coherently.
///
/// @note Real-time safe: no allocation, no exceptions
/// @note NOT cryptographically secure - for audio/DSP use only
///
/// @example Basic usage:
///     Pcg32 rng(441, 5);
///     float noise = rng.nextFloat();  // Returns [-1.0, 1.0]
///
class Pcg32 {
public:
    /// Construct with seed and stream selector.
    /// @param seedValue Initial seed (any value, including 0)
    /// @param stream Stream selector; different streams give independent sequences
    explicit constexpr Pcg32(uint64_t seedValue = 0, uint64_t stream = kDefaultStream) noexcept {
        seed(seedValue, stream);
    }

    /// Reseed the generator.
    constexpr void seed(uint64_t seedValue, uint64_t stream = kDefaultStream) noexcept {
        state_ = 0;
        increment_ = (stream << 1u) | 1u;
        (void)next();
        state_ += seedValue;
        (void)next();
    }

    /// Generate next 32-bit unsigned integer.
    [[nodiscard]] constexpr uint32_t next() noexcept {
        const uint64_t old = state_;
        state_ = old * kMultiplier + increment_;
        const auto xorShifted = static_cast<uint32_t>(((old >> 18u) ^ old) >> 27u);
        const auto rotation = static_cast<uint32_t>(old >> 59u);
        return (xorShifted >> rotation) | (xorShifted << ((32u - rotation) & 31u));
    }

    /// Generate next float in the closed bipolar range.
    /// @return Random float in range [-1.0, 1.0]
    [[nodiscard]] constexpr float nextFloat() noexcept {
        return static_cast<float>(next()) * kToFloat * 2.0f - 1.0f;
    }

    /// Generate next float in unipolar range.
    /// @return Random float in range [0.0, 1.0]
    [[nodiscard]] constexpr float nextUnipolar() noexcept {
        return static_cast<float>(next()) * kToFloat;
    }

    /// Current 64-bit LCG state.
    [[nodiscard]] constexpr uint64_t state() const noexcept {
        return state_;
    }

    /// Stream used when none is given
    static constexpr uint64_t kDefaultStream = 5u;

private:
    static constexpr uint64_t kMultiplier = 6364136223846793005ull;

    /// 1.0 / (2^32 - 1)
    static constexpr float kToFloat = 2.3283064370807974e-10f;

    uint64_t state_ = 0;
    uint64_t increment_ = 1;
};

} // namespace DSP
} // namespace Usfx
