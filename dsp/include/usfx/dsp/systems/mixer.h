// ==============================================================================
// Layer 3: System Component - Mixer
// ==============================================================================
// Owns every playing Voice and sums them into one mono output buffer.
//
// Signal flow per generate() call:
//   zero buffer -> + Voice[0..N) -> optional cubic soft clip -> retire Done
//
// Mixing policy: plain additive sum, not normalized. Each voice is bounded
// by its distortion stage and volume, but the sum of many voices can exceed
// [-1, 1]; enable setSoftClip(true) or manage gain at the device layer.
//
// @par Thread Safety
// Single-threaded model. The Mixer has no internal locking; play() and
// generate() must not run concurrently. Feed play requests from other
// threads through a PlayQueue drained on the audio thread.
//
// @par Real-Time Safety
// generate() is noexcept, never blocks and never allocates.
// play() allocates only when the voice count exceeds the reserved capacity.
// ==============================================================================

#pragma once

#include <usfx/dsp/core/math_constants.h>
#include <usfx/dsp/systems/sample.h>
#include <usfx/dsp/systems/voice.h>

#include <cstddef>
#include <span>
#include <vector>

namespace Usfx {
namespace DSP {

class Mixer {
public:
    /// @brief Create a mixer running at a fixed sample rate.
    /// @param sampleRate Output sample rate in Hz; non-positive, NaN or
    ///        infinite values fall back to kDefaultSampleRate.
    explicit Mixer(float sampleRate = kDefaultSampleRate);

    // =========================================================================
    // Voice Management
    // =========================================================================

    /// @brief Pre-allocate storage for @p voiceCount simultaneous voices.
    ///
    /// play() does not allocate while activeVoiceCount() < capacity(), which
    /// makes it safe to call from the audio thread.
    void reserve(size_t voiceCount);

    /// @brief Start playing a copy of @p sample (fire and forget).
    ///
    /// The new voice starts at phase 0 with its envelope triggered. There is
    /// no handle and no early stop; the voice is retired once its envelope
    /// completes.
    void play(const Sample& sample);

    // =========================================================================
    // Processing
    // =========================================================================

    /// @brief Overwrite @p output with the mix of all active voices, then
    ///        retire every voice whose envelope reached Done.
    void generate(float* output, size_t numSamples) noexcept;

    void generate(std::span<float> output) noexcept {
        generate(output.data(), output.size());
    }

    /// @brief Pass the summed output through a cubic soft clipper.
    void setSoftClip(bool enabled) noexcept { softClip_ = enabled; }

    // =========================================================================
    // State Queries
    // =========================================================================

    [[nodiscard]] size_t activeVoiceCount() const noexcept { return voices_.size(); }
    [[nodiscard]] size_t capacity() const noexcept { return voices_.capacity(); }
    [[nodiscard]] float getSampleRate() const noexcept { return sampleRate_; }
    [[nodiscard]] bool isSoftClipEnabled() const noexcept { return softClip_; }

private:
    void removeFinishedVoices() noexcept;

    float sampleRate_ = kDefaultSampleRate;
    bool softClip_ = false;
    std::vector<Voice> voices_;
};

} // namespace DSP
} // namespace Usfx
