// ==============================================================================
// Layer 3: System Component - Mixer Implementation
// ==============================================================================

#include "mixer.h"

#include <usfx/dsp/core/db_utils.h>
#include <usfx/dsp/core/sigmoid.h>

#include <algorithm>
#include <utility>

namespace Usfx {
namespace DSP {

Mixer::Mixer(float sampleRate)
    : sampleRate_((sampleRate > 0.0f && detail::isFinite(sampleRate))
                      ? sampleRate
                      : kDefaultSampleRate)
{
}

void Mixer::reserve(size_t voiceCount) {
    voices_.reserve(voiceCount);
}

void Mixer::play(const Sample& sample) {
    voices_.emplace_back(sample, sampleRate_);
}

void Mixer::generate(float* output, size_t numSamples) noexcept {
    if (output != nullptr && numSamples > 0) {
        std::fill_n(output, numSamples, 0.0f);

        for (auto& voice : voices_) {
            voice.processBlock(output, numSamples);
        }

        if (softClip_) {
            for (size_t i = 0; i < numSamples; ++i) {
                output[i] = Sigmoid::softClipCubic(output[i]);
            }
        }
    }

    removeFinishedVoices();
}

void Mixer::removeFinishedVoices() noexcept {
    // Swap-and-pop: output is a sum, so voice order does not matter
    size_t i = 0;
    while (i < voices_.size()) {
        if (voices_[i].isFinished()) {
            if (i != voices_.size() - 1) {
                voices_[i] = std::move(voices_.back());
            }
            voices_.pop_back();
        } else {
            ++i;
        }
    }
}

} // namespace DSP
} // namespace Usfx
