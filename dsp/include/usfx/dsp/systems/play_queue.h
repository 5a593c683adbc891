// ==============================================================================
// Layer 3: System Component - PlayQueue
// ==============================================================================
// Lock-free single-producer / single-consumer ring of Sample blueprints.
//
// Carries play requests from a control thread (game logic, UI) to the audio
// thread that owns the Mixer:
//
//   control thread:  queue.push(explosion);
//   audio callback:  queue.drainInto(mixer); mixer.generate(out, n);
//
// Exactly one thread may call push() and exactly one (other) thread may call
// pop()/drainInto(). Indices grow monotonically and are masked into the
// power-of-two slot array; acquire/release ordering on the indices publishes
// the slot contents.
//
// Real-time safe: push() and pop() never block and never allocate.
// ==============================================================================

#pragma once

#include <usfx/dsp/systems/mixer.h>
#include <usfx/dsp/systems/sample.h>

#include <array>
#include <atomic>
#include <cstddef>

namespace Usfx {
namespace DSP {

template <size_t Capacity>
class PlayQueue {
    static_assert(Capacity >= 2 && (Capacity & (Capacity - 1)) == 0,
                  "PlayQueue capacity must be a power of two");

public:
    PlayQueue() noexcept = default;

    PlayQueue(const PlayQueue&) = delete;
    PlayQueue& operator=(const PlayQueue&) = delete;

    /// @brief Enqueue a copy of @p sample (producer thread only).
    /// @return false when the queue is full; the request is dropped
    [[nodiscard]] bool push(const Sample& sample) noexcept {
        const size_t tail = tail_.load(std::memory_order_relaxed);
        const size_t head = head_.load(std::memory_order_acquire);
        if (tail - head >= Capacity) {
            return false;
        }
        slots_[tail & kMask] = sample;
        tail_.store(tail + 1, std::memory_order_release);
        return true;
    }

    /// @brief Dequeue the oldest request (consumer thread only).
    /// @return false when the queue is empty; @p out is left untouched
    [[nodiscard]] bool pop(Sample& out) noexcept {
        const size_t head = head_.load(std::memory_order_relaxed);
        const size_t tail = tail_.load(std::memory_order_acquire);
        if (head == tail) {
            return false;
        }
        out = slots_[head & kMask];
        head_.store(head + 1, std::memory_order_release);
        return true;
    }

    /// @brief Play every pending request on @p mixer (consumer thread only).
    ///
    /// Call at the start of the audio callback, before Mixer::generate().
    /// Allocation-free as long as the mixer has reserved enough voices.
    ///
    /// @return Number of voices started
    size_t drainInto(Mixer& mixer) {
        size_t started = 0;
        Sample sample;
        while (pop(sample)) {
            mixer.play(sample);
            ++started;
        }
        return started;
    }

    /// @brief Approximate number of pending requests (exact when quiescent).
    [[nodiscard]] size_t size() const noexcept {
        // head first: it can never overtake a tail read afterwards
        const size_t head = head_.load(std::memory_order_acquire);
        const size_t tail = tail_.load(std::memory_order_acquire);
        return tail - head;
    }

    [[nodiscard]] bool empty() const noexcept { return size() == 0; }

    [[nodiscard]] static constexpr size_t capacity() noexcept { return Capacity; }

private:
    static constexpr size_t kMask = Capacity - 1;

    std::array<Sample, Capacity> slots_{};
    alignas(64) std::atomic<size_t> head_{0};
    alignas(64) std::atomic<size_t> tail_{0};
};

} // namespace DSP
} // namespace Usfx
