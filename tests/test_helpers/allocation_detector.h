#pragma once
// ==============================================================================
// Allocation Detector
// ==============================================================================
// Counts heap allocations made while a scope is active, so tests can check
// that audio-thread paths (Mixer::generate, PlayQueue::drainInto) never
// allocate.
//
// Counting needs the global operator new replacement below. It must appear
// in exactly one translation unit of a test executable:
//
//   #define USFX_DEFINE_ALLOCATION_HOOKS
//   #include "allocation_detector.h"
//
// Only plain (non-aligned) operator new is counted.
// ==============================================================================

#include <atomic>
#include <cstddef>
#include <cstdlib>
#include <new>

namespace TestHelpers {

// ==============================================================================
// Allocation Tracking
// ==============================================================================

class AllocationDetector {
public:
    void startTracking() {
        allocationCount_.store(0, std::memory_order_relaxed);
        tracking_.store(true, std::memory_order_release);
    }

    size_t stopTracking() {
        tracking_.store(false, std::memory_order_release);
        return allocationCount_.load(std::memory_order_acquire);
    }

    bool isTracking() const {
        return tracking_.load(std::memory_order_acquire);
    }

    // Called by the replaced operator new
    void recordAllocation() {
        if (tracking_.load(std::memory_order_acquire)) {
            allocationCount_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    static AllocationDetector& instance() {
        static AllocationDetector detector;
        return detector;
    }

private:
    std::atomic<bool> tracking_{false};
    std::atomic<size_t> allocationCount_{0};
};

// ==============================================================================
// RAII Tracking Scope
// ==============================================================================
// Call stop() before inspecting the count inside the same block; the
// destructor stops tracking if stop() was never called.

class AllocationScope {
public:
    AllocationScope() {
        AllocationDetector::instance().startTracking();
    }

    ~AllocationScope() {
        if (!stopped_) {
            (void)stop();
        }
    }

    AllocationScope(const AllocationScope&) = delete;
    AllocationScope& operator=(const AllocationScope&) = delete;

    size_t stop() {
        count_ = AllocationDetector::instance().stopTracking();
        stopped_ = true;
        return count_;
    }

    size_t getAllocationCount() const { return count_; }
    bool hadAllocations() const { return count_ > 0; }

private:
    size_t count_ = 0;
    bool stopped_ = false;
};

} // namespace TestHelpers

// ==============================================================================
// Global Operator Replacements
// ==============================================================================

#ifdef USFX_DEFINE_ALLOCATION_HOOKS

void* operator new(std::size_t size) {
    TestHelpers::AllocationDetector::instance().recordAllocation();
    void* p = std::malloc(size == 0 ? 1 : size);
    if (!p) throw std::bad_alloc();
    return p;
}

void operator delete(void* p) noexcept {
    std::free(p);
}

void operator delete(void* p, [[maybe_unused]] std::size_t size) noexcept {
    std::free(p);
}

#endif // USFX_DEFINE_ALLOCATION_HOOKS
