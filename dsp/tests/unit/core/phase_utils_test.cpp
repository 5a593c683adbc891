// ==============================================================================
// Layer 0: Core Utility Tests - Phase Accumulation
// ==============================================================================

#include <usfx/dsp/core/phase_utils.h>

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <limits>

using Catch::Approx;
using namespace Usfx::DSP;

TEST_CASE("calculatePhaseIncrement returns frequency / sampleRate", "[phase_utils]") {
    CHECK(calculatePhaseIncrement(441.0f, 44100.0f) == Approx(0.01));
    CHECK(calculatePhaseIncrement(1000.0f, 48000.0f) == Approx(1000.0 / 48000.0));
    CHECK(calculatePhaseIncrement(22050.0f, 44100.0f) == Approx(0.5));
}

TEST_CASE("calculatePhaseIncrement is zero for degenerate input", "[phase_utils]") {
    const float nan = std::numeric_limits<float>::quiet_NaN();

    CHECK(calculatePhaseIncrement(0.0f, 44100.0f) == 0.0);
    CHECK(calculatePhaseIncrement(-440.0f, 44100.0f) == 0.0);
    CHECK(calculatePhaseIncrement(nan, 44100.0f) == 0.0);
    CHECK(calculatePhaseIncrement(440.0f, 0.0f) == 0.0);
    CHECK(calculatePhaseIncrement(440.0f, -1.0f) == 0.0);
    CHECK(calculatePhaseIncrement(440.0f, nan) == 0.0);
}

TEST_CASE("wrapPhase maps into [0, 1)", "[phase_utils]") {
    CHECK(wrapPhase(0.25) == Approx(0.25));
    CHECK(wrapPhase(1.0) == 0.0);
    CHECK(wrapPhase(1.75) == Approx(0.75));
    CHECK(wrapPhase(3.5) == Approx(0.5));
    CHECK(wrapPhase(-0.25) == Approx(0.75));

    for (double p : {-7.3, -1.0, 0.0, 0.999, 12.01, 1e6 + 0.5}) {
        const double wrapped = wrapPhase(p);
        CHECK(wrapped >= 0.0);
        CHECK(wrapped < 1.0);
    }
}

TEST_CASE("PhaseAccumulator advances and reports wraps", "[phase_utils]") {
    PhaseAccumulator acc;
    acc.setFrequency(11025.0f, 44100.0f);   // quarter cycle per sample
    REQUIRE(acc.increment == Approx(0.25));

    CHECK_FALSE(acc.advance());
    CHECK(acc.phase == Approx(0.25));
    CHECK_FALSE(acc.advance());
    CHECK_FALSE(acc.advance());
    CHECK(acc.phase == Approx(0.75));

    CHECK(acc.advance());
    CHECK(acc.phase == Approx(0.0).margin(1e-12));

    SECTION("reset returns to phase 0 and keeps the increment") {
        (void)acc.advance();
        acc.reset();
        CHECK(acc.phase == 0.0);
        CHECK(acc.increment == Approx(0.25));
    }

    SECTION("zero increment never moves") {
        acc.setFrequency(0.0f, 44100.0f);
        acc.phase = 0.4;
        for (int i = 0; i < 100; ++i) {
            CHECK_FALSE(acc.advance());
        }
        CHECK(acc.phase == 0.4);
    }
}

TEST_CASE("PhaseAccumulator stays in range over long runs", "[phase_utils]") {
    PhaseAccumulator acc;
    acc.setFrequency(997.0f, 44100.0f);

    int wraps = 0;
    for (int i = 0; i < 44100; ++i) {
        if (acc.advance()) ++wraps;
        REQUIRE(acc.phase >= 0.0);
        REQUIRE(acc.phase < 1.0);
    }
    // One second at 997 Hz
    CHECK((wraps == 996 || wraps == 997));
}
