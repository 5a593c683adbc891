// ==============================================================================
// Serialization Tests - Sample <-> JSON
// ==============================================================================

#include <usfx/dsp/serialization/sample_json.h>

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

using Catch::Approx;
using namespace Usfx::DSP;

namespace {

Sample makeLaser() {
    Sample laser;
    laser.setOscType(OscillatorType::Square);
    laser.setOscFrequency(880.0f);
    laser.setOscDutyCycle(DutyCycle::Quarter);
    laser.setVolume(0.75f);
    laser.setEnvAttack(0.0f);
    laser.setEnvDecay(0.05f);
    laser.setEnvSustain(0.25f);
    laser.setEnvHold(0.125f);
    laser.setEnvRelease(0.2f);
    laser.setDisCrunch(2.5f);
    laser.setDisDrive(0.5f);
    return laser;
}

std::filesystem::path tempPath(const char* name) {
    return std::filesystem::temp_directory_path() / name;
}

} // anonymous namespace

// =============================================================================
// Enum names
// =============================================================================

TEST_CASE("Oscillator type names", "[serialization]") {
    CHECK(std::string(oscillatorTypeName(OscillatorType::Sine)) == "sine");
    CHECK(std::string(oscillatorTypeName(OscillatorType::Saw)) == "saw");
    CHECK(std::string(oscillatorTypeName(OscillatorType::Triangle)) == "triangle");
    CHECK(std::string(oscillatorTypeName(OscillatorType::Square)) == "square");
    CHECK(std::string(oscillatorTypeName(OscillatorType::Noise)) == "noise");

    CHECK(oscillatorTypeFromName("triangle") == OscillatorType::Triangle);
    CHECK_FALSE(oscillatorTypeFromName("Triangle").has_value());
    CHECK_FALSE(oscillatorTypeFromName("pulse").has_value());
}

TEST_CASE("Duty cycle names", "[serialization]") {
    CHECK(std::string(dutyCycleName(DutyCycle::Eighth)) == "eighth");
    CHECK(std::string(dutyCycleName(DutyCycle::Third)) == "third");
    CHECK(dutyCycleFromName("quarter") == DutyCycle::Quarter);
    CHECK(dutyCycleFromName("half") == DutyCycle::Half);
    CHECK_FALSE(dutyCycleFromName("fifth").has_value());
}

// =============================================================================
// nlohmann hooks
// =============================================================================

TEST_CASE("Sample to_json writes every field", "[serialization]") {
    const nlohmann::json j = makeLaser();

    CHECK(j.at("osc_type").get<std::string>() == "square");
    CHECK(j.at("osc_frequency").get<float>() == 880.0f);
    CHECK(j.at("osc_duty_cycle").get<std::string>() == "quarter");
    CHECK(j.at("volume").get<float>() == 0.75f);
    CHECK(j.at("env_attack").get<float>() == 0.0f);
    CHECK(j.at("env_decay").get<float>() == 0.05f);
    CHECK(j.at("env_sustain").get<float>() == 0.25f);
    CHECK(j.at("env_hold").get<float>() == 0.125f);
    CHECK(j.at("env_release").get<float>() == 0.2f);
    CHECK(j.at("dis_crunch").get<float>() == 2.5f);
    CHECK(j.at("dis_drive").get<float>() == 0.5f);
    CHECK(j.size() == 11);
}

TEST_CASE("Sample survives a JSON round trip", "[serialization]") {
    const Sample laser = makeLaser();
    const nlohmann::json j = laser;
    CHECK(j.get<Sample>() == laser);

    const auto text = sampleToJsonText(laser);
    const auto parsed = sampleFromJsonText(text);
    REQUIRE(parsed.has_value());
    CHECK(*parsed == laser);
}

TEST_CASE("Missing keys keep their defaults", "[serialization]") {
    const auto parsed = sampleFromJsonText(R"({"osc_type": "noise", "volume": 0.5})");
    REQUIRE(parsed.has_value());

    Sample expected;
    expected.setOscType(OscillatorType::Noise);
    expected.setVolume(0.5f);
    CHECK(*parsed == expected);

    const auto empty = sampleFromJsonText("{}");
    REQUIRE(empty.has_value());
    CHECK(*empty == Sample{});
}

TEST_CASE("Out of range values are clamped like the setters", "[serialization]") {
    const auto parsed = sampleFromJsonText(
        R"({"volume": 3.0, "osc_frequency": -10, "env_release": 1e6, "dis_drive": 1e9})");
    REQUIRE(parsed.has_value());
    CHECK(parsed->getVolume() == 1.0f);
    CHECK(parsed->getOscFrequency() == 0.0f);
    CHECK(parsed->getEnvRelease() == kMaxEnvelopeTimeSeconds);
    CHECK(parsed->getDisDrive() == kMaxDrive);

    const auto slow = sampleFromJsonText(R"({"env_attack": 9900})");
    REQUIRE(slow.has_value());
    CHECK(slow->getEnvAttack() == 9900.0f);
}

TEST_CASE("from_json rejects bad input", "[serialization][errors]") {
    SECTION("unknown enum name") {
        const auto j = nlohmann::json::parse(R"({"osc_type": "pulse"})");
        CHECK_THROWS_AS(j.get<Sample>(), std::invalid_argument);

        const auto d = nlohmann::json::parse(R"({"osc_duty_cycle": "fifth"})");
        CHECK_THROWS_AS(d.get<Sample>(), std::invalid_argument);
    }

    SECTION("wrong JSON type") {
        const auto j = nlohmann::json::parse(R"({"volume": "loud"})");
        CHECK_THROWS_AS(j.get<Sample>(), nlohmann::json::type_error);

        const auto t = nlohmann::json::parse(R"({"osc_type": 3})");
        CHECK_THROWS_AS(t.get<Sample>(), nlohmann::json::type_error);
    }

    SECTION("not an object") {
        const auto j = nlohmann::json::parse("[1, 2, 3]");
        CHECK_THROWS_AS(j.get<Sample>(), std::invalid_argument);
    }
}

TEST_CASE("sampleFromJsonText reports failures as empty", "[serialization][errors]") {
    CHECK_FALSE(sampleFromJsonText("{ not json").has_value());
    CHECK_FALSE(sampleFromJsonText(R"({"osc_type": "pulse"})").has_value());
    CHECK_FALSE(sampleFromJsonText(R"({"env_attack": null})").has_value());
    CHECK_FALSE(sampleFromJsonText("42").has_value());
}

// =============================================================================
// Files
// =============================================================================

TEST_CASE("Sample files save and load", "[serialization][files]") {
    const auto path = tempPath("usfx_sample_json_test.json");
    const Sample laser = makeLaser();

    REQUIRE(saveSampleFile(path.string(), laser));
    const auto loaded = loadSampleFile(path.string());
    REQUIRE(loaded.has_value());
    CHECK(*loaded == laser);

    std::filesystem::remove(path);
}

TEST_CASE("Sample file errors", "[serialization][files][errors]") {
    SECTION("missing file") {
        CHECK_FALSE(loadSampleFile(tempPath("usfx_does_not_exist.json").string()).has_value());
    }

    SECTION("malformed file") {
        const auto path = tempPath("usfx_malformed_test.json");
        {
            std::ofstream file(path);
            file << R"({"osc_type": "sine", )";
        }
        CHECK_FALSE(loadSampleFile(path.string()).has_value());
        std::filesystem::remove(path);
    }

    SECTION("unwritable path") {
        const auto path = tempPath("usfx_missing_dir") / "nested" / "sample.json";
        CHECK_FALSE(saveSampleFile(path.string(), Sample{}));
    }
}
