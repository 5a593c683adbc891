// ==============================================================================
// usfx_play - Play sound-effect blueprints on the default audio device
// ==============================================================================
// Loads one or more JSON blueprints, opens the default PortAudio output as a
// mono float32 stream and fires the blueprints one after another.
//
// Threading: the main thread only pushes blueprints into a PlayQueue. The
// PortAudio callback owns the Mixer: it drains the queue, then generates.
// After each block it publishes the voice count, then the running total of
// started requests, so the main thread can tell when its last push has played.
//
// Usage:
//   usfx_play [--rate <hz>] [--buffer <frames>] [--interval <ms>]
//             [--gain <dB>] <sample.json>...
// ==============================================================================

#include <usfx/dsp/core/db_utils.h>
#include <usfx/dsp/serialization/sample_json.h>
#include <usfx/dsp/systems/mixer.h>
#include <usfx/dsp/systems/play_queue.h>

#include <portaudio.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace Usfx::DSP;

namespace {

constexpr size_t kQueueCapacity = 64;
constexpr size_t kReservedVoices = 256;

std::atomic<bool> gStopRequested{false};

void handleSignal(int /*signal*/) {
    gStopRequested.store(true);
}

struct Options {
    double sampleRate = kDefaultSampleRate;
    unsigned long framesPerBuffer = 512;
    int intervalMs = 250;
    float gainDb = 0.0f;
    std::vector<std::string> files;
};

/// Everything the audio callback touches. Only the callback mutates mixer.
struct PlaybackState {
    explicit PlaybackState(float sampleRate) : mixer(sampleRate) {}

    Mixer mixer;
    PlayQueue<kQueueCapacity> queue;
    float gain = 1.0f;
    std::atomic<size_t> activeVoices{0};
    std::atomic<size_t> voicesStarted{0};
    size_t startedInCallback = 0;   // callback only
};

int audioCallback(const void* /*input*/, void* output, unsigned long frameCount,
                  const PaStreamCallbackTimeInfo* /*timeInfo*/,
                  PaStreamCallbackFlags /*statusFlags*/, void* userData) {
    auto* state = static_cast<PlaybackState*>(userData);
    auto* out = static_cast<float*>(output);

    state->startedInCallback += state->queue.drainInto(state->mixer);
    state->mixer.generate(out, frameCount);

    if (state->gain != 1.0f) {
        for (unsigned long i = 0; i < frameCount; ++i) {
            out[i] *= state->gain;
        }
    }

    state->activeVoices.store(state->mixer.activeVoiceCount(), std::memory_order_release);
    state->voicesStarted.store(state->startedInCallback, std::memory_order_release);
    return paContinue;
}

void printUsage() {
    std::cerr << "usage: usfx_play [--rate <hz>] [--buffer <frames>] [--interval <ms>]"
                 " [--gain <dB>] <sample.json>...\n";
}

bool parseArguments(int argc, char* argv[], Options& options) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool hasValue = (i + 1 < argc);

        try {
            if (arg == "--rate" && hasValue) {
                options.sampleRate = std::stod(argv[++i]);
            } else if (arg == "--buffer" && hasValue) {
                options.framesPerBuffer = std::stoul(argv[++i]);
            } else if (arg == "--interval" && hasValue) {
                options.intervalMs = std::stoi(argv[++i]);
            } else if (arg == "--gain" && hasValue) {
                options.gainDb = std::stof(argv[++i]);
            } else if (arg == "--help" || arg == "-h") {
                return false;
            } else if (!arg.empty() && arg[0] == '-') {
                std::cerr << "Unknown option: " << arg << std::endl;
                return false;
            } else {
                options.files.push_back(arg);
            }
        } catch (const std::exception& e) {
            std::cerr << "Invalid value for " << arg << ": " << e.what() << std::endl;
            return false;
        }
    }

    if (!(options.sampleRate > 0.0) || options.framesPerBuffer == 0 || options.intervalMs < 0) {
        std::cerr << "Sample rate and buffer size must be positive" << std::endl;
        return false;
    }
    return !options.files.empty();
}

bool reportError(PaError err, const char* what) {
    if (err == paNoError) {
        return false;
    }
    std::cerr << what << ": " << Pa_GetErrorText(err) << std::endl;
    return true;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    Options options;
    if (!parseArguments(argc, argv, options)) {
        printUsage();
        return 1;
    }

    std::vector<Sample> samples;
    for (const auto& path : options.files) {
        auto sample = loadSampleFile(path);
        if (!sample) {
            return 1;
        }
        std::cout << "Loaded " << path << " (" << oscillatorTypeName(sample->getOscType())
                  << ", " << sample->getOscFrequency() << " Hz, "
                  << sample->getDuration() << " s)" << std::endl;
        samples.push_back(*sample);
    }

    PlaybackState state(static_cast<float>(options.sampleRate));
    state.mixer.reserve(kReservedVoices);
    state.gain = dbToGain(options.gainDb);

    if (reportError(Pa_Initialize(), "Failed to initialize PortAudio")) {
        return 1;
    }

    PaStream* stream = nullptr;
    PaError err = Pa_OpenDefaultStream(&stream, 0, 1, paFloat32, options.sampleRate,
                                       options.framesPerBuffer, audioCallback, &state);
    if (reportError(err, "Failed to open output stream")) {
        Pa_Terminate();
        return 1;
    }

    if (reportError(Pa_StartStream(stream), "Failed to start output stream")) {
        Pa_CloseStream(stream);
        Pa_Terminate();
        return 1;
    }

    std::signal(SIGINT, handleSignal);
    std::cout << "Playing " << samples.size() << " sample(s) at " << options.sampleRate
              << " Hz. Press Ctrl+C to stop early" << std::endl;

    size_t pushed = 0;
    for (const auto& sample : samples) {
        if (gStopRequested.load()) break;
        while (!state.queue.push(sample)) {
            if (gStopRequested.load()) break;
            Pa_Sleep(1);
        }
        if (gStopRequested.load()) break;
        ++pushed;
        std::this_thread::sleep_for(std::chrono::milliseconds(options.intervalMs));
    }

    // Wait until a callback has started every pushed request and then reported
    // no active voices. voicesStarted is stored after activeVoices, so reading
    // it first makes the voice count at least as new as the started total.
    const auto allPlayed = [&state, pushed] {
        if (state.voicesStarted.load(std::memory_order_acquire) < pushed) {
            return false;
        }
        return state.activeVoices.load(std::memory_order_acquire) == 0;
    };
    while (!gStopRequested.load() && !allPlayed()) {
        Pa_Sleep(10);
        if (Pa_IsStreamActive(stream) != 1) {
            std::cerr << "Stream stopped unexpectedly!" << std::endl;
            break;
        }
    }

    int exitCode = 0;
    if (reportError(Pa_StopStream(stream), "Failed to stop output stream")) {
        exitCode = 1;
    }
    if (reportError(Pa_CloseStream(stream), "Failed to close output stream")) {
        exitCode = 1;
    }
    Pa_Terminate();

    std::cout << "Done!" << std::endl;
    return exitCode;
}
