#include "speechseg.h"
#include "../src/whisper_gateway.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace speechseg;

static bool load_wav_pcm16(const char* path, std::vector<int16_t>& out, int expected_rate) {
    FILE* f = fopen(path, "rb");
    if (!f) {
        fprintf(stderr, "Cannot open WAV file: %s\n", path);
        return false;
    }

    char header[44];
    if (fread(header, 1, 44, f) != 44) {
        fprintf(stderr, "WAV header too short: %s\n", path);
        fclose(f);
        return false;
    }

    if (memcmp(header, "RIFF", 4) != 0 || memcmp(header + 8, "WAVE", 4) != 0) {
        fprintf(stderr, "Not a WAV file: %s\n", path);
        fclose(f);
        return false;
    }

    int sample_rate = *(int*)(header + 24);
    short bits_per_sample = *(short*)(header + 34);

    if (sample_rate != expected_rate) {
        fprintf(stderr, "Expected %d Hz, got %d Hz\n", expected_rate, sample_rate);
        fclose(f);
        return false;
    }
    if (bits_per_sample != 16) {
        fprintf(stderr, "Expected 16-bit PCM, got %d-bit\n", bits_per_sample);
        fclose(f);
        return false;
    }

    fseek(f, 0, SEEK_END);
    long file_size = ftell(f);
    fseek(f, 44, SEEK_SET);

    long data_bytes = file_size - 44;
    out.resize(data_bytes / 2);
    size_t read_count = fread(out.data(), 2, out.size(), f);
    fclose(f);
    out.resize(read_count);
    return true;
}

static std::atomic<double> g_audio_time{0.0};

static double audio_clock() {
    return g_audio_time.load();
}

struct Ctx {
    WhisperVadGateway* vad = nullptr;
    WhisperRecognizer* recognizer = nullptr;
    std::mutex mtx;
    int vad_requests = 0;
    std::vector<TranscriptionSegment> segments;
};

static void on_vad_request(const VadRequest& request, void* user_data) {
    auto* ctx = static_cast<Ctx*>(user_data);
    {
        std::lock_guard<std::mutex> lock(ctx->mtx);
        ctx->vad_requests++;
    }
    whisper_vad_gateway_submit(ctx->vad, request);
}

static void on_recognition_request(const RecognitionRequest& request, void* user_data) {
    auto* ctx = static_cast<Ctx*>(user_data);
    whisper_recognizer_submit(ctx->recognizer, request);
}

static void on_segment(const TranscriptionSegment& segment, void* user_data) {
    auto* ctx = static_cast<Ctx*>(user_data);
    std::lock_guard<std::mutex> lock(ctx->mtx);
    ctx->segments.push_back(segment);
}

// Replays the audio through one engine and both gateways, answering every
// request before the audio clock moves on.
static bool run_replay(const char* whisper_model, const char* vad_model, const std::vector<int16_t>& audio,
                       int recognizer_queue, std::vector<TranscriptionSegment>& segments, StreamStats& st,
                       int& pending_after) {
    g_audio_time.store(0.0);

    Ctx ctx;
    EngineCallbacks callbacks;
    callbacks.on_vad_request = on_vad_request;
    callbacks.on_recognition_request = on_recognition_request;
    callbacks.on_segment = on_segment;
    callbacks.user_data = &ctx;

    EngineConfig config;
    config.clock = audio_clock;
    Engine* engine = engine_init(config, callbacks);
    if (!engine) {
        printf("FAIL: engine_init returned null\n");
        return false;
    }

    WhisperVadConfig vad_config;
    vad_config.vad_model_path = vad_model;
    vad_config.no_prints = true;
    ctx.vad = whisper_vad_gateway_init(vad_config, engine);

    WhisperRecognizerConfig rec_config;
    rec_config.whisper_model_path = whisper_model;
    rec_config.no_prints = true;
    rec_config.max_queue = recognizer_queue;
    ctx.recognizer = whisper_recognizer_init(rec_config, engine);

    if (!ctx.vad || !ctx.recognizer) {
        printf("FAIL: gateway init returned null\n");
        whisper_vad_gateway_free(ctx.vad);
        whisper_recognizer_free(ctx.recognizer);
        engine_free(engine);
        return false;
    }

    for (size_t offset = 0; offset < audio.size(); offset += 480) {
        const int n = static_cast<int>(std::min<size_t>(480, audio.size() - offset));
        engine_push_frame(engine, MIXED_STREAM_ID, audio.data() + offset, n, offset / 16000.0);

        while (true) {
            engine_wait_idle(engine);
            if (whisper_vad_gateway_pending(ctx.vad) == 0 &&
                whisper_recognizer_pending(ctx.recognizer) == 0) break;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        engine_wait_idle(engine);
        g_audio_time.store((offset + n) / 16000.0);
        engine_tick(engine);
    }
    {
        std::lock_guard<std::mutex> lock(ctx.mtx);
        printf("%d VAD requests answered\n", ctx.vad_requests);
    }
    engine_finalize_stream(engine, MIXED_STREAM_ID);
    engine_wait_idle(engine);

    printf("Waiting for transcripts...\n");
    while (true) {
        engine_wait_idle(engine);
        if (whisper_recognizer_pending(ctx.recognizer) == 0) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    engine_wait_idle(engine);

    engine_get_stats(engine, MIXED_STREAM_ID, st);
    pending_after = st.recognitions_in_flight;

    whisper_vad_gateway_free(ctx.vad);
    whisper_recognizer_free(ctx.recognizer);
    engine_free(engine);
    printf("Gateways freed cleanly\n");

    std::lock_guard<std::mutex> lock(ctx.mtx);
    segments = ctx.segments;
    return true;
}

int main(int argc, char* argv[]) {
    const char* whisper_model = nullptr;
    const char* vad_model = nullptr;
    const char* audio_path = nullptr;

    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "--whisper-model") == 0 && i + 1 < argc) {
            whisper_model = argv[++i];
        } else if (strcmp(argv[i], "--vad-model") == 0 && i + 1 < argc) {
            vad_model = argv[++i];
        } else {
            audio_path = argv[i];
        }
    }

    if (!whisper_model || !vad_model || !audio_path) {
        printf("Usage: test_whisper_gateway --whisper-model <ggml.bin> --vad-model <silero.bin> <audio.wav>\n");
        printf("SKIP: No model provided\n");
        return 0;
    }

    std::vector<int16_t> audio;
    if (!load_wav_pcm16(audio_path, audio, 16000)) {
        printf("FAIL: Could not load audio file\n");
        return 1;
    }
    printf("Loaded %zu samples (%.1fs)\n", audio.size(), audio.size() / 16000.0);

    int failures = 0;

    printf("\n=== Replay ===\n");
    std::vector<TranscriptionSegment> segments;
    StreamStats st;
    int in_flight = 0;
    if (!run_replay(whisper_model, vad_model, audio, 16, segments, st, in_flight)) {
        return 1;
    }

    const uint64_t expected_packets = audio.size() / 1600;
    if (st.packets != expected_packets) {
        printf("FAIL: expected %llu packets, got %llu\n",
               static_cast<unsigned long long>(expected_packets),
               static_cast<unsigned long long>(st.packets));
        failures++;
    }
    if (st.verdicts == 0) {
        printf("FAIL: no VAD verdict was answered\n");
        failures++;
    }

    size_t with_text = 0;
    double prev_start = -1.0;
    for (const auto& seg : segments) {
        printf("  [%.2f - %.2f] %s%s\n", seg.start, seg.end, seg.gap ? "(gap) " : "", seg.text.c_str());
        if (!seg.gap && !seg.text.empty()) with_text++;
        if (seg.start < prev_start) {
            printf("FAIL: segments out of order\n");
            failures++;
        }
        if (seg.start > seg.end) {
            printf("FAIL: segment start (%.3f) > end (%.3f)\n", seg.start, seg.end);
            failures++;
        }
        prev_start = seg.start;
    }
    if (with_text == 0) {
        printf("FAIL: no transcribed segment\n");
        failures++;
    }

    // A recognizer with no queue room answers every segment as failed
    printf("\n=== Full recognizer queue ===\n");
    std::vector<TranscriptionSegment> dropped;
    StreamStats st_full;
    if (!run_replay(whisper_model, vad_model, audio, 0, dropped, st_full, in_flight)) {
        return 1;
    }
    if (dropped.empty() || dropped.size() != st_full.segments_dispatched) {
        printf("FAIL: expected every dispatched segment released, got %zu of %llu\n",
               dropped.size(), static_cast<unsigned long long>(st_full.segments_dispatched));
        failures++;
    }
    for (const auto& seg : dropped) {
        if (!seg.gap) {
            printf("FAIL: segment %llu released with text despite a full queue\n",
                   static_cast<unsigned long long>(seg.sequence));
            failures++;
        }
    }
    if (in_flight != 0) {
        printf("FAIL: %d recognitions still in flight\n", in_flight);
        failures++;
    }

    if (failures > 0) {
        printf("\nFAIL: %d failures\n", failures);
        return 1;
    }

    printf("\nPASS\n");
    return 0;
}
