#pragma once

#include "speechseg_types.h"

#include <cstdint>
#include <string>

namespace speechseg {

struct EngineConfig {
    // Audio format of every stream
    int sample_rate = 16000;

    // false: one synthetic stream (MIXED_STREAM_ID) created at init, all frames routed to it.
    // true: one stream per speaker, created on first frame.
    bool individual_mode = false;
    bool diarize = false;              // forwarded to the recognition gateway

    // Packetization (voice-activity requests)
    double packet_duration = 0.1;      // 1,600 samples at 16 kHz
    int max_outstanding_vad = 8;       // oldest packet forced to non-speech beyond this
    double vad_timeout = 0.3;          // unanswered packet resolved as non-speech

    // Segmentation
    double segment_duration = 2.5;     // 0 disables target trimming
    double min_speech_duration = 0.5;
    double max_speech_duration = 5.0;  // overflow bound
    double silence_timeout = 1.0;

    // Recognition reordering
    double reorder_timeout = 10.0;     // head of the reorder buffer released as a gap after this
    int history_size = 30;             // transcript entries kept for the recognition prompt

    // Resources
    int max_streams = 32;
    int mailbox_capacity = 1024;       // per stream, for inputs and for gateway replies each
    double tick_interval = 0.05;       // sweeper period, drives silence and reply timeouts

    bool verbose = false;              // per-event diagnostics on stderr

    // Monotonic clock in seconds. nullptr = std::chrono::steady_clock.
    double (*clock)() = nullptr;
};

typedef void (*vad_request_callback)(const VadRequest& request, void* user_data);
typedef void (*recognition_request_callback)(const RecognitionRequest& request, void* user_data);
typedef void (*segment_callback)(const TranscriptionSegment& segment, void* user_data);

// Callbacks run on the owning stream's worker thread. They must not block for
// long and must not destroy their own stream or the engine.
struct EngineCallbacks {
    vad_request_callback on_vad_request = nullptr;
    recognition_request_callback on_recognition_request = nullptr;
    segment_callback on_segment = nullptr;
    void* user_data = nullptr;
};

struct Engine;

// Logs every problem found and returns false if any.
bool engine_config_validate(const EngineConfig& config);

// Returns nullptr on invalid config.
Engine* engine_init(const EngineConfig& config, const EngineCallbacks& callbacks);

// Lifecycle. Creating an existing stream is a no-op returning true.
// Destroying discards unfinalized speech, cancels pending correlations and
// returns once no further callback can fire for the stream. Destroying an
// unknown or already destroyed stream returns false and has no effect.
// In mixed mode every id names the single mixed stream, here and in
// engine_finalize_stream / engine_get_stats.
bool engine_create_stream(Engine* engine, const std::string& stream_id);
bool engine_destroy_stream(Engine* engine, const std::string& stream_id);

// Finalizes the in-progress utterance now (minimum duration applies).
bool engine_finalize_stream(Engine* engine, const std::string& stream_id);

// Non-blocking. Returns false if the frame was rejected (unknown stream in
// mixed mode never happens; pool exhausted; mailbox full; empty frame).
// In mixed mode `stream_id` is ignored.
bool engine_push_frame(Engine* engine, const std::string& stream_id,
                       const int16_t* samples, int n_samples, double capture_time);

// Non-blocking. Replies for unknown or destroyed streams are dropped and return false.
bool engine_on_vad_reply(Engine* engine, const VadReply& reply);
bool engine_on_recognition_reply(Engine* engine, const RecognitionReply& reply);

// Posts a timer tick to every stream immediately.
void engine_tick(Engine* engine);

// Blocks until every stream mailbox is empty and no message is being processed.
void engine_wait_idle(Engine* engine);

bool engine_get_stats(Engine* engine, const std::string& stream_id, StreamStats& stats);
int engine_stream_count(Engine* engine);

void engine_free(Engine* engine);

}  // namespace speechseg
