#pragma once
#include <cstdint>
#include <string>

namespace speechseg {

// Identity of the single synthetic stream used in mixed mode.
constexpr const char* MIXED_STREAM_ID = "__mixed__";

// Sent to the voice-activity gateway for every full packet.
// `samples` points into engine-owned memory and is only valid for the
// duration of the request callback; asynchronous gateways must copy it.
struct VadRequest {
    std::string stream_id;
    uint64_t id = 0;               // VAD correlation id, consecutive within a stream instance
    const int16_t* samples = nullptr;
    int n_samples = 0;             // always the configured packet length
    int sample_rate = 16000;
    double capture_time = 0.0;     // seconds, timestamp of the first sample
};

struct VadReply {
    std::string stream_id;
    uint64_t id = 0;
    bool is_speech = false;
    float confidence = 0.0f;
};

// Sent to the recognition gateway for every finalized speech segment.
// Same lifetime rule for `samples` as VadRequest.
struct RecognitionRequest {
    std::string stream_id;
    uint64_t id = 0;               // dispatch sequence, consecutive within a stream instance
    const int16_t* samples = nullptr;
    int n_samples = 0;
    int sample_rate = 16000;
    double start_time = 0.0;
    double end_time = 0.0;
    bool contiguous = true;        // false when pauses inside the utterance were left out of `samples`
    bool diarize = false;
    std::string speaker_id;        // empty in mixed mode
    std::string prompt;            // recent conversation text, may be empty
};

struct RecognitionReply {
    std::string stream_id;
    uint64_t id = 0;
    bool valid = false;            // false = malformed / failed recognition
    std::string text;
    std::string speaker_id;
    float confidence = 0.0f;
    // Session seconds; negative = use request times. Ignored unless the request
    // was contiguous and the times fall inside its span.
    double start = -1.0;
    double end = -1.0;
};

struct TranscriptionSegment {
    std::string stream_id;
    std::string speaker_id;
    std::string text;
    float confidence = 0.0f;
    double start = 0.0;
    double end = 0.0;
    uint64_t sequence = 0;         // dispatch sequence within the stream
    bool gap = false;              // released without a usable reply
    bool forced = false;           // cut by the overflow bound
};

struct StreamStats {
    uint64_t frames = 0;
    uint64_t samples = 0;
    uint64_t packets = 0;
    uint64_t verdicts = 0;             // replies matched to a pending packet
    uint64_t verdicts_timed_out = 0;
    uint64_t verdicts_evicted = 0;     // oldest packet forced to non-speech by the outstanding bound
    uint64_t verdicts_rejected = 0;    // unknown, duplicate or late replies
    uint64_t segments_dispatched = 0;
    uint64_t segments_forced = 0;
    uint64_t fragments_discarded = 0;
    uint64_t transcripts_released = 0;
    uint64_t gaps = 0;
    uint64_t replies_rejected = 0;
    uint64_t messages_dropped = 0;     // mailbox full
    int vad_outstanding = 0;
    int recognitions_in_flight = 0;
};

}  // namespace speechseg
