#pragma once

#include "sample_pool.h"

#include <cstdint>

namespace speechseg {

enum class SpeechState {
    Idle,
    Accumulating,
};

const char* speech_state_name(SpeechState state);

struct SegmentPolicy {
    int sample_rate = 16000;
    int segment_samples = 40000;      // 0 = no target trimming
    int min_speech_samples = 8000;
    double silence_timeout = 1.0;     // seconds of wall-clock time since the last speech verdict
    // The overflow bound is the capacity of the speech region.
};

struct SpeechSegment {
    const int16_t* samples;  // valid only inside the callback
    int n_samples;
    double start_time;
    double end_time;
    bool forced;             // cut by the overflow bound
};

typedef void (*speech_segment_callback)(const SpeechSegment& segment, void* user_data);

// Speech/silence state machine of one stream. Fed with verdicts in packet
// order; emits segments through the callback given at construction.
class SpeechStateMachine {
public:
    SpeechStateMachine(SampleRegion region, const SegmentPolicy& policy,
                       speech_segment_callback cb, void* user_data);

    void on_verdict(const int16_t* samples, int n, double capture_time, bool is_speech, double now);

    // Applies the silence timeout without new input. Returns true if the
    // utterance was finalized (emitted or discarded).
    bool tick(double now);

    // Ends the current utterance now, honouring the minimum duration.
    // Returns true if a segment was emitted.
    bool finalize();

    // Drops the current utterance without emitting.
    void reset();

    SpeechState state() const;
    int size() const;
    int capacity() const;
    double last_speech() const;

    uint64_t emitted() const { return emitted_; }
    uint64_t forced() const { return forced_; }
    uint64_t discarded() const { return discarded_; }

private:
    void append_speech(const int16_t* samples, int n, double capture_time);
    void emit_front(int n, bool forced);
    void end_utterance();

    SampleRegion region_;
    SegmentPolicy policy_;
    speech_segment_callback cb_;
    void* user_data_;

    SpeechState state_;
    int size_;
    double start_time_;    // capture time of region_.data[0]
    double end_time_;      // capture time just past the last buffered sample
    double last_speech_;   // wall-clock time of the last speech verdict

    uint64_t emitted_;
    uint64_t forced_;
    uint64_t discarded_;
};

}  // namespace speechseg
