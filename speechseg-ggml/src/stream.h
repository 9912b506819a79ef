#pragma once

#include "correlation_tracker.h"
#include "packet_accumulator.h"
#include "sample_pool.h"
#include "segment_dispatcher.h"
#include "speech_state_machine.h"
#include "speechseg.h"

#include <string>

namespace speechseg {

class ConversationContext;

// Sample counts derived once from EngineConfig durations.
struct StreamLimits {
    int sample_rate;
    int packet_samples;
    int segment_samples;
    int min_speech_samples;
    int max_speech_samples;
    int max_outstanding;
};

StreamLimits stream_limits_from_config(const EngineConfig& config);

// All state of one audio stream. Single-threaded: every call must come from
// the stream's owner (its StreamWorker). `now` is wall-clock seconds.
class Stream {
public:
    // VAD ids and dispatch sequences start at id_base + 1.
    Stream(const std::string& stream_id, const PoolSlot& slot, const EngineConfig& config,
           const EngineCallbacks& callbacks, ConversationContext* context, uint64_t id_base = 0);

    Stream(const Stream&) = delete;
    Stream& operator=(const Stream&) = delete;

    void on_frame(const int16_t* samples, int n, double capture_time, double now);
    void on_vad_reply(const VadReply& reply, double now);
    void on_recognition_reply(const RecognitionReply& reply, double now);
    void on_tick(double now);
    void finalize(double now);

    // Cancels pending correlations and in-flight recognitions and drops the
    // unfinalized utterance. Nothing is emitted.
    void cancel();

    const std::string& id() const { return stream_id_; }
    int slot_index() const { return slot_index_; }
    SpeechState state() const { return speech_.state(); }
    StreamStats stats() const;

private:
    static void packet_ready(const Packet& packet, void* user_data);
    static void packet_resolved(const ResolvedPacket& packet, void* user_data);
    static void segment_ready(const SpeechSegment& segment, void* user_data);
    static void submit_recognition(const RecognitionRequest& request, void* user_data);
    static void deliver_transcript(const TranscriptionSegment& segment, void* user_data);

    std::string stream_id_;
    int slot_index_;
    EngineConfig config_;
    EngineCallbacks callbacks_;
    StreamLimits limits_;

    PacketAccumulator accumulator_;
    CorrelationTracker tracker_;
    SpeechStateMachine speech_;
    SegmentDispatcher dispatcher_;

    double now_;
    StreamStats stats_;
};

}  // namespace speechseg
