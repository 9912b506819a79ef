#pragma once

#include "speech_state_machine.h"
#include "speechseg_types.h"

#include <cstdint>
#include <map>
#include <string>

namespace speechseg {

class ConversationContext;

typedef void (*recognition_submit_callback)(const RecognitionRequest& request, void* user_data);
typedef void (*transcript_callback)(const TranscriptionSegment& segment, void* user_data);

struct DispatcherConfig {
    std::string stream_id;
    std::string speaker_id;   // empty in mixed mode
    int sample_rate = 16000;
    bool diarize = false;
    double reorder_timeout = 10.0;
    uint64_t first_sequence = 1;
};

enum class ReplyStatus {
    Released,    // accepted; released now or waiting for older replies
    Malformed,   // accepted as a gap
    Unmatched,   // unknown or already released sequence
    Duplicate,   // sequence already answered
};

const char* reply_status_name(ReplyStatus status);

// Sends segments to the recognition gateway and delivers the replies in
// dispatch order through a reorder buffer keyed by sequence number.
class SegmentDispatcher {
public:
    SegmentDispatcher(const DispatcherConfig& config, ConversationContext* context,
                      recognition_submit_callback submit, transcript_callback deliver,
                      void* user_data);

    // Returns the sequence number assigned to the segment.
    uint64_t dispatch(const SpeechSegment& segment, double now);

    ReplyStatus on_reply(const RecognitionReply& reply);

    // Releases the head as a gap while it is older than the reorder timeout.
    // Returns the number of gaps released.
    int expire(double now);

    // Forgets every in-flight segment; nothing is delivered.
    void clear();

    int in_flight() const;
    uint64_t next_sequence() const;
    uint64_t released() const { return released_; }
    uint64_t gaps() const { return gaps_; }

private:
    struct Slot {
        double dispatch_time = 0.0;
        double start = 0.0;
        double end = 0.0;
        bool contiguous = true;
        bool forced = false;
        bool done = false;
        TranscriptionSegment segment;
    };

    void apply_times(const RecognitionReply& reply, const Slot& slot, TranscriptionSegment& seg) const;
    void release_ready();
    void mark_gap(uint64_t sequence, Slot& slot);

    DispatcherConfig config_;
    ConversationContext* context_;
    recognition_submit_callback submit_;
    transcript_callback deliver_;
    void* user_data_;

    std::map<uint64_t, Slot> slots_;
    uint64_t next_sequence_;
    uint64_t next_release_;
    uint64_t released_;
    uint64_t gaps_;
};

}  // namespace speechseg
