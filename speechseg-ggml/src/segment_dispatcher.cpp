#include "segment_dispatcher.h"
#include "conversation_context.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace speechseg {

const char* reply_status_name(ReplyStatus status) {
    switch (status) {
        case ReplyStatus::Released:  return "released";
        case ReplyStatus::Malformed: return "malformed";
        case ReplyStatus::Unmatched: return "unmatched";
        case ReplyStatus::Duplicate: return "duplicate";
    }
    return "?";
}

// Audio shorter than its capture span by more than this had pauses cut out.
static const double kSpanTolerance = 0.01;

SegmentDispatcher::SegmentDispatcher(const DispatcherConfig& config, ConversationContext* context,
                                     recognition_submit_callback submit, transcript_callback deliver,
                                     void* user_data)
    : config_(config),
      context_(context),
      submit_(submit),
      deliver_(deliver),
      user_data_(user_data),
      next_sequence_(config.first_sequence),
      next_release_(config.first_sequence),
      released_(0),
      gaps_(0) {}

uint64_t SegmentDispatcher::dispatch(const SpeechSegment& segment, double now) {
    const uint64_t sequence = next_sequence_++;

    Slot& slot = slots_[sequence];
    slot.dispatch_time = now;
    slot.start = segment.start_time;
    slot.end = segment.end_time;
    const double audio_seconds = static_cast<double>(segment.n_samples) / config_.sample_rate;
    slot.contiguous = std::fabs((segment.end_time - segment.start_time) - audio_seconds) <= kSpanTolerance;
    slot.forced = segment.forced;
    slot.done = false;

    RecognitionRequest request;
    request.stream_id = config_.stream_id;
    request.id = sequence;
    request.samples = segment.samples;
    request.n_samples = segment.n_samples;
    request.sample_rate = config_.sample_rate;
    request.start_time = segment.start_time;
    request.end_time = segment.end_time;
    request.contiguous = slot.contiguous;
    request.diarize = config_.diarize;
    request.speaker_id = config_.speaker_id;
    if (context_) {
        request.prompt = context_->build_prompt(segment.start_time);
    }

    if (submit_) {
        submit_(request, user_data_);
    }
    return sequence;
}

ReplyStatus SegmentDispatcher::on_reply(const RecognitionReply& reply) {
    auto it = slots_.find(reply.id);
    if (it == slots_.end()) {
        return ReplyStatus::Unmatched;
    }

    Slot& slot = it->second;
    if (slot.done) {
        return ReplyStatus::Duplicate;
    }

    if (!reply.valid) {
        mark_gap(reply.id, slot);
        release_ready();
        return ReplyStatus::Malformed;
    }

    TranscriptionSegment& seg = slot.segment;
    seg.stream_id = config_.stream_id;
    seg.speaker_id = reply.speaker_id.empty() ? config_.speaker_id : reply.speaker_id;
    seg.text = reply.text;
    seg.confidence = reply.confidence;
    apply_times(reply, slot, seg);
    seg.sequence = reply.id;
    seg.gap = false;
    seg.forced = slot.forced;
    slot.done = true;

    release_ready();
    return ReplyStatus::Released;
}

void SegmentDispatcher::apply_times(const RecognitionReply& reply, const Slot& slot,
                                    TranscriptionSegment& seg) const {
    seg.start = slot.start;
    seg.end = slot.end;
    if (!slot.contiguous || reply.start < 0.0 || reply.end <= reply.start) {
        return;
    }
    if (reply.start < slot.start - kSpanTolerance || reply.end > slot.end + kSpanTolerance) {
        return;
    }
    const double start = std::max(reply.start, slot.start);
    const double end = std::min(reply.end, slot.end);
    if (end > start) {
        seg.start = start;
        seg.end = end;
    }
}

int SegmentDispatcher::expire(double now) {
    int expired = 0;
    while (!slots_.empty()) {
        auto head = slots_.begin();
        Slot& slot = head->second;
        if (slot.done || now - slot.dispatch_time < config_.reorder_timeout) {
            break;
        }
        mark_gap(head->first, slot);
        expired += 1;
        release_ready();
    }
    return expired;
}

void SegmentDispatcher::mark_gap(uint64_t sequence, Slot& slot) {
    TranscriptionSegment& seg = slot.segment;
    seg.stream_id = config_.stream_id;
    seg.speaker_id = config_.speaker_id;
    seg.text.clear();
    seg.confidence = 0.0f;
    seg.start = slot.start;
    seg.end = slot.end;
    seg.sequence = sequence;
    seg.gap = true;
    seg.forced = slot.forced;
    slot.done = true;
}

void SegmentDispatcher::release_ready() {
    while (!slots_.empty()) {
        auto head = slots_.begin();
        if (head->first != next_release_ || !head->second.done) {
            break;
        }

        TranscriptionSegment seg = std::move(head->second.segment);
        slots_.erase(head);
        next_release_ += 1;
        released_ += 1;
        if (seg.gap) {
            gaps_ += 1;
        } else if (context_) {
            context_->add(seg.start, seg.end, seg.text, seg.speaker_id);
        }

        if (deliver_) {
            deliver_(seg, user_data_);
        }
    }
}

void SegmentDispatcher::clear() {
    slots_.clear();
    next_release_ = next_sequence_;
}

int SegmentDispatcher::in_flight() const {
    return static_cast<int>(slots_.size());
}

uint64_t SegmentDispatcher::next_sequence() const {
    return next_sequence_;
}

}  // namespace speechseg
