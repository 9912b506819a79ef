#include "stream.h"
#include "conversation_context.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace speechseg {

static int samples_for(double seconds, int sample_rate) {
    return static_cast<int>(std::lround(seconds * sample_rate));
}

StreamLimits stream_limits_from_config(const EngineConfig& config) {
    StreamLimits limits;
    limits.sample_rate = config.sample_rate;
    limits.packet_samples = samples_for(config.packet_duration, config.sample_rate);
    limits.segment_samples = samples_for(config.segment_duration, config.sample_rate);
    limits.min_speech_samples = samples_for(config.min_speech_duration, config.sample_rate);
    limits.max_speech_samples = samples_for(config.max_speech_duration, config.sample_rate);
    limits.max_outstanding = std::max(1, config.max_outstanding_vad);
    return limits;
}

static SegmentPolicy make_policy(const StreamLimits& limits, const EngineConfig& config) {
    SegmentPolicy policy;
    policy.sample_rate = limits.sample_rate;
    policy.segment_samples = limits.segment_samples;
    policy.min_speech_samples = limits.min_speech_samples;
    policy.silence_timeout = config.silence_timeout;
    return policy;
}

static DispatcherConfig make_dispatcher_config(const std::string& stream_id, const EngineConfig& config,
                                               uint64_t id_base) {
    DispatcherConfig dc;
    dc.stream_id = stream_id;
    dc.speaker_id = config.individual_mode ? stream_id : std::string();
    dc.sample_rate = config.sample_rate;
    dc.diarize = config.diarize;
    dc.reorder_timeout = config.reorder_timeout;
    dc.first_sequence = id_base + 1;
    return dc;
}

Stream::Stream(const std::string& stream_id, const PoolSlot& slot, const EngineConfig& config,
               const EngineCallbacks& callbacks, ConversationContext* context, uint64_t id_base)
    : stream_id_(stream_id),
      slot_index_(slot.index),
      config_(config),
      callbacks_(callbacks),
      limits_(stream_limits_from_config(config)),
      accumulator_(slot.packet, config.sample_rate, id_base + 1),
      tracker_(slot.pending, limits_.packet_samples, limits_.max_outstanding, config.vad_timeout),
      speech_(slot.speech, make_policy(limits_, config), &Stream::segment_ready, this),
      dispatcher_(make_dispatcher_config(stream_id, config, id_base), context,
                  &Stream::submit_recognition, &Stream::deliver_transcript, this),
      now_(0.0) {}

void Stream::on_frame(const int16_t* samples, int n, double capture_time, double now) {
    if (samples == nullptr || n <= 0) {
        return;
    }
    now_ = now;
    stats_.frames += 1;
    stats_.samples += static_cast<uint64_t>(n);
    accumulator_.push(samples, n, capture_time, &Stream::packet_ready, this);
}

void Stream::on_vad_reply(const VadReply& reply, double now) {
    now_ = now;
    VerdictStatus status = tracker_.resolve(reply.id, reply.is_speech, &Stream::packet_resolved, this);
    if (status != VerdictStatus::Accepted) {
        stats_.verdicts_rejected += 1;
        if (config_.verbose) {
            fprintf(stderr, "[vad] %s: dropped %s verdict id=%llu (head=%llu)\n",
                    stream_id_.c_str(), verdict_status_name(status),
                    static_cast<unsigned long long>(reply.id),
                    static_cast<unsigned long long>(tracker_.head()));
        }
        return;
    }
    stats_.verdicts += 1;
}

void Stream::on_recognition_reply(const RecognitionReply& reply, double now) {
    now_ = now;
    ReplyStatus status = dispatcher_.on_reply(reply);
    if (status == ReplyStatus::Unmatched || status == ReplyStatus::Duplicate) {
        stats_.replies_rejected += 1;
        if (config_.verbose) {
            fprintf(stderr, "[dispatch] %s: dropped %s reply seq=%llu\n",
                    stream_id_.c_str(), reply_status_name(status),
                    static_cast<unsigned long long>(reply.id));
        }
    } else if (status == ReplyStatus::Malformed) {
        fprintf(stderr, "WARNING: [dispatch] %s: malformed reply seq=%llu released as gap\n",
                stream_id_.c_str(), static_cast<unsigned long long>(reply.id));
    }
}

void Stream::on_tick(double now) {
    now_ = now;

    const int expired = tracker_.expire(now, &Stream::packet_resolved, this);
    if (expired > 0 && config_.verbose) {
        fprintf(stderr, "[vad] %s: %d verdict(s) timed out, treated as non-speech\n",
                stream_id_.c_str(), expired);
    }

    const uint64_t discarded = speech_.discarded();
    if (speech_.tick(now) && config_.verbose) {
        fprintf(stderr, "[segment] %s: silence timeout, utterance %s\n", stream_id_.c_str(),
                speech_.discarded() > discarded ? "discarded (too short)" : "finalized");
    }
    stats_.fragments_discarded = speech_.discarded();

    const int gaps = dispatcher_.expire(now);
    if (gaps > 0) {
        fprintf(stderr, "WARNING: [dispatch] %s: %d recognition reply(s) timed out, released as gap\n",
                stream_id_.c_str(), gaps);
    }
}

void Stream::finalize(double now) {
    now_ = now;
    const bool emitted = speech_.finalize();
    stats_.fragments_discarded = speech_.discarded();
    if (config_.verbose) {
        fprintf(stderr, "[segment] %s: finalize (%s)\n", stream_id_.c_str(),
                emitted ? "segment emitted" : "nothing emitted");
    }
}

void Stream::cancel() {
    if (config_.verbose) {
        fprintf(stderr, "[registry] %s: cancel (%d verdict(s) pending, %d recognition(s) in flight, %d samples dropped)\n",
                stream_id_.c_str(), tracker_.outstanding(), dispatcher_.in_flight(), speech_.size());
    }
    tracker_.clear();
    dispatcher_.clear();
    speech_.reset();
    accumulator_.reset();
}

StreamStats Stream::stats() const {
    StreamStats s = stats_;
    s.vad_outstanding = tracker_.outstanding();
    s.recognitions_in_flight = dispatcher_.in_flight();
    s.segments_forced = speech_.forced();
    s.fragments_discarded = speech_.discarded();
    s.transcripts_released = dispatcher_.released();
    s.gaps = dispatcher_.gaps();
    return s;
}

void Stream::packet_ready(const Packet& packet, void* user_data) {
    auto* self = static_cast<Stream*>(user_data);
    self->stats_.packets += 1;

    const int16_t* copy = self->tracker_.track(packet, self->now_, &Stream::packet_resolved, self);

    if (self->callbacks_.on_vad_request) {
        VadRequest request;
        request.stream_id = self->stream_id_;
        request.id = packet.id;
        request.samples = copy;
        request.n_samples = packet.n_samples;
        request.sample_rate = self->limits_.sample_rate;
        request.capture_time = packet.capture_time;
        self->callbacks_.on_vad_request(request, self->callbacks_.user_data);
    }
}

void Stream::packet_resolved(const ResolvedPacket& packet, void* user_data) {
    auto* self = static_cast<Stream*>(user_data);

    if (packet.origin == VerdictOrigin::Timeout) {
        self->stats_.verdicts_timed_out += 1;
    } else if (packet.origin == VerdictOrigin::Evicted) {
        self->stats_.verdicts_evicted += 1;
        if (self->config_.verbose) {
            fprintf(stderr, "[vad] %s: packet id=%llu evicted by outstanding bound, treated as non-speech\n",
                    self->stream_id_.c_str(), static_cast<unsigned long long>(packet.id));
        }
    }

    self->speech_.on_verdict(packet.samples, packet.n_samples, packet.capture_time,
                             packet.is_speech, self->now_);
}

void Stream::segment_ready(const SpeechSegment& segment, void* user_data) {
    auto* self = static_cast<Stream*>(user_data);
    self->stats_.segments_dispatched += 1;

    if (self->config_.verbose) {
        fprintf(stderr, "[segment] %s: %s segment %.3fs (%.3f - %.3f)\n",
                self->stream_id_.c_str(), segment.forced ? "overflow" : "speech",
                static_cast<double>(segment.n_samples) / self->limits_.sample_rate,
                segment.start_time, segment.end_time);
    }
    self->dispatcher_.dispatch(segment, self->now_);
}

void Stream::submit_recognition(const RecognitionRequest& request, void* user_data) {
    auto* self = static_cast<Stream*>(user_data);
    if (self->callbacks_.on_recognition_request) {
        self->callbacks_.on_recognition_request(request, self->callbacks_.user_data);
    }
}

void Stream::deliver_transcript(const TranscriptionSegment& segment, void* user_data) {
    auto* self = static_cast<Stream*>(user_data);
    if (self->callbacks_.on_segment) {
        self->callbacks_.on_segment(segment, self->callbacks_.user_data);
    }
}

}  // namespace speechseg
