#include "speech_state_machine.h"

#include <algorithm>
#include <cstring>

namespace speechseg {

const char* speech_state_name(SpeechState state) {
    return state == SpeechState::Idle ? "IDLE" : "ACCUMULATING";
}

SpeechStateMachine::SpeechStateMachine(SampleRegion region, const SegmentPolicy& policy,
                                       speech_segment_callback cb, void* user_data)
    : region_(region),
      policy_(policy),
      cb_(cb),
      user_data_(user_data),
      state_(SpeechState::Idle),
      size_(0),
      start_time_(0.0),
      end_time_(0.0),
      last_speech_(0.0),
      emitted_(0),
      forced_(0),
      discarded_(0) {}

void SpeechStateMachine::on_verdict(const int16_t* samples, int n, double capture_time,
                                    bool is_speech, double now) {
    if (is_speech) {
        if (state_ == SpeechState::Idle) {
            state_ = SpeechState::Accumulating;
            size_ = 0;
            start_time_ = capture_time;
        }
        last_speech_ = now;
        append_speech(samples, n, capture_time);
        return;
    }

    if (state_ != SpeechState::Accumulating) {
        return;
    }

    // Overflow takes precedence over the silence rule
    if (size_ >= region_.capacity) {
        emit_front(size_, true);
    }
    tick(now);
}

bool SpeechStateMachine::tick(double now) {
    if (state_ != SpeechState::Accumulating) {
        return false;
    }
    if (now - last_speech_ < policy_.silence_timeout) {
        return false;
    }
    end_utterance();
    return true;
}

bool SpeechStateMachine::finalize() {
    if (state_ != SpeechState::Accumulating) {
        return false;
    }
    const bool emit = size_ > 0 && size_ >= policy_.min_speech_samples;
    end_utterance();
    return emit;
}

void SpeechStateMachine::reset() {
    state_ = SpeechState::Idle;
    size_ = 0;
}

void SpeechStateMachine::append_speech(const int16_t* samples, int n, double capture_time) {
    if (samples == nullptr || n <= 0 || region_.capacity <= 0) {
        return;
    }

    const double rate = static_cast<double>(policy_.sample_rate);
    int offset = 0;
    while (offset < n) {
        if (size_ == 0) {
            start_time_ = capture_time + offset / rate;
        }

        const int take = std::min(region_.capacity - size_, n - offset);
        std::memcpy(region_.data + size_, samples + offset, sizeof(int16_t) * take);
        size_ += take;
        offset += take;
        end_time_ = capture_time + offset / rate;

        if (size_ >= region_.capacity) {
            emit_front(size_, true);
        }
        if (policy_.segment_samples > 0) {
            while (size_ >= policy_.segment_samples) {
                emit_front(policy_.segment_samples, false);
            }
        }
    }
}

void SpeechStateMachine::emit_front(int n, bool forced) {
    n = std::min(n, size_);
    if (n <= 0) {
        return;
    }

    const double rate = static_cast<double>(policy_.sample_rate);
    SpeechSegment segment;
    segment.samples = region_.data;
    segment.n_samples = n;
    segment.start_time = start_time_;
    segment.end_time = end_time_ - (size_ - n) / rate;
    segment.forced = forced;

    if (cb_) {
        cb_(segment, user_data_);
    }
    emitted_ += 1;
    if (forced) {
        forced_ += 1;
    }

    const int rest = size_ - n;
    if (rest > 0) {
        std::memmove(region_.data, region_.data + n, sizeof(int16_t) * rest);
    }
    size_ = rest;
    start_time_ = segment.end_time;
}

void SpeechStateMachine::end_utterance() {
    if (size_ > 0) {
        if (size_ >= policy_.min_speech_samples) {
            emit_front(size_, false);
        } else {
            discarded_ += 1;
        }
    }
    state_ = SpeechState::Idle;
    size_ = 0;
}

SpeechState SpeechStateMachine::state() const {
    return state_;
}

int SpeechStateMachine::size() const {
    return size_;
}

int SpeechStateMachine::capacity() const {
    return region_.capacity;
}

double SpeechStateMachine::last_speech() const {
    return last_speech_;
}

}  // namespace speechseg
