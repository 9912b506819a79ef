#include "correlation_tracker.h"

#include <algorithm>
#include <cstring>

namespace speechseg {

const char* verdict_status_name(VerdictStatus status) {
    switch (status) {
        case VerdictStatus::Accepted:  return "accepted";
        case VerdictStatus::Unknown:   return "unknown";
        case VerdictStatus::Duplicate: return "duplicate";
        case VerdictStatus::Late:      return "late";
    }
    return "?";
}

CorrelationTracker::CorrelationTracker(SampleRegion ring, int packet_samples, int max_outstanding, double timeout)
    : ring_(ring),
      packet_samples_(packet_samples),
      max_outstanding_(std::max(1, max_outstanding)),
      timeout_(timeout),
      entries_(static_cast<size_t>(std::max(1, max_outstanding))),
      head_(1),
      tail_(1) {}

CorrelationTracker::PendingVerdict& CorrelationTracker::entry(uint64_t id) {
    return entries_[static_cast<size_t>(id % static_cast<uint64_t>(max_outstanding_))];
}

int16_t* CorrelationTracker::samples_for(uint64_t id) {
    const int64_t slot = static_cast<int64_t>(id % static_cast<uint64_t>(max_outstanding_));
    return ring_.data + slot * packet_samples_;
}

const int16_t* CorrelationTracker::track(const Packet& packet, double now,
                                         resolved_callback cb, void* user_data) {
    if (head_ == tail_ && packet.id != tail_) {
        head_ = tail_ = packet.id;
    }

    while (tail_ - head_ >= static_cast<uint64_t>(max_outstanding_)) {
        PendingVerdict& oldest = entry(head_);
        if (!oldest.resolved) {
            oldest.resolved = true;
            oldest.is_speech = false;
            oldest.origin = VerdictOrigin::Evicted;
        }
        release_ready(cb, user_data);
    }

    PendingVerdict& pv = entry(packet.id);
    pv.id = packet.id;
    pv.capture_time = packet.capture_time;
    pv.dispatch_time = now;
    pv.resolved = false;
    pv.is_speech = false;
    pv.origin = VerdictOrigin::Reply;

    int16_t* copy = samples_for(packet.id);
    const int n = std::min(packet.n_samples, packet_samples_);
    std::memcpy(copy, packet.samples, sizeof(int16_t) * n);
    tail_ = packet.id + 1;
    return copy;
}

VerdictStatus CorrelationTracker::resolve(uint64_t id, bool is_speech,
                                          resolved_callback cb, void* user_data) {
    if (id >= tail_ || id == 0) {
        return VerdictStatus::Unknown;
    }
    if (id < head_) {
        return VerdictStatus::Late;
    }

    PendingVerdict& pv = entry(id);
    if (pv.resolved) {
        return VerdictStatus::Duplicate;
    }

    pv.resolved = true;
    pv.is_speech = is_speech;
    pv.origin = VerdictOrigin::Reply;
    release_ready(cb, user_data);
    return VerdictStatus::Accepted;
}

int CorrelationTracker::expire(double now, resolved_callback cb, void* user_data) {
    int expired = 0;
    for (uint64_t id = head_; id < tail_; ++id) {
        PendingVerdict& pv = entry(id);
        if (!pv.resolved && now - pv.dispatch_time >= timeout_) {
            pv.resolved = true;
            pv.is_speech = false;
            pv.origin = VerdictOrigin::Timeout;
            expired += 1;
        }
    }
    if (expired > 0) {
        release_ready(cb, user_data);
    }
    return expired;
}

void CorrelationTracker::release_ready(resolved_callback cb, void* user_data) {
    while (head_ < tail_) {
        PendingVerdict& pv = entry(head_);
        if (!pv.resolved) {
            break;
        }

        ResolvedPacket packet;
        packet.id = pv.id;
        packet.samples = samples_for(pv.id);
        packet.n_samples = packet_samples_;
        packet.capture_time = pv.capture_time;
        packet.is_speech = pv.is_speech;
        packet.origin = pv.origin;

        head_ += 1;
        if (cb) {
            cb(packet, user_data);
        }
    }
}

void CorrelationTracker::clear() {
    head_ = tail_;
    for (auto& pv : entries_) {
        pv = PendingVerdict();
    }
}

int CorrelationTracker::outstanding() const {
    return static_cast<int>(tail_ - head_);
}

uint64_t CorrelationTracker::head() const {
    return head_;
}

}  // namespace speechseg
