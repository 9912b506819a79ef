#pragma once

#include "packet_accumulator.h"
#include "sample_pool.h"

#include <cstdint>
#include <vector>

namespace speechseg {

enum class VerdictOrigin {
    Reply,     // answered by the gateway
    Timeout,   // no answer within the timeout
    Evicted,   // pushed out by the outstanding bound
};

struct ResolvedPacket {
    uint64_t id;
    const int16_t* samples;  // valid only inside the callback
    int n_samples;
    double capture_time;
    bool is_speech;
    VerdictOrigin origin;
};

typedef void (*resolved_callback)(const ResolvedPacket& packet, void* user_data);

enum class VerdictStatus {
    Accepted,
    Unknown,     // id never issued
    Duplicate,   // already answered, still waiting for an older packet
    Late,        // already released (answered, timed out or evicted)
};

const char* verdict_status_name(VerdictStatus status);

// Pending voice-activity requests of one stream. Ids are issued consecutively,
// so the unreleased ids always form the window [head, tail) of at most
// `max_outstanding` entries, stored in a ring indexed by id % max_outstanding.
// Verdicts are released to `cb` strictly in id order.
class CorrelationTracker {
public:
    CorrelationTracker(SampleRegion ring, int packet_samples, int max_outstanding, double timeout);

    // Copies the packet into the ring and returns the copy, which stays
    // valid until the packet is released. Evicts the oldest pending packet
    // as non-speech first when the window is full.
    const int16_t* track(const Packet& packet, double now, resolved_callback cb, void* user_data);

    VerdictStatus resolve(uint64_t id, bool is_speech, resolved_callback cb, void* user_data);

    // Resolves every packet older than the timeout as non-speech.
    int expire(double now, resolved_callback cb, void* user_data);

    // Forgets everything; nothing is released.
    void clear();

    int outstanding() const;
    uint64_t head() const;

private:
    struct PendingVerdict {
        uint64_t id = 0;
        double capture_time = 0.0;
        double dispatch_time = 0.0;
        bool resolved = false;
        bool is_speech = false;
        VerdictOrigin origin = VerdictOrigin::Reply;
    };

    PendingVerdict& entry(uint64_t id);
    int16_t* samples_for(uint64_t id);
    void release_ready(resolved_callback cb, void* user_data);

    SampleRegion ring_;
    int packet_samples_;
    int max_outstanding_;
    double timeout_;
    std::vector<PendingVerdict> entries_;
    uint64_t head_;
    uint64_t tail_;
};

}  // namespace speechseg
