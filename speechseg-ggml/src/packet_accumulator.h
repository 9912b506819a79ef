#pragma once

#include "sample_pool.h"

#include <cstdint>

namespace speechseg {

struct Packet {
    uint64_t id;
    const int16_t* samples;  // valid only inside the callback
    int n_samples;
    double capture_time;     // timestamp of the first sample
};

typedef void (*packet_callback)(const Packet& packet, void* user_data);

// Reshapes frames of arbitrary length into packets of exactly
// `packet_samples`, carrying the remainder into the next packet.
class PacketAccumulator {
public:
    PacketAccumulator(SampleRegion region, int sample_rate, uint64_t first_id = 1);

    // Returns the number of packets emitted through `cb`.
    int push(const int16_t* samples, int n, double capture_time,
             packet_callback cb, void* user_data);

    // Drops the partial packet. Ids keep counting.
    void reset();

    int size() const;
    int packet_samples() const;
    uint64_t next_id() const;

private:
    SampleRegion region_;
    int sample_rate_;
    int fill_;
    double fill_start_time_;
    uint64_t next_id_;
};

}  // namespace speechseg
