#pragma once

#include <cstdint>
#include <vector>

namespace speechseg {

struct SampleRegion {
    int16_t* data = nullptr;
    int capacity = 0;
};

// Regions handed to one stream for its whole lifetime.
struct PoolSlot {
    int index = -1;
    SampleRegion packet;    // one packet being filled
    SampleRegion pending;   // ring of max_outstanding packets awaiting a verdict
    SampleRegion speech;    // speech buffer, overflow bound
};

// Fixed-capacity PCM storage, one slot per live stream. All memory is
// allocated up front; slots are reused after release. Not thread-safe.
class SamplePool {
public:
    SamplePool(int max_slots, int packet_samples, int max_outstanding, int speech_samples);

    bool acquire(PoolSlot& slot);
    void release(int index);

    int max_slots() const;
    int slots_in_use() const;

private:
    std::vector<int16_t> storage_;
    std::vector<int> free_slots_;
    std::vector<bool> in_use_;
    int packet_samples_;
    int pending_samples_;
    int speech_samples_;
    int64_t slot_stride_;
};

}  // namespace speechseg
