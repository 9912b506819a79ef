#include "packet_accumulator.h"

#include <algorithm>
#include <cstring>

namespace speechseg {

PacketAccumulator::PacketAccumulator(SampleRegion region, int sample_rate, uint64_t first_id)
    : region_(region),
      sample_rate_(sample_rate),
      fill_(0),
      fill_start_time_(0.0),
      next_id_(first_id) {}

int PacketAccumulator::push(const int16_t* samples, int n, double capture_time,
                            packet_callback cb, void* user_data) {
    if (samples == nullptr || n <= 0 || region_.capacity <= 0) {
        return 0;
    }

    int emitted = 0;
    int offset = 0;
    while (offset < n) {
        if (fill_ == 0) {
            fill_start_time_ = capture_time + static_cast<double>(offset) / sample_rate_;
        }

        const int take = std::min(region_.capacity - fill_, n - offset);
        std::memcpy(region_.data + fill_, samples + offset, sizeof(int16_t) * take);
        fill_ += take;
        offset += take;

        if (fill_ == region_.capacity) {
            Packet packet;
            packet.id = next_id_++;
            packet.samples = region_.data;
            packet.n_samples = fill_;
            packet.capture_time = fill_start_time_;
            fill_ = 0;
            if (cb) {
                cb(packet, user_data);
            }
            emitted += 1;
        }
    }

    return emitted;
}

void PacketAccumulator::reset() {
    fill_ = 0;
    fill_start_time_ = 0.0;
}

int PacketAccumulator::size() const {
    return fill_;
}

int PacketAccumulator::packet_samples() const {
    return region_.capacity;
}

uint64_t PacketAccumulator::next_id() const {
    return next_id_;
}

}  // namespace speechseg
