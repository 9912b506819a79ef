#include "sample_pool.h"

#include <cstddef>

namespace speechseg {

SamplePool::SamplePool(int max_slots, int packet_samples, int max_outstanding, int speech_samples)
    : packet_samples_(packet_samples),
      pending_samples_(packet_samples * max_outstanding),
      speech_samples_(speech_samples),
      slot_stride_(static_cast<int64_t>(packet_samples) * (1 + max_outstanding) + speech_samples) {
    if (max_slots < 0) {
        max_slots = 0;
    }
    storage_.assign(static_cast<size_t>(slot_stride_ * max_slots), 0);
    in_use_.assign(static_cast<size_t>(max_slots), false);

    // Hand out low indices first
    free_slots_.reserve(static_cast<size_t>(max_slots));
    for (int i = max_slots - 1; i >= 0; --i) {
        free_slots_.push_back(i);
    }
}

bool SamplePool::acquire(PoolSlot& slot) {
    if (free_slots_.empty()) {
        return false;
    }

    const int index = free_slots_.back();
    free_slots_.pop_back();
    in_use_[index] = true;

    int16_t* base = storage_.data() + slot_stride_ * index;
    slot.index = index;
    slot.packet.data = base;
    slot.packet.capacity = packet_samples_;
    slot.pending.data = base + packet_samples_;
    slot.pending.capacity = pending_samples_;
    slot.speech.data = base + packet_samples_ + pending_samples_;
    slot.speech.capacity = speech_samples_;
    return true;
}

void SamplePool::release(int index) {
    if (index < 0 || index >= static_cast<int>(in_use_.size()) || !in_use_[index]) {
        return;
    }
    in_use_[index] = false;
    free_slots_.push_back(index);
}

int SamplePool::max_slots() const {
    return static_cast<int>(in_use_.size());
}

int SamplePool::slots_in_use() const {
    return max_slots() - static_cast<int>(free_slots_.size());
}

}  // namespace speechseg
