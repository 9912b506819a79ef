#include "stream_registry.h"
#include "stream.h"

#include <cstdio>
#include <utility>

namespace speechseg {

static SamplePool make_pool(const EngineConfig& config) {
    StreamLimits limits = stream_limits_from_config(config);
    return SamplePool(config.max_streams, limits.packet_samples, limits.max_outstanding,
                      limits.max_speech_samples);
}

StreamRegistry::StreamRegistry(const EngineConfig& config, const EngineCallbacks& callbacks,
                               ConversationContext* context)
    : config_(config),
      callbacks_(callbacks),
      context_(context),
      pool_(make_pool(config)) {}

StreamRegistry::~StreamRegistry() {
    release_all();
}

std::shared_ptr<StreamWorker> StreamRegistry::acquire(const std::string& stream_id) {
    std::lock_guard<std::mutex> lock(mtx_);

    auto it = streams_.find(stream_id);
    if (it != streams_.end()) {
        return it->second;
    }

    PoolSlot slot;
    if (!pool_.acquire(slot)) {
        fprintf(stderr, "ERROR: [registry] cannot create stream '%s': all %d slots in use\n",
                stream_id.c_str(), pool_.max_slots());
        return nullptr;
    }

    // Every instance gets its own 2^32 id range, so replies addressed to a
    // released instance never match its successor
    const uint64_t id_base = instances_++ << 32;
    std::unique_ptr<Stream> stream(new Stream(stream_id, slot, config_, callbacks_, context_, id_base));
    auto worker = std::make_shared<StreamWorker>(std::move(stream), config_.mailbox_capacity, config_.clock);
    streams_[stream_id] = worker;

    fprintf(stderr, "[registry] stream '%s' created (slot %d, %d live)\n",
            stream_id.c_str(), slot.index, static_cast<int>(streams_.size()));
    return worker;
}

std::shared_ptr<StreamWorker> StreamRegistry::find(const std::string& stream_id) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = streams_.find(stream_id);
    if (it == streams_.end()) {
        return nullptr;
    }
    return it->second;
}

bool StreamRegistry::release(const std::string& stream_id) {
    std::shared_ptr<StreamWorker> worker;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = streams_.find(stream_id);
        if (it == streams_.end()) {
            return false;
        }
        worker = std::move(it->second);
        streams_.erase(it);
    }

    stop_and_recycle(worker);
    fprintf(stderr, "[registry] stream '%s' released\n", stream_id.c_str());
    return true;
}

void StreamRegistry::release_all() {
    std::unordered_map<std::string, std::shared_ptr<StreamWorker>> streams;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        streams.swap(streams_);
    }
    for (auto& kv : streams) {
        stop_and_recycle(kv.second);
    }
}

void StreamRegistry::stop_and_recycle(const std::shared_ptr<StreamWorker>& worker) {
    // Join outside the registry lock so other streams keep flowing
    worker->stop();

    std::lock_guard<std::mutex> lock(mtx_);
    pool_.release(worker->slot_index());
}

std::vector<std::shared_ptr<StreamWorker>> StreamRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<std::shared_ptr<StreamWorker>> out;
    out.reserve(streams_.size());
    for (const auto& kv : streams_) {
        out.push_back(kv.second);
    }
    return out;
}

int StreamRegistry::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return static_cast<int>(streams_.size());
}

}  // namespace speechseg
