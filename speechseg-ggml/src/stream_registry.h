#pragma once

#include "sample_pool.h"
#include "speechseg.h"
#include "stream_worker.h"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace speechseg {

class ConversationContext;

// Owns the live streams and their pool slots. The map and the pool are the
// only state shared across streams; everything else belongs to one worker.
class StreamRegistry {
public:
    StreamRegistry(const EngineConfig& config, const EngineCallbacks& callbacks,
                   ConversationContext* context);
    ~StreamRegistry();

    StreamRegistry(const StreamRegistry&) = delete;
    StreamRegistry& operator=(const StreamRegistry&) = delete;

    // Returns the existing stream or creates it. nullptr when the pool is exhausted.
    std::shared_ptr<StreamWorker> acquire(const std::string& stream_id);

    std::shared_ptr<StreamWorker> find(const std::string& stream_id) const;

    // Stops the worker and returns its slot. False if the id is not live.
    bool release(const std::string& stream_id);
    void release_all();

    std::vector<std::shared_ptr<StreamWorker>> snapshot() const;
    int size() const;

private:
    void stop_and_recycle(const std::shared_ptr<StreamWorker>& worker);

    EngineConfig config_;
    EngineCallbacks callbacks_;
    ConversationContext* context_;

    mutable std::mutex mtx_;
    SamplePool pool_;
    std::unordered_map<std::string, std::shared_ptr<StreamWorker>> streams_;
    uint64_t instances_ = 0;
};

}  // namespace speechseg
