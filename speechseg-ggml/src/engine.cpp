#include "speechseg.h"
#include "conversation_context.h"
#include "stream.h"
#include "stream_registry.h"

#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <memory>
#include <mutex>
#include <thread>

namespace speechseg {

struct Engine {
    EngineConfig config;
    EngineCallbacks callbacks;

    std::unique_ptr<ConversationContext> context;
    std::unique_ptr<StreamRegistry> registry;

    std::thread sweeper;
    std::mutex sweeper_mtx;
    std::condition_variable sweeper_cv;
    bool shutdown = false;
};

static void sweeper_loop(Engine* engine) {
    const auto period = std::chrono::duration<double>(engine->config.tick_interval);
    while (true) {
        {
            std::unique_lock<std::mutex> lock(engine->sweeper_mtx);
            engine->sweeper_cv.wait_for(lock, period, [engine] { return engine->shutdown; });
            if (engine->shutdown) return;
        }
        engine_tick(engine);
    }
}

bool engine_config_validate(const EngineConfig& config) {
    bool ok = true;
    auto fail = [&ok](const char* msg) {
        fprintf(stderr, "ERROR: invalid engine config: %s\n", msg);
        ok = false;
    };

    if (config.sample_rate <= 0) fail("sample_rate must be positive");
    if (config.packet_duration <= 0.0) fail("packet_duration must be positive");
    if (config.max_outstanding_vad < 1) fail("max_outstanding_vad must be at least 1");
    if (config.vad_timeout <= 0.0) fail("vad_timeout must be positive");
    if (config.segment_duration < 0.0) fail("segment_duration must not be negative");
    if (config.min_speech_duration < 0.0) fail("min_speech_duration must not be negative");
    if (config.max_speech_duration <= 0.0) fail("max_speech_duration must be positive");
    if (config.silence_timeout <= 0.0) fail("silence_timeout must be positive");
    if (config.reorder_timeout <= 0.0) fail("reorder_timeout must be positive");
    if (config.max_streams < 1) fail("max_streams must be at least 1");
    if (config.mailbox_capacity < 1) fail("mailbox_capacity must be at least 1");
    if (config.tick_interval <= 0.0) fail("tick_interval must be positive");
    if (!ok) {
        return false;
    }

    StreamLimits limits = stream_limits_from_config(config);
    if (limits.packet_samples < 1) {
        fail("packet_duration is shorter than one sample");
    }
    if (limits.max_speech_samples < limits.packet_samples) {
        fail("max_speech_duration must hold at least one packet");
    }
    if (limits.min_speech_samples > limits.max_speech_samples) {
        fail("min_speech_duration exceeds max_speech_duration");
    }
    return ok;
}

Engine* engine_init(const EngineConfig& config, const EngineCallbacks& callbacks) {
    if (!engine_config_validate(config)) {
        return nullptr;
    }

    auto* engine = new Engine();
    engine->config = config;
    engine->callbacks = callbacks;
    engine->context.reset(new ConversationContext(config.history_size));
    engine->registry.reset(new StreamRegistry(config, callbacks, engine->context.get()));

    StreamLimits limits = stream_limits_from_config(config);
    fprintf(stderr, "[engine] init: %s mode, %d Hz, packet %d, segment %d, min %d, max %d samples, silence %.2fs\n",
            config.individual_mode ? "individual" : "mixed", limits.sample_rate,
            limits.packet_samples, limits.segment_samples, limits.min_speech_samples,
            limits.max_speech_samples, config.silence_timeout);

    if (!config.individual_mode) {
        if (!engine->registry->acquire(MIXED_STREAM_ID)) {
            fprintf(stderr, "ERROR: failed to create mixed stream\n");
            delete engine;
            return nullptr;
        }
    }

    engine->sweeper = std::thread(sweeper_loop, engine);
    return engine;
}

// Mixed mode has a single stream whatever id the caller uses.
static std::string stream_key(const Engine* engine, const std::string& stream_id) {
    return engine->config.individual_mode ? stream_id : std::string(MIXED_STREAM_ID);
}

bool engine_create_stream(Engine* engine, const std::string& stream_id) {
    if (!engine) return false;
    return engine->registry->acquire(stream_key(engine, stream_id)) != nullptr;
}

bool engine_destroy_stream(Engine* engine, const std::string& stream_id) {
    if (!engine) return false;

    const std::string id = stream_key(engine, stream_id);
    auto worker = engine->registry->find(id);
    if (worker && worker->on_worker_thread()) {
        fprintf(stderr, "ERROR: engine_destroy_stream('%s') called from its own callback\n",
                id.c_str());
        return false;
    }
    return engine->registry->release(id);
}

bool engine_finalize_stream(Engine* engine, const std::string& stream_id) {
    if (!engine) return false;
    auto worker = engine->registry->find(stream_key(engine, stream_id));
    if (!worker) return false;
    return worker->post_finalize();
}

bool engine_push_frame(Engine* engine, const std::string& stream_id,
                       const int16_t* samples, int n_samples, double capture_time) {
    if (!engine || !samples || n_samples <= 0) return false;

    std::shared_ptr<StreamWorker> worker;
    if (engine->config.individual_mode) {
        worker = engine->registry->acquire(stream_id);
    } else {
        worker = engine->registry->find(stream_key(engine, stream_id));
    }
    if (!worker) {
        return false;
    }
    return worker->post_frame(samples, n_samples, capture_time);
}

bool engine_on_vad_reply(Engine* engine, const VadReply& reply) {
    if (!engine) return false;
    auto worker = engine->registry->find(reply.stream_id);
    if (!worker) return false;
    return worker->post_vad_reply(reply);
}

bool engine_on_recognition_reply(Engine* engine, const RecognitionReply& reply) {
    if (!engine) return false;
    auto worker = engine->registry->find(reply.stream_id);
    if (!worker) return false;
    return worker->post_recognition_reply(reply);
}

void engine_tick(Engine* engine) {
    if (!engine) return;
    for (const auto& worker : engine->registry->snapshot()) {
        worker->post_tick();
    }
}

void engine_wait_idle(Engine* engine) {
    if (!engine) return;
    for (const auto& worker : engine->registry->snapshot()) {
        worker->wait_idle();
    }
}

bool engine_get_stats(Engine* engine, const std::string& stream_id, StreamStats& stats) {
    if (!engine) return false;
    auto worker = engine->registry->find(stream_key(engine, stream_id));
    if (!worker) return false;
    stats = worker->stats();
    return true;
}

int engine_stream_count(Engine* engine) {
    if (!engine) return 0;
    return engine->registry->size();
}

void engine_free(Engine* engine) {
    if (!engine) return;

    {
        std::lock_guard<std::mutex> lock(engine->sweeper_mtx);
        engine->shutdown = true;
    }
    engine->sweeper_cv.notify_all();
    if (engine->sweeper.joinable()) {
        engine->sweeper.join();
    }

    engine->registry->release_all();
    fprintf(stderr, "[engine] free: done\n");
    delete engine;
}

}  // namespace speechseg
