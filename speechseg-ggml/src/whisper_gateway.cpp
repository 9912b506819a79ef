#include "whisper_gateway.h"
#include "whisper.h"

#include <algorithm>
#include <condition_variable>
#include <cstdio>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace speechseg {

static void pcm16_to_float(const int16_t* in, int n, std::vector<float>& out) {
    out.resize(static_cast<size_t>(n));
    for (int i = 0; i < n; ++i) {
        out[i] = static_cast<float>(in[i]) / 32768.0f;
    }
}

static void silence_whisper_logs() {
    whisper_log_set([](enum ggml_log_level, const char*, void*){}, nullptr);
}

// ============================================================================
// Voice activity
// ============================================================================

struct PendingVad {
    std::string stream_id;
    uint64_t id;
    std::vector<int16_t> samples;
};

struct WhisperVadGateway {
    whisper_vad_context* vctx = nullptr;
    Engine* engine = nullptr;
    WhisperVadConfig config;

    std::thread worker;
    std::mutex mtx;
    std::condition_variable cv;
    std::deque<PendingVad> queue;
    bool busy = false;
    bool shutdown = false;
};

static void vad_worker_loop(WhisperVadGateway* gw) {
    std::vector<float> audio;
    while (true) {
        PendingVad req;
        {
            std::unique_lock<std::mutex> lock(gw->mtx);
            gw->cv.wait(lock, [gw]{ return !gw->queue.empty() || gw->shutdown; });
            if (gw->shutdown) return;
            req = std::move(gw->queue.front());
            gw->queue.pop_front();
            gw->busy = true;
        }

        pcm16_to_float(req.samples.data(), static_cast<int>(req.samples.size()), audio);

        VadReply reply;
        reply.stream_id = req.stream_id;
        reply.id = req.id;

        if (whisper_vad_detect_speech(gw->vctx, audio.data(), static_cast<int>(audio.size()))) {
            const int n_probs = whisper_vad_n_probs(gw->vctx);
            const float* probs = whisper_vad_probs(gw->vctx);
            float max_prob = 0.0f;
            for (int i = 0; i < n_probs; ++i) {
                max_prob = std::max(max_prob, probs[i]);
            }
            reply.is_speech = max_prob >= gw->config.threshold;
            reply.confidence = reply.is_speech ? max_prob : 1.0f - max_prob;
        } else {
            // Unanswered packets time out as non-speech in the engine anyway
            fprintf(stderr, "ERROR: whisper_vad_detect_speech failed (stream %s, id %llu)\n",
                    req.stream_id.c_str(), static_cast<unsigned long long>(req.id));
            std::lock_guard<std::mutex> lock(gw->mtx);
            gw->busy = false;
            continue;
        }

        engine_on_vad_reply(gw->engine, reply);

        std::lock_guard<std::mutex> lock(gw->mtx);
        gw->busy = false;
    }
}

WhisperVadGateway* whisper_vad_gateway_init(const WhisperVadConfig& config, Engine* engine) {
    if (!engine || !config.vad_model_path) {
        fprintf(stderr, "ERROR: whisper_vad_gateway_init requires an engine and a VAD model path\n");
        return nullptr;
    }

    if (config.no_prints) {
        silence_whisper_logs();
    }

    whisper_vad_context_params vparams = whisper_vad_default_context_params();
    vparams.n_threads = config.n_threads;
    vparams.use_gpu = config.use_gpu;

    whisper_vad_context* vctx = whisper_vad_init_from_file_with_params(config.vad_model_path, vparams);
    if (!vctx) {
        fprintf(stderr, "ERROR: failed to load VAD model from '%s'\n", config.vad_model_path);
        return nullptr;
    }

    auto* gw = new WhisperVadGateway();
    gw->vctx = vctx;
    gw->engine = engine;
    gw->config = config;
    gw->worker = std::thread(vad_worker_loop, gw);
    return gw;
}

void whisper_vad_gateway_submit(WhisperVadGateway* gw, const VadRequest& request) {
    if (!gw || !request.samples || request.n_samples <= 0) return;

    bool overloaded = false;
    {
        std::lock_guard<std::mutex> lock(gw->mtx);
        if (gw->shutdown) return;
        if (static_cast<int>(gw->queue.size()) >= gw->config.max_queue) {
            overloaded = true;
        } else {
            PendingVad req;
            req.stream_id = request.stream_id;
            req.id = request.id;
            req.samples.assign(request.samples, request.samples + request.n_samples);
            gw->queue.push_back(std::move(req));
        }
    }

    if (overloaded) {
        fprintf(stderr, "WARNING: [vad] queue full, packet %llu of %s answered as non-speech\n",
                static_cast<unsigned long long>(request.id), request.stream_id.c_str());
        VadReply reply;
        reply.stream_id = request.stream_id;
        reply.id = request.id;
        reply.is_speech = false;
        engine_on_vad_reply(gw->engine, reply);
        return;
    }
    gw->cv.notify_one();
}

int whisper_vad_gateway_pending(WhisperVadGateway* gw) {
    if (!gw) return 0;
    std::lock_guard<std::mutex> lock(gw->mtx);
    return static_cast<int>(gw->queue.size()) + (gw->busy ? 1 : 0);
}

void whisper_vad_gateway_free(WhisperVadGateway* gw) {
    if (!gw) return;

    {
        std::lock_guard<std::mutex> lock(gw->mtx);
        gw->shutdown = true;
        gw->cv.notify_one();
    }

    if (gw->worker.joinable()) {
        gw->worker.join();
    }

    if (gw->vctx) {
        whisper_vad_free(gw->vctx);
    }

    delete gw;
}

// ============================================================================
// Recognition
// ============================================================================

struct PendingRecognition {
    std::string stream_id;
    uint64_t id;
    std::vector<int16_t> samples;
    double start_time;
    double end_time;
    bool contiguous;
    bool diarize;
    std::string speaker_id;
    std::string prompt;
};

struct WhisperRecognizer {
    whisper_context* ctx = nullptr;
    Engine* engine = nullptr;
    WhisperRecognizerConfig config;
    std::string language;

    std::thread worker;
    std::mutex mtx;
    std::condition_variable cv;
    std::deque<PendingRecognition> queue;
    bool busy = false;
    bool shutdown = false;
};

static RecognitionReply recognize(WhisperRecognizer* r, const PendingRecognition& req) {
    RecognitionReply reply;
    reply.stream_id = req.stream_id;
    reply.id = req.id;
    reply.speaker_id = req.speaker_id;

    const WhisperRecognizerConfig& opts = r->config;
    auto strategy = (opts.beam_size > 1) ? WHISPER_SAMPLING_BEAM_SEARCH : WHISPER_SAMPLING_GREEDY;
    auto params = whisper_full_default_params(strategy);

    params.print_progress   = false;
    params.print_realtime   = false;
    params.print_timestamps = false;
    params.print_special    = false;
    params.single_segment   = false;
    params.no_context       = true;

    params.n_threads        = opts.n_threads;
    params.language         = r->language.empty() ? nullptr : r->language.c_str();
    params.translate        = opts.translate;
    params.temperature      = opts.temperature;
    params.temperature_inc  = opts.no_fallback ? 0.0f : opts.temperature_inc;
    if (strategy == WHISPER_SAMPLING_BEAM_SEARCH) {
        params.beam_search.beam_size = opts.beam_size;
    } else {
        params.greedy.best_of = opts.best_of;
    }
    params.no_speech_thold  = opts.no_speech_thold;
    params.suppress_blank   = opts.suppress_blank;
    params.tdrz_enable      = req.diarize;
    params.initial_prompt   = (opts.use_prompt && !req.prompt.empty()) ? req.prompt.c_str() : nullptr;

    std::vector<float> audio;
    pcm16_to_float(req.samples.data(), static_cast<int>(req.samples.size()), audio);

    int ret = whisper_full(r->ctx, params, audio.data(), static_cast<int>(audio.size()));
    if (ret != 0) {
        fprintf(stderr, "ERROR: whisper_full failed with code %d\n", ret);
        reply.valid = false;
        return reply;
    }

    const whisper_token eot = whisper_token_eot(r->ctx);
    double p_sum = 0.0;
    int p_count = 0;
    double first_t0 = -1.0;
    double last_t1 = -1.0;

    const int n_segments = whisper_full_n_segments(r->ctx);
    for (int seg = 0; seg < n_segments; seg++) {
        if (whisper_full_get_segment_no_speech_prob(r->ctx, seg) > 0.9f) continue;

        const char* text = whisper_full_get_segment_text(r->ctx, seg);
        if (!text || text[0] == '\0') continue;

        reply.text += text;
        if (req.diarize && whisper_full_get_segment_speaker_turn_next(r->ctx, seg)) {
            reply.text += " [SPEAKER_TURN]";
        }

        const double t0 = whisper_full_get_segment_t0(r->ctx, seg) * 0.01 + req.start_time;
        const double t1 = whisper_full_get_segment_t1(r->ctx, seg) * 0.01 + req.start_time;
        if (first_t0 < 0.0) first_t0 = t0;
        last_t1 = t1;

        const int n_tokens = whisper_full_n_tokens(r->ctx, seg);
        for (int t = 0; t < n_tokens; t++) {
            if (whisper_full_get_token_id(r->ctx, seg, t) >= eot) continue;
            p_sum += whisper_full_get_token_p(r->ctx, seg, t);
            p_count++;
        }
    }

    reply.valid = true;
    reply.confidence = p_count > 0 ? static_cast<float>(p_sum / p_count) : 0.0f;
    // Offsets only map to session time when no pause was cut out of the audio
    if (req.contiguous && first_t0 >= 0.0 && last_t1 > first_t0) {
        reply.start = first_t0;
        reply.end = std::min(last_t1, req.end_time);
    }
    return reply;
}

static void recognizer_worker_loop(WhisperRecognizer* r) {
    while (true) {
        PendingRecognition req;
        size_t queued = 0;
        {
            std::unique_lock<std::mutex> lock(r->mtx);
            r->cv.wait(lock, [r]{ return !r->queue.empty() || r->shutdown; });
            if (r->shutdown) return;
            req = std::move(r->queue.front());
            r->queue.pop_front();
            queued = r->queue.size();
            r->busy = true;
        }

        fprintf(stderr, "[recognizer] %s #%llu: %.3fs (start=%.3fs, queue: %zu)\n",
                req.stream_id.c_str(), static_cast<unsigned long long>(req.id),
                static_cast<double>(req.samples.size()) / WHISPER_SAMPLE_RATE,
                req.start_time, queued);

        RecognitionReply reply = recognize(r, req);
        engine_on_recognition_reply(r->engine, reply);

        std::lock_guard<std::mutex> lock(r->mtx);
        r->busy = false;
    }
}

WhisperRecognizer* whisper_recognizer_init(const WhisperRecognizerConfig& config, Engine* engine) {
    if (!engine || !config.whisper_model_path) {
        fprintf(stderr, "ERROR: whisper_recognizer_init requires an engine and a whisper model path\n");
        return nullptr;
    }

    auto cparams = whisper_context_default_params();
    cparams.use_gpu = config.use_gpu;
    cparams.flash_attn = config.flash_attn;
    cparams.gpu_device = config.gpu_device;

    if (config.no_prints) {
        silence_whisper_logs();
    }

    whisper_context* ctx = whisper_init_from_file_with_params(config.whisper_model_path, cparams);
    if (!ctx) {
        fprintf(stderr, "ERROR: failed to load whisper model from '%s'\n", config.whisper_model_path);
        return nullptr;
    }

    auto* r = new WhisperRecognizer();
    r->ctx = ctx;
    r->engine = engine;
    r->config = config;
    r->language = config.language ? config.language : "";
    r->worker = std::thread(recognizer_worker_loop, r);
    return r;
}

void whisper_recognizer_submit(WhisperRecognizer* r, const RecognitionRequest& request) {
    if (!r || !request.samples || request.n_samples <= 0) return;

    PendingRecognition req;
    req.stream_id = request.stream_id;
    req.id = request.id;
    req.samples.assign(request.samples, request.samples + request.n_samples);
    req.start_time = request.start_time;
    req.end_time = request.end_time;
    req.contiguous = request.contiguous;
    req.diarize = request.diarize;
    req.speaker_id = request.speaker_id;
    req.prompt = request.prompt;

    {
        std::lock_guard<std::mutex> lock(r->mtx);
        if (r->shutdown) return;
        if (static_cast<int>(r->queue.size()) < r->config.max_queue) {
            r->queue.push_back(std::move(req));
            r->cv.notify_one();
            return;
        }
    }

    // Answered as failed so the engine releases a gap at once
    fprintf(stderr, "WARNING: [recognizer] queue full, segment %llu of %s dropped\n",
            static_cast<unsigned long long>(request.id), request.stream_id.c_str());
    RecognitionReply reply;
    reply.stream_id = request.stream_id;
    reply.id = request.id;
    reply.speaker_id = request.speaker_id;
    reply.valid = false;
    engine_on_recognition_reply(r->engine, reply);
}

int whisper_recognizer_pending(WhisperRecognizer* r) {
    if (!r) return 0;
    std::lock_guard<std::mutex> lock(r->mtx);
    return static_cast<int>(r->queue.size()) + (r->busy ? 1 : 0);
}

void whisper_recognizer_free(WhisperRecognizer* r) {
    if (!r) return;

    {
        std::lock_guard<std::mutex> lock(r->mtx);
        r->shutdown = true;
        r->cv.notify_one();
    }

    if (r->worker.joinable()) {
        r->worker.join();
    }

    if (r->ctx) {
        whisper_free(r->ctx);
    }

    delete r;
}

}  // namespace speechseg
