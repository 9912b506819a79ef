#include "speechseg.h"
#include "whisper_gateway.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace speechseg;

static constexpr int SAMPLE_RATE = 16000;

// Frame sizes cycled during replay, in samples (20, 30 and 40 ms)
static const int FRAME_SIZES[] = {320, 480, 640};

// Engine clock for offline replay: audio time of the last pushed sample
static std::atomic<double> g_replay_time{0.0};

static double replay_clock() {
    return g_replay_time.load();
}

struct wav_header {
    char riff[4];
    uint32_t file_size;
    char wave[4];
    char fmt[4];
    uint32_t fmt_size;
    uint16_t audio_format;
    uint16_t num_channels;
    uint32_t sample_rate;
    uint32_t byte_rate;
    uint16_t block_align;
    uint16_t bits_per_sample;
};

struct wav_data_chunk {
    char id[4];
    uint32_t size;
};

static bool load_wav_file(const std::string& path, std::vector<int16_t>& samples, uint32_t& sample_rate) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        fprintf(stderr, "ERROR: Failed to open WAV file: %s\n", path.c_str());
        return false;
    }

    wav_header header;
    file.read(reinterpret_cast<char*>(&header), sizeof(wav_header));
    if (!file.good()) {
        fprintf(stderr, "ERROR: Failed to read WAV header\n");
        return false;
    }

    if (std::strncmp(header.riff, "RIFF", 4) != 0 || std::strncmp(header.wave, "WAVE", 4) != 0) {
        fprintf(stderr, "ERROR: Invalid WAV file format\n");
        return false;
    }
    if (header.audio_format != 1) {
        fprintf(stderr, "ERROR: Only PCM format supported\n");
        return false;
    }
    if (header.num_channels != 1) {
        fprintf(stderr, "ERROR: Only mono audio supported\n");
        return false;
    }
    if (header.bits_per_sample != 16) {
        fprintf(stderr, "ERROR: Only 16-bit audio supported\n");
        return false;
    }

    // Skip any chunk between fmt and data
    if (header.fmt_size > 16) {
        file.seekg(header.fmt_size - 16, std::ios::cur);
    }

    wav_data_chunk data_chunk;
    file.read(reinterpret_cast<char*>(&data_chunk), sizeof(wav_data_chunk));
    if (!file.good()) {
        fprintf(stderr, "ERROR: Failed to read WAV chunks\n");
        return false;
    }

    while (std::strncmp(data_chunk.id, "data", 4) != 0) {
        file.seekg(data_chunk.size, std::ios::cur);
        if (!file.read(reinterpret_cast<char*>(&data_chunk), sizeof(wav_data_chunk))) {
            fprintf(stderr, "ERROR: Data chunk not found\n");
            return false;
        }
    }

    samples.resize(data_chunk.size / sizeof(int16_t));
    file.read(reinterpret_cast<char*>(samples.data()), static_cast<std::streamsize>(samples.size() * sizeof(int16_t)));
    if (!file.good()) {
        fprintf(stderr, "ERROR: Failed to read WAV sample data\n");
        return false;
    }

    sample_rate = header.sample_rate;
    return true;
}

static std::string json_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '\\') {
            out += "\\\\";
        } else if (c == '"') {
            out += "\\\"";
        } else if (c == '\n') {
            out += "\\n";
        } else if (c == '\r') {
            out += "\\r";
        } else if (c == '\t') {
            out += "\\t";
        } else {
            out += c;
        }
    }
    return out;
}

static void write_segments_json(FILE* out, const std::vector<TranscriptionSegment>& segments) {
    std::fprintf(out, "{\n  \"segments\": [\n");
    for (size_t s = 0; s < segments.size(); ++s) {
        const TranscriptionSegment& seg = segments[s];
        std::fprintf(out, "    {\"stream\": \"%s\", \"speaker\": \"%s\", \"start\": %.3f, \"end\": %.3f, "
                          "\"confidence\": %.3f, \"gap\": %s, \"text\": \"%s\"}%s\n",
                     json_escape(seg.stream_id).c_str(),
                     json_escape(seg.speaker_id).c_str(),
                     seg.start,
                     seg.end,
                     seg.confidence,
                     seg.gap ? "true" : "false",
                     json_escape(seg.text).c_str(),
                     (s + 1 == segments.size() ? "" : ","));
    }
    std::fprintf(out, "  ]\n}\n");
}

struct Source {
    std::string stream_id;
    std::string path;
    std::vector<int16_t> samples;
    size_t offset = 0;
};

struct CallbackCtx {
    WhisperVadGateway* vad = nullptr;
    WhisperRecognizer* recognizer = nullptr;
    std::mutex mtx;
    std::vector<TranscriptionSegment> segments;
};

static void on_vad_request(const VadRequest& request, void* user_data) {
    auto* ctx = static_cast<CallbackCtx*>(user_data);
    whisper_vad_gateway_submit(ctx->vad, request);
}

static void on_recognition_request(const RecognitionRequest& request, void* user_data) {
    auto* ctx = static_cast<CallbackCtx*>(user_data);
    whisper_recognizer_submit(ctx->recognizer, request);
}

static void on_segment(const TranscriptionSegment& segment, void* user_data) {
    auto* ctx = static_cast<CallbackCtx*>(user_data);
    std::lock_guard<std::mutex> lock(ctx->mtx);
    if (segment.gap) {
        fprintf(stderr, "[%.2f - %.2f] %s: (no transcript)\n", segment.start, segment.end,
                segment.speaker_id.empty() ? segment.stream_id.c_str() : segment.speaker_id.c_str());
    } else {
        printf("[%.2f - %.2f] %s: %s\n", segment.start, segment.end,
               segment.speaker_id.empty() ? "speaker" : segment.speaker_id.c_str(),
               segment.text.c_str());
        fflush(stdout);
    }
    ctx->segments.push_back(segment);
}

static void print_usage(const char* program) {
    fprintf(stderr, "Usage: %s <audio.wav> [options]\n", program);
    fprintf(stderr, "       %s --speaker <id>=<audio.wav> [--speaker ...] [options]\n", program);
    fprintf(stderr, "\n");
    fprintf(stderr, "Positional arguments:\n");
    fprintf(stderr, "  audio.wav               Mixed input audio (16kHz mono PCM WAV)\n");
    fprintf(stderr, "\n");
    fprintf(stderr, "Options:\n");
    fprintf(stderr, "  --speaker <id>=<path>   One WAV file per speaker (individual mode)\n");
    fprintf(stderr, "  --whisper-model <path>  Whisper GGML model path\n");
    fprintf(stderr, "  --vad-model <path>      Silero VAD GGML model path\n");
    fprintf(stderr, "  --language <lang>       Whisper language code (default: en)\n");
    fprintf(stderr, "  --threads <n>           Whisper decoding threads (default: 4)\n");
    fprintf(stderr, "  --vad-threshold <p>     Speech probability threshold (default: 0.5)\n");
    fprintf(stderr, "  --segment <sec>         Target segment duration, 0 = none (default: 2.5)\n");
    fprintf(stderr, "  --min-speech <sec>      Minimum segment duration (default: 0.5)\n");
    fprintf(stderr, "  --max-speech <sec>      Overflow bound (default: 5.0)\n");
    fprintf(stderr, "  --silence <sec>         Silence timeout (default: 1.0)\n");
    fprintf(stderr, "  --diarize               Ask whisper for speaker turns (tinydiarize models)\n");
    fprintf(stderr, "  --no-gpu                Run whisper on the CPU\n");
    fprintf(stderr, "  -o, --output <path>     Output JSON file\n");
    fprintf(stderr, "  --realtime              Pace frames at 1x real-time speed on the wall clock\n");
    fprintf(stderr, "                          (default: replay on audio time, waiting for each reply)\n");
    fprintf(stderr, "  --verbose               Per-event engine diagnostics\n");
    fprintf(stderr, "  --no-prints             Silence whisper.cpp logging\n");
    fprintf(stderr, "  --help                  Print this help message\n");
}


// Blocks until `pending` reports nothing queued and the engine has applied
// every reply the gateway posted.
template <typename Gateway>
static void drain(Engine* engine, Gateway* gw, int (*pending)(Gateway*)) {
    while (true) {
        engine_wait_idle(engine);
        if (pending(gw) == 0) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    engine_wait_idle(engine);
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::vector<Source> sources;
    std::string mixed_path;
    const char* whisper_model = nullptr;
    const char* vad_model = nullptr;
    const char* language = "en";
    const char* output_path = nullptr;
    int n_threads = 4;
    float vad_threshold = 0.5f;
    bool realtime = false;
    bool no_prints = false;
    bool use_gpu = true;

    EngineConfig config;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--speaker") == 0 && i + 1 < argc) {
            const std::string arg = argv[++i];
            const size_t eq = arg.find('=');
            if (eq == std::string::npos || eq == 0 || eq + 1 == arg.size()) {
                fprintf(stderr, "Error: --speaker expects <id>=<path>, got '%s'\n", arg.c_str());
                return 1;
            }
            Source src;
            src.stream_id = arg.substr(0, eq);
            src.path = arg.substr(eq + 1);
            sources.push_back(src);
        } else if (strcmp(argv[i], "--whisper-model") == 0 && i + 1 < argc) {
            whisper_model = argv[++i];
        } else if (strcmp(argv[i], "--vad-model") == 0 && i + 1 < argc) {
            vad_model = argv[++i];
        } else if (strcmp(argv[i], "--language") == 0 && i + 1 < argc) {
            language = argv[++i];
        } else if (strcmp(argv[i], "--threads") == 0 && i + 1 < argc) {
            n_threads = atoi(argv[++i]);
        } else if (strcmp(argv[i], "--vad-threshold") == 0 && i + 1 < argc) {
            vad_threshold = static_cast<float>(atof(argv[++i]));
        } else if (strcmp(argv[i], "--segment") == 0 && i + 1 < argc) {
            config.segment_duration = atof(argv[++i]);
        } else if (strcmp(argv[i], "--min-speech") == 0 && i + 1 < argc) {
            config.min_speech_duration = atof(argv[++i]);
        } else if (strcmp(argv[i], "--max-speech") == 0 && i + 1 < argc) {
            config.max_speech_duration = atof(argv[++i]);
        } else if (strcmp(argv[i], "--silence") == 0 && i + 1 < argc) {
            config.silence_timeout = atof(argv[++i]);
        } else if (strcmp(argv[i], "--diarize") == 0) {
            config.diarize = true;
        } else if (strcmp(argv[i], "--no-gpu") == 0) {
            use_gpu = false;
        } else if ((strcmp(argv[i], "-o") == 0 || strcmp(argv[i], "--output") == 0) && i + 1 < argc) {
            output_path = argv[++i];
        } else if (strcmp(argv[i], "--realtime") == 0) {
            realtime = true;
        } else if (strcmp(argv[i], "--verbose") == 0) {
            config.verbose = true;
        } else if (strcmp(argv[i], "--no-prints") == 0) {
            no_prints = true;
        } else if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (argv[i][0] != '-' && mixed_path.empty()) {
            mixed_path = argv[i];
        } else {
            fprintf(stderr, "Error: unknown or incomplete option '%s'\n\n", argv[i]);
            print_usage(argv[0]);
            return 1;
        }
    }

    if (mixed_path.empty() == sources.empty()) {
        fprintf(stderr, "Error: give either one mixed <audio.wav> or one or more --speaker files\n\n");
        print_usage(argv[0]);
        return 1;
    }
    if (!whisper_model || !vad_model) {
        fprintf(stderr, "Error: --whisper-model and --vad-model are required\n\n");
        print_usage(argv[0]);
        return 1;
    }

    config.individual_mode = !sources.empty();
    if (!config.individual_mode) {
        Source src;
        src.stream_id = MIXED_STREAM_ID;
        src.path = mixed_path;
        sources.push_back(src);
    }

    double total_audio_s = 0.0;
    for (auto& src : sources) {
        uint32_t sample_rate = 0;
        if (!load_wav_file(src.path, src.samples, sample_rate)) {
            return 1;
        }
        if (sample_rate != SAMPLE_RATE) {
            fprintf(stderr, "Error: %s: expected %d Hz audio, got %u Hz\n", src.path.c_str(), SAMPLE_RATE, sample_rate);
            return 1;
        }
        total_audio_s = std::max(total_audio_s, static_cast<double>(src.samples.size()) / SAMPLE_RATE);
    }
    config.sample_rate = SAMPLE_RATE;
    if (!realtime) {
        config.clock = replay_clock;
    }

    CallbackCtx callback_ctx;
    EngineCallbacks callbacks;
    callbacks.on_vad_request = on_vad_request;
    callbacks.on_recognition_request = on_recognition_request;
    callbacks.on_segment = on_segment;
    callbacks.user_data = &callback_ctx;

    const auto t0 = std::chrono::steady_clock::now();

    Engine* engine = engine_init(config, callbacks);
    if (!engine) {
        fprintf(stderr, "Error: engine initialization failed\n");
        return 1;
    }

    WhisperVadConfig vad_config;
    vad_config.vad_model_path = vad_model;
    vad_config.threshold = vad_threshold;
    vad_config.no_prints = no_prints;

    WhisperRecognizerConfig rec_config;
    rec_config.whisper_model_path = whisper_model;
    rec_config.n_threads = n_threads;
    rec_config.language = language;
    rec_config.use_gpu = use_gpu;
    rec_config.no_prints = no_prints;

    // No frame has been pushed yet, so no callback can observe the null gateways
    callback_ctx.vad = whisper_vad_gateway_init(vad_config, engine);
    callback_ctx.recognizer = whisper_recognizer_init(rec_config, engine);
    if (!callback_ctx.vad || !callback_ctx.recognizer) {
        fprintf(stderr, "Error: gateway initialization failed\n");
        whisper_vad_gateway_free(callback_ctx.vad);
        whisper_recognizer_free(callback_ctx.recognizer);
        engine_free(engine);
        return 1;
    }

    // Interleave the sources frame by frame with irregular frame sizes
    size_t frame_index = 0;
    double next_progress_s = 5.0;
    while (true) {
        const int frame = FRAME_SIZES[frame_index % 3];
        frame_index++;

        bool any = false;
        double round_start = 0.0;
        double round_end = 0.0;
        for (auto& src : sources) {
            if (src.offset >= src.samples.size()) {
                continue;
            }
            const int n = static_cast<int>(std::min<size_t>(frame, src.samples.size() - src.offset));
            const double capture_time = static_cast<double>(src.offset) / SAMPLE_RATE;
            if (!engine_push_frame(engine, src.stream_id, src.samples.data() + src.offset, n, capture_time)) {
                fprintf(stderr, "WARNING: frame at %.3fs of %s rejected\n", capture_time, src.stream_id.c_str());
            }
            src.offset += static_cast<size_t>(n);
            round_start = capture_time;
            round_end = std::max(round_end, static_cast<double>(src.offset) / SAMPLE_RATE);
            any = true;
        }
        if (!any) {
            break;
        }

        if (realtime) {
            std::this_thread::sleep_for(std::chrono::microseconds(frame * 1000000LL / SAMPLE_RATE));
        } else {
            // Offline replay: audio time advances only once every reply is in
            drain(engine, callback_ctx.vad, whisper_vad_gateway_pending);
            drain(engine, callback_ctx.recognizer, whisper_recognizer_pending);
            g_replay_time.store(round_end);
            engine_tick(engine);
        }
        if (round_start + 1e-9 >= next_progress_s) {
            fprintf(stderr, "[push] %.1fs / %.1fs\n", round_start, total_audio_s);
            next_progress_s += 5.0;
        }
    }

    // End of input: let the outstanding verdicts land, close the open
    // utterances, then wait for their transcripts.
    drain(engine, callback_ctx.vad, whisper_vad_gateway_pending);
    for (const auto& src : sources) {
        engine_finalize_stream(engine, src.stream_id);
    }
    engine_wait_idle(engine);
    drain(engine, callback_ctx.recognizer, whisper_recognizer_pending);

    int total_gaps = 0;
    for (const auto& src : sources) {
        StreamStats st;
        if (engine_get_stats(engine, src.stream_id, st)) {
            fprintf(stderr, "[engine] %s: %llu packets, %llu segments (%llu forced, %llu discarded), "
                            "%llu transcripts, %llu gaps, %llu verdict timeouts, %llu dropped\n",
                    src.stream_id.c_str(),
                    static_cast<unsigned long long>(st.packets),
                    static_cast<unsigned long long>(st.segments_dispatched),
                    static_cast<unsigned long long>(st.segments_forced),
                    static_cast<unsigned long long>(st.fragments_discarded),
                    static_cast<unsigned long long>(st.transcripts_released),
                    static_cast<unsigned long long>(st.gaps),
                    static_cast<unsigned long long>(st.verdicts_timed_out),
                    static_cast<unsigned long long>(st.messages_dropped));
            total_gaps += static_cast<int>(st.gaps);
        }
        engine_destroy_stream(engine, src.stream_id);
    }

    whisper_vad_gateway_free(callback_ctx.vad);
    whisper_recognizer_free(callback_ctx.recognizer);
    engine_free(engine);

    const auto t1 = std::chrono::steady_clock::now();

    if (output_path) {
        FILE* out = std::fopen(output_path, "wb");
        if (!out) {
            fprintf(stderr, "Error: could not open output file '%s'\n", output_path);
            return 1;
        }
        write_segments_json(out, callback_ctx.segments);
        std::fclose(out);
    }

    const double elapsed_s = std::chrono::duration<double>(t1 - t0).count();
    const double rtf = total_audio_s > 0.0 ? elapsed_s / total_audio_s : 0.0;
    fprintf(stderr, "Timing: total=%.3fs audio=%.3fs rtf=%.4f segments=%zu gaps=%d\n",
            elapsed_s, total_audio_s, rtf, callback_ctx.segments.size(), total_gaps);

    return 0;
}
