#pragma once
#include "speechseg.h"

#include <string>

// In-process gateways backed by whisper.cpp. Each runs one worker thread,
// copies incoming requests into its own queue and answers through
// engine_on_vad_reply / engine_on_recognition_reply.

struct whisper_context;
struct whisper_vad_context;

namespace speechseg {

struct WhisperVadConfig {
    const char* vad_model_path = nullptr;   // Silero VAD in ggml format
    float threshold = 0.5f;                 // speech if max window probability >= threshold
    int n_threads = 1;
    bool use_gpu = false;
    bool no_prints = false;
    int max_queue = 256;                    // requests beyond this are answered as non-speech
};

struct WhisperRecognizerConfig {
    const char* whisper_model_path = nullptr;
    int n_threads = 4;
    bool use_gpu = true;
    bool flash_attn = true;
    int gpu_device = 0;
    bool no_prints = false;
    int max_queue = 16;                     // segments beyond this are answered as failed

    const char* language = "en";
    bool translate = false;
    float temperature = 0.0f;
    float temperature_inc = 0.2f;
    bool no_fallback = false;
    int beam_size = -1;                     // > 1 switches to beam search
    int best_of = 5;
    float no_speech_thold = 0.6f;
    bool suppress_blank = true;
    bool use_prompt = true;                 // pass the conversation prompt as initial_prompt
};

struct WhisperVadGateway;
struct WhisperRecognizer;

WhisperVadGateway* whisper_vad_gateway_init(const WhisperVadConfig& config, Engine* engine);
void whisper_vad_gateway_submit(WhisperVadGateway* gw, const VadRequest& request);
int whisper_vad_gateway_pending(WhisperVadGateway* gw);
void whisper_vad_gateway_free(WhisperVadGateway* gw);

WhisperRecognizer* whisper_recognizer_init(const WhisperRecognizerConfig& config, Engine* engine);
void whisper_recognizer_submit(WhisperRecognizer* r, const RecognitionRequest& request);
int whisper_recognizer_pending(WhisperRecognizer* r);
void whisper_recognizer_free(WhisperRecognizer* r);

}  // namespace speechseg
