#include "speechseg.h"

#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

namespace {

[[noreturn]] void fail(const std::string& name, const std::string& detail) {
    std::cerr << "FAIL: " << name << " - " << detail << std::endl;
    std::exit(1);
}

void pass(const std::string& name) {
    std::cout << "PASS: " << name << std::endl;
}

void expect_true(bool condition, const std::string& name, const std::string& detail) {
    if (!condition) {
        fail(name, detail);
    }
}

using namespace speechseg;

std::atomic<double> g_now{0.0};

double fake_clock() {
    return g_now.load();
}

struct CapturedRecognition {
    std::string stream_id;
    uint64_t id;
    std::string speaker_id;
    std::vector<int16_t> samples;
    double start;
    double end;
};

// Stands in for both gateways. With auto_vad set, every packet is answered
// on the spot: speech if its first sample is non-zero.
struct FakeGateways {
    std::mutex mtx;
    Engine* engine = nullptr;
    bool auto_vad = true;
    int vad_requests = 0;
    std::vector<CapturedRecognition> recognitions;
    std::vector<TranscriptionSegment> segments;
};

void on_vad_request(const VadRequest& request, void* user_data) {
    auto* gw = static_cast<FakeGateways*>(user_data);
    bool answer;
    {
        std::lock_guard<std::mutex> lock(gw->mtx);
        gw->vad_requests += 1;
        answer = gw->auto_vad;
    }
    if (answer) {
        VadReply reply;
        reply.stream_id = request.stream_id;
        reply.id = request.id;
        reply.is_speech = request.samples[0] != 0;
        reply.confidence = 1.0f;
        engine_on_vad_reply(gw->engine, reply);
    }
}

void on_recognition_request(const RecognitionRequest& request, void* user_data) {
    auto* gw = static_cast<FakeGateways*>(user_data);
    CapturedRecognition c;
    c.stream_id = request.stream_id;
    c.id = request.id;
    c.speaker_id = request.speaker_id;
    c.samples.assign(request.samples, request.samples + request.n_samples);
    c.start = request.start_time;
    c.end = request.end_time;
    std::lock_guard<std::mutex> lock(gw->mtx);
    gw->recognitions.push_back(c);
}

void on_segment(const TranscriptionSegment& segment, void* user_data) {
    auto* gw = static_cast<FakeGateways*>(user_data);
    std::lock_guard<std::mutex> lock(gw->mtx);
    gw->segments.push_back(segment);
}

EngineCallbacks make_callbacks(FakeGateways& gw) {
    EngineCallbacks cb;
    cb.on_vad_request = on_vad_request;
    cb.on_recognition_request = on_recognition_request;
    cb.on_segment = on_segment;
    cb.user_data = &gw;
    return cb;
}

EngineConfig make_config(bool individual) {
    EngineConfig config;
    config.individual_mode = individual;
    config.tick_interval = 3600.0;   // ticks are driven by hand
    config.clock = fake_clock;
    return config;
}

// Pushes `seconds` of 20 ms frames filled with `value`, advancing the clock.
void push_audio(Engine* engine, const std::string& id, int16_t value, double seconds, double& t) {
    std::vector<int16_t> frame(320, value);
    const int frames = static_cast<int>(seconds / 0.02 + 0.5);
    for (int i = 0; i < frames; ++i) {
        if (!engine_push_frame(engine, id, frame.data(), 320, t)) {
            fail("push_audio", "frame rejected for " + id);
        }
        t += 0.02;
        g_now.store(t);
    }
}

void reply_all(FakeGateways& gw, const std::string& text_prefix) {
    std::vector<CapturedRecognition> pending;
    {
        std::lock_guard<std::mutex> lock(gw.mtx);
        pending = gw.recognitions;
    }
    for (const auto& c : pending) {
        RecognitionReply reply;
        reply.stream_id = c.stream_id;
        reply.id = c.id;
        reply.valid = true;
        reply.text = text_prefix + c.stream_id;
        reply.confidence = 0.8f;
        engine_on_recognition_reply(gw.engine, reply);
    }
}

}

int main() {
    {
        EngineConfig bad = make_config(false);
        bad.packet_duration = 0.0;
        bad.max_streams = 0;
        FakeGateways gw;
        expect_true(!engine_config_validate(bad), "Test 1", "invalid config accepted");
        expect_true(engine_init(bad, make_callbacks(gw)) == nullptr, "Test 1", "engine created from invalid config");

        EngineConfig tiny = make_config(false);
        tiny.min_speech_duration = 6.0;
        expect_true(!engine_config_validate(tiny), "Test 1", "min above max accepted");
        expect_true(engine_config_validate(make_config(true)), "Test 1", "default config rejected");
        pass("Test 1: config validation");
    }

    {
        // Scenario D: two speakers interleaved frame by frame
        g_now.store(0.0);
        FakeGateways gw;
        Engine* engine = engine_init(make_config(true), make_callbacks(gw));
        expect_true(engine != nullptr, "Scenario D", "engine_init failed");
        gw.engine = engine;

        std::vector<int16_t> alice(320, 100);
        std::vector<int16_t> bob(320, -200);
        double t = 0.0;
        for (int i = 0; i < 50; ++i) {
            expect_true(engine_push_frame(engine, "alice", alice.data(), 320, t), "Scenario D", "alice frame rejected");
            expect_true(engine_push_frame(engine, "bob", bob.data(), 320, t), "Scenario D", "bob frame rejected");
            t += 0.02;
            g_now.store(t);
        }
        expect_true(engine_stream_count(engine) == 2, "Scenario D", "expected two streams");
        engine_wait_idle(engine);

        g_now.store(t + 2.0);
        engine_tick(engine);
        engine_wait_idle(engine);

        {
            std::lock_guard<std::mutex> lock(gw.mtx);
            expect_true(gw.recognitions.size() == 2, "Scenario D", "expected one segment per speaker");
            for (const auto& c : gw.recognitions) {
                const int16_t expected = c.stream_id == "alice" ? 100 : -200;
                expect_true(c.speaker_id == c.stream_id, "Scenario D", "segment tagged with the wrong speaker");
                expect_true(c.samples.size() == 16000, "Scenario D", "segment is not 1.0 s");
                for (int16_t s : c.samples) {
                    if (s != expected) fail("Scenario D", "samples of the other speaker in " + c.stream_id);
                }
            }
        }

        reply_all(gw, "said by ");
        engine_wait_idle(engine);
        {
            std::lock_guard<std::mutex> lock(gw.mtx);
            expect_true(gw.segments.size() == 2, "Scenario D", "transcripts not released");
            for (const auto& s : gw.segments) {
                expect_true(s.speaker_id == s.stream_id && s.text == "said by " + s.stream_id,
                            "Scenario D", "transcript attributed to the wrong speaker");
                expect_true(!s.gap, "Scenario D", "unexpected gap");
            }
        }

        StreamStats st;
        expect_true(engine_get_stats(engine, "alice", st), "Scenario D", "stats missing");
        expect_true(st.frames == 50 && st.packets == 10 && st.verdicts == 10, "Scenario D", "stream counters");
        expect_true(st.transcripts_released == 1 && st.vad_outstanding == 0, "Scenario D", "release counters");
        engine_free(engine);
        pass("Scenario D: independent speaker streams");
    }

    {
        g_now.store(0.0);
        FakeGateways gw;
        Engine* engine = engine_init(make_config(false), make_callbacks(gw));
        expect_true(engine != nullptr, "Test 3", "engine_init failed");
        gw.engine = engine;
        expect_true(engine_stream_count(engine) == 1, "Test 3", "mixed stream not created at init");

        double t = 0.0;
        push_audio(engine, "whoever", 50, 0.3, t);
        push_audio(engine, "someone-else", 50, 0.3, t);
        engine_wait_idle(engine);
        expect_true(engine_stream_count(engine) == 1, "Test 3", "mixed mode created extra streams");

        expect_true(engine_create_stream(engine, "room-1"), "Test 3", "create rejected");
        expect_true(engine_stream_count(engine) == 1, "Test 3", "create added a stream");

        // Any id names the mixed stream
        StreamStats st;
        expect_true(engine_get_stats(engine, "room-1", st) && st.frames == 30, "Test 3", "stats by caller id");
        expect_true(engine_finalize_stream(engine, "room-1"), "Test 3", "finalize rejected");
        engine_wait_idle(engine);
        {
            std::lock_guard<std::mutex> lock(gw.mtx);
            expect_true(gw.recognitions.size() == 1, "Test 3", "finalize did not emit");
            expect_true(gw.recognitions[0].stream_id == MIXED_STREAM_ID, "Test 3", "wrong stream id");
            expect_true(gw.recognitions[0].speaker_id.empty(), "Test 3", "mixed segment has a speaker id");
            expect_true(gw.recognitions[0].samples.size() == 9600, "Test 3", "segment is not 0.6 s");
        }
        expect_true(engine_destroy_stream(engine, "room-1"), "Test 3", "destroy by caller id rejected");
        expect_true(engine_stream_count(engine) == 0, "Test 3", "mixed stream survived destroy");
        expect_true(!engine_destroy_stream(engine, MIXED_STREAM_ID), "Test 3", "second destroy accepted");
        engine_free(engine);
        pass("Test 3: mixed mode routes every frame to one stream");
    }

    {
        g_now.store(0.0);
        FakeGateways gw;
        gw.auto_vad = false;
        EngineConfig config = make_config(true);
        config.max_outstanding_vad = 8;
        Engine* engine = engine_init(config, make_callbacks(gw));
        expect_true(engine != nullptr, "Test 4", "engine_init failed");
        gw.engine = engine;

        double t = 0.0;
        push_audio(engine, "dave", 10, 1.0, t);
        engine_wait_idle(engine);

        StreamStats st;
        engine_get_stats(engine, "dave", st);
        expect_true(st.packets == 10, "Test 4", "expected ten packets");
        expect_true(st.verdicts_evicted == 2 && st.vad_outstanding == 8, "Test 4", "outstanding bound not enforced");

        g_now.store(t + 0.5);
        engine_tick(engine);
        engine_wait_idle(engine);
        engine_get_stats(engine, "dave", st);
        expect_true(st.verdicts_timed_out == 8 && st.vad_outstanding == 0, "Test 4", "pending verdicts did not time out");

        VadReply late;
        late.stream_id = "dave";
        late.id = 3;
        late.is_speech = true;
        expect_true(engine_on_vad_reply(engine, late), "Test 4", "reply for a live stream not accepted");
        engine_wait_idle(engine);
        engine_get_stats(engine, "dave", st);
        expect_true(st.verdicts_rejected == 1 && st.verdicts == 0, "Test 4", "late verdict not rejected");
        {
            std::lock_guard<std::mutex> lock(gw.mtx);
            expect_true(gw.recognitions.empty(), "Test 4", "non-speech produced a segment");
        }
        engine_free(engine);
        pass("Test 4: eviction, timeout and late verdicts");
    }

    {
        g_now.store(0.0);
        FakeGateways gw;
        EngineConfig config = make_config(true);
        config.max_streams = 1;
        Engine* engine = engine_init(config, make_callbacks(gw));
        expect_true(engine != nullptr, "Test 5", "engine_init failed");
        gw.engine = engine;

        double t = 0.0;
        push_audio(engine, "carol", 20, 1.0, t);
        std::vector<int16_t> frame(320, 1);
        expect_true(!engine_push_frame(engine, "erin", frame.data(), 320, t), "Test 5", "pool exhaustion not reported");
        engine_wait_idle(engine);

        expect_true(engine_destroy_stream(engine, "carol"), "Test 5", "destroy failed");
        expect_true(!engine_destroy_stream(engine, "carol"), "Test 5", "second destroy reported success");
        expect_true(engine_stream_count(engine) == 0, "Test 5", "stream still registered");

        VadReply vad;
        vad.stream_id = "carol";
        vad.id = 1;
        expect_true(!engine_on_vad_reply(engine, vad), "Test 5", "verdict for destroyed stream accepted");
        RecognitionReply rr;
        rr.stream_id = "carol";
        rr.id = 1;
        rr.valid = true;
        expect_true(!engine_on_recognition_reply(engine, rr), "Test 5", "reply for destroyed stream accepted");
        StreamStats st;
        expect_true(!engine_get_stats(engine, "carol", st), "Test 5", "stats for destroyed stream");

        g_now.store(t + 5.0);
        engine_tick(engine);
        engine_wait_idle(engine);
        {
            std::lock_guard<std::mutex> lock(gw.mtx);
            expect_true(gw.recognitions.empty() && gw.segments.empty(), "Test 5", "output after destroy");
        }

        // The freed slot is reusable
        expect_true(engine_create_stream(engine, "erin"), "Test 5", "slot not recycled");
        expect_true(engine_create_stream(engine, "erin"), "Test 5", "create of live stream should be a no-op");
        expect_true(engine_stream_count(engine) == 1, "Test 5", "duplicate stream created");
        engine_free(engine);
        pass("Test 5: destroy is final and idempotent");
    }

    {
        g_now.store(0.0);
        FakeGateways gw;
        Engine* engine = engine_init(make_config(true), make_callbacks(gw));
        expect_true(engine != nullptr, "Test 6", "engine_init failed");
        gw.engine = engine;

        // Three segments via finalize, answered in reverse
        double t = 0.0;
        for (int i = 0; i < 3; ++i) {
            push_audio(engine, "frank", 30, 0.6, t);
            // Let the verdicts of the last packets land before finalizing
            engine_wait_idle(engine);
            engine_finalize_stream(engine, "frank");
        }
        engine_wait_idle(engine);

        std::vector<CapturedRecognition> reqs;
        {
            std::lock_guard<std::mutex> lock(gw.mtx);
            reqs = gw.recognitions;
        }
        expect_true(reqs.size() == 3, "Test 6", "expected three requests");
        for (int i = 2; i >= 0; --i) {
            RecognitionReply reply;
            reply.stream_id = "frank";
            reply.id = reqs[i].id;
            reply.valid = i != 1;
            reply.text = "part " + std::to_string(i);
            engine_on_recognition_reply(engine, reply);
        }
        engine_wait_idle(engine);
        {
            std::lock_guard<std::mutex> lock(gw.mtx);
            expect_true(gw.segments.size() == 3, "Test 6", "not all segments released");
            for (size_t i = 0; i < 3; ++i) {
                if (gw.segments[i].sequence != i + 1) fail("Test 6", "released out of dispatch order");
            }
            expect_true(gw.segments[1].gap && gw.segments[1].text.empty(), "Test 6", "malformed reply not a gap");
            expect_true(gw.segments[2].text == "part 2", "Test 6", "text mismatch");
        }
        engine_free(engine);
        pass("Test 6: out-of-order recognition replies");
    }

    {
        g_now.store(0.0);
        FakeGateways gw;
        gw.auto_vad = false;
        Engine* engine = engine_init(make_config(true), make_callbacks(gw));
        expect_true(engine != nullptr, "Test 7", "engine_init failed");
        gw.engine = engine;

        double t = 0.0;
        push_audio(engine, "gina", 40, 0.1, t);
        engine_wait_idle(engine);
        expect_true(engine_destroy_stream(engine, "gina"), "Test 7", "destroy failed");

        // Same participant rejoins; the reply meant for the first instance arrives late
        push_audio(engine, "gina", 40, 0.1, t);
        engine_wait_idle(engine);
        VadReply stale;
        stale.stream_id = "gina";
        stale.id = 1;
        stale.is_speech = true;
        engine_on_vad_reply(engine, stale);
        engine_wait_idle(engine);

        StreamStats st;
        expect_true(engine_get_stats(engine, "gina", st), "Test 7", "rejoined stream missing");
        expect_true(st.packets == 1 && st.vad_outstanding == 1, "Test 7", "rejoined stream did not start fresh");
        expect_true(st.verdicts == 0 && st.verdicts_rejected == 1, "Test 7", "stale reply matched the new instance");
        engine_free(engine);
        pass("Test 7: rejoined stream ignores replies for its predecessor");
    }

    std::cout << "PASS: test_engine" << std::endl;
    return 0;
}
