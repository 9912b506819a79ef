#pragma once

#include "stream.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace speechseg {

// Single writer of one Stream. Every input (frames, verdicts, recognition
// replies, timer ticks, finalize) is posted to a bounded mailbox and applied
// on the worker thread. Gateway replies have their own queue and are applied
// before the next queued frame, so a burst of frames cannot push answered
// packets past the outstanding bound. Posting never blocks.
class StreamWorker {
public:
    StreamWorker(std::unique_ptr<Stream> stream, int mailbox_capacity, double (*clock)());
    ~StreamWorker();

    StreamWorker(const StreamWorker&) = delete;
    StreamWorker& operator=(const StreamWorker&) = delete;

    bool post_frame(const int16_t* samples, int n, double capture_time);
    bool post_vad_reply(const VadReply& reply);
    bool post_recognition_reply(const RecognitionReply& reply);
    bool post_tick();
    bool post_finalize();

    // Discards queued messages, cancels the stream and joins the thread.
    // No callback fires after this returns. Idempotent.
    void stop();

    void wait_idle();

    bool on_worker_thread() const;
    bool stopped() const;
    const std::string& id() const { return stream_id_; }
    int slot_index() const { return slot_index_; }
    StreamStats stats() const;

private:
    enum class MessageType {
        Frame,
        VadReply,
        RecognitionReply,
        Tick,
        Finalize,
    };

    struct Message {
        MessageType type;
        std::vector<int16_t> samples;
        double capture_time = 0.0;
        VadReply vad;
        RecognitionReply recognition;
    };

    bool post(Message&& msg);
    bool idle_locked() const;
    void run();
    void handle(Message& msg, double now);

    std::unique_ptr<Stream> stream_;
    std::string stream_id_;
    int slot_index_;
    size_t capacity_;
    double (*clock_)();

    mutable std::mutex mtx_;
    std::condition_variable cv_post_;
    std::condition_variable cv_idle_;
    std::deque<Message> mailbox_;
    std::deque<Message> replies_;
    bool busy_ = false;
    bool tick_queued_ = false;
    bool shutdown_ = false;
    std::atomic<bool> stopped_{false};
    std::atomic<uint64_t> dropped_{0};

    mutable std::mutex stats_mtx_;
    StreamStats stats_;

    std::mutex join_mtx_;
    std::thread worker_;
};

}  // namespace speechseg
