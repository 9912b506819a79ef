#include "stream_worker.h"

#include <chrono>
#include <cstdio>
#include <utility>

namespace speechseg {

static double steady_seconds() {
    using namespace std::chrono;
    return duration_cast<duration<double>>(steady_clock::now().time_since_epoch()).count();
}

StreamWorker::StreamWorker(std::unique_ptr<Stream> stream, int mailbox_capacity, double (*clock)())
    : stream_(std::move(stream)),
      stream_id_(stream_->id()),
      slot_index_(stream_->slot_index()),
      capacity_(mailbox_capacity > 0 ? static_cast<size_t>(mailbox_capacity) : 1),
      clock_(clock ? clock : &steady_seconds) {
    stats_ = stream_->stats();
    worker_ = std::thread(&StreamWorker::run, this);
}

StreamWorker::~StreamWorker() {
    stop();
}

bool StreamWorker::post(Message&& msg) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (shutdown_) {
            return false;
        }
        const bool reply = msg.type == MessageType::VadReply ||
                           msg.type == MessageType::RecognitionReply;
        std::deque<Message>& queue = reply ? replies_ : mailbox_;
        if (msg.type == MessageType::Tick) {
            if (tick_queued_) {
                return true;
            }
            tick_queued_ = true;
        } else if (queue.size() >= capacity_) {
            dropped_ += 1;
            fprintf(stderr, "WARNING: [worker] %s: %s queue full (%zu), message dropped\n",
                    stream_id_.c_str(), reply ? "reply" : "mailbox", queue.size());
            return false;
        }
        queue.push_back(std::move(msg));
    }
    cv_post_.notify_one();
    return true;
}

bool StreamWorker::post_frame(const int16_t* samples, int n, double capture_time) {
    if (samples == nullptr || n <= 0) {
        return false;
    }
    Message msg;
    msg.type = MessageType::Frame;
    msg.samples.assign(samples, samples + n);
    msg.capture_time = capture_time;
    return post(std::move(msg));
}

bool StreamWorker::post_vad_reply(const VadReply& reply) {
    Message msg;
    msg.type = MessageType::VadReply;
    msg.vad = reply;
    return post(std::move(msg));
}

bool StreamWorker::post_recognition_reply(const RecognitionReply& reply) {
    Message msg;
    msg.type = MessageType::RecognitionReply;
    msg.recognition = reply;
    return post(std::move(msg));
}

bool StreamWorker::post_tick() {
    Message msg;
    msg.type = MessageType::Tick;
    return post(std::move(msg));
}

bool StreamWorker::post_finalize() {
    Message msg;
    msg.type = MessageType::Finalize;
    return post(std::move(msg));
}

void StreamWorker::run() {
    while (true) {
        Message msg;
        {
            std::unique_lock<std::mutex> lock(mtx_);
            cv_post_.wait(lock, [this] { return shutdown_ || !mailbox_.empty() || !replies_.empty(); });
            if (shutdown_) {
                return;
            }
            std::deque<Message>& queue = replies_.empty() ? mailbox_ : replies_;
            msg = std::move(queue.front());
            queue.pop_front();
            if (msg.type == MessageType::Tick) {
                tick_queued_ = false;
            }
            busy_ = true;
        }

        handle(msg, clock_());

        {
            std::lock_guard<std::mutex> lock(stats_mtx_);
            stats_ = stream_->stats();
        }

        {
            std::lock_guard<std::mutex> lock(mtx_);
            busy_ = false;
            if (idle_locked()) {
                cv_idle_.notify_all();
            }
        }
    }
}

void StreamWorker::handle(Message& msg, double now) {
    switch (msg.type) {
        case MessageType::Frame:
            stream_->on_frame(msg.samples.data(), static_cast<int>(msg.samples.size()),
                              msg.capture_time, now);
            break;
        case MessageType::VadReply:
            stream_->on_vad_reply(msg.vad, now);
            break;
        case MessageType::RecognitionReply:
            stream_->on_recognition_reply(msg.recognition, now);
            break;
        case MessageType::Tick:
            stream_->on_tick(now);
            break;
        case MessageType::Finalize:
            stream_->finalize(now);
            break;
    }
}

void StreamWorker::stop() {
    std::lock_guard<std::mutex> join_lock(join_mtx_);
    if (stopped_) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mtx_);
        shutdown_ = true;
        mailbox_.clear();
        replies_.clear();
    }
    cv_post_.notify_all();
    cv_idle_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }

    stream_->cancel();
    {
        std::lock_guard<std::mutex> lock(stats_mtx_);
        stats_ = stream_->stats();
    }
    stopped_ = true;
}

void StreamWorker::wait_idle() {
    std::unique_lock<std::mutex> lock(mtx_);
    cv_idle_.wait(lock, [this] { return shutdown_ || idle_locked(); });
}

bool StreamWorker::idle_locked() const {
    return mailbox_.empty() && replies_.empty() && !busy_;
}

bool StreamWorker::on_worker_thread() const {
    return std::this_thread::get_id() == worker_.get_id();
}

bool StreamWorker::stopped() const {
    return stopped_;
}

StreamStats StreamWorker::stats() const {
    StreamStats s;
    {
        std::lock_guard<std::mutex> lock(stats_mtx_);
        s = stats_;
    }
    s.messages_dropped = dropped_;
    return s;
}

}  // namespace speechseg
