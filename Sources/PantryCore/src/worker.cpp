#include "pantry/worker.hpp"
#include "pantry/log.hpp"

namespace pantry {

worker::worker(worker_config config, reply_handler default_handler)
    : dispatcher_(std::move(config))
    , default_handler_(std::move(default_handler)) {
    thread_ = std::thread([this] { run_loop(); });
}

worker::~worker() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    cv_.notify_one();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void worker::post(std::string payload) {
    post(std::move(payload), default_handler_);
}

void worker::post(std::string payload, reply_handler on_reply) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            LOG_WARN("worker", "Request posted after shutdown, dropped");
            return;
        }
        queue_.push(job{std::move(payload), std::move(on_reply)});
        ++in_flight_;
    }
    cv_.notify_one();
}

void worker::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return in_flight_ == 0; });
}

void worker::run_loop() {
    thread_id_ = std::this_thread::get_id();
    while (true) {
        job next;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || !running_; });

            if (!running_ && queue_.empty()) {
                return;
            }

            next = std::move(queue_.front());
            queue_.pop();
        }

        const auto& on_reply = next.on_reply;
        dispatcher_.handle(next.payload, [&on_reply](const std::string& message) {
            if (!on_reply) return;
            try {
                on_reply(message);
            } catch (const std::exception& e) {
                LOG_ERROR("worker", "Reply handler threw: %s", e.what());
            }
        });

        {
            std::lock_guard<std::mutex> lock(mutex_);
            --in_flight_;
        }
        idle_cv_.notify_all();
    }
}

} // namespace pantry
