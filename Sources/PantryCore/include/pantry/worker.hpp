#pragma once

#include "config.hpp"
#include "dispatcher.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

namespace pantry {

// ============================================================================
// Worker - serialized request queue in front of the dispatcher
// ============================================================================
//
// post() enqueues an opaque payload and returns immediately. A single
// consumer thread drains the queue in arrival order and runs each request to
// completion (commit or rollback included) before taking the next, so the
// replies for one channel come back in request order. All messages for a
// request, Debug traces and the final reply, are passed to the reply handler
// given with that request, on the worker thread. An exception thrown by a
// handler is logged and does not stop the queue.

class worker {
public:
    using reply_handler = std::function<void(const std::string& message)>;

    explicit worker(worker_config config, reply_handler default_handler = {});

    /// Processes everything already queued, then stops the consumer thread.
    ~worker();

    worker(const worker&) = delete;
    worker& operator=(const worker&) = delete;

    /// Queue a request whose replies go to the default handler.
    void post(std::string payload);

    /// Queue a request whose replies go to `on_reply`.
    void post(std::string payload, reply_handler on_reply);

    /// Block until every request posted so far has been answered.
    void wait_idle();

    [[nodiscard]] bool is_on_thread() const noexcept {
        return std::this_thread::get_id() == thread_id_.load();
    }

    handle_state state() const { return dispatcher_.state(); }

private:
    struct job {
        std::string payload;
        reply_handler on_reply;
    };

    void run_loop();

    dispatcher dispatcher_;
    reply_handler default_handler_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::queue<job> queue_;
    size_t in_flight_ = 0;
    std::atomic<bool> running_{true};

    std::thread thread_;
    std::atomic<std::thread::id> thread_id_{};
};

} // namespace pantry
