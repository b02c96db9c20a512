#pragma once

#include "config.hpp"
#include "ipc.hpp"
#include "worker.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace pantry {

// ============================================================================
// Worker service - serves one worker over a Unix domain socket channel
// ============================================================================
//
// Every accepted connection shares the same worker, so all callers see one
// database handle and one request queue. Each connection only receives the
// replies to its own requests, in the order it sent them.

class worker_service {
public:
    explicit worker_service(worker_config config);
    ~worker_service();

    worker_service(const worker_service&) = delete;
    worker_service& operator=(const worker_service&) = delete;

    /// Bind the configured channel and start accepting. Throws transport_error.
    void start();

    /// Stop accepting, close every connection, drain the queue.
    void stop();

    const std::string& socket_path() const { return socket_path_; }

    size_t connection_count();

private:
    void on_accept(std::unique_ptr<ipc_connection> connection);
    void reap_closed();

    std::string socket_path_;
    worker worker_;
    ipc_server server_;

    std::mutex mutex_;
    std::vector<std::shared_ptr<ipc_connection>> connections_;
};

} // namespace pantry
