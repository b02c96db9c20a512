#pragma once

#include "ipc.hpp"
#include "protocol.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace pantry {

// ============================================================================
// Worker client - typed requests over an IPC channel
// ============================================================================
//
// One request is in flight at a time: request() sends and waits for the next
// reply that is not a Debug trace. Debug traces go to the debug handler,
// which is called without the client's lock held.

class worker_client {
public:
    using debug_handler = std::function<void(const std::string& message)>;

    /// `socket_path` as returned by resolve_ipc_socket_path() or worker_service::socket_path().
    explicit worker_client(std::string socket_path,
                           std::chrono::milliseconds timeout = std::chrono::seconds(30));
    ~worker_client();

    worker_client(const worker_client&) = delete;
    worker_client& operator=(const worker_client&) = delete;

    /// Throws transport_error if the worker is not reachable.
    void connect();
    void disconnect();

    void set_on_debug(debug_handler handler);

    /// Send one request, return its reply. Throws client_timeout,
    /// transport_error, or unexpected_reply for an unreadable reply.
    response request(const pantry::request& req);

    /// Send a raw payload. Used for payloads that are not valid requests.
    response request_raw(const std::string& payload);

    // Typed helpers. Err replies are thrown as remote_error.
    void init_db(std::optional<std::string> database_file = std::nullopt);
    void exec(std::vector<statement> statements,
              std::optional<std::string> database_file = std::nullopt);
    std::vector<row_t> query(statement stmt,
                             std::optional<std::string> database_file = std::nullopt);

private:
    ipc_connection connection_;
    std::chrono::milliseconds timeout_;

    std::mutex request_mutex_;  // one request in flight

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> inbox_;
    // Replies still owed for requests that timed out. The worker answers in
    // order, so that many replies are skipped before the next one counts.
    size_t abandoned_ = 0;
    bool closed_ = false;
    debug_handler on_debug_;
};

} // namespace pantry
