#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace pantry {

/// Resolve a channel name to a platform-specific Unix domain socket path.
/// macOS: ~/Library/Caches/Pantry/ipc/<channel>.sock
/// Linux: $XDG_RUNTIME_DIR/pantry/<channel>.sock (fallback: /tmp/pantry-<uid>/<channel>.sock)
std::string resolve_ipc_socket_path(const std::string& channel);

// ============================================================================
// Length-prefix framing helpers
// ============================================================================

/// Largest frame accepted by read_frame(): 256 MB.
inline constexpr uint32_t max_frame_size = 1u << 28;

/// Write a length-prefixed frame to a file descriptor.
/// Format: [4 bytes big-endian length][payload]
/// Returns true on success.
bool write_frame(int fd, const void* data, uint32_t length);

/// Read a length-prefixed frame from a file descriptor into `out`.
/// Returns false on EOF, error or an oversized frame. A zero-length frame is valid.
bool read_frame(int fd, std::vector<uint8_t>& out);

// ============================================================================
// IPC connection - one end of a framed Unix domain socket stream
// ============================================================================

class ipc_connection {
public:
    using on_message_handler = std::function<void(std::string message)>;
    using on_close_handler = std::function<void()>;

    /// Construct with a socket path (for client-initiated connections).
    explicit ipc_connection(const std::string& socket_path);

    /// Construct by wrapping an already-accepted file descriptor (server side).
    explicit ipc_connection(int accepted_fd);

    ~ipc_connection();

    // Non-copyable
    ipc_connection(const ipc_connection&) = delete;
    ipc_connection& operator=(const ipc_connection&) = delete;

    /// Connect (client side) or activate an accepted fd (server side), then
    /// start delivering frames to the message handler on a reader thread.
    /// Throws transport_error if the socket cannot be connected.
    void open();

    /// Close the socket and join the reader thread. Calls the close handler once.
    void close();

    bool is_open() const { return open_.load(); }

    /// Send one frame. Safe to call from several threads. Returns false if the
    /// connection is closed or the write failed.
    bool send(const std::string& message);

    void set_on_message(on_message_handler handler) { on_message_ = std::move(handler); }
    void set_on_close(on_close_handler handler) { on_close_ = std::move(handler); }

private:
    std::string socket_path_;
    std::atomic<int> fd_{-1};
    std::atomic<bool> open_{false};
    std::atomic<bool> should_stop_{false};
    std::atomic<bool> close_reported_{false};
    std::mutex write_mutex_;

    on_message_handler on_message_;
    on_close_handler on_close_;

    std::thread read_thread_;

    void start_read_loop();
    void close_fd();
    void report_close();
};

// ============================================================================
// IPC server: owns a channel's socket and hands each accepted peer to a callback
// ============================================================================
//
// A channel has at most one live server. start() refuses a socket path that
// another process still answers on and only replaces a stale file left by a
// server that died. The socket file is readable and writable by its owner only.

class ipc_server {
public:
    using accept_callback = std::function<void(std::unique_ptr<ipc_connection>)>;

    explicit ipc_server(std::string socket_path);
    ~ipc_server();

    ipc_server(const ipc_server&) = delete;
    ipc_server& operator=(const ipc_server&) = delete;

    /// Bind, listen and accept on a background thread. The callback runs on
    /// that thread once per peer. Throws transport_error, also when the
    /// channel is already served.
    void start(accept_callback callback);

    /// Stop accepting and remove the socket file. Connections already handed
    /// out stay open.
    void stop();

    bool is_listening() const { return listen_fd_.load() >= 0; }

private:
    void accept_loop(const accept_callback& callback);

    std::string socket_path_;
    std::atomic<int> listen_fd_{-1};
    std::atomic<bool> should_stop_{false};
    std::thread accept_thread_;
};

} // namespace pantry
