#include "pantry/ipc.hpp"
#include "pantry/errors.hpp"
#include "pantry/log.hpp"

#include <fcntl.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <cstdlib>
#include <filesystem>
#include <arpa/inet.h>  // htonl / ntohl

#ifdef __APPLE__
#include <pwd.h>
#endif

namespace pantry {

namespace {

#ifdef MSG_NOSIGNAL
constexpr int send_flags = MSG_NOSIGNAL;
#else
constexpr int send_flags = 0;
#endif

bool write_all(int fd, const uint8_t* data, size_t length) {
    size_t written = 0;
    while (written < length) {
        ssize_t n = ::send(fd, data + written, length - written, send_flags);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        written += static_cast<size_t>(n);
    }
    return true;
}

bool read_all(int fd, uint8_t* data, size_t length) {
    size_t received = 0;
    while (received < length) {
        ssize_t n = ::read(fd, data + received, length - received);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;  // EOF or error
        received += static_cast<size_t>(n);
    }
    return true;
}

sockaddr_un make_address(const std::string& socket_path) {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (socket_path.size() >= sizeof(addr.sun_path)) {
        throw transport_error("ipc: socket path too long: " + socket_path);
    }
    std::strncpy(addr.sun_path, socket_path.c_str(), sizeof(addr.sun_path) - 1);
    return addr;
}

int unix_socket() {
    int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd >= 0 && ::fcntl(fd, F_SETFD, FD_CLOEXEC) < 0) {
        int err = errno;
        ::close(fd);
        errno = err;
        return -1;
    }
    return fd;
}

// True if something accepts connections on `addr` right now.
bool peer_answers(const sockaddr_un& addr) {
    int fd = unix_socket();
    if (fd < 0) return false;
    bool answered = ::connect(fd, reinterpret_cast<const struct sockaddr*>(&addr), sizeof(addr)) == 0;
    ::close(fd);
    return answered;
}

} // namespace

// ============================================================================
// Channel → socket path resolution
// ============================================================================

std::string resolve_ipc_socket_path(const std::string& channel) {
#ifdef __APPLE__
    const char* home = getenv("HOME");
    if (!home) {
        struct passwd* pw = getpwuid(getuid());
        home = pw ? pw->pw_dir : "/tmp";
    }
    std::string dir = std::string(home) + "/Library/Caches/Pantry/ipc";
#else
    const char* runtime_dir = getenv("XDG_RUNTIME_DIR");
    std::string dir;
    if (runtime_dir && runtime_dir[0] != '\0') {
        dir = std::string(runtime_dir) + "/pantry";
    } else {
        dir = "/tmp/pantry-" + std::to_string(getuid());
    }
#endif
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw transport_error("ipc: cannot create " + dir + ": " + ec.message());
    }
    return dir + "/" + channel + ".sock";
}

// ============================================================================
// Length-prefix framing
// ============================================================================

bool write_frame(int fd, const void* data, uint32_t length) {
    uint32_t net_len = htonl(length);
    if (!write_all(fd, reinterpret_cast<const uint8_t*>(&net_len), sizeof(net_len))) {
        return false;
    }
    return write_all(fd, static_cast<const uint8_t*>(data), length);
}

bool read_frame(int fd, std::vector<uint8_t>& out) {
    uint32_t net_len = 0;
    if (!read_all(fd, reinterpret_cast<uint8_t*>(&net_len), sizeof(net_len))) {
        return false;
    }

    uint32_t length = ntohl(net_len);
    if (length > max_frame_size) {
        LOG_WARN("ipc", "Rejecting frame of %u bytes", length);
        return false;
    }

    out.resize(length);
    return length == 0 || read_all(fd, out.data(), length);
}

// ============================================================================
// ipc_connection implementation
// ============================================================================

ipc_connection::ipc_connection(const std::string& socket_path)
    : socket_path_(socket_path) {}

ipc_connection::ipc_connection(int accepted_fd)
    : fd_(accepted_fd) {
    // fd is valid but the connection stays closed until open() starts the read loop,
    // so the owner can install handlers before any message is delivered.
}

ipc_connection::~ipc_connection() {
    should_stop_ = true;
    close_fd();
    if (read_thread_.joinable()) {
        if (read_thread_.get_id() == std::this_thread::get_id()) {
            read_thread_.detach();
        } else {
            read_thread_.join();
        }
    }
}

void ipc_connection::open() {
    if (open_) return;

    // A previous session that ended on the peer's side leaves its reader
    // thread finished but joinable.
    if (read_thread_.joinable()) {
        read_thread_.join();
    }
    close_reported_ = false;

    // Server-accepted connection: just start the read loop.
    if (socket_path_.empty() && fd_ >= 0) {
        open_ = true;
        start_read_loop();
        return;
    }

    close_fd();
    auto addr = make_address(socket_path_);
    int sock = unix_socket();
    if (sock < 0) {
        throw transport_error("ipc: socket() failed: " + std::string(strerror(errno)));
    }

    if (::connect(sock, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::string err = "ipc: connect(" + socket_path_ + ") failed: " + std::string(strerror(errno));
        LOG_DEBUG("ipc", "%s", err.c_str());
        ::close(sock);
        throw transport_error(err);
    }

    fd_ = sock;
    open_ = true;
    start_read_loop();
}

void ipc_connection::close() {
    bool was_open = open_.exchange(false);
    should_stop_ = true;
    close_fd();

    // Always join the read thread if joinable, even if the read loop already
    // exited on its own. A joinable std::thread destroyed unjoined calls std::terminate().
    if (read_thread_.joinable()) {
        if (read_thread_.get_id() == std::this_thread::get_id()) {
            read_thread_.detach();
        } else {
            read_thread_.join();
        }
    }

    if (was_open) report_close();
}

bool ipc_connection::send(const std::string& message) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    int fd = fd_;
    if (fd < 0 || !open_) return false;

    if (!write_frame(fd, message.data(), static_cast<uint32_t>(message.size()))) {
        LOG_DEBUG("ipc", "send failed: %s", strerror(errno));
        // The read loop notices the broken connection and reports the close.
        return false;
    }
    return true;
}

void ipc_connection::start_read_loop() {
    should_stop_ = false;
    read_thread_ = std::thread([this]() {
        std::vector<uint8_t> payload;
        while (!should_stop_) {
            int fd = fd_;
            if (fd < 0 || !read_frame(fd, payload)) {
                if (should_stop_) break;
                LOG_DEBUG("ipc", "read_frame failed, connection lost");
                open_ = false;
                report_close();
                return;
            }
            if (on_message_) on_message_(std::string(payload.begin(), payload.end()));
        }
    });
}

void ipc_connection::close_fd() {
    int fd = fd_.exchange(-1);
    if (fd >= 0) {
        ::shutdown(fd, SHUT_RDWR);
        ::close(fd);
    }
}

void ipc_connection::report_close() {
    if (!close_reported_.exchange(true) && on_close_) {
        on_close_();
    }
}

// ============================================================================
// ipc_server implementation
// ============================================================================

ipc_server::ipc_server(std::string socket_path)
    : socket_path_(std::move(socket_path)) {}

ipc_server::~ipc_server() {
    stop();
}

void ipc_server::start(accept_callback callback) {
    if (is_listening()) return;

    auto addr = make_address(socket_path_);

    if (peer_answers(addr)) {
        throw transport_error("ipc_server: channel " + socket_path_ + " is already served");
    }
    ::unlink(socket_path_.c_str());  // stale file from a server that died

    int fd = unix_socket();
    if (fd < 0) {
        throw transport_error("ipc_server: socket() failed: " + std::string(strerror(errno)));
    }

    const char* step = nullptr;
    if (::bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        step = "bind";
    } else if (::chmod(socket_path_.c_str(), S_IRUSR | S_IWUSR) < 0) {
        step = "chmod";
    } else if (::listen(fd, SOMAXCONN) < 0) {
        step = "listen";
    }
    if (step) {
        int err = errno;
        ::close(fd);
        if (std::strcmp(step, "bind") != 0) ::unlink(socket_path_.c_str());
        throw transport_error(std::string("ipc_server: ") + step + "(" + socket_path_ +
                              ") failed: " + strerror(err));
    }

    listen_fd_ = fd;
    should_stop_ = false;
    accept_thread_ = std::thread([this, cb = std::move(callback)]() { accept_loop(cb); });
    LOG_DEBUG("ipc_server", "Listening on %s", socket_path_.c_str());
}

void ipc_server::accept_loop(const accept_callback& callback) {
    while (!should_stop_) {
        int fd = listen_fd_;
        if (fd < 0) break;

        int client_fd = ::accept(fd, nullptr, nullptr);
        if (client_fd < 0) {
            if (should_stop_ || errno == EBADF || errno == EINVAL) break;
            if (errno == EMFILE || errno == ENFILE) {
                // Out of descriptors: give existing peers a chance to go away.
                LOG_WARN("ipc_server", "accept() out of descriptors, backing off");
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
            continue;
        }
        if (::fcntl(client_fd, F_SETFD, FD_CLOEXEC) < 0) {
            LOG_DEBUG("ipc_server", "FD_CLOEXEC on fd=%d failed: %s", client_fd, strerror(errno));
        }
        callback(std::make_unique<ipc_connection>(client_fd));
    }
}

void ipc_server::stop() {
    should_stop_ = true;

    int fd = listen_fd_.exchange(-1);
    if (fd >= 0) {
        ::shutdown(fd, SHUT_RDWR);
        ::close(fd);
        ::unlink(socket_path_.c_str());
    }

    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
}

} // namespace pantry
