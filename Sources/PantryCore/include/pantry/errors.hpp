#pragma once

#include <stdexcept>
#include <string>

namespace pantry {

/// Base for everything the worker, its transport and its client throw.
class error : public std::runtime_error {
public:
    explicit error(const std::string& msg) : std::runtime_error(msg) {}
};

// ============================================================================
// Worker-side errors. Each one ends up as a single Err reply.
// ============================================================================

/// Incoming payload is not valid JSON or not a well-formed request object.
class request_decode_error : public error {
public:
    explicit request_decode_error(const std::string& cause)
        : error("Failed to parse request: " + cause) {}
};

/// Request object carries a "type" the worker does not handle.
class unknown_request_kind : public error {
public:
    explicit unknown_request_kind(const std::string& kind)
        : error("Unknown request type: " + kind), kind_(kind) {}

    const std::string& kind() const { return kind_; }

private:
    std::string kind_;
};

/// Persistence backend is missing or not writable in the current environment.
class storage_unavailable : public error {
public:
    explicit storage_unavailable(const std::string& reason)
        : error("Persistent storage is not available in this environment: " + reason) {}
};

/// SQLite rejected a statement (prepare, bind or step), or a transaction
/// bracket could not be opened or closed.
class statement_error : public error {
public:
    explicit statement_error(const std::string& msg, int code = 0)
        : error(msg), code_(code) {}

    /// SQLite result code, 0 when not produced by SQLite.
    int code() const { return code_; }

private:
    int code_;
};

/// Configuration file missing, unreadable or holding a value of the wrong type.
class config_error : public error {
public:
    explicit config_error(const std::string& msg) : error(msg) {}
};

// ============================================================================
// Client-side errors
// ============================================================================

/// The worker answered with Err.
class remote_error : public error {
public:
    explicit remote_error(const std::string& msg) : error(msg) {}
};

/// The worker answered with a reply kind that does not fit the request.
class unexpected_reply : public error {
public:
    explicit unexpected_reply(const std::string& msg) : error(msg) {}
};

/// No reply arrived within the client's timeout.
class client_timeout : public error {
public:
    explicit client_timeout(const std::string& msg) : error(msg) {}
};

/// Socket-level failure: connect, send or a dropped connection.
class transport_error : public error {
public:
    explicit transport_error(const std::string& msg) : error(msg) {}
};

} // namespace pantry
