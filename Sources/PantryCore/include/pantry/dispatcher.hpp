#pragma once

#include "config.hpp"
#include "handle_manager.hpp"
#include "protocol.hpp"

#include <functional>
#include <string>
#include <string_view>

namespace pantry {

// ============================================================================
// Dispatcher - one opaque message in, exactly one reply out
// ============================================================================
//
// Every error raised while handling a message becomes the single Err reply
// for it. Debug trace messages (when enabled) are emitted before that reply.
// handle() is not re-entrant; callers serialize requests (see worker).

class dispatcher {
public:
    /// Receives every outgoing message (Debug traces and the final reply), already encoded.
    using emit_fn = std::function<void(const std::string& message)>;

    explicit dispatcher(worker_config config);

    dispatcher(const dispatcher&) = delete;
    dispatcher& operator=(const dispatcher&) = delete;

    void handle(std::string_view payload, const emit_fn& emit);

    /// Typed entry point used by handle() once the payload is decoded.
    response execute(const request& req, const trace_fn& trace = {});

    handle_state state() const { return handles_.state(); }
    const worker_config& config() const { return handles_.config(); }

private:
    handle_manager handles_;

    std::string file_for(const std::optional<std::string>& requested) const;
};

} // namespace pantry
