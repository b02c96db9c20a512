#pragma once

#include "types.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace pantry {

// ============================================================================
// Requests (caller → worker)
// ============================================================================
//
// Wire form, one JSON object per message:
//   {"type":"InitDbFile", "database_file"?: str}
//   {"type":"Exec",       "database_file"?: str, "statements": [{"sql": str, "bind"?: [v]}]}
//   {"type":"Query",      "database_file"?: str, "sql": str, "bind"?: [v]}
// An omitted, null or empty database_file means the configured default.

struct init_db_request {
    std::optional<std::string> database_file;
};

struct exec_request {
    std::optional<std::string> database_file;
    std::vector<statement> statements;
};

struct query_request {
    std::optional<std::string> database_file;
    statement query;
};

using request = std::variant<init_db_request, exec_request, query_request>;

// ============================================================================
// Replies (worker → caller)
// ============================================================================
//
//   {"type":"Ok"}
//   {"type":"Rows", "rows": [{column: value, ...}]}
//   {"type":"Err",  "message": str}
//   {"type":"Debug","message": str}   out-of-band, never the only reply

struct ok_response {};

struct rows_response {
    std::vector<row_t> rows;
};

struct err_response {
    std::string message;
};

struct debug_message {
    std::string message;
};

using response = std::variant<ok_response, rows_response, err_response>;
using reply = std::variant<ok_response, rows_response, err_response, debug_message>;

/// Wire name of a request kind ("InitDbFile", "Exec", "Query").
const char* request_kind(const request& req);

/// Decode one request. Throws request_decode_error for text that is not a
/// request object and unknown_request_kind for an unhandled "type".
request decode_request(std::string_view payload);

std::string encode_request(const request& req);

std::string encode_response(const response& resp);
std::string encode_debug(const std::string& message);

/// Decode a reply as the client sees it. Throws unexpected_reply.
reply decode_reply(std::string_view payload);

} // namespace pantry
