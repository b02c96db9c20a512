#include "pantry/protocol.hpp"
#include "pantry/errors.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <limits>

namespace pantry {

using json = nlohmann::json;
using ordered_json = nlohmann::ordered_json;

namespace {

// ============================================================================
// value_t <-> JSON
// ============================================================================

// Arrays of byte-sized integers are how a blob travels (Uint8Array / Vec<u8>).
bool is_byte_array(const json& j) {
    if (!j.is_array()) return false;
    for (const auto& el : j) {
        if (!el.is_number_integer()) return false;
        auto v = el.get<int64_t>();
        if (v < 0 || v > 255) return false;
    }
    return true;
}

value_t value_from_json(const json& j, const std::string& where) {
    switch (j.type()) {
        case json::value_t::null:
            return nullptr;
        case json::value_t::boolean:
            return static_cast<int64_t>(j.get<bool>() ? 1 : 0);
        case json::value_t::number_integer:
            return j.get<int64_t>();
        case json::value_t::number_unsigned: {
            auto v = j.get<uint64_t>();
            if (v > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return static_cast<double>(v);
            }
            return static_cast<int64_t>(v);
        }
        case json::value_t::number_float:
            return j.get<double>();
        case json::value_t::string:
            return j.get<std::string>();
        case json::value_t::array:
            if (is_byte_array(j)) {
                blob_t blob;
                blob.reserve(j.size());
                for (const auto& el : j) blob.push_back(static_cast<uint8_t>(el.get<int64_t>()));
                return blob;
            }
            throw request_decode_error(where + " holds an array that is not a byte array");
        default:
            throw request_decode_error(where + " must be null, a boolean, a number, a string or a byte array");
    }
}

template <typename Json>
Json value_to_json(const value_t& value) {
    return std::visit([](auto&& v) -> Json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return nullptr;
        } else if constexpr (std::is_same_v<T, double>) {
            if (!std::isfinite(v)) return nullptr;
            return v;
        } else if constexpr (std::is_same_v<T, blob_t>) {
            Json arr = Json::array();
            for (auto b : v) arr.push_back(static_cast<int>(b));
            return arr;
        } else {
            return v;
        }
    }, value);
}

std::vector<value_t> bind_from_json(const json& obj, const std::string& where) {
    std::vector<value_t> values;
    auto it = obj.find("bind");
    if (it == obj.end() || it->is_null()) return values;
    if (!it->is_array()) {
        throw request_decode_error(where + "'bind' must be an array");
    }
    values.reserve(it->size());
    for (size_t i = 0; i < it->size(); ++i) {
        values.push_back(value_from_json((*it)[i], where + "bind[" + std::to_string(i) + "]"));
    }
    return values;
}

std::string required_string(const json& obj, const char* key, const std::string& where) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        throw request_decode_error(where + "missing '" + key + "'");
    }
    if (!it->is_string()) {
        throw request_decode_error(where + "'" + key + "' must be a string");
    }
    return it->get<std::string>();
}

std::optional<std::string> database_file_from_json(const json& obj) {
    auto it = obj.find("database_file");
    if (it == obj.end() || it->is_null()) return std::nullopt;
    if (!it->is_string()) {
        throw request_decode_error("'database_file' must be a string");
    }
    auto name = it->get<std::string>();
    if (name.empty()) return std::nullopt;
    return name;
}

json bind_to_json(const std::vector<value_t>& bind) {
    json arr = json::array();
    for (const auto& v : bind) arr.push_back(value_to_json<json>(v));
    return arr;
}

json parse_object(std::string_view payload) {
    json doc;
    try {
        doc = json::parse(payload);
    } catch (const json::parse_error& e) {
        throw request_decode_error(e.what());
    }
    if (!doc.is_object()) {
        throw request_decode_error("expected a JSON object, got " + std::string(doc.type_name()));
    }
    return doc;
}

std::string kind_from_json(const json& doc) {
    auto it = doc.find("type");
    if (it == doc.end()) {
        throw request_decode_error("missing 'type'");
    }
    if (!it->is_string()) {
        throw unknown_request_kind(it->dump());
    }
    return it->get<std::string>();
}

} // namespace

const char* request_kind(const request& req) {
    return std::visit([](auto&& r) -> const char* {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, init_db_request>) {
            return "InitDbFile";
        } else if constexpr (std::is_same_v<T, exec_request>) {
            return "Exec";
        } else {
            return "Query";
        }
    }, req);
}

request decode_request(std::string_view payload) {
    json doc = parse_object(payload);
    std::string kind = kind_from_json(doc);

    if (kind == "InitDbFile") {
        return init_db_request{database_file_from_json(doc)};
    }

    if (kind == "Exec") {
        exec_request req;
        req.database_file = database_file_from_json(doc);
        auto it = doc.find("statements");
        if (it != doc.end() && !it->is_null()) {
            if (!it->is_array()) {
                throw request_decode_error("'statements' must be an array");
            }
            req.statements.reserve(it->size());
            for (size_t i = 0; i < it->size(); ++i) {
                const auto& item = (*it)[i];
                std::string where = "statements[" + std::to_string(i) + "]: ";
                if (!item.is_object()) {
                    throw request_decode_error("statements[" + std::to_string(i) + "] must be an object");
                }
                req.statements.emplace_back(required_string(item, "sql", where), bind_from_json(item, where));
            }
        }
        return req;
    }

    if (kind == "Query") {
        query_request req;
        req.database_file = database_file_from_json(doc);
        req.query = statement(required_string(doc, "sql", ""), bind_from_json(doc, ""));
        return req;
    }

    throw unknown_request_kind(kind);
}

std::string encode_request(const request& req) {
    json doc;
    doc["type"] = request_kind(req);
    std::visit([&](auto&& r) {
        using T = std::decay_t<decltype(r)>;
        if (r.database_file) doc["database_file"] = *r.database_file;
        if constexpr (std::is_same_v<T, exec_request>) {
            json statements = json::array();
            for (const auto& stmt : r.statements) {
                json item;
                item["sql"] = stmt.sql;
                if (!stmt.bind.empty()) item["bind"] = bind_to_json(stmt.bind);
                statements.push_back(std::move(item));
            }
            doc["statements"] = std::move(statements);
        } else if constexpr (std::is_same_v<T, query_request>) {
            doc["sql"] = r.query.sql;
            doc["bind"] = bind_to_json(r.query.bind);
        }
    }, req);
    return doc.dump();
}

std::string encode_response(const response& resp) {
    // ordered_json keeps "type" first and each row's columns in result order.
    ordered_json doc;
    std::visit([&](auto&& r) {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, ok_response>) {
            doc["type"] = "Ok";
        } else if constexpr (std::is_same_v<T, rows_response>) {
            doc["type"] = "Rows";
            ordered_json rows = ordered_json::array();
            for (const auto& row : r.rows) {
                ordered_json obj = ordered_json::object();
                for (const auto& [column, value] : row) {
                    obj[column] = value_to_json<ordered_json>(value);
                }
                rows.push_back(std::move(obj));
            }
            doc["rows"] = std::move(rows);
        } else {
            doc["type"] = "Err";
            doc["message"] = r.message;
        }
    }, resp);
    // Replace invalid UTF-8 from TEXT columns rather than failing the reply.
    return doc.dump(-1, ' ', false, ordered_json::error_handler_t::replace);
}

std::string encode_debug(const std::string& message) {
    ordered_json doc;
    doc["type"] = "Debug";
    doc["message"] = message;
    return doc.dump(-1, ' ', false, ordered_json::error_handler_t::replace);
}

reply decode_reply(std::string_view payload) {
    ordered_json doc;
    try {
        doc = ordered_json::parse(payload);
    } catch (const ordered_json::parse_error& e) {
        throw unexpected_reply(std::string("Failed to parse reply: ") + e.what());
    }
    if (!doc.is_object() || !doc.contains("type") || !doc["type"].is_string()) {
        throw unexpected_reply("Failed to parse reply: not a typed JSON object");
    }

    auto kind = doc["type"].get<std::string>();
    if (kind == "Ok") {
        return ok_response{};
    }
    if (kind == "Err" || kind == "Debug") {
        std::string message;
        if (doc.contains("message") && doc["message"].is_string()) {
            message = doc["message"].get<std::string>();
        }
        if (kind == "Err") return err_response{message};
        return debug_message{message};
    }
    if (kind == "Rows") {
        rows_response out;
        if (!doc.contains("rows") || !doc["rows"].is_array()) {
            throw unexpected_reply("Failed to parse reply: Rows without a 'rows' array");
        }
        for (const auto& obj : doc["rows"]) {
            if (!obj.is_object()) {
                throw unexpected_reply("Failed to parse reply: row is not an object");
            }
            row_t row;
            for (const auto& [column, value] : obj.items()) {
                // Arrays of bytes come back as blobs, same rule as bind values.
                try {
                    row.emplace_back(column, value_from_json(json(value), "column '" + column + "'"));
                } catch (const request_decode_error&) {
                    throw unexpected_reply("Failed to parse reply: column '" + column + "' holds an unsupported value");
                }
            }
            out.rows.push_back(std::move(row));
        }
        return out;
    }
    throw unexpected_reply("Failed to parse reply: unknown type " + kind);
}

} // namespace pantry
