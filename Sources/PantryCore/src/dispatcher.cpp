#include "pantry/dispatcher.hpp"
#include "pantry/errors.hpp"
#include "pantry/executor.hpp"
#include "pantry/log.hpp"

namespace pantry {

dispatcher::dispatcher(worker_config config) : handles_(std::move(config)) {}

std::string dispatcher::file_for(const std::optional<std::string>& requested) const {
    return requested ? *requested : handles_.config().default_database_file;
}

void dispatcher::handle(std::string_view payload, const emit_fn& emit) {
    trace_fn trace;
    if (handles_.config().debug_trace) {
        trace = [&emit](const std::string& message) { emit(encode_debug(message)); };
        trace("handleMessage: received request");
    }

    request req;
    try {
        req = decode_request(payload);
    } catch (const std::exception& e) {
        // request_decode_error and unknown_request_kind carry the reply text
        LOG_WARN("dispatch", "%s", e.what());
        emit(encode_response(err_response{e.what()}));
        return;
    }

    response resp;
    try {
        resp = execute(req, trace);
    } catch (const std::exception& e) {
        LOG_WARN("dispatch", "%s failed: %s", request_kind(req), e.what());
        if (trace) trace(std::string("Error: ") + e.what());
        resp = err_response{e.what()};
    }
    emit(encode_response(resp));
}

response dispatcher::execute(const request& req, const trace_fn& trace) {
    return std::visit([&](auto&& r) -> response {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, init_db_request>) {
            if (trace) trace("InitDbFile");
            handles_.ensure_open(file_for(r.database_file), trace);
            return ok_response{};
        } else if constexpr (std::is_same_v<T, exec_request>) {
            if (trace) trace("Exec begin");
            auto& db = handles_.ensure_open(file_for(r.database_file), trace);
            run_batch(db, r.statements, trace);
            if (trace) trace("Exec done");
            return ok_response{};
        } else {
            if (trace) trace("Query begin");
            auto& db = handles_.ensure_open(file_for(r.database_file), trace);
            rows_response rows{run_query(db, r.query)};
            if (trace) trace("Query done");
            return rows;
        }
    }, req);
}

} // namespace pantry
