#include "pantry/client.hpp"
#include "pantry/errors.hpp"
#include "pantry/log.hpp"

namespace pantry {

worker_client::worker_client(std::string socket_path, std::chrono::milliseconds timeout)
    : connection_(socket_path)
    , timeout_(timeout) {
    connection_.set_on_message([this](std::string message) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            inbox_.push_back(std::move(message));
        }
        cv_.notify_all();
    });
    connection_.set_on_close([this]() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    });
}

worker_client::~worker_client() {
    connection_.close();
}

void worker_client::connect() {
    {
        // Nothing owed on the previous connection arrives on a new one.
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = false;
        inbox_.clear();
        abandoned_ = 0;
    }
    connection_.open();
}

void worker_client::disconnect() {
    connection_.close();
}

void worker_client::set_on_debug(debug_handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_debug_ = std::move(handler);
}

response worker_client::request(const pantry::request& req) {
    return request_raw(encode_request(req));
}

response worker_client::request_raw(const std::string& payload) {
    std::lock_guard<std::mutex> in_flight(request_mutex_);

    if (!connection_.send(payload)) {
        throw transport_error("Failed to send request to worker");
    }

    auto deadline = std::chrono::steady_clock::now() + timeout_;
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        if (!cv_.wait_until(lock, deadline, [this] { return !inbox_.empty() || closed_; })) {
            ++abandoned_;
            throw client_timeout("No reply from worker within " + std::to_string(timeout_.count()) + " ms");
        }
        if (inbox_.empty()) {
            throw transport_error("Connection to worker closed while waiting for a reply");
        }

        std::string text = std::move(inbox_.front());
        inbox_.pop_front();

        auto parsed = decode_reply(text);
        if (auto* debug = std::get_if<debug_message>(&parsed)) {
            LOG_DEBUG("client", "worker debug: %s", debug->message.c_str());
            auto handler = on_debug_;
            if (handler) {
                lock.unlock();
                handler(debug->message);
                lock.lock();
            }
            continue;
        }
        if (abandoned_ > 0) {
            --abandoned_;
            LOG_DEBUG("client", "Dropped late reply of a timed-out request");
            continue;
        }
        if (auto* ok = std::get_if<ok_response>(&parsed)) {
            return *ok;
        }
        if (auto* rows = std::get_if<rows_response>(&parsed)) {
            return std::move(*rows);
        }
        return std::get<err_response>(std::move(parsed));
    }
}

void worker_client::init_db(std::optional<std::string> database_file) {
    auto resp = request(init_db_request{std::move(database_file)});
    if (auto* err = std::get_if<err_response>(&resp)) {
        throw remote_error(err->message);
    }
    if (!std::holds_alternative<ok_response>(resp)) {
        throw unexpected_reply("Unexpected rows for InitDbFile");
    }
}

void worker_client::exec(std::vector<statement> statements, std::optional<std::string> database_file) {
    auto resp = request(exec_request{std::move(database_file), std::move(statements)});
    if (auto* err = std::get_if<err_response>(&resp)) {
        throw remote_error(err->message);
    }
    if (!std::holds_alternative<ok_response>(resp)) {
        throw unexpected_reply("Unexpected rows for Exec");
    }
}

std::vector<row_t> worker_client::query(statement stmt, std::optional<std::string> database_file) {
    auto resp = request(query_request{std::move(database_file), std::move(stmt)});
    if (auto* err = std::get_if<err_response>(&resp)) {
        throw remote_error(err->message);
    }
    if (auto* rows = std::get_if<rows_response>(&resp)) {
        return std::move(rows->rows);
    }
    throw unexpected_reply("Query returned Ok without rows");
}

} // namespace pantry
