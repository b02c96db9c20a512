#include "pantry/service.hpp"
#include "pantry/log.hpp"

#include <algorithm>

namespace pantry {

worker_service::worker_service(worker_config config)
    : socket_path_(resolve_ipc_socket_path(config.channel))
    , worker_(std::move(config))
    , server_(socket_path_) {}

worker_service::~worker_service() {
    stop();
}

void worker_service::start() {
    server_.start([this](std::unique_ptr<ipc_connection> connection) {
        on_accept(std::move(connection));
    });
    LOG_INFO("service", "Serving on %s", socket_path_.c_str());
}

void worker_service::stop() {
    server_.stop();

    std::vector<std::shared_ptr<ipc_connection>> connections;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connections.swap(connections_);
    }
    for (auto& connection : connections) {
        connection->close();
    }
    // Replies for requests still queued are dropped by their closed connections.
    worker_.wait_idle();
}

size_t worker_service::connection_count() {
    std::lock_guard<std::mutex> lock(mutex_);
    reap_closed();
    return connections_.size();
}

void worker_service::on_accept(std::unique_ptr<ipc_connection> accepted) {
    std::shared_ptr<ipc_connection> connection(std::move(accepted));
    std::weak_ptr<ipc_connection> weak = connection;

    connection->set_on_message([this, weak](std::string message) {
        worker_.post(std::move(message), [weak](const std::string& reply) {
            if (auto c = weak.lock()) {
                if (!c->send(reply)) {
                    LOG_DEBUG("service", "Reply dropped, connection closed");
                }
            }
        });
    });
    connection->set_on_close([]() {
        LOG_DEBUG("service", "Client disconnected");
    });

    connection->open();

    std::lock_guard<std::mutex> lock(mutex_);
    reap_closed();
    connections_.push_back(std::move(connection));
}

void worker_service::reap_closed() {
    // Connections are destroyed here, never on their own reader thread.
    connections_.erase(std::remove_if(connections_.begin(), connections_.end(),
                                      [](const std::shared_ptr<ipc_connection>& c) {
                                          return !c->is_open();
                                      }),
                       connections_.end());
}

} // namespace pantry
