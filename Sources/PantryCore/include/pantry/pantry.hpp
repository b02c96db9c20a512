#pragma once

// Umbrella header for PantryCore.
//
// In-process use:
//   pantry::worker_config config;
//   pantry::worker w(config, [](const std::string& reply) { ... });
//   w.post(R"({"type":"Query","sql":"SELECT 1 AS one"})");
//
// Cross-process use: run pantry-worker, then talk to it through
// pantry::worker_client(pantry::resolve_ipc_socket_path(channel)).

#include "pantry/log.hpp"
#include "pantry/errors.hpp"
#include "pantry/types.hpp"
#include "pantry/config.hpp"
#include "pantry/storage.hpp"
#include "pantry/db.hpp"
#include "pantry/handle_manager.hpp"
#include "pantry/executor.hpp"
#include "pantry/protocol.hpp"
#include "pantry/dispatcher.hpp"
#include "pantry/worker.hpp"
#include "pantry/ipc.hpp"
#include "pantry/service.hpp"
#include "pantry/client.hpp"
