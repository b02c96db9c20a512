// pantry-worker: hosts the database worker on its IPC channel until
// SIGINT or SIGTERM. Optional argument: path to a JSON configuration file.

#include <pantry/pantry.hpp>

#include <csignal>
#include <iostream>
#include <pthread.h>

int main(int argc, char** argv) {
    if (argc > 2) {
        std::cerr << "usage: " << argv[0] << " [config.json]" << std::endl;
        return 2;
    }

    pantry::worker_config config;
    try {
        if (argc == 2) {
            config = pantry::load_config(argv[1]);
        }
    } catch (const pantry::config_error& e) {
        std::cerr << e.what() << std::endl;
        return 2;
    }
    config.apply_log_level();

    // Block the stop signals in every thread; this one collects them with sigwait().
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);
    std::signal(SIGPIPE, SIG_IGN);

    try {
        pantry::worker_service service(config);
        service.start();
        LOG_INFO("main", "pantry-worker ready on %s (storage %s)",
                 service.socket_path().c_str(), config.storage_root.c_str());

        int received = 0;
        sigwait(&signals, &received);
        LOG_INFO("main", "Signal %d, shutting down", received);
        service.stop();
    } catch (const pantry::error& e) {
        std::cerr << "pantry-worker: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
