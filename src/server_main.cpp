#include "config.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "server_app.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

namespace {
std::atomic<bool> g_stop{false};

void on_signal(int) {
    g_stop = true;
}
}  // namespace

int main(int argc, char** argv) {
    camingest::AppConfig cfg;
    try {
        cfg = camingest::parse_args(argc, argv);
    } catch (const camingest::ValidationError& e) {
        std::cerr << "[ERROR] " << e.what() << "\n" << camingest::usage();
        return 2;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    camingest::log_info("main", "starting camera ingest server");
    camingest::log_info("main", "events: " + cfg.events_jsonl + ", snapshots: " + cfg.pipeline.snapshot_dir);

    camingest::ServerApp app(cfg);
    if (!app.start()) {
        app.stop();
        return 1;
    }

    while (!g_stop && !app.listen_failed()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    camingest::log_info("main", "shutting down");
    app.stop();
    return app.listen_failed() ? 1 : 0;
}
