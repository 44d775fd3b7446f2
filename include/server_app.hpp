#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include "camera_supervisor.hpp"
#include "config.hpp"
#include "event_publisher.hpp"
#include "inference_engine.hpp"
#include "metrics.hpp"
#include "stream_source.hpp"

namespace httplib {
class Server;
}

namespace camingest {

// Wires the pipeline together and serves the HTTP API.
class ServerApp {
public:
    explicit ServerApp(const AppConfig& cfg);
    ~ServerApp();

    // Binds the listening socket, then serves on a background thread.
    // False if the address could not be bound.
    bool start();

    // Safe to call more than once, and after a failed listen.
    void stop();

    bool listening() const;
    // Binding failed, or the listener stopped on its own.
    bool listen_failed() const { return listen_failed_; }

    CameraSupervisor& supervisor() { return *supervisor_; }

private:
    void run_http();
    void setup_routes();

    AppConfig cfg_;
    std::shared_ptr<Metrics> metrics_;
    std::shared_ptr<EventPublisher> publisher_;
    std::shared_ptr<RecentEventLog> recent_;
    std::shared_ptr<InferenceBackend> detector_;
    std::unique_ptr<CameraSupervisor> supervisor_;

    std::atomic<bool> http_running_{false};
    std::atomic<bool> listen_failed_{false};
    std::atomic<bool> http_done_{true};
    std::thread http_thread_;
    std::unique_ptr<httplib::Server> http_srv_;
};

}  // namespace camingest
