#include "server_app.hpp"

#include <chrono>
#include <cstdlib>
#include <optional>
#include <sstream>
#include <thread>
#include <utility>
#include <vector>

#include <httplib.h>

#include "api_codec.hpp"
#include "errors.hpp"
#include "live_stream.hpp"
#include "log.hpp"

namespace camingest {

namespace {

const char* kJson = "application/json";

void send_error(httplib::Response& res, int status, const std::string& detail) {
    res.status = status;
    res.set_content(error_json(detail), kJson);
}

int status_for(IngestStatus s) {
    switch (s) {
        case IngestStatus::ACCEPTED: return 202;
        case IngestStatus::UNKNOWN_CAMERA: return 404;
        case IngestStatus::INVALID_IMAGE: return 400;
        case IngestStatus::NOT_PUSH_SOURCE:
        case IngestStatus::NOT_RUNNING: return 409;
    }
    return 500;
}

}  // namespace

ServerApp::ServerApp(const AppConfig& cfg)
    : cfg_(cfg),
      metrics_(std::make_shared<Metrics>()),
      publisher_(std::make_shared<EventPublisher>(cfg.event_queue)),
      recent_(std::make_shared<RecentEventLog>(cfg.recent_events)) {
    publisher_->add_sink(recent_);
    if (!cfg_.events_jsonl.empty()) {
        publisher_->add_sink(std::make_shared<JsonlEventSink>(cfg_.events_jsonl));
    }
    metrics_->set_dropped_events_source([pub = publisher_.get()] { return pub->dropped(); });

    if (cfg_.pipeline.detection_enabled) {
        log_info("server", "person detection is ENABLED, loading model " + cfg_.detector.model_path);
        detector_ = std::make_shared<YoloPersonDetector>(cfg_.detector);
        if (!detector_->ready()) {
            log_warn("server", "detector not ready; motion events only");
        }
    } else {
        log_info("server", "person detection is DISABLED");
    }

    WorkerDeps deps;
    deps.source = std::make_shared<OpenCvStreamSource>(cfg_.open_timeout_ms, cfg_.read_timeout_ms);
    deps.inference = detector_;
    deps.events = publisher_;
    deps.metrics = metrics_;
    supervisor_ = std::make_unique<CameraSupervisor>(
        cfg_.pipeline, std::move(deps), std::make_shared<TemplateUrlResolver>(cfg_.onvif_url_template));
}

ServerApp::~ServerApp() {
    stop();
}

bool ServerApp::start() {
    if (http_thread_.joinable()) return true;
    publisher_->start();
    http_srv_ = std::make_unique<httplib::Server>();
    setup_routes();

    const std::string addr = cfg_.host + ":" + std::to_string(cfg_.port);
    if (!http_srv_->bind_to_port(cfg_.host, cfg_.port)) {
        log_error("server", "unable to listen on " + addr);
        listen_failed_ = true;
        return false;
    }
    listen_failed_ = false;
    http_done_ = false;
    http_running_ = true;
    http_thread_ = std::thread(&ServerApp::run_http, this);
    log_info("server", "listening on http://" + addr);
    return true;
}

void ServerApp::stop() {
    // Streaming responses poll http_running_ and the workers, so both go
    // down before the server waits for its connection threads.
    http_running_ = false;
    recent_->close();
    supervisor_->stop_all();
    if (http_thread_.joinable()) {
        // stop() is a no-op until listen_after_bind() has started
        while (!http_done_) {
            http_srv_->stop();
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        http_thread_.join();
        log_info("server", "HTTP server stopped");
    }
    publisher_->stop();
}

bool ServerApp::listening() const {
    return http_running_ && http_srv_ && http_srv_->is_running();
}

void ServerApp::run_http() {
    if (!http_srv_->listen_after_bind() && http_running_) {
        log_error("server", "HTTP listener exited unexpectedly");
        listen_failed_ = true;
    }
    http_done_ = true;
}

void ServerApp::setup_routes() {
    auto& srv = *http_srv_;

    srv.set_exception_handler([](const httplib::Request&, httplib::Response& res, std::exception_ptr ep) {
        try {
            if (ep) std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            log_error("http", e.what());
            send_error(res, 500, e.what());
        }
    });

    srv.Get("/api/health", [](const httplib::Request&, httplib::Response& res) {
        res.set_content("{\"status\":\"ok\",\"service\":\"camera-ingest-module\"}", kJson);
    });

    srv.Get("/metrics", [this](const httplib::Request&, httplib::Response& res) {
        res.set_content(metrics_->render(), "text/plain; version=0.0.4");
    });

    srv.Post("/api/cameras", [this](const httplib::Request& req, httplib::Response& res) {
        try {
            Camera cam = supervisor_->register_camera(camera_from_json(req.body));
            res.set_content(camera_to_json(cam), kJson);
        } catch (const ValidationError& e) {
            send_error(res, 400, e.what());
        }
    });

    srv.Get("/api/cameras", [this](const httplib::Request&, httplib::Response& res) {
        res.set_content(cameras_to_json(supervisor_->list_cameras()), kJson);
    });

    srv.Get(R"(/api/cameras/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        auto cam = supervisor_->get_camera(req.matches[1]);
        if (!cam) return send_error(res, 404, "Camera not found");
        res.set_content(camera_to_json(*cam), kJson);
    });

    srv.Delete(R"(/api/cameras/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        if (!supervisor_->unregister_camera(req.matches[1])) return send_error(res, 404, "Camera not found");
        res.status = 204;
    });

    srv.Get(R"(/api/cameras/([^/]+)/frame/latest)", [this](const httplib::Request& req, httplib::Response& res) {
        auto worker = supervisor_->get_worker(req.matches[1]);
        if (!worker) return send_error(res, 404, "Camera or worker not found.");
        auto jpeg = latest_jpeg(*worker);
        if (!jpeg) return send_error(res, 404, "No frames available for this camera.");
        res.set_content(std::string(jpeg->begin(), jpeg->end()), "image/jpeg");
    });

    srv.Get(R"(/api/cameras/([^/]+)/stream/live\.mjpeg)", [this](const httplib::Request& req, httplib::Response& res) {
        auto worker = supervisor_->get_worker(req.matches[1]);
        if (!worker || !worker->running()) return send_error(res, 404, "Camera worker not found or not running.");

        auto seq = std::make_shared<LiveFrameSequence>(worker, cfg_.pipeline.stream_fps);
        res.set_chunked_content_provider(
            "multipart/x-mixed-replace; boundary=frame",
            [this, seq](size_t, httplib::DataSink& sink) {
                const bool more = write_live_chunk(
                    *seq, [&] { return http_running_.load() && sink.is_writable(); },
                    [&](const std::string& chunk) { return sink.write(chunk.data(), chunk.size()); });
                if (!more) sink.done();
                return true;
            },
            [seq](bool) { seq->cancel(); });
    });

    srv.Post(R"(/api/cameras/([^/]+)/frames)", [this](const httplib::Request& req, httplib::Response& res) {
        const std::string id = req.matches[1];
        std::optional<double> ts;
        if (req.has_param("timestamp")) {
            const std::string raw = req.get_param_value("timestamp");
            char* end = nullptr;
            double v = std::strtod(raw.c_str(), &end);
            if (end == raw.c_str() || *end != '\0') return send_error(res, 400, "timestamp must be a number");
            ts = v;
        }

        std::vector<unsigned char> payload(req.body.begin(), req.body.end());
        IngestStatus st = supervisor_->ingest(id, payload, ts);
        if (st != IngestStatus::ACCEPTED) return send_error(res, status_for(st), ingest_status_to_string(st));
        res.status = 202;
        res.set_content("{\"status\":\"accepted\"}", kJson);
    });

    srv.Get("/api/events", [this](const httplib::Request& req, httplib::Response& res) {
        uint64_t since = 0;
        if (req.has_param("since")) since = std::strtoull(req.get_param_value("since").c_str(), nullptr, 10);
        auto entries = recent_->since(since);
        std::ostringstream oss;
        oss << "[";
        for (size_t i = 0; i < entries.size(); ++i) {
            if (i) oss << ",";
            oss << "{\"seq\":" << entries[i].seq << ",\"event\":" << entries[i].json << "}";
        }
        oss << "]";
        res.set_content(oss.str(), kJson);
    });

    srv.Get("/api/events/stream", [this](const httplib::Request&, httplib::Response& res) {
        auto cursor = std::make_shared<uint64_t>(recent_->last_seq());
        res.set_header("Cache-Control", "no-store");
        res.set_chunked_content_provider(
            "text/event-stream",
            [this, cursor](size_t, httplib::DataSink& sink) {
                if (!http_running_ || !sink.is_writable()) {
                    sink.done();
                    return true;
                }
                auto entries = recent_->wait_since(*cursor, 1000);
                std::string out;
                if (entries.empty()) {
                    out = ": keepalive\n\n";
                }
                for (const auto& e : entries) {
                    out += "id: " + std::to_string(e.seq) + "\ndata: " + e.json + "\n\n";
                    *cursor = e.seq;
                }
                return sink.write(out.data(), out.size());
            });
    });
}

}  // namespace camingest
