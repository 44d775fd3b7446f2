#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "camera_worker.hpp"
#include "config.hpp"
#include "frame_types.hpp"

namespace camingest {

// Turns discovery parameters (host, port, credentials) into a stream URL.
class StreamUrlResolver {
public:
    virtual ~StreamUrlResolver() = default;
    // Throws ValidationError when the camera cannot be resolved.
    virtual std::string resolve(const Camera& camera) = 0;
};

// Expands {host}, {port}, {user} and {password}. Without a username the
// "{user}:{password}@" part is dropped.
class TemplateUrlResolver : public StreamUrlResolver {
public:
    explicit TemplateUrlResolver(std::string url_template);
    std::string resolve(const Camera& camera) override;

private:
    std::string template_;
};

enum class IngestStatus { ACCEPTED, UNKNOWN_CAMERA, NOT_PUSH_SOURCE, INVALID_IMAGE, NOT_RUNNING };

inline const char* ingest_status_to_string(IngestStatus s) {
    switch (s) {
        case IngestStatus::ACCEPTED: return "accepted";
        case IngestStatus::UNKNOWN_CAMERA: return "unknown camera";
        case IngestStatus::NOT_PUSH_SOURCE: return "camera is not an http_push source";
        case IngestStatus::INVALID_IMAGE: return "payload is not a decodable image";
        case IngestStatus::NOT_RUNNING: return "camera worker is not running";
    }
    return "unknown";
}

// Owns the camera and worker registries. Register and unregister are
// serialised so one identity never has two live workers; lookups only take
// the short map lock and never wait on a worker being stopped.
class CameraSupervisor {
public:
    CameraSupervisor(const PipelineConfig& cfg, WorkerDeps deps,
                     std::shared_ptr<StreamUrlResolver> resolver = nullptr);
    ~CameraSupervisor();

    CameraSupervisor(const CameraSupervisor&) = delete;
    CameraSupervisor& operator=(const CameraSupervisor&) = delete;

    // Validates, stops any worker already registered under the same id, then
    // starts a fresh one. Throws ValidationError.
    Camera register_camera(Camera camera);

    // False if the id was not registered.
    bool unregister_camera(const std::string& id);

    std::shared_ptr<CameraWorker> get_worker(const std::string& id) const;
    std::optional<Camera> get_camera(const std::string& id) const;
    std::vector<Camera> list_cameras() const;
    size_t size() const;

    // Push ingestion: decode `payload` and hand it to the camera's worker.
    // `timestamp` defaults to the worker clock.
    IngestStatus ingest(const std::string& id, const std::vector<unsigned char>& payload,
                        std::optional<double> timestamp);

    void stop_all();

private:
    struct Entry {
        Camera camera;
        std::shared_ptr<CameraWorker> worker;
    };

    void validate(Camera& camera) const;
    static Camera snapshot(const Entry& entry);

    PipelineConfig cfg_;
    WorkerDeps deps_;
    std::shared_ptr<StreamUrlResolver> resolver_;

    std::mutex lifecycle_mu_;
    mutable std::mutex mu_;
    std::unordered_map<std::string, Entry> entries_;
};

}  // namespace camingest
