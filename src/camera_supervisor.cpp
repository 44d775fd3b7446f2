#include "camera_supervisor.hpp"

#include <algorithm>
#include <utility>

#include <opencv2/imgcodecs.hpp>

#include "errors.hpp"
#include "log.hpp"

namespace camingest {

namespace {

void replace_all(std::string& s, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

}  // namespace

TemplateUrlResolver::TemplateUrlResolver(std::string url_template) : template_(std::move(url_template)) {}

std::string TemplateUrlResolver::resolve(const Camera& camera) {
    if (camera.ip_address.empty()) {
        throw ValidationError("Source type 'onvif' requires an ip_address.");
    }
    std::string url = template_;
    if (camera.username.empty()) {
        replace_all(url, "{user}:{password}@", "");
        replace_all(url, "{user}@", "");
    }
    replace_all(url, "{host}", camera.ip_address);
    replace_all(url, "{port}", std::to_string(camera.onvif_port));
    replace_all(url, "{user}", camera.username);
    replace_all(url, "{password}", camera.password);
    return url;
}

CameraSupervisor::CameraSupervisor(const PipelineConfig& cfg, WorkerDeps deps,
                                   std::shared_ptr<StreamUrlResolver> resolver)
    : cfg_(cfg), deps_(std::move(deps)), resolver_(std::move(resolver)) {
    if (!deps_.clock) deps_.clock = wall_clock;
}

CameraSupervisor::~CameraSupervisor() {
    stop_all();
}

void CameraSupervisor::validate(Camera& camera) const {
    if (camera.id.empty()) throw ValidationError("Camera id must not be empty.");
    if (camera.id.find('/') != std::string::npos) throw ValidationError("Camera id must not contain '/'.");

    switch (camera.source_type) {
        case SourceType::RTSP:
        case SourceType::MJPEG:
            if (camera.source_url.empty()) {
                throw ValidationError(std::string("Source type '") + source_type_to_string(camera.source_type) +
                                      "' requires a source_url.");
            }
            break;
        case SourceType::ONVIF:
            if (camera.source_url.empty()) {
                if (!resolver_) throw ValidationError("ONVIF discovery is not available; provide a source_url.");
                camera.source_url = resolver_->resolve(camera);
                if (camera.source_url.empty()) throw ValidationError("ONVIF discovery returned no stream URL.");
            }
            break;
        case SourceType::HTTP_PUSH:
            break;
    }
}

Camera CameraSupervisor::register_camera(Camera camera) {
    validate(camera);
    camera.status = CameraStatus::REGISTERED;

    std::lock_guard<std::mutex> lifecycle(lifecycle_mu_);

    std::shared_ptr<CameraWorker> previous;
    {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = entries_.find(camera.id);
        if (it != entries_.end()) previous = it->second.worker;
    }
    if (previous) {
        log_info("supervisor", "replacing camera " + camera.id);
        previous->stop();
    }

    auto worker = std::make_shared<CameraWorker>(camera, cfg_, deps_);
    worker->start();

    Entry entry{camera, worker};
    Camera out = snapshot(entry);
    {
        std::lock_guard<std::mutex> lock(mu_);
        entries_[camera.id] = std::move(entry);
    }
    log_info("supervisor", "registered camera " + camera.id + " (" + source_type_to_string(camera.source_type) + ")");
    return out;
}

bool CameraSupervisor::unregister_camera(const std::string& id) {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mu_);

    std::shared_ptr<CameraWorker> worker;
    {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = entries_.find(id);
        if (it == entries_.end()) return false;
        worker = std::move(it->second.worker);
        entries_.erase(it);
    }
    if (worker) worker->stop();
    if (deps_.metrics) deps_.metrics->remove_camera(id);
    log_info("supervisor", "unregistered camera " + id);
    return true;
}

std::shared_ptr<CameraWorker> CameraSupervisor::get_worker(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = entries_.find(id);
    if (it == entries_.end()) return nullptr;
    return it->second.worker;
}

std::optional<Camera> CameraSupervisor::get_camera(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = entries_.find(id);
    if (it == entries_.end()) return std::nullopt;
    return snapshot(it->second);
}

std::vector<Camera> CameraSupervisor::list_cameras() const {
    std::vector<Camera> out;
    {
        std::lock_guard<std::mutex> lock(mu_);
        out.reserve(entries_.size());
        for (const auto& kv : entries_) out.push_back(snapshot(kv.second));
    }
    std::sort(out.begin(), out.end(), [](const Camera& a, const Camera& b) { return a.id < b.id; });
    return out;
}

size_t CameraSupervisor::size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return entries_.size();
}

Camera CameraSupervisor::snapshot(const Entry& entry) {
    Camera c = entry.camera;
    if (entry.worker) c.status = entry.worker->status();
    return c;
}

IngestStatus CameraSupervisor::ingest(const std::string& id, const std::vector<unsigned char>& payload,
                                      std::optional<double> timestamp) {
    std::shared_ptr<CameraWorker> worker = get_worker(id);
    if (!worker) return IngestStatus::UNKNOWN_CAMERA;
    if (!worker->is_push()) return IngestStatus::NOT_PUSH_SOURCE;
    if (payload.empty()) return IngestStatus::INVALID_IMAGE;

    cv::Mat image;
    try {
        image = cv::imdecode(payload, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        log_warn("supervisor", "decode failed for " + id + ": " + e.what());
        return IngestStatus::INVALID_IMAGE;
    }
    if (image.empty()) return IngestStatus::INVALID_IMAGE;

    const double ts = timestamp ? *timestamp : deps_.clock();
    if (!worker->process_frame(image, ts)) return IngestStatus::NOT_RUNNING;
    return IngestStatus::ACCEPTED;
}

void CameraSupervisor::stop_all() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mu_);
    std::vector<std::shared_ptr<CameraWorker>> workers;
    {
        std::lock_guard<std::mutex> lock(mu_);
        for (auto& kv : entries_) workers.push_back(kv.second.worker);
    }
    for (auto& w : workers) {
        if (w) w->stop();
    }
}

}  // namespace camingest
