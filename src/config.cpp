#include "config.hpp"

#include <cctype>
#include <cstdlib>
#include <cstring>
#include <iostream>

#include "errors.hpp"

namespace camingest {

namespace {

bool arg_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

int to_int(const char* name, const char* v) {
    char* end = nullptr;
    long n = std::strtol(v, &end, 10);
    if (end == v || *end != '\0') throw ValidationError(std::string(name) + ": not an integer: " + v);
    return static_cast<int>(n);
}

size_t to_size(const char* name, const char* v) {
    int n = to_int(name, v);
    if (n < 1) throw ValidationError(std::string(name) + ": must be positive");
    return static_cast<size_t>(n);
}

double to_double(const char* name, const char* v) {
    char* end = nullptr;
    double d = std::strtod(v, &end);
    if (end == v || *end != '\0') throw ValidationError(std::string(name) + ": not a number: " + v);
    return d;
}

bool to_bool(const char* v) {
    std::string s(v);
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s == "1" || s == "true" || s == "yes" || s == "on";
}

void apply_env(AppConfig& cfg) {
    auto& p = cfg.pipeline;
    if (const char* v = std::getenv("CAMINGEST_HOST")) cfg.host = v;
    if (const char* v = std::getenv("CAMINGEST_PORT")) cfg.port = to_int("CAMINGEST_PORT", v);
    if (const char* v = std::getenv("BUFFER_CAPACITY")) p.buffer_capacity = to_size("BUFFER_CAPACITY", v);
    if (const char* v = std::getenv("ENABLE_PERSON_DETECTION")) p.detection_enabled = to_bool(v);
    if (const char* v = std::getenv("PERSON_COOLDOWN_SECONDS")) p.person_cooldown_sec = to_double("PERSON_COOLDOWN_SECONDS", v);
    if (const char* v = std::getenv("YOLO_CONFIDENCE_THRESHOLD")) cfg.detector.conf_threshold = static_cast<float>(to_double("YOLO_CONFIDENCE_THRESHOLD", v));
    if (const char* v = std::getenv("MOTION_MIN_AREA")) p.motion.min_area = to_double("MOTION_MIN_AREA", v);
    if (const char* v = std::getenv("MOTION_COOLDOWN_SECONDS")) p.motion.cooldown_sec = to_double("MOTION_COOLDOWN_SECONDS", v);
    if (const char* v = std::getenv("YOLO_TRIGGER_COOLDOWN")) p.inference_cooldown_sec = to_double("YOLO_TRIGGER_COOLDOWN", v);
    if (const char* v = std::getenv("FRAME_SKIP")) p.frame_skip = to_int("FRAME_SKIP", v);
    if (const char* v = std::getenv("EVENT_PUB_INTERVAL")) p.event_interval_sec = to_double("EVENT_PUB_INTERVAL", v);
    if (const char* v = std::getenv("YOLO_CFG")) cfg.detector.model_config = v;
    if (const char* v = std::getenv("YOLO_WEIGHTS")) cfg.detector.model_path = v;
    if (const char* v = std::getenv("YOLO_NAMES")) cfg.detector.class_names_path = v;
    if (const char* v = std::getenv("IMG_SIZE")) cfg.detector.img_size = to_int("IMG_SIZE", v);
    if (const char* v = std::getenv("EVENTS_JSONL")) cfg.events_jsonl = v;
    if (const char* v = std::getenv("SNAPSHOT_DIR")) p.snapshot_dir = v;
    if (const char* v = std::getenv("STREAM_FPS")) p.stream_fps = to_int("STREAM_FPS", v);
    if (const char* v = std::getenv("ONVIF_URL_TEMPLATE")) cfg.onvif_url_template = v;
}

}  // namespace

std::string usage() {
    return "Usage: camingest_server [--host <addr>] [--port <n>] [--buffer <n>]\n"
           "                        [--detect|--no-detect] [--model <weights>] [--model-cfg <cfg>]\n"
           "                        [--class-names <file>] [--img <size>] [--conf <thresh>] [--nms <thresh>]\n"
           "                        [--use-ort|--no-ort] [--motion-area <px>] [--motion-cooldown <s>]\n"
           "                        [--trigger-cooldown <s>] [--person-cooldown <s>] [--frame-skip <k>]\n"
           "                        [--event-interval <s>] [--events <path>] [--event-queue <n>]\n"
           "                        [--snapshots <dir>] [--open-timeout <ms>] [--read-timeout <ms>]\n"
           "                        [--backoff <s>] [--backoff-max <s>] [--stream-fps <n>]\n"
           "                        [--onvif-template <url>]\n";
}

AppConfig parse_args(int argc, char** argv) {
    AppConfig cfg;
    apply_env(cfg);
    auto& p = cfg.pipeline;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        const char* next = (i + 1 < argc) ? argv[i + 1] : nullptr;

        if (arg_eq(arg, "--help")) {
            std::cout << usage();
            std::exit(0);
        } else if (arg_eq(arg, "--detect")) {
            p.detection_enabled = true;
        } else if (arg_eq(arg, "--no-detect")) {
            p.detection_enabled = false;
        } else if (arg_eq(arg, "--use-ort")) {
            cfg.detector.use_onnxruntime = true;
        } else if (arg_eq(arg, "--no-ort")) {
            cfg.detector.use_onnxruntime = false;
        } else if (!next) {
            throw ValidationError(std::string("missing value or unknown flag: ") + arg);
        } else {
            if (arg_eq(arg, "--host")) cfg.host = next;
            else if (arg_eq(arg, "--port")) cfg.port = to_int(arg, next);
            else if (arg_eq(arg, "--buffer")) p.buffer_capacity = to_size(arg, next);
            else if (arg_eq(arg, "--model")) cfg.detector.model_path = next;
            else if (arg_eq(arg, "--model-cfg")) cfg.detector.model_config = next;
            else if (arg_eq(arg, "--class-names")) cfg.detector.class_names_path = next;
            else if (arg_eq(arg, "--img")) cfg.detector.img_size = to_int(arg, next);
            else if (arg_eq(arg, "--conf")) cfg.detector.conf_threshold = static_cast<float>(to_double(arg, next));
            else if (arg_eq(arg, "--nms")) cfg.detector.nms_threshold = static_cast<float>(to_double(arg, next));
            else if (arg_eq(arg, "--motion-area")) p.motion.min_area = to_double(arg, next);
            else if (arg_eq(arg, "--motion-cooldown")) p.motion.cooldown_sec = to_double(arg, next);
            else if (arg_eq(arg, "--trigger-cooldown")) p.inference_cooldown_sec = to_double(arg, next);
            else if (arg_eq(arg, "--person-cooldown")) p.person_cooldown_sec = to_double(arg, next);
            else if (arg_eq(arg, "--frame-skip")) p.frame_skip = to_int(arg, next);
            else if (arg_eq(arg, "--event-interval")) p.event_interval_sec = to_double(arg, next);
            else if (arg_eq(arg, "--events")) cfg.events_jsonl = next;
            else if (arg_eq(arg, "--event-queue")) cfg.event_queue = to_size(arg, next);
            else if (arg_eq(arg, "--snapshots")) p.snapshot_dir = next;
            else if (arg_eq(arg, "--open-timeout")) cfg.open_timeout_ms = to_int(arg, next);
            else if (arg_eq(arg, "--read-timeout")) cfg.read_timeout_ms = to_int(arg, next);
            else if (arg_eq(arg, "--backoff")) p.reconnect_initial_sec = to_double(arg, next);
            else if (arg_eq(arg, "--backoff-max")) p.reconnect_max_sec = to_double(arg, next);
            else if (arg_eq(arg, "--stream-fps")) p.stream_fps = to_int(arg, next);
            else if (arg_eq(arg, "--onvif-template")) cfg.onvif_url_template = next;
            else throw ValidationError(std::string("unknown flag: ") + arg);
            i++;
        }
    }

    validate(cfg);
    return cfg;
}

void validate(const AppConfig& cfg) {
    const auto& p = cfg.pipeline;
    if (cfg.port < 1 || cfg.port > 65535) throw ValidationError("port must be in 1..65535");
    if (p.buffer_capacity == 0) throw ValidationError("buffer capacity must be positive");
    if (p.frame_skip < 1) throw ValidationError("frame skip must be at least 1");
    if (p.reconnect_initial_sec <= 0.0 || p.reconnect_max_sec < p.reconnect_initial_sec) {
        throw ValidationError("backoff must be positive and not exceed the backoff cap");
    }
    if (p.stream_fps < 1) throw ValidationError("stream fps must be at least 1");
    if (cfg.detector.img_size < 32) throw ValidationError("model input size too small");
    if (cfg.event_queue == 0) throw ValidationError("event queue must be positive");
}

}  // namespace camingest
