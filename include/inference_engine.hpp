#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <opencv2/dnn.hpp>

#include "frame_types.hpp"

#ifdef USE_ONNXRUNTIME
#include <onnxruntime_cxx_api.h>
#endif

namespace camingest {

// Opaque deep-inference capability. Returns only detections of interest that
// passed the backend's own confidence threshold.
class InferenceBackend {
public:
    virtual ~InferenceBackend() = default;
    virtual bool ready() const = 0;
    virtual InferenceResult infer(const cv::Mat& frame) = 0;
};

struct DetectorConfig {
    std::string model_path{"models/yolov4-tiny.weights"};
    std::string model_config{"models/yolov4-tiny.cfg"};   // Darknet cfg, ignored for ONNX
    std::string class_names_path{"models/coco.names"};
    std::string target_label{"person"};
    int img_size{416};
    float conf_threshold{0.65f};
    float nms_threshold{0.4f};
    bool use_onnxruntime{false};
};

// YOLO person detector. OpenCV DNN by default (Darknet or any readNet
// format); ONNX Runtime when built with it and asked for. One instance is
// shared by all workers; infer() runs one frame at a time.
class YoloPersonDetector : public InferenceBackend {
public:
    explicit YoloPersonDetector(const DetectorConfig& cfg);

    bool ready() const override { return ready_; }
    InferenceResult infer(const cv::Mat& frame) override;

private:
    struct Candidates {
        std::vector<cv::Rect> boxes;
        std::vector<float> scores;
    };

    void load_class_names(const std::string& path);
    void decode(const float* data, int rows, int dims, bool channel_first,
                const cv::Size& frame_size, Candidates& out) const;
    InferenceResult finish(const cv::Mat& frame, const Candidates& cands) const;

    InferenceResult run_opencv(const cv::Mat& frame);
#ifdef USE_ONNXRUNTIME
    InferenceResult run_ort(const cv::Mat& frame);
#endif

    DetectorConfig cfg_;
    std::mutex infer_mu_;
    cv::dnn::Net net_;
    std::vector<std::string> out_layers_;
    std::vector<std::string> class_names_;
    int target_class_{-1};
    bool ready_{false};
    bool use_ort_{false};

#ifdef USE_ONNXRUNTIME
    Ort::Env env_{ORT_LOGGING_LEVEL_WARNING, "camingest"};
    std::unique_ptr<Ort::Session> session_;
    Ort::MemoryInfo mem_info_{Ort::MemoryInfo::CreateCpu(OrtDeviceAllocator, OrtMemTypeCPU)};
    std::vector<std::string> input_name_strs_;
    std::vector<const char*> input_names_;
    std::vector<std::string> output_name_strs_;
    std::vector<const char*> output_names_;
#endif
};

}  // namespace camingest
