#include "inference_engine.hpp"

#include <algorithm>
#include <fstream>

#include <opencv2/imgproc.hpp>

#include "log.hpp"

namespace camingest {

namespace {

const std::vector<std::string> kCocoNames = {
    "person", "bicycle", "car", "motorcycle", "airplane", "bus", "train", "truck",
    "boat", "traffic light", "fire hydrant", "stop sign", "parking meter", "bench",
    "bird", "cat", "dog", "horse", "sheep", "cow", "elephant", "bear", "zebra", "giraffe",
    "backpack", "umbrella", "handbag", "tie", "suitcase", "frisbee", "skis", "snowboard",
    "sports ball", "kite", "baseball bat", "baseball glove", "skateboard", "surfboard",
    "tennis racket", "bottle", "wine glass", "cup", "fork", "knife", "spoon", "bowl",
    "banana", "apple", "sandwich", "orange", "broccoli", "carrot", "hot dog", "pizza",
    "donut", "cake", "chair", "couch", "potted plant", "bed", "dining table", "toilet",
    "tv", "laptop", "mouse", "remote", "keyboard", "cell phone", "microwave", "oven",
    "toaster", "sink", "refrigerator", "book", "clock", "vase", "scissors", "teddy bear",
    "hair drier", "toothbrush"};

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

YoloPersonDetector::YoloPersonDetector(const DetectorConfig& cfg) : cfg_(cfg) {
    if (!cfg_.class_names_path.empty()) load_class_names(cfg_.class_names_path);
    if (class_names_.empty()) class_names_ = kCocoNames;

    auto it = std::find(class_names_.begin(), class_names_.end(), cfg_.target_label);
    if (it == class_names_.end()) {
        log_error("detector", "class '" + cfg_.target_label + "' not found in class names");
        return;
    }
    target_class_ = static_cast<int>(it - class_names_.begin());

#ifdef USE_ONNXRUNTIME
    if (cfg_.use_onnxruntime && ends_with(cfg_.model_path, ".onnx")) {
        try {
            Ort::SessionOptions opts;
            opts.SetGraphOptimizationLevel(ORT_ENABLE_ALL);
            session_ = std::make_unique<Ort::Session>(env_, cfg_.model_path.c_str(), opts);

            Ort::AllocatorWithDefaultOptions allocator;
            for (size_t i = 0; i < session_->GetInputCount(); ++i) {
                input_name_strs_.push_back(session_->GetInputNameAllocated(i, allocator).get());
            }
            for (size_t i = 0; i < session_->GetOutputCount(); ++i) {
                output_name_strs_.push_back(session_->GetOutputNameAllocated(i, allocator).get());
            }
            for (const auto& s : input_name_strs_) input_names_.push_back(s.c_str());
            for (const auto& s : output_name_strs_) output_names_.push_back(s.c_str());

            use_ort_ = true;
            ready_ = true;
            log_info("detector", "loaded ORT model: " + cfg_.model_path);
            return;
        } catch (const std::exception& e) {
            log_warn("detector", std::string("ONNX Runtime load failed (") + e.what() + "); falling back to OpenCV DNN");
        }
    }
#endif

    try {
        if (ends_with(cfg_.model_config, ".cfg")) {
            net_ = cv::dnn::readNetFromDarknet(cfg_.model_config, cfg_.model_path);
        } else {
            net_ = cv::dnn::readNet(cfg_.model_path, cfg_.model_config);
        }
        net_.setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
        net_.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);
        out_layers_ = net_.getUnconnectedOutLayersNames();
        ready_ = !net_.empty();
        if (ready_) log_info("detector", "loaded OpenCV DNN model: " + cfg_.model_path);
    } catch (const std::exception& e) {
        log_error("detector", std::string("could not load model: ") + e.what());
        ready_ = false;
    }
}

void YoloPersonDetector::load_class_names(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        log_warn("detector", "unable to open class names file: " + path + ", using COCO names");
        return;
    }
    std::string line;
    while (std::getline(f, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) class_names_.push_back(line);
    }
}

InferenceResult YoloPersonDetector::infer(const cv::Mat& frame) {
    if (!ready_ || frame.empty()) return InferenceResult{};
    std::lock_guard<std::mutex> lock(infer_mu_);
#ifdef USE_ONNXRUNTIME
    if (use_ort_ && session_) return run_ort(frame);
#endif
    return run_opencv(frame);
}

// Rows are [cx, cy, w, h, (objectness), class scores...]. Darknet region
// layers emit coordinates normalised to [0,1] and class scores that already
// include objectness; exported ONNX models emit input-pixel coordinates.
void YoloPersonDetector::decode(const float* data, int rows, int dims, bool channel_first,
                                const cv::Size& frame_size, Candidates& out) const {
    const int n_names = static_cast<int>(class_names_.size());
    const bool has_objectness = dims != n_names + 4;
    const int class_start = has_objectness ? 5 : 4;
    const int classes = dims - class_start;
    if (classes <= 0) return;

    const bool normalized = !use_ort_ && ends_with(cfg_.model_config, ".cfg");
    const float scale_x = normalized ? static_cast<float>(frame_size.width)
                                     : static_cast<float>(frame_size.width) / static_cast<float>(cfg_.img_size);
    const float scale_y = normalized ? static_cast<float>(frame_size.height)
                                     : static_cast<float>(frame_size.height) / static_cast<float>(cfg_.img_size);

    for (int i = 0; i < rows; ++i) {
        auto item = [&](int idx) -> float {
            return channel_first ? data[idx * rows + i] : data[i * dims + idx];
        };

        int best_cls = -1;
        float best_score = 0.0f;
        for (int c = 0; c < classes; ++c) {
            float s = item(class_start + c);
            if (s > best_score) {
                best_score = s;
                best_cls = c;
            }
        }
        if (best_cls != target_class_) continue;
        if (has_objectness && !normalized) best_score *= item(4);
        if (best_score <= cfg_.conf_threshold) continue;

        const float cx = item(0) * scale_x;
        const float cy = item(1) * scale_y;
        const float w = item(2) * scale_x;
        const float h = item(3) * scale_y;
        out.boxes.emplace_back(static_cast<int>(cx - 0.5f * w), static_cast<int>(cy - 0.5f * h),
                               static_cast<int>(w), static_cast<int>(h));
        out.scores.push_back(best_score);
    }
}

InferenceResult YoloPersonDetector::finish(const cv::Mat& frame, const Candidates& cands) const {
    InferenceResult result;
    std::vector<int> keep;
    cv::dnn::NMSBoxes(cands.boxes, cands.scores, cfg_.conf_threshold, cfg_.nms_threshold, keep);
    if (keep.empty()) return result;

    result.annotated = frame.clone();
    const cv::Scalar green(0, 255, 0);
    for (int idx : keep) {
        const cv::Rect& box = cands.boxes[idx];
        result.dets.push_back(Detection{cfg_.target_label, cands.scores[idx], box});
        cv::rectangle(result.annotated, box, green, 2);
        std::string caption = "Person: " + cv::format("%.2f", cands.scores[idx]);
        cv::putText(result.annotated, caption, cv::Point(box.x, std::max(0, box.y - 5)),
                    cv::FONT_HERSHEY_SIMPLEX, 0.5, green, 2);
    }
    return result;
}

InferenceResult YoloPersonDetector::run_opencv(const cv::Mat& frame) {
    cv::Mat blob = cv::dnn::blobFromImage(frame, 1.0 / 255.0, cv::Size(cfg_.img_size, cfg_.img_size),
                                          cv::Scalar(), true, false);
    net_.setInput(blob);
    std::vector<cv::Mat> outputs;
    net_.forward(outputs, out_layers_);

    Candidates cands;
    for (const auto& pred : outputs) {
        if (pred.dims == 3) {
            // [1, rows, dims] or the transposed [1, dims, rows] layout
            int rows = pred.size[1];
            int dims = pred.size[2];
            bool channel_first = false;
            if (pred.size[2] > pred.size[1]) {
                rows = pred.size[2];
                dims = pred.size[1];
                channel_first = true;
            }
            decode(pred.ptr<float>(), rows, dims, channel_first, frame.size(), cands);
        } else if (pred.dims == 2) {
            decode(pred.ptr<float>(), pred.rows, pred.cols, false, frame.size(), cands);
        }
    }
    return finish(frame, cands);
}

#ifdef USE_ONNXRUNTIME
InferenceResult YoloPersonDetector::run_ort(const cv::Mat& frame) {
    const int size = cfg_.img_size;
    cv::Mat resized, rgb;
    cv::resize(frame, resized, cv::Size(size, size));
    cv::cvtColor(resized, rgb, cv::COLOR_BGR2RGB);
    rgb.convertTo(rgb, CV_32F, 1.0 / 255.0);

    std::vector<float> blob;
    blob.reserve(static_cast<size_t>(3) * size * size);
    for (int c = 0; c < 3; ++c) {
        for (int y = 0; y < size; ++y) {
            const float* row = rgb.ptr<float>(y);
            for (int x = 0; x < size; ++x) blob.push_back(row[x * 3 + c]);
        }
    }
    std::vector<int64_t> input_shape{1, 3, size, size};

    Ort::Value input_tensor = Ort::Value::CreateTensor<float>(mem_info_, blob.data(), blob.size(),
                                                              input_shape.data(), input_shape.size());
    auto outputs = session_->Run(Ort::RunOptions{nullptr}, input_names_.data(), &input_tensor, 1,
                                 output_names_.data(), output_names_.size());
    if (outputs.empty()) return InferenceResult{};

    auto& out = outputs.front();
    const float* data = out.GetTensorData<float>();
    auto shape = out.GetTensorTypeAndShapeInfo().GetShape();

    Candidates cands;
    if (shape.size() == 3) {
        int rows = static_cast<int>(shape[1]);
        int dims = static_cast<int>(shape[2]);
        bool channel_first = false;
        if (shape[2] > shape[1]) {
            rows = static_cast<int>(shape[2]);
            dims = static_cast<int>(shape[1]);
            channel_first = true;
        }
        decode(data, rows, dims, channel_first, frame.size(), cands);
    } else if (shape.size() == 2) {
        decode(data, static_cast<int>(shape[0]), static_cast<int>(shape[1]), false, frame.size(), cands);
    }
    return finish(frame, cands);
}
#endif

}  // namespace camingest
