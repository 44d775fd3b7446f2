#include "stream_source.hpp"

#include <cctype>
#include <utility>
#include <vector>

#include "log.hpp"

namespace camingest {

namespace {

class OpenCvFrameStream : public FrameStream {
public:
    explicit OpenCvFrameStream(std::unique_ptr<cv::VideoCapture> cap) : cap_(std::move(cap)) {
        meta_.width = static_cast<int>(cap_->get(cv::CAP_PROP_FRAME_WIDTH));
        meta_.height = static_cast<int>(cap_->get(cv::CAP_PROP_FRAME_HEIGHT));
        meta_.fps = cap_->get(cv::CAP_PROP_FPS);
    }

    ~OpenCvFrameStream() override {
        cap_->release();
    }

    StreamMetadata metadata() const override { return meta_; }

    bool read(cv::Mat& frame) override {
        return cap_->read(frame) && !frame.empty();
    }

private:
    std::unique_ptr<cv::VideoCapture> cap_;
    StreamMetadata meta_;
};

bool is_device_index(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

}  // namespace

OpenCvStreamSource::OpenCvStreamSource(int open_timeout_ms, int read_timeout_ms)
    : open_timeout_ms_(open_timeout_ms), read_timeout_ms_(read_timeout_ms) {}

std::unique_ptr<FrameStream> OpenCvStreamSource::open(const std::string& url) {
    auto cap = std::make_unique<cv::VideoCapture>();
    const std::vector<int> params{cv::CAP_PROP_OPEN_TIMEOUT_MSEC, open_timeout_ms_,
                                  cv::CAP_PROP_READ_TIMEOUT_MSEC, read_timeout_ms_};

    // Allow numeric index or URL
    if (is_device_index(url)) {
        cap->open(std::stoi(url), cv::CAP_ANY, params);
    } else {
        cap->open(url, cv::CAP_ANY, params);
    }

    if (!cap->isOpened()) {
        log_warn("source", "unable to open video source: " + url);
        return nullptr;
    }
    return std::make_unique<OpenCvFrameStream>(std::move(cap));
}

}  // namespace camingest
