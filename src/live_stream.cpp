#include "live_stream.hpp"

#include <algorithm>
#include <chrono>
#include <thread>
#include <utility>

#include <opencv2/imgcodecs.hpp>

namespace camingest {

std::optional<std::vector<unsigned char>> encode_jpeg(const cv::Mat& image, int quality) {
    if (image.empty()) return std::nullopt;
    std::vector<unsigned char> out;
    const std::vector<int> params{cv::IMWRITE_JPEG_QUALITY, quality};
    if (!cv::imencode(".jpg", image, out, params)) return std::nullopt;
    return out;
}

std::optional<std::vector<unsigned char>> latest_jpeg(const CameraWorker& worker) {
    FramePtr frame = worker.latest_frame();
    if (!frame) return std::nullopt;
    return encode_jpeg(frame->image);
}

LiveFrameSequence::LiveFrameSequence(std::shared_ptr<CameraWorker> worker, int max_fps)
    : worker_(std::move(worker)), period_ms_(std::max(1, 1000 / (max_fps > 0 ? max_fps : 30))) {}

bool LiveFrameSequence::active() const {
    return !cancelled_ && worker_ && worker_->running();
}

LivePoll LiveFrameSequence::poll(std::vector<unsigned char>& jpeg) {
    if (pace_) {
        // a frame went out on the previous call
        std::this_thread::sleep_for(std::chrono::milliseconds(period_ms_));
        pace_ = false;
    }
    if (!active()) return LivePoll::ENDED;

    FramePtr frame = worker_->latest_frame();
    if (frame && (first_ || frame->timestamp > last_timestamp_)) {
        if (auto encoded = encode_jpeg(frame->image)) {
            first_ = false;
            last_timestamp_ = frame->timestamp;
            jpeg = std::move(*encoded);
            pace_ = true;
            return LivePoll::FRAME;
        }
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(period_ms_));
    return active() ? LivePoll::PENDING : LivePoll::ENDED;
}

bool LiveFrameSequence::next(std::vector<unsigned char>& jpeg, const std::function<bool()>& keep_going) {
    for (;;) {
        if (keep_going && !keep_going()) return false;
        switch (poll(jpeg)) {
            case LivePoll::FRAME: return true;
            case LivePoll::ENDED: return false;
            case LivePoll::PENDING: break;
        }
    }
}

std::string LiveFrameSequence::multipart_chunk(const std::vector<unsigned char>& jpeg) {
    std::string chunk = "--frame\r\nContent-Type: image/jpeg\r\n\r\n";
    chunk.append(reinterpret_cast<const char*>(jpeg.data()), jpeg.size());
    chunk += "\r\n";
    return chunk;
}

bool write_live_chunk(LiveFrameSequence& seq, const std::function<bool()>& open,
                      const std::function<bool(const std::string&)>& write) {
    if (!open()) return false;
    std::vector<unsigned char> jpeg;
    switch (seq.poll(jpeg)) {
        case LivePoll::FRAME: return write(LiveFrameSequence::multipart_chunk(jpeg));
        case LivePoll::PENDING: return true;
        case LivePoll::ENDED: return false;
    }
    return false;
}

}  // namespace camingest
