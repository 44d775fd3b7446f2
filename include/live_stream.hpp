#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "camera_worker.hpp"

namespace camingest {

// JPEG-encodes a frame; nullopt if OpenCV refuses it.
std::optional<std::vector<unsigned char>> encode_jpeg(const cv::Mat& image, int quality = 90);

// Latest buffered frame of `worker` as JPEG, or nullopt when the buffer is empty.
std::optional<std::vector<unsigned char>> latest_jpeg(const CameraWorker& worker);

enum class LivePoll { FRAME, PENDING, ENDED };

// Lazy, unbounded sequence of JPEG frames for one camera. Each frame is
// yielded only if it is newer than the previous one, at most `max_fps` times
// per second. Ends when the worker stops or cancel() is called.
class LiveFrameSequence {
public:
    LiveFrameSequence(std::shared_ptr<CameraWorker> worker, int max_fps);

    // Waits at most one period. PENDING means no newer frame yet; the caller
    // decides whether to keep polling.
    LivePoll poll(std::vector<unsigned char>& jpeg);

    // Polls until a frame arrives, the sequence ends, or `keep_going` turns false.
    bool next(std::vector<unsigned char>& jpeg, const std::function<bool()>& keep_going = nullptr);

    void cancel() { cancelled_ = true; }
    int period_ms() const { return period_ms_; }

    // "--frame\r\nContent-Type: image/jpeg\r\n\r\n" + jpeg + "\r\n"
    static std::string multipart_chunk(const std::vector<unsigned char>& jpeg);

private:
    bool active() const;

    std::shared_ptr<CameraWorker> worker_;
    int period_ms_;
    double last_timestamp_{0.0};
    bool first_{true};
    bool pace_{false};
    std::atomic<bool> cancelled_{false};
};

// One step of a chunked multipart response. `open` reports whether the
// consumer and server are still there; `write` sends one chunk. Returns false
// once the response should be finished.
bool write_live_chunk(LiveFrameSequence& seq, const std::function<bool()>& open,
                      const std::function<bool(const std::string&)>& write);

}  // namespace camingest
