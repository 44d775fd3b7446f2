#pragma once

#include <memory>
#include <string>

#include <opencv2/videoio.hpp>

#include "frame_types.hpp"

namespace camingest {

// An opened pull stream. read() may block, but for no longer than the
// source's read timeout.
class FrameStream {
public:
    virtual ~FrameStream() = default;
    virtual StreamMetadata metadata() const = 0;
    // False on EOF or I/O error; the stream is unusable afterwards.
    virtual bool read(cv::Mat& frame) = 0;
};

class StreamSource {
public:
    virtual ~StreamSource() = default;
    // nullptr if the URL cannot be opened.
    virtual std::unique_ptr<FrameStream> open(const std::string& url) = 0;
};

class OpenCvStreamSource : public StreamSource {
public:
    OpenCvStreamSource(int open_timeout_ms, int read_timeout_ms);
    std::unique_ptr<FrameStream> open(const std::string& url) override;

private:
    int open_timeout_ms_;
    int read_timeout_ms_;
};

}  // namespace camingest
