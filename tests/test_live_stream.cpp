#include <gtest/gtest.h>

#include <functional>

#include <opencv2/imgcodecs.hpp>

#include "live_stream.hpp"
#include "test_support.hpp"

using namespace camingest;
using namespace camingest::testing;

namespace {

std::shared_ptr<CameraWorker> push_worker(ManualClock& clock) {
    Camera cam;
    cam.id = "live";
    cam.source_type = SourceType::HTTP_PUSH;
    PipelineConfig cfg;
    cfg.detection_enabled = false;
    WorkerDeps deps;
    deps.clock = clock.fn();
    auto worker = std::make_shared<CameraWorker>(cam, cfg, deps);
    worker->start();
    return worker;
}

}  // namespace

TEST(LiveStream, EncodesDecodableJpeg) {
    EXPECT_FALSE(encode_jpeg(cv::Mat()));
    auto jpeg = encode_jpeg(frame_with_square(10, 10, 50));
    ASSERT_TRUE(jpeg);
    ASSERT_GE(jpeg->size(), 2u);
    EXPECT_EQ((*jpeg)[0], 0xFF);
    EXPECT_EQ((*jpeg)[1], 0xD8);
    cv::Mat back = cv::imdecode(*jpeg, cv::IMREAD_COLOR);
    EXPECT_EQ(back.cols, 320);
    EXPECT_EQ(back.rows, 240);
}

TEST(LiveStream, LatestJpegIsEmptyUntilFirstFrame) {
    ManualClock clock;
    auto worker = push_worker(clock);
    EXPECT_FALSE(latest_jpeg(*worker));
    worker->process_frame(blank_frame(), 1.0);
    EXPECT_TRUE(latest_jpeg(*worker));
}

TEST(LiveStream, MultipartChunkFraming) {
    const std::vector<unsigned char> payload{0xFF, 0xD8, 0x00, 0xFF, 0xD9};
    const std::string chunk = LiveFrameSequence::multipart_chunk(payload);
    const std::string head = "--frame\r\nContent-Type: image/jpeg\r\n\r\n";
    ASSERT_EQ(chunk.size(), head.size() + payload.size() + 2);
    EXPECT_EQ(chunk.substr(0, head.size()), head);
    EXPECT_EQ(static_cast<unsigned char>(chunk[head.size() + 2]), 0x00);
    EXPECT_EQ(chunk.substr(chunk.size() - 2), "\r\n");
}

TEST(LiveStream, YieldsOnlyNewerFrames) {
    ManualClock clock;
    auto worker = push_worker(clock);
    worker->process_frame(blank_frame(), 1.0);

    LiveFrameSequence seq(worker, 100);
    std::vector<unsigned char> jpeg;
    ASSERT_TRUE(seq.next(jpeg));
    EXPECT_FALSE(jpeg.empty());

    std::atomic<int> yielded{0};
    std::thread reader([&] {
        std::vector<unsigned char> out;
        while (seq.next(out)) yielded++;
    });

    // no new frame: the reader keeps polling without yielding
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    EXPECT_EQ(yielded.load(), 0);

    worker->process_frame(blank_frame(), 2.0);
    ASSERT_TRUE(wait_until([&] { return yielded.load() == 1; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    EXPECT_EQ(yielded.load(), 1);

    worker->stop();
    reader.join();
}

TEST(LiveStream, PeriodFollowsMaxFps) {
    ManualClock clock;
    auto worker = push_worker(clock);
    EXPECT_EQ(LiveFrameSequence(worker, 30).period_ms(), 33);
    EXPECT_EQ(LiveFrameSequence(worker, 0).period_ms(), 33);
    EXPECT_EQ(LiveFrameSequence(worker, 1000).period_ms(), 1);
    EXPECT_EQ(LiveFrameSequence(worker, 5000).period_ms(), 1);
}

TEST(LiveStream, PollWaitsAtMostOnePeriod) {
    ManualClock clock;
    auto worker = push_worker(clock);
    LiveFrameSequence seq(worker, 20);
    std::vector<unsigned char> jpeg;

    auto t0 = std::chrono::steady_clock::now();
    EXPECT_EQ(seq.poll(jpeg), LivePoll::PENDING);
    EXPECT_LT(std::chrono::steady_clock::now() - t0, std::chrono::milliseconds(500));

    worker->process_frame(blank_frame(), 1.0);
    EXPECT_EQ(seq.poll(jpeg), LivePoll::FRAME);
    worker->stop();
    EXPECT_EQ(seq.poll(jpeg), LivePoll::ENDED);
}

// Drives the sequence the way the chunked HTTP provider does, one step per call.
class ChunkPump {
public:
    ChunkPump(LiveFrameSequence& seq, std::function<bool()> open, std::function<bool(const std::string&)> write)
        : thread_([this, &seq, open, write] {
              while (write_live_chunk(seq, open, write)) steps++;
              finished = true;
          }) {}
    ~ChunkPump() {
        if (thread_.joinable()) thread_.join();
    }

    std::atomic<int> steps{0};
    std::atomic<bool> finished{false};

private:
    std::thread thread_;
};

TEST(LiveStream, IdleStreamEndsWhenServerGoesAway) {
    ManualClock clock;
    auto worker = push_worker(clock);
    LiveFrameSequence seq(worker, 30);
    std::atomic<bool> serving{true};
    std::atomic<int> writes{0};

    ChunkPump pump(seq, [&] { return serving.load(); }, [&](const std::string&) {
        writes++;
        return true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_FALSE(pump.finished.load());
    EXPECT_GT(pump.steps.load(), 0);

    serving = false;
    EXPECT_TRUE(wait_until([&] { return pump.finished.load(); }, 1000));
    EXPECT_EQ(writes.load(), 0);
    EXPECT_TRUE(worker->running());
}

TEST(LiveStream, IdleStreamEndsWhenWorkerStops) {
    ManualClock clock;
    auto worker = push_worker(clock);
    LiveFrameSequence seq(worker, 30);

    ChunkPump pump(seq, [] { return true; }, [](const std::string&) { return true; });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    worker->stop();
    EXPECT_TRUE(wait_until([&] { return pump.finished.load(); }, 1000));
}

TEST(LiveStream, StreamEndsWhenConsumerStopsReading) {
    ManualClock clock;
    auto worker = push_worker(clock);
    LiveFrameSequence seq(worker, 100);
    std::atomic<bool> connected{true};
    std::atomic<int> writes{0};

    ChunkPump pump(seq, [&] { return connected.load(); }, [&](const std::string& chunk) {
        EXPECT_EQ(chunk.rfind("--frame\r\n", 0), 0u);
        writes++;
        return true;
    });
    worker->process_frame(blank_frame(), 1.0);
    ASSERT_TRUE(wait_until([&] { return writes.load() == 1; }));

    // a disconnected consumer is seen between frames, without any new frame arriving
    connected = false;
    EXPECT_TRUE(wait_until([&] { return pump.finished.load(); }, 1000));
    EXPECT_EQ(writes.load(), 1);
}

TEST(LiveStream, FailedWriteEndsStream) {
    ManualClock clock;
    auto worker = push_worker(clock);
    worker->process_frame(blank_frame(), 1.0);
    LiveFrameSequence seq(worker, 100);

    int writes = 0;
    EXPECT_FALSE(write_live_chunk(seq, [] { return true; }, [&](const std::string&) {
        writes++;
        return false;
    }));
    EXPECT_EQ(writes, 1);
}

TEST(LiveStream, EndsWhenCancelled) {
    ManualClock clock;
    auto worker = push_worker(clock);
    LiveFrameSequence seq(worker, 50);

    std::thread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        seq.cancel();
    });
    std::vector<unsigned char> jpeg;
    EXPECT_FALSE(seq.next(jpeg));
    canceller.join();
    worker->stop();
}

TEST(LiveStream, EndsForStoppedWorker) {
    ManualClock clock;
    auto worker = push_worker(clock);
    worker->process_frame(blank_frame(), 1.0);
    worker->stop();

    LiveFrameSequence seq(worker, 30);
    std::vector<unsigned char> jpeg;
    EXPECT_FALSE(seq.next(jpeg));
}
