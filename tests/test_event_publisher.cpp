#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "event_publisher.hpp"
#include "test_support.hpp"

using namespace camingest;
using namespace camingest::testing;

namespace {

Event make_event(EventKind kind, const std::string& camera_id, double ts) {
    Event ev;
    ev.kind = kind;
    ev.camera_id = camera_id;
    ev.timestamp = ts;
    return ev;
}

}  // namespace

TEST(EventJson, CarriesKindSpecificFields) {
    Event connected = make_event(EventKind::CAMERA_CONNECTED, "cam_1", 12.5);
    connected.stream = StreamMetadata{1280, 720, 25.0};
    EXPECT_EQ(event_to_json("camera:cam_1", connected),
              "{\"channel\":\"camera:cam_1\",\"event_type\":\"camera.connected\",\"data\":{"
              "\"camera_id\":\"cam_1\",\"timestamp\":12.500,\"width\":1280,\"height\":720,\"fps\":25.00}}");

    Event lost = make_event(EventKind::CAMERA_DISCONNECTED, "cam_1", 13.0);
    lost.reason = "Failed to open stream: \"rtsp://x\"";
    EXPECT_NE(event_to_json("camera:cam_1", lost).find("\"reason\":\"Failed to open stream: \\\"rtsp://x\\\"\""),
              std::string::npos);

    Event ingested = make_event(EventKind::FRAME_INGESTED, "cam_1", 14.0);
    ingested.source = SourceType::HTTP_PUSH;
    EXPECT_NE(event_to_json("camera:cam_1", ingested).find("\"source\":\"http_push\""), std::string::npos);

    Event person = make_event(EventKind::PERSON_DETECTED, "cam_1", 15.0);
    person.person_count = 3;
    std::string json = event_to_json("camera:cam_1", person);
    EXPECT_NE(json.find("\"person_count\":3"), std::string::npos);
    EXPECT_NE(json.find("\"frame_path\":null"), std::string::npos);
}

TEST(EventPublisher, DeliversToEverySinkInOrder) {
    auto a = std::make_shared<RecordingSink>();
    auto b = std::make_shared<RecordingSink>();
    EventPublisher publisher;
    publisher.add_sink(a);
    publisher.add_sink(b);
    publisher.start();

    for (int i = 0; i < 50; ++i) {
        publisher.publish(channel_for("cam"), make_event(EventKind::FRAME_INGESTED, "cam", i));
    }
    publisher.flush();

    for (const auto& sink : {a, b}) {
        auto records = sink->records();
        ASSERT_EQ(records.size(), 50u);
        for (int i = 0; i < 50; ++i) {
            EXPECT_DOUBLE_EQ(records[i].ev.timestamp, i);
            EXPECT_EQ(records[i].channel, "camera:cam");
        }
    }
    EXPECT_EQ(publisher.dropped(), 0u);
    publisher.stop();
}

TEST(EventPublisher, FailingSinkDoesNotAffectOthers) {
    auto failing = std::make_shared<ThrowingSink>();
    auto good = std::make_shared<RecordingSink>();
    EventPublisher publisher;
    publisher.add_sink(failing);
    publisher.add_sink(good);
    publisher.start();

    publisher.publish("camera:a", make_event(EventKind::MOTION_DETECTED, "a", 1.0));
    publisher.publish("camera:a", make_event(EventKind::MOTION_DETECTED, "a", 2.0));
    publisher.flush();

    EXPECT_EQ(good->size(), 2u);
    EXPECT_EQ(failing->calls.load(), 2);
    EXPECT_EQ(publisher.sink_failures(), 2u);
}

TEST(EventPublisher, FullQueueDropsOldest) {
    auto sink = std::make_shared<RecordingSink>();
    EventPublisher publisher(4);
    publisher.add_sink(sink);

    // not started yet, so everything stays queued
    for (int i = 0; i < 10; ++i) {
        publisher.publish("camera:a", make_event(EventKind::FRAME_INGESTED, "a", i));
    }
    EXPECT_EQ(publisher.dropped(), 6u);

    publisher.start();
    publisher.flush();
    auto records = sink->records();
    ASSERT_EQ(records.size(), 4u);
    EXPECT_DOUBLE_EQ(records.front().ev.timestamp, 6.0);
    EXPECT_DOUBLE_EQ(records.back().ev.timestamp, 9.0);
}

TEST(EventPublisher, StopDrainsQueue) {
    auto sink = std::make_shared<RecordingSink>();
    EventPublisher publisher;
    publisher.add_sink(sink);
    publisher.start();
    for (int i = 0; i < 20; ++i) {
        publisher.publish("camera:a", make_event(EventKind::FRAME_INGESTED, "a", i));
    }
    publisher.stop();
    EXPECT_EQ(sink->size(), 20u);
    publisher.stop();
}

TEST(JsonlEventSink, AppendsOneLinePerEvent) {
    const auto dir = std::filesystem::temp_directory_path() / "camingest_jsonl_test";
    std::filesystem::remove_all(dir);
    const auto path = dir / "nested" / "events.jsonl";

    JsonlEventSink sink(path.string());
    sink.publish("camera:a", make_event(EventKind::MOTION_DETECTED, "a", 1.0));
    sink.publish("camera:b", make_event(EventKind::MOTION_DETECTED, "b", 2.0));

    std::ifstream in(path);
    std::vector<std::string> lines;
    for (std::string line; std::getline(in, line);) lines.push_back(line);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].rfind("{\"channel\":\"camera:a\"", 0), 0u);
    EXPECT_NE(lines[1].find("\"camera_id\":\"b\""), std::string::npos);

    std::filesystem::remove_all(dir);
}

TEST(RecentEventLog, KeepsLastEntriesWithSequenceNumbers) {
    RecentEventLog log(3);
    EXPECT_EQ(log.last_seq(), 0u);
    for (int i = 0; i < 5; ++i) {
        log.publish("camera:a", make_event(EventKind::FRAME_INGESTED, "a", i));
    }
    EXPECT_EQ(log.last_seq(), 5u);

    auto all = log.since(0);
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].seq, 3u);
    EXPECT_EQ(all[2].seq, 5u);

    auto tail = log.since(4);
    ASSERT_EQ(tail.size(), 1u);
    EXPECT_EQ(tail[0].seq, 5u);
    EXPECT_TRUE(log.since(5).empty());
}

TEST(RecentEventLog, WaitSinceWakesOnPublish) {
    RecentEventLog log;
    std::thread producer([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        log.publish("camera:a", make_event(EventKind::MOTION_DETECTED, "a", 1.0));
    });
    auto entries = log.wait_since(0, 3000);
    producer.join();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_NE(entries[0].json.find("motion.detected"), std::string::npos);

    EXPECT_TRUE(log.wait_since(1, 10).empty());

    log.close();
    auto t0 = std::chrono::steady_clock::now();
    EXPECT_TRUE(log.wait_since(1, 5000).empty());
    EXPECT_LT(std::chrono::steady_clock::now() - t0, std::chrono::seconds(1));
}
