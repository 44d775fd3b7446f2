#include <gtest/gtest.h>

#include <cstdlib>
#include <string>
#include <vector>

#include "config.hpp"
#include "errors.hpp"

using namespace camingest;

namespace {

class Args {
public:
    Args(std::initializer_list<std::string> args) : storage_(args) {
        storage_.insert(storage_.begin(), "camingest_server");
        for (auto& s : storage_) ptrs_.push_back(&s[0]);
    }
    int argc() const { return static_cast<int>(ptrs_.size()); }
    char** argv() { return ptrs_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> ptrs_;
};

AppConfig parse(std::initializer_list<std::string> list) {
    Args args(list);
    return parse_args(args.argc(), args.argv());
}

}  // namespace

TEST(Config, Defaults) {
    AppConfig cfg = parse({});
    EXPECT_EQ(cfg.port, 8000);
    EXPECT_EQ(cfg.pipeline.buffer_capacity, 10u);
    EXPECT_EQ(cfg.pipeline.frame_skip, 5);
    EXPECT_DOUBLE_EQ(cfg.pipeline.event_interval_sec, 1.0);
    EXPECT_DOUBLE_EQ(cfg.pipeline.inference_cooldown_sec, 3.0);
    EXPECT_DOUBLE_EQ(cfg.pipeline.person_cooldown_sec, 10.0);
    EXPECT_DOUBLE_EQ(cfg.pipeline.motion.min_area, 1500.0);
    EXPECT_DOUBLE_EQ(cfg.pipeline.reconnect_initial_sec, 1.0);
    EXPECT_DOUBLE_EQ(cfg.pipeline.reconnect_max_sec, 60.0);
    EXPECT_FLOAT_EQ(cfg.detector.conf_threshold, 0.65f);
}

TEST(Config, FlagsOverrideDefaults) {
    AppConfig cfg = parse({"--port", "9090", "--buffer", "32", "--no-detect", "--frame-skip", "2",
                           "--motion-area", "800", "--events", "/tmp/ev.jsonl", "--backoff", "0.5",
                           "--backoff-max", "8", "--snapshots", ""});
    EXPECT_EQ(cfg.port, 9090);
    EXPECT_EQ(cfg.pipeline.buffer_capacity, 32u);
    EXPECT_FALSE(cfg.pipeline.detection_enabled);
    EXPECT_EQ(cfg.pipeline.frame_skip, 2);
    EXPECT_DOUBLE_EQ(cfg.pipeline.motion.min_area, 800.0);
    EXPECT_EQ(cfg.events_jsonl, "/tmp/ev.jsonl");
    EXPECT_DOUBLE_EQ(cfg.pipeline.reconnect_initial_sec, 0.5);
    EXPECT_DOUBLE_EQ(cfg.pipeline.reconnect_max_sec, 8.0);
    EXPECT_TRUE(cfg.pipeline.snapshot_dir.empty());
}

TEST(Config, RejectsBadValues) {
    EXPECT_THROW(parse({"--port", "abc"}), ValidationError);
    EXPECT_THROW(parse({"--port", "70000"}), ValidationError);
    EXPECT_THROW(parse({"--buffer", "0"}), ValidationError);
    EXPECT_THROW(parse({"--frame-skip", "0"}), ValidationError);
    EXPECT_THROW(parse({"--backoff", "10", "--backoff-max", "5"}), ValidationError);
    EXPECT_THROW(parse({"--what", "1"}), ValidationError);
    EXPECT_THROW(parse({"--port"}), ValidationError);
}

TEST(Config, EnvironmentIsReadBeforeFlags) {
    ::setenv("BUFFER_CAPACITY", "20", 1);
    ::setenv("PERSON_COOLDOWN_SECONDS", "30", 1);
    ::setenv("ENABLE_PERSON_DETECTION", "false", 1);

    AppConfig env_only = parse({});
    EXPECT_EQ(env_only.pipeline.buffer_capacity, 20u);
    EXPECT_DOUBLE_EQ(env_only.pipeline.person_cooldown_sec, 30.0);
    EXPECT_FALSE(env_only.pipeline.detection_enabled);

    AppConfig flagged = parse({"--buffer", "5", "--detect"});
    EXPECT_EQ(flagged.pipeline.buffer_capacity, 5u);
    EXPECT_TRUE(flagged.pipeline.detection_enabled);

    ::unsetenv("BUFFER_CAPACITY");
    ::unsetenv("PERSON_COOLDOWN_SECONDS");
    ::unsetenv("ENABLE_PERSON_DETECTION");
}

TEST(Config, InvalidEnvironmentValueIsReported) {
    ::setenv("FRAME_SKIP", "often", 1);
    EXPECT_THROW(parse({}), ValidationError);
    ::unsetenv("FRAME_SKIP");
}
