#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "events.hpp"

namespace camingest {

// Non-blocking fan-out. publish() enqueues and returns; a dispatcher thread
// hands each event to every sink in publish order. When the queue is full the
// oldest queued event is discarded.
class EventPublisher : public EventSink {
public:
    explicit EventPublisher(size_t max_queue = 256);
    ~EventPublisher() override;

    EventPublisher(const EventPublisher&) = delete;
    EventPublisher& operator=(const EventPublisher&) = delete;

    // Sinks must be added before start().
    void add_sink(std::shared_ptr<EventSink> sink);

    void start();
    void stop();  // drains what is queued, then joins

    void publish(const std::string& channel, const Event& ev) override;

    // Blocks until everything published so far has reached the sinks.
    void flush();

    uint64_t dropped() const { return dropped_.load(); }
    uint64_t sink_failures() const { return sink_failures_.load(); }

private:
    struct Item {
        std::string channel;
        Event ev;
    };

    void run();
    void dispatch(const Item& item);

    size_t max_queue_;
    std::vector<std::shared_ptr<EventSink>> sinks_;
    std::deque<Item> queue_;
    std::mutex mu_;
    std::condition_variable cv_work_;
    std::condition_variable cv_idle_;
    bool running_{false};
    bool busy_{false};
    std::thread worker_;
    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> sink_failures_{0};
};

// Appends one JSON line per event.
class JsonlEventSink : public EventSink {
public:
    explicit JsonlEventSink(const std::string& path);
    void publish(const std::string& channel, const Event& ev) override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::mutex mu_;
    bool dir_ready_{false};
};

// Last N events in memory, numbered from 1. Backs the event listing and the
// server-sent event stream.
class RecentEventLog : public EventSink {
public:
    struct Entry {
        uint64_t seq{0};
        std::string json;
    };

    explicit RecentEventLog(size_t capacity = 500);
    void publish(const std::string& channel, const Event& ev) override;

    // Entries with seq > `after`, oldest first.
    std::vector<Entry> since(uint64_t after) const;

    // Like since(), but waits up to `timeout_ms` for at least one entry.
    std::vector<Entry> wait_since(uint64_t after, int timeout_ms) const;

    uint64_t last_seq() const;

    // Wakes every waiter; subsequent waits return immediately.
    void close();

private:
    std::vector<Entry> collect(uint64_t after) const;

    size_t capacity_;
    std::deque<Entry> entries_;
    uint64_t next_seq_{1};
    bool closed_{false};
    mutable std::mutex mu_;
    mutable std::condition_variable cv_;
};

}  // namespace camingest
