#include "event_publisher.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <utility>

#include "log.hpp"

namespace camingest {

EventPublisher::EventPublisher(size_t max_queue) : max_queue_(max_queue == 0 ? 1 : max_queue) {}

EventPublisher::~EventPublisher() {
    stop();
}

void EventPublisher::add_sink(std::shared_ptr<EventSink> sink) {
    std::lock_guard<std::mutex> lock(mu_);
    if (sink) sinks_.push_back(std::move(sink));
}

void EventPublisher::start() {
    std::lock_guard<std::mutex> lock(mu_);
    if (running_) return;
    running_ = true;
    worker_ = std::thread(&EventPublisher::run, this);
}

void EventPublisher::stop() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (!running_) return;
        running_ = false;
    }
    cv_work_.notify_all();
    if (worker_.joinable()) worker_.join();
    cv_idle_.notify_all();
}

void EventPublisher::publish(const std::string& channel, const Event& ev) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (queue_.size() >= max_queue_) {
            queue_.pop_front();
            dropped_++;
        }
        queue_.push_back(Item{channel, ev});
    }
    cv_work_.notify_one();
}

void EventPublisher::flush() {
    std::unique_lock<std::mutex> lock(mu_);
    cv_idle_.wait(lock, [&] { return (queue_.empty() && !busy_) || !running_; });
}

void EventPublisher::run() {
    std::unique_lock<std::mutex> lock(mu_);
    for (;;) {
        cv_work_.wait(lock, [&] { return !queue_.empty() || !running_; });
        if (queue_.empty()) {
            if (!running_) break;
            continue;
        }
        Item item = std::move(queue_.front());
        queue_.pop_front();
        busy_ = true;
        lock.unlock();

        dispatch(item);

        lock.lock();
        busy_ = false;
        if (queue_.empty()) cv_idle_.notify_all();
    }
}

void EventPublisher::dispatch(const Item& item) {
    for (const auto& sink : sinks_) {
        try {
            sink->publish(item.channel, item.ev);
        } catch (const std::exception& e) {
            sink_failures_++;
            log_warn("events", std::string("sink failed for ") + event_kind_to_string(item.ev.kind) +
                                   " on " + item.channel + ": " + e.what());
        }
    }
}

JsonlEventSink::JsonlEventSink(const std::string& path) : path_(path) {}

void JsonlEventSink::publish(const std::string& channel, const Event& ev) {
    const std::string line = event_to_json(channel, ev);

    std::lock_guard<std::mutex> lock(mu_);
    if (!dir_ready_) {
        auto parent = std::filesystem::path(path_).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }
        dir_ready_ = true;
    }
    std::ofstream f(path_, std::ios::app);
    if (!f) {
        throw std::runtime_error("unable to open events file: " + path_);
    }
    f << line << '\n';
}

RecentEventLog::RecentEventLog(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

void RecentEventLog::publish(const std::string& channel, const Event& ev) {
    std::string json = event_to_json(channel, ev);
    {
        std::lock_guard<std::mutex> lock(mu_);
        entries_.push_back(Entry{next_seq_++, std::move(json)});
        if (entries_.size() > capacity_) entries_.pop_front();
    }
    cv_.notify_all();
}

std::vector<RecentEventLog::Entry> RecentEventLog::collect(uint64_t after) const {
    std::vector<Entry> out;
    for (const auto& e : entries_) {
        if (e.seq > after) out.push_back(e);
    }
    return out;
}

std::vector<RecentEventLog::Entry> RecentEventLog::since(uint64_t after) const {
    std::lock_guard<std::mutex> lock(mu_);
    return collect(after);
}

std::vector<RecentEventLog::Entry> RecentEventLog::wait_since(uint64_t after, int timeout_ms) const {
    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                 [&] { return closed_ || next_seq_ - 1 > after; });
    return collect(after);
}

uint64_t RecentEventLog::last_seq() const {
    std::lock_guard<std::mutex> lock(mu_);
    return next_seq_ - 1;
}

void RecentEventLog::close() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        closed_ = true;
    }
    cv_.notify_all();
}

}  // namespace camingest
