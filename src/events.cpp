#include "events.hpp"
#include <sstream>
#include <cstdio>

namespace events {

namespace {

std::string format_size(uint64_t bytes) {
    double size = static_cast<double>(bytes);
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int i = 0;
    while (size >= 1024 && i < 4) {
        size /= 1024;
        i++;
    }
    char buf[32];
    snprintf(buf, sizeof(buf), "%.1f%s", size, units[i]);
    return std::string(buf);
}

struct Describer {
    std::string operator()(const DeviceFound& e) const {
        std::ostringstream oss;
        oss << "Found device: " << e.device.name << " (" << e.device.address << ":"
            << e.device.http_port << ") id " << e.device.id;
        return oss.str();
    }
    std::string operator()(const FileReceived& e) const {
        return "Received: " + e.file.name + " (" + format_size(e.file.size) + ") -> " + e.file.path;
    }
    std::string operator()(const FileSent& e) const {
        return "Sent: " + e.name + " (" + format_size(e.size) + ") to " + e.device_name;
    }
    std::string operator()(const SendFailed& e) const {
        return "Failed to send: " + e.name + " to " + e.device_name;
    }
};

} // namespace

std::string describe(const Event& event) {
    return std::visit(Describer{}, event);
}

void EventQueue::push(Event event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        queue_.push_back(std::move(event));
    }
    ready_.notify_one();
}

std::optional<Event> EventQueue::try_pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) return std::nullopt;
    Event event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

std::optional<Event> EventQueue::wait_pop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    ready_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
    if (queue_.empty()) return std::nullopt;
    Event event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

void EventQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    ready_.notify_all();
}

void EventQueue::reopen() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = false;
}

bool EventQueue::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t EventQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

} // namespace events
