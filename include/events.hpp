#pragma once

#include <string>
#include <deque>
#include <variant>
#include <optional>
#include <chrono>
#include <mutex>
#include <condition_variable>
#include "networking.hpp"
#include "protocol/file_meta.hpp"

namespace events {

struct DeviceFound {
    networking::Device device;
};

struct FileReceived {
    protocol::ReceivedFile file;
};

struct FileSent {
    std::string name;
    uint64_t size;
    std::string device_name;
};

struct SendFailed {
    std::string name;
    std::string device_name;
};

using Event = std::variant<DeviceFound, FileReceived, FileSent, SendFailed>;

// One-line console rendering, used by the CLI
std::string describe(const Event& event);

/**
 * FIFO handing events from background tasks to a single consumer.
 * After close(), pushes are dropped and pops drain what is left, then
 * return std::nullopt. reopen() accepts pushes again.
 */
class EventQueue {
public:
    void push(Event event);

    std::optional<Event> try_pop();
    std::optional<Event> wait_pop(std::chrono::milliseconds timeout);

    void close();
    void reopen();
    bool closed() const;
    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<Event> queue_;
    bool closed_ = false;
};

} // namespace events
