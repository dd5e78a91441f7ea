#pragma once

#include <string>
#include <vector>
#include <list>
#include <memory>
#include <functional>
#include <filesystem>
#include <optional>
#include <chrono>
#include <thread>
#include <atomic>
#include <mutex>
#include <boost/asio.hpp>
#include "networking.hpp"
#include "protocol/file_meta.hpp"

namespace transfer {

constexpr std::size_t CHUNK_SIZE = 64 * 1024; // 64KB per read
constexpr unsigned short DEFAULT_HTTP_PORT = 8080;

// Resolved on every upload so the directory can change while running
using SaveDirProvider = std::function<std::filesystem::path()>;
using FileReceivedCallback = std::function<void(const protocol::ReceivedFile&)>;

// Strips directory components and control characters from a client-supplied
// filename. Falls back to "file_<unix millis>" when nothing usable is left.
std::string sanitize_filename(const std::string& raw);

// Picks dir/name, or dir/<stem>_<suffix><ext> when that already exists, and
// creates the empty file so no concurrent upload can claim the same path.
std::filesystem::path reserve_destination(const std::filesystem::path& dir, const std::string& name);

// Received uploads, in arrival order
class FileCatalogue {
public:
    void add(const protocol::ReceivedFile& file);
    std::optional<protocol::ReceivedFile> find(const std::string& id) const;
    std::vector<protocol::ReceivedFile> list() const;
    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<protocol::ReceivedFile> files_;
};

struct ReceiverOptions {
    unsigned short port = DEFAULT_HTTP_PORT;   // 0 picks a free port
    std::string bind_address = "0.0.0.0";
};

// Served on GET /api/info
struct ServerInfo {
    std::string device_id;
    std::string device_name;
};

/**
 * HTTP server accepting POST /upload (multipart/form-data, one file part).
 * The accept loop runs on its own thread; every connection is served on a
 * session thread and handles exactly one request.
 */
class FileReceiver {
public:
    FileReceiver(ReceiverOptions options, SaveDirProvider save_dir,
                 FileReceivedCallback on_received, ServerInfo info = {});
    ~FileReceiver();

    FileReceiver(const FileReceiver&) = delete;
    FileReceiver& operator=(const FileReceiver&) = delete;

    // Throws boost::system::system_error if the port cannot be bound
    void start();

    // In-flight uploads are aborted, not drained
    void stop();

    bool is_running() const { return running_; }

    // Actual listening port, valid after start()
    unsigned short port() const { return bound_port_; }

private:
    struct Session {
        boost::asio::ip::tcp::socket socket;
        std::thread thread;
        std::atomic<bool> done{false};

        explicit Session(boost::asio::ip::tcp::socket s) : socket(std::move(s)) {}
    };

    void do_accept();
    void spawn_session(boost::asio::ip::tcp::socket socket);
    void reap_sessions();
    void handle_session(boost::asio::ip::tcp::socket& socket);

    ReceiverOptions options_;
    SaveDirProvider save_dir_;
    FileReceivedCallback on_received_;
    ServerInfo info_;

    boost::asio::io_context io_context_;
    std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
    std::thread accept_thread_;
    std::atomic<bool> running_{false};
    std::atomic<unsigned short> bound_port_{0};
    std::mutex lifecycle_mutex_;

    std::mutex sessions_mutex_;
    std::list<std::shared_ptr<Session>> sessions_;
};

struct SendOptions {
    std::chrono::milliseconds timeout{90000};
    std::string target = "/upload";
};

class FileSender {
public:
    // Pushes one file to the device's receiver. True only on a 2xx answer;
    // every failure (unreadable file, refused, timeout, error status) is false.
    static bool send(const networking::Device& device, const std::string& filepath,
                     const SendOptions& options = {});
};

} // namespace transfer
