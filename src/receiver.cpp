#include "transfer.hpp"
#include "security.hpp"
#include "protocol/multipart.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <limits>
#include <vector>
#include <cstdint>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

namespace beast = boost::beast;
namespace http = beast::http;
using boost::asio::ip::tcp;

namespace transfer {

namespace {

http::response<http::string_body> json_response(http::status status, const nlohmann::json& body,
                                                unsigned version) {
    http::response<http::string_body> res{status, version};
    res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
    res.set(http::field::content_type, "application/json");
    res.keep_alive(false);
    res.body() = body.dump();
    res.prepare_payload();
    return res;
}

// Most of a rejected request body that is read before answering
constexpr std::uint64_t DISCARD_LIMIT = 8 * 1024 * 1024;

// Reads and drops the rest of the request body, so that closing the socket
// does not reset the connection before the client has read the response.
// Larger bodies are cut off at `limit` and may still see a reset.
void discard_body(tcp::socket& socket, beast::flat_buffer& buffer,
                  http::request_parser<http::buffer_body>& parser, std::uint64_t limit) {
    std::vector<char> scratch(CHUNK_SIZE);
    std::uint64_t discarded = 0;
    while (!parser.is_done() && discarded < limit) {
        parser.get().body().data = scratch.data();
        parser.get().body().size = scratch.size();
        beast::error_code ec;
        http::read(socket, buffer, parser, ec);
        if (ec == http::error::need_buffer) ec = {};
        if (ec) return;
        discarded += scratch.size() - parser.get().body().size;
    }
}

std::string iso_timestamp() {
    std::time_t now = std::time(nullptr);
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &now);
#else
    localtime_r(&now, &local);
#endif
    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%dT%H:%M:%S");
    return oss.str();
}

} // namespace

FileReceiver::FileReceiver(ReceiverOptions options, SaveDirProvider save_dir,
                           FileReceivedCallback on_received, ServerInfo info)
    : options_(std::move(options)),
      save_dir_(std::move(save_dir)),
      on_received_(std::move(on_received)),
      info_(std::move(info)) {}

FileReceiver::~FileReceiver() {
    stop();
}

void FileReceiver::start() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (running_) return;

    io_context_.restart();
    auto acceptor = std::make_unique<tcp::acceptor>(io_context_);
    tcp::endpoint endpoint(boost::asio::ip::make_address(options_.bind_address), options_.port);
    acceptor->open(endpoint.protocol());
    acceptor->set_option(boost::asio::socket_base::reuse_address(true));
    acceptor->bind(endpoint);
    acceptor->listen(boost::asio::socket_base::max_listen_connections);

    acceptor_ = std::move(acceptor);
    bound_port_ = acceptor_->local_endpoint().port();
    running_ = true;

    do_accept();
    accept_thread_ = std::thread([this]() {
        try {
            io_context_.run();
        } catch (std::exception& e) {
            std::cerr << "FileReceiver accept loop exception: " << e.what() << "\n";
        }
    });

    std::cout << "FileReceiver listening on port " << bound_port_ << "\n";
}

void FileReceiver::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (!running_) return;
    running_ = false;

    io_context_.stop();
    if (accept_thread_.joinable()) accept_thread_.join();

    boost::system::error_code ec;
    acceptor_->close(ec);

    std::list<std::shared_ptr<Session>> sessions;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions.swap(sessions_);
        // Best-effort: unblock sessions still reading a request
        for (auto& session : sessions) {
            session->socket.shutdown(tcp::socket::shutdown_both, ec);
        }
    }
    for (auto& session : sessions) {
        if (session->thread.joinable()) session->thread.join();
    }
}

void FileReceiver::do_accept() {
    acceptor_->async_accept([this](const boost::system::error_code& ec, tcp::socket socket) {
        if (!running_ || ec == boost::asio::error::operation_aborted) return;

        if (ec) {
            std::cerr << "FileReceiver accept error: " << ec.message() << "\n";
        } else {
            spawn_session(std::move(socket));
        }
        do_accept();
    });
}

void FileReceiver::spawn_session(tcp::socket socket) {
    reap_sessions();

    auto session = std::make_shared<Session>(std::move(socket));
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_.push_back(session);
    session->thread = std::thread([this, raw = session.get()]() {
        handle_session(raw->socket);
        raw->done = true;
    });
}

// Joins session threads that have already finished
void FileReceiver::reap_sessions() {
    std::list<std::shared_ptr<Session>> finished;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            if ((*it)->done) {
                finished.push_back(*it);
                it = sessions_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& session : finished) {
        if (session->thread.joinable()) session->thread.join();
    }
}

void FileReceiver::handle_session(tcp::socket& socket) {
    try {
        beast::flat_buffer buffer;
        http::request_parser<http::buffer_body> parser;
        parser.body_limit((std::numeric_limits<std::uint64_t>::max)());
        http::read_header(socket, buffer, parser);

        auto& req = parser.get();
        std::string target(req.target());
        target = target.substr(0, target.find('?'));
        unsigned version = req.version();

        http::response<http::string_body> res;

        if (target == "/upload" || target == "/api/upload") {
            if (req.method() != http::verb::post) {
                res = json_response(http::status::method_not_allowed,
                                    {{"success", false}, {"error", "Method not allowed"}}, version);
            } else {
                if (beast::iequals(req[http::field::expect], "100-continue")) {
                    http::response<http::empty_body> cont{http::status::continue_, version};
                    http::write(socket, cont);
                }

                auto boundary = protocol::boundary_from_content_type(
                    std::string(req[http::field::content_type]));
                if (!boundary) {
                    res = json_response(http::status::bad_request,
                                        {{"success", false}, {"error", "No file"}}, version);
                } else {
                    std::filesystem::path dest_path;
                    std::ofstream out;
                    uint64_t written = 0;
                    std::string display_name;

                    protocol::MultipartFileReader reader(*boundary,
                        [&](const std::string& raw_name) {
                            display_name = sanitize_filename(raw_name);
                            std::filesystem::path dir = save_dir_();
                            std::filesystem::create_directories(dir);
                            dest_path = reserve_destination(dir, display_name);
                            out.open(dest_path, std::ios::binary | std::ios::trunc);
                            if (!out.is_open()) {
                                throw std::runtime_error("Could not open file for writing: " + dest_path.string());
                            }
                        },
                        [&](const char* data, std::size_t size) {
                            out.write(data, static_cast<std::streamsize>(size));
                            if (!out) throw std::runtime_error("Write failed: " + dest_path.string());
                            written += size;
                        },
                        [&]() {
                            out.close();
                            if (out.fail()) throw std::runtime_error("Could not finish writing: " + dest_path.string());
                        });

                    try {
                        // Stream the body through the multipart reader in bounded chunks
                        std::vector<char> chunk(CHUNK_SIZE);
                        while (!parser.is_done()) {
                            parser.get().body().data = chunk.data();
                            parser.get().body().size = chunk.size();
                            beast::error_code ec;
                            http::read(socket, buffer, parser, ec);
                            if (ec == http::error::need_buffer) ec = {};
                            if (ec) throw beast::system_error(ec);

                            std::size_t used = chunk.size() - parser.get().body().size;
                            if (used > 0) reader.feed(chunk.data(), used);
                        }
                        reader.finish();

                        if (!reader.found_file()) {
                            res = json_response(http::status::bad_request,
                                                {{"success", false}, {"error", "No file"}}, version);
                        } else {
                            protocol::ReceivedFile record{
                                security::generate_file_id(),
                                display_name,
                                written,
                                dest_path.string(),
                                iso_timestamp()
                            };
                            std::cout << "Received " << record.name << " (" << record.size
                                      << " bytes) -> " << record.path << "\n";
                            if (on_received_) on_received_(record);

                            res = json_response(http::status::ok,
                                                {{"success", true}, {"fileId", record.id}}, version);
                        }
                    } catch (std::exception& e) {
                        std::cerr << "FileReceiver upload failed: " << e.what() << "\n";
                        if (out.is_open()) out.close();
                        if (!dest_path.empty()) {
                            std::error_code remove_ec;
                            std::filesystem::remove(dest_path, remove_ec);
                        }
                        res = json_response(http::status::internal_server_error,
                                            {{"success", false}, {"error", e.what()}}, version);
                    }
                }
            }
        } else if (target == "/api/info") {
            if (req.method() != http::verb::get) {
                res = json_response(http::status::method_not_allowed,
                                    {{"success", false}, {"error", "Method not allowed"}}, version);
            } else {
                res = json_response(http::status::ok, {
                    {"deviceId", info_.device_id},
                    {"deviceName", info_.device_name},
                    {"ip", networking::get_local_ip()},
                    {"httpPort", static_cast<unsigned short>(bound_port_)}
                }, version);
            }
        } else {
            res = json_response(http::status::not_found,
                                {{"success", false}, {"error", "Not found"}}, version);
        }

        if (!parser.is_done()) {
            discard_body(socket, buffer, parser, DISCARD_LIMIT);
        }
        http::write(socket, res);

        beast::error_code ec;
        socket.shutdown(tcp::socket::shutdown_send, ec);
    } catch (beast::system_error& e) {
        // Peer went away or sent garbage: nothing to answer
        if (e.code() != http::error::end_of_stream && e.code() != boost::asio::error::eof) {
            std::cerr << "FileReceiver session error: " << e.code().message() << "\n";
        }
    } catch (std::exception& e) {
        std::cerr << "FileReceiver session exception: " << e.what() << "\n";
    }
}

} // namespace transfer
