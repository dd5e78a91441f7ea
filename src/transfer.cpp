#include "transfer.hpp"
#include "security.hpp"
#include "protocol/multipart.hpp"
#include "protocol/mime.hpp"
#include <iostream>
#include <fstream>
#include <iterator>
#include <algorithm>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

namespace beast = boost::beast;
namespace http = beast::http;
using boost::asio::ip::tcp;

namespace transfer {

std::string sanitize_filename(const std::string& raw) {
    std::string name = raw;
    name.erase(std::remove_if(name.begin(), name.end(), [](char ch) {
        auto c = static_cast<unsigned char>(ch);
        return c < 0x20 || c == 0x7F;
    }), name.end());

    // Both separators: uploads from Windows clients may carry a full path
    std::size_t pos = name.find_last_of("/\\");
    if (pos != std::string::npos) {
        name = name.substr(pos + 1);
    }

    std::size_t begin = name.find_first_not_of(' ');
    std::size_t end = name.find_last_not_of(' ');
    name = (begin == std::string::npos) ? "" : name.substr(begin, end - begin + 1);

    if (name.empty() || name == "." || name == "..") {
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        name = "file_" + std::to_string(millis);
    }
    return name;
}

std::filesystem::path reserve_destination(const std::filesystem::path& dir, const std::string& name) {
    // Shared by every receiver in the process: check-then-create must be atomic
    static std::mutex reserve_mutex;
    std::lock_guard<std::mutex> lock(reserve_mutex);

    std::filesystem::path candidate = dir / name;
    const std::filesystem::path original(name);
    const std::string stem = original.stem().string();
    const std::string extension = original.extension().string();

    while (std::filesystem::exists(candidate)) {
        candidate = dir / (stem + "_" + security::generate_suffix() + extension);
    }

    std::ofstream placeholder(candidate, std::ios::binary);
    if (!placeholder.is_open()) {
        throw std::runtime_error("Could not create file: " + candidate.string());
    }
    return candidate;
}

// ─── FileCatalogue ──────────────────────────────────────────────────────────

void FileCatalogue::add(const protocol::ReceivedFile& file) {
    std::lock_guard<std::mutex> lock(mutex_);
    files_.push_back(file);
}

std::optional<protocol::ReceivedFile> FileCatalogue::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(files_.begin(), files_.end(),
                           [&id](const protocol::ReceivedFile& f) { return f.id == id; });
    if (it == files_.end()) return std::nullopt;
    return *it;
}

std::vector<protocol::ReceivedFile> FileCatalogue::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return files_;
}

std::size_t FileCatalogue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return files_.size();
}

// ─── FileSender ─────────────────────────────────────────────────────────────

bool FileSender::send(const networking::Device& device, const std::string& filepath,
                      const SendOptions& options) {
    try {
        std::ifstream file(filepath, std::ios::binary);
        if (!file.is_open()) {
            std::cerr << "Could not open file for reading: " << filepath << "\n";
            return false;
        }
        // Whole file in memory: intended for ad-hoc small/medium transfers
        std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        if (file.bad()) {
            std::cerr << "Could not read file: " << filepath << "\n";
            return false;
        }

        std::string filename = std::filesystem::path(filepath).filename().string();
        std::string boundary = security::generate_boundary();
        std::string body = protocol::build_form_file(boundary, "file", filename,
                                                     protocol::guess_content_type(filepath), content);

        boost::asio::io_context io_context;
        tcp::resolver resolver(io_context);
        beast::tcp_stream stream(io_context);
        beast::error_code ec;
        std::string port = std::to_string(device.http_port);

        // One deadline for connect, write and read together
        stream.expires_after(options.timeout);

        tcp::resolver::results_type endpoints;
        resolver.async_resolve(device.address, port,
            [&](const beast::error_code& result, tcp::resolver::results_type found) {
                ec = result;
                endpoints = std::move(found);
            });
        io_context.run();
        if (ec) throw beast::system_error(ec);

        io_context.restart();
        stream.async_connect(endpoints, [&](const beast::error_code& result, const tcp::endpoint&) {
            ec = result;
        });
        io_context.run();
        if (ec) throw beast::system_error(ec);

        http::request<http::string_body> req{http::verb::post, options.target, 11};
        req.set(http::field::host, device.address + ":" + port);
        req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
        req.set(http::field::content_type, "multipart/form-data; boundary=" + boundary);
        req.body() = std::move(body);
        req.prepare_payload();

        io_context.restart();
        http::async_write(stream, req, [&](const beast::error_code& result, std::size_t) {
            ec = result;
        });
        io_context.run();
        if (ec) throw beast::system_error(ec);

        beast::flat_buffer buffer;
        http::response<http::string_body> res;
        io_context.restart();
        http::async_read(stream, buffer, res, [&](const beast::error_code& result, std::size_t) {
            ec = result;
        });
        io_context.run();
        if (ec) throw beast::system_error(ec);

        // not_connected happens sometimes, nothing to report
        beast::error_code shutdown_ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, shutdown_ec);

        if (res.result_int() < 200 || res.result_int() >= 300) {
            std::cerr << "FileSender: " << device.address << ":" << port
                      << " answered HTTP " << res.result_int() << " for " << filename << "\n";
            return false;
        }
        return true;
    } catch (std::exception& e) {
        std::cerr << "FileSender Exception: " << e.what() << "\n";
        return false;
    }
}

} // namespace transfer
