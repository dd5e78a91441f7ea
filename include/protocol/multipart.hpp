#pragma once

#include <string>
#include <cstddef>
#include <functional>
#include <optional>
#include <stdexcept>

namespace protocol {

class MultipartError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Single-part multipart/form-data body carrying one file
std::string build_form_file(const std::string& boundary,
                            const std::string& field_name,
                            const std::string& filename,
                            const std::string& content_type,
                            const std::string& content);

// Extracts the boundary from a "multipart/form-data; boundary=..." header value
std::optional<std::string> boundary_from_content_type(const std::string& content_type);

/**
 * Incremental multipart/form-data parser that extracts the first part carrying
 * a filename. Input can be fed in chunks of any size; file content is handed to
 * on_data as soon as it is known not to be part of a delimiter, so memory use
 * stays bounded by the chunk size.
 */
class MultipartFileReader {
public:
    using BeginCallback = std::function<void(const std::string& filename)>;
    using DataCallback = std::function<void(const char* data, std::size_t size)>;
    using EndCallback = std::function<void()>;

    MultipartFileReader(const std::string& boundary,
                        BeginCallback on_begin,
                        DataCallback on_data,
                        EndCallback on_end);

    // Throws MultipartError on malformed input
    void feed(const char* data, std::size_t size);

    // Call once the body is exhausted. Throws if it ended inside the file part.
    void finish();

    bool found_file() const { return found_file_; }
    bool file_complete() const { return file_complete_; }

private:
    enum class State {
        PREAMBLE,
        AFTER_DELIMITER,
        HEADERS,
        BODY,
        DONE
    };

    bool step();

    std::string dash_boundary_;  // "--" + boundary
    std::string delimiter_;      // "\r\n--" + boundary
    std::string buffer_;
    State state_ = State::PREAMBLE;
    bool capturing_ = false;
    bool found_file_ = false;
    bool file_complete_ = false;

    BeginCallback on_begin_;
    DataCallback on_data_;
    EndCallback on_end_;
};

} // namespace protocol
