#include "protocol/multipart.hpp"
#include <algorithm>
#include <cctype>
#include <map>

namespace protocol {

namespace {

constexpr std::size_t MAX_HEADER_BYTES = 16 * 1024;

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t");
    return s.substr(begin, end - begin + 1);
}

struct HeaderValue {
    std::string value;
    std::map<std::string, std::string> params;
};

// Parses `value; key=val; key2="quoted; val"`. Parameter names are lowercased.
HeaderValue parse_header_value(const std::string& raw) {
    HeaderValue result;
    std::size_t i = 0;

    std::size_t semi = raw.find(';');
    result.value = trim(raw.substr(0, semi));
    if (semi == std::string::npos) return result;
    i = semi + 1;

    while (i < raw.size()) {
        while (i < raw.size() && (raw[i] == ' ' || raw[i] == '\t' || raw[i] == ';')) ++i;
        std::size_t eq = raw.find('=', i);
        std::size_t next_semi = raw.find(';', i);
        if (eq == std::string::npos || (next_semi != std::string::npos && next_semi < eq)) {
            // Parameter without a value
            i = (next_semi == std::string::npos) ? raw.size() : next_semi + 1;
            continue;
        }

        std::string key = to_lower(trim(raw.substr(i, eq - i)));
        i = eq + 1;
        while (i < raw.size() && (raw[i] == ' ' || raw[i] == '\t')) ++i;

        std::string val;
        if (i < raw.size() && raw[i] == '"') {
            ++i;
            while (i < raw.size() && raw[i] != '"') {
                // Backslashes stay literal unless escaping a quote or another backslash
                if (raw[i] == '\\' && i + 1 < raw.size() && (raw[i + 1] == '"' || raw[i + 1] == '\\')) ++i;
                val += raw[i++];
            }
            ++i; // closing quote
            std::size_t after = raw.find(';', i);
            i = (after == std::string::npos) ? raw.size() : after + 1;
        } else {
            std::size_t end = raw.find(';', i);
            val = trim(raw.substr(i, end == std::string::npos ? std::string::npos : end - i));
            i = (end == std::string::npos) ? raw.size() : end + 1;
        }

        if (!key.empty()) result.params[key] = val;
    }
    return result;
}

// filename parameter of the part's Content-Disposition, if any
std::optional<std::string> filename_from_headers(const std::string& headers) {
    std::size_t start = 0;
    while (start <= headers.size()) {
        std::size_t end = headers.find("\r\n", start);
        std::string line = headers.substr(start, end == std::string::npos ? std::string::npos : end - start);

        std::size_t colon = line.find(':');
        if (colon != std::string::npos && to_lower(trim(line.substr(0, colon))) == "content-disposition") {
            HeaderValue disposition = parse_header_value(line.substr(colon + 1));
            auto it = disposition.params.find("filename");
            if (it != disposition.params.end()) return it->second;
            return std::nullopt;
        }

        if (end == std::string::npos) break;
        start = end + 2;
    }
    return std::nullopt;
}

std::string quote_filename(const std::string& filename) {
    std::string out;
    for (char c : filename) {
        if (c == '"') {
            out += "%22";
        } else if (c == '\r' || c == '\n') {
            continue;
        } else {
            out += c;
        }
    }
    return out;
}

} // namespace

std::string build_form_file(const std::string& boundary,
                            const std::string& field_name,
                            const std::string& filename,
                            const std::string& content_type,
                            const std::string& content) {
    std::string body;
    body.reserve(content.size() + boundary.size() * 2 + filename.size() + 160);
    body += "--" + boundary + "\r\n";
    body += "Content-Disposition: form-data; name=\"" + field_name
          + "\"; filename=\"" + quote_filename(filename) + "\"\r\n";
    body += "Content-Type: " + content_type + "\r\n\r\n";
    body += content;
    body += "\r\n--" + boundary + "--\r\n";
    return body;
}

std::optional<std::string> boundary_from_content_type(const std::string& content_type) {
    HeaderValue header = parse_header_value(content_type);
    if (to_lower(header.value) != "multipart/form-data") return std::nullopt;

    auto it = header.params.find("boundary");
    if (it == header.params.end() || it->second.empty()) return std::nullopt;
    return it->second;
}

// ─── MultipartFileReader ────────────────────────────────────────────────────

MultipartFileReader::MultipartFileReader(const std::string& boundary,
                                         BeginCallback on_begin,
                                         DataCallback on_data,
                                         EndCallback on_end)
    : dash_boundary_("--" + boundary),
      delimiter_("\r\n--" + boundary),
      on_begin_(std::move(on_begin)),
      on_data_(std::move(on_data)),
      on_end_(std::move(on_end)) {
    if (boundary.empty()) {
        throw MultipartError("Empty multipart boundary");
    }
}

void MultipartFileReader::feed(const char* data, std::size_t size) {
    if (state_ == State::DONE) return;
    buffer_.append(data, size);
    while (step()) {
    }
}

void MultipartFileReader::finish() {
    if (capturing_) {
        throw MultipartError("Multipart body ended inside the file part");
    }
}

// Advances the state machine once. Returns false when more input is needed.
bool MultipartFileReader::step() {
    switch (state_) {
    case State::PREAMBLE: {
        std::size_t pos = buffer_.find(dash_boundary_);
        if (pos == std::string::npos) {
            std::size_t keep = dash_boundary_.size() - 1;
            if (buffer_.size() > keep) buffer_.erase(0, buffer_.size() - keep);
            return false;
        }
        buffer_.erase(0, pos + dash_boundary_.size());
        state_ = State::AFTER_DELIMITER;
        return true;
    }

    case State::AFTER_DELIMITER: {
        if (buffer_.size() < 2) return false;
        if (buffer_.compare(0, 2, "--") == 0) {
            state_ = State::DONE;
            buffer_.clear();
            return false;
        }
        std::size_t crlf = buffer_.find("\r\n");
        if (crlf == std::string::npos) {
            if (buffer_.size() > MAX_HEADER_BYTES) {
                throw MultipartError("Malformed multipart delimiter line");
            }
            return false;
        }
        // Only transport padding may follow a delimiter
        if (!trim(buffer_.substr(0, crlf)).empty()) {
            throw MultipartError("Malformed multipart delimiter line");
        }
        buffer_.erase(0, crlf + 2);
        state_ = State::HEADERS;
        return true;
    }

    case State::HEADERS: {
        std::string headers;
        if (buffer_.compare(0, 2, "\r\n") == 0) {
            buffer_.erase(0, 2);
        } else {
            std::size_t end = buffer_.find("\r\n\r\n");
            if (end == std::string::npos) {
                if (buffer_.size() > MAX_HEADER_BYTES) {
                    throw MultipartError("Multipart part headers too large");
                }
                return false;
            }
            headers = buffer_.substr(0, end);
            buffer_.erase(0, end + 4);
        }

        auto filename = filename_from_headers(headers);
        capturing_ = filename.has_value() && !found_file_;
        if (capturing_) {
            found_file_ = true;
            if (on_begin_) on_begin_(*filename);
        }
        state_ = State::BODY;
        return true;
    }

    case State::BODY: {
        std::size_t pos = buffer_.find(delimiter_);
        if (pos == std::string::npos) {
            // Hold back anything that could be the start of a delimiter
            std::size_t keep = delimiter_.size() - 1;
            if (buffer_.size() > keep) {
                std::size_t ready = buffer_.size() - keep;
                if (capturing_ && on_data_) on_data_(buffer_.data(), ready);
                buffer_.erase(0, ready);
            }
            return false;
        }

        if (capturing_ && pos > 0 && on_data_) on_data_(buffer_.data(), pos);
        buffer_.erase(0, pos + delimiter_.size());
        if (capturing_) {
            capturing_ = false;
            file_complete_ = true;
            if (on_end_) on_end_();
        }
        state_ = State::AFTER_DELIMITER;
        return true;
    }

    case State::DONE:
        buffer_.clear();
        return false;
    }
    return false;
}

} // namespace protocol
