#include "toon_io.h"
#include "toon_infer.h"
#include <algorithm>
#include <cstdio>

namespace toontab {

namespace {

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

} // namespace

LineReader::LineReader(const std::string& filepath, size_t buffer_size)
    : filepath_(filepath), buffer_(std::max<size_t>(buffer_size, 1)) {
    file_.open(filepath, std::ios::binary);
    if (!file_.is_open()) {
        has_error_ = true;
        error_message_ = "Cannot open file: " + filepath;
    }
}

LineReader::LineReader(std::string_view text)
    : from_string_(true), text_(text) {
}

bool LineReader::read_chunk() {
    if (eof_reached_) {
        return false;
    }

    file_.read(buffer_.data(), static_cast<std::streamsize>(buffer_.size()));
    buffer_pos_ = 0;
    buffer_end_ = static_cast<size_t>(file_.gcount());

    if (file_.bad()) {
        has_error_ = true;
        error_message_ = "Read error: " + filepath_;
        return false;
    }
    if (file_.eof() || buffer_end_ == 0) {
        eof_reached_ = true;
    }
    return buffer_end_ > 0;
}

bool LineReader::next_from_text(std::string_view& raw) {
    if (text_pos_ >= text_.size()) {
        return false;
    }

    size_t newline = text_.find('\n', text_pos_);
    if (newline == std::string_view::npos) {
        raw = text_.substr(text_pos_);
        text_pos_ = text_.size();
    } else {
        raw = text_.substr(text_pos_, newline - text_pos_);
        text_pos_ = newline + 1;
    }
    return true;
}

bool LineReader::next_from_file(std::string_view& raw) {
    if (has_error_) {
        return false;
    }

    scratch_.clear();
    bool partial = false;

    while (true) {
        if (buffer_pos_ >= buffer_end_ && !read_chunk()) {
            if (has_error_) {
                return false;
            }
            // Last line without a terminating '\n'
            if (partial) {
                raw = scratch_;
                return true;
            }
            return false;
        }

        const char* start = buffer_.data() + buffer_pos_;
        const char* end = buffer_.data() + buffer_end_;
        const char* newline = std::find(start, end, '\n');

        if (newline == end) {
            scratch_.append(start, end);
            partial = true;
            buffer_pos_ = buffer_end_;
            continue;
        }

        buffer_pos_ = static_cast<size_t>(newline - buffer_.data()) + 1;
        if (partial) {
            scratch_.append(start, newline);
            raw = scratch_;
        } else {
            raw = std::string_view(start, static_cast<size_t>(newline - start));
        }
        return true;
    }
}

bool LineReader::next(Line& line) {
    std::string_view raw;
    bool got = from_string_ ? next_from_text(raw) : next_from_file(raw);
    if (!got) {
        return false;
    }

    line_no_++;
    if (line_no_ == 1 && raw.substr(0, kUtf8Bom.size()) == kUtf8Bom) {
        raw.remove_prefix(kUtf8Bom.size());
    }
    if (!raw.empty() && raw.back() == '\r') {
        raw.remove_suffix(1);
    }

    line.text = raw;
    line.number = line_no_;
    return true;
}

bool LineReader::next_content(Line& line) {
    while (next(line)) {
        line.text = trim(line.text);
        if (!line.text.empty()) {
            return true;
        }
    }
    return false;
}

// WriteBuffer implementation
WriteBuffer::WriteBuffer(size_t initial_capacity) {
    data_.reserve(initial_capacity);
}

void WriteBuffer::append(const char* data, size_t len) {
    data_.insert(data_.end(), data, data + len);
}

void WriteBuffer::append(std::string_view sv) {
    append(sv.data(), sv.size());
}

void WriteBuffer::append_char(char c) {
    data_.push_back(c);
}

void WriteBuffer::append_joined(const std::vector<std::string>& items, char delim) {
    for (size_t i = 0; i < items.size(); i++) {
        if (i > 0) append_char(delim);
        append(items[i]);
    }
}

void WriteBuffer::start_line() {
    if (!data_.empty()) {
        append_char('\n');
    }
}

void WriteBuffer::append_escaped_string(std::string_view s) {
    append_char('"');
    for (char c : s) {
        switch (c) {
            case '"':  append("\\\"", 2); break;
            case '\\': append("\\\\", 2); break;
            case '\n': append("\\n", 2); break;
            case '\r': append("\\r", 2); break;
            case '\t': append("\\t", 2); break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[7];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    append(buf, 6);
                } else {
                    append_char(c);
                }
                break;
        }
    }
    append_char('"');
}

std::string WriteBuffer::str() const {
    return std::string(data_.begin(), data_.end());
}

bool WriteBuffer::write_to_file(const std::string& filepath) const {
    std::ofstream out(filepath, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return false;
    }
    out.write(data_.data(), static_cast<std::streamsize>(data_.size()));
    out.close();
    return !out.fail();
}

void WriteBuffer::clear() {
    data_.clear();
}

} // namespace toontab
