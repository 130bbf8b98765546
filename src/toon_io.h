#ifndef TOONTAB_IO_H
#define TOONTAB_IO_H

#include <string>
#include <string_view>
#include <fstream>
#include <vector>
#include <cstddef>

namespace toontab {

// One physical input line, without its '\n' or trailing '\r'.  The text view
// stays valid only until the next read from the same LineReader.
struct Line {
    std::string_view text;
    size_t number = 0;  // 1-based
};

// Line source over a file or an in-memory string.  A UTF-8 byte order mark
// at the start of the input is dropped.
class LineReader {
public:
    static constexpr size_t DEFAULT_BUFFER_SIZE = 1024 * 1024; // 1MB buffer

    explicit LineReader(const std::string& filepath, size_t buffer_size = DEFAULT_BUFFER_SIZE);
    explicit LineReader(std::string_view text);

    // Next physical line; false at end of input or after a read error
    bool next(Line& line);

    // Next line with non-whitespace content, trimmed
    bool next_content(Line& line);

    size_t lines_read() const { return line_no_; }

    // Empty when reading from a string
    const std::string& filepath() const { return filepath_; }

    bool has_error() const { return has_error_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool next_from_text(std::string_view& raw);
    bool next_from_file(std::string_view& raw);
    bool read_chunk();

    std::ifstream file_;
    std::string filepath_;
    std::vector<char> buffer_;
    size_t buffer_pos_ = 0;
    size_t buffer_end_ = 0;
    bool eof_reached_ = false;

    bool from_string_ = false;
    std::string_view text_;
    size_t text_pos_ = 0;

    // Holds a line that spans two buffer fills
    std::string scratch_;

    size_t line_no_ = 0;
    bool has_error_ = false;
    std::string error_message_;
};

// Growable output buffer for encoded text
class WriteBuffer {
public:
    static constexpr size_t DEFAULT_CAPACITY = 64 * 1024;

    explicit WriteBuffer(size_t initial_capacity = DEFAULT_CAPACITY);

    void append(const char* data, size_t len);
    void append(std::string_view sv);
    void append_char(char c);

    // Items separated by delim, no trailing delimiter
    void append_joined(const std::vector<std::string>& items, char delim);

    // Begin a new output line: a '\n' unless the buffer is empty, so the
    // output never ends with a line break.
    void start_line();

    // Append as a double-quoted string with backslash escapes
    void append_escaped_string(std::string_view s);

    std::string str() const;

    bool write_to_file(const std::string& filepath) const;

    void clear();
    size_t size() const { return data_.size(); }

private:
    std::vector<char> data_;
};

} // namespace toontab

#endif // TOONTAB_IO_H
