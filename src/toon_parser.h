#ifndef TOONTAB_PARSER_H
#define TOONTAB_PARSER_H

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <cstddef>
#include <cstdint>
#include "toon_errors.h"
#include "toon_io.h"
#include "toon_value.h"

namespace toontab {

// Parser options
struct ParseOptions {
    char delimiter = '|';
    char name_marker = '@';
    std::string separator = "---";
    bool quoted_fields = false;            // "..." fields are escaped strings
    std::string ragged_rows = "keep_warn"; // "keep_warn" or "error"
    bool warn = true;
};

// Reads the line-oriented table notation:
//
//   @employees                  optional table name
//   name|department|salary      header
//   ---                         optional separator
//   Alice|Engineering|95000.0   data rows, blank lines ignored
//
// Rows are not padded or truncated to the header width unless
// ragged_rows is "error", in which case the first mismatching row throws.
class Parser {
public:
    explicit Parser(const ParseOptions& opts = ParseOptions());

    // Parse from string
    Document parse_string(std::string_view text);

    // Parse from file
    Document parse_file(const std::string& filepath);

    // Validate without throwing
    ValidationResult validate_string(std::string_view text);
    ValidationResult validate_file(const std::string& filepath);

    // Get warnings accumulated during parsing
    const std::vector<Warning>& warnings() const { return warnings_; }

private:
    void reset();
    Document parse_document(LineReader& reader);
    void check_read(const LineReader& reader) const;

    std::vector<std::string> parse_header(std::string_view line);
    Row parse_row(const Line& line, size_t ncol);
    std::vector<std::string_view> split_row(std::string_view line);
    Value parse_field(std::string_view field);
    std::optional<std::string> parse_quoted_string(std::string_view text);

    bool is_separator(std::string_view line) const;
    void finish_warnings(size_t ncol);

    ParseOptions opts_;
    std::vector<Warning> warnings_;
    std::string current_file_;

    // Ragged row tracking
    size_t ragged_count_ = 0;
    size_t first_ragged_line_ = 0;
    size_t min_fields_ = SIZE_MAX;
    size_t max_fields_ = 0;
};

// Parse with default options
Document parse(std::string_view text);

} // namespace toontab

#endif // TOONTAB_PARSER_H
