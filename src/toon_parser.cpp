#include "toon_parser.h"
#include "toon_infer.h"
#include <charconv>
#include <utility>

namespace toontab {

Parser::Parser(const ParseOptions& opts) : opts_(opts) {}

void Parser::reset() {
    warnings_.clear();
    current_file_.clear();
    ragged_count_ = 0;
    first_ragged_line_ = 0;
    min_fields_ = SIZE_MAX;
    max_fields_ = 0;
}

bool Parser::is_separator(std::string_view line) const {
    return !opts_.separator.empty() &&
           line.substr(0, opts_.separator.size()) == opts_.separator;
}

std::vector<std::string> Parser::parse_header(std::string_view line) {
    std::vector<std::string> columns;

    while (true) {
        size_t pos = line.find(opts_.delimiter);
        columns.emplace_back(trim(line.substr(0, pos)));
        if (pos == std::string_view::npos) {
            break;
        }
        line = line.substr(pos + 1);
    }

    return columns;
}

std::vector<std::string_view> Parser::split_row(std::string_view line) {
    std::vector<std::string_view> fields;

    size_t start = 0;
    bool in_string = false;
    bool escape = false;

    for (size_t i = 0; i < line.size(); i++) {
        char c = line[i];

        if (opts_.quoted_fields) {
            if (escape) {
                escape = false;
                continue;
            }

            if (c == '\\' && in_string) {
                escape = true;
                continue;
            }

            if (c == '"') {
                in_string = !in_string;
                continue;
            }
        }

        if (!in_string && c == opts_.delimiter) {
            fields.push_back(trim(line.substr(start, i - start)));
            start = i + 1;
        }
    }

    // Last field
    fields.push_back(trim(line.substr(start)));

    return fields;
}

std::optional<std::string> Parser::parse_quoted_string(std::string_view text) {
    if (text.size() < 2 || text.front() != '"' || text.back() != '"') {
        return std::nullopt;
    }

    std::string result;
    result.reserve(text.size() - 2);

    const size_t end = text.size() - 1;
    for (size_t i = 1; i < end; i++) {
        char c = text[i];

        if (c != '\\') {
            if (c == '"') {
                // Unescaped quote inside the field: not a quoted string
                return std::nullopt;
            }
            result += c;
            continue;
        }

        if (i + 1 >= end) {
            return std::nullopt;
        }

        char next = text[i + 1];
        switch (next) {
            case '"':  result += '"'; i++; break;
            case '\\': result += '\\'; i++; break;
            case 'n':  result += '\n'; i++; break;
            case 'r':  result += '\r'; i++; break;
            case 't':  result += '\t'; i++; break;
            case 'u': {
                // Unicode escape \uXXXX
                if (i + 5 >= end) {
                    return std::nullopt;
                }
                std::string_view hex = text.substr(i + 2, 4);
                unsigned int cp;
                auto res = std::from_chars(hex.data(), hex.data() + 4, cp, 16);
                if (res.ec != std::errc{} || res.ptr != hex.data() + 4) {
                    return std::nullopt;
                }
                // Simple UTF-8 encoding for BMP
                if (cp < 0x80) {
                    result += static_cast<char>(cp);
                } else if (cp < 0x800) {
                    result += static_cast<char>(0xC0 | (cp >> 6));
                    result += static_cast<char>(0x80 | (cp & 0x3F));
                } else {
                    result += static_cast<char>(0xE0 | (cp >> 12));
                    result += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
                    result += static_cast<char>(0x80 | (cp & 0x3F));
                }
                i += 5;
                break;
            }
            default:
                return std::nullopt;
        }
    }

    return result;
}

Value Parser::parse_field(std::string_view field) {
    if (opts_.quoted_fields && !field.empty() && field.front() == '"') {
        if (auto s = parse_quoted_string(field)) {
            return Value::make_string(std::move(*s));
        }
    }
    return infer_value(field);
}

Row Parser::parse_row(const Line& line, size_t ncol) {
    auto fields = split_row(line.text);
    size_t n_fields = fields.size();

    if (n_fields < min_fields_) min_fields_ = n_fields;
    if (n_fields > max_fields_) max_fields_ = n_fields;

    if (n_fields != ncol) {
        if (opts_.ragged_rows == "error") {
            throw ParseError(ErrorType::RAGGED_ROW,
                "Row has " + std::to_string(n_fields) + " fields but expected " +
                std::to_string(ncol), line.number, std::string(line.text), current_file_);
        }
        if (ragged_count_ == 0) {
            first_ragged_line_ = line.number;
        }
        ragged_count_++;
    }

    Row row;
    row.reserve(n_fields);
    for (auto field : fields) {
        row.push_back(parse_field(field));
    }
    return row;
}

void Parser::finish_warnings(size_t ncol) {
    if (ragged_count_ == 0 || !opts_.warn) {
        return;
    }

    warnings_.push_back(Warning("ragged_rows",
        std::to_string(ragged_count_) + " row(s) did not match the " +
        std::to_string(ncol) + " header columns (min=" + std::to_string(min_fields_) +
        ", max=" + std::to_string(max_fields_) + ", first at line " +
        std::to_string(first_ragged_line_) + "); rows kept as parsed."));
}

void Parser::check_read(const LineReader& reader) const {
    if (reader.has_error()) {
        throw ParseError(ErrorType::IO_ERROR, reader.error_message(),
                         reader.lines_read(), "", reader.filepath());
    }
}

Document Parser::parse_document(LineReader& reader) {
    Document doc;
    Line line;

    if (!reader.next_content(line)) {
        check_read(reader);
        throw ParseError(ErrorType::EMPTY_CONTENT, "Empty TOON content", 0, "", current_file_);
    }

    if (line.text.front() == opts_.name_marker) {
        doc.table_name = std::string(trim(line.text.substr(1)));
        if (!reader.next_content(line)) {
            check_read(reader);
            throw ParseError(ErrorType::MISSING_HEADER, "Missing column headers",
                             line.number, "", current_file_);
        }
    }

    doc.columns = parse_header(line.text);
    const size_t ncol = doc.columns.size();

    bool at_separator = true;
    while (reader.next_content(line)) {
        if (at_separator) {
            at_separator = false;
            if (is_separator(line.text)) {
                continue;
            }
        }
        doc.rows.push_back(parse_row(line, ncol));
    }
    check_read(reader);

    finish_warnings(ncol);
    return doc;
}

Document Parser::parse_string(std::string_view text) {
    reset();
    LineReader reader(text);
    return parse_document(reader);
}

Document Parser::parse_file(const std::string& filepath) {
    reset();
    current_file_ = filepath;

    LineReader reader(filepath);
    check_read(reader);
    return parse_document(reader);
}

ValidationResult Parser::validate_string(std::string_view text) {
    try {
        parse_string(text);
    } catch (const ParseError& e) {
        return ValidationResult::error(e);
    }
    return ValidationResult::ok();
}

ValidationResult Parser::validate_file(const std::string& filepath) {
    try {
        parse_file(filepath);
    } catch (const ParseError& e) {
        return ValidationResult::error(e);
    }
    return ValidationResult::ok();
}

Document parse(std::string_view text) {
    Parser parser;
    return parser.parse_string(text);
}

} // namespace toontab
