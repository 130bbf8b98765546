#ifndef TOONTAB_ERRORS_H
#define TOONTAB_ERRORS_H

#include <string>
#include <stdexcept>
#include <cstddef>

namespace toontab {

// Error types
enum class ErrorType {
    EMPTY_CONTENT,
    MISSING_HEADER,
    RAGGED_ROW,
    ARITY_MISMATCH,
    TYPE_ERROR,
    IO_ERROR
};

// Parse error with location information
class ParseError : public std::runtime_error {
public:
    ParseError(ErrorType type,
               const std::string& message,
               size_t line = 0,
               const std::string& snippet = "",
               const std::string& file = "")
        : std::runtime_error(message),
          type_(type),
          line_(line),
          snippet_(snippet),
          file_(file) {}

    ErrorType type() const { return type_; }
    size_t line() const { return line_; }
    const std::string& snippet() const { return snippet_; }
    const std::string& file() const { return file_; }

    std::string formatted_message() const {
        std::string msg = what();
        if (!file_.empty()) {
            msg += "\n  File: " + file_;
        }
        if (line_ > 0) {
            msg += "\n  Location: line " + std::to_string(line_);
        }
        if (!snippet_.empty()) {
            msg += "\n  Snippet: " + snippet_;
        }
        return msg;
    }

private:
    ErrorType type_;
    size_t line_;
    std::string snippet_;
    std::string file_;
};

// Raised by the encoder when its input breaks a precondition
class EncodeError : public std::runtime_error {
public:
    EncodeError(ErrorType type, const std::string& message)
        : std::runtime_error(message), type_(type) {}

    ErrorType type() const { return type_; }

private:
    ErrorType type_;
};

// Validation result (does not throw)
struct ValidationResult {
    bool valid = true;
    ErrorType error_type = ErrorType::EMPTY_CONTENT;
    std::string message;
    size_t line = 0;
    std::string file;

    static ValidationResult ok() {
        return ValidationResult{true, ErrorType::EMPTY_CONTENT, "", 0, ""};
    }

    static ValidationResult error(const ParseError& e) {
        return ValidationResult{false, e.type(), e.what(), e.line(), e.file()};
    }
};

// Warning information for aggregated warnings
struct Warning {
    std::string type;
    std::string message;

    Warning(const std::string& t, const std::string& m) : type(t), message(m) {}
};

inline const char* error_type_name(ErrorType type) {
    switch (type) {
        case ErrorType::EMPTY_CONTENT:  return "EmptyContent";
        case ErrorType::MISSING_HEADER: return "MissingHeader";
        case ErrorType::RAGGED_ROW:     return "RaggedRow";
        case ErrorType::ARITY_MISMATCH: return "ArityMismatch";
        case ErrorType::TYPE_ERROR:     return "TypeError";
        case ErrorType::IO_ERROR:       return "IoError";
    }
    return "Unknown";
}

} // namespace toontab

#endif // TOONTAB_ERRORS_H
