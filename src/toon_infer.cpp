#include "toon_infer.h"
#include "toon_charconv.h"
#include <charconv>
#include <cctype>
#include <cmath>
#include <limits>

namespace toontab {

namespace {

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

// Optional sign followed by at least one digit and nothing else
bool is_integer_literal(std::string_view text) {
    if (!text.empty() && (text.front() == '+' || text.front() == '-')) {
        text.remove_prefix(1);
    }
    if (text.empty()) return false;
    for (char c : text) {
        if (!is_digit(c)) return false;
    }
    return true;
}

bool has_fraction_or_exponent(std::string_view text) {
    for (char c : text) {
        if (c == '.' || c == 'e' || c == 'E') return true;
    }
    return false;
}

// std::from_chars rejects a leading '+'
std::string_view strip_plus(std::string_view text) {
    if (text.size() >= 2 && text[0] == '+' && (is_digit(text[1]) || text[1] == '.')) {
        text.remove_prefix(1);
    }
    return text;
}

// Decimal exponent of the leading significant digit of a float literal
// already accepted by from_chars, e.g. 0 for "5.2", -3 for "0.001e0".
// Exponents too large for long long saturate.
long long leading_exponent(std::string_view text) {
    if (!text.empty() && (text.front() == '+' || text.front() == '-')) {
        text.remove_prefix(1);
    }

    size_t e_pos = text.find_first_of("eE");
    std::string_view mantissa = text.substr(0, e_pos);

    long long exp10 = 0;
    if (e_pos != std::string_view::npos) {
        std::string_view digits = text.substr(e_pos + 1);
        bool negative = !digits.empty() && digits.front() == '-';
        if (!digits.empty() && (digits.front() == '+' || digits.front() == '-')) {
            digits.remove_prefix(1);
        }
        auto res = std::from_chars(digits.data(), digits.data() + digits.size(), exp10);
        if (res.ec == std::errc::result_out_of_range) {
            exp10 = std::numeric_limits<long long>::max() / 2;
        }
        if (negative) exp10 = -exp10;
    }

    size_t point = mantissa.find('.');
    size_t int_len = point == std::string_view::npos ? mantissa.size() : point;
    for (size_t i = 0; i < mantissa.size(); i++) {
        if (mantissa[i] == '.' || mantissa[i] == '0') continue;
        long long pos = i < int_len
            ? static_cast<long long>(int_len - i) - 1
            : -static_cast<long long>(i - int_len);
        return exp10 + pos;
    }
    return exp10;
}

} // namespace

std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) {
        sv.remove_suffix(1);
    }
    return sv;
}

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); i++) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

bool parse_null(std::string_view text) {
    return text.empty() ||
           iequals(text, "null") ||
           iequals(text, "none") ||
           iequals(text, "na") ||
           iequals(text, "nan");
}

std::optional<bool> parse_bool(std::string_view text) {
    if (iequals(text, "true")) return true;
    if (iequals(text, "false")) return false;
    return std::nullopt;
}

std::optional<int64_t> parse_integer(std::string_view text) {
    if (text.empty() || has_fraction_or_exponent(text)) return std::nullopt;

    text = strip_plus(text);

    int64_t value;
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);

    if (result.ec == std::errc{} && result.ptr == text.data() + text.size()) {
        return value;
    }

    return std::nullopt;
}

std::optional<double> parse_number(std::string_view text) {
    if (text.empty()) return std::nullopt;

    text = strip_plus(text);

    double value;
    auto result = double_from_chars(text.data(), text.data() + text.size(), value);

    if (result.ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    if (result.ec == std::errc{}) {
        return value;
    }
    // Too small for a double: rounds to a signed zero.  Overflow stays a failure.
    if (result.ec == std::errc::result_out_of_range && leading_exponent(text) < 0) {
        return text.front() == '-' ? -0.0 : 0.0;
    }

    return std::nullopt;
}

Value infer_value(std::string_view token) {
    token = trim(token);

    if (parse_null(token)) {
        return Value::make_null();
    }

    if (auto b = parse_bool(token)) {
        return Value::make_bool(*b);
    }

    if (!has_fraction_or_exponent(token)) {
        if (auto i = parse_integer(token)) {
            return Value::make_int(*i);
        }
        // Integer literal beyond the 64-bit range keeps its magnitude
        if (is_integer_literal(token)) {
            if (auto d = parse_number(token)) {
                return Value::make_double(*d);
            }
        }
    } else if (auto d = parse_number(token)) {
        return Value::make_double(*d);
    }

    return Value::make_string(std::string(token));
}

std::string render_value(const Value& v) {
    switch (v.kind()) {
        case ValueKind::V_NULL:
            return std::string();
        case ValueKind::V_BOOL:
            return v.bool_val() ? "true" : "false";
        case ValueKind::V_INT:
            return std::to_string(v.int_val());
        case ValueKind::V_DOUBLE:
            if (std::isnan(v.double_val())) {
                return std::string();
            }
            return format_double(v.double_val());
        case ValueKind::V_STRING:
            return v.string_val();
    }
    return std::string();
}

} // namespace toontab
