#ifndef TOONTAB_CHARCONV_H
#define TOONTAB_CHARCONV_H

#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <string>
#include <string_view>
#include <system_error>

#ifdef _LIBCPP_VERSION
#include <xlocale.h>
#endif

namespace toontab {

// Apple clang's libc++ does not implement std::from_chars for floating-point
// types.  Provide a thin wrapper that falls back to strtod_l (C locale) on
// libc++.

inline std::from_chars_result double_from_chars(const char* first,
                                                const char* last,
                                                double& value) {
#ifdef _LIBCPP_VERSION
    const std::size_t len = static_cast<std::size_t>(last - first);
    if (len == 0) {
        return {first, std::errc::invalid_argument};
    }

    // std::from_chars (default format) rejects leading '+' and hex floats;
    // strtod accepts both.  Filter them out for consistent cross-platform
    // behavior.
    if (*first == '+') {
        return {first, std::errc::invalid_argument};
    }
    {
        const char* p = (*first == '-') ? first + 1 : first;
        if (last - p >= 2 && p[0] == '0' && (p[1] == 'x' || p[1] == 'X')) {
            return {first, std::errc::invalid_argument};
        }
    }

    // Null-terminate: stack buffer for typical numbers, heap for outliers
    constexpr std::size_t kBuf = 256;
    char stack_buf[kBuf];
    std::string heap_buf;
    char* buf;
    if (len < kBuf) {
        std::memcpy(stack_buf, first, len);
        stack_buf[len] = '\0';
        buf = stack_buf;
    } else {
        heap_buf.assign(first, len);
        buf = &heap_buf[0];
    }

    // Use strtod_l with the C locale to avoid LC_NUMERIC dependence
    static locale_t c_locale = newlocale(LC_ALL_MASK, "C", nullptr);
    char* end = nullptr;
    errno = 0;
    double tmp = strtod_l(buf, &end, c_locale);

    if (end == buf) {
        return {first, std::errc::invalid_argument};
    }
    if (errno == ERANGE) {
        return {first + (end - buf), std::errc::result_out_of_range};
    }
    value = tmp;
    return {first + (end - buf), std::errc{}};
#else
    return std::from_chars(first, last, value);
#endif
}

// Shortest decimal text that reads back as the same double.  Fixed notation
// for decimal exponents in [-4, 16), always carrying a fractional part
// ("95000.0"); scientific with a signed two-digit exponent otherwise
// ("1e+16", "1.5e-05").
inline std::string format_double(double value) {
    if (std::isnan(value)) {
        return "nan";
    }
    if (std::isinf(value)) {
        return value < 0 ? "-inf" : "inf";
    }

    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::scientific);
    if (res.ec != std::errc{}) {
        return std::to_string(value);
    }
    std::string_view sci(buf, static_cast<std::size_t>(res.ptr - buf));

    std::string out;
    if (!sci.empty() && sci.front() == '-') {
        out += '-';
        sci.remove_prefix(1);
    }

    // sci is now d[.ddd]e(+|-)XX
    std::size_t e_pos = sci.find('e');
    std::string digits;
    for (char c : sci.substr(0, e_pos)) {
        if (c != '.') digits += c;
    }

    int exp10 = 0;
    const char* p = sci.data() + e_pos + 1;
    const char* end = sci.data() + sci.size();
    if (p < end && *p == '+') p++;
    if (std::from_chars(p, end, exp10).ec != std::errc{}) {
        exp10 = 0;
    }

    const int n = static_cast<int>(digits.size());

    if (exp10 >= -4 && exp10 < 16) {
        if (exp10 >= 0) {
            int int_len = exp10 + 1;
            if (n <= int_len) {
                out += digits;
                out.append(static_cast<std::size_t>(int_len - n), '0');
                out += ".0";
            } else {
                out += digits.substr(0, static_cast<std::size_t>(int_len));
                out += '.';
                out += digits.substr(static_cast<std::size_t>(int_len));
            }
        } else {
            out += "0.";
            out.append(static_cast<std::size_t>(-exp10 - 1), '0');
            out += digits;
        }
        return out;
    }

    out += digits[0];
    if (n > 1) {
        out += '.';
        out += digits.substr(1);
    }
    out += 'e';
    out += exp10 < 0 ? '-' : '+';
    int abs_exp = exp10 < 0 ? -exp10 : exp10;
    if (abs_exp < 10) out += '0';
    out += std::to_string(abs_exp);
    return out;
}

}  // namespace toontab

#endif  // TOONTAB_CHARCONV_H
