#ifndef TOONTAB_INFER_H
#define TOONTAB_INFER_H

#include <string>
#include <string_view>
#include <optional>
#include <cstdint>
#include "toon_value.h"

namespace toontab {

// Strip leading and trailing ASCII whitespace
std::string_view trim(std::string_view sv);

// Case-insensitive ASCII comparison
bool iequals(std::string_view a, std::string_view b);

// Primitive recognisers; each expects an already trimmed token
bool parse_null(std::string_view text);
std::optional<bool> parse_bool(std::string_view text);
std::optional<int64_t> parse_integer(std::string_view text);
std::optional<double> parse_number(std::string_view text);

// Map a raw field token to a typed value.  Never fails: tokens that are not
// null, bool or numeric are kept as strings.
//
//   ""  null  NULL  none  na  nan   -> null
//   true  False                     -> bool
//   30  -7  +12                     -> int
//   30.0  3e2  .5                   -> double
//   anything else                   -> string (verbatim after trimming)
Value infer_value(std::string_view token);

// Inverse of infer_value: null and NaN render empty, doubles use the
// shortest round-trip form with a fractional part or exponent.
std::string render_value(const Value& v);

} // namespace toontab

#endif // TOONTAB_INFER_H
