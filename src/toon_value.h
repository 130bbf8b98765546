#ifndef TOONTAB_VALUE_H
#define TOONTAB_VALUE_H

#include <string>
#include <vector>
#include <variant>
#include <optional>
#include <cstdint>
#include <cstddef>
#include <ostream>

namespace toontab {

// Value kinds, in variant index order
enum class ValueKind {
    V_NULL,
    V_BOOL,
    V_INT,
    V_DOUBLE,
    V_STRING
};

const char* kind_name(ValueKind kind);

// Typed scalar cell of a TOON table
class Value {
public:
    Value() = default;

    // Factory methods
    static Value make_null();
    static Value make_bool(bool v);
    static Value make_int(int64_t v);
    static Value make_double(double v);
    static Value make_string(std::string v);

    ValueKind kind() const { return static_cast<ValueKind>(data_.index()); }
    bool is_null() const { return kind() == ValueKind::V_NULL; }

    // Accessors throw std::bad_variant_access on a kind mismatch
    bool bool_val() const { return std::get<bool>(data_); }
    int64_t int_val() const { return std::get<int64_t>(data_); }
    double double_val() const { return std::get<double>(data_); }
    const std::string& string_val() const { return std::get<std::string>(data_); }

    bool operator==(const Value& other) const { return data_ == other.data_; }
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    std::variant<std::monostate, bool, int64_t, double, std::string> data_;
};

using Row = std::vector<Value>;

// One parsed or to-be-serialized table
struct Document {
    std::optional<std::string> table_name;
    std::vector<std::string> columns;
    std::vector<Row> rows;

    size_t ncol() const { return columns.size(); }
    size_t nrow() const { return rows.size(); }
};

bool operator==(const Document& a, const Document& b);
bool operator!=(const Document& a, const Document& b);

std::ostream& operator<<(std::ostream& os, const Value& v);
std::ostream& operator<<(std::ostream& os, const Document& doc);

} // namespace toontab

#endif // TOONTAB_VALUE_H
