#include "toon_value.h"
#include "toon_infer.h"
#include <utility>

namespace toontab {

const char* kind_name(ValueKind kind) {
    switch (kind) {
        case ValueKind::V_NULL:   return "null";
        case ValueKind::V_BOOL:   return "bool";
        case ValueKind::V_INT:    return "int";
        case ValueKind::V_DOUBLE: return "double";
        case ValueKind::V_STRING: return "string";
    }
    return "unknown";
}

Value Value::make_null() {
    return Value();
}

Value Value::make_bool(bool v) {
    Value val;
    val.data_.emplace<bool>(v);
    return val;
}

Value Value::make_int(int64_t v) {
    Value val;
    val.data_.emplace<int64_t>(v);
    return val;
}

Value Value::make_double(double v) {
    Value val;
    val.data_.emplace<double>(v);
    return val;
}

Value Value::make_string(std::string v) {
    Value val;
    val.data_.emplace<std::string>(std::move(v));
    return val;
}

bool operator==(const Document& a, const Document& b) {
    return a.table_name == b.table_name &&
           a.columns == b.columns &&
           a.rows == b.rows;
}

bool operator!=(const Document& a, const Document& b) {
    return !(a == b);
}

std::ostream& operator<<(std::ostream& os, const Value& v) {
    os << kind_name(v.kind()) << '(';
    switch (v.kind()) {
        case ValueKind::V_NULL:
            break;
        case ValueKind::V_BOOL:
        case ValueKind::V_INT:
        case ValueKind::V_DOUBLE:
            os << render_value(v);
            break;
        case ValueKind::V_STRING:
            os << '"' << v.string_val() << '"';
            break;
    }
    return os << ')';
}

std::ostream& operator<<(std::ostream& os, const Document& doc) {
    os << "Document{";
    if (doc.table_name) {
        os << "name=" << *doc.table_name << ", ";
    }
    os << "columns=[";
    for (size_t i = 0; i < doc.columns.size(); i++) {
        if (i > 0) os << ", ";
        os << doc.columns[i];
    }
    os << "], rows=[";
    for (size_t r = 0; r < doc.rows.size(); r++) {
        if (r > 0) os << ", ";
        os << '[';
        for (size_t i = 0; i < doc.rows[r].size(); i++) {
            if (i > 0) os << ", ";
            os << doc.rows[r][i];
        }
        os << ']';
    }
    return os << "]}";
}

} // namespace toontab
