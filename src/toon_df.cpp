#include "toon_df.h"
#include "toon_infer.h"
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <utility>

namespace toontab {

namespace {

ColType required_type(const Value& v) {
    switch (v.kind()) {
        case ValueKind::V_NULL:
            return ColType::UNKNOWN;
        case ValueKind::V_BOOL:
            return ColType::LOGICAL;
        case ValueKind::V_INT:
            // INT32_MIN is R's NA_integer_
            if (v.int_val() > INT32_MIN && v.int_val() <= INT32_MAX) {
                return ColType::INTEGER;
            }
            return ColType::DOUBLE;
        case ValueKind::V_DOUBLE:
            return ColType::DOUBLE;
        case ValueKind::V_STRING:
            return ColType::STRING;
    }
    return ColType::STRING;
}

int to_logical(const Value& v) {
    switch (v.kind()) {
        case ValueKind::V_BOOL:
            return v.bool_val() ? TRUE : FALSE;
        case ValueKind::V_NULL:
        case ValueKind::V_INT:
        case ValueKind::V_DOUBLE:
        case ValueKind::V_STRING:
            break;
    }
    return NA_LOGICAL;
}

int to_integer(const Value& v) {
    switch (v.kind()) {
        case ValueKind::V_BOOL:
            return v.bool_val() ? 1 : 0;
        case ValueKind::V_INT:
            return static_cast<int>(v.int_val());
        case ValueKind::V_NULL:
        case ValueKind::V_DOUBLE:
        case ValueKind::V_STRING:
            break;
    }
    return NA_INTEGER;
}

double to_double(const Value& v) {
    switch (v.kind()) {
        case ValueKind::V_BOOL:
            return v.bool_val() ? 1.0 : 0.0;
        case ValueKind::V_INT:
            return static_cast<double>(v.int_val());
        case ValueKind::V_DOUBLE:
            return v.double_val();
        case ValueKind::V_NULL:
        case ValueKind::V_STRING:
            break;
    }
    return NA_REAL;
}

std::string format_utc(double seconds, const char* fmt) {
    std::time_t t = static_cast<std::time_t>(seconds);
    std::tm tm_info{};
    if (gmtime_r(&t, &tm_info) == nullptr) {
        return std::string();
    }
    char buf[64];
    size_t n = std::strftime(buf, sizeof(buf), fmt, &tm_info);
    return std::string(buf, n);
}

// Compact row.names are stored as c(NA, -n)
R_xlen_t dataframe_nrow(SEXP df) {
    SEXP row_names = Rf_getAttrib(df, R_RowNamesSymbol);
    if (TYPEOF(row_names) == INTSXP && Rf_xlength(row_names) == 2 &&
        INTEGER(row_names)[0] == NA_INTEGER) {
        int n = INTEGER(row_names)[1];
        return n < 0 ? -n : n;
    }
    return Rf_xlength(row_names);
}

std::string column_name(SEXP names, R_xlen_t j) {
    if (names == R_NilValue || STRING_ELT(names, j) == NA_STRING) {
        return "V" + std::to_string(j + 1);
    }
    return Rf_translateCharUTF8(STRING_ELT(names, j));
}

// Convert column j of a data.frame into cells, appended row-wise to doc
void append_column(Document& doc, SEXP col, R_xlen_t nrow) {
    const std::string& name = doc.columns.back();

    if (Rf_inherits(col, "Date") || Rf_inherits(col, "POSIXct")) {
        if (TYPEOF(col) != REALSXP && TYPEOF(col) != INTSXP) {
            throw EncodeError(ErrorType::TYPE_ERROR,
                "Column '" + name + "' has an unsupported date storage type");
        }
        bool is_date = Rf_inherits(col, "Date");
        for (R_xlen_t i = 0; i < nrow; i++) {
            double val = TYPEOF(col) == REALSXP ? REAL(col)[i]
                : (INTEGER(col)[i] == NA_INTEGER ? NA_REAL : INTEGER(col)[i]);
            if (ISNAN(val)) {
                doc.rows[i].push_back(Value::make_null());
            } else if (is_date) {
                doc.rows[i].push_back(Value::make_string(format_utc(val * 86400.0, "%Y-%m-%d")));
            } else {
                doc.rows[i].push_back(Value::make_string(format_utc(val, "%Y-%m-%dT%H:%M:%SZ")));
            }
        }
        return;
    }

    switch (TYPEOF(col)) {
        case LGLSXP: {
            const int* data = LOGICAL(col);
            for (R_xlen_t i = 0; i < nrow; i++) {
                doc.rows[i].push_back(data[i] == NA_LOGICAL
                    ? Value::make_null() : Value::make_bool(data[i] != 0));
            }
            break;
        }
        case INTSXP: {
            const int* data = INTEGER(col);
            SEXP levels = Rf_getAttrib(col, R_LevelsSymbol);
            for (R_xlen_t i = 0; i < nrow; i++) {
                if (data[i] == NA_INTEGER) {
                    doc.rows[i].push_back(Value::make_null());
                } else if (levels != R_NilValue) {
                    // Factor - use the level label
                    doc.rows[i].push_back(Value::make_string(
                        Rf_translateCharUTF8(STRING_ELT(levels, data[i] - 1))));
                } else {
                    doc.rows[i].push_back(Value::make_int(data[i]));
                }
            }
            break;
        }
        case REALSXP: {
            const double* data = REAL(col);
            for (R_xlen_t i = 0; i < nrow; i++) {
                doc.rows[i].push_back(ISNAN(data[i])
                    ? Value::make_null() : Value::make_double(data[i]));
            }
            break;
        }
        case STRSXP: {
            for (R_xlen_t i = 0; i < nrow; i++) {
                SEXP elem = STRING_ELT(col, i);
                doc.rows[i].push_back(elem == NA_STRING
                    ? Value::make_null() : Value::make_string(Rf_translateCharUTF8(elem)));
            }
            break;
        }
        default:
            throw EncodeError(ErrorType::TYPE_ERROR,
                "Column '" + name + "' has unsupported type " + Rf_type2char(TYPEOF(col)));
    }
}

} // namespace

// ColBuilder implementation
ColBuilder::ColBuilder(const std::string& name, size_t initial_capacity)
    : name_(name) {
    cells_.reserve(initial_capacity);
}

void ColBuilder::promote_to(ColType t) {
    if (static_cast<int>(t) > static_cast<int>(type_)) {
        type_ = t;
    }
}

void ColBuilder::append(const Value& v) {
    promote_to(required_type(v));
    cells_.push_back(v);
}

void ColBuilder::append_null() {
    cells_.push_back(Value::make_null());
}

SEXP ColBuilder::finalize() const {
    const R_xlen_t n = static_cast<R_xlen_t>(cells_.size());
    SEXP result;

    switch (type_) {
        case ColType::UNKNOWN:
        case ColType::LOGICAL: {
            result = PROTECT(Rf_allocVector(LGLSXP, n));
            int* out = LOGICAL(result);
            for (R_xlen_t i = 0; i < n; i++) {
                out[i] = to_logical(cells_[i]);
            }
            break;
        }
        case ColType::INTEGER: {
            result = PROTECT(Rf_allocVector(INTSXP, n));
            int* out = INTEGER(result);
            for (R_xlen_t i = 0; i < n; i++) {
                out[i] = to_integer(cells_[i]);
            }
            break;
        }
        case ColType::DOUBLE: {
            result = PROTECT(Rf_allocVector(REALSXP, n));
            double* out = REAL(result);
            for (R_xlen_t i = 0; i < n; i++) {
                out[i] = to_double(cells_[i]);
            }
            break;
        }
        case ColType::STRING: {
            result = PROTECT(Rf_allocVector(STRSXP, n));
            for (R_xlen_t i = 0; i < n; i++) {
                if (cells_[i].is_null()) {
                    SET_STRING_ELT(result, i, NA_STRING);
                } else {
                    SET_STRING_ELT(result, i,
                        Rf_mkCharCE(render_value(cells_[i]).c_str(), CE_UTF8));
                }
            }
            break;
        }
        default:
            return R_NilValue;
    }

    UNPROTECT(1);
    return result;
}

// DataFrameBuilder implementation
void DataFrameBuilder::expand_columns(size_t n_fields, size_t nrow_so_far) {
    size_t before = columns_.size();
    for (size_t i = before; i < n_fields; i++) {
        ColBuilder col("V" + std::to_string(i + 1), nrow_so_far + 1);
        // Backfill with NA
        for (size_t r = 0; r < nrow_so_far; r++) {
            col.append_null();
        }
        columns_.push_back(std::move(col));
    }
    warnings_.push_back(Warning("column_expanded",
        "Row " + std::to_string(nrow_so_far + 1) + " has " + std::to_string(n_fields) +
        " fields; schema expanded from " + std::to_string(before) + " to " +
        std::to_string(n_fields) + " columns."));
}

SEXP DataFrameBuilder::build(const Document& doc) {
    columns_.clear();
    warnings_.clear();

    for (const auto& name : doc.columns) {
        columns_.emplace_back(name, doc.rows.size());
    }

    for (size_t r = 0; r < doc.rows.size(); r++) {
        const Row& row = doc.rows[r];
        if (row.size() > columns_.size()) {
            expand_columns(row.size(), r);
        }
        for (size_t i = 0; i < columns_.size(); i++) {
            if (i < row.size()) {
                columns_[i].append(row[i]);
            } else {
                columns_[i].append_null();
            }
        }
    }

    SEXP df = PROTECT(build_dataframe(columns_, doc.rows.size()));

    if (doc.table_name) {
        SEXP name = PROTECT(Rf_allocVector(STRSXP, 1));
        SET_STRING_ELT(name, 0, Rf_mkCharCE(doc.table_name->c_str(), CE_UTF8));
        Rf_setAttrib(df, Rf_install(kTableNameAttr), name);
        UNPROTECT(1);
    }

    UNPROTECT(1);
    return df;
}

SEXP build_dataframe(const std::vector<ColBuilder>& columns, size_t nrow) {
    size_t ncol = columns.size();

    SEXP df = PROTECT(Rf_allocVector(VECSXP, ncol));
    SEXP names = PROTECT(Rf_allocVector(STRSXP, ncol));

    for (size_t i = 0; i < ncol; i++) {
        SET_VECTOR_ELT(df, i, columns[i].finalize());
        SET_STRING_ELT(names, i, Rf_mkCharCE(columns[i].name().c_str(), CE_UTF8));
    }

    Rf_setAttrib(df, R_NamesSymbol, names);

    // Set row.names
    SEXP row_names = PROTECT(Rf_allocVector(INTSXP, 2));
    INTEGER(row_names)[0] = NA_INTEGER;
    INTEGER(row_names)[1] = -static_cast<int>(nrow);
    Rf_setAttrib(df, R_RowNamesSymbol, row_names);

    // Set class
    SEXP class_attr = PROTECT(Rf_allocVector(STRSXP, 1));
    SET_STRING_ELT(class_attr, 0, Rf_mkChar("data.frame"));
    Rf_setAttrib(df, R_ClassSymbol, class_attr);

    UNPROTECT(4);
    return df;
}

Document dataframe_to_document(SEXP df, const std::optional<std::string>& table_name) {
    if (TYPEOF(df) != VECSXP || !Rf_inherits(df, "data.frame")) {
        throw EncodeError(ErrorType::TYPE_ERROR, "Expected a data.frame");
    }

    Document doc;
    doc.table_name = table_name;

    const R_xlen_t ncol = Rf_xlength(df);
    const R_xlen_t nrow = dataframe_nrow(df);
    SEXP names = Rf_getAttrib(df, R_NamesSymbol);

    doc.rows.resize(static_cast<size_t>(nrow));
    for (auto& row : doc.rows) {
        row.reserve(static_cast<size_t>(ncol));
    }

    for (R_xlen_t j = 0; j < ncol; j++) {
        SEXP col = VECTOR_ELT(df, j);
        doc.columns.push_back(column_name(names, j));
        if (Rf_xlength(col) != nrow) {
            throw EncodeError(ErrorType::TYPE_ERROR,
                "Column '" + doc.columns.back() + "' is not a plain vector of " +
                std::to_string(nrow) + " rows");
        }
        append_column(doc, col, nrow);
    }

    return doc;
}

} // namespace toontab
