#ifndef TOONTAB_DF_H
#define TOONTAB_DF_H

#include <string>
#include <vector>
#include <optional>
#include <cstddef>
#include "toon_errors.h"
#include "toon_value.h"

#include <R.h>
#include <Rinternals.h>
#ifdef error
#undef error
#endif
#ifdef length
#undef length
#endif
#ifdef Realloc
#undef Realloc
#endif
#ifdef Free
#undef Free
#endif

namespace toontab {

// Column type for tabular data, ordered narrowest to widest
enum class ColType {
    UNKNOWN,
    LOGICAL,
    INTEGER,
    DOUBLE,
    STRING
};

// Attribute holding the table name on a data.frame built from a document
constexpr const char* kTableNameAttr = "toon_table_name";

// Collects one column of cells and settles on the narrowest R vector type
// able to hold all of them.
class ColBuilder {
public:
    explicit ColBuilder(const std::string& name, size_t initial_capacity = 0);

    const std::string& name() const { return name_; }
    ColType type() const { return type_; }
    size_t size() const { return cells_.size(); }

    void append(const Value& v);
    void append_null();

    // Create R vector
    SEXP finalize() const;

private:
    void promote_to(ColType t);

    std::string name_;
    ColType type_ = ColType::UNKNOWN;
    std::vector<Value> cells_;
};

// Document -> data.frame
class DataFrameBuilder {
public:
    SEXP build(const Document& doc);

    const std::vector<Warning>& warnings() const { return warnings_; }

private:
    void expand_columns(size_t n_fields, size_t nrow_so_far);

    std::vector<ColBuilder> columns_;
    std::vector<Warning> warnings_;
};

// Build data.frame from column builders
SEXP build_dataframe(const std::vector<ColBuilder>& columns, size_t nrow);

// data.frame -> Document.  Throws EncodeError(TYPE_ERROR) for column types
// with no TOON counterpart.
Document dataframe_to_document(SEXP df, const std::optional<std::string>& table_name);

} // namespace toontab

#endif // TOONTAB_DF_H
