#include "toon_encoder.h"
#include "toon_errors.h"
#include "toon_infer.h"
#include <cctype>

namespace toontab {

Encoder::Encoder(const EncodeOptions& opts) : opts_(opts) {}

bool Encoder::needs_quotes(std::string_view s) const {
    if (s.empty()) {
        return true;
    }
    if (std::isspace(static_cast<unsigned char>(s.front())) ||
        std::isspace(static_cast<unsigned char>(s.back()))) {
        return true;
    }
    for (char c : s) {
        if (c == opts_.delimiter || c == '"' || static_cast<unsigned char>(c) < 0x20) {
            return true;
        }
    }
    // Would read back as null, bool or a number
    return infer_value(s).kind() != ValueKind::V_STRING;
}

void Encoder::encode_string(const std::string& s) {
    if (opts_.quote_strings && needs_quotes(s)) {
        buf_.append_escaped_string(s);
    } else {
        buf_.append(s);
    }
}

void Encoder::encode_value(const Value& v) {
    switch (v.kind()) {
        case ValueKind::V_NULL:
        case ValueKind::V_BOOL:
        case ValueKind::V_INT:
        case ValueKind::V_DOUBLE:
            buf_.append(render_value(v));
            break;
        case ValueKind::V_STRING:
            encode_string(v.string_val());
            break;
    }
}

void Encoder::encode_row(const Row& row, size_t row_index, size_t ncol) {
    if (opts_.strict && row.size() != ncol) {
        throw EncodeError(ErrorType::ARITY_MISMATCH,
            "Row " + std::to_string(row_index) + " has " + std::to_string(row.size()) +
            " values but the header has " + std::to_string(ncol) + " columns");
    }

    for (size_t i = 0; i < row.size(); i++) {
        if (i > 0) buf_.append_char(opts_.delimiter);
        encode_value(row[i]);
    }
}

void Encoder::encode_document(const Document& doc) {
    if (doc.table_name && !doc.table_name->empty()) {
        buf_.append_char(opts_.name_marker);
        buf_.append(*doc.table_name);
        buf_.append_char('\n');
    }

    // The header line may be empty, the separator always follows it
    buf_.append_joined(doc.columns, opts_.delimiter);
    buf_.append_char('\n');
    buf_.append(opts_.separator);

    for (size_t r = 0; r < doc.rows.size(); r++) {
        buf_.start_line();
        encode_row(doc.rows[r], r, doc.columns.size());
    }
}

std::string Encoder::encode(const Document& doc) {
    buf_.clear();
    encode_document(doc);
    return buf_.str();
}

void Encoder::encode_to_file(const Document& doc, const std::string& filepath) {
    buf_.clear();
    encode_document(doc);
    if (!buf_.write_to_file(filepath)) {
        throw EncodeError(ErrorType::IO_ERROR, "Cannot write file: " + filepath);
    }
}

std::string serialize(const Document& doc) {
    Encoder encoder;
    return encoder.encode(doc);
}

} // namespace toontab
