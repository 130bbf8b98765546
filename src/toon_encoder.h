#ifndef TOONTAB_ENCODER_H
#define TOONTAB_ENCODER_H

#include <string>
#include <string_view>
#include "toon_io.h"
#include "toon_value.h"

namespace toontab {

// Encoder options
struct EncodeOptions {
    char delimiter = '|';
    char name_marker = '@';
    std::string separator = "---";
    bool quote_strings = false;  // Quote strings that would not read back verbatim
    bool strict = true;          // Reject rows whose width differs from the header
};

// Encoder class
class Encoder {
public:
    explicit Encoder(const EncodeOptions& opts = EncodeOptions());

    // Encode document to TOON string
    std::string encode(const Document& doc);

    // Encode document and write it to a file
    void encode_to_file(const Document& doc, const std::string& filepath);

private:
    void encode_document(const Document& doc);
    void encode_row(const Row& row, size_t row_index, size_t ncol);
    void encode_value(const Value& v);
    void encode_string(const std::string& s);

    bool needs_quotes(std::string_view s) const;

    EncodeOptions opts_;
    WriteBuffer buf_;
};

// Encode with default options
std::string serialize(const Document& doc);

} // namespace toontab

#endif // TOONTAB_ENCODER_H
