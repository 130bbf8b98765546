#include "toontab.h"
#include "toon_parser.h"
#include "toon_encoder.h"
#include "toon_errors.h"

#include <optional>
#include <stdexcept>
#include <string>

using namespace toontab;

namespace {

ParseOptions parse_options(SEXP ragged_rows, SEXP quoted_fields) {
    ParseOptions opts;
    std::string mode(CHAR(STRING_ELT(ragged_rows, 0)));
    if (mode != "keep_warn" && mode != "error") {
        throw std::invalid_argument(
            "ragged_rows must be \"keep_warn\" or \"error\", not \"" + mode + "\"");
    }
    opts.ragged_rows = mode;
    opts.quoted_fields = Rf_asLogical(quoted_fields) == TRUE;
    return opts;
}

EncodeOptions encode_options(SEXP quote_strings) {
    EncodeOptions opts;
    opts.quote_strings = Rf_asLogical(quote_strings) == TRUE;
    return opts;
}

// NULL or NA -> no table name
std::optional<std::string> optional_string(SEXP x) {
    if (x == R_NilValue || Rf_xlength(x) == 0 || STRING_ELT(x, 0) == NA_STRING) {
        return std::nullopt;
    }
    return std::string(Rf_translateCharUTF8(STRING_ELT(x, 0)));
}

// Helper to emit warnings from parser and converter
void emit_warnings(const std::vector<Warning>& warnings) {
    for (const auto& w : warnings) {
        Rf_warning("%s", w.message.c_str());
    }
}

SEXP document_to_sexp(const Document& doc, const std::vector<Warning>& parse_warnings) {
    DataFrameBuilder builder;
    SEXP df = PROTECT(builder.build(doc));
    emit_warnings(parse_warnings);
    emit_warnings(builder.warnings());
    UNPROTECT(1);
    return df;
}

SEXP make_string(const std::string& s) {
    SEXP out = PROTECT(Rf_allocVector(STRSXP, 1));
    SET_STRING_ELT(out, 0, s.empty() ? NA_STRING : Rf_mkCharCE(s.c_str(), CE_UTF8));
    UNPROTECT(1);
    return out;
}

const R_CallMethodDef kCallMethods[] = {
    {"C_from_toon",     (DL_FUNC) &C_from_toon,     3},
    {"C_read_toon",     (DL_FUNC) &C_read_toon,     3},
    {"C_to_toon",       (DL_FUNC) &C_to_toon,       3},
    {"C_write_toon",    (DL_FUNC) &C_write_toon,    4},
    {"C_validate_toon", (DL_FUNC) &C_validate_toon, 2},
    {NULL, NULL, 0}
};

} // namespace

const R_CallMethodDef* toontab::call_methods() {
    return kCallMethods;
}

extern "C" {

// Parse TOON string to data.frame
SEXP C_from_toon(SEXP text, SEXP ragged_rows, SEXP quoted_fields) {
    try {
        Parser parser(parse_options(ragged_rows, quoted_fields));

        const char* data = CHAR(STRING_ELT(text, 0));
        Document doc = parser.parse_string(data);

        return document_to_sexp(doc, parser.warnings());
    } catch (const ParseError& e) {
        Rf_error("%s", e.formatted_message().c_str());
    } catch (const std::exception& e) {
        Rf_error("Error parsing TOON: %s", e.what());
    }

    return R_NilValue;
}

// Read TOON file to data.frame
SEXP C_read_toon(SEXP file, SEXP ragged_rows, SEXP quoted_fields) {
    try {
        Parser parser(parse_options(ragged_rows, quoted_fields));
        std::string filepath(R_ExpandFileName(Rf_translateChar(STRING_ELT(file, 0))));

        Document doc = parser.parse_file(filepath);

        return document_to_sexp(doc, parser.warnings());
    } catch (const ParseError& e) {
        Rf_error("%s", e.formatted_message().c_str());
    } catch (const std::exception& e) {
        Rf_error("Error reading TOON file: %s", e.what());
    }

    return R_NilValue;
}

// Encode data.frame to TOON string
SEXP C_to_toon(SEXP df, SEXP table_name, SEXP quote_strings) {
    try {
        Document doc = dataframe_to_document(df, optional_string(table_name));

        Encoder encoder(encode_options(quote_strings));
        std::string result = encoder.encode(doc);

        SEXP out = PROTECT(Rf_allocVector(STRSXP, 1));
        SET_STRING_ELT(out, 0, Rf_mkCharCE(result.c_str(), CE_UTF8));

        // Set class
        SEXP class_attr = PROTECT(Rf_allocVector(STRSXP, 1));
        SET_STRING_ELT(class_attr, 0, Rf_mkChar("toon"));
        Rf_setAttrib(out, R_ClassSymbol, class_attr);

        UNPROTECT(2);
        return out;
    } catch (const std::exception& e) {
        Rf_error("Error encoding to TOON: %s", e.what());
    }

    return R_NilValue;
}

// Encode data.frame and write it to a .toon file
SEXP C_write_toon(SEXP df, SEXP file, SEXP table_name, SEXP quote_strings) {
    try {
        Document doc = dataframe_to_document(df, optional_string(table_name));
        std::string filepath(R_ExpandFileName(Rf_translateChar(STRING_ELT(file, 0))));

        Encoder encoder(encode_options(quote_strings));
        encoder.encode_to_file(doc, filepath);

        return R_NilValue;
    } catch (const std::exception& e) {
        Rf_error("Error writing TOON file: %s", e.what());
    }

    return R_NilValue;
}

// Validate TOON text or file
SEXP C_validate_toon(SEXP x, SEXP is_file) {
    Parser parser;
    ValidationResult vr;

    if (Rf_asLogical(is_file) == TRUE) {
        std::string filepath(R_ExpandFileName(Rf_translateChar(STRING_ELT(x, 0))));
        vr = parser.validate_file(filepath);
    } else {
        const char* text = CHAR(STRING_ELT(x, 0));
        vr = parser.validate_string(text);
    }

    SEXP result = PROTECT(Rf_allocVector(LGLSXP, 1));
    LOGICAL(result)[0] = vr.valid ? TRUE : FALSE;

    if (!vr.valid) {
        // Attach error info
        SEXP error_info = PROTECT(Rf_allocVector(VECSXP, 4));
        SEXP error_names = PROTECT(Rf_allocVector(STRSXP, 4));

        SET_STRING_ELT(error_names, 0, Rf_mkChar("type"));
        SET_STRING_ELT(error_names, 1, Rf_mkChar("message"));
        SET_STRING_ELT(error_names, 2, Rf_mkChar("line"));
        SET_STRING_ELT(error_names, 3, Rf_mkChar("file"));

        SET_VECTOR_ELT(error_info, 0, make_string(error_type_name(vr.error_type)));
        SET_VECTOR_ELT(error_info, 1, make_string(vr.message));

        SEXP line_int = PROTECT(Rf_allocVector(INTSXP, 1));
        INTEGER(line_int)[0] = vr.line > 0 ? static_cast<int>(vr.line) : NA_INTEGER;
        SET_VECTOR_ELT(error_info, 2, line_int);

        SET_VECTOR_ELT(error_info, 3, make_string(vr.file));

        Rf_setAttrib(error_info, R_NamesSymbol, error_names);
        Rf_setAttrib(result, Rf_install("error"), error_info);

        UNPROTECT(4);
    } else {
        UNPROTECT(1);
    }

    return result;
}

// Called by R when the shared library is loaded
void R_init_toontab(DllInfo* dll) {
    R_registerRoutines(dll, NULL, kCallMethods, NULL, NULL);
    R_useDynamicSymbols(dll, FALSE);
    R_forceSymbols(dll, TRUE);
}

} // extern "C"
