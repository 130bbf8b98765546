#ifndef TOONTAB_H
#define TOONTAB_H

#include "toon_df.h"
#include <R_ext/Rdynload.h>

namespace toontab {

// .Call routine table registered by R_init_toontab, NULL-terminated
const R_CallMethodDef* call_methods();

} // namespace toontab

extern "C" {

SEXP C_from_toon(SEXP text, SEXP ragged_rows, SEXP quoted_fields);
SEXP C_read_toon(SEXP file, SEXP ragged_rows, SEXP quoted_fields);
SEXP C_to_toon(SEXP df, SEXP table_name, SEXP quote_strings);
SEXP C_write_toon(SEXP df, SEXP file, SEXP table_name, SEXP quote_strings);
SEXP C_validate_toon(SEXP x, SEXP is_file);

void R_init_toontab(DllInfo* dll);

} // extern "C"

#endif // TOONTAB_H
