/**
 * @file mrn_error.hpp
 * @brief Error codes shared by the composer, the checksum engine and the request parser.
 *
 * The core never throws. Every fallible operation returns an `MrnError`, and
 * callers branch on `error_class()`:
 *
 * | Class            | Meaning                                   | CLI exit |
 * |------------------|-------------------------------------------|----------|
 * | `InvalidField`   | a supplied field failed its format rule   | 2        |
 * | `InvalidPayload` | composer produced a bad payload (a bug)   | 1        |
 *
 * `reason()` returns a stable lowercase token ("bad_country_code", ...) so
 * scripts can match on `status=error reason=<token>` without parsing prose.
 */

#ifndef MRNGEN_MRN_ERROR_HPP
#define MRNGEN_MRN_ERROR_HPP

#include <stdint.h>

namespace mrngen {

enum class MrnError : uint8_t {
    Ok = 0,
    BadCountryCode,
    BadYear,
    BadDeclarationOffice,
    BadProcedureCategory,
    BadCombinedCategory,
    CombinedWithoutProcedure,
    BadCount,
    BadRequestLine,
    BadPayload
};

enum class ErrorClass : uint8_t { None = 0, InvalidField, InvalidPayload };

/// @brief Classify an error as a user field error or an internal payload fault.
ErrorClass error_class(MrnError e);

/// @brief Stable reason token for `status=error reason=...` lines. "ok" for MrnError::Ok.
const char* reason(MrnError e);

} // namespace mrngen

#endif // MRNGEN_MRN_ERROR_HPP
