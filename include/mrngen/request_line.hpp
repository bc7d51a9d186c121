/**
 * @file request_line.hpp
 * @brief Map a `-key value` request line onto a GenerationRequest.
 *
 * Recognized keys (short and long forms are equivalent):
 *
 * | Short | Long                     | Field                     |
 * |-------|--------------------------|---------------------------|
 * | `-c`  | `--country-code`         | country_code              |
 * | `-n`  | `--number-of-mrns`       | count (default 1)         |
 * | `-p`  | `--procedure-category`   | procedure_category        |
 * | `-C`  | `--combined`             | combined_category         |
 * | `-o`  | `--declaration-office`   | declaration_office        |
 *
 * Letter fields are uppercased before validation, matching the command line.
 * Fields the line leaves out keep the value from the `base` request, which is
 * how config-file defaults reach batch lines.
 */

#ifndef MRNGEN_REQUEST_LINE_HPP
#define MRNGEN_REQUEST_LINE_HPP

#include "mrngen/mrn_types.hpp"
#include "mrngen/mrn_error.hpp"

namespace mrngen {

/// @brief Uppercase ASCII letters in place; other characters are left alone.
void upper_ascii(FieldStr& s);

/**
 * @brief Parse a positive decimal count ("1".."4294967295").
 * @return false for empty input, non-digits, zero, or overflow.
 */
bool parse_count(const char* text, uint32_t& out);

/**
 * @brief true if the line is blank or a `#` comment.
 */
bool is_skippable_line(const char* line);

/**
 * @brief Parse one request line.
 * @param line   NUL-terminated text, e.g. "-c dk -n 3 -o 004700".
 * @param base   Starting values (year and defaults); copied into `out` first.
 * @param out    Receives the merged request; fully validated on success.
 * @param count  Receives the number of MRNs requested (1 if `-n` is absent).
 * @return MrnError::Ok, a field error, MrnError::BadCount, or
 *         MrnError::BadRequestLine for unknown keys, stray tokens, overflow,
 *         or a field given by both its short and long key (`-c DK --country-code SE`).
 *
 * The same key written twice keeps its last value (ArgParser rule).
 */
MrnError parse_request_line(const char* line, const GenerationRequest& base,
                            GenerationRequest& out, uint32_t& count);

} // namespace mrngen

#endif // MRNGEN_REQUEST_LINE_HPP
