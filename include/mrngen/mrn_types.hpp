/**
 * @file mrn_types.hpp
 * @brief mrngen data model: request fields, payload layout and fixed-capacity strings.
 *
 * This header defines the small set of types shared by every layer of mrngen:
 *
 *  - `GenerationRequest` : the input for exactly one MRN (country, year and the
 *                          optional office / procedure / combined fields).
 *  - `PayloadStr`        : the 17-character unchecked payload.
 *  - `MrnStr`            : the completed 18-character MRN.
 *
 * ## Payload layout
 *
 * | Pos   | Len | Field              | Source                                  |
 * |-------|-----|--------------------|-----------------------------------------|
 * | 0-1   | 2   | Year               | request (derived from the clock)        |
 * | 2-3   | 2   | Country code       | request                                 |
 * | 4-9   | 6   | Declaration office | request, or 6 random digits             |
 * | 10-14 | 5   | Reference          | always random `{0-9, A-Z}`              |
 * | 15-16 | 2   | Category slot      | procedure (+ combined), or random       |
 * | 17    | 1   | Check character    | checksum engine                         |
 *
 * ## Why fixed-capacity strings
 * The composer and checksum engine are heap-free (ETL only), so the same code
 * runs inside tests, the CLI and any embedded consumer. Field strings are wider
 * than the fields themselves: an over-long user value is kept long enough to be
 * rejected by validation instead of being silently truncated to a valid length.
 */

#ifndef MRNGEN_MRN_TYPES_HPP
#define MRNGEN_MRN_TYPES_HPP

#include "etl/string.h"
#include "etl/optional.h"
#include <stdint.h>
#include <stddef.h>

namespace mrngen {

// Field widths.
static constexpr size_t YEAR_LEN        = 2;
static constexpr size_t COUNTRY_LEN     = 2;
static constexpr size_t OFFICE_LEN      = 6;
static constexpr size_t REFERENCE_LEN   = 5;
static constexpr size_t CATEGORY_LEN    = 2;
static constexpr size_t PAYLOAD_LEN     = 17;
static constexpr size_t MRN_LEN         = PAYLOAD_LEN + 1;

// Field offsets inside the payload.
static constexpr size_t YEAR_POS        = 0;
static constexpr size_t COUNTRY_POS     = YEAR_POS + YEAR_LEN;
static constexpr size_t OFFICE_POS      = COUNTRY_POS + COUNTRY_LEN;
static constexpr size_t REFERENCE_POS   = OFFICE_POS + OFFICE_LEN;
static constexpr size_t CATEGORY_POS    = REFERENCE_POS + REFERENCE_LEN;

static_assert(CATEGORY_POS + CATEGORY_LEN == PAYLOAD_LEN, "payload layout must cover 17 characters");

/// Capacity of a raw request field; wide enough to detect over-long input.
static constexpr size_t FIELD_MAX       = 16;

/// Raw request field as supplied by the caller (not yet validated).
using FieldStr   = etl::string<FIELD_MAX>;

/// 17-character unchecked payload.
using PayloadStr = etl::string<PAYLOAD_LEN>;

/// Completed 18-character MRN (payload + check character).
using MrnStr     = etl::string<MRN_LEN>;

/// Alphabet every payload character is drawn from; index == character value.
static constexpr const char* MRN_ALPHABET = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ";
static constexpr uint8_t     MRN_ALPHABET_SIZE = 36;

/**
 * @brief Input for exactly one generated MRN.
 *
 * `country_code` and `year` are always set by the caller. The three optional
 * fields are absent when they have no value; an engaged but empty value is a
 * field error, not an absent one.
 *
 * Validation happens in `validate_request()` (field_composer.hpp); this struct
 * itself does not enforce anything.
 */
struct GenerationRequest {
    FieldStr year;                                   ///< "24" for 2024
    FieldStr country_code;                           ///< ISO 3166-1 alpha-2, uppercase
    etl::optional<FieldStr> declaration_office;      ///< 6 digits
    etl::optional<FieldStr> procedure_category;      ///< letter + alphanumeric, e.g. "B1"
    etl::optional<FieldStr> combined_category;       ///< single letter, needs procedure_category
};

/// @brief true for `0`-`9` and `A`-`Z` (uppercase only).
inline bool is_mrn_char(char c) {
    return (c >= '0' && c <= '9') || (c >= 'A' && c <= 'Z');
}

/// @brief true for `0`-`9`.
inline bool is_digit_char(char c) { return c >= '0' && c <= '9'; }

/// @brief true for `A`-`Z`.
inline bool is_upper_char(char c) { return c >= 'A' && c <= 'Z'; }

} // namespace mrngen

#endif // MRNGEN_MRN_TYPES_HPP
