/**
 * @file checksum.hpp
 * @brief MRN check character engine.
 *
 * The check character makes an MRN self-validating: it is a pure function of
 * the 17-character payload, so recomputing it from the first 17 characters of
 * any MRN must reproduce the 18th.
 *
 * @section mrngen_checksum_mod37 Scheme `Mod37` (default)
 *
 * ISO 7064 style pure system over the 36-character alphabet:
 *
 * | Character | Value  |
 * |-----------|--------|
 * | `0`-`9`   | 0-9    |
 * | `A`-`Z`   | 10-35  |
 *
 * The payload is read as a base-36 numeral, most significant character first,
 * and reduced modulo 37 one character at a time:
 *
 * @code
 *   r = 0
 *   for c in payload: r = (r * 36 + value(c)) % 37
 * @endcode
 *
 * A 17-digit base-36 numeral does not fit in 64 bits, so the running remainder
 * is the only way to evaluate it. The remainder maps back through the same
 * table; remainder 36 has no character and is written as the sentinel `0`.
 *
 * @section mrngen_checksum_iso6346 Scheme `Iso6346`
 *
 * The weighted scheme used by the customs systems themselves (and by ISO 6346
 * container codes). Letters skip every multiple of 11:
 *
 * | Letters   | Values |
 * |-----------|--------|
 * | `A`       | 10     |
 * | `B`-`K`   | 12-21  |
 * | `L`-`U`   | 23-32  |
 * | `V`-`Z`   | 34-38  |
 *
 * Each value is weighted by `2^i` (i = 0-based position), the products are
 * summed, and the check digit is `(sum % 11) % 10`.
 */

#ifndef MRNGEN_CHECKSUM_HPP
#define MRNGEN_CHECKSUM_HPP

#include "mrngen/mrn_types.hpp"
#include "mrngen/mrn_error.hpp"

namespace mrngen {

enum class CheckScheme : uint8_t { Mod37 = 0, Iso6346 = 1 };

/// Check character emitted when the mod-37 remainder is 36.
static constexpr char MOD37_SENTINEL = '0';

/**
 * @brief Base-36 value of a payload character.
 * @return 0-35, or -1 if `c` is not in `{0-9, A-Z}`.
 */
int8_t character_value(char c);

/**
 * @brief Inverse of character_value() for 0-35; 36 yields MOD37_SENTINEL.
 * @return The character, or 0 (NUL) for values above 36.
 */
char value_character(uint8_t v);

/**
 * @brief ISO 6346 value of a payload character (letters skip multiples of 11).
 * @return 0-38, or -1 if `c` is not in `{0-9, A-Z}`.
 */
int8_t iso6346_value(char c);

/**
 * @brief Running mod-37 remainder of a payload read as a base-36 numeral.
 * @param payload Exactly 17 characters over `{0-9, A-Z}`.
 * @param out     Remainder 0-36 on success.
 */
MrnError mod37_remainder(const PayloadStr& payload, uint8_t& out);

/**
 * @brief Compute the check character with the default (mod-37) scheme.
 * @param payload Exactly 17 characters over `{0-9, A-Z}`.
 * @param out     Receives the check character on success.
 * @return MrnError::Ok or MrnError::BadPayload.
 */
MrnError check_character(const PayloadStr& payload, char& out);

/**
 * @brief Compute the check character with an explicit scheme.
 */
MrnError check_character(const PayloadStr& payload, CheckScheme scheme, char& out);

/**
 * @brief Append the check character to a payload.
 * @param payload 17-character payload.
 * @param scheme  Check scheme.
 * @param out     Receives the 18-character MRN; cleared on failure.
 */
MrnError complete(const PayloadStr& payload, CheckScheme scheme, MrnStr& out);

/// @brief "mod37" / "iso6346".
const char* scheme_name(CheckScheme scheme);

/**
 * @brief Parse a scheme name (exact, lowercase).
 * @return true and sets `out` if `name` is "mod37" or "iso6346".
 */
bool scheme_from_name(const char* name, CheckScheme& out);

} // namespace mrngen

#endif // MRNGEN_CHECKSUM_HPP
