/**
 * @file field_composer.hpp
 * @brief Field validation and 17-character payload composition.
 *
 * Two steps, kept separate so each can be tested on its own:
 *
 *  1. `validate_request()` checks every supplied field. It is pure: no
 *     randomness, no output. The first failing field wins, checked in payload
 *     order (year, country, office, procedure, combined).
 *  2. `compose()` validates first and only then draws random filler, so a bad
 *     request never consumes entropy and never yields a partial payload.
 *
 * ### Random draws, in order
 * - 6 digits for the office block, only when no office was supplied
 * - 5 alphanumerics for the reference block, always
 * - 2 alphanumerics for the category slot, only when no procedure was supplied
 *
 * ### Category slot
 * @code
 *   procedure "B1"               -> "B1"
 *   procedure "B1" + combined "A" -> "BA"   (combined replaces the second character)
 *   no procedure                 -> two random alphanumerics
 * @endcode
 */

#ifndef MRNGEN_FIELD_COMPOSER_HPP
#define MRNGEN_FIELD_COMPOSER_HPP

#include "mrngen/mrn_types.hpp"
#include "mrngen/mrn_error.hpp"
#include "mrngen/random_source.hpp"

namespace mrngen {

/// @brief Exactly 2 uppercase letters.
bool valid_country_code(const FieldStr& s);

/// @brief Exactly 2 digits.
bool valid_year(const FieldStr& s);

/// @brief Exactly 6 digits.
bool valid_declaration_office(const FieldStr& s);

/// @brief One uppercase letter followed by one digit or uppercase letter.
bool valid_procedure_category(const FieldStr& s);

/// @brief Exactly 1 uppercase letter.
bool valid_combined_category(const FieldStr& s);

/**
 * @brief Check every field of a request without touching any random source.
 * @return MrnError::Ok, or the first field error found.
 */
MrnError validate_request(const GenerationRequest& req);

/**
 * @brief Build the unchecked payload for one MRN.
 * @param req  Request to compose from; validated before any random draw.
 * @param rng  Source for the random office digits, reference and category filler.
 * @param out  Receives exactly 17 characters on success; cleared on failure.
 * @return MrnError::Ok, a field error, or MrnError::BadPayload if the
 *         composed length is not 17 (an internal fault).
 */
MrnError compose(const GenerationRequest& req, IRandomSource& rng, PayloadStr& out);

} // namespace mrngen

#endif // MRNGEN_FIELD_COMPOSER_HPP
