// -----------------------------------------------------------------------------
// @file field_composer.cpp
// @brief Request validation and payload assembly.
//
// All routines are heap-free; strings are fixed-capacity ETL strings.
// -----------------------------------------------------------------------------
#include "mrngen/field_composer.hpp"

namespace mrngen {

// =============================================================================
// Field rules
// =============================================================================

static bool all_digits(const FieldStr& s) {
    for (size_t i = 0; i < s.size(); ++i) {
        if (!is_digit_char(s[i])) return false;
    }
    return true;
}

bool valid_country_code(const FieldStr& s) {
    return s.size() == COUNTRY_LEN && is_upper_char(s[0]) && is_upper_char(s[1]);
}

bool valid_year(const FieldStr& s) {
    return s.size() == YEAR_LEN && all_digits(s);
}

bool valid_declaration_office(const FieldStr& s) {
    return s.size() == OFFICE_LEN && all_digits(s);
}

bool valid_procedure_category(const FieldStr& s) {
    return s.size() == CATEGORY_LEN && is_upper_char(s[0]) && is_mrn_char(s[1]);
}

bool valid_combined_category(const FieldStr& s) {
    return s.size() == 1 && is_upper_char(s[0]);
}

MrnError validate_request(const GenerationRequest& req) {
    if (!valid_year(req.year))                 return MrnError::BadYear;
    if (!valid_country_code(req.country_code)) return MrnError::BadCountryCode;

    if (req.declaration_office && !valid_declaration_office(*req.declaration_office)) {
        return MrnError::BadDeclarationOffice;
    }
    if (req.procedure_category && !valid_procedure_category(*req.procedure_category)) {
        return MrnError::BadProcedureCategory;
    }
    if (req.combined_category) {
        if (!valid_combined_category(*req.combined_category)) return MrnError::BadCombinedCategory;
        if (!req.procedure_category)                          return MrnError::CombinedWithoutProcedure;
    }
    return MrnError::Ok;
}

// =============================================================================
// Composition
// =============================================================================

static char random_digit(IRandomSource& rng) {
    return static_cast<char>('0' + rng.uniform(10));
}

static char random_alnum(IRandomSource& rng) {
    return MRN_ALPHABET[rng.uniform(MRN_ALPHABET_SIZE)];
}

MrnError compose(const GenerationRequest& req, IRandomSource& rng, PayloadStr& out) {
    out.clear();

    // Fail fast: nothing below may run for a bad request.
    MrnError err = validate_request(req);
    if (err != MrnError::Ok) return err;

    // Positions 0-3: year + country
    out.append(req.year);
    out.append(req.country_code);

    // Positions 4-9: office, verbatim or fully random
    if (req.declaration_office) {
        out.append(*req.declaration_office);
    } else {
        for (size_t i = 0; i < OFFICE_LEN; ++i) out.push_back(random_digit(rng));
    }

    // Positions 10-14: reference
    for (size_t i = 0; i < REFERENCE_LEN; ++i) out.push_back(random_alnum(rng));

    // Positions 15-16: category slot
    if (req.procedure_category) {
        const FieldStr& proc = *req.procedure_category;
        out.push_back(proc[0]);
        out.push_back(req.combined_category ? (*req.combined_category)[0] : proc[1]);
    } else {
        out.push_back(random_alnum(rng));
        out.push_back(random_alnum(rng));
    }

    if (out.size() != PAYLOAD_LEN) {
        out.clear();
        return MrnError::BadPayload;
    }
    return MrnError::Ok;
}

} // namespace mrngen
