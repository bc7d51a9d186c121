// -----------------------------------------------------------------------------
// @file checksum.cpp
// @brief Check character computation for both supported schemes.
//
// Both schemes validate the whole payload before producing anything, so an
// out-of-alphabet character can never leak into a partial result.
// -----------------------------------------------------------------------------
#include "mrngen/checksum.hpp"

#include <string.h>

namespace mrngen {

static constexpr uint8_t MOD37 = 37;
static constexpr uint8_t ISO6346_MOD = 11;

// =============================================================================
// Character tables
// =============================================================================

int8_t character_value(char c) {
    // '0'..'9' -> 0..9
    if (c >= '0' && c <= '9') return static_cast<int8_t>(c - '0');
    // 'A'..'Z' -> 10..35
    if (c >= 'A' && c <= 'Z') return static_cast<int8_t>(c - 'A' + 10);
    return -1;
}

char value_character(uint8_t v) {
    if (v < MRN_ALPHABET_SIZE) return MRN_ALPHABET[v];
    if (v == MRN_ALPHABET_SIZE) return MOD37_SENTINEL;
    return 0;
}

int8_t iso6346_value(char c) {
    if (c >= '0' && c <= '9') return static_cast<int8_t>(c - '0');
    if (c == 'A')             return 10;
    if (c >= 'B' && c <= 'K') return static_cast<int8_t>(c - 'B' + 12);
    if (c >= 'L' && c <= 'U') return static_cast<int8_t>(c - 'L' + 23);
    if (c >= 'V' && c <= 'Z') return static_cast<int8_t>(c - 'V' + 34);
    return -1;
}

// =============================================================================
// Schemes
// =============================================================================

MrnError mod37_remainder(const PayloadStr& payload, uint8_t& out) {
    if (payload.size() != PAYLOAD_LEN) return MrnError::BadPayload;

    uint32_t r = 0;
    for (size_t i = 0; i < payload.size(); ++i) {
        int8_t v = character_value(payload[i]);
        if (v < 0) return MrnError::BadPayload;
        r = (r * MRN_ALPHABET_SIZE + static_cast<uint32_t>(v)) % MOD37;
    }
    out = static_cast<uint8_t>(r);
    return MrnError::Ok;
}

static MrnError iso6346_digit(const PayloadStr& payload, char& out) {
    if (payload.size() != PAYLOAD_LEN) return MrnError::BadPayload;

    // 38 * (2^17 - 1) stays well inside 32 bits
    uint32_t sum = 0;
    for (size_t i = 0; i < payload.size(); ++i) {
        int8_t v = iso6346_value(payload[i]);
        if (v < 0) return MrnError::BadPayload;
        sum += static_cast<uint32_t>(v) << i;
    }
    out = static_cast<char>('0' + (sum % ISO6346_MOD) % 10);
    return MrnError::Ok;
}

MrnError check_character(const PayloadStr& payload, char& out) {
    return check_character(payload, CheckScheme::Mod37, out);
}

MrnError check_character(const PayloadStr& payload, CheckScheme scheme, char& out) {
    switch (scheme) {
        case CheckScheme::Mod37: {
            uint8_t r = 0;
            MrnError err = mod37_remainder(payload, r);
            if (err != MrnError::Ok) return err;
            out = value_character(r);
            return MrnError::Ok;
        }
        case CheckScheme::Iso6346:
            return iso6346_digit(payload, out);
    }
    return MrnError::BadPayload;
}

MrnError complete(const PayloadStr& payload, CheckScheme scheme, MrnStr& out) {
    out.clear();
    char check = 0;
    MrnError err = check_character(payload, scheme, check);
    if (err != MrnError::Ok) return err;
    out.append(payload);
    out.push_back(check);
    return MrnError::Ok;
}

// =============================================================================
// Names
// =============================================================================

const char* scheme_name(CheckScheme scheme) {
    switch (scheme) {
        case CheckScheme::Mod37:   return "mod37";
        case CheckScheme::Iso6346: return "iso6346";
    }
    return "unknown";
}

bool scheme_from_name(const char* name, CheckScheme& out) {
    if (!name) return false;
    if (strcmp(name, "mod37") == 0)   { out = CheckScheme::Mod37;   return true; }
    if (strcmp(name, "iso6346") == 0) { out = CheckScheme::Iso6346; return true; }
    return false;
}

} // namespace mrngen
