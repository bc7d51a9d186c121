// -----------------------------------------------------------------------------
// @file request_line.cpp
// @brief Request-line keys → GenerationRequest fields.
// -----------------------------------------------------------------------------
#include "mrngen/request_line.hpp"
#include "mrngen/arg_parser.hpp"
#include "mrngen/field_composer.hpp"

namespace mrngen {

namespace {

enum class LineKey : uint8_t { Unknown, Country, Count, Procedure, Combined, Office };

LineKey key_of(const ArgParser::token_t& k) {
    if (k == "-c" || k == "--country-code")       return LineKey::Country;
    if (k == "-n" || k == "--number-of-mrns")     return LineKey::Count;
    if (k == "-p" || k == "--procedure-category") return LineKey::Procedure;
    if (k == "-C" || k == "--combined")           return LineKey::Combined;
    if (k == "-o" || k == "--declaration-office") return LineKey::Office;
    return LineKey::Unknown;
}

// Error for a key that appeared without a value.
MrnError missing_value_error(LineKey key) {
    switch (key) {
        case LineKey::Country:   return MrnError::BadCountryCode;
        case LineKey::Count:     return MrnError::BadCount;
        case LineKey::Procedure: return MrnError::BadProcedureCategory;
        case LineKey::Combined:  return MrnError::BadCombinedCategory;
        case LineKey::Office:    return MrnError::BadDeclarationOffice;
        case LineKey::Unknown:   break;
    }
    return MrnError::BadRequestLine;
}

} // namespace

void upper_ascii(FieldStr& s) {
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] >= 'a' && s[i] <= 'z') s[i] = static_cast<char>(s[i] - 'a' + 'A');
    }
}

bool parse_count(const char* text, uint32_t& out) {
    if (!text || *text == 0) return false;
    uint64_t v = 0;
    for (const char* p = text; *p; ++p) {
        if (*p < '0' || *p > '9') return false;
        v = v * 10 + static_cast<uint64_t>(*p - '0');
        if (v > 0xFFFFFFFFull) return false;
    }
    if (v == 0) return false;
    out = static_cast<uint32_t>(v);
    return true;
}

bool is_skippable_line(const char* line) {
    if (!line) return true;
    const char* p = line;
    while (*p == ' ' || *p == '\t' || *p == '\r' || *p == '\n') ++p;
    return *p == 0 || *p == '#';
}

MrnError parse_request_line(const char* line, const GenerationRequest& base,
                            GenerationRequest& out, uint32_t& count) {
    ArgParser args(line);
    if (args.overflowed() || args.stray()) return MrnError::BadRequestLine;

    // Keys with no value: known ones are field errors, anything else is unknown.
    if (!args.flags().empty()) return missing_value_error(key_of(args.flags()[0]));

    out = base;
    count = 1;

    // A short key and its long form set the same field; giving both is a conflict.
    uint8_t seen = 0;
    for (auto it = args.arguments().begin(); it != args.arguments().end(); ++it) {
        const LineKey key = key_of(it->first);
        const uint8_t bit = static_cast<uint8_t>(1u << static_cast<uint8_t>(key));
        if (key != LineKey::Unknown && (seen & bit)) return MrnError::BadRequestLine;
        seen = static_cast<uint8_t>(seen | bit);

        // Values past FIELD_MAX are cut, but what is left is still too long to validate.
        FieldStr value(it->second.c_str());
        switch (key) {
            case LineKey::Country:
                upper_ascii(value);
                out.country_code = value;
                break;
            case LineKey::Count:
                if (!parse_count(it->second.c_str(), count)) return MrnError::BadCount;
                break;
            case LineKey::Procedure:
                upper_ascii(value);
                out.procedure_category = value;
                break;
            case LineKey::Combined:
                upper_ascii(value);
                out.combined_category = value;
                break;
            case LineKey::Office:
                out.declaration_office = value;
                break;
            case LineKey::Unknown:
                return MrnError::BadRequestLine;
        }
    }

    return validate_request(out);
}

} // namespace mrngen
