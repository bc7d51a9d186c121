#include "mrngen/mrn_error.hpp"

namespace mrngen {

ErrorClass error_class(MrnError e) {
    switch (e) {
        case MrnError::Ok:
            return ErrorClass::None;
        case MrnError::BadPayload:
            return ErrorClass::InvalidPayload;
        case MrnError::BadCountryCode:
        case MrnError::BadYear:
        case MrnError::BadDeclarationOffice:
        case MrnError::BadProcedureCategory:
        case MrnError::BadCombinedCategory:
        case MrnError::CombinedWithoutProcedure:
        case MrnError::BadCount:
        case MrnError::BadRequestLine:
            return ErrorClass::InvalidField;
    }
    return ErrorClass::InvalidPayload;
}

const char* reason(MrnError e) {
    switch (e) {
        case MrnError::Ok:                       return "ok";
        case MrnError::BadCountryCode:           return "bad_country_code";
        case MrnError::BadYear:                  return "bad_year";
        case MrnError::BadDeclarationOffice:     return "bad_declaration_office";
        case MrnError::BadProcedureCategory:     return "bad_procedure_category";
        case MrnError::BadCombinedCategory:      return "bad_combined_category";
        case MrnError::CombinedWithoutProcedure: return "combined_without_procedure";
        case MrnError::BadCount:                 return "bad_count";
        case MrnError::BadRequestLine:           return "bad_request_line";
        case MrnError::BadPayload:               return "bad_payload";
    }
    return "unknown";
}

} // namespace mrngen
