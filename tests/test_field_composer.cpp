#include <doctest/doctest.h>
#include "mrngen/field_composer.hpp"
#include "sequence_random.hpp"

using namespace mrngen;

static GenerationRequest dk24() {
    GenerationRequest r;
    r.year = "24";
    r.country_code = "DK";
    return r;
}

TEST_CASE("field rules") {
    CHECK(valid_country_code("DK"));
    CHECK_FALSE(valid_country_code("dk"));
    CHECK_FALSE(valid_country_code("DNK"));
    CHECK_FALSE(valid_country_code("D1"));
    CHECK_FALSE(valid_country_code(""));

    CHECK(valid_year("24"));
    CHECK_FALSE(valid_year("2024"));
    CHECK_FALSE(valid_year("2A"));

    CHECK(valid_declaration_office("004700"));
    CHECK_FALSE(valid_declaration_office("00470"));
    CHECK_FALSE(valid_declaration_office("0047000"));
    CHECK_FALSE(valid_declaration_office("00470A"));

    CHECK(valid_procedure_category("B1"));
    CHECK(valid_procedure_category("AB"));
    CHECK_FALSE(valid_procedure_category("1B"));
    CHECK_FALSE(valid_procedure_category("B"));
    CHECK_FALSE(valid_procedure_category("B12"));
    CHECK_FALSE(valid_procedure_category("b1"));

    CHECK(valid_combined_category("A"));
    CHECK_FALSE(valid_combined_category("1"));
    CHECK_FALSE(valid_combined_category("AB"));
    CHECK_FALSE(valid_combined_category(""));
}

TEST_CASE("validate_request reports the first bad field") {
    GenerationRequest r = dk24();
    CHECK(validate_request(r) == MrnError::Ok);

    r.country_code = "DNK";
    CHECK(validate_request(r) == MrnError::BadCountryCode);

    r = dk24();
    r.declaration_office = FieldStr("12345");
    CHECK(validate_request(r) == MrnError::BadDeclarationOffice);

    r = dk24();
    r.declaration_office = FieldStr("");
    CHECK(validate_request(r) == MrnError::BadDeclarationOffice);

    r = dk24();
    r.procedure_category = FieldStr("11");
    CHECK(validate_request(r) == MrnError::BadProcedureCategory);

    r = dk24();
    r.procedure_category = FieldStr("B1");
    r.combined_category = FieldStr("7");
    CHECK(validate_request(r) == MrnError::BadCombinedCategory);

    r = dk24();
    r.combined_category = FieldStr("A");
    CHECK(validate_request(r) == MrnError::CombinedWithoutProcedure);
    CHECK(error_class(MrnError::CombinedWithoutProcedure) == ErrorClass::InvalidField);
}

TEST_CASE("compose with nothing optional draws 13 random characters") {
    // office digits: 0..5, reference: 6..10, category: 11, 12
    SequenceRandom rng{{0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12}};
    PayloadStr p;
    REQUIRE(compose(dk24(), rng, p) == MrnError::Ok);
    CHECK(p == "24DK0123456789ABC");
    CHECK(p.size() == PAYLOAD_LEN);
    CHECK(rng.calls == 13);
}

TEST_CASE("declaration office is copied verbatim into positions 4-9") {
    GenerationRequest r = dk24();
    r.declaration_office = FieldStr("004700");
    SequenceRandom rng{{35}};
    PayloadStr p;
    REQUIRE(compose(r, rng, p) == MrnError::Ok);
    CHECK(p == "24DK004700ZZZZZZZ");
    CHECK(rng.calls == 7);
}

TEST_CASE("procedure category fills the last two positions") {
    GenerationRequest r = dk24();
    r.declaration_office = FieldStr("004700");
    r.procedure_category = FieldStr("B1");
    SequenceRandom rng;
    PayloadStr p;
    REQUIRE(compose(r, rng, p) == MrnError::Ok);
    CHECK(p == "24DK00470000000B1");
    CHECK(rng.calls == 5);
}

TEST_CASE("combined category replaces the second procedure character") {
    GenerationRequest r = dk24();
    r.declaration_office = FieldStr("004700");
    r.procedure_category = FieldStr("B1");
    r.combined_category = FieldStr("A");
    SequenceRandom rng;
    PayloadStr p;
    REQUIRE(compose(r, rng, p) == MrnError::Ok);
    CHECK(p[15] == 'B');
    CHECK(p[16] == 'A');
    CHECK(p == "24DK00470000000BA");
}

TEST_CASE("invalid requests fail before any random draw") {
    GenerationRequest r = dk24();
    r.procedure_category = FieldStr("B1");
    r.combined_category = FieldStr("AB");
    SequenceRandom rng;
    PayloadStr p("left over");
    CHECK(compose(r, rng, p) == MrnError::BadCombinedCategory);
    CHECK(rng.calls == 0);
    CHECK(p.empty());
}

TEST_CASE("composed payloads stay inside the alphabet") {
    LcgRandom rng{7};
    PayloadStr p;
    for (int i = 0; i < 500; ++i) {
        REQUIRE(compose(dk24(), rng, p) == MrnError::Ok);
        REQUIRE(p.size() == PAYLOAD_LEN);
        for (size_t k = 0; k < p.size(); ++k) CHECK(is_mrn_char(p[k]));
        for (size_t k = OFFICE_POS; k < OFFICE_POS + OFFICE_LEN; ++k) CHECK(is_digit_char(p[k]));
    }
}
