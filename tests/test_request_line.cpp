#include <doctest/doctest.h>
#include "mrngen/request_line.hpp"

using namespace mrngen;

static GenerationRequest base24() {
    GenerationRequest r;
    r.year = "24";
    return r;
}

TEST_CASE("request line fills every field and uppercases letters") {
    GenerationRequest req;
    uint32_t count = 0;
    REQUIRE(parse_request_line("-c dk -n 3 -p b1 -C a -o 004700", base24(), req, count) == MrnError::Ok);
    CHECK(req.year == "24");
    CHECK(req.country_code == "DK");
    CHECK(count == 3);
    REQUIRE(req.procedure_category.has_value());
    CHECK(*req.procedure_category == "B1");
    REQUIRE(req.combined_category.has_value());
    CHECK(*req.combined_category == "A");
    REQUIRE(req.declaration_office.has_value());
    CHECK(*req.declaration_office == "004700");
}

TEST_CASE("long keys match short keys") {
    GenerationRequest req;
    uint32_t count = 0;
    REQUIRE(parse_request_line("--country-code SE --number-of-mrns 2 --declaration-office 123456",
                               base24(), req, count) == MrnError::Ok);
    CHECK(req.country_code == "SE");
    CHECK(count == 2);
    CHECK(*req.declaration_office == "123456");
}

TEST_CASE("short and long key for one field conflict") {
    GenerationRequest req;
    uint32_t count = 0;
    CHECK(parse_request_line("-c DK --country-code SE", base24(), req, count) == MrnError::BadRequestLine);
    CHECK(parse_request_line("-c DK -n 2 --number-of-mrns 3", base24(), req, count) == MrnError::BadRequestLine);
    CHECK(parse_request_line("-c DK -o 004700 --declaration-office 123456", base24(), req, count)
          == MrnError::BadRequestLine);

    // The same key twice is not a conflict: the last value is kept.
    REQUIRE(parse_request_line("-c DK -c SE", base24(), req, count) == MrnError::Ok);
    CHECK(req.country_code == "SE");
}

TEST_CASE("base values carry over and count defaults to 1") {
    GenerationRequest base = base24();
    base.country_code = "DE";
    base.declaration_office = FieldStr("004700");

    GenerationRequest req;
    uint32_t count = 0;
    REQUIRE(parse_request_line("-p A1", base, req, count) == MrnError::Ok);
    CHECK(req.country_code == "DE");
    CHECK(*req.declaration_office == "004700");
    CHECK(count == 1);
}

TEST_CASE("request line errors") {
    GenerationRequest req;
    uint32_t count = 0;
    CHECK(parse_request_line("-c DK -x 1", base24(), req, count) == MrnError::BadRequestLine);
    CHECK(parse_request_line("DK", base24(), req, count) == MrnError::BadRequestLine);
    CHECK(parse_request_line("-c DK -o", base24(), req, count) == MrnError::BadDeclarationOffice);
    CHECK(parse_request_line("-c DK -n 0", base24(), req, count) == MrnError::BadCount);
    CHECK(parse_request_line("-c DK -n two", base24(), req, count) == MrnError::BadCount);
    CHECK(parse_request_line("-c DK -C A", base24(), req, count) == MrnError::CombinedWithoutProcedure);
    CHECK(parse_request_line("-c DENMARK", base24(), req, count) == MrnError::BadCountryCode);
    CHECK(parse_request_line("-n 2", base24(), req, count) == MrnError::BadCountryCode);
    CHECK(parse_request_line("-c DK -o 0047000000000000000000", base24(), req, count) == MrnError::BadDeclarationOffice);
}

TEST_CASE("parse_count accepts positive 32-bit decimals only") {
    uint32_t n = 0;
    CHECK(parse_count("1", n));
    CHECK(n == 1);
    CHECK(parse_count("4294967295", n));
    CHECK(n == 4294967295u);
    CHECK_FALSE(parse_count("4294967296", n));
    CHECK_FALSE(parse_count("0", n));
    CHECK_FALSE(parse_count("-3", n));
    CHECK_FALSE(parse_count("", n));
    CHECK_FALSE(parse_count(nullptr, n));
}

TEST_CASE("blank and comment lines are skipped") {
    CHECK(is_skippable_line(""));
    CHECK(is_skippable_line("   \t"));
    CHECK(is_skippable_line("  # DK office batch"));
    CHECK_FALSE(is_skippable_line("-c DK"));
}
