#include <doctest/doctest.h>
#include "output_format.hpp"

#include <sstream>

using namespace mrngen;

TEST_CASE("format names") {
    OutputFormat f = OutputFormat::Plain;
    CHECK(format_from_name("json", f));
    CHECK(f == OutputFormat::Json);
    CHECK(format_from_name("plain", f));
    CHECK(f == OutputFormat::Plain);
    CHECK_FALSE(format_from_name("pretty", f));
}

TEST_CASE("plain rendering is one MRN per line") {
    std::vector<MrnStr> mrns{MrnStr("24DK004700ABCDEB1R"), MrnStr("24DK00470000000BAO")};
    CHECK(render(mrns, OutputFormat::Plain) == "24DK004700ABCDEB1R\n24DK00470000000BAO\n");
    CHECK(render_plain({}).empty());
}

TEST_CASE("json rendering splits each MRN into its fields") {
    std::vector<MrnStr> mrns{MrnStr("24DK004700ABCDEB1R")};
    auto j = nlohmann::json::parse(render(mrns, OutputFormat::Json));
    REQUIRE(j.is_array());
    REQUIRE(j.size() == 1);
    CHECK(j[0]["mrn"] == "24DK004700ABCDEB1R");
    CHECK(j[0]["payload"] == "24DK004700ABCDEB1");
    CHECK(j[0]["check"] == "R");
    CHECK(j[0]["year"] == "24");
    CHECK(j[0]["country"] == "DK");

    CHECK(render_json({}, -1) == "[]\n");
}

TEST_CASE("write_plain emits one line per call") {
    std::ostringstream os;
    write_plain(os, MrnStr("24DK004700ABCDEB1R"));
    write_plain(os, MrnStr("24DK00470000000BAO"));
    CHECK(os.str() == "24DK004700ABCDEB1R\n24DK00470000000BAO\n");
}

TEST_CASE("only json output is limited in size") {
    CHECK(count_fits_format(4294967295ull, OutputFormat::Plain));
    CHECK(count_fits_format(JSON_MAX_MRNS, OutputFormat::Json));
    CHECK_FALSE(count_fits_format(JSON_MAX_MRNS + 1, OutputFormat::Json));
    CHECK_FALSE(count_fits_format(4294967295ull, OutputFormat::Json));
}
