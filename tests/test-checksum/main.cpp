/**
 * @file test-checksum/main.cpp
 * @brief CLI tool that shows how a check character is derived from a payload.
 *
 * Prints every step so a payload can be checked by hand against another
 * implementation or a customs system's answer.
 *
 * @code
 *   ./test-checksum --payload 24DK004700ABCDEB1
 *   ./test-checksum --payload 24DK004700ABCDEB1 --scheme iso6346
 *   ./test-checksum --mrn 24DK004700ABCDEB1R
 * @endcode
 *
 * With `--mrn`, the first 17 characters are checked and the result is
 * compared against the 18th (exit 1 on mismatch). A payload that is not
 * exactly 17 characters, or an MRN that is not 18, is refused (exit 2).
 *
 * Example output (mod37):
 * @code
 *   pos char value remainder
 *     0    2     2         2
 *     1    4     4        32
 *   ...
 *   Check:       R
 * @endcode
 */

#include <iomanip>
#include <iostream>
#include <string>
#include "CLI/CLI11.hpp"
#include "mrngen/checksum.hpp"

using namespace mrngen;

static void print_mod37_steps(const PayloadStr& p) {
    std::cout << "pos char value remainder\n";
    uint32_t r = 0;
    for (size_t i = 0; i < p.size(); ++i) {
        int v = character_value(p[i]);
        r = (r * 36 + static_cast<uint32_t>(v)) % 37;
        std::cout << std::setw(3) << i << "    " << p[i]
                  << std::setw(6) << v << std::setw(10) << r << "\n";
    }
}

static void print_iso6346_steps(const PayloadStr& p) {
    std::cout << "pos char value weight product\n";
    uint32_t sum = 0;
    for (size_t i = 0; i < p.size(); ++i) {
        int v = iso6346_value(p[i]);
        uint32_t w = 1u << i;
        sum += static_cast<uint32_t>(v) * w;
        std::cout << std::setw(3) << i << "    " << p[i]
                  << std::setw(6) << v << std::setw(7) << w << std::setw(8) << v * w << "\n";
    }
    std::cout << "Sum:         " << sum << "\n"
              << "Sum % 11:    " << sum % 11 << "\n";
}

int main(int argc, char** argv) {
    CLI::App app{"mrngen check character inspector"};

    std::string payload_text, mrn_text, scheme_text = "mod37";
    auto opt_payload = app.add_option("--payload", payload_text, "17-character payload");
    auto opt_mrn = app.add_option("--mrn", mrn_text, "18-character MRN to verify");
    app.add_option("--scheme", scheme_text, "mod37|iso6346")->check(CLI::IsMember({"mod37", "iso6346"}));
    opt_payload->excludes(opt_mrn);

    CLI11_PARSE(app, argc, argv);

    if (!*opt_payload && !*opt_mrn) {
        std::cout << "Please provide --payload or --mrn. Use --help for options.\n";
        return 2;
    }

    if (*opt_payload && payload_text.size() != PAYLOAD_LEN) {
        std::cerr << "status=error reason=bad_payload detail=length length=" << payload_text.size() << "\n";
        return 2;
    }
    if (*opt_mrn && mrn_text.size() != MRN_LEN) {
        std::cerr << "status=error reason=bad_payload detail=length length=" << mrn_text.size() << "\n";
        return 2;
    }

    const std::string text = *opt_mrn ? mrn_text.substr(0, PAYLOAD_LEN) : payload_text;
    PayloadStr payload(text.c_str());

    CheckScheme scheme = CheckScheme::Mod37;
    if (!scheme_from_name(scheme_text.c_str(), scheme)) {
        std::cerr << "status=error reason=bad_scheme\n";
        return 2;
    }

    char check = 0;
    MrnError err = check_character(payload, scheme, check);
    if (err != MrnError::Ok) {
        std::cerr << "status=error reason=" << reason(err) << "\n";
        return 2;
    }

    std::cout << "Payload:     " << payload.c_str() << "\n"
              << "Scheme:      " << scheme_name(scheme) << "\n";
    if (scheme == CheckScheme::Mod37) print_mod37_steps(payload);
    else                              print_iso6346_steps(payload);
    std::cout << "Check:       " << check << "\n";

    if (*opt_mrn) {
        const bool match = mrn_text[PAYLOAD_LEN] == check;
        std::cout << "Matches MRN: " << (match ? "true" : "false") << "\n";
        return match ? 0 : 1;
    }
    return 0;
}
