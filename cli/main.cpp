/**
 * @file main.cpp
 * @brief mrngen CLI — generate checksum-valid customs MRNs.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11) and merge them over the optional config file.
 *  - Build one GenerationRequest (or one per batch line) with the current year.
 *  - Run every request through one MrnGenerator sharing one random source.
 *  - Print MRNs to stdout (plain lines streamed as generated, or one JSON
 *    array capped at JSON_MAX_MRNS); diagnostics go to stderr as
 *    `status=<ok|error> reason=<token> ...` lines.
 *
 * Exit status:
 *  - 0 success
 *  - 1 internal fault (invalid payload, out of memory)
 *  - 2 invalid field, bad count or bad request line
 *  - 3 config or batch file could not be used
 */

#include <cstdint>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <new>
#include <string>
#include <utility>
#include <vector>

#include <unistd.h> // isatty

#include "CLI/CLI11.hpp"

#include "mrngen/checksum.hpp"
#include "mrngen/generator.hpp"
#include "mrngen/mrn_error.hpp"
#include "mrngen/random_source.hpp"
#include "mrngen/request_line.hpp"
#include "mrn_config.hpp"
#include "output_format.hpp"

#ifndef MRNGEN_VERSION
#define MRNGEN_VERSION "0.0.0"
#endif

namespace fs = std::filesystem;
using namespace mrngen;

// ---------- small utilities ----------

static constexpr int EXIT_INTERNAL = 1;
static constexpr int EXIT_FIELD    = 2;
static constexpr int EXIT_CONFIG   = 3;

static bool is_tty_stderr() { return ::isatty(fileno(stderr)); }

struct Ansi {
  bool enabled{true};
  std::string red(const std::string& s) const { return enabled ? "\033[31m"+s+"\033[0m" : s; }
};

static int report_error(const Ansi& ansi, const std::string& reason, const std::string& extra, int code) {
  std::string line = "status=error reason=" + reason;
  if (!extra.empty()) line += " " + extra;
  std::cerr << ansi.red(line) << "\n";
  return code;
}

static int exit_code_for(MrnError e) {
  return error_class(e) == ErrorClass::InvalidPayload ? EXIT_INTERNAL : EXIT_FIELD;
}

// Optional field: flag wins, then config value, else absent.
static etl::optional<FieldStr> pick_field(const CLI::Option* opt, const std::string& flag_value,
                                          const std::string& config_value, bool upper) {
  if (opt->count() == 0 && config_value.empty()) return etl::nullopt;
  FieldStr f((opt->count() > 0 ? flag_value : config_value).c_str());
  if (upper) upper_ascii(f);
  return f;
}

struct BatchEntry {
  GenerationRequest req;
  uint32_t count;
};

// Read and validate every line before anything is generated.
static int read_batch(std::istream& in, const GenerationRequest& base,
                      std::vector<BatchEntry>& out, const Ansi& ansi) {
  std::string line;
  size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (is_skippable_line(line.c_str())) continue;

    BatchEntry e;
    MrnError err = parse_request_line(line.c_str(), base, e.req, e.count);
    if (err != MrnError::Ok) {
      return report_error(ansi, reason(err), "line=" + std::to_string(line_no), exit_code_for(err));
    }
    out.push_back(e);
  }
  if (in.bad()) return report_error(ansi, "bad_batch_file", "detail=read_failed", EXIT_CONFIG);
  return 0;
}

// ---------- main ----------

int main(int argc, char** argv) {
  std::string opt_country;
  std::string opt_count = "1";
  std::string opt_procedure;
  std::string opt_combined;
  std::string opt_office;
  std::string opt_scheme;
  std::string opt_format;
  std::string opt_batch;
  std::string opt_config;
  uint64_t    opt_seed = 0;
  bool        opt_verbose = false;
  bool        opt_no_color = false;

  CLI::App app{"Command line utility to generate valid MRNs"};
  app.set_version_flag("--version", MRNGEN_VERSION);

  auto* o_country   = app.add_option("-c,--country-code", opt_country, "Country code of MRN (ISO 3166-1 alpha-2)");
  auto* o_count     = app.add_option("-n,--number-of-mrns", opt_count, "Number of MRNs to generate")->capture_default_str();
  auto* o_procedure = app.add_option("-p,--procedure-category", opt_procedure, "Procedure category (letter + alphanumeric, e.g. B1)");
  auto* o_combined  = app.add_option("-C,--combined", opt_combined, "Combined procedure category (single letter, needs -p)");
  auto* o_office    = app.add_option("-o,--declaration-office", opt_office, "Customs office of declaration (6 digits)");
  auto* o_scheme    = app.add_option("--scheme", opt_scheme, "Check scheme: mod37|iso6346")->check(CLI::IsMember({"mod37", "iso6346"}));
  auto* o_format    = app.add_option("--format", opt_format, "Output format: plain|json")->check(CLI::IsMember({"plain", "json"}));
  auto* o_seed      = app.add_option("--seed", opt_seed, "Fixed random seed for reproducible output");
  auto* o_batch     = app.add_option("--batch", opt_batch, "Read request lines from a file ('-' for stdin)");
  auto* o_config    = app.add_option("--config", opt_config, "Config file (default: $XDG_CONFIG_HOME/mrngen/config.json)");
  app.add_flag("-v,--verbose", opt_verbose, "Print status lines on stderr");
  app.add_flag("--no-color", opt_no_color, "Disable ANSI colors");

  o_count->excludes(o_batch);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    return app.exit(e);
  }

  Ansi ansi;
  ansi.enabled = !opt_no_color && is_tty_stderr();

  // -------- config --------
  MrnConfig cfg;
  {
    fs::path path = o_config->count() > 0 ? fs::path(opt_config) : default_config_path();
    std::error_code ec;
    if (o_config->count() > 0 && !fs::exists(path, ec)) {
      return report_error(ansi, "bad_config", "detail=missing path=" + path.string(), EXIT_CONFIG);
    }
    std::string err;
    if (!load_config(path, cfg, err)) {
      return report_error(ansi, "bad_config", "detail=" + err + " path=" + path.string(), EXIT_CONFIG);
    }
  }

  CheckScheme scheme = CheckScheme::Mod37;
  const std::string scheme_text = o_scheme->count() > 0 ? opt_scheme : cfg.scheme;
  if (!scheme_from_name(scheme_text.c_str(), scheme)) {
    return report_error(ansi, "bad_config", "detail=scheme", EXIT_CONFIG);
  }

  OutputFormat format = OutputFormat::Plain;
  if (!format_from_name(o_format->count() > 0 ? opt_format : cfg.format, format)) {
    return report_error(ansi, "bad_config", "detail=format", EXIT_CONFIG);
  }

  // -------- base request --------
  GenerationRequest base;
  base.year = year_from_time(std::time(nullptr));
  {
    FieldStr country((o_country->count() > 0 ? opt_country : cfg.country_code).c_str());
    upper_ascii(country);
    base.country_code = country;
  }
  base.declaration_office = pick_field(o_office, opt_office, cfg.declaration_office, false);
  base.procedure_category = pick_field(o_procedure, opt_procedure, cfg.procedure_category, true);
  base.combined_category  = pick_field(o_combined, opt_combined, std::string(), true);

  // -------- collect work --------
  std::vector<BatchEntry> work;
  if (o_batch->count() > 0) {
    int rc = 0;
    if (opt_batch == "-") {
      rc = read_batch(std::cin, base, work, ansi);
    } else {
      std::ifstream in(opt_batch);
      if (!in) return report_error(ansi, "bad_batch_file", "detail=open_failed path=" + opt_batch, EXIT_CONFIG);
      rc = read_batch(in, base, work, ansi);
    }
    if (rc != 0) return rc;
  } else {
    uint32_t count = 0;
    if (!parse_count(opt_count.c_str(), count)) {
      return report_error(ansi, reason(MrnError::BadCount), "value=" + opt_count, EXIT_FIELD);
    }
    work.push_back({base, count});
  }

  uint64_t total = 0;
  for (const auto& w : work) total += w.count;
  if (!count_fits_format(total, format)) {
    return report_error(ansi, reason(MrnError::BadCount),
                        "detail=json_limit total=" + std::to_string(total) +
                        " max=" + std::to_string(JSON_MAX_MRNS), EXIT_FIELD);
  }

  // -------- generate --------
  const uint64_t seed = o_seed->count() > 0 ? opt_seed : LcgRandom::clock_seed();
  LcgRandom rng{seed};
  MrnGenerator gen{rng, scheme};

  try {
    if (format == OutputFormat::Plain) {
      // Streamed: each MRN is printed as soon as it is generated.
      for (const auto& w : work) {
        MrnError err = gen.generate_each(w.req, w.count,
                                         [](const MrnStr& mrn) { write_plain(std::cout, mrn); });
        if (err != MrnError::Ok) {
          std::cout.flush();
          return report_error(ansi, reason(err), std::string(), exit_code_for(err));
        }
      }
    } else {
      std::vector<MrnStr> mrns;
      for (const auto& w : work) {
        MrnError err = gen.generate(w.req, w.count, mrns);
        if (err != MrnError::Ok) {
          return report_error(ansi, reason(err), std::string(), exit_code_for(err));
        }
      }
      std::cout << render(mrns, format);
    }
  } catch (const std::bad_alloc&) {
    std::cout.flush();
    return report_error(ansi, "out_of_memory", "generated=" + std::to_string(gen.generated_count()),
                        EXIT_INTERNAL);
  }
  std::cout.flush();

  if (opt_verbose) {
    std::cerr << "status=ok count=" << gen.generated_count()
              << " requests=" << work.size()
              << " scheme=" << scheme_name(scheme)
              << " seed=" << seed << "\n";
  }
  return 0;
}
