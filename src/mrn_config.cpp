// ============================================================================
// mrn_config.cpp — implementation for mrn_config.hpp
// ============================================================================

#include "mrn_config.hpp"
#include "mrngen/checksum.hpp"
#include "output_format.hpp"

#include <cstdlib>            // getenv for XDG/HOME lookups
#include <fstream>
#include <sstream>
#include <system_error>       // std::error_code for non-throwing filesystem ops

#include "nlohmann/json.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace mrngen {

fs::path default_config_path() {
  if (const char* x = std::getenv("XDG_CONFIG_HOME"); x && *x)
    return fs::path(x) / "mrngen" / "config.json";
  if (const char* h = std::getenv("HOME"); h && *h)
    return fs::path(h) / ".config" / "mrngen" / "config.json";
  return {};
}

// Copy a string-valued key if present; anything else under that key is a type error.
static bool read_string(const json& j, const char* key, std::string& dst, std::string& err) {
  auto it = j.find(key);
  if (it == j.end()) return true;
  if (!it->is_string()) {
    err = std::string("bad_config:type:") + key;
    return false;
  }
  dst = it->get<std::string>();
  return true;
}

bool parse_config(const std::string& text, MrnConfig& out, std::string& err) {
  json j = json::parse(text, nullptr, /*allow_exceptions*/false);
  if (j.is_discarded() || !j.is_object()) {
    err = "bad_config:parse";
    return false;
  }

  MrnConfig cfg = out;
  if (!read_string(j, "country_code", cfg.country_code, err))             return false;
  if (!read_string(j, "declaration_office", cfg.declaration_office, err)) return false;
  if (!read_string(j, "procedure_category", cfg.procedure_category, err)) return false;
  if (!read_string(j, "scheme", cfg.scheme, err))                         return false;
  if (!read_string(j, "format", cfg.format, err))                         return false;

  CheckScheme scheme;
  if (!scheme_from_name(cfg.scheme.c_str(), scheme)) {
    err = "bad_config:scheme";
    return false;
  }
  OutputFormat format;
  if (!format_from_name(cfg.format, format)) {
    err = "bad_config:format";
    return false;
  }

  out = cfg;
  return true;
}

bool load_config(const fs::path& path, MrnConfig& out, std::string& err) {
  std::error_code ec;
  if (path.empty() || !fs::exists(path, ec)) return true;

  std::ifstream in(path);
  if (!in) {
    err = "bad_config:read";
    return false;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return parse_config(ss.str(), out, err);
}

} // namespace mrngen
