#include "output_format.hpp"

using json = nlohmann::json;

namespace mrngen {

bool format_from_name(const std::string& name, OutputFormat& out) {
  if (name == "plain") { out = OutputFormat::Plain; return true; }
  if (name == "json")  { out = OutputFormat::Json;  return true; }
  return false;
}

bool count_fits_format(uint64_t total, OutputFormat format) {
  return format != OutputFormat::Json || total <= JSON_MAX_MRNS;
}

void write_plain(std::ostream& os, const MrnStr& mrn) {
  os << mrn.c_str() << '\n';
}

json mrn_to_json(const MrnStr& mrn) {
  std::string s(mrn.c_str());
  json j;
  j["mrn"] = s;
  j["payload"] = s.substr(0, PAYLOAD_LEN);
  j["check"] = s.substr(PAYLOAD_LEN, 1);
  j["year"] = s.substr(YEAR_POS, YEAR_LEN);
  j["country"] = s.substr(COUNTRY_POS, COUNTRY_LEN);
  return j;
}

std::string render_plain(const std::vector<MrnStr>& mrns) {
  std::string out;
  out.reserve(mrns.size() * (MRN_LEN + 1));
  for (const auto& m : mrns) {
    out.append(m.c_str());
    out.push_back('\n');
  }
  return out;
}

std::string render_json(const std::vector<MrnStr>& mrns, int indent) {
  json arr = json::array();
  for (const auto& m : mrns) arr.push_back(mrn_to_json(m));
  return arr.dump(indent) + "\n";
}

std::string render(const std::vector<MrnStr>& mrns, OutputFormat format) {
  switch (format) {
    case OutputFormat::Plain: return render_plain(mrns);
    case OutputFormat::Json:  return render_json(mrns);
  }
  return render_plain(mrns);
}

} // namespace mrngen
