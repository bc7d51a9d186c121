#include "mrngen/generator.hpp"
#include "mrngen/field_composer.hpp"

#include <time.h> // localtime_r

namespace mrngen {

MrnGenerator::MrnGenerator(IRandomSource& rng, CheckScheme scheme)
  : rng_(rng), scheme_(scheme) {}

MrnError MrnGenerator::generate(const GenerationRequest& req, MrnStr& out) {
  out.clear();

  PayloadStr payload;
  MrnError err = compose(req, rng_, payload);
  if (err != MrnError::Ok) return err;

  err = complete(payload, scheme_, out);
  if (err != MrnError::Ok) return err;

  ++generated_;
  return MrnError::Ok;
}

MrnError MrnGenerator::generate(const GenerationRequest& req, size_t count, std::vector<MrnStr>& out) {
  return generate_each(req, count, [&out](const MrnStr& mrn) { out.push_back(mrn); });
}

FieldStr year_from_time(std::time_t t) {
  std::tm tm_local{};
  localtime_r(&t, &tm_local);
  int yy = (tm_local.tm_year + 1900) % 100;

  FieldStr year;
  year.push_back(static_cast<char>('0' + yy / 10));
  year.push_back(static_cast<char>('0' + yy % 10));
  return year;
}

} // namespace mrngen
