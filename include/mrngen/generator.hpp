/**
 * @file generator.hpp
 * @brief MrnGenerator: composer + checksum engine behind one call.
 *
 * The generator owns nothing but a reference to the caller's random source and
 * the selected check scheme. Repeated calls share that one source, so N MRNs
 * from one process come from a single unbroken random sequence.
 *
 * @code
 * mrngen::LcgRandom rng{mrngen::LcgRandom::clock_seed()};
 * mrngen::MrnGenerator gen{rng};
 *
 * mrngen::GenerationRequest req;
 * req.year = mrngen::year_from_time(std::time(nullptr));
 * req.country_code = "DK";
 *
 * std::vector<mrngen::MrnStr> out;
 * if (gen.generate(req, 20, out) != mrngen::MrnError::Ok) {
 *   // report mrngen::reason(err)
 * }
 * @endcode
 *
 * Uniqueness across outputs is not guaranteed; two calls may return the same MRN.
 */

#ifndef MRNGEN_GENERATOR_HPP
#define MRNGEN_GENERATOR_HPP

#include "mrngen/mrn_types.hpp"
#include "mrngen/mrn_error.hpp"
#include "mrngen/random_source.hpp"
#include "mrngen/checksum.hpp"
#include "mrngen/field_composer.hpp"

#include <ctime>
#include <vector>

namespace mrngen {

class MrnGenerator {
public:
  explicit MrnGenerator(IRandomSource& rng, CheckScheme scheme = CheckScheme::Mod37);

  /**
   * @brief Generate one MRN.
   * @param req Request; validated before any random draw.
   * @param out Receives 18 characters on success; cleared on failure.
   */
  MrnError generate(const GenerationRequest& req, MrnStr& out);

  /**
   * @brief Generate `count` MRNs for the same request, appended to `out` in order.
   *
   * The request is validated once, before the first draw, so a bad request
   * appends nothing. `count` must be at least 1 (MrnError::BadCount).
   * If an internal fault stops the run, MRNs appended before it stay in `out`.
   */
  MrnError generate(const GenerationRequest& req, size_t count, std::vector<MrnStr>& out);

  /**
   * @brief Generate `count` MRNs, handing each to `emit` as soon as it exists.
   *
   * Same validation and error rules as the vector overload, but nothing is
   * buffered: memory use does not grow with `count`.
   * @param emit Callable taking `const MrnStr&`.
   */
  template <typename Emit>
  MrnError generate_each(const GenerationRequest& req, size_t count, Emit&& emit) {
    if (count == 0) return MrnError::BadCount;

    MrnError err = validate_request(req);
    if (err != MrnError::Ok) return err;

    MrnStr mrn;
    for (size_t i = 0; i < count; ++i) {
      err = generate(req, mrn);
      if (err != MrnError::Ok) return err;
      emit(static_cast<const MrnStr&>(mrn));
    }
    return MrnError::Ok;
  }

  CheckScheme scheme() const { return scheme_; }
  void set_scheme(CheckScheme s) { scheme_ = s; }

  /// Number of MRNs produced by this generator so far.
  uint64_t generated_count() const { return generated_; }

private:
  IRandomSource& rng_;
  CheckScheme    scheme_;
  uint64_t       generated_{0};
};

/**
 * @brief Two-digit year of a point in time, in local time ("24" for 2024).
 */
FieldStr year_from_time(std::time_t t);

} // namespace mrngen

#endif // MRNGEN_GENERATOR_HPP
