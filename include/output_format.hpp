#pragma once
/**
 * @file output_format.hpp
 * @brief Rendering generated MRNs for stdout.
 *
 * - plain : one MRN per line, in generation order, each line ending in '\n'.
 *           Written line by line while generating; never buffered.
 * - json  : an array of objects, one per MRN:
 *   @code
 *   [
 *     { "mrn": "24DK0047001A2B3B1X", "payload": "24DK0047001A2B3B1",
 *       "check": "X", "year": "24", "country": "DK" }
 *   ]
 *   @endcode
 */

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

#include "mrngen/mrn_types.hpp"

namespace mrngen {

enum class OutputFormat { Plain, Json };

/// JSON output holds the whole array in memory; runs above this are refused.
constexpr uint64_t JSON_MAX_MRNS = 100000;

/// @brief true if `total` MRNs may be rendered in `format`.
bool count_fits_format(uint64_t total, OutputFormat format);

/// @brief Write one MRN and a newline.
void write_plain(std::ostream& os, const MrnStr& mrn);

/// @brief "plain" / "json" → OutputFormat. false for anything else.
bool format_from_name(const std::string& name, OutputFormat& out);

/// @brief Split one 18-character MRN into its fields.
nlohmann::json mrn_to_json(const MrnStr& mrn);

std::string render_plain(const std::vector<MrnStr>& mrns);

std::string render_json(const std::vector<MrnStr>& mrns, int indent = 2);

/// @brief Dispatch on `format`. JSON output ends with a trailing newline.
std::string render(const std::vector<MrnStr>& mrns, OutputFormat format);

} // namespace mrngen
