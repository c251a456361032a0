#ifndef LUFSCHECK_SCRAPE_HPP
#define LUFSCHECK_SCRAPE_HPP

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "measurement.hpp"

namespace lufscheck {

// Key that marks the loudnorm JSON block inside ffmpeg's log.
inline constexpr std::string_view loudnorm_signature = "\"input_i\"";

// Key printed by ametadata for every astats frame.
inline constexpr std::string_view peak_level_key =
  "lavfi.astats.Overall.Peak_level=";

// Split captured process output into lines. "\r\n" and lone "\r" both end a
// line. A trailing line terminator does not produce an empty last line.
[[nodiscard]] std::vector<std::string_view> split_lines(std::string_view text);

// Locate the JSON object that encloses the first line containing signature:
// the nearest '{' at or above that line and the nearest '}' at or below it.
// The result starts at that '{' and ends at that '}'.
[[nodiscard]] std::optional<std::string>
extract_json_block(std::vector<std::string_view> const &lines,
                   std::string_view signature);

// Parse the loudnorm payload. Fails unless input_i, input_tp and input_lra
// are all present and numeric (loudnorm prints them as strings).
[[nodiscard]] std::expected<loudness_facts, std::string>
parse_loudnorm_json(std::string_view payload);

// Every value printed after peak_level_key, in order of appearance.
[[nodiscard]] std::vector<double> scrape_peak_levels(std::string_view text);

// Maximum of scrape_peak_levels(), rounded to two decimals.
[[nodiscard]] std::optional<double> max_peak_level(std::string_view text);

// Parse `ffprobe -of json` output. Never fails as a whole: each field that
// is missing or malformed is left empty.
[[nodiscard]] stream_facts parse_probe_json(std::string_view text);

} // namespace lufscheck

#endif
