#ifndef LUFSCHECK_CLASSIFY_HPP
#define LUFSCHECK_CLASSIFY_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "measurement.hpp"
#include "settings.hpp"

namespace lufscheck {

// Derive verdict, issue tags and suggested gain from the measurements.
//
// Every failing check is tagged, even when the verdict is already ERROR.
// An unknown sample rate is never penalized. The loudness window is closed:
// exactly target +/- tolerance passes, as does a true peak equal to the
// ceiling.
[[nodiscard]] classification
classify(loudness_facts const &loudness, std::optional<int> sample_rate_hz,
         thresholds const &limits);

// "LUFS HIGH|TRUE PEAK HOT", or "NONE" for a clean record.
[[nodiscard]] std::string join_issues(std::vector<issue> const &issues,
                                      std::string_view separator = "|");

} // namespace lufscheck

#endif
