#include "classify.hpp"

namespace lufscheck {

std::string join_issues(std::vector<issue> const &issues,
                        std::string_view separator)
{
  if (issues.empty()) return "NONE";

  std::string out;
  for (auto tag : issues) {
    if (!out.empty()) out += separator;
    out += to_string(tag);
  }
  return out;
}

classification
classify(loudness_facts const &loudness, std::optional<int> sample_rate_hz,
         thresholds const &limits)
{
  classification result;

  const bool analysis_ok = loudness.complete();
  if (!analysis_ok) result.issues.push_back(issue::analysis_error);

  bool in_window = false;
  if (const auto &lufs = loudness.integrated_lufs) {
    const double hi = limits.target_lufs + limits.tolerance_lu;
    const double lo = limits.target_lufs - limits.tolerance_lu;
    if (*lufs > hi) {
      result.issues.push_back(issue::lufs_high);
    } else if (*lufs < lo) {
      result.issues.push_back(issue::lufs_low);
    } else {
      in_window = true;
    }
    result.suggested_gain_db = round2(limits.target_lufs - *lufs);
  }

  const auto &tp = loudness.true_peak_dbtp;
  if (tp && *tp > limits.true_peak_ceiling)
    result.issues.push_back(issue::true_peak_hot);
  const bool peak_safe = tp && *tp <= limits.true_peak_ceiling;

  const bool rate_ok = !sample_rate_hz
    || limits.allowed_sample_rates.contains(*sample_rate_hz);
  if (!rate_ok) result.issues.push_back(issue::sample_rate_check);

  if (!analysis_ok)
    result.status = verdict::error;
  else if (in_window && peak_safe && rate_ok)
    result.status = verdict::ready;
  else
    result.status = verdict::adjust;

  return result;
}

} // namespace lufscheck
