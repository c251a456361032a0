#ifndef LUFSCHECK_MEASUREMENT_HPP
#define LUFSCHECK_MEASUREMENT_HPP

#include <cmath>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lufscheck {

enum class verdict { ready, adjust, error };

// Issue tags, declared in report order.
enum class issue {
  analysis_error,
  lufs_high,
  lufs_low,
  true_peak_hot,
  sample_rate_check
};

[[nodiscard]] constexpr std::string_view to_string(verdict v) noexcept
{
  switch (v) {
    case verdict::ready:  return "READY";
    case verdict::adjust: return "ADJUST";
    case verdict::error:  return "ERROR";
  }
  return "ERROR";
}

[[nodiscard]] constexpr std::string_view to_string(issue i) noexcept
{
  switch (i) {
    case issue::analysis_error:    return "ANALYSIS ERROR";
    case issue::lufs_high:         return "LUFS HIGH";
    case issue::lufs_low:          return "LUFS LOW";
    case issue::true_peak_hot:     return "TRUE PEAK HOT";
    case issue::sample_rate_check: return "SAMPLE RATE CHECK";
  }
  return "";
}

// Adding 0.0 turns a rounded -0.0 into 0.0.
[[nodiscard]] inline double round2(double v) noexcept
{ return std::round(v * 100.0) / 100.0 + 0.0; }

// Container and first-audio-stream facts reported by ffprobe.
struct stream_facts {
  std::optional<double>      duration_sec;
  std::optional<int>         sample_rate_hz;
  std::optional<int>         bit_depth;
  std::optional<int>         channels;
  std::optional<std::string> codec;
  std::optional<int>         bitrate_kbps;
};

// Values scraped from the loudnorm analysis pass.
struct loudness_facts {
  std::optional<double> integrated_lufs;
  std::optional<double> true_peak_dbtp;
  std::optional<double> loudness_range_lu;

  [[nodiscard]] bool complete() const noexcept
  { return integrated_lufs && true_peak_dbtp && loudness_range_lu; }
};

struct classification {
  verdict               status = verdict::error;
  std::vector<issue>    issues;
  std::optional<double> suggested_gain_db;
};

// One analysed file. Built once by analyze_file() and never changed.
struct measurement_record {
  std::string           file_name;
  std::filesystem::path file_path;
  stream_facts          stream;
  loudness_facts        loudness;
  std::optional<double> sample_peak_dbfs;
  classification        result;
};

} // namespace lufscheck

#endif
