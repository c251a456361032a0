#ifndef LUFSCHECK_SETTINGS_HPP
#define LUFSCHECK_SETTINGS_HPP

#include <chrono>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace lufscheck {

// Compliance thresholds passed to extraction and classification.
struct thresholds {
  double target_lufs = -14.0;
  double tolerance_lu = 0.5;
  double true_peak_ceiling = -1.0;
  double loudness_range_target = 8.0; // only forwarded to loudnorm
  std::set<int> allowed_sample_rates{44100, 48000};
};

struct settings {
  thresholds limits;

  // Lower-case, without the leading dot.
  std::set<std::string> extensions{
    "wav", "flac", "mp3", "m4a", "aac", "ogg", "opus", "aif", "aiff"
  };
  bool recursive = true;

  std::chrono::seconds timeout{600}; // per engine call, 0 = unbounded
  std::string ffmpeg = "ffmpeg";
  std::string ffprobe = "ffprobe";

  std::filesystem::path output_dir = ".";
  bool debug_dumps = false;
  bool parallel = false;
  bool verbose = false;
  bool quiet = false;
};

// getopt_long return values for the options that change settings.
enum option_id : int {
  opt_output_dir = 'o',
  opt_verbose = 'v',
  opt_quiet = 'q',
  opt_config = 256,
  opt_target,
  opt_tolerance,
  opt_ceiling,
  opt_sample_rates,
  opt_extensions,
  opt_no_recursive,
  opt_timeout,
  opt_ffmpeg,
  opt_ffprobe,
  opt_csv,
  opt_html,
  opt_debug_dumps,
  opt_parallel,
};

// Overlay the keys present in a JSON object onto s.
// Throws std::runtime_error on a malformed value.
void apply_json(settings &s, nlohmann::json const &j);

// Read a JSON configuration file and overlay it onto s.
// Throws std::runtime_error (or std::ios_base::failure) on error.
void load_settings_file(settings &s, std::filesystem::path const &file);

// Apply one command-line option. Throws std::runtime_error on a bad value.
void apply_option(settings &s, int id, std::string const &value);

// Defaults, then the configuration file (if any), then the command-line
// options in the order given. The file never overrides an option, wherever
// --config appeared.
[[nodiscard]] settings
resolve_settings(std::optional<std::filesystem::path> const &config_file,
                 std::vector<std::pair<int, std::string>> const &options);

// "44100,48000" -> {44100, 48000}. Throws std::runtime_error.
[[nodiscard]] std::set<int> parse_sample_rate_list(std::string_view text);

// "wav,.FLAC" -> {"wav", "flac"}. Throws std::runtime_error.
[[nodiscard]] std::set<std::string> parse_extension_list(std::string_view text);

} // namespace lufscheck

#endif
