#include "settings.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <format>
#include <fstream>
#include <stdexcept>
#include <vector>

#include <nlohmann/json.hpp>

#include "text.hpp"

namespace lufscheck {

namespace {

using nlohmann::json;
using std::runtime_error;
using std::string, std::string_view;

[[nodiscard]] string normalize_extension(string_view ext)
{
  ext = trim(ext);
  if (ext.starts_with('.')) ext.remove_prefix(1);
  string out(ext);
  std::ranges::transform(out, out.begin(),
    [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

template<typename T>
[[nodiscard]] T typed(json const &j, const char *key)
{
  try {
    return j.at(key).get<T>();
  } catch (const json::exception &) {
    throw runtime_error(std::format("config: '{}' has the wrong type", key));
  }
}

[[nodiscard]] double finite_threshold(double value, string_view what)
{
  if (!std::isfinite(value))
    throw runtime_error(std::format("{} must be a finite number", what));
  return value;
}

template<typename T>
[[nodiscard]] T number_option(const char *name, string const &value)
{
  auto v = parse_number<T>(trim(value));
  if (!v) throw runtime_error(std::format("Invalid --{} value '{}': {}", name, value, v.error()));
  return *v;
}

} // namespace

std::set<int> parse_sample_rate_list(string_view text)
{
  std::set<int> rates;
  for (auto field : split(text, ',')) {
    field = trim(field);
    if (field.empty()) continue;
    auto rate = parse_number<int>(field);
    if (!rate || *rate <= 0)
      throw runtime_error(std::format("invalid sample rate '{}': {}",
        field, rate ? "must be > 0" : rate.error()));
    rates.insert(*rate);
  }
  if (rates.empty()) throw runtime_error("empty sample rate list");
  return rates;
}

std::set<string> parse_extension_list(string_view text)
{
  std::set<string> exts;
  for (auto field : split(text, ',')) {
    auto ext = normalize_extension(field);
    if (!ext.empty()) exts.insert(std::move(ext));
  }
  if (exts.empty()) throw runtime_error("empty extension list");
  return exts;
}

void apply_json(settings &s, json const &j)
{
  if (!j.is_object()) throw runtime_error("config: root is not an object");

  if (j.contains("target_lufs"))
    s.limits.target_lufs = finite_threshold(typed<double>(j, "target_lufs"),
                                            "config: 'target_lufs'");
  if (j.contains("tolerance_lu")) {
    s.limits.tolerance_lu = finite_threshold(typed<double>(j, "tolerance_lu"),
                                             "config: 'tolerance_lu'");
    if (s.limits.tolerance_lu < 0.0)
      throw runtime_error("config: 'tolerance_lu' must be >= 0");
  }
  if (j.contains("true_peak_ceiling"))
    s.limits.true_peak_ceiling = finite_threshold(typed<double>(j, "true_peak_ceiling"),
                                                  "config: 'true_peak_ceiling'");
  if (j.contains("allowed_sample_rates")) {
    auto rates = typed<std::set<int>>(j, "allowed_sample_rates");
    if (rates.empty())
      throw runtime_error("config: 'allowed_sample_rates' is empty");
    s.limits.allowed_sample_rates = std::move(rates);
  }
  if (j.contains("extensions")) {
    std::set<string> exts;
    for (auto const &e : typed<std::vector<string>>(j, "extensions"))
      if (auto ext = normalize_extension(e); !ext.empty()) exts.insert(ext);
    if (exts.empty()) throw runtime_error("config: 'extensions' is empty");
    s.extensions = std::move(exts);
  }
  if (j.contains("recursive"))
    s.recursive = typed<bool>(j, "recursive");
  if (j.contains("timeout_seconds")) {
    auto secs = typed<long>(j, "timeout_seconds");
    if (secs < 0)
      throw runtime_error("config: 'timeout_seconds' must be >= 0");
    s.timeout = std::chrono::seconds(secs);
  }
  if (j.contains("ffmpeg"))      s.ffmpeg = typed<string>(j, "ffmpeg");
  if (j.contains("ffprobe"))     s.ffprobe = typed<string>(j, "ffprobe");
  if (j.contains("output_dir"))  s.output_dir = typed<string>(j, "output_dir");
  if (j.contains("debug_dumps")) s.debug_dumps = typed<bool>(j, "debug_dumps");
  if (j.contains("parallel"))    s.parallel = typed<bool>(j, "parallel");
}

void load_settings_file(settings &s, std::filesystem::path const &file)
{
  std::ifstream in;
  in.exceptions(std::ifstream::failbit | std::ifstream::badbit);
  in.open(file);

  json j = json::parse(in, nullptr, false);
  if (j.is_discarded())
    throw runtime_error("config: " + file.generic_string() + " is not valid JSON");

  apply_json(s, j);
}

void apply_option(settings &s, int id, string const &value)
{
  switch (id) {
    case opt_target:
      s.limits.target_lufs = finite_threshold(number_option<double>("target", value),
                                              "--target");
      break;
    case opt_tolerance:
      s.limits.tolerance_lu = finite_threshold(number_option<double>("tolerance", value),
                                               "--tolerance");
      if (s.limits.tolerance_lu < 0.0)
        throw runtime_error("Invalid --tolerance value: must be >= 0");
      break;
    case opt_ceiling:
      s.limits.true_peak_ceiling = finite_threshold(number_option<double>("ceiling", value),
                                                    "--ceiling");
      break;
    case opt_sample_rates:
      s.limits.allowed_sample_rates = parse_sample_rate_list(value);
      break;
    case opt_extensions:
      s.extensions = parse_extension_list(value);
      break;
    case opt_no_recursive:
      s.recursive = false;
      break;
    case opt_timeout: {
      const auto secs = number_option<long>("timeout", value);
      if (secs < 0) throw runtime_error("Invalid --timeout value: must be >= 0");
      s.timeout = std::chrono::seconds(secs);
      break;
    }
    case opt_ffmpeg:      s.ffmpeg = value; break;
    case opt_ffprobe:     s.ffprobe = value; break;
    case opt_output_dir:  s.output_dir = value; break;
    case opt_debug_dumps: s.debug_dumps = true; break;
    case opt_parallel:    s.parallel = true; break;
    case opt_verbose:     s.verbose = true; break;
    case opt_quiet:       s.quiet = true; break;
    default: break;
  }
}

settings resolve_settings(std::optional<std::filesystem::path> const &config_file,
                          std::vector<std::pair<int, string>> const &options)
{
  settings s;
  if (config_file) load_settings_file(s, *config_file);
  for (auto const &[id, value] : options) apply_option(s, id, value);
  return s;
}

} // namespace lufscheck
