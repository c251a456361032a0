#include "analyzer.hpp"

#include <chrono>
#include <ctime>
#include <format>
#include <fstream>
#include <iostream>
#include <print>

#include "classify.hpp"
#include "process.hpp"
#include "scrape.hpp"

namespace lufscheck {

namespace {

using std::cerr;
using std::filesystem::path;
using std::optional, std::nullopt;
using std::println;
using std::string, std::string_view;
using std::unexpected;
using std::vector;

} // namespace

vector<string> probe_command(string const &ffprobe, path const &file)
{
  return {
    ffprobe, "-v", "error",
    "-select_streams", "a:0",
    "-show_entries",
    "format=duration,bit_rate:stream=sample_rate,bits_per_sample,"
    "bits_per_raw_sample,channels,codec_name,bit_rate",
    "-of", "json",
    file.string()
  };
}

vector<string>
loudnorm_command(string const &ffmpeg, path const &file, thresholds const &limits)
{
  return {
    ffmpeg, "-hide_banner", "-nostats",
    "-i", file.string(),
    "-af", std::format("loudnorm=I={}:TP={}:LRA={}:print_format=json",
                       limits.target_lufs, limits.true_peak_ceiling,
                       limits.loudness_range_target),
    "-f", "null", "-"
  };
}

vector<string> sample_peak_command(string const &ffmpeg, path const &file)
{
  return {
    ffmpeg, "-hide_banner", "-nostats",
    "-i", file.string(),
    "-af", "astats=metadata=1:reset=0,"
           "ametadata=print:key=lavfi.astats.Overall.Peak_level",
    "-f", "null", "-"
  };
}

std::expected<loudness_facts, loudnorm_failure> scrape_loudnorm(string_view output)
{
  const auto lines = split_lines(output);
  auto span = extract_json_block(lines, loudnorm_signature);
  if (!span)
    return unexpected(loudnorm_failure{"no loudnorm JSON block in output", nullopt});

  auto facts = parse_loudnorm_json(*span);
  if (!facts)
    return unexpected(loudnorm_failure{facts.error(), std::move(span)});
  return *facts;
}

string run_timestamp()
{
  const std::time_t now = std::chrono::system_clock::to_time_t(
    std::chrono::system_clock::now());
  std::tm local{};
  localtime_r(&now, &local);
  char buf[32];
  std::strftime(buf, sizeof buf, "%Y%m%d_%H%M%S", &local);
  return buf;
}

analyzer::analyzer(settings const &config, string run_stamp)
: config_(config), run_stamp_(std::move(run_stamp))
{}

optional<string>
analyzer::run(vector<string> const &argv, path const &file) const
{
  if (config_.verbose) println(cerr, "  $ {}", format_command(argv));

  auto result = run_process(argv, config_.timeout);
  if (!result) {
    println(cerr, "Warning: {}", result.error());
    return nullopt;
  }
  if (result->timed_out) {
    println(cerr, "Warning: {} timed out after {}s on {}",
            argv.front(), config_.timeout.count(), file.generic_string());
  } else if (result->exit_code != 0 && config_.verbose) {
    println(cerr, "  {} exited with status {}", argv.front(), result->exit_code);
  }
  return std::move(result->output);
}

void analyzer::dump(path const &file, string_view stage,
                    string_view extension, string_view text) const
{
  if (!config_.debug_dumps) return;

  const path dir = config_.output_dir / "debug";
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    println(cerr, "Warning: cannot create {}: {}", dir.generic_string(), ec.message());
    return;
  }

  const path out_path = dir / std::format("{}_{}_{}.{}",
    file.stem().string(), stage, run_stamp_, extension);
  std::ofstream out(out_path, std::ios::trunc | std::ios::binary);
  if (!out) {
    println(cerr, "Warning: failed to write debug dump {}", out_path.generic_string());
    return;
  }
  out << text;
  if (config_.verbose) println(cerr, "  wrote {}", out_path.generic_string());
}

stream_facts analyzer::probe(path const &file) const
{
  auto output = run(probe_command(config_.ffprobe, file), file);
  if (!output) return {};

  // ffprobe -v error may still print warnings ahead of the JSON document.
  string_view text = *output;
  if (auto brace = text.find('{'); brace != string_view::npos)
    text.remove_prefix(brace);
  return parse_probe_json(text);
}

loudness_facts analyzer::measure_loudness(path const &file) const
{
  auto output = run(loudnorm_command(config_.ffmpeg, file, config_.limits), file);
  if (!output) return {};

  auto facts = scrape_loudnorm(*output);
  if (facts) return *facts;

  if (config_.verbose)
    println(cerr, "  loudness: {}: {}", file.filename().string(), facts.error().reason);
  dump(file, "loudnorm", "log", *output);
  if (facts.error().span) dump(file, "loudnorm", "json", *facts.error().span);
  return {};
}

optional<double> analyzer::measure_sample_peak(path const &file) const
{
  auto output = run(sample_peak_command(config_.ffmpeg, file), file);
  if (!output) return nullopt;

  auto peak = max_peak_level(*output);
  if (!peak) {
    if (config_.verbose)
      println(cerr, "  sample peak: {}: no peak level in output", file.filename().string());
    dump(file, "astats", "log", *output);
  }
  return peak;
}

measurement_record analyzer::analyze(path const &file) const
{
  // The engine gets an absolute path: a relative "take:1.wav" would be read
  // as a URL protocol and "-x.wav" as an option.
  std::error_code ec;
  path absolute = std::filesystem::absolute(file, ec);
  if (ec) absolute = file;
  absolute = absolute.lexically_normal();

  auto stream = probe(absolute);
  auto loudness = measure_loudness(absolute);
  auto sample_peak = measure_sample_peak(absolute);
  auto result = classify(loudness, stream.sample_rate_hz, config_.limits);

  return measurement_record{
    .file_name = file.filename().string(),
    .file_path = absolute,
    .stream = std::move(stream),
    .loudness = loudness,
    .sample_peak_dbfs = sample_peak,
    .result = std::move(result),
  };
}

} // namespace lufscheck
