// Batch loudness compliance checker built on ffmpeg's loudnorm and astats

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <execution>
#include <filesystem>
#include <format>
#include <iostream>
#include <mutex>
#include <optional>
#include <print>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <getopt.h>

#include "analyzer.hpp"
#include "classify.hpp"
#include "inputs.hpp"
#include "measurement.hpp"
#include "process.hpp"
#include "report.hpp"
#include "settings.hpp"

namespace {

using namespace lufscheck;
using std::cerr, std::cout;
using std::filesystem::path;
using std::optional;
using std::println;
using std::string;
using std::vector;

void usage(std::ostream &out)
{
  out << "Usage: lufscheck [options] [path ...]\n"
         "Paths may be files or directories (default: current directory).\n"
         "  @list.txt reads one path per line; 'a.wav;b.wav' is split on ';'.\n"
         "Options:\n"
         "  --config <file.json>     Load settings; command-line options win\n"
         "  --target <LUFS>          Integrated loudness target (default -14)\n"
         "  --tolerance <LU>         Allowed deviation from target (default 0.5)\n"
         "  --ceiling <dBTP>         True-peak ceiling (default -1)\n"
         "  --sample-rates <list>    Allowed sample rates (default 44100,48000)\n"
         "  --extensions <list>      File extensions to scan (default wav,flac,mp3,...)\n"
         "  --no-recursive           Do not descend into subdirectories\n"
         "  --timeout <seconds>      Limit per ffmpeg/ffprobe call, 0 = none (default 600)\n"
         "  --ffmpeg <program>       ffmpeg executable\n"
         "  --ffprobe <program>      ffprobe executable\n"
         "  -o, --output-dir <dir>   Where reports and debug dumps go (default .)\n"
         "  --csv <file>             CSV report path (default <dir>/loudness_report.csv)\n"
         "  --html <file>            HTML report path (default <dir>/loudness_report.html)\n"
         "  --debug-dumps            Save ffmpeg output when extraction fails\n"
         "  --parallel               Analyse files concurrently\n"
         "  -v, --verbose            Print engine command lines and failures\n"
         "  -q, --quiet              Only print the final summary\n"
         "  -h, --help               Show this help\n";
}

void print_progress(settings const &config, size_t index, size_t total,
                    measurement_record const &record)
{
  if (config.quiet) return;
  const auto &lufs = record.loudness.integrated_lufs;
  println(cout, "[{}/{}] {:<6} {:>8}  {}  ({})",
          index, total, to_string(record.result.status),
          lufs ? std::format("{:.2f}", *lufs) : string("--"),
          record.file_name, join_issues(record.result.issues, ", "));
}

[[nodiscard]] vector<measurement_record>
analyze_all(settings const &config, vector<path> const &files, string const &stamp)
{
  const analyzer engine(config, stamp);
  vector<measurement_record> records(files.size());

  if (!config.parallel) {
    for (size_t i = 0; i < files.size(); ++i) {
      records[i] = engine.analyze(files[i]);
      print_progress(config, i + 1, files.size(), records[i]);
    }
    return records;
  }

  std::mutex progress_mutex;
  std::atomic<size_t> done{0};
  std::transform(std::execution::par, files.begin(), files.end(), records.begin(),
    [&](path const &file) {
      auto record = engine.analyze(file);
      std::lock_guard lock(progress_mutex);
      print_progress(config, ++done, files.size(), record);
      return record;
    }
  );
  return records;
}

} // namespace

int main(int argc, char** argv)
{
  settings config;
  optional<path> config_file;
  optional<path> csv_path;
  optional<path> html_path;
  vector<std::pair<int, string>> cli_options;

  static struct option long_options[] = {
    {"config",       required_argument, nullptr, opt_config},
    {"target",       required_argument, nullptr, opt_target},
    {"tolerance",    required_argument, nullptr, opt_tolerance},
    {"ceiling",      required_argument, nullptr, opt_ceiling},
    {"sample-rates", required_argument, nullptr, opt_sample_rates},
    {"extensions",   required_argument, nullptr, opt_extensions},
    {"no-recursive", no_argument,       nullptr, opt_no_recursive},
    {"timeout",      required_argument, nullptr, opt_timeout},
    {"ffmpeg",       required_argument, nullptr, opt_ffmpeg},
    {"ffprobe",      required_argument, nullptr, opt_ffprobe},
    {"output-dir",   required_argument, nullptr, opt_output_dir},
    {"csv",          required_argument, nullptr, opt_csv},
    {"html",         required_argument, nullptr, opt_html},
    {"debug-dumps",  no_argument,       nullptr, opt_debug_dumps},
    {"parallel",     no_argument,       nullptr, opt_parallel},
    {"verbose",      no_argument,       nullptr, opt_verbose},
    {"quiet",        no_argument,       nullptr, opt_quiet},
    {"help",         no_argument,       nullptr, 'h'},
    {nullptr,        0,                 nullptr,  0 }
  };

  // Collect first so that --config is loaded before any other option is
  // applied, whatever the order on the command line.
  int opt;
  int option_index = 0;
  while ((opt = getopt_long(argc, argv, "o:vqh", long_options, &option_index)) != -1) {
    switch (opt) {
      case 'h':
        usage(cout);
        return EXIT_SUCCESS;
      case opt_config:
        config_file = path(optarg);
        break;
      case opt_csv:
        csv_path = path(optarg);
        break;
      case opt_html:
        html_path = path(optarg);
        break;
      case '?':
        usage(cerr);
        return EXIT_FAILURE;
      default:
        cli_options.emplace_back(opt, optarg ? optarg : "");
        break;
    }
  }

  try {
    config = resolve_settings(config_file, cli_options);
  } catch (const std::exception &e) {
    println(cerr, "{}", e.what());
    return EXIT_FAILURE;
  }

  // Nothing works without the engine; fail before touching any file.
  for (auto const *program : {&config.ffprobe, &config.ffmpeg}) {
    auto found = find_executable(*program);
    if (!found) {
      println(cerr, "Error: '{}' not found. Install FFmpeg or pass --ffmpeg/--ffprobe.",
              *program);
      return EXIT_FAILURE;
    }
    if (config.verbose) println(cerr, "Using {}", found->generic_string());
  }

  vector<path> files;
  try {
    const auto roots = expand_arguments(vector<string>(argv + optind, argv + argc));
    files = collect_audio_files(roots, config.extensions, config.recursive);
  } catch (const std::exception &e) {
    println(cerr, "{}", e.what());
    return EXIT_FAILURE;
  }

  if (files.empty()) {
    println(cout, "No supported audio files found.");
    return EXIT_SUCCESS;
  }

  std::error_code ec;
  std::filesystem::create_directories(config.output_dir, ec);
  if (ec) {
    println(cerr, "Cannot create output directory {}: {}",
            config.output_dir.generic_string(), ec.message());
    return EXIT_FAILURE;
  }

  const string stamp = run_timestamp();
  if (!config.quiet)
    println(cout, "Analysing {} file(s), target {} LUFS +/- {} LU, ceiling {} dBTP",
            files.size(), config.limits.target_lufs, config.limits.tolerance_lu,
            config.limits.true_peak_ceiling);

  auto records = analyze_all(config, files, stamp);
  sort_records(records);
  const run_summary summary = summarize(records);

  const path csv_out = csv_path.value_or(config.output_dir / "loudness_report.csv");
  const path html_out = html_path.value_or(config.output_dir / "loudness_report.html");
  try {
    save_csv(csv_out, records);
    save_html(html_out, records, summary, config.limits, stamp);
  } catch (const std::exception &e) {
    println(cerr, "Failed to write report: {}", e.what());
    return EXIT_FAILURE;
  }

  println(cout, "{} file(s): {} READY, {} ADJUST, {} ERROR",
          summary.files, summary.ready, summary.adjust, summary.error);
  if (summary.mean_integrated_lufs)
    println(cout, "Average integrated loudness: {:.2f} LUFS", *summary.mean_integrated_lufs);
  if (summary.mean_loudness_range_lu)
    println(cout, "Average LRA: {:.2f} LU", *summary.mean_loudness_range_lu);
  println(cout, "Wrote {}", csv_out.generic_string());
  println(cout, "Wrote {}", html_out.generic_string());

  return EXIT_SUCCESS;
}
