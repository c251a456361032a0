#ifndef LUFSCHECK_ANALYZER_HPP
#define LUFSCHECK_ANALYZER_HPP

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "measurement.hpp"
#include "settings.hpp"

namespace lufscheck {

// Engine command lines. Kept separate so the exact invocation is testable.
[[nodiscard]] std::vector<std::string>
probe_command(std::string const &ffprobe, std::filesystem::path const &file);

[[nodiscard]] std::vector<std::string>
loudnorm_command(std::string const &ffmpeg, std::filesystem::path const &file,
                 thresholds const &limits);

[[nodiscard]] std::vector<std::string>
sample_peak_command(std::string const &ffmpeg, std::filesystem::path const &file);

// Why a loudnorm scrape failed, plus the span that was found (if any) so it
// can be dumped next to the raw log.
struct loudnorm_failure {
  std::string reason;
  std::optional<std::string> span;
};

// Pull integrated loudness, true peak and LRA out of ffmpeg's log.
[[nodiscard]] std::expected<loudness_facts, loudnorm_failure>
scrape_loudnorm(std::string_view output);

// Local time as "20240131_235959"; one per run, shared by all dumps.
[[nodiscard]] std::string run_timestamp();

// Runs the probe, loudnorm and astats passes for one file at a time.
// Holds no per-file state, so one instance may serve several threads.
class analyzer {
public:
  analyzer(settings const &config, std::string run_stamp);

  [[nodiscard]] stream_facts probe(std::filesystem::path const &file) const;

  [[nodiscard]] loudness_facts
  measure_loudness(std::filesystem::path const &file) const;

  [[nodiscard]] std::optional<double>
  measure_sample_peak(std::filesystem::path const &file) const;

  // Full pipeline for one file. Never throws for per-file problems; they end
  // up as empty fields and an ERROR verdict.
  [[nodiscard]] measurement_record
  analyze(std::filesystem::path const &file) const;

private:
  [[nodiscard]] std::optional<std::string>
  run(std::vector<std::string> const &argv,
      std::filesystem::path const &file) const;

  void dump(std::filesystem::path const &file, std::string_view stage,
            std::string_view extension, std::string_view text) const;

  settings const &config_;
  std::string run_stamp_;
};

} // namespace lufscheck

#endif
