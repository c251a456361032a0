#ifndef LUFSCHECK_REPORT_HPP
#define LUFSCHECK_REPORT_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "measurement.hpp"
#include "settings.hpp"

namespace lufscheck {

struct run_summary {
  size_t files = 0;
  size_t ready = 0;
  size_t adjust = 0;
  size_t error = 0;
  std::optional<double> mean_integrated_lufs;
  std::optional<double> mean_loudness_range_lu;
};

[[nodiscard]] run_summary summarize(std::vector<measurement_record> const &records);

// Order records by file name, then by path.
void sort_records(std::vector<measurement_record> &records);

// 75.4 -> "01:15", 3725 -> "62:05". Empty when unknown.
[[nodiscard]] std::string format_duration(std::optional<double> seconds);

// Two decimals, or empty when unknown.
[[nodiscard]] std::string format_decimal(std::optional<double> value);

[[nodiscard]] std::string csv_field(std::string_view value);
[[nodiscard]] std::string html_escape(std::string_view value);

void write_csv(std::ostream &out, std::vector<measurement_record> const &records);

void write_html(std::ostream &out, std::vector<measurement_record> const &records,
                run_summary const &summary, thresholds const &limits,
                std::string_view generated_at);

// File variants. Throw std::ios_base::failure when the file cannot be written.
void save_csv(std::filesystem::path const &file,
              std::vector<measurement_record> const &records);

void save_html(std::filesystem::path const &file,
               std::vector<measurement_record> const &records,
               run_summary const &summary, thresholds const &limits,
               std::string_view generated_at);

} // namespace lufscheck

#endif
