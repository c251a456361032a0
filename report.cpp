#include "report.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <fstream>
#include <print>

#include <boost/math/statistics/univariate_statistics.hpp>

#include "classify.hpp"

namespace lufscheck {

namespace {

using std::optional, std::nullopt;
using std::println;
using std::string, std::string_view;
using std::vector;

template<typename T>
[[nodiscard]] string format_optional(optional<T> const &value)
{
  return value ? std::format("{}", *value) : string();
}

template<typename Projection>
[[nodiscard]] optional<double>
mean_of(vector<measurement_record> const &records, Projection project)
{
  vector<double> values;
  for (auto const &r : records)
    if (optional<double> v = project(r); v && std::isfinite(*v)) values.push_back(*v);
  if (values.empty()) return nullopt;
  return boost::math::statistics::mean(values);
}

[[nodiscard]] string_view status_class(verdict v) noexcept
{
  switch (v) {
    case verdict::ready:  return "ready";
    case verdict::adjust: return "adjust";
    case verdict::error:  return "error";
  }
  return "error";
}

constexpr string_view html_head = R"(<!DOCTYPE html>
<html lang="en">
<head>
<meta charset="utf-8">
<title>Loudness report</title>
<style>
body { font-family: sans-serif; margin: 2em; color: #222; }
table { border-collapse: collapse; font-size: 0.9em; }
th, td { border: 1px solid #ccc; padding: 4px 8px; text-align: right; }
th { background: #f0f0f0; }
td.name, td.path, td.issues { text-align: left; }
td.path { color: #666; font-size: 0.85em; }
td.ready { background: #c8e6c9; font-weight: bold; text-align: center; }
td.adjust { background: #ffe0b2; font-weight: bold; text-align: center; }
td.error { background: #ffcdd2; font-weight: bold; text-align: center; }
dl.summary { display: grid; grid-template-columns: max-content auto; gap: 2px 1em; }
dl.summary dt { font-weight: bold; }
dl.summary dd { margin: 0; }
</style>
</head>
<body>
)";

constexpr string_view html_legend = R"(<h2>Legend</h2>
<dl>
<dt>Integrated LUFS</dt>
<dd>Loudness of the whole file in LUFS (ITU-R BS.1770 / EBU R128).</dd>
<dt>Suggested gain</dt>
<dd>Gain in dB that brings the integrated loudness to the target. Advisory only.</dd>
<dt>True peak (dBTP)</dt>
<dd>Highest peak including inter-sample overs after reconstruction.</dd>
<dt>Sample peak (dBFS)</dt>
<dd>Highest raw sample value relative to digital full scale.</dd>
<dt>LRA (LU)</dt>
<dd>Loudness range: statistical spread of short-term loudness across the file.</dd>
<dt>Status</dt>
<dd>READY: all checks pass. ADJUST: measured, but at least one check fails.
ERROR: loudness analysis did not produce a complete result.</dd>
</dl>
)";

} // namespace

run_summary summarize(vector<measurement_record> const &records)
{
  run_summary s;
  s.files = records.size();
  for (auto const &r : records) {
    switch (r.result.status) {
      case verdict::ready:  ++s.ready; break;
      case verdict::adjust: ++s.adjust; break;
      case verdict::error:  ++s.error; break;
    }
  }
  s.mean_integrated_lufs = mean_of(records,
    [](measurement_record const &r) { return r.loudness.integrated_lufs; });
  s.mean_loudness_range_lu = mean_of(records,
    [](measurement_record const &r) { return r.loudness.loudness_range_lu; });
  return s;
}

void sort_records(vector<measurement_record> &records)
{
  std::ranges::sort(records, [](auto const &a, auto const &b) {
    if (a.file_name != b.file_name) return a.file_name < b.file_name;
    return a.file_path < b.file_path;
  });
}

string format_duration(optional<double> seconds)
{
  if (!seconds || !std::isfinite(*seconds) || *seconds < 0.0) return {};
  const long long total = std::llround(*seconds);
  return std::format("{:02d}:{:02d}", total / 60, total % 60);
}

string format_decimal(optional<double> value)
{
  return value ? std::format("{:.2f}", *value) : string();
}

string csv_field(string_view value)
{
  if (value.find_first_of(",\"\r\n") == string_view::npos) return string(value);

  string out = "\"";
  for (char c : value) {
    if (c == '"') out += "\"\"";
    else out += c;
  }
  out += '"';
  return out;
}

string html_escape(string_view value)
{
  string out;
  out.reserve(value.size());
  for (char c : value) {
    switch (c) {
      case '&':  out += "&amp;"; break;
      case '<':  out += "&lt;"; break;
      case '>':  out += "&gt;"; break;
      case '"':  out += "&quot;"; break;
      case '\'': out += "&#39;"; break;
      default:   out += c;
    }
  }
  return out;
}

void write_csv(std::ostream &out, vector<measurement_record> const &records)
{
  println(out, "File,Duration,SampleRate_Hz,Bitrate_kbps,BitDepth,Channels,Codec,"
               "IntegratedLUFS,SuggestedGain_dB,TruePeak_dBTP,SamplePeak_dBFS,LRA,"
               "Status,Issues,Path");

  for (auto const &r : records) {
    println(out, "{},{},{},{},{},{},{},{},{},{},{},{},{},{},{}",
      csv_field(r.file_name),
      format_duration(r.stream.duration_sec),
      format_optional(r.stream.sample_rate_hz),
      format_optional(r.stream.bitrate_kbps),
      format_optional(r.stream.bit_depth),
      format_optional(r.stream.channels),
      csv_field(r.stream.codec.value_or("")),
      format_decimal(r.loudness.integrated_lufs),
      format_decimal(r.result.suggested_gain_db),
      format_decimal(r.loudness.true_peak_dbtp),
      format_decimal(r.sample_peak_dbfs),
      format_decimal(r.loudness.loudness_range_lu),
      to_string(r.result.status),
      csv_field(join_issues(r.result.issues)),
      csv_field(r.file_path.string()));
  }
}

void write_html(std::ostream &out, vector<measurement_record> const &records,
                run_summary const &summary, thresholds const &limits,
                string_view generated_at)
{
  auto or_dash = [](string s) { return s.empty() ? string("&ndash;") : s; };

  out << html_head;
  println(out, "<h1>Loudness report</h1>");
  println(out, "<p>Generated {}</p>", html_escape(generated_at));

  string rates;
  for (int rate : limits.allowed_sample_rates) {
    if (!rates.empty()) rates += ", ";
    rates += std::to_string(rate);
  }

  println(out, "<h2>Summary</h2>");
  println(out, "<dl class=\"summary\">");
  println(out, "<dt>Files</dt><dd>{}</dd>", summary.files);
  println(out, "<dt>READY</dt><dd>{}</dd>", summary.ready);
  println(out, "<dt>ADJUST</dt><dd>{}</dd>", summary.adjust);
  println(out, "<dt>ERROR</dt><dd>{}</dd>", summary.error);
  println(out, "<dt>Average integrated loudness</dt><dd>{}</dd>",
          summary.mean_integrated_lufs
            ? std::format("{:.2f} LUFS", *summary.mean_integrated_lufs) : "n/a");
  println(out, "<dt>Average LRA</dt><dd>{}</dd>",
          summary.mean_loudness_range_lu
            ? std::format("{:.2f} LU", *summary.mean_loudness_range_lu) : "n/a");
  println(out, "<dt>Target</dt><dd>{} LUFS &plusmn; {} LU</dd>",
          limits.target_lufs, limits.tolerance_lu);
  println(out, "<dt>True-peak ceiling</dt><dd>{} dBTP</dd>", limits.true_peak_ceiling);
  println(out, "<dt>Allowed sample rates</dt><dd>{} Hz</dd>", rates);
  println(out, "</dl>");

  println(out, "<h2>Files</h2>");
  println(out, "<table>");
  println(out, "<tr><th>File</th><th>Duration</th><th>Sample rate (Hz)</th>"
               "<th>Bitrate (kbps)</th><th>Bit depth</th><th>Channels</th>"
               "<th>Codec</th><th>Integrated LUFS</th><th>Suggested gain (dB)</th>"
               "<th>True peak (dBTP)</th><th>Sample peak (dBFS)</th><th>LRA (LU)</th>"
               "<th>Status</th><th>Issues</th><th>Path</th></tr>");

  for (auto const &r : records) {
    println(out, "<tr><td class=\"name\">{}</td><td>{}</td><td>{}</td><td>{}</td>"
                 "<td>{}</td><td>{}</td><td>{}</td><td>{}</td><td>{}</td>"
                 "<td>{}</td><td>{}</td><td>{}</td><td class=\"{}\">{}</td>"
                 "<td class=\"issues\">{}</td><td class=\"path\">{}</td></tr>",
      html_escape(r.file_name),
      or_dash(format_duration(r.stream.duration_sec)),
      or_dash(format_optional(r.stream.sample_rate_hz)),
      or_dash(format_optional(r.stream.bitrate_kbps)),
      or_dash(format_optional(r.stream.bit_depth)),
      or_dash(format_optional(r.stream.channels)),
      or_dash(html_escape(r.stream.codec.value_or(""))),
      or_dash(format_decimal(r.loudness.integrated_lufs)),
      or_dash(format_decimal(r.result.suggested_gain_db)),
      or_dash(format_decimal(r.loudness.true_peak_dbtp)),
      or_dash(format_decimal(r.sample_peak_dbfs)),
      or_dash(format_decimal(r.loudness.loudness_range_lu)),
      status_class(r.result.status), to_string(r.result.status),
      html_escape(join_issues(r.result.issues, ", ")),
      html_escape(r.file_path.string()));
  }

  println(out, "</table>");
  out << html_legend;
  println(out, "</body>");
  println(out, "</html>");
}

void save_csv(std::filesystem::path const &file, vector<measurement_record> const &records)
{
  std::ofstream out;
  out.exceptions(std::ofstream::failbit | std::ofstream::badbit);
  out.open(file, std::ios::trunc);
  write_csv(out, records);
}

void save_html(std::filesystem::path const &file,
               vector<measurement_record> const &records,
               run_summary const &summary, thresholds const &limits,
               string_view generated_at)
{
  std::ofstream out;
  out.exceptions(std::ofstream::failbit | std::ofstream::badbit);
  out.open(file, std::ios::trunc);
  write_html(out, records, summary, limits, generated_at);
}

} // namespace lufscheck
