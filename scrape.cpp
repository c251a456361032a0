#include "scrape.hpp"

#include <algorithm>
#include <cmath>

#include <nlohmann/json.hpp>

#include "text.hpp"

namespace lufscheck {

namespace {

using nlohmann::json;
using std::optional, std::nullopt;
using std::string, std::string_view;
using std::unexpected;

// ffprobe and loudnorm print numbers as strings ("48000", "-14.20") and
// sometimes as plain numbers. Accept both; reject "N/A" and friends.
[[nodiscard]] optional<double> json_number(json const &obj, const char *key)
{
  if (!obj.is_object()) return nullopt;
  auto it = obj.find(key);
  if (it == obj.end()) return nullopt;
  if (it->is_number()) return it->get<double>();
  if (it->is_string()) {
    auto v = parse_number<double>(trim(it->get_ref<string const &>()));
    if (v && std::isfinite(*v)) return *v;
  }
  return nullopt;
}

[[nodiscard]] optional<int> json_int(json const &obj, const char *key)
{
  auto v = json_number(obj, key);
  if (!v) return nullopt;
  return static_cast<int>(std::lround(*v));
}

[[nodiscard]] optional<int> positive(optional<int> v)
{
  if (v && *v > 0) return v;
  return nullopt;
}

} // namespace

std::vector<string_view> split_lines(string_view text)
{
  std::vector<string_view> lines;
  size_t start = 0;
  while (start < text.size()) {
    const auto end = text.find_first_of("\r\n", start);
    if (end == string_view::npos) {
      lines.push_back(text.substr(start));
      break;
    }
    lines.push_back(text.substr(start, end - start));
    start = end + 1;
    if (text[end] == '\r' && start < text.size() && text[start] == '\n')
      ++start;
  }
  return lines;
}

optional<string>
extract_json_block(std::vector<string_view> const &lines, string_view signature)
{
  auto key = std::ranges::find_if(lines,
    [&](string_view line) { return line.find(signature) != string_view::npos; });
  if (key == lines.end()) return nullopt;

  const auto key_index = static_cast<size_t>(key - lines.begin());

  optional<size_t> open;
  for (size_t i = key_index + 1; i-- > 0;) {
    if (lines[i].find('{') != string_view::npos) { open = i; break; }
  }

  optional<size_t> close;
  for (size_t i = key_index; i < lines.size(); ++i) {
    if (lines[i].find('}') != string_view::npos) { close = i; break; }
  }

  if (!open || !close) return nullopt;

  // On the signature line itself the braces must bracket the key.
  string_view first = lines[*open];
  string_view last = lines[*close];
  const auto brace_open = *open == key_index
    ? first.rfind('{', first.find(signature)) : first.rfind('{');
  if (brace_open == string_view::npos) return nullopt;

  string block;
  if (*open == *close) {
    const auto brace_close = last.find('}', brace_open);
    if (brace_close == string_view::npos) return nullopt;
    return string(first.substr(brace_open, brace_close - brace_open + 1));
  }

  block += first.substr(brace_open);
  for (size_t i = *open + 1; i < *close; ++i) {
    block += '\n';
    block += lines[i];
  }
  block += '\n';
  block += last.substr(0, last.find('}') + 1);
  return block;
}

std::expected<loudness_facts, string> parse_loudnorm_json(string_view payload)
{
  json j = json::parse(payload, nullptr, false);
  if (j.is_discarded()) return unexpected(string("loudnorm block is not valid JSON"));
  if (!j.is_object()) return unexpected(string("loudnorm block is not an object"));

  loudness_facts facts{
    .integrated_lufs   = json_number(j, "input_i"),
    .true_peak_dbtp    = json_number(j, "input_tp"),
    .loudness_range_lu = json_number(j, "input_lra"),
  };
  if (!facts.complete())
    return unexpected(string("loudnorm block lacks input_i/input_tp/input_lra"));
  return facts;
}

std::vector<double> scrape_peak_levels(string_view text)
{
  std::vector<double> levels;
  for (auto line : split_lines(text)) {
    for (auto pos = line.find(peak_level_key); pos != string_view::npos;
         pos = line.find(peak_level_key, pos + 1)) {
      auto value = line.substr(pos + peak_level_key.size());
      value = value.substr(0, value.find_first_of(" \t"));
      if (auto v = parse_number<double>(value); v && !std::isnan(*v))
        levels.push_back(*v);
    }
  }
  return levels;
}

optional<double> max_peak_level(string_view text)
{
  auto levels = scrape_peak_levels(text);
  if (levels.empty()) return nullopt;
  const double peak = std::ranges::max(levels);
  return std::isfinite(peak) ? round2(peak) : peak;
}

stream_facts parse_probe_json(string_view text)
{
  stream_facts facts;

  json j = json::parse(text, nullptr, false);
  if (j.is_discarded() || !j.is_object()) return facts;

  static const json empty = json::object();
  json const &format = j.contains("format") ? j["format"] : empty;
  json const *stream = &empty;
  if (auto it = j.find("streams");
      it != j.end() && it->is_array() && !it->empty())
    stream = &it->front();

  facts.duration_sec = json_number(format, "duration");
  facts.sample_rate_hz = positive(json_int(*stream, "sample_rate"));
  facts.channels = positive(json_int(*stream, "channels"));

  facts.bit_depth = positive(json_int(*stream, "bits_per_sample"));
  if (!facts.bit_depth)
    facts.bit_depth = positive(json_int(*stream, "bits_per_raw_sample"));

  if (stream->is_object()) {
    if (auto it = stream->find("codec_name");
        it != stream->end() && it->is_string() && !it->get_ref<string const &>().empty())
      facts.codec = it->get<string>();
  }

  auto bitrate = json_number(*stream, "bit_rate");
  if (!bitrate || *bitrate <= 0.0) bitrate = json_number(format, "bit_rate");
  if (bitrate && *bitrate > 0.0)
    facts.bitrate_kbps = static_cast<int>(std::lround(*bitrate / 1000.0));

  return facts;
}

} // namespace lufscheck
