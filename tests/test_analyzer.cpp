#include <catch2/catch.hpp>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iterator>
#include <string>

#include "analyzer.hpp"
#include "process.hpp"
#include "temp_dir.hpp"

using namespace lufscheck;

namespace {

const char *fake_ffprobe = R"(cat <<'EOF'
{
    "programs": [

    ],
    "streams": [
        {
            "codec_name": "pcm_s24le",
            "sample_rate": "48000",
            "channels": 2,
            "bits_per_sample": 24,
            "bit_rate": "2304000"
        }
    ],
    "format": {
        "duration": "192.480000",
        "bit_rate": "2304218"
    }
}
EOF
)";

// loudnorm writes its report to stderr; the runner must capture both streams.
const char *fake_ffmpeg = R"(case "$*" in
  *loudnorm=I=-14:TP=-1:LRA=8:print_format=json*)
    echo "size=N/A time=00:03:12.48 bitrate=N/A speed= 410x"
    cat >&2 <<'EOF'
[Parsed_loudnorm_0 @ 0x55d1c1a3b2c0]
{
	"input_i" : "-14.00",
	"input_tp" : "-1.00",
	"input_lra" : "6.00",
	"input_thresh" : "-24.10",
	"output_i" : "-14.00",
	"output_tp" : "-1.00",
	"output_lra" : "6.00",
	"output_thresh" : "-24.10",
	"normalization_type" : "dynamic",
	"target_offset" : "0.00"
}
EOF
    ;;
  *astats*)
    printf 'frame:0 pts:0\nlavfi.astats.Overall.Peak_level=-6.000000\n' >&2
    printf 'frame:1 pts:4096\nlavfi.astats.Overall.Peak_level=-3.254000\n' >&2
    ;;
  *)
    echo "unexpected arguments: $*" >&2
    exit 1
    ;;
esac
)";

settings fake_engine(temp_dir const &dir, const char *ffmpeg_body)
{
  settings s;
  s.ffprobe = dir.script("bin/ffprobe", fake_ffprobe).string();
  s.ffmpeg = dir.script("bin/ffmpeg", ffmpeg_body).string();
  s.output_dir = dir.path() / "out";
  s.timeout = std::chrono::seconds(20);
  return s;
}

// Switch the working directory for the lifetime of the object.
class working_dir {
  std::filesystem::path saved_ = std::filesystem::current_path();

public:
  explicit working_dir(std::filesystem::path const &dir)
  {
    std::filesystem::current_path(dir);
  }
  ~working_dir()
  {
    std::error_code ec;
    std::filesystem::current_path(saved_, ec);
  }

  working_dir(const working_dir&) = delete;
  working_dir& operator=(const working_dir&) = delete;
};

std::vector<std::string> read_lines(std::filesystem::path const &file)
{
  std::ifstream in(file);
  std::vector<std::string> lines;
  for (std::string line; std::getline(in, line);) lines.push_back(line);
  return lines;
}

} // namespace

TEST_CASE("Engine command lines") {
  thresholds limits;
  limits.target_lufs = -16.0;
  limits.true_peak_ceiling = -1.5;

  auto loud = loudnorm_command("ffmpeg", "/music/a b.flac", limits);
  REQUIRE(loud == std::vector<std::string>{
    "ffmpeg", "-hide_banner", "-nostats", "-i", "/music/a b.flac",
    "-af", "loudnorm=I=-16:TP=-1.5:LRA=8:print_format=json",
    "-f", "null", "-"});

  auto peak = sample_peak_command("ffmpeg", "x.wav");
  REQUIRE(std::ranges::find(peak,
    "astats=metadata=1:reset=0,ametadata=print:key=lavfi.astats.Overall.Peak_level")
    != peak.end());

  auto probe = probe_command("ffprobe", "x.wav");
  REQUIRE(probe.front() == "ffprobe");
  REQUIRE(probe.back() == "x.wav");
  REQUIRE(std::ranges::find(probe, "json") != probe.end());
}

TEST_CASE("scrape_loudnorm keeps the span for dumping") {
  auto ok = scrape_loudnorm("{\n\"input_i\" : \"-1\", \"input_tp\" : \"-2\", \"input_lra\" : \"3\"\n}\n");
  REQUIRE(ok);
  REQUIRE(*ok->loudness_range_lu == Approx(3.0));

  auto missing = scrape_loudnorm("no json at all\n");
  REQUIRE_FALSE(missing);
  REQUIRE_FALSE(missing.error().span);

  auto broken = scrape_loudnorm("{\n\"input_i\" : nope\n}\n");
  REQUIRE_FALSE(broken);
  REQUIRE(broken.error().span);
  REQUIRE(*broken.error().span == "{\n\"input_i\" : nope\n}");
}

TEST_CASE("Run timestamp format") {
  auto stamp = run_timestamp();
  REQUIRE(stamp.size() == 15);
  REQUIRE(stamp[8] == '_');
}

TEST_CASE("Full pipeline against a scripted engine") {
  temp_dir dir;
  const auto config = fake_engine(dir, fake_ffmpeg);
  const auto song = dir.write("music/song.wav");

  const analyzer engine(config, "20240101_120000");
  const auto record = engine.analyze(song);

  REQUIRE(record.file_name == "song.wav");
  REQUIRE(record.file_path.is_absolute());

  REQUIRE(record.stream.sample_rate_hz == 48000);
  REQUIRE(record.stream.bit_depth == 24);
  REQUIRE(record.stream.channels == 2);
  REQUIRE(record.stream.codec == "pcm_s24le");
  REQUIRE(record.stream.bitrate_kbps == 2304);
  REQUIRE(*record.stream.duration_sec == Approx(192.48));

  REQUIRE(*record.loudness.integrated_lufs == Approx(-14.0));
  REQUIRE(*record.loudness.true_peak_dbtp == Approx(-1.0));
  REQUIRE(*record.loudness.loudness_range_lu == Approx(6.0));
  REQUIRE(*record.sample_peak_dbfs == Approx(-3.25));

  REQUIRE(record.result.status == verdict::ready);
  REQUIRE(record.result.issues.empty());
  REQUIRE(*record.result.suggested_gain_db == Approx(0.0));

  // Nothing failed, so nothing was dumped.
  REQUIRE_FALSE(std::filesystem::exists(config.output_dir / "debug"));
}

TEST_CASE("Broken loudnorm output becomes ERROR and a debug dump") {
  temp_dir dir;
  auto config = fake_engine(dir, R"(case "$*" in
  *loudnorm*) printf '[Parsed_loudnorm_0 @ 0x1]\n{\n\t"input_i" : "-14.00",\n\t"input_tp" :\n}\n' >&2 ;;
  *astats*) echo 'lavfi.astats.Overall.Peak_level=-2.0' >&2 ;;
esac
)");
  config.debug_dumps = true;
  const auto song = dir.write("Take 3.flac");

  const analyzer engine(config, "20240101_120000");
  const auto record = engine.analyze(song);

  REQUIRE(record.result.status == verdict::error);
  REQUIRE(record.result.issues == std::vector<issue>{issue::analysis_error});
  REQUIRE_FALSE(record.loudness.integrated_lufs);
  REQUIRE(*record.sample_peak_dbfs == Approx(-2.0));
  REQUIRE(record.stream.sample_rate_hz == 48000);

  const auto debug = config.output_dir / "debug";
  REQUIRE(std::filesystem::exists(debug / "Take 3_loudnorm_20240101_120000.log"));
  REQUIRE(std::filesystem::exists(debug / "Take 3_loudnorm_20240101_120000.json"));
}

TEST_CASE("Dumps are off by default") {
  temp_dir dir;
  const auto config = fake_engine(dir, "echo nothing useful >&2\n");
  const auto song = dir.write("a.wav");

  const auto record = analyzer(config, "stamp").analyze(song);
  REQUIRE(record.result.status == verdict::error);
  REQUIRE_FALSE(record.sample_peak_dbfs);
  REQUIRE_FALSE(std::filesystem::exists(config.output_dir / "debug"));
}

TEST_CASE("A hung engine is cut off by the timeout") {
  temp_dir dir;
  auto config = fake_engine(dir, "exec sleep 30\n");
  config.timeout = std::chrono::seconds(1);
  const auto song = dir.write("slow.wav");

  const auto started = std::chrono::steady_clock::now();
  const auto record = analyzer(config, "stamp").analyze(song);
  const auto elapsed = std::chrono::steady_clock::now() - started;

  REQUIRE(record.result.status == verdict::error);
  REQUIRE(elapsed < std::chrono::seconds(15));
}

TEST_CASE("Missing engine binary leaves every measurement empty") {
  temp_dir dir;
  settings config;
  config.ffprobe = (dir.path() / "missing-ffprobe").string();
  config.ffmpeg = (dir.path() / "missing-ffmpeg").string();
  const auto song = dir.write("a.wav");

  const auto record = analyzer(config, "stamp").analyze(song);
  REQUIRE_FALSE(record.stream.sample_rate_hz);
  REQUIRE_FALSE(record.loudness.integrated_lufs);
  REQUIRE_FALSE(record.sample_peak_dbfs);
  REQUIRE(record.result.status == verdict::error);
}

TEST_CASE("The engine is handed absolute paths") {
  temp_dir dir;
  settings config = fake_engine(dir, fake_ffmpeg);
  // Same engines, but each also records its arguments one per line.
  config.ffprobe = dir.script("bin/ffprobe",
    std::string("printf '%s\\n' \"$@\" >> \"$0.args\"\n") + fake_ffprobe).string();
  config.ffmpeg = dir.script("bin/ffmpeg",
    std::string("printf '%s\\n' \"$@\" >> \"$0.args\"\n") + fake_ffmpeg).string();

  const auto colon = dir.write("music/take:1.wav");
  const auto dash = dir.write("music/-x.wav");

  for (auto const &song : {colon, dash}) {
    std::filesystem::remove(config.ffprobe + ".args");
    std::filesystem::remove(config.ffmpeg + ".args");

    measurement_record record;
    {
      working_dir cwd(dir.path() / "music");
      record = analyzer(config, "stamp").analyze(song.filename());
    }

    REQUIRE(record.file_name == song.filename().string());
    REQUIRE(record.file_path == song);
    REQUIRE(record.result.status == verdict::ready);

    const auto probe_args = read_lines(config.ffprobe + ".args");
    REQUIRE_FALSE(probe_args.empty());
    REQUIRE(probe_args.back() == song.string());

    const auto ffmpeg_args = read_lines(config.ffmpeg + ".args");
    REQUIRE(std::ranges::count(ffmpeg_args, song.string()) == 2);
    REQUIRE(std::ranges::count(ffmpeg_args, song.filename().string()) == 0);
  }
}

TEST_CASE("A loudnorm report written in bursts is scraped whole") {
  temp_dir dir;
  const auto engine = dir.script("bin/ffmpeg",
    "printf '[Parsed_loudnorm_0 @ 0x55d1c1a3b2c0]\\n{\\n\\t\"input_i\" : ' >&2\n"
    "sleep 0.2\n"
    "printf '\"-9.87\",\\n\\t\"input_tp\" : \"-0.4' >&2\n"
    "sleep 0.2\n"
    "printf '5\",\\n\\t\"input_lra\" : \"4.20\",\\n' >&2\n"
    "sleep 0.2\n"
    "printf '\\t\"target_offset\" : \"0.00\"\\n}\\n' >&2\n");

  auto run = run_process({engine.string()}, std::chrono::seconds(20));
  REQUIRE(run);
  REQUIRE(run->exit_code == 0);

  auto facts = scrape_loudnorm(run->output);
  REQUIRE(facts);
  REQUIRE(*facts->integrated_lufs == Approx(-9.87));
  REQUIRE(*facts->true_peak_dbtp == Approx(-0.45));
  REQUIRE(*facts->loudness_range_lu == Approx(4.2));
}
