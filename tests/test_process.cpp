#include <catch2/catch.hpp>

#include <chrono>

#include "process.hpp"
#include "temp_dir.hpp"

using namespace lufscheck;
using namespace std::chrono_literals;

TEST_CASE("Output from both streams is captured") {
  auto r = run_process({"/bin/sh", "-c", "echo out; echo err >&2; echo again"});
  REQUIRE(r);
  REQUIRE(r->exit_code == 0);
  REQUIRE_FALSE(r->timed_out);
  REQUIRE(r->output.find("out\n") != std::string::npos);
  REQUIRE(r->output.find("err\n") != std::string::npos);
  REQUIRE(r->output.find("again\n") != std::string::npos);
}

TEST_CASE("Large output is read completely") {
  auto r = run_process({"/bin/sh", "-c",
    "i=0; while [ $i -lt 20000 ]; do echo \"line $i\"; i=$((i+1)); done"}, 30s);
  REQUIRE(r);
  REQUIRE(r->output.find("line 0\n") == 0);
  REQUIRE(r->output.find("line 19999\n") != std::string::npos);
}

TEST_CASE("Exit status is reported") {
  auto r = run_process({"/bin/sh", "-c", "exit 3"});
  REQUIRE(r);
  REQUIRE(r->exit_code == 3);
}

TEST_CASE("Timeout kills the child but keeps its output") {
  const auto started = std::chrono::steady_clock::now();
  auto r = run_process({"/bin/sh", "-c", "echo partial; exec sleep 30"}, 500ms);
  REQUIRE(r);
  REQUIRE(r->timed_out);
  REQUIRE(r->output == "partial\n");
  REQUIRE(std::chrono::steady_clock::now() - started < 10s);
}

TEST_CASE("Unknown program is an error") {
  auto r = run_process({"lufscheck-no-such-program-4711"});
  REQUIRE_FALSE(r);
  REQUIRE(r.error().find("lufscheck-no-such-program-4711") != std::string::npos);

  REQUIRE_FALSE(run_process({}));
}

TEST_CASE("Executables are resolved like execvp") {
  auto sh = find_executable("sh");
  REQUIRE(sh);
  REQUIRE(sh->filename() == "sh");

  REQUIRE_FALSE(find_executable("lufscheck-no-such-program-4711"));
  REQUIRE_FALSE(find_executable(""));

  temp_dir dir;
  auto script = dir.script("tool", "exit 0\n");
  auto plain = dir.write("data.txt", "x");
  REQUIRE(find_executable(script.string()) == script);
  REQUIRE_FALSE(find_executable(plain.string()));
}

TEST_CASE("Command lines are quoted for display") {
  REQUIRE(format_command({"ffmpeg", "-i", "my song.wav", "-af", "a=1:b=2"}) ==
          "ffmpeg -i 'my song.wav' -af a=1:b=2");
  REQUIRE(format_command({"echo", "it's", ""}) == "echo 'it'\\''s' ''");
}
