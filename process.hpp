#ifndef LUFSCHECK_PROCESS_HPP
#define LUFSCHECK_PROCESS_HPP

#include <chrono>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lufscheck {

struct process_result {
  int exit_code = -1;     // -1 when killed by a signal
  bool timed_out = false;
  std::string output;     // stdout and stderr, interleaved as written
};

// Run argv[0] (looked up on PATH) with the given arguments and collect its
// merged output. A zero timeout waits forever; otherwise the child is killed
// once the timeout expires and whatever it printed is still returned.
// Fails only when the process cannot be started.
[[nodiscard]] std::expected<process_result, std::string>
run_process(std::vector<std::string> const &argv,
            std::chrono::milliseconds timeout = {});

// Resolve a program name the way execvp would. Names containing '/' are
// checked as given.
[[nodiscard]] std::optional<std::filesystem::path>
find_executable(std::string_view name);

// Shell-like rendering of argv, for log output only.
[[nodiscard]] std::string format_command(std::vector<std::string> const &argv);

} // namespace lufscheck

#endif
