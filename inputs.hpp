#ifndef LUFSCHECK_INPUTS_HPP
#define LUFSCHECK_INPUTS_HPP

#include <filesystem>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace lufscheck {

inline constexpr char list_file_marker = '@';
inline constexpr char path_separator = ';';

// Turn raw command-line operands into paths: "@list.txt" is replaced by the
// lines of list.txt, "a.wav;b.wav" by its pieces. No operands yields ".".
// Throws std::runtime_error if a list file cannot be read.
[[nodiscard]] std::vector<std::filesystem::path>
expand_arguments(std::vector<std::string> const &args);

[[nodiscard]] bool has_supported_extension(std::filesystem::path const &file,
                                           std::set<std::string> const &extensions);

// Resolve files and directories to the audio files to analyse. Unreadable
// entries are reported on stderr and skipped. The result has no duplicates.
[[nodiscard]] std::vector<std::filesystem::path>
collect_audio_files(std::vector<std::filesystem::path> const &roots,
                    std::set<std::string> const &extensions, bool recursive);

} // namespace lufscheck

#endif
