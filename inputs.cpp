#include "inputs.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <iterator>
#include <print>
#include <stdexcept>

#include "text.hpp"

namespace lufscheck {

namespace {

namespace fs = std::filesystem;
using std::cerr;
using std::println;
using std::runtime_error;
using std::string, std::string_view;
using std::vector;

[[nodiscard]] string_view unquote(string_view s)
{
  s = trim(s);
  if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front())
    s = trim(s.substr(1, s.size() - 2));
  return s;
}

void add_pieces(vector<fs::path> &out, string_view arg)
{
  for (auto piece : split(arg, path_separator)) {
    piece = unquote(piece);
    if (!piece.empty()) out.emplace_back(piece);
  }
}

[[nodiscard]] vector<fs::path> read_list_file(fs::path const &list)
{
  std::ifstream in(list);
  if (!in) throw runtime_error("cannot read list file " + list.generic_string());

  vector<fs::path> paths;
  string line;
  while (std::getline(in, line)) add_pieces(paths, line);
  if (in.bad()) throw runtime_error("error reading list file " + list.generic_string());
  return paths;
}

} // namespace

vector<fs::path> expand_arguments(vector<string> const &args)
{
  vector<fs::path> paths;
  for (auto const &arg : args) {
    if (arg.size() > 1 && arg.front() == list_file_marker) {
      auto listed = read_list_file(string_view(arg).substr(1));
      std::ranges::move(listed, std::back_inserter(paths));
    } else {
      add_pieces(paths, arg);
    }
  }
  if (paths.empty()) paths.emplace_back(".");
  return paths;
}

bool has_supported_extension(fs::path const &file, std::set<string> const &extensions)
{
  string ext = file.extension().string();
  if (ext.size() < 2) return false;
  ext.erase(0, 1);
  std::ranges::transform(ext, ext.begin(),
    [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return extensions.contains(ext);
}

vector<fs::path>
collect_audio_files(vector<fs::path> const &roots,
                    std::set<string> const &extensions, bool recursive)
{
  vector<fs::path> files;
  std::set<fs::path> seen;

  auto add = [&](fs::path const &p) {
    std::error_code ec;
    fs::path key = fs::weakly_canonical(p, ec);
    if (ec) key = p.lexically_normal();
    if (seen.insert(key).second) files.push_back(p);
  };

  auto scan = [&](auto iter) {
    std::error_code ec;
    for (auto end = decltype(iter){}; iter != end; iter.increment(ec)) {
      if (ec) {
        println(cerr, "Warning: {}", ec.message());
        break;
      }
      std::error_code type_ec;
      if (iter->is_regular_file(type_ec) && has_supported_extension(iter->path(), extensions))
        add(iter->path());
    }
  };

  for (auto const &root : roots) {
    std::error_code ec;
    const auto status = fs::status(root, ec);
    if (ec || !fs::exists(status)) {
      println(cerr, "Warning: no such file or directory: {}", root.generic_string());
      continue;
    }

    if (fs::is_directory(status)) {
      constexpr auto opts = fs::directory_options::skip_permission_denied;
      if (recursive) {
        fs::recursive_directory_iterator it(root, opts, ec);
        if (ec) {
          println(cerr, "Warning: cannot scan {}: {}", root.generic_string(), ec.message());
          continue;
        }
        scan(std::move(it));
      } else {
        fs::directory_iterator it(root, opts, ec);
        if (ec) {
          println(cerr, "Warning: cannot scan {}: {}", root.generic_string(), ec.message());
          continue;
        }
        scan(std::move(it));
      }
    } else if (fs::is_regular_file(status) && has_supported_extension(root, extensions)) {
      add(root);
    } else {
      println(cerr, "Warning: skipping unsupported file: {}", root.generic_string());
    }
  }

  return files;
}

} // namespace lufscheck
