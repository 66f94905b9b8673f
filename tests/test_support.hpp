/**
 * @file test_support.hpp
 * @brief Shared helpers for the ffrotate test executables
 *
 * @details Provides:
 *          - CHECK / CHECK_THROWS_KIND assertion macros (active in every
 *            build type)
 *
 *          - A scratch directory per test
 *
 *          - A shell-script stand-in for ffmpeg that follows the three
 *            command shapes the pipeline uses
 */

#ifndef FFROTATE_TEST_SUPPORT_HPP
#define FFROTATE_TEST_SUPPORT_HPP

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <fmt/core.h>

#include "ffrotate/errors.hpp"
#include "ffrotate/ffmpeg_executor.hpp"
#include "ffrotate/staging.hpp"

namespace ffrotate {
namespace test {

namespace fs = std::filesystem;

#define CHECK(cond)                                                            \
  do {                                                                         \
    if (!(cond)) {                                                             \
      fmt::print(stderr, "{}:{}: CHECK failed: {}\n", __FILE__, __LINE__,      \
                 #cond);                                                       \
      std::exit(1);                                                            \
    }                                                                          \
  } while (0)

#define CHECK_THROWS_KIND(expr, expected_kind)                                 \
  do {                                                                         \
    bool thrown_ = false;                                                      \
    try {                                                                      \
      (void)(expr);                                                            \
    } catch (const ffrotate::RotateError &e) {                                 \
      thrown_ = true;                                                          \
      if (e.kind() != (expected_kind)) {                                       \
        fmt::print(stderr, "{}:{}: expected {} but got {}\n", __FILE__,        \
                   __LINE__, ffrotate::error_kind_name(expected_kind),         \
                   ffrotate::error_kind_name(e.kind()));                       \
        std::exit(1);                                                          \
      }                                                                        \
    }                                                                          \
    if (!thrown_) {                                                            \
      fmt::print(stderr, "{}:{}: expected {} from {}\n", __FILE__, __LINE__,   \
                 ffrotate::error_kind_name(expected_kind), #expr);             \
      std::exit(1);                                                            \
    }                                                                          \
  } while (0)

#define RUN_TEST(fn)                                                           \
  do {                                                                         \
    fn();                                                                      \
    fmt::print("{}: PASSED\n", #fn);                                           \
  } while (0)

/**
 * @brief Stand-in for ffmpeg.
 *
 * @details Behaviour, keyed on the contents of the -i input:
 *
 *          - unreadable or containing CORRUPT: error on stderr, exit 1
 *
 *          - "-f null" (probe): echo the input's "Duration:" line to stderr
 *
 *          - containing NOOUTPUT: exit 0 without writing anything
 *
 *          - containing NOFRAME with -vframes: error, exit 1
 *
 *          - otherwise: copy the input to the output path
 *
 *          Every invocation is appended to invocations.log next to the
 *          script.
 */
inline const char *fake_transcoder_script() {
  return R"(#!/bin/sh
log="$(dirname "$0")/invocations.log"
echo "$*" >> "$log"
input=""
out=""
null=0
frames=0
while [ $# -gt 0 ]; do
  case "$1" in
    -i) input="$2"; shift 2; continue ;;
    -f) [ "$2" = "null" ] && null=1; shift 2; continue ;;
    -vframes) frames=1; shift 2; continue ;;
    -vf|-c:v|-crf|-preset|-ss) shift 2; continue ;;
  esac
  out="$1"
  shift
done
if [ ! -r "$input" ] || grep -q CORRUPT "$input"; then
  echo "$input: Invalid data found when processing input" >&2
  exit 1
fi
if [ "$null" = 1 ]; then
  grep "Duration:" "$input" >&2
  exit 0
fi
if grep -q NOOUTPUT "$input"; then
  exit 0
fi
if [ "$frames" = 1 ] && grep -q NOFRAME "$input"; then
  echo "Output file is empty, nothing was encoded" >&2
  exit 1
fi
cp "$input" "$out"
)";
}

inline void write_file(const fs::path &path, const std::string &content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

inline std::string read_file(const fs::path &path) {
  std::ifstream in(path, std::ios::binary);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

inline std::vector<std::string> read_lines(const fs::path &path) {
  std::vector<std::string> lines;
  std::ifstream in(path);
  std::string line;
  while (std::getline(in, line))
    lines.push_back(line);
  return lines;
}

/// Regular files directly inside dir (0 if dir does not exist)
inline size_t count_files(const fs::path &dir) {
  std::error_code ec;
  if (!fs::is_directory(dir, ec))
    return 0;
  size_t n = 0;
  for (const auto &entry : fs::directory_iterator(dir)) {
    if (entry.is_regular_file())
      ++n;
  }
  return n;
}

/// Write the fake transcoder into dir and make it executable
inline std::string install_fake_transcoder(const fs::path &dir) {
  fs::path script = dir / "fake-ffmpeg";
  write_file(script, fake_transcoder_script());
  fs::permissions(script,
                  fs::perms::owner_all | fs::perms::group_read |
                      fs::perms::group_exec | fs::perms::others_read |
                      fs::perms::others_exec,
                  fs::perm_options::replace);
  return script.string();
}

/// Options pointing at a fake transcoder, no settle delay
inline TranscodeOptions fake_options(const std::string &transcoder,
                                     const std::string &staging_root) {
  TranscodeOptions options;
  options.transcoder = transcoder;
  options.video_codec = "libx264";
  options.preset = "ultrafast";
  options.custom_crf = 0;
  options.settle_delay_ms = 0;
  options.output_suffix = "_rotated";
  options.staging_root = staging_root;
  return options;
}

/// A media-like input understood by the fake transcoder
inline std::string fake_media(const std::string &name) {
  return fmt::format("{}\n  Duration: 00:01:30.50, start: 0.000000, "
                     "bitrate: 1205 kb/s\n",
                     name);
}

} // namespace test
} // namespace ffrotate

#endif // FFROTATE_TEST_SUPPORT_HPP
