/**
 * @file test_media_probe.cpp
 * @brief Tests for duration probing and preview frame extraction
 */

#include <algorithm>

#include "ffrotate/media_probe.hpp"
#include "test_support.hpp"

using namespace ffrotate;
using namespace ffrotate::test;

namespace {

/// ffrotate-*.png files currently in the temp directory
size_t count_preview_files() {
  size_t n = 0;
  for (const auto &entry : fs::directory_iterator(fs::temp_directory_path())) {
    std::string name = entry.path().filename().string();
    if (name.rfind("ffrotate-", 0) == 0 && entry.path().extension() == ".png")
      ++n;
  }
  return n;
}

} // anonymous namespace

void test_parse_duration_exact() {
  auto d = parse_duration("  Duration: 00:01:30.50, start: 0.000000");
  CHECK(d && *d == 90.5);
}

void test_parse_duration_in_full_diagnostics() {
  std::string stderr_text =
      "ffmpeg version 6.1 Copyright (c) 2000-2023 the FFmpeg developers\n"
      "Input #0, mov,mp4,m4a,3gp,3g2,mj2, from 'clip.mp4':\n"
      "  Metadata:\n"
      "    major_brand     : isom\n"
      "  Duration: 01:02:03.25, start: 0.000000, bitrate: 1205 kb/s\n"
      "  Stream #0:0(und): Video: h264\n";
  auto d = parse_duration(stderr_text);
  CHECK(d && *d == 3723.25);
}

void test_parse_duration_end_of_text() {
  auto d = parse_duration("Duration: 00:00:10.00");
  CHECK(d && *d == 10.0);
}

void test_parse_duration_unavailable() {
  CHECK(!parse_duration(""));
  CHECK(!parse_duration("clip.mp4: Invalid data found when processing input"));
  CHECK(!parse_duration("  Duration: N/A, bitrate: N/A"));
  CHECK(!parse_duration("  Duration: 00:xx:10.00, start: 0"));
}

void test_probe_duration() {
  StagingDirectory scratch;
  fs::path dir = scratch.path();
  std::string ffmpeg = install_fake_transcoder(dir);
  write_file(dir / "clip.mp4", fake_media("clip"));

  ProbeResult probe = probe_duration(ffmpeg, (dir / "clip.mp4").string());
  CHECK(probe.duration_seconds == 90.5);

  /// Exact command shape
  auto calls = read_lines(dir / "invocations.log");
  CHECK(calls.size() == 1);
  CHECK(calls[0] == "-i " + (dir / "clip.mp4").string() + " -f null -");
}

void test_probe_duration_missing_marker() {
  StagingDirectory scratch;
  fs::path dir = scratch.path();
  std::string ffmpeg = install_fake_transcoder(dir);
  write_file(dir / "silent.mp4", "no metadata here\n");
  write_file(dir / "corrupt.mp4", "CORRUPT\n");

  CHECK_THROWS_KIND(probe_duration(ffmpeg, (dir / "silent.mp4").string()),
                    ErrorKind::DurationUnavailable);
  CHECK_THROWS_KIND(probe_duration(ffmpeg, (dir / "corrupt.mp4").string()),
                    ErrorKind::DurationUnavailable);
}

void test_extract_preview_frame_seeks_to_midpoint() {
  StagingDirectory scratch;
  fs::path dir = scratch.path();
  std::string ffmpeg = install_fake_transcoder(dir);
  fs::path input = dir / "clip.mp4";
  write_file(input, fake_media("clip"));

  std::string frame_path;
  {
    ScopedFile frame(
        extract_preview_frame(ffmpeg, input.string(), RotationMode::deg90()));
    frame_path = frame.path();
    CHECK(fs::exists(frame_path));
    CHECK(fs::path(frame_path).extension() == ".png");
    CHECK(read_file(frame_path) == read_file(input));
  }
  /// Caller-side ScopedFile removed it
  CHECK(!fs::exists(frame_path));

  auto calls = read_lines(dir / "invocations.log");
  CHECK(calls.size() == 2);
  CHECK(calls[1] == "-y -ss 45.250 -i " + input.string() +
                        " -vf transpose=1 -vframes 1 " + frame_path);
}

void test_extract_preview_frame_failure_leaves_no_file() {
  StagingDirectory scratch;
  fs::path dir = scratch.path();
  std::string ffmpeg = install_fake_transcoder(dir);
  fs::path input = dir / "broken.mp4";
  write_file(input, fake_media("NOFRAME"));

  size_t before = count_preview_files();
  CHECK_THROWS_KIND(
      extract_preview_frame(ffmpeg, input.string(), RotationMode::deg180()),
      ErrorKind::FrameExtractionFailed);
  CHECK(count_preview_files() == before);
}

void test_extract_preview_frame_rejects_bad_angle() {
  StagingDirectory scratch;
  fs::path dir = scratch.path();
  std::string ffmpeg = install_fake_transcoder(dir);
  fs::path input = dir / "clip.mp4";
  write_file(input, fake_media("clip"));

  CHECK_THROWS_KIND(extract_preview_frame(ffmpeg, input.string(),
                                          RotationMode::custom(std::nullopt)),
                    ErrorKind::InvalidAngle);
  /// Nothing was run
  CHECK(!fs::exists(dir / "invocations.log"));
}

int main() {
  RUN_TEST(test_parse_duration_exact);
  RUN_TEST(test_parse_duration_in_full_diagnostics);
  RUN_TEST(test_parse_duration_end_of_text);
  RUN_TEST(test_parse_duration_unavailable);
  RUN_TEST(test_probe_duration);
  RUN_TEST(test_probe_duration_missing_marker);
  RUN_TEST(test_extract_preview_frame_seeks_to_midpoint);
  RUN_TEST(test_extract_preview_frame_failure_leaves_no_file);
  RUN_TEST(test_extract_preview_frame_rejects_bad_angle);
  return 0;
}
