/**
 * @file test_output_paths.cpp
 * @brief Unit tests for output naming and placement
 */

#include "ffrotate/output_paths.hpp"
#include "test_support.hpp"

using namespace ffrotate;
using namespace ffrotate::test;

void test_rotated_file_name() {
  CHECK(rotated_file_name("clip.mp4", "_rotated") == "clip_rotated.mp4");
  CHECK(rotated_file_name("/videos/holiday/clip.MOV", "_rotated") ==
        "clip_rotated.MOV");
  CHECK(rotated_file_name("archive.tar.mkv", "_rotated") ==
        "archive.tar_rotated.mkv");
  CHECK(rotated_file_name("noext", "_rotated") == "noext_rotated");
  CHECK(rotated_file_name("clip.mp4", "-r") == "clip-r.mp4");
}

void test_resolve_output_path() {
  std::string first = resolve_output_path("clip.mp4", "/out/dir", "_rotated");
  CHECK(first == "/out/dir/clip_rotated.mp4");

  /// Idempotent
  std::string second =
      resolve_output_path("clip.mp4", "/out/dir", "_rotated");
  CHECK(first == second);

  /// Only the file name of the input matters
  CHECK(resolve_output_path("/in/a/clip.mp4", "/out/dir", "_rotated") ==
        first);
}

void test_ensure_directory_creates_segments() {
  StagingDirectory scratch;
  fs::path nested = fs::path(scratch.path()) / "a" / "b" / "c";

  ensure_directory(nested.string());
  CHECK(fs::is_directory(nested));

  /// Existing directory is fine
  ensure_directory(nested.string());
  CHECK(fs::is_directory(nested));
}

void test_ensure_directory_rejects_file() {
  StagingDirectory scratch;
  fs::path file = fs::path(scratch.path()) / "occupied";
  write_file(file, "x");

  CHECK_THROWS_KIND(ensure_directory(file.string()),
                    ErrorKind::OutputDirectoryUnavailable);
}

void test_move_file_replaces_destination() {
  StagingDirectory scratch;
  fs::path from = fs::path(scratch.path()) / "staged.mp4";
  fs::path to = fs::path(scratch.path()) / "final.mp4";
  write_file(from, "new");
  write_file(to, "old");

  std::string error;
  CHECK(move_file(from.string(), to.string(), error));
  CHECK(!fs::exists(from));
  CHECK(read_file(to) == "new");
}

void test_move_file_reports_missing_source() {
  StagingDirectory scratch;
  fs::path from = fs::path(scratch.path()) / "missing.mp4";
  fs::path to = fs::path(scratch.path()) / "final.mp4";

  std::string error;
  CHECK(!move_file(from.string(), to.string(), error));
  CHECK(!error.empty());
}

int main() {
  RUN_TEST(test_rotated_file_name);
  RUN_TEST(test_resolve_output_path);
  RUN_TEST(test_ensure_directory_creates_segments);
  RUN_TEST(test_ensure_directory_rejects_file);
  RUN_TEST(test_move_file_replaces_destination);
  RUN_TEST(test_move_file_reports_missing_source);
  return 0;
}
