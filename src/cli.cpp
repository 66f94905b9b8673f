/**
 * @file cli.cpp
 * @brief Command-line front-end: rotate and preview
 *
 * @note Directories given to rotate expand to the video files they contain.
 *       Settings such as FFMPEG_BINARY or SETTLE_DELAY_MS come from the
 *       environment (see config.hpp).
 */

#include "ffrotate/cli.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <exception>
#include <optional>
#include <stdexcept>

#include <fmt/core.h>

#include "ffrotate/batch_processor.hpp"
#include "ffrotate/config.hpp"
#include "ffrotate/errors.hpp"
#include "ffrotate/filter_resolver.hpp"
#include "ffrotate/frame_inspector.hpp"
#include "ffrotate/logging.hpp"
#include "ffrotate/media_probe.hpp"
#include "ffrotate/progress.hpp"
#include "ffrotate/staging.hpp"
#include "ffrotate/system.hpp"

namespace ffrotate {

namespace fs = std::filesystem;

namespace {

void print_usage() {
  LOG_WARN("Usage:\n"
           "  ffrotate rotate <90|180|270|custom> [--angle DEG] [-o DIR] "
           "<input>...\n"
           "  ffrotate preview <input> <90|180|270|custom> [--angle DEG] "
           "[--save PATH]");
}

std::optional<double> parse_angle(const std::string &text) {
  try {
    size_t used = 0;
    double value = std::stod(text, &used);
    if (used != text.size())
      return std::nullopt;
    return value;
  } catch (const std::invalid_argument &) {
    return std::nullopt;
  } catch (const std::out_of_range &) {
    return std::nullopt;
  }
}

// **---- ROTATE ----**

int run_rotate(const std::vector<std::string> &args) {
  if (args.empty()) {
    print_usage();
    return 1;
  }

  std::string selection = args[0];
  std::optional<double> angle;
  std::string output_dir = Config::default_output_dir();
  std::vector<std::string> inputs;

  for (size_t i = 1; i < args.size(); ++i) {
    if (args[i] == "--angle" && i + 1 < args.size()) {
      angle = parse_angle(args[++i]);
      if (!angle) {
        LOG_ERROR("Invalid angle: {}", args[i]);
        return 1;
      }
    } else if ((args[i] == "-o" || args[i] == "--output") &&
               i + 1 < args.size()) {
      output_dir = args[++i];
    } else {
      inputs.push_back(args[i]);
    }
  }

  auto mode = parse_rotation_mode(selection, angle);
  if (!mode) {
    LOG_ERROR("Unknown rotation '{}'", selection);
    print_usage();
    return 1;
  }

  std::vector<std::string> files = expand_inputs(inputs);

  LOG_INFO("ffrotate - Batch Mode");
  LOG_INFO("Output directory: {}", output_dir);

  BatchProcessor processor;
  LogProgressSink progress(files.size());
  auto outcomes = processor.process(files, *mode, output_dir, progress);

  for (const auto &outcome : outcomes) {
    if (outcome.ok) {
      fmt::print("OK    {} -> {}\n", outcome.input_path, outcome.output_path);
    } else {
      fmt::print("FAIL  {}: {}\n", outcome.input_path, outcome.message);
    }
  }
  std::fflush(stdout);

  return batch_exit_code(outcomes);
}

// **---- PREVIEW ----**

int run_preview(const std::vector<std::string> &args) {
  if (args.size() < 2) {
    print_usage();
    return 1;
  }

  std::string input = args[0];
  std::string selection = args[1];
  std::optional<double> angle;
  std::string save_path;

  for (size_t i = 2; i < args.size(); ++i) {
    if (args[i] == "--angle" && i + 1 < args.size()) {
      angle = parse_angle(args[++i]);
      if (!angle) {
        LOG_ERROR("Invalid angle: {}", args[i]);
        return 1;
      }
    } else if (args[i] == "--save" && i + 1 < args.size()) {
      save_path = args[++i];
    } else {
      LOG_ERROR("Unexpected argument: {}", args[i]);
      print_usage();
      return 1;
    }
  }

  auto mode = parse_rotation_mode(selection, angle);
  if (!mode) {
    LOG_ERROR("Unknown rotation '{}'", selection);
    print_usage();
    return 1;
  }

  LOG_INFO("ffrotate - Preview");
  LOG_INFO("Input: {}", input);

  std::string transcoder = locate_transcoder(Config::ffmpeg_binary());

  /// Deleted on every exit path below
  ScopedFile frame(extract_preview_frame(transcoder, input, *mode));

  DecodedFrame decoded = decode_first_frame(frame.path());
  LOG_SUCCESS("Preview frame: {}x{} ({})", decoded.width, decoded.height,
              decoded.pixel_format);

  if (!save_path.empty()) {
    std::error_code ec;
    fs::copy_file(frame.path(), save_path,
                  fs::copy_options::overwrite_existing, ec);
    if (ec) {
      LOG_ERROR("Cannot save preview to {}: {}", save_path, ec.message());
      return 1;
    }
    LOG_INFO("Preview saved to {}", save_path);
  }
  return 0;
}

} // anonymous namespace

bool is_video_file(const fs::path &path) {
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return ext == ".mp4" || ext == ".mov" || ext == ".avi" || ext == ".mkv" ||
         ext == ".ts";
}

std::vector<std::string> expand_inputs(const std::vector<std::string> &args) {
  std::vector<std::string> files;
  for (const auto &arg : args) {
    std::error_code ec;
    if (!fs::is_directory(arg, ec)) {
      files.push_back(arg);
      continue;
    }

    std::vector<std::string> found;
    fs::directory_iterator it(arg, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
      std::error_code type_ec;
      if (it->is_regular_file(type_ec) && is_video_file(it->path())) {
        found.push_back(it->path().string());
      }
    }
    if (ec) {
      LOG_WARN("Cannot list directory {}: {}", arg, ec.message());
    }
    std::sort(found.begin(), found.end());
    LOG_INFO("Found {} video files in {}", found.size(), arg);
    files.insert(files.end(), found.begin(), found.end());
  }
  return files;
}

int run_cli(const std::vector<std::string> &argv) {
  if (argv.empty()) {
    print_usage();
    return 1;
  }

  const std::string &command = argv[0];
  std::vector<std::string> args(argv.begin() + 1, argv.end());

  try {
    if (command == "rotate")
      return run_rotate(args);
    if (command == "preview")
      return run_preview(args);
    LOG_ERROR("Unknown command '{}'", command);
    print_usage();
    return 1;
  } catch (const RotateError &e) {
    LOG_ERROR("{}: {}", error_kind_name(e.kind()), e.what());
    return 1;
  } catch (const std::exception &e) {
    /// e.g. a non-numeric SETTLE_DELAY_MS or CUSTOM_CRF
    LOG_ERROR("{}", e.what());
    return 1;
  }
}

} // namespace ffrotate
