/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables.
 *          Values are read once per process; pipeline entry points take an
 *          explicit TranscodeOptions whose defaults come from here.
 */

#ifndef FFROTATE_CONFIG_HPP
#define FFROTATE_CONFIG_HPP

#include <cstdlib>
#include <string>

namespace ffrotate {
namespace Config {

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed integer value or default
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  return val ? std::stoi(val) : default_val;
}

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 * @return Variable contents or default
 */
inline std::string get_env_string(const char *name,
                                  const std::string &default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : default_val;
}

// **---- TRANSCODER ----**

/**
 * @brief Explicit transcoder location (bundled binary).
 * @note Empty = search PATH for "ffmpeg".
 */
inline const std::string &ffmpeg_binary() {
  static std::string val = get_env_string("FFMPEG_BINARY", "");
  return val;
}

/// Video codec used for the lossless transposition encode
inline const std::string &video_codec() {
  static std::string val = get_env_string("VIDEO_CODEC", "libx264");
  return val;
}

/**
 * @brief Encoder preset.
 * @note Transpositions are lossless at CRF 0 whatever the preset, so the
 *       fastest one is the default.
 */
inline const std::string &encode_preset() {
  static std::string val = get_env_string("ENCODE_PRESET", "ultrafast");
  return val;
}

/**
 * @brief Constant quality for arbitrary-angle rotation.
 * @note Same CRF 0 as the transpositions unless overridden; rotate still
 *       resamples, so the result is never bit-exact.
 */
inline int custom_crf() {
  static int val = get_env_int("CUSTOM_CRF", 0);
  return val;
}

/**
 * @brief Delay after the transcoder exits before its output is touched.
 * @note Some filesystems report the file before it is fully flushed.
 */
inline int settle_delay_ms() {
  static int val = get_env_int("SETTLE_DELAY_MS", 1000);
  return val;
}

// **---- PATHS ----**

/// Suffix inserted before the extension of every rotated file
inline const std::string &output_suffix() {
  static std::string val = get_env_string("OUTPUT_SUFFIX", "_rotated");
  return val;
}

/// Parent directory of per-batch staging directories (empty = system temp)
inline const std::string &staging_root() {
  static std::string val = get_env_string("STAGING_ROOT", "");
  return val;
}

/**
 * @brief Default output directory for the command-line front-end.
 * @note Falls back to ~/Movies/rotated.
 */
inline const std::string &default_output_dir() {
  static std::string val = [] {
    std::string configured = get_env_string("OUTPUT_DIR", "");
    if (!configured.empty())
      return configured;
    std::string home = get_env_string("HOME", ".");
    return home + "/Movies/rotated";
  }();
  return val;
}

} // namespace Config
} // namespace ffrotate

#endif // FFROTATE_CONFIG_HPP
