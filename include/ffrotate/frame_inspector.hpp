/**
 * @file frame_inspector.hpp
 * @brief Decode a single picture with libavformat/libavcodec
 *
 * @details Opens an image (e.g. a preview PNG) or a video, decodes the first
 *          video frame and packs its planes into one contiguous buffer.
 *          Used to report preview dimensions and to compare rotated outputs
 *          pixel for pixel.
 */

#ifndef FFROTATE_FRAME_INSPECTOR_HPP
#define FFROTATE_FRAME_INSPECTOR_HPP

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
}

#include <cstdint>
#include <string>
#include <vector>

namespace ffrotate {

/**
 * @struct DecodedFrame
 * @brief One decoded picture with tightly packed planes.
 */
struct DecodedFrame {
  int width = 0;
  int height = 0;
  std::string pixel_format;    //< av_get_pix_fmt_name(), e.g. "rgb24"
  std::vector<uint8_t> pixels; //< Planes back to back, alignment 1
};

/**
 * @class FrameInspector
 * @brief Decodes the first video frame of a file.
 *
 * @attention MANAGEMENT:
 *
 *            - Destructor handles partial initialization failures
 *
 *            - All FFmpeg resources are freed in reverse allocation order
 */
class FrameInspector {
  AVFormatContext *fmt_ctx = nullptr;
  AVCodecContext *dec_ctx = nullptr;
  AVFrame *frame = nullptr;
  AVPacket *pkt = nullptr;
  int video_stream_idx = -1;
  std::string path_;

  /// Pack the current frame into out
  bool copy_frame(DecodedFrame &out) const;

public:
  explicit FrameInspector(std::string path);
  ~FrameInspector();

  FrameInspector(const FrameInspector &) = delete;
  FrameInspector &operator=(const FrameInspector &) = delete;

  /**
   * @brief Open the file and its video decoder.
   * @return true on success (errors are logged)
   */
  bool initialize();

  /**
   * @brief Decode the first frame.
   * @param out Receives the packed picture
   * @return true if a frame was decoded
   */
  bool read_first_frame(DecodedFrame &out);
};

/**
 * @brief Convenience wrapper around FrameInspector.
 * @throws RotateError (FrameDecodeFailed)
 */
DecodedFrame decode_first_frame(const std::string &path);

} // namespace ffrotate

#endif // FFROTATE_FRAME_INSPECTOR_HPP
