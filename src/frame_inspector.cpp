/**
 * @file frame_inspector.cpp
 * @brief Single-frame decoding implementation
 */

#include "ffrotate/frame_inspector.hpp"

#include <utility>

extern "C" {
#include <libavutil/imgutils.h>
#include <libavutil/pixdesc.h>
}

#include <fmt/core.h>

#include "ffrotate/errors.hpp"
#include "ffrotate/logging.hpp"

namespace ffrotate {

FrameInspector::FrameInspector(std::string path) : path_(std::move(path)) {
  frame = av_frame_alloc();
  pkt = av_packet_alloc();
}

FrameInspector::~FrameInspector() {
  if (dec_ctx)
    avcodec_free_context(&dec_ctx);
  if (fmt_ctx)
    avformat_close_input(&fmt_ctx);
  av_frame_free(&frame);
  av_packet_free(&pkt);
}

bool FrameInspector::initialize() {
  if (!frame || !pkt) {
    LOG_ERROR("Failed to allocate frame/packet");
    return false;
  }

  if (avformat_open_input(&fmt_ctx, path_.c_str(), nullptr, nullptr) < 0) {
    LOG_ERROR("avformat_open_input failed: {}", path_);
    return false;
  }

  if (avformat_find_stream_info(fmt_ctx, nullptr) < 0) {
    LOG_ERROR("avformat_find_stream_info failed: {}", path_);
    return false;
  }

  video_stream_idx =
      av_find_best_stream(fmt_ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (video_stream_idx < 0) {
    LOG_ERROR("No video stream found: {}", path_);
    return false;
  }

  /// Only the picture matters here
  for (unsigned int i = 0; i < fmt_ctx->nb_streams; i++) {
    if (i != static_cast<unsigned int>(video_stream_idx)) {
      fmt_ctx->streams[i]->discard = AVDISCARD_ALL;
    }
  }

  AVCodecParameters *param = fmt_ctx->streams[video_stream_idx]->codecpar;
  const AVCodec *codec = avcodec_find_decoder(param->codec_id);
  if (!codec) {
    LOG_ERROR("No decoder found for codec ID {}", (int)param->codec_id);
    return false;
  }

  dec_ctx = avcodec_alloc_context3(codec);
  if (!dec_ctx) {
    LOG_ERROR("Failed to allocate decoder context");
    return false;
  }
  if (avcodec_parameters_to_context(dec_ctx, param) < 0) {
    LOG_ERROR("avcodec_parameters_to_context failed");
    return false;
  }

  if (avcodec_open2(dec_ctx, codec, nullptr) < 0) {
    LOG_ERROR("avcodec_open2 failed");
    return false;
  }
  return true;
}

bool FrameInspector::read_first_frame(DecodedFrame &out) {
  while (av_read_frame(fmt_ctx, pkt) >= 0) {
    if (pkt->stream_index != video_stream_idx) {
      av_packet_unref(pkt);
      continue;
    }

    int send_ret = avcodec_send_packet(dec_ctx, pkt);
    if (send_ret == AVERROR(EAGAIN)) {
      /// Output queue full: take a frame out, then resend the same packet
      int recv_ret = avcodec_receive_frame(dec_ctx, frame);
      if (recv_ret == 0) {
        av_packet_unref(pkt);
        return copy_frame(out);
      }
      if (recv_ret == AVERROR(EAGAIN))
        send_ret = avcodec_send_packet(dec_ctx, pkt);
      else
        send_ret = recv_ret;
    }
    av_packet_unref(pkt);
    if (send_ret < 0) {
      LOG_ERROR("avcodec_send_packet failed: {}", path_);
      return false;
    }

    int recv_ret = avcodec_receive_frame(dec_ctx, frame);
    if (recv_ret == 0)
      return copy_frame(out);
    if (recv_ret != AVERROR(EAGAIN)) {
      LOG_ERROR("avcodec_receive_frame failed: {}", path_);
      return false;
    }
  }

  /// Drain: decoders with delay only emit after a flush packet
  if (avcodec_send_packet(dec_ctx, nullptr) >= 0 &&
      avcodec_receive_frame(dec_ctx, frame) == 0)
    return copy_frame(out);

  LOG_ERROR("No frame could be decoded: {}", path_);
  return false;
}

bool FrameInspector::copy_frame(DecodedFrame &out) const {
  auto format = static_cast<AVPixelFormat>(frame->format);
  int size =
      av_image_get_buffer_size(format, frame->width, frame->height, 1);
  if (size < 0) {
    LOG_ERROR("Unsupported pixel layout in {}", path_);
    return false;
  }

  out.width = frame->width;
  out.height = frame->height;
  const char *name = av_get_pix_fmt_name(format);
  out.pixel_format = name ? name : "unknown";
  out.pixels.resize(static_cast<size_t>(size));

  if (av_image_copy_to_buffer(out.pixels.data(), size, frame->data,
                              frame->linesize, format, frame->width,
                              frame->height, 1) < 0) {
    LOG_ERROR("av_image_copy_to_buffer failed: {}", path_);
    return false;
  }
  return true;
}

DecodedFrame decode_first_frame(const std::string &path) {
  FrameInspector inspector(path);
  DecodedFrame out;
  if (!inspector.initialize() || !inspector.read_first_frame(out)) {
    throw RotateError(ErrorKind::FrameDecodeFailed,
                      fmt::format("Cannot decode a frame from '{}'", path));
  }
  return out;
}

} // namespace ffrotate
