// Repository: Redub
// Component: FFmpeg Audio Extractor
// Purpose: Decode the best audio stream of a container to mono float PCM
//          using libavformat/libavcodec/libswresample.
// Copyright (c) 2026 Redub

#include "redub/media/AudioExtractor.hpp"

#include <memory>
#include <sstream>

#include "redub/core/Errors.hpp"
#include "redub/util/Logger.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libavutil/mathematics.h>
#include <libavutil/samplefmt.h>
#include <libswresample/swresample.h>
}

namespace redub::media {

using core::SegmentationError;
using util::Logger;

namespace {

std::string AvErrorString(int err) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(err, errbuf, sizeof(errbuf));
  return errbuf;
}

struct FormatContextCloser {
  void operator()(AVFormatContext* ctx) const { avformat_close_input(&ctx); }
};
struct CodecContextFreer {
  void operator()(AVCodecContext* ctx) const { avcodec_free_context(&ctx); }
};
struct FrameFreer {
  void operator()(AVFrame* f) const { av_frame_free(&f); }
};
struct PacketFreer {
  void operator()(AVPacket* p) const { av_packet_free(&p); }
};
struct SwrFreer {
  void operator()(SwrContext* s) const { swr_free(&s); }
};

[[noreturn]] void Fail(const std::string& step, const std::string& path, int ret) {
  std::ostringstream oss;
  oss << "[FFmpegAudioExtractor] EXTRACT_STEP " << step << " FAILED uri=" << path;
  if (ret != 0) oss << " ret=" << ret << " err=" << AvErrorString(ret);
  Logger::Error(oss.str());
  throw SegmentationError(oss.str());
}

// Appends swr output for |frame| (or the resampler tail when frame is null).
void ConvertInto(SwrContext* swr, const AVFrame* frame, int in_rate, int out_rate,
                 PcmBuffer* out, const std::string& path) {
  const int in_samples = frame ? frame->nb_samples : 0;
  const int64_t delay = swr_get_delay(swr, in_rate);
  const int64_t out_samples =
      av_rescale_rnd(delay + in_samples, out_rate, in_rate, AV_ROUND_UP);
  if (out_samples <= 0) return;

  const size_t offset = out->samples.size();
  out->samples.resize(offset + static_cast<size_t>(out_samples));
  uint8_t* out_data[1] = {reinterpret_cast<uint8_t*>(out->samples.data() + offset)};

  int converted = swr_convert(
      swr, out_data, static_cast<int>(out_samples),
      frame ? const_cast<const uint8_t**>(frame->extended_data) : nullptr, in_samples);
  if (converted < 0) {
    out->samples.resize(offset);
    Fail("swr_convert", path, converted);
  }
  out->samples.resize(offset + static_cast<size_t>(converted));
}

}  // namespace

PcmBuffer FFmpegAudioExtractor::Extract(const std::string& path, int sample_rate) {
  AVFormatContext* raw_format = nullptr;
  int ret = avformat_open_input(&raw_format, path.c_str(), nullptr, nullptr);
  if (ret < 0) Fail("open_input", path, ret);
  std::unique_ptr<AVFormatContext, FormatContextCloser> format(raw_format);

  ret = avformat_find_stream_info(format.get(), nullptr);
  if (ret < 0) Fail("avformat_find_stream_info", path, ret);

  const AVCodec* codec = nullptr;
  const int stream_index =
      av_find_best_stream(format.get(), AVMEDIA_TYPE_AUDIO, -1, -1, &codec, 0);
  if (stream_index < 0 || codec == nullptr) Fail("find_audio_stream", path, 0);
  AVStream* stream = format->streams[stream_index];

  std::unique_ptr<AVCodecContext, CodecContextFreer> decoder(avcodec_alloc_context3(codec));
  if (!decoder) Fail("avcodec_alloc_context3", path, 0);
  ret = avcodec_parameters_to_context(decoder.get(), stream->codecpar);
  if (ret < 0) Fail("avcodec_parameters_to_context", path, ret);
  ret = avcodec_open2(decoder.get(), codec, nullptr);
  if (ret < 0) Fail("avcodec_open2", path, ret);

  // Resampler: decoder format → mono float at the analysis rate.
  AVChannelLayout src_layout{};
  AVChannelLayout dst_layout{};
  av_channel_layout_default(&dst_layout, 1);
  if (decoder->ch_layout.order == AV_CHANNEL_ORDER_UNSPEC ||
      decoder->ch_layout.nb_channels <= 0) {
    av_channel_layout_default(&src_layout, decoder->ch_layout.nb_channels > 0
                                               ? decoder->ch_layout.nb_channels
                                               : 1);
  } else if (av_channel_layout_copy(&src_layout, &decoder->ch_layout) < 0) {
    av_channel_layout_uninit(&dst_layout);
    Fail("channel_layout_copy", path, 0);
  }

  SwrContext* raw_swr = nullptr;
  ret = swr_alloc_set_opts2(&raw_swr,
                            &dst_layout, AV_SAMPLE_FMT_FLT, sample_rate,
                            &src_layout, decoder->sample_fmt, decoder->sample_rate,
                            0, nullptr);
  // swr_alloc_set_opts2 copies the layouts.
  av_channel_layout_uninit(&src_layout);
  av_channel_layout_uninit(&dst_layout);
  std::unique_ptr<SwrContext, SwrFreer> swr(raw_swr);
  if (ret < 0) Fail("swr_alloc_set_opts2", path, ret);
  ret = swr_init(swr.get());
  if (ret < 0) Fail("swr_init", path, ret);

  std::unique_ptr<AVPacket, PacketFreer> packet(av_packet_alloc());
  std::unique_ptr<AVFrame, FrameFreer> frame(av_frame_alloc());
  if (!packet || !frame) Fail("alloc", path, 0);

  PcmBuffer out;
  out.sample_rate = sample_rate;
  const int in_rate = decoder->sample_rate;
  int decode_errors = 0;

  auto receive_all = [&]() {
    while (true) {
      int r = avcodec_receive_frame(decoder.get(), frame.get());
      if (r == AVERROR(EAGAIN) || r == AVERROR_EOF) return;
      if (r < 0) {
        ++decode_errors;
        return;
      }
      ConvertInto(swr.get(), frame.get(), in_rate, sample_rate, &out, path);
      av_frame_unref(frame.get());
    }
  };

  while (true) {
    ret = av_read_frame(format.get(), packet.get());
    if (ret == AVERROR_EOF) break;
    if (ret < 0) Fail("av_read_frame", path, ret);

    if (packet->stream_index == stream_index) {
      int send = avcodec_send_packet(decoder.get(), packet.get());
      if (send < 0 && send != AVERROR(EAGAIN)) {
        ++decode_errors;
      } else {
        receive_all();
      }
    }
    av_packet_unref(packet.get());
  }

  // Drain decoder, then the resampler tail.
  ret = avcodec_send_packet(decoder.get(), nullptr);
  if (ret < 0 && ret != AVERROR_EOF) {
    ++decode_errors;
  } else {
    receive_all();
  }
  ConvertInto(swr.get(), nullptr, in_rate, sample_rate, &out, path);

  if (out.samples.empty() && decode_errors > 0) {
    std::ostringstream oss;
    oss << "no decodable audio (" << decode_errors << " decode errors)";
    Logger::Error("[FFmpegAudioExtractor] " + oss.str() + " uri=" + path);
    throw SegmentationError(oss.str() + ": " + path);
  }

  std::ostringstream oss;
  oss << "[FFmpegAudioExtractor] EXTRACT_OK uri=" << path
      << " codec=" << codec->name
      << " src_rate=" << in_rate
      << " dst_rate=" << sample_rate
      << " samples=" << out.samples.size()
      << " duration_ms=" << out.DurationMs();
  if (decode_errors > 0) oss << " decode_errors=" << decode_errors;
  Logger::Info(oss.str());
  return out;
}

}  // namespace redub::media
