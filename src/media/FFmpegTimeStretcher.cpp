// Repository: Redub
// Component: FFmpeg Time Stretcher
// Purpose: atempo filter graph for pitch-preserving rate adjustment.
// Copyright (c) 2026 Redub

#include "redub/media/TimeStretcher.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <memory>
#include <sstream>

#include "redub/core/Errors.hpp"
#include "redub/util/Logger.hpp"

extern "C" {
#include <libavfilter/avfilter.h>
#include <libavfilter/buffersink.h>
#include <libavfilter/buffersrc.h>
#include <libavutil/channel_layout.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libavutil/mem.h>
#include <libavutil/samplefmt.h>
}

namespace redub::media {

using core::DubError;
using core::DubException;
using util::Logger;

namespace {

// Samples per frame pushed into the graph.
constexpr int kFeedFrameSamples = 1024;
constexpr int kMaxFlushRequests = 64;

// Portable atempo range (older FFmpeg rejects values outside it).
constexpr double kAtempoMin = 0.5;
constexpr double kAtempoMax = 2.0;

std::string AvErrorString(int err) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(err, errbuf, sizeof(errbuf));
  return errbuf;
}

struct GraphFreer {
  void operator()(AVFilterGraph* g) const { avfilter_graph_free(&g); }
};
struct FrameFreer {
  void operator()(AVFrame* f) const { av_frame_free(&f); }
};
struct InOutFreer {
  void operator()(AVFilterInOut* io) const { avfilter_inout_free(&io); }
};

[[noreturn]] void Fail(const std::string& step, int ret) {
  std::ostringstream oss;
  oss << "[FFmpegTimeStretcher] STRETCH_STEP " << step << " FAILED";
  if (ret != 0) oss << " ret=" << ret << " err=" << AvErrorString(ret);
  Logger::Error(oss.str());
  throw DubException(DubError::kSynthesisFailed, oss.str());
}

// Pulls every frame currently available from the sink into |out|.
// Returns true once the sink reports EOF.
bool DrainSink(AVFilterContext* sink, AVFrame* frame, PcmBuffer* out) {
  while (true) {
    int ret = av_buffersink_get_frame(sink, frame);
    if (ret == AVERROR(EAGAIN)) return false;
    if (ret == AVERROR_EOF) return true;
    if (ret < 0) Fail("av_buffersink_get_frame", ret);
    const float* data = reinterpret_cast<const float*>(frame->data[0]);
    out->samples.insert(out->samples.end(), data, data + frame->nb_samples);
    av_frame_unref(frame);
  }
}

}  // namespace

std::string BuildAtempoChain(double tempo) {
  std::ostringstream desc;
  bool first = true;
  auto stage = [&](double factor) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "atempo=%f", factor);
    if (!first) desc << ',';
    desc << buf;
    first = false;
  };
  while (tempo > kAtempoMax) {
    stage(kAtempoMax);
    tempo /= kAtempoMax;
  }
  while (tempo < kAtempoMin) {
    stage(kAtempoMin);
    tempo /= kAtempoMin;
  }
  stage(tempo);
  return desc.str();
}

PcmBuffer FFmpegTimeStretcher::Stretch(const PcmBuffer& input, double tempo,
                                       int output_sample_rate) {
  if (tempo <= 0.0 || input.sample_rate <= 0 || output_sample_rate <= 0) {
    std::ostringstream oss;
    oss << "invalid stretch request tempo=" << tempo << " in_rate=" << input.sample_rate
        << " out_rate=" << output_sample_rate;
    throw DubException(DubError::kSynthesisFailed, oss.str());
  }

  PcmBuffer out;
  out.sample_rate = output_sample_rate;
  if (input.empty()) return out;
  if (std::fabs(tempo - 1.0) < 1e-6 && input.sample_rate == output_sample_rate) {
    out.samples = input.samples;
    return out;
  }

  std::unique_ptr<AVFilterGraph, GraphFreer> graph(avfilter_graph_alloc());
  if (!graph) Fail("avfilter_graph_alloc", 0);

  const AVFilter* abuffer = avfilter_get_by_name("abuffer");
  const AVFilter* abuffersink = avfilter_get_by_name("abuffersink");
  if (!abuffer || !abuffersink) Fail("avfilter_get_by_name", 0);

  char src_args[256];
  std::snprintf(src_args, sizeof(src_args),
                "time_base=1/%d:sample_rate=%d:sample_fmt=%s:channel_layout=mono",
                input.sample_rate, input.sample_rate,
                av_get_sample_fmt_name(AV_SAMPLE_FMT_FLT));

  // Contexts are owned by the graph.
  AVFilterContext* src_ctx = nullptr;
  AVFilterContext* sink_ctx = nullptr;
  int ret = avfilter_graph_create_filter(&src_ctx, abuffer, "in", src_args, nullptr, graph.get());
  if (ret < 0) Fail("create_filter abuffer", ret);
  ret = avfilter_graph_create_filter(&sink_ctx, abuffersink, "out", nullptr, nullptr, graph.get());
  if (ret < 0) Fail("create_filter abuffersink", ret);

  std::ostringstream desc;
  desc << BuildAtempoChain(tempo)
       << ",aresample=" << output_sample_rate
       << ",aformat=sample_fmts=flt:channel_layouts=mono";

  // Open ends of the parsed chain: its input attaches to "in", its output
  // to "out".
  std::unique_ptr<AVFilterInOut, InOutFreer> outputs(avfilter_inout_alloc());
  std::unique_ptr<AVFilterInOut, InOutFreer> inputs(avfilter_inout_alloc());
  if (!outputs || !inputs) Fail("avfilter_inout_alloc", 0);
  outputs->name = av_strdup("in");
  outputs->filter_ctx = src_ctx;
  outputs->pad_idx = 0;
  outputs->next = nullptr;
  inputs->name = av_strdup("out");
  inputs->filter_ctx = sink_ctx;
  inputs->pad_idx = 0;
  inputs->next = nullptr;

  AVFilterInOut* raw_inputs = inputs.release();
  AVFilterInOut* raw_outputs = outputs.release();
  ret = avfilter_graph_parse_ptr(graph.get(), desc.str().c_str(), &raw_inputs, &raw_outputs, nullptr);
  inputs.reset(raw_inputs);
  outputs.reset(raw_outputs);
  if (ret < 0) Fail("avfilter_graph_parse_ptr " + desc.str(), ret);
  ret = avfilter_graph_config(graph.get(), nullptr);
  if (ret < 0) Fail("avfilter_graph_config", ret);

  std::unique_ptr<AVFrame, FrameFreer> in_frame(av_frame_alloc());
  std::unique_ptr<AVFrame, FrameFreer> out_frame(av_frame_alloc());
  if (!in_frame || !out_frame) Fail("av_frame_alloc", 0);

  const size_t total = input.samples.size();
  for (size_t offset = 0; offset < total; offset += kFeedFrameSamples) {
    const int n = static_cast<int>(std::min<size_t>(kFeedFrameSamples, total - offset));
    in_frame->format = AV_SAMPLE_FMT_FLT;
    av_channel_layout_default(&in_frame->ch_layout, 1);
    in_frame->sample_rate = input.sample_rate;
    in_frame->nb_samples = n;
    in_frame->pts = static_cast<int64_t>(offset);
    ret = av_frame_get_buffer(in_frame.get(), 0);
    if (ret < 0) Fail("av_frame_get_buffer", ret);
    std::memcpy(in_frame->data[0], input.samples.data() + offset, sizeof(float) * n);

    // Takes ownership of the frame's buffers and resets it.
    ret = av_buffersrc_add_frame(src_ctx, in_frame.get());
    if (ret < 0) Fail("av_buffersrc_add_frame", ret);
    DrainSink(sink_ctx, out_frame.get(), &out);
  }

  ret = av_buffersrc_add_frame(src_ctx, nullptr);
  if (ret < 0) Fail("av_buffersrc_add_frame(eof)", ret);
  // After EOF on the source, the sink pulls the remaining frames through the
  // graph itself; EAGAIN only means a filter needs another request.
  bool eof = DrainSink(sink_ctx, out_frame.get(), &out);
  for (int i = 0; !eof && i < kMaxFlushRequests; ++i) {
    ret = avfilter_graph_request_oldest(graph.get());
    if (ret < 0 && ret != AVERROR(EAGAIN) && ret != AVERROR_EOF) {
      Fail("avfilter_graph_request_oldest", ret);
    }
    eof = DrainSink(sink_ctx, out_frame.get(), &out) || ret == AVERROR_EOF;
  }

  std::ostringstream oss;
  oss << "[FFmpegTimeStretcher] tempo=" << tempo
      << " in_ms=" << input.DurationMs()
      << " out_ms=" << out.DurationMs()
      << " out_rate=" << output_sample_rate;
  Logger::Debug(oss.str());
  return out;
}

}  // namespace redub::media
