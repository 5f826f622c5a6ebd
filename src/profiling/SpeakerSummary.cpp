// Repository: Redub
// Component: Speaker Summary Implementation
// Copyright (c) 2026 Redub

#include "redub/profiling/SpeakerSummary.hpp"

#include <algorithm>
#include <cmath>

#include "redub/core/FlatJson.hpp"

namespace redub::profiling {

using core::JsonObjectWriter;

ValueStats ValueStats::Of(const std::vector<double>& values) {
  ValueStats s;
  if (values.empty()) return s;
  s.count = values.size();
  s.min = *std::min_element(values.begin(), values.end());
  s.max = *std::max_element(values.begin(), values.end());
  double sum = 0.0;
  for (double v : values) sum += v;
  s.mean = sum / static_cast<double>(s.count);
  double sq = 0.0;
  for (double v : values) sq += (v - s.mean) * (v - s.mean);
  s.stddev = std::sqrt(sq / static_cast<double>(s.count));
  return s;
}

SpeakerSummary SummarizeSpeakers(const std::vector<core::SourceSegment>& segments,
                                 const std::map<int32_t, core::SpeakerProfile>& profiles) {
  SpeakerSummary out;
  std::vector<double> durations;
  std::vector<double> pitches;
  std::vector<double> energies;

  for (const auto& seg : segments) {
    if (!seg.is_speech) continue;
    auto it = profiles.find(seg.id);
    if (it == profiles.end()) continue;
    const core::SpeakerProfile& p = it->second;
    const int64_t ms = seg.duration_ms();

    ++out.speech_segments;
    out.speech_ms += ms;
    durations.push_back(static_cast<double>(ms));

    GenderShare* share = &out.unknown;
    if (p.gender == core::Gender::kMale) share = &out.male;
    if (p.gender == core::Gender::kFemale) share = &out.female;
    ++share->count;
    share->duration_ms += ms;

    if (p.pitch_hz > 0.0) pitches.push_back(p.pitch_hz);
    energies.push_back(p.energy_db);
    if (!p.voice_id.empty()) ++out.voices[p.voice_id];
  }

  if (out.speech_segments > 0) {
    const double n = static_cast<double>(out.speech_segments);
    for (GenderShare* g : {&out.male, &out.female, &out.unknown}) {
      g->percent = 100.0 * static_cast<double>(g->count) / n;
    }
  }
  out.segment_duration_ms = ValueStats::Of(durations);
  out.pitch_hz = ValueStats::Of(pitches);
  out.energy_db = ValueStats::Of(energies);
  return out;
}

namespace {

std::string StatsJson(const ValueStats& s) {
  JsonObjectWriter w;
  w.Add("count", static_cast<uint64_t>(s.count))
      .Add("mean", s.mean)
      .Add("std", s.stddev)
      .Add("min", s.min)
      .Add("max", s.max);
  return w.str();
}

std::string ShareJson(const GenderShare& g) {
  JsonObjectWriter w;
  w.Add("count", static_cast<uint64_t>(g.count))
      .Add("duration_ms", g.duration_ms)
      .Add("percent", g.percent);
  return w.str();
}

}  // namespace

std::string SpeakerSummary::ToJson() const {
  JsonObjectWriter genders;
  genders.AddRaw("male", ShareJson(male))
      .AddRaw("female", ShareJson(female))
      .AddRaw("unknown", ShareJson(unknown));

  JsonObjectWriter voice_counts;
  for (const auto& v : voices) voice_counts.Add(v.first, static_cast<uint64_t>(v.second));

  JsonObjectWriter w;
  w.Add("speech_segments", static_cast<uint64_t>(speech_segments))
      .Add("speech_ms", speech_ms)
      .AddRaw("genders", genders.str())
      .AddRaw("segment_duration_ms", StatsJson(segment_duration_ms))
      .AddRaw("pitch_hz", StatsJson(pitch_hz))
      .AddRaw("energy_db", StatsJson(energy_db))
      .AddRaw("voices", voice_counts.str());
  return w.str();
}

}  // namespace redub::profiling
