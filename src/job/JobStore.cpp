// Repository: Redub
// Component: Job Store Implementation
// Copyright (c) 2026 Redub

#include "redub/job/JobStore.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>

#include "redub/core/Errors.hpp"
#include "redub/core/FlatJson.hpp"
#include "redub/media/WavFile.hpp"

namespace redub::job {

using core::AlignedClip;
using core::IoError;
using core::JsonFindBool;
using core::JsonFindDouble;
using core::JsonFindInt64;
using core::JsonFindString;
using core::JsonObjectWriter;
using core::SourceSegment;

namespace {

std::string TempPath(const std::string& path) {
  return path + ".tmp." + std::to_string(static_cast<unsigned long>(getpid()));
}

bool FindInt32(const std::string& json, const std::string& key, int32_t* out) {
  int64_t v = 0;
  if (!JsonFindInt64(json, key, &v)) return false;
  *out = static_cast<int32_t>(v);
  return true;
}

std::string SegmentToJsonLine(const SourceSegment& s) {
  JsonObjectWriter w;
  w.Add("id", s.id)
      .Add("start_ms", s.start_ms)
      .Add("end_ms", s.end_ms)
      .Add("is_speech", s.is_speech)
      .Add("sample_begin", s.sample_begin)
      .Add("sample_end", s.sample_end);
  return w.str();
}

bool SegmentFromJsonLine(const std::string& line, SourceSegment* out) {
  if (!core::IsCompleteJsonObject(line)) return false;
  SourceSegment s;
  if (!FindInt32(line, "id", &s.id)) return false;
  if (!JsonFindInt64(line, "start_ms", &s.start_ms)) return false;
  if (!JsonFindInt64(line, "end_ms", &s.end_ms)) return false;
  if (!JsonFindBool(line, "is_speech", &s.is_speech)) return false;
  if (!JsonFindInt64(line, "sample_begin", &s.sample_begin)) return false;
  if (!JsonFindInt64(line, "sample_end", &s.sample_end)) return false;
  *out = s;
  return true;
}

bool DriftKindFromName(const std::string& name, core::DriftKind* out) {
  for (core::DriftKind k : {core::DriftKind::kAbsorbedIntoSilence,
                            core::DriftKind::kCascadingShift}) {
    if (name == core::DriftKindName(k)) {
      *out = k;
      return true;
    }
  }
  return false;
}

}  // namespace

// -----------------------------------------------------------------------------
// AlignmentRecord
// -----------------------------------------------------------------------------

std::string AlignmentRecord::ToJsonLine() const {
  JsonObjectWriter w;
  w.Add("segment_id", clip.segment_id)
      .Add("source_start_ms", clip.source_start_ms)
      .Add("source_end_ms", clip.source_end_ms)
      .Add("final_start_ms", clip.final_start_ms)
      .Add("final_end_ms", clip.final_end_ms)
      .Add("applied_rate", clip.applied_rate)
      .Add("pad_ms", clip.pad_ms)
      .Add("absorbed_ms", clip.absorbed_ms)
      .Add("shift_ms", clip.shift_ms)
      .Add("cumulative_drift_ms", cumulative_drift_ms);
  if (warning) {
    w.Add("warning_kind", core::DriftKindName(warning->kind))
        .Add("required_rate", warning->required_rate)
        .Add("overflow_ms", warning->overflow_ms)
        .Add("warning_absorbed_ms", warning->absorbed_ms)
        .Add("warning_shift_ms", warning->shift_ms);
  }
  return w.str();
}

bool AlignmentRecord::FromJsonLine(const std::string& line, AlignmentRecord* out) {
  if (!core::IsCompleteJsonObject(line)) return false;
  AlignmentRecord r;
  if (!FindInt32(line, "segment_id", &r.clip.segment_id)) return false;
  if (!JsonFindInt64(line, "source_start_ms", &r.clip.source_start_ms)) return false;
  if (!JsonFindInt64(line, "source_end_ms", &r.clip.source_end_ms)) return false;
  if (!JsonFindInt64(line, "final_start_ms", &r.clip.final_start_ms)) return false;
  if (!JsonFindInt64(line, "final_end_ms", &r.clip.final_end_ms)) return false;
  if (!JsonFindDouble(line, "applied_rate", &r.clip.applied_rate)) return false;
  if (!JsonFindInt64(line, "pad_ms", &r.clip.pad_ms)) return false;
  if (!JsonFindInt64(line, "absorbed_ms", &r.clip.absorbed_ms)) return false;
  if (!JsonFindInt64(line, "shift_ms", &r.clip.shift_ms)) return false;
  if (!JsonFindInt64(line, "cumulative_drift_ms", &r.cumulative_drift_ms)) return false;

  std::string kind;
  if (JsonFindString(line, "warning_kind", &kind)) {
    core::DriftWarning d;
    if (!DriftKindFromName(kind, &d.kind)) return false;
    d.segment_id = r.clip.segment_id;
    d.applied_rate = r.clip.applied_rate;
    d.cumulative_drift_ms = r.cumulative_drift_ms;
    if (!JsonFindDouble(line, "required_rate", &d.required_rate)) return false;
    if (!JsonFindInt64(line, "overflow_ms", &d.overflow_ms)) return false;
    if (!JsonFindInt64(line, "warning_absorbed_ms", &d.absorbed_ms)) return false;
    if (!JsonFindInt64(line, "warning_shift_ms", &d.shift_ms)) return false;
    r.warning = d;
  }
  *out = r;
  return true;
}

// -----------------------------------------------------------------------------
// JobStore
// -----------------------------------------------------------------------------

JobStore::JobStore(const std::string& work_root, const std::string& job_id)
    : work_root_(work_root), job_dir_(work_root + "/" + job_id) {
  EnsureDir(work_root_);
  EnsureDir(job_dir_);
}

void JobStore::EnsureDir(const std::string& path) const {
  // mkdir -p: create each missing component in turn.
  for (size_t pos = 1; pos <= path.size(); ++pos) {
    if (pos != path.size() && path[pos] != '/') continue;
    const std::string partial = path.substr(0, pos);
    if (mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST) {
      throw IoError("JobStore: cannot create directory " + partial + ": " +
                    std::strerror(errno));
    }
  }
}

std::string JobStore::PathFor(const std::string& name) const {
  return job_dir_ + "/" + name;
}

std::string JobStore::SegmentDir(int32_t segment_id) const {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "seg_%04d", segment_id);
  return PathFor(buf);
}

void JobStore::WriteFileAtomic(const std::string& path, const std::string& content) const {
  const std::string tmp_path = TempPath(path);
  {
    std::ofstream of(tmp_path, std::ios::out | std::ios::trunc);
    if (!of) throw IoError("JobStore: cannot open " + tmp_path);
    of << content;
    of.flush();
    if (!of) throw IoError("JobStore: write failed " + tmp_path);
  }
  if (rename(tmp_path.c_str(), path.c_str()) != 0) {
    (void)unlink(tmp_path.c_str());
    throw IoError("JobStore: rename failed " + path);
  }
}

void JobStore::WriteWavAtomic(const std::string& path, const media::PcmBuffer& audio) const {
  const std::string tmp_path = TempPath(path);
  std::string error;
  if (!media::WriteWavMono16(tmp_path, audio, &error)) {
    (void)unlink(tmp_path.c_str());
    throw IoError("JobStore: " + error);
  }
  if (rename(tmp_path.c_str(), path.c_str()) != 0) {
    (void)unlink(tmp_path.c_str());
    throw IoError("JobStore: rename failed " + path);
  }
}

bool JobStore::ReadFile(const std::string& path, std::string* out) {
  std::ifstream in(path);
  if (!in) return false;
  std::ostringstream ss;
  ss << in.rdbuf();
  *out = ss.str();
  return true;
}

void JobStore::SaveSegments(const std::vector<SourceSegment>& segments) {
  std::ostringstream o;
  for (const auto& s : segments) o << SegmentToJsonLine(s) << '\n';
  WriteFileAtomic(PathFor(kSegmentsFile), o.str());
}

bool JobStore::LoadSegments(std::vector<SourceSegment>* out) const {
  std::ifstream in(PathFor(kSegmentsFile));
  if (!in) return false;
  std::vector<SourceSegment> segments;
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) continue;
    SourceSegment s;
    if (!SegmentFromJsonLine(line, &s)) return false;
    segments.push_back(s);
  }
  *out = std::move(segments);
  return true;
}

void JobStore::SaveSourceAudio(int32_t segment_id, const media::PcmBuffer& audio) {
  const std::string dir = SegmentDir(segment_id);
  EnsureDir(dir);
  WriteWavAtomic(dir + "/source.wav", audio);
}

void JobStore::SaveProfile(const core::SpeakerProfile& profile) {
  const std::string dir = SegmentDir(profile.segment_id);
  EnsureDir(dir);
  JsonObjectWriter w;
  w.Add("segment_id", profile.segment_id)
      .Add("gender", core::GenderName(profile.gender))
      .Add("confidence", profile.confidence)
      .Add("pitch_hz", profile.pitch_hz)
      .Add("energy_db", profile.energy_db)
      .Add("spectral_centroid_hz", profile.spectral_centroid_hz)
      .Add("voice_type", profile.voice_type)
      .Add("voice_id", profile.voice_id)
      .Add("volume", profile.volume)
      .Add("pitch_shift_hz", static_cast<int32_t>(profile.pitch_shift_hz))
      .Add("min_rate", profile.min_rate)
      .Add("max_rate", profile.max_rate);
  WriteFileAtomic(dir + "/profile.json", w.str());
}

bool JobStore::LoadProfile(int32_t segment_id, core::SpeakerProfile* out) const {
  std::string json;
  if (!ReadFile(SegmentDir(segment_id) + "/profile.json", &json)) return false;
  core::SpeakerProfile p;
  p.segment_id = segment_id;
  std::string gender;
  int32_t shift = 0;
  if (!JsonFindString(json, "gender", &gender)) return false;
  p.gender = core::GenderFromName(gender);
  if (!JsonFindDouble(json, "confidence", &p.confidence)) return false;
  if (!JsonFindDouble(json, "pitch_hz", &p.pitch_hz)) return false;
  if (!JsonFindDouble(json, "energy_db", &p.energy_db)) return false;
  if (!JsonFindDouble(json, "spectral_centroid_hz", &p.spectral_centroid_hz)) return false;
  if (!JsonFindString(json, "voice_type", &p.voice_type)) return false;
  if (!JsonFindString(json, "voice_id", &p.voice_id)) return false;
  if (!JsonFindDouble(json, "volume", &p.volume)) return false;
  if (!FindInt32(json, "pitch_shift_hz", &shift)) return false;
  p.pitch_shift_hz = shift;
  if (!JsonFindDouble(json, "min_rate", &p.min_rate)) return false;
  if (!JsonFindDouble(json, "max_rate", &p.max_rate)) return false;
  *out = std::move(p);
  return true;
}

void JobStore::SaveTranscript(const core::TranscriptSegment& transcript) {
  const std::string dir = SegmentDir(transcript.segment_id);
  EnsureDir(dir);

  std::ostringstream words;
  for (const auto& w : transcript.words) {
    JsonObjectWriter ww;
    ww.Add("word", w.word).Add("start_ms", w.start_ms).Add("end_ms", w.end_ms);
    words << ww.str() << '\n';
  }
  WriteFileAtomic(dir + "/words.jsonl", words.str());

  // transcript.json is written last; its presence marks the pair complete.
  JsonObjectWriter w;
  w.Add("segment_id", transcript.segment_id)
      .Add("text", transcript.text)
      .Add("confidence", transcript.confidence)
      .Add("word_count", static_cast<int64_t>(transcript.words.size()));
  WriteFileAtomic(dir + "/transcript.json", w.str());
}

bool JobStore::LoadTranscript(int32_t segment_id, core::TranscriptSegment* out) const {
  const std::string dir = SegmentDir(segment_id);
  std::string json;
  if (!ReadFile(dir + "/transcript.json", &json)) return false;

  core::TranscriptSegment t;
  t.segment_id = segment_id;
  int64_t word_count = 0;
  if (!JsonFindString(json, "text", &t.text)) return false;
  if (!JsonFindDouble(json, "confidence", &t.confidence)) return false;
  if (!JsonFindInt64(json, "word_count", &word_count)) return false;

  std::ifstream in(dir + "/words.jsonl");
  if (!in && word_count > 0) return false;
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) continue;
    core::WordTiming w;
    if (!core::IsCompleteJsonObject(line) ||
        !JsonFindString(line, "word", &w.word) ||
        !JsonFindInt64(line, "start_ms", &w.start_ms) ||
        !JsonFindInt64(line, "end_ms", &w.end_ms)) {
      return false;
    }
    t.words.push_back(std::move(w));
  }
  if (static_cast<int64_t>(t.words.size()) != word_count) return false;
  *out = std::move(t);
  return true;
}

void JobStore::SaveTranslation(const core::TranslatedSegment& translation) {
  const std::string dir = SegmentDir(translation.segment_id);
  EnsureDir(dir);
  JsonObjectWriter w;
  w.Add("segment_id", translation.segment_id)
      .Add("translated_text", translation.translated_text)
      .Add("target_language", translation.target_language);
  WriteFileAtomic(dir + "/translation.json", w.str());
}

bool JobStore::LoadTranslation(int32_t segment_id, core::TranslatedSegment* out) const {
  std::string json;
  if (!ReadFile(SegmentDir(segment_id) + "/translation.json", &json)) return false;
  core::TranslatedSegment t;
  t.segment_id = segment_id;
  if (!JsonFindString(json, "translated_text", &t.translated_text)) return false;
  if (!JsonFindString(json, "target_language", &t.target_language)) return false;
  *out = std::move(t);
  return true;
}

void JobStore::SaveSynthesis(const core::SynthesizedClip& clip) {
  const std::string dir = SegmentDir(clip.segment_id);
  EnsureDir(dir);
  WriteWavAtomic(dir + "/synth.wav", clip.waveform);
  JsonObjectWriter w;
  w.Add("segment_id", clip.segment_id)
      .Add("voice_id", clip.voice_id)
      .Add("used_fallback_voice", clip.used_fallback_voice)
      .Add("sample_rate", static_cast<int64_t>(clip.sample_rate()))
      .Add("duration_ms", clip.duration_ms());
  WriteFileAtomic(dir + "/synth.json", w.str());
}

bool JobStore::LoadSynthesis(int32_t segment_id, core::SynthesizedClip* out) const {
  const std::string dir = SegmentDir(segment_id);
  std::string json;
  if (!ReadFile(dir + "/synth.json", &json)) return false;
  core::SynthesizedClip clip;
  clip.segment_id = segment_id;
  if (!JsonFindString(json, "voice_id", &clip.voice_id)) return false;
  if (!JsonFindBool(json, "used_fallback_voice", &clip.used_fallback_voice)) return false;
  std::string error;
  if (!media::ReadWavMono16(dir + "/synth.wav", &clip.waveform, &error)) return false;
  *out = std::move(clip);
  return true;
}

void JobStore::AppendAligned(const AlignedClip& clip, int64_t cumulative_drift_ms,
                             const core::DriftWarning* warning) {
  const std::string dir = SegmentDir(clip.segment_id);
  EnsureDir(dir);
  WriteWavAtomic(dir + "/aligned.wav", clip.waveform);

  AlignmentRecord record;
  record.clip = clip;
  record.cumulative_drift_ms = cumulative_drift_ms;
  if (warning) record.warning = *warning;

  std::lock_guard<std::mutex> lock(ledger_mutex_);
  std::ofstream of(PathFor(kLedgerFile), std::ios::app);
  if (!of) throw IoError("JobStore: cannot open ledger " + PathFor(kLedgerFile));
  of << record.ToJsonLine() << '\n';
  of.flush();
  if (!of) throw IoError("JobStore: ledger write failed " + PathFor(kLedgerFile));
}

std::vector<AlignmentRecord> JobStore::ReplayAlignment() const {
  std::ifstream in(PathFor(kLedgerFile));
  if (!in) return {};

  std::vector<AlignmentRecord> result;
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) continue;
    AlignmentRecord r;
    if (!AlignmentRecord::FromJsonLine(line, &r)) continue;  // torn final line
    result.push_back(r);
  }
  return result;
}

bool JobStore::LoadAlignedAudio(int32_t segment_id, media::PcmBuffer* out) const {
  std::string error;
  return media::ReadWavMono16(SegmentDir(segment_id) + "/aligned.wav", out, &error);
}

void JobStore::ResetAlignment() {
  std::lock_guard<std::mutex> lock(ledger_mutex_);
  std::ofstream of(PathFor(kLedgerFile), std::ios::out | std::ios::trunc);
  if (!of) throw IoError("JobStore: cannot reset ledger " + PathFor(kLedgerFile));
}

void JobStore::WriteReport(const std::string& json) {
  WriteFileAtomic(PathFor(kReportFile), json + "\n");
}

}  // namespace redub::job
