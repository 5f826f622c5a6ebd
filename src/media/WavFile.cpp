// Repository: Redub
// Component: WAV File I/O
// Copyright (c) 2026 Redub

#include "redub/media/WavFile.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <vector>

namespace redub::media {

namespace {

template <typename T>
void WriteLe(std::ofstream& out, T value) {
  out.write(reinterpret_cast<const char*>(&value), sizeof(value));
}

template <typename T>
bool ReadLe(std::ifstream& in, T* value) {
  in.read(reinterpret_cast<char*>(value), sizeof(T));
  return static_cast<bool>(in);
}

void SetError(std::string* error, const std::string& msg) {
  if (error) *error = msg;
}

}  // namespace

bool WriteWavMono16(const std::string& path, const PcmBuffer& buffer, std::string* error) {
  if (buffer.sample_rate <= 0) {
    SetError(error, "invalid sample rate for " + path);
    return false;
  }

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    SetError(error, "failed to open WAV output " + path);
    return false;
  }

  const uint16_t channels = 1;
  const uint16_t bits_per_sample = 16;
  const uint32_t sample_rate = static_cast<uint32_t>(buffer.sample_rate);
  const uint32_t byte_rate = sample_rate * channels * (bits_per_sample / 8);
  const uint16_t block_align = channels * (bits_per_sample / 8);
  const uint32_t data_size = static_cast<uint32_t>(buffer.samples.size() * sizeof(int16_t));

  out.write("RIFF", 4);
  WriteLe<uint32_t>(out, 36 + data_size);
  out.write("WAVE", 4);

  out.write("fmt ", 4);
  WriteLe<uint32_t>(out, 16);
  WriteLe<uint16_t>(out, 1);  // PCM
  WriteLe<uint16_t>(out, channels);
  WriteLe<uint32_t>(out, sample_rate);
  WriteLe<uint32_t>(out, byte_rate);
  WriteLe<uint16_t>(out, block_align);
  WriteLe<uint16_t>(out, bits_per_sample);

  out.write("data", 4);
  WriteLe<uint32_t>(out, data_size);

  std::vector<int16_t> pcm(buffer.samples.size());
  for (size_t i = 0; i < buffer.samples.size(); ++i) {
    const float clamped = std::max(-1.0f, std::min(1.0f, buffer.samples[i]));
    pcm[i] = static_cast<int16_t>(std::lround(clamped * 32767.0f));
  }
  out.write(reinterpret_cast<const char*>(pcm.data()),
            static_cast<std::streamsize>(pcm.size() * sizeof(int16_t)));

  if (!out.good()) {
    SetError(error, "failed to write WAV data " + path);
    return false;
  }
  return true;
}

bool ReadWavMono16(const std::string& path, PcmBuffer* buffer, std::string* error) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    SetError(error, "failed to open WAV input " + path);
    return false;
  }

  char riff[4];
  uint32_t riff_size = 0;
  char wave[4];
  in.read(riff, 4);
  ReadLe(in, &riff_size);
  in.read(wave, 4);
  if (!in || std::memcmp(riff, "RIFF", 4) != 0 || std::memcmp(wave, "WAVE", 4) != 0) {
    SetError(error, "not a RIFF/WAVE file " + path);
    return false;
  }

  uint16_t format = 0;
  uint16_t channels = 0;
  uint32_t sample_rate = 0;
  uint16_t bits_per_sample = 0;
  bool have_fmt = false;

  // Walk chunks until "data"; unknown chunks (LIST, fact) are skipped.
  while (true) {
    char id[4];
    uint32_t size = 0;
    in.read(id, 4);
    if (!ReadLe(in, &size)) {
      SetError(error, "missing data chunk " + path);
      return false;
    }
    if (std::memcmp(id, "fmt ", 4) == 0) {
      uint32_t byte_rate = 0;
      uint16_t block_align = 0;
      ReadLe(in, &format);
      ReadLe(in, &channels);
      ReadLe(in, &sample_rate);
      ReadLe(in, &byte_rate);
      ReadLe(in, &block_align);
      ReadLe(in, &bits_per_sample);
      if (!in) {
        SetError(error, "truncated fmt chunk " + path);
        return false;
      }
      if (size > 16) in.seekg(size - 16, std::ios::cur);
      have_fmt = true;
    } else if (std::memcmp(id, "data", 4) == 0) {
      if (!have_fmt || format != 1 || bits_per_sample != 16 || channels == 0) {
        SetError(error, "unsupported WAV format (need 16-bit PCM) " + path);
        return false;
      }
      const size_t frames = size / (sizeof(int16_t) * channels);
      std::vector<int16_t> pcm(frames * channels);
      in.read(reinterpret_cast<char*>(pcm.data()),
              static_cast<std::streamsize>(pcm.size() * sizeof(int16_t)));
      const size_t read_frames =
          static_cast<size_t>(in.gcount()) / (sizeof(int16_t) * channels);

      buffer->sample_rate = static_cast<int>(sample_rate);
      buffer->samples.assign(read_frames, 0.0f);
      for (size_t f = 0; f < read_frames; ++f) {
        float sum = 0.0f;
        for (uint16_t ch = 0; ch < channels; ++ch) {
          sum += static_cast<float>(pcm[f * channels + ch]) / 32768.0f;
        }
        buffer->samples[f] = sum / static_cast<float>(channels);
      }
      return true;
    } else {
      in.seekg(size + (size & 1u), std::ios::cur);
    }
  }
}

}  // namespace redub::media
