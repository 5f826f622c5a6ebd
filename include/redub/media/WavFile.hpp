// Repository: Redub
// Component: WAV File I/O
// Purpose: 16-bit PCM mono WAV read/write for job artifacts.
// Copyright (c) 2026 Redub

#ifndef REDUB_MEDIA_WAV_FILE_HPP_
#define REDUB_MEDIA_WAV_FILE_HPP_

#include <string>

#include "redub/media/PcmBuffer.hpp"

namespace redub::media {

// Writes |buffer| as 16-bit PCM mono, clamping to [-1, 1]. An empty buffer
// produces a valid zero-length WAV. Returns false with |error| set on failure.
bool WriteWavMono16(const std::string& path, const PcmBuffer& buffer, std::string* error);

// Reads a 16-bit PCM WAV; multi-channel input is averaged to mono.
bool ReadWavMono16(const std::string& path, PcmBuffer* buffer, std::string* error);

}  // namespace redub::media

#endif  // REDUB_MEDIA_WAV_FILE_HPP_
