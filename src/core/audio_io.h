#pragma once

/// @file audio_io.h
/// @brief Audio file loading (dr_wav, minimp3) and 24-bit WAV export (dr_wav).

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "core/audio_buffer.h"

namespace masterprint {

/// @brief Detected audio format.
enum class AudioFormat {
  Unknown,
  WAV,
  MP3,
};

/// @brief Options for audio loading.
struct AudioLoadOptions {
  /// @brief Maximum file size in bytes (0 = no limit).
  size_t max_file_size = 1024u * 1024u * 1024u;
};

/// @brief Detects audio format from buffer header.
/// @param data Pointer to audio data
/// @param size Size of data in bytes
AudioFormat detect_format(const uint8_t* data, size_t size);

/// @brief Decodes a WAV image from memory, keeping channels separate.
/// @throws MasterprintException on decode error
AudioBuffer load_buffer_wav(const uint8_t* data, size_t size);

/// @brief Decodes an MP3 image from memory, keeping channels separate.
/// @throws MasterprintException on decode error
AudioBuffer load_buffer_mp3(const uint8_t* data, size_t size);

/// @brief Decodes audio from memory (auto-detect format).
/// @throws MasterprintException on unknown format or decode error
AudioBuffer load_buffer(const uint8_t* data, size_t size);

/// @brief Loads an audio file (auto-detect format), keeping channels separate.
/// @param path Path to audio file
/// @param options Loading options
/// @throws MasterprintException on file not found, unknown format, file too large, or decode error
AudioBuffer load_audio(const std::string& path, const AudioLoadOptions& options = {});

/// @brief Incremental PCM WAV writer.
/// @details Frames are appended chunk by chunk. The RIFF header is finalized by close() or
///          by the destructor. Samples are clamped to [-1, 1].
class WavWriter {
 public:
  /// @brief Opens (truncates) a WAV file for writing.
  /// @param path Output path
  /// @param channels Channel count
  /// @param sample_rate Sample rate in Hz
  /// @param bits_per_sample 16 or 24
  /// @throws MasterprintException if the file cannot be created
  WavWriter(const std::string& path, int channels, int sample_rate, int bits_per_sample = 24);
  ~WavWriter();

  WavWriter(const WavWriter&) = delete;
  WavWriter& operator=(const WavWriter&) = delete;

  /// @brief Appends all frames of a buffer.
  /// @throws MasterprintException on channel mismatch or short write
  void write(const AudioBuffer& buffer);

  /// @brief Finalizes the file. Further writes are rejected.
  void close();

  size_t frames_written() const { return frames_written_; }
  int channels() const { return channels_; }

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
  int channels_;
  int bits_per_sample_;
  size_t frames_written_ = 0;
};

/// @brief Saves a whole buffer to a WAV file.
/// @param path Output file path
/// @param buffer Audio to write
/// @param bits_per_sample Bit depth (16 or 24, default 24)
/// @throws MasterprintException on write error
void save_wav(const std::string& path, const AudioBuffer& buffer, int bits_per_sample = 24);

}  // namespace masterprint
