#pragma once

/// @file audio_buffer.h
/// @brief Planar multichannel audio buffer used by loading, mastering and export.

#include <cstddef>
#include <vector>

#include "core/audio.h"

namespace masterprint {

/// @brief Planar multichannel audio (one contiguous vector per channel).
/// @details Channel layout is always explicit. Conversions from interleaved data take the
///          channel count from the caller and never infer it from array dimensions.
class AudioBuffer {
 public:
  AudioBuffer();

  /// @brief Creates a zero-filled buffer.
  /// @param channels Number of channels (>= 1)
  /// @param frames Samples per channel
  /// @param sample_rate Sample rate in Hz
  AudioBuffer(int channels, size_t frames, int sample_rate);

  /// @brief Splits interleaved samples into channels.
  /// @param data Interleaved samples [frame0 ch0, frame0 ch1, ...]
  /// @param n_values Total number of values (must be a multiple of channels)
  /// @param channels Known channel count of the source format
  /// @param sample_rate Sample rate in Hz
  /// @throws MasterprintException if n_values is not a multiple of channels
  static AudioBuffer from_interleaved(const float* data, size_t n_values, int channels,
                                      int sample_rate);

  /// @brief Creates a buffer from per-channel vectors (all of equal length).
  static AudioBuffer from_channels(std::vector<std::vector<float>> channels, int sample_rate);

  /// @brief Wraps a mono Audio as a one-channel buffer.
  static AudioBuffer from_mono(const Audio& audio);

  int channels() const { return static_cast<int>(data_.size()); }
  size_t frames() const { return frames_; }
  int sample_rate() const { return sample_rate_; }
  bool empty() const { return frames_ == 0 || data_.empty(); }
  float duration() const;

  float* channel(int ch) { return data_[static_cast<size_t>(ch)].data(); }
  const float* channel(int ch) const { return data_[static_cast<size_t>(ch)].data(); }
  std::vector<float>& channel_vector(int ch) { return data_[static_cast<size_t>(ch)]; }
  const std::vector<float>& channel_vector(int ch) const { return data_[static_cast<size_t>(ch)]; }

  /// @brief Returns samples interleaved in frame order.
  std::vector<float> interleaved() const;

  /// @brief Copies frames [start, end) into a new buffer.
  AudioBuffer slice(size_t start_frame, size_t end_frame) const;

  /// @brief Averages all channels into a mono Audio.
  Audio to_mono() const;

  /// @brief Returns one channel as a mono Audio (copied).
  Audio channel_audio(int ch) const;

  /// @brief Returns a stereo copy, duplicating a mono channel when needed.
  AudioBuffer to_stereo() const;

  /// @brief Multiplies every sample by a linear gain.
  void apply_gain(float gain);

  /// @brief Absolute peak over all channels.
  float peak() const;

 private:
  std::vector<std::vector<float>> data_;
  size_t frames_;
  int sample_rate_;
};

}  // namespace masterprint
