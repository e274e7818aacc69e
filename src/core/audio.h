#pragma once

/// @file audio.h
/// @brief Mono analysis buffer with shared ownership and zero-copy slicing.

#include <cstddef>
#include <memory>
#include <vector>

namespace masterprint {

/// @brief Mono audio buffer with shared ownership and zero-copy slicing.
/// @details Used by every feature extractor. Slices share the underlying buffer.
class Audio {
 public:
  /// @brief Default constructor creates an empty Audio.
  Audio();

  /// @brief Creates Audio from existing samples (copied).
  /// @param samples Pointer to sample data
  /// @param size Number of samples
  /// @param sample_rate Sample rate in Hz
  static Audio from_buffer(const float* samples, size_t size, int sample_rate);

  /// @brief Creates Audio from a vector of samples (moved).
  /// @param samples Vector of samples
  /// @param sample_rate Sample rate in Hz
  static Audio from_vector(std::vector<float> samples, int sample_rate);

  /// @brief Returns pointer to sample data.
  const float* data() const;

  /// @brief Returns number of samples.
  size_t size() const { return length_; }

  /// @brief Returns sample rate in Hz.
  int sample_rate() const { return sample_rate_; }

  /// @brief Returns duration in seconds.
  float duration() const;

  /// @brief Returns true if audio is empty.
  bool empty() const { return length_ == 0; }

  /// @brief Creates a slice by time (shared buffer, zero-copy).
  /// @param start_time Start time in seconds
  /// @param end_time End time in seconds (negative means end of audio)
  Audio slice(float start_time, float end_time = -1.0f) const;

  /// @brief Creates a slice by sample indices (shared buffer, zero-copy).
  /// @param start_sample Start sample index
  /// @param end_sample End sample index (size_t(-1) means end of audio)
  Audio slice_samples(size_t start_sample, size_t end_sample = static_cast<size_t>(-1)) const;

  /// @brief Access sample by index.
  float operator[](size_t index) const;

  const float* begin() const { return data(); }
  const float* end() const { return data() + size(); }

 private:
  Audio(std::shared_ptr<const std::vector<float>> buffer, size_t offset, size_t length,
        int sample_rate);

  std::shared_ptr<const std::vector<float>> buffer_;
  size_t offset_;
  size_t length_;
  int sample_rate_;
};

}  // namespace masterprint
