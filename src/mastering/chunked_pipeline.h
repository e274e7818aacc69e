#pragma once

/// @file chunked_pipeline.h
/// @brief Chunked processing with crossfaded joins and streamed output.

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "core/audio_buffer.h"

namespace masterprint {

class WavWriter;

/// @brief Progress callback: fraction in [0,1] and a stage name.
using ProgressCallback = std::function<void(float progress, const char* stage)>;

/// @brief Processes one chunk. Must return the same channel count and frame count.
using ChunkProcessor = std::function<AudioBuffer(const AudioBuffer& chunk)>;

/// @brief Destination of assembled output chunks.
class ChunkSink {
 public:
  virtual ~ChunkSink() = default;

  /// @brief Appends frames to the output.
  virtual void write(const AudioBuffer& frames) = 0;

  /// @brief Finalizes the output.
  virtual void close() {}
};

/// @brief Streams chunks into a PCM WAV file.
/// @details Frames go to "<path>.partial", which close() finalizes and renames to @p path.
/// A sink destroyed before close() deletes the partial file, so a failed run never leaves
/// a truncated WAV at @p path.
class WavChunkSink : public ChunkSink {
 public:
  WavChunkSink(const std::string& path, int channels, int sample_rate, int bits_per_sample = 24);
  ~WavChunkSink() override;

  void write(const AudioBuffer& frames) override;

  /// @throws MasterprintException with WriteFailed if the file cannot be finalized or moved
  ///         into place
  void close() override;

  size_t frames_written() const;

  const std::string& partial_path() const { return partial_path_; }

 private:
  std::string path_;
  std::string partial_path_;
  std::unique_ptr<WavWriter> writer_;
  size_t frames_written_ = 0;
  bool committed_ = false;
};

/// @brief Collects chunks in memory.
class MemoryChunkSink : public ChunkSink {
 public:
  MemoryChunkSink(int channels, int sample_rate);

  void write(const AudioBuffer& frames) override;

  /// @brief Returns everything written so far as one buffer.
  AudioBuffer buffer() const;

  /// @brief Number of write() calls.
  size_t writes() const { return writes_; }

  size_t frames() const { return data_.empty() ? 0 : data_[0].size(); }

 private:
  std::vector<std::vector<float>> data_;
  int sample_rate_;
  size_t writes_ = 0;
};

/// @brief Pipeline configuration.
struct PipelineConfig {
  float chunk_seconds = 30.0f;      ///< Core chunk length
  float crossfade_seconds = 0.5f;   ///< Join length; clamped to the chunk length
};

/// @brief Sequential chunked driver.
/// @details Chunk i covers [i * chunk, (i + 1) * chunk) and, after the first, is read with
/// crossfade_length frames of lead-in. Its processed head is crossfaded against the tail
/// held back from chunk i-1 with a sin^2/cos^2 ramp; the crossfaded region and the core are
/// written, and the last crossfade_length frames are held back as the new tail (the final
/// chunk writes everything). The tail is committed only after the sink accepted the write.
/// Total output frames always equal input frames.
class ChunkedPipeline {
 public:
  explicit ChunkedPipeline(const PipelineConfig& config = PipelineConfig());

  /// @brief Runs @p process over @p input and streams the result into @p sink.
  /// @return Frames written
  /// @throws MasterprintException with InvalidFormat if a processed chunk has the wrong
  ///         channel count or length; the held tail is left untouched
  size_t run(const AudioBuffer& input, const ChunkProcessor& process, ChunkSink& sink,
             const ProgressCallback& progress = nullptr) const;

  /// @brief Same as run() for interleaved samples split by the known channel count.
  size_t run_interleaved(const float* samples, size_t n_values, int channels, int sample_rate,
                         const ChunkProcessor& process, ChunkSink& sink,
                         const ProgressCallback& progress = nullptr) const;

  /// @brief Chunk length in frames at @p sample_rate (at least 1).
  size_t chunk_frames(int sample_rate) const;

  /// @brief Effective crossfade length in frames: min(crossfade, chunk).
  size_t crossfade_frames(int sample_rate) const;

  const PipelineConfig& config() const { return config_; }

 private:
  PipelineConfig config_;
};

}  // namespace masterprint
