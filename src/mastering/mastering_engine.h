#pragma once

/// @file mastering_engine.h
/// @brief Fingerprint-driven automatic mastering of a file or buffer.

#include <string>

#include "cache/fingerprint_service.h"
#include "core/audio_buffer.h"
#include "fingerprint/fingerprint.h"
#include "mastering/chunked_pipeline.h"
#include "mastering/mastering_config.h"
#include "mastering/material_classifier.h"
#include "mastering/stage_trace.h"

namespace masterprint {

/// @brief Mastering options.
struct MasteringOptions {
  float intensity = 1.0f;          ///< User intensity in [0, 1]
  MasteringConfig mastering;
  PipelineConfig pipeline;
  int bits_per_sample = 24;        ///< Output WAV bit depth
};

/// @brief Outcome of one mastering run.
struct MasteringResult {
  Fingerprint fingerprint;
  MaterialClass material = MaterialClass::Quiet;
  float effective_intensity = 0.0f;
  float peak_db = 0.0f;            ///< Source peak in dBFS
  StageTrace trace;                ///< Stages applied to the first chunk
  size_t frames = 0;               ///< Frames written
  int channels = 0;
  int sample_rate = 0;
};

/// @brief Masters audio with the branch selected by its fingerprint.
class MasteringEngine {
 public:
  /// @param options Intensity and tuning
  explicit MasteringEngine(const MasteringOptions& options = MasteringOptions());

  /// @brief Masters @p input_path into a 24-bit WAV at @p output_path.
  /// @details Mono input is promoted to stereo; the sample rate is kept.
  /// @throws MasterprintException with FileNotFound before any processing if the input
  ///         does not exist, or with WriteFailed on export errors
  MasteringResult master_file(const std::string& input_path, const std::string& output_path,
                              FingerprintService& fingerprints,
                              const ProgressCallback& progress = nullptr) const;

  /// @brief Masters an in-memory buffer with a known fingerprint.
  /// @details Runs the chunked branch chain twice. The first pass ("metering") skips the
  ///          level stage and measures the assembled track peak; the second ("mastering")
  ///          applies one limiter or normalize gain and one output-ceiling gain to every
  ///          chunk, so level differences between chunks are kept.
  MasteringResult master_buffer(const AudioBuffer& audio, const Fingerprint& fingerprint,
                                ChunkSink& sink, const ProgressCallback& progress = nullptr) const;

  const MasteringOptions& options() const { return options_; }

 private:
  MasteringOptions options_;
};

/// @brief Returns "<dir>/<stem>_mastered.wav" for an input path.
std::string default_output_path(const std::string& input_path);

}  // namespace masterprint
