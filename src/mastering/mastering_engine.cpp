#include "mastering/mastering_engine.h"

#include <sys/stat.h>

#include <algorithm>

#include "core/audio_io.h"
#include "mastering/adaptive_loudness.h"
#include "mastering/processing_branches.h"
#include "util/exception.h"
#include "util/log.h"
#include "util/math_utils.h"

namespace masterprint {

namespace {

/// @brief Discards frames and keeps their running peak.
class PeakMeterSink : public ChunkSink {
 public:
  void write(const AudioBuffer& frames) override { peak_ = std::max(peak_, frames.peak()); }

  float peak() const { return peak_; }

 private:
  float peak_ = 0.0f;
};

}  // namespace

MasteringEngine::MasteringEngine(const MasteringOptions& options) : options_(options) {
  MASTERPRINT_CHECK_MSG(options.intensity >= 0.0f && options.intensity <= 1.0f,
                        ErrorCode::InvalidParameter, "Intensity must be within [0, 1]");
}

MasteringResult MasteringEngine::master_buffer(const AudioBuffer& audio,
                                               const Fingerprint& fingerprint, ChunkSink& sink,
                                               const ProgressCallback& progress) const {
  MasteringResult result;
  result.fingerprint = fingerprint;
  result.channels = audio.channels();
  result.sample_rate = audio.sample_rate();
  float peak = audio.peak();
  result.peak_db = peak > 0.0f ? amplitude_to_db(peak) : -96.0f;
  result.effective_intensity =
      effective_intensity(options_.intensity, fingerprint.lufs(), fingerprint.crest_db());
  result.material = classify_material(fingerprint.lufs(), fingerprint.crest_db(),
                                      options_.mastering.classifier);

  logger()->info("Material {} (LUFS {:.1f}, crest {:.1f} dB), effective intensity {:.2f}",
                 material_class_name(result.material), fingerprint.lufs(), fingerprint.crest_db(),
                 result.effective_intensity);

  const MasteringConfig& config = options_.mastering;
  ChunkedPipeline pipeline(options_.pipeline);
  BranchContext context{fingerprint, result.peak_db, result.effective_intensity,
                        audio.sample_rate(), config};

  // Metering pass: the branch chain without its level stage, assembled exactly as the
  // output will be, so one gain can level the whole track.
  context.level_mode = LevelMode::Deferred;
  bool needs_output_normalize = false;
  ChunkProcessor meter = [&](const AudioBuffer& chunk) {
    BranchResult branch = apply_branch(result.material, chunk, context);
    needs_output_normalize = branch.needs_output_normalize;
    return branch.audio;
  };
  PeakMeterSink meter_sink;
  ProgressCallback meter_progress = nullptr;
  if (progress) {
    meter_progress = [&progress](float fraction, const char*) { progress(fraction, "metering"); };
  }
  pipeline.run(audio, meter, meter_sink, meter_progress);

  context.level_mode = LevelMode::Track;
  context.track_peak = meter_sink.peak();
  float output_gain = 1.0f;
  if (needs_output_normalize) {
    float leveled_peak =
        peak_after_level_stage(result.material, fingerprint, context.track_peak, config);
    if (leveled_peak > config.output_ceiling) {
      output_gain = config.output_ceiling / leveled_peak;
    }
  }
  logger()->debug("Track peak before leveling {:.2f} dBFS, output gain {:.2f} dB",
                  amplitude_to_db(context.track_peak), amplitude_to_db(output_gain));

  bool first_chunk = true;
  StageTrace& trace = result.trace;
  ChunkProcessor process = [&](const AudioBuffer& chunk) {
    BranchResult branch = apply_branch(result.material, chunk, context);
    if (output_gain < 1.0f) {
      branch.audio.apply_gain(output_gain);
      branch.trace.add("output_normalize").with("gain_db", amplitude_to_db(output_gain));
    }
    if (first_chunk) {
      trace = branch.trace;
      first_chunk = false;
    }
    return branch.audio;
  };

  result.frames = pipeline.run(audio, process, sink, progress);
  return result;
}

MasteringResult MasteringEngine::master_file(const std::string& input_path,
                                             const std::string& output_path,
                                             FingerprintService& fingerprints,
                                             const ProgressCallback& progress) const {
  struct stat info;
  MASTERPRINT_CHECK_MSG(::stat(input_path.c_str(), &info) == 0, ErrorCode::FileNotFound,
                        "Input not found: " + input_path);

  if (progress) progress(0.0f, "fingerprint");
  Fingerprint fingerprint = fingerprints.get_or_compute(input_path);

  if (progress) progress(0.0f, "loading");
  AudioBuffer audio = load_audio(input_path);
  if (audio.channels() == 1) {
    audio = audio.to_stereo();
  }
  logger()->debug("Loaded {} ({} ch, {} Hz, {:.1f} s)", input_path, audio.channels(),
                  audio.sample_rate(), audio.duration());

  WavChunkSink sink(output_path, audio.channels(), audio.sample_rate(), options_.bits_per_sample);
  MasteringResult result = master_buffer(audio, fingerprint, sink, progress);
  logger()->info("Wrote {} ({} frames)", output_path, result.frames);
  return result;
}

std::string default_output_path(const std::string& input_path) {
  size_t slash = input_path.find_last_of('/');
  size_t dot = input_path.find_last_of('.');
  std::string stem = (dot != std::string::npos && (slash == std::string::npos || dot > slash))
                         ? input_path.substr(0, dot)
                         : input_path;
  return stem + "_mastered.wav";
}

}  // namespace masterprint
