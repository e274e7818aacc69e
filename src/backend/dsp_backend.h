#pragma once

/// @file dsp_backend.h
/// @brief Pluggable numeric backend for harmonic/percussive separation, f0 and chroma.

#include <Eigen/Core>
#include <memory>
#include <string>
#include <vector>

#include "core/audio.h"

namespace masterprint {

/// @brief Harmonic and percussive components, each the length of the input.
struct HarmonicPercussive {
  Audio harmonic;
  Audio percussive;
};

/// @brief Backend choice requested by configuration.
enum class BackendPreference {
  Auto,      ///< Probe the native backend, fall back to portable
  Native,    ///< Force the Eigen/KissFFT backend
  Portable,  ///< Force the plain-loop backend
};

/// @brief Numeric backend interface.
/// @details Implementations are stateless and safe to call from several threads.
class DspBackend {
 public:
  virtual ~DspBackend() = default;

  /// @brief Backend identifier ("native" or "portable").
  virtual std::string name() const = 0;

  /// @brief Splits audio into harmonic and percussive components.
  /// @throws MasterprintException on invalid input
  virtual HarmonicPercussive separate_harmonic_percussive(const Audio& audio) const = 0;

  /// @brief Tracks the fundamental frequency frame by frame.
  /// @param audio Input audio
  /// @param fmin Lowest candidate frequency in Hz
  /// @param fmax Highest candidate frequency in Hz
  /// @return f0 per frame in Hz, 0 for unvoiced frames
  virtual std::vector<float> track_pitch(const Audio& audio, float fmin, float fmax) const = 0;

  /// @brief Computes a chromagram normalized so each frame's maximum is 1.
  /// @return Matrix of 12 rows (C..B) by n_frames columns
  virtual Eigen::MatrixXf chroma(const Audio& audio) const = 0;
};

/// @brief Number of pitch classes in a chromagram.
constexpr int kNumChroma = 12;

/// @brief f0 search range used by pitch stability (C2 to C7).
constexpr float kPitchFmin = 65.41f;
constexpr float kPitchFmax = 2093.0f;

/// @brief Parses "auto", "native" or "portable" (case-sensitive).
/// @throws MasterprintException for any other value
BackendPreference parse_backend_preference(const std::string& value);

/// @brief Reads MASTERPRINT_BACKEND; unset or unparsable values mean Auto.
BackendPreference backend_preference_from_env();

/// @brief Runs a short self-test against a backend.
/// @return true if every operation produced well-formed output
bool probe_backend(const DspBackend& backend);

/// @brief Creates the backend for a preference.
/// @details Auto probes the native backend and binds the portable one if the probe fails.
///          The decision is logged once per call.
std::unique_ptr<DspBackend> select_backend(BackendPreference preference);

/// @brief Separation that never throws: failure yields the input as harmonic and silence as
///        percussive, with a logged warning.
HarmonicPercussive safe_separate_harmonic_percussive(const DspBackend& backend, const Audio& audio);

/// @brief Pitch tracking that never throws: failure yields an empty (all-unvoiced) track.
std::vector<float> safe_track_pitch(const DspBackend& backend, const Audio& audio, float fmin,
                                    float fmax);

/// @brief Chroma that never throws: failure yields a uniform single-frame chromagram.
Eigen::MatrixXf safe_chroma(const DspBackend& backend, const Audio& audio);

}  // namespace masterprint
