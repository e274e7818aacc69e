#include "backend/dsp_backend.h"

#include <cmath>
#include <cstdlib>
#include <exception>

#include "backend/native_backend.h"
#include "backend/portable_backend.h"
#include "util/exception.h"
#include "util/log.h"

namespace masterprint {

namespace {

constexpr int kProbeSampleRate = 22050;
constexpr float kProbeFrequency = 440.0f;
constexpr float kUniformChroma = 0.2f;

Audio probe_signal() {
  std::vector<float> samples(kProbeSampleRate / 2);
  for (size_t i = 0; i < samples.size(); ++i) {
    samples[i] = 0.5f * std::sin(2.0f * 3.14159265f * kProbeFrequency * i / kProbeSampleRate);
  }
  return Audio::from_vector(std::move(samples), kProbeSampleRate);
}

bool all_finite(const float* data, size_t size) {
  for (size_t i = 0; i < size; ++i) {
    if (!std::isfinite(data[i])) return false;
  }
  return true;
}

}  // namespace

BackendPreference parse_backend_preference(const std::string& value) {
  if (value == "auto") return BackendPreference::Auto;
  if (value == "native") return BackendPreference::Native;
  if (value == "portable") return BackendPreference::Portable;
  throw MasterprintException(ErrorCode::InvalidParameter, "Unknown backend: " + value);
}

BackendPreference backend_preference_from_env() {
  const char* value = std::getenv("MASTERPRINT_BACKEND");
  if (value == nullptr || *value == '\0') {
    return BackendPreference::Auto;
  }
  try {
    return parse_backend_preference(value);
  } catch (const MasterprintException& e) {
    logger()->warn("{}; using auto", e.what());
    return BackendPreference::Auto;
  }
}

bool probe_backend(const DspBackend& backend) {
  try {
    Audio signal = probe_signal();

    HarmonicPercussive hp = backend.separate_harmonic_percussive(signal);
    if (hp.harmonic.size() != signal.size() || hp.percussive.size() != signal.size() ||
        !all_finite(hp.harmonic.data(), hp.harmonic.size())) {
      return false;
    }

    std::vector<float> f0 = backend.track_pitch(signal, kPitchFmin, kPitchFmax);
    bool found_pitch = false;
    for (float f : f0) {
      if (std::abs(f - kProbeFrequency) < 10.0f) found_pitch = true;
    }
    if (!found_pitch) {
      return false;
    }

    Eigen::MatrixXf chroma = backend.chroma(signal);
    return chroma.rows() == kNumChroma && chroma.cols() > 0 && chroma.allFinite();
  } catch (const std::exception& e) {
    logger()->warn("Backend '{}' probe failed: {}", backend.name(), e.what());
    return false;
  }
}

std::unique_ptr<DspBackend> select_backend(BackendPreference preference) {
  if (preference == BackendPreference::Portable) {
    logger()->info("DSP backend: portable (forced)");
    return std::make_unique<PortableBackend>();
  }
  if (preference == BackendPreference::Native) {
    logger()->info("DSP backend: native (forced)");
    return std::make_unique<NativeBackend>();
  }

  auto native = std::make_unique<NativeBackend>();
  if (probe_backend(*native)) {
    logger()->info("DSP backend: native");
    return native;
  }
  logger()->warn("Native DSP backend unavailable, falling back to portable");
  return std::make_unique<PortableBackend>();
}

HarmonicPercussive safe_separate_harmonic_percussive(const DspBackend& backend,
                                                     const Audio& audio) {
  try {
    return backend.separate_harmonic_percussive(audio);
  } catch (const std::exception& e) {
    logger()->warn("HPSS failed ({}); treating signal as fully harmonic", e.what());
    HarmonicPercussive result;
    result.harmonic = audio;
    result.percussive =
        Audio::from_vector(std::vector<float>(audio.size(), 0.0f), audio.sample_rate());
    return result;
  }
}

std::vector<float> safe_track_pitch(const DspBackend& backend, const Audio& audio, float fmin,
                                    float fmax) {
  try {
    return backend.track_pitch(audio, fmin, fmax);
  } catch (const std::exception& e) {
    logger()->warn("Pitch tracking failed ({}); treating signal as unvoiced", e.what());
    return {};
  }
}

Eigen::MatrixXf safe_chroma(const DspBackend& backend, const Audio& audio) {
  try {
    return backend.chroma(audio);
  } catch (const std::exception& e) {
    logger()->warn("Chroma failed ({}); using uniform chroma", e.what());
    return Eigen::MatrixXf::Constant(kNumChroma, 1, kUniformChroma);
  }
}

}  // namespace masterprint
