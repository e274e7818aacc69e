#include "core/audio_buffer.h"

#include <algorithm>
#include <cmath>
#include <string>

#include "util/exception.h"
#include "util/math_utils.h"

namespace masterprint {

AudioBuffer::AudioBuffer() : frames_(0), sample_rate_(0) {}

AudioBuffer::AudioBuffer(int channels, size_t frames, int sample_rate)
    : data_(static_cast<size_t>(std::max(channels, 0)), std::vector<float>(frames, 0.0f)),
      frames_(frames),
      sample_rate_(sample_rate) {
  MASTERPRINT_CHECK(channels >= 1, ErrorCode::InvalidParameter);
  MASTERPRINT_CHECK(sample_rate > 0, ErrorCode::InvalidParameter);
}

AudioBuffer AudioBuffer::from_interleaved(const float* data, size_t n_values, int channels,
                                          int sample_rate) {
  MASTERPRINT_CHECK(channels >= 1, ErrorCode::InvalidParameter);
  MASTERPRINT_CHECK_MSG(n_values % static_cast<size_t>(channels) == 0, ErrorCode::InvalidFormat,
                        "Interleaved sample count " + std::to_string(n_values) +
                            " is not a multiple of " + std::to_string(channels) + " channels");

  size_t frames = n_values / static_cast<size_t>(channels);
  AudioBuffer buffer(channels, frames, sample_rate);
  for (size_t i = 0; i < frames; ++i) {
    for (int ch = 0; ch < channels; ++ch) {
      buffer.data_[static_cast<size_t>(ch)][i] = data[i * channels + ch];
    }
  }
  return buffer;
}

AudioBuffer AudioBuffer::from_channels(std::vector<std::vector<float>> channels,
                                       int sample_rate) {
  MASTERPRINT_CHECK(!channels.empty(), ErrorCode::InvalidParameter);
  MASTERPRINT_CHECK(sample_rate > 0, ErrorCode::InvalidParameter);
  size_t frames = channels.front().size();
  for (const auto& ch : channels) {
    MASTERPRINT_CHECK_MSG(ch.size() == frames, ErrorCode::InvalidFormat,
                          "Channel lengths differ");
  }

  AudioBuffer buffer;
  buffer.data_ = std::move(channels);
  buffer.frames_ = frames;
  buffer.sample_rate_ = sample_rate;
  return buffer;
}

AudioBuffer AudioBuffer::from_mono(const Audio& audio) {
  std::vector<std::vector<float>> channels(1);
  channels[0].assign(audio.begin(), audio.end());
  return from_channels(std::move(channels), audio.sample_rate());
}

float AudioBuffer::duration() const {
  if (sample_rate_ == 0) return 0.0f;
  return static_cast<float>(frames_) / static_cast<float>(sample_rate_);
}

std::vector<float> AudioBuffer::interleaved() const {
  size_t n_ch = data_.size();
  std::vector<float> out(frames_ * n_ch);
  for (size_t i = 0; i < frames_; ++i) {
    for (size_t ch = 0; ch < n_ch; ++ch) {
      out[i * n_ch + ch] = data_[ch][i];
    }
  }
  return out;
}

AudioBuffer AudioBuffer::slice(size_t start_frame, size_t end_frame) const {
  start_frame = std::min(start_frame, frames_);
  end_frame = std::min(std::max(end_frame, start_frame), frames_);

  std::vector<std::vector<float>> channels(data_.size());
  for (size_t ch = 0; ch < data_.size(); ++ch) {
    channels[ch].assign(data_[ch].begin() + static_cast<std::ptrdiff_t>(start_frame),
                        data_[ch].begin() + static_cast<std::ptrdiff_t>(end_frame));
  }

  AudioBuffer buffer;
  buffer.data_ = std::move(channels);
  buffer.frames_ = end_frame - start_frame;
  buffer.sample_rate_ = sample_rate_;
  return buffer;
}

Audio AudioBuffer::to_mono() const {
  if (data_.empty()) return Audio();
  if (data_.size() == 1) return Audio::from_buffer(data_[0].data(), frames_, sample_rate_);

  std::vector<float> mono(frames_, 0.0f);
  float scale = 1.0f / static_cast<float>(data_.size());
  for (const auto& ch : data_) {
    for (size_t i = 0; i < frames_; ++i) {
      mono[i] += ch[i] * scale;
    }
  }
  return Audio::from_vector(std::move(mono), sample_rate_);
}

Audio AudioBuffer::channel_audio(int ch) const {
  MASTERPRINT_CHECK(ch >= 0 && ch < channels(), ErrorCode::InvalidParameter);
  return Audio::from_buffer(channel(ch), frames_, sample_rate_);
}

AudioBuffer AudioBuffer::to_stereo() const {
  if (channels() == 2) return *this;
  MASTERPRINT_CHECK_MSG(channels() == 1, ErrorCode::InvalidFormat,
                        "Only mono and stereo sources are supported");
  return from_channels({data_[0], data_[0]}, sample_rate_);
}

void AudioBuffer::apply_gain(float gain) {
  for (auto& ch : data_) {
    for (float& s : ch) {
      s *= gain;
    }
  }
}

float AudioBuffer::peak() const {
  float p = 0.0f;
  for (const auto& ch : data_) {
    p = std::max(p, peak_abs(ch.data(), ch.size()));
  }
  return p;
}

}  // namespace masterprint
