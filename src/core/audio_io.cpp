#include "core/audio_io.h"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <vector>

#include "util/exception.h"

// dr_wav implementation
#define DR_WAV_IMPLEMENTATION
#include "dr_wav.h"

// minimp3 implementation
#define MINIMP3_IMPLEMENTATION
#include "minimp3.h"
#include "minimp3_ex.h"

namespace masterprint {

namespace {

/// @brief RAII guard for MP3 decode buffer.
struct Mp3BufferGuard {
  mp3d_sample_t* ptr = nullptr;
  ~Mp3BufferGuard() {
    if (ptr) {
      free(ptr);
    }
  }
};

/// @brief Reads entire file into memory.
std::vector<uint8_t> read_file(const std::string& path) {
  std::ifstream file(path, std::ios::binary | std::ios::ate);
  MASTERPRINT_CHECK_MSG(file.is_open(), ErrorCode::FileNotFound, "Cannot open file: " + path);

  auto size = file.tellg();
  file.seekg(0, std::ios::beg);

  std::vector<uint8_t> buffer(static_cast<size_t>(size));
  file.read(reinterpret_cast<char*>(buffer.data()), size);
  MASTERPRINT_CHECK_MSG(file.good(), ErrorCode::DecodeFailed, "Failed to read file: " + path);

  return buffer;
}

inline float clamp_unit(float v) { return std::max(-1.0f, std::min(1.0f, v)); }

}  // namespace

AudioFormat detect_format(const uint8_t* data, size_t size) {
  if (size < 12) {
    return AudioFormat::Unknown;
  }

  // WAV: "RIFF....WAVE"
  if (data[0] == 'R' && data[1] == 'I' && data[2] == 'F' && data[3] == 'F' && data[8] == 'W' &&
      data[9] == 'A' && data[10] == 'V' && data[11] == 'E') {
    return AudioFormat::WAV;
  }

  // MP3: frame sync or ID3 tag
  if ((data[0] == 0xFF && (data[1] & 0xE0) == 0xE0) ||
      (data[0] == 'I' && data[1] == 'D' && data[2] == '3')) {
    return AudioFormat::MP3;
  }

  return AudioFormat::Unknown;
}

AudioBuffer load_buffer_wav(const uint8_t* data, size_t size) {
  drwav wav;
  drwav_bool32 ok = drwav_init_memory(&wav, data, size, nullptr);
  MASTERPRINT_CHECK_MSG(ok, ErrorCode::DecodeFailed, "Failed to parse WAV data");

  int channels = static_cast<int>(wav.channels);
  int sample_rate = static_cast<int>(wav.sampleRate);
  std::vector<float> interleaved(static_cast<size_t>(wav.totalPCMFrameCount) * wav.channels);

  drwav_uint64 frames_read =
      drwav_read_pcm_frames_f32(&wav, wav.totalPCMFrameCount, interleaved.data());
  drwav_uninit(&wav);

  MASTERPRINT_CHECK_MSG(frames_read > 0, ErrorCode::DecodeFailed, "No audio frames in WAV data");
  MASTERPRINT_CHECK_MSG(channels > 0 && sample_rate > 0, ErrorCode::InvalidFormat,
                        "Invalid WAV header");

  return AudioBuffer::from_interleaved(interleaved.data(),
                                       static_cast<size_t>(frames_read) * channels, channels,
                                       sample_rate);
}

AudioBuffer load_buffer_mp3(const uint8_t* data, size_t size) {
  mp3dec_t mp3d;
  mp3dec_file_info_t info;

  mp3dec_init(&mp3d);
  int result = mp3dec_load_buf(&mp3d, data, size, &info, nullptr, nullptr);
  MASTERPRINT_CHECK_MSG(result == 0, ErrorCode::DecodeFailed, "Failed to decode MP3 data");

  Mp3BufferGuard buffer_guard;
  buffer_guard.ptr = info.buffer;

  MASTERPRINT_CHECK_MSG(info.samples > 0 && info.channels > 0, ErrorCode::DecodeFailed,
                        "No audio samples in MP3 data");

  int channels = info.channels;
  size_t n_values = static_cast<size_t>(info.samples);
  n_values -= n_values % static_cast<size_t>(channels);

  std::vector<float> interleaved(n_values);
  for (size_t i = 0; i < n_values; ++i) {
    interleaved[i] = static_cast<float>(info.buffer[i]) / 32768.0f;
  }

  return AudioBuffer::from_interleaved(interleaved.data(), n_values, channels, info.hz);
}

AudioBuffer load_buffer(const uint8_t* data, size_t size) {
  switch (detect_format(data, size)) {
    case AudioFormat::WAV:
      return load_buffer_wav(data, size);
    case AudioFormat::MP3:
      return load_buffer_mp3(data, size);
    default:
      throw MasterprintException(ErrorCode::InvalidFormat, "Unknown or unsupported audio format");
  }
}

AudioBuffer load_audio(const std::string& path, const AudioLoadOptions& options) {
  if (options.max_file_size > 0) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    MASTERPRINT_CHECK_MSG(file.is_open(), ErrorCode::FileNotFound, "Cannot open file: " + path);
    auto size = file.tellg();
    MASTERPRINT_CHECK_MSG(static_cast<size_t>(size) <= options.max_file_size,
                          ErrorCode::InvalidParameter,
                          "File too large: " + std::to_string(static_cast<long long>(size)) + " bytes");
  }

  std::vector<uint8_t> data = read_file(path);
  return load_buffer(data.data(), data.size());
}

// ============================================================================
// WavWriter
// ============================================================================

struct WavWriter::Impl {
  drwav wav;
  bool open = false;
};

WavWriter::WavWriter(const std::string& path, int channels, int sample_rate, int bits_per_sample)
    : impl_(std::make_unique<Impl>()), channels_(channels), bits_per_sample_(bits_per_sample) {
  MASTERPRINT_CHECK_MSG(channels > 0, ErrorCode::InvalidParameter, "Invalid channel count");
  MASTERPRINT_CHECK_MSG(sample_rate > 0, ErrorCode::InvalidParameter, "Invalid sample rate");
  MASTERPRINT_CHECK_MSG(bits_per_sample == 16 || bits_per_sample == 24,
                        ErrorCode::InvalidParameter, "bits_per_sample must be 16 or 24");

  drwav_data_format format;
  format.container = drwav_container_riff;
  format.format = DR_WAVE_FORMAT_PCM;
  format.channels = static_cast<drwav_uint32>(channels);
  format.sampleRate = static_cast<drwav_uint32>(sample_rate);
  format.bitsPerSample = static_cast<drwav_uint32>(bits_per_sample);

  drwav_bool32 ok = drwav_init_file_write(&impl_->wav, path.c_str(), &format, nullptr);
  MASTERPRINT_CHECK_MSG(ok, ErrorCode::WriteFailed, "Failed to create WAV file: " + path);
  impl_->open = true;
}

WavWriter::~WavWriter() {
  if (impl_ && impl_->open) {
    drwav_uninit(&impl_->wav);
    impl_->open = false;
  }
}

void WavWriter::write(const AudioBuffer& buffer) {
  MASTERPRINT_CHECK_MSG(impl_->open, ErrorCode::WriteFailed, "WAV writer is closed");
  MASTERPRINT_CHECK_MSG(buffer.channels() == channels_, ErrorCode::InvalidFormat,
                        "Channel count does not match the output file");
  size_t n_frames = buffer.frames();
  if (n_frames == 0) return;

  std::vector<float> interleaved = buffer.interleaved();
  drwav_uint64 written = 0;

  if (bits_per_sample_ == 16) {
    std::vector<int16_t> pcm(interleaved.size());
    for (size_t i = 0; i < interleaved.size(); ++i) {
      pcm[i] = static_cast<int16_t>(clamp_unit(interleaved[i]) * 32767.0f);
    }
    written = drwav_write_pcm_frames(&impl_->wav, n_frames, pcm.data());
  } else {
    // 24-bit little-endian, three bytes per sample
    std::vector<uint8_t> pcm(interleaved.size() * 3);
    for (size_t i = 0; i < interleaved.size(); ++i) {
      int32_t v = static_cast<int32_t>(clamp_unit(interleaved[i]) * 8388607.0f);
      pcm[i * 3] = static_cast<uint8_t>(v & 0xFF);
      pcm[i * 3 + 1] = static_cast<uint8_t>((v >> 8) & 0xFF);
      pcm[i * 3 + 2] = static_cast<uint8_t>((v >> 16) & 0xFF);
    }
    written = drwav_write_pcm_frames(&impl_->wav, n_frames, pcm.data());
  }

  MASTERPRINT_CHECK_MSG(written == n_frames, ErrorCode::WriteFailed,
                        "Failed to write all samples");
  frames_written_ += n_frames;
}

void WavWriter::close() {
  if (!impl_->open) return;
  impl_->open = false;
  drwav_result result = drwav_uninit(&impl_->wav);
  MASTERPRINT_CHECK_MSG(result == DRWAV_SUCCESS, ErrorCode::WriteFailed,
                        "Failed to finalize WAV file");
}

void save_wav(const std::string& path, const AudioBuffer& buffer, int bits_per_sample) {
  MASTERPRINT_CHECK_MSG(!buffer.empty(), ErrorCode::InvalidParameter, "No samples to save");
  WavWriter writer(path, buffer.channels(), buffer.sample_rate(), bits_per_sample);
  writer.write(buffer);
  writer.close();
}

}  // namespace masterprint
