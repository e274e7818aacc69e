#include "mastering/chunked_pipeline.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

#include "core/audio_io.h"
#include "util/exception.h"
#include "util/log.h"

namespace masterprint {

namespace {
constexpr float kHalfPi = 1.57079632679489661923f;
}

WavChunkSink::WavChunkSink(const std::string& path, int channels, int sample_rate,
                           int bits_per_sample)
    : path_(path),
      partial_path_(path + ".partial"),
      writer_(new WavWriter(partial_path_, channels, sample_rate, bits_per_sample)) {}

WavChunkSink::~WavChunkSink() {
  if (committed_) return;
  writer_.reset();
  if (std::remove(partial_path_.c_str()) == 0) {
    logger()->warn("Discarded unfinished output {}", path_);
  }
}

void WavChunkSink::write(const AudioBuffer& frames) {
  MASTERPRINT_CHECK_MSG(writer_ != nullptr, ErrorCode::WriteFailed, "WAV sink is closed");
  writer_->write(frames);
  frames_written_ = writer_->frames_written();
}

void WavChunkSink::close() {
  if (committed_) return;
  MASTERPRINT_CHECK_MSG(writer_ != nullptr, ErrorCode::WriteFailed, "WAV sink is closed");
  writer_->close();
  writer_.reset();
  MASTERPRINT_CHECK_MSG(std::rename(partial_path_.c_str(), path_.c_str()) == 0,
                        ErrorCode::WriteFailed, "Failed to move output into place: " + path_);
  committed_ = true;
}

size_t WavChunkSink::frames_written() const { return frames_written_; }

MemoryChunkSink::MemoryChunkSink(int channels, int sample_rate)
    : data_(static_cast<size_t>(channels)), sample_rate_(sample_rate) {
  MASTERPRINT_CHECK(channels > 0 && sample_rate > 0, ErrorCode::InvalidParameter);
}

void MemoryChunkSink::write(const AudioBuffer& frames) {
  MASTERPRINT_CHECK_MSG(frames.channels() == static_cast<int>(data_.size()),
                        ErrorCode::InvalidFormat, "Channel count mismatch in sink");
  for (int ch = 0; ch < frames.channels(); ++ch) {
    const float* src = frames.channel(ch);
    data_[ch].insert(data_[ch].end(), src, src + frames.frames());
  }
  ++writes_;
}

AudioBuffer MemoryChunkSink::buffer() const { return AudioBuffer::from_channels(data_, sample_rate_); }

ChunkedPipeline::ChunkedPipeline(const PipelineConfig& config) : config_(config) {
  MASTERPRINT_CHECK(config.chunk_seconds > 0.0f, ErrorCode::InvalidParameter);
  MASTERPRINT_CHECK(config.crossfade_seconds >= 0.0f, ErrorCode::InvalidParameter);
}

size_t ChunkedPipeline::chunk_frames(int sample_rate) const {
  return std::max<size_t>(1, static_cast<size_t>(std::lround(config_.chunk_seconds * sample_rate)));
}

size_t ChunkedPipeline::crossfade_frames(int sample_rate) const {
  size_t crossfade = static_cast<size_t>(std::lround(config_.crossfade_seconds * sample_rate));
  return std::min(crossfade, chunk_frames(sample_rate));
}

size_t ChunkedPipeline::run(const AudioBuffer& input, const ChunkProcessor& process,
                            ChunkSink& sink, const ProgressCallback& progress) const {
  MASTERPRINT_CHECK(process != nullptr, ErrorCode::InvalidParameter);
  const size_t total = input.frames();
  const int channels = input.channels();
  const int sr = input.sample_rate();
  if (total == 0) {
    return 0;
  }

  const size_t chunk = chunk_frames(sr);
  const size_t fade = crossfade_frames(sr);
  const size_t n_chunks = (total + chunk - 1) / chunk;

  std::vector<std::vector<float>> tail;  // committed tail of the last written chunk
  size_t written = 0;

  for (size_t i = 0; i < n_chunks; ++i) {
    const size_t start = i * chunk;
    const size_t end = std::min(total, start + chunk);
    const size_t lead = i > 0 ? fade : 0;
    const bool last_chunk = end == total;

    AudioBuffer segment = input.slice(start - lead, end);
    AudioBuffer processed = process(segment);
    MASTERPRINT_CHECK_MSG(processed.channels() == channels, ErrorCode::InvalidFormat,
                          "Processed chunk has " + std::to_string(processed.channels()) +
                              " channels, expected " + std::to_string(channels));
    MASTERPRINT_CHECK_MSG(processed.frames() == segment.frames(), ErrorCode::InvalidFormat,
                          "Processed chunk has " + std::to_string(processed.frames()) +
                              " frames, expected " + std::to_string(segment.frames()));

    const size_t length = processed.frames();
    const size_t keep = last_chunk ? length : length - fade;

    if (fade == 0) {
      sink.write(processed);
      written += length;
    } else {
      AudioBuffer out(channels, keep, sr);
      std::vector<std::vector<float>> candidate;
      for (int ch = 0; ch < channels; ++ch) {
        const float* p = processed.channel(ch);
        float* o = out.channel(ch);
        for (size_t j = 0; j < lead; ++j) {
          float phase = kHalfPi * (static_cast<float>(j) + 0.5f) / static_cast<float>(fade);
          float fade_in = std::sin(phase);
          float fade_out = std::cos(phase);
          o[j] = tail[ch][j] * fade_out * fade_out + p[j] * fade_in * fade_in;
        }
        std::copy(p + lead, p + keep, o + lead);
        if (!last_chunk) {
          candidate.emplace_back(p + length - fade, p + length);
        }
      }
      sink.write(out);
      written += keep;
      tail = std::move(candidate);
    }

    logger()->debug("Chunk {}/{} written ({} frames total)", i + 1, n_chunks, written);
    if (progress) {
      progress(static_cast<float>(i + 1) / static_cast<float>(n_chunks), "mastering");
    }
  }

  sink.close();
  return written;
}

size_t ChunkedPipeline::run_interleaved(const float* samples, size_t n_values, int channels,
                                        int sample_rate, const ChunkProcessor& process,
                                        ChunkSink& sink, const ProgressCallback& progress) const {
  AudioBuffer input = AudioBuffer::from_interleaved(samples, n_values, channels, sample_rate);
  return run(input, process, sink, progress);
}

}  // namespace masterprint
