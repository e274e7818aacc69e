/// @file cli_test.cpp
/// @brief Tests for the masterprint CLI tool.

#include <sys/wait.h>

#include <array>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include "core/audio_buffer.h"
#include "core/audio_io.h"

using namespace masterprint;
using Catch::Matchers::ContainsSubstring;

namespace {

/// @brief Creates a stereo test WAV file with a sine wave.
void create_test_wav(const std::string& path, float duration = 3.0f, float frequency = 440.0f,
                     int sample_rate = 22050) {
  size_t n_samples = static_cast<size_t>(duration * sample_rate);
  std::vector<float> samples(n_samples);
  for (size_t i = 0; i < n_samples; ++i) {
    float t = static_cast<float>(i) / sample_rate;
    samples[i] = 0.1f * std::sin(2.0f * static_cast<float>(M_PI) * frequency * t);
  }
  save_wav(path, AudioBuffer::from_channels({samples, samples}, sample_rate), 16);
}

/// @brief Executes a shell command and returns (exit_code, combined output).
std::pair<int, std::string> exec_command(const std::string& cmd) {
  std::array<char, 4096> buffer;
  std::string result;

  std::string full_cmd = cmd + " 2>&1";
  std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(full_cmd.c_str(), "r"), pclose);
  if (!pipe) {
    return {-1, "popen failed"};
  }
  while (fgets(buffer.data(), buffer.size(), pipe.get()) != nullptr) {
    result += buffer.data();
  }
  int status = pclose(pipe.release());
  return {WEXITSTATUS(status), result};
}

/// @brief Gets the path to the masterprint CLI executable.
std::string get_cli_path() {
#ifdef MASTERPRINT_CLI_PATH
  return MASTERPRINT_CLI_PATH;
#else
  std::vector<std::string> paths = {"./build/bin/masterprint", "./bin/masterprint",
                                    "../bin/masterprint"};
  for (const auto& path : paths) {
    std::ifstream f(path);
    if (f.good()) {
      return path;
    }
  }
  return "./build/bin/masterprint";
#endif
}

const std::string CLI = get_cli_path();
const std::string TEST_WAV = "/tmp/masterprint_cli_test.wav";
const std::string TEST_OUT = "/tmp/masterprint_cli_out.wav";
const std::string TEST_DB = "/tmp/masterprint_cli_test.db";

/// @brief Removes the test database and every cache artifact of the test input.
void reset_cache() {
  for (const std::string& path : {TEST_DB, TEST_DB + "-wal", TEST_DB + "-shm", TEST_WAV + ".25d"}) {
    std::filesystem::remove(path);
  }
}

}  // namespace

TEST_CASE("CLI help", "[cli]") {
  auto [code, output] = exec_command(CLI + " --help");
  REQUIRE(code == 0);
  REQUIRE_THAT(output, ContainsSubstring("Usage:"));
  REQUIRE_THAT(output, ContainsSubstring("--intensity"));
  REQUIRE_THAT(output, ContainsSubstring("MASTERPRINT_BACKEND"));
}

TEST_CASE("CLI version", "[cli]") {
  auto [code, output] = exec_command(CLI + " --version");
  REQUIRE(code == 0);
  REQUIRE_THAT(output, ContainsSubstring("masterprint version"));
}

TEST_CASE("CLI argument errors", "[cli]") {
  SECTION("no arguments") {
    auto [code, output] = exec_command(CLI);
    REQUIRE(code != 0);
    REQUIRE_THAT(output, ContainsSubstring("Usage:"));
  }

  SECTION("missing file") {
    auto [code, output] =
        exec_command(CLI + " /tmp/masterprint_no_such_file.wav --db " + TEST_DB + " -q");
    REQUIRE(code != 0);
    REQUIRE_THAT(output, ContainsSubstring("Error:"));
  }

  SECTION("intensity out of range") {
    create_test_wav(TEST_WAV);
    auto [code, output] = exec_command(CLI + " " + TEST_WAV + " -i 1.5 -q");
    REQUIRE(code != 0);
    REQUIRE_THAT(output, ContainsSubstring("Intensity"));
  }
}

TEST_CASE("CLI fingerprint", "[cli]") {
  create_test_wav(TEST_WAV);
  reset_cache();

  auto [code, output] =
      exec_command(CLI + " " + TEST_WAV + " --fingerprint-only --json --db " + TEST_DB);
  REQUIRE(code == 0);
  REQUIRE_THAT(output, ContainsSubstring("\"source\": \"computed\""));
  REQUIRE_THAT(output, ContainsSubstring("\"lufs\""));
  REQUIRE_THAT(output, ContainsSubstring("\"phase_correlation\""));
  REQUIRE_THAT(output, ContainsSubstring("\"mastering_targets\""));

  auto [code2, cached] =
      exec_command(CLI + " " + TEST_WAV + " --fingerprint-only --json --db " + TEST_DB);
  REQUIRE(code2 == 0);
  REQUIRE_THAT(cached, ContainsSubstring("\"source\": \"store\""));

  auto [code3, text] = exec_command(CLI + " " + TEST_WAV + " --fingerprint-only --db " + TEST_DB);
  REQUIRE(code3 == 0);
  REQUIRE_THAT(text, ContainsSubstring("Fingerprint:"));
  REQUIRE_THAT(text, ContainsSubstring("spectral_centroid"));

  reset_cache();
}

TEST_CASE("CLI clear cache", "[cli]") {
  create_test_wav(TEST_WAV);
  reset_cache();

  exec_command(CLI + " " + TEST_WAV + " --fingerprint-only -q --db " + TEST_DB);
  REQUIRE(std::filesystem::exists(TEST_WAV + ".25d"));

  auto [code, output] = exec_command(CLI + " --clear-cache --db " + TEST_DB);
  REQUIRE(code == 0);
  REQUIRE_FALSE(std::filesystem::exists(TEST_WAV + ".25d"));

  auto [code2, again] =
      exec_command(CLI + " " + TEST_WAV + " --fingerprint-only --json --db " + TEST_DB);
  REQUIRE(code2 == 0);
  REQUIRE_THAT(again, ContainsSubstring("\"source\": \"computed\""));

  reset_cache();
}

TEST_CASE("CLI mastering", "[cli]") {
  create_test_wav(TEST_WAV);
  reset_cache();
  std::filesystem::remove(TEST_OUT);

  auto [code, output] = exec_command(CLI + " " + TEST_WAV + " -o " + TEST_OUT + " -i 0.8 --json" +
                                     " --db " + TEST_DB);
  REQUIRE(code == 0);
  REQUIRE_THAT(output, ContainsSubstring("\"material\": \"quiet\""));
  REQUIRE_THAT(output, ContainsSubstring("\"stages\""));
  REQUIRE_THAT(output, ContainsSubstring("\"normalize\""));

  AudioBuffer mastered = load_audio(TEST_OUT);
  REQUIRE(mastered.channels() == 2);
  REQUIRE(mastered.sample_rate() == 22050);
  REQUIRE(mastered.frames() == static_cast<size_t>(3.0f * 22050));

  std::filesystem::remove(TEST_OUT);
  reset_cache();
}
