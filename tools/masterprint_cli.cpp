/// @file masterprint_cli.cpp
/// @brief Command-line interface for fingerprinting and automatic mastering.

#include <cstdio>
#include <cstdlib>
#include <functional>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "backend/dsp_backend.h"
#include "cache/fingerprint_service.h"
#include "fingerprint/fingerprint.h"
#include "fingerprint/mastering_targets.h"
#include "mastering/mastering_engine.h"
#include "util/log.h"
#include "util/version.h"

using namespace masterprint;

// ============================================================================
// JSON Builder - Fluent interface for building JSON output
// ============================================================================

class JsonBuilder {
 public:
  JsonBuilder& begin_object() {
    append_separator();
    ss_ << "{";
    needs_comma_.push_back(false);
    return *this;
  }

  JsonBuilder& end_object() {
    ss_ << "}";
    needs_comma_.pop_back();
    if (!needs_comma_.empty()) needs_comma_.back() = true;
    return *this;
  }

  JsonBuilder& begin_array() {
    append_separator();
    ss_ << "[";
    needs_comma_.push_back(false);
    return *this;
  }

  JsonBuilder& end_array() {
    ss_ << "]";
    needs_comma_.pop_back();
    if (!needs_comma_.empty()) needs_comma_.back() = true;
    return *this;
  }

  JsonBuilder& key(const std::string& k) {
    append_separator();
    ss_ << "\"" << escape(k) << "\": ";
    needs_comma_.back() = false;
    return *this;
  }

  JsonBuilder& value(const std::string& v) { return raw("\"" + escape(v) + "\""); }
  JsonBuilder& value(const char* v) { return value(std::string(v)); }
  JsonBuilder& value(bool v) { return raw(v ? "true" : "false"); }

  template <typename Number>
  JsonBuilder& value(Number v) {
    std::ostringstream out;
    out << v;
    return raw(out.str());
  }

  template <typename T>
  JsonBuilder& kv(const std::string& k, const T& v) {
    return key(k).value(v);
  }

  std::string build() const { return ss_.str(); }
  void print() const { std::cout << ss_.str() << "\n"; }

 private:
  JsonBuilder& raw(const std::string& text) {
    append_separator();
    ss_ << text;
    needs_comma_.back() = true;
    return *this;
  }

  void append_separator() {
    if (!needs_comma_.empty() && needs_comma_.back()) {
      ss_ << ", ";
    }
  }

  static std::string escape(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
      switch (c) {
        case '"':
          result += "\\\"";
          break;
        case '\\':
          result += "\\\\";
          break;
        case '\n':
          result += "\\n";
          break;
        case '\t':
          result += "\\t";
          break;
        default:
          result += c;
      }
    }
    return result;
  }

  std::ostringstream ss_;
  std::vector<bool> needs_comma_;
};

// ============================================================================
// CLI Arguments
// ============================================================================

struct CliArgs {
  std::string input_file;
  std::string output_file;
  std::string db_path = "masterprint.db";
  float intensity = 1.0f;
  bool clear_cache = false;
  bool fingerprint_only = false;
  bool json_output = false;
  bool quiet = false;
  bool verbose = false;
  bool help = false;
  bool version = false;
};

class ArgParser {
 public:
  /// @throws std::invalid_argument on unknown options or missing values
  static CliArgs parse(int argc, char* argv[]) {
    CliArgs args;

    static const std::map<std::string, std::function<void(CliArgs&)>> flags = {
        {"--help", [](CliArgs& a) { a.help = true; }},
        {"-h", [](CliArgs& a) { a.help = true; }},
        {"--json", [](CliArgs& a) { a.json_output = true; }},
        {"--quiet", [](CliArgs& a) { a.quiet = true; }},
        {"-q", [](CliArgs& a) { a.quiet = true; }},
        {"--verbose", [](CliArgs& a) { a.verbose = true; }},
        {"-v", [](CliArgs& a) { a.verbose = true; }},
        {"--clear-cache", [](CliArgs& a) { a.clear_cache = true; }},
        {"--fingerprint-only", [](CliArgs& a) { a.fingerprint_only = true; }},
        {"--version", [](CliArgs& a) { a.version = true; }},
    };
    static const std::map<std::string, std::function<void(CliArgs&, const std::string&)>>
        options = {
            {"-o", [](CliArgs& a, const std::string& v) { a.output_file = v; }},
            {"--output", [](CliArgs& a, const std::string& v) { a.output_file = v; }},
            {"-i", [](CliArgs& a, const std::string& v) { a.intensity = std::stof(v); }},
            {"--intensity", [](CliArgs& a, const std::string& v) { a.intensity = std::stof(v); }},
            {"--db", [](CliArgs& a, const std::string& v) { a.db_path = v; }},
        };

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      auto flag = flags.find(arg);
      if (flag != flags.end()) {
        flag->second(args);
        continue;
      }

      auto option = options.find(arg);
      if (option != options.end()) {
        if (i + 1 >= argc) {
          throw std::invalid_argument("Missing value for " + arg);
        }
        option->second(args, argv[++i]);
        continue;
      }

      if (arg.size() > 1 && arg[0] == '-') {
        throw std::invalid_argument("Unknown option " + arg);
      }
      if (!args.input_file.empty()) {
        throw std::invalid_argument("Unexpected argument " + arg);
      }
      args.input_file = arg;
    }
    return args;
  }
};

// ============================================================================
// Output Helpers
// ============================================================================

void progress_callback(float progress, const char* stage) {
  std::cerr << "\r" << stage << ": " << static_cast<int>(progress * 100) << "%   " << std::flush;
}

void clear_progress() { std::cerr << "\r                              \r"; }

void add_fingerprint(JsonBuilder& json, const Fingerprint& fingerprint) {
  json.key("fingerprint").begin_object();
  for (const FieldSpec& spec : fingerprint_fields()) {
    json.kv(spec.name, fingerprint.get(spec.field));
  }
  json.end_object();
}

void add_targets(JsonBuilder& json, const MasteringTargets& targets) {
  json.key("mastering_targets").begin_object();
  json.kv("target_lufs", targets.target_lufs).kv("target_crest_db", targets.target_crest_db);
  json.key("eq_adjustments_db").begin_object();
  for (size_t i = 0; i < kNumEqBands; ++i) {
    json.kv(eq_band_names()[i], targets.eq_adjustments_db[i]);
  }
  json.end_object();
  json.kv("compression_ratio", targets.compression_ratio)
      .kv("compression_amount", targets.compression_amount);
  json.end_object();
}

void print_fingerprint_text(const Fingerprint& fingerprint) {
  std::cout << "Fingerprint:\n";
  for (const FieldSpec& spec : fingerprint_fields()) {
    fprintf(stdout, "  %-24s %10.4f\n", spec.name, fingerprint.get(spec.field));
  }
}

void print_usage(const char* prog) {
  std::cerr << "Usage: " << prog << " <audio_file> [options]\n\n"
            << "Fingerprints the input and writes an adaptively mastered 24-bit WAV.\n"
            << "\nOPTIONS:\n"
            << "  -o, --output <path>     Output file (default: <input stem>_mastered.wav)\n"
            << "  -i, --intensity <0-1>   Processing intensity (default: 1.0)\n"
            << "  --clear-cache           Purge cached fingerprints first\n"
            << "  --db <path>             Fingerprint store (default: masterprint.db)\n"
            << "  --fingerprint-only      Print the fingerprint and exit\n"
            << "  --json                  Output results in JSON format\n"
            << "  --quiet, -q             Suppress progress output\n"
            << "  --verbose, -v           Debug logging\n"
            << "  --version               Show library version\n"
            << "  --help, -h              Show help\n"
            << "\nENVIRONMENT:\n"
            << "  MASTERPRINT_BACKEND     auto | native | portable (default: auto)\n"
            << "\nExamples:\n"
            << "  " << prog << " song.wav\n"
            << "  " << prog << " song.mp3 -i 0.6 -o master.wav\n"
            << "  " << prog << " song.wav --fingerprint-only --json\n";
}

// ============================================================================
// Commands
// ============================================================================

int cmd_fingerprint(const CliArgs& args, FingerprintService& service) {
  CacheResult result = service.lookup(args.input_file);

  if (args.json_output) {
    JsonBuilder json;
    json.begin_object().kv("path", args.input_file).kv("source", cache_tier_name(result.tier));
    add_fingerprint(json, result.fingerprint);
    add_targets(json, derive_mastering_targets(result.fingerprint));
    json.end_object().print();
  } else {
    std::cout << "File:   " << args.input_file << "\n";
    std::cout << "Source: " << cache_tier_name(result.tier) << "\n";
    print_fingerprint_text(result.fingerprint);
  }
  return 0;
}

int cmd_master(const CliArgs& args, FingerprintService& service) {
  std::string output = args.output_file.empty() ? default_output_path(args.input_file)
                                                : args.output_file;

  MasteringOptions options;
  options.intensity = args.intensity;
  MasteringEngine engine(options);

  bool show_progress = !args.quiet && !args.json_output;
  ProgressCallback progress = show_progress ? ProgressCallback(progress_callback) : nullptr;
  MasteringResult result = engine.master_file(args.input_file, output, service, progress);
  if (show_progress) clear_progress();

  if (args.json_output) {
    JsonBuilder json;
    json.begin_object()
        .kv("input", args.input_file)
        .kv("output", output)
        .kv("material", material_class_name(result.material))
        .kv("effective_intensity", result.effective_intensity)
        .kv("peak_db", result.peak_db)
        .kv("frames", result.frames)
        .kv("channels", result.channels)
        .kv("sample_rate", result.sample_rate);
    add_fingerprint(json, result.fingerprint);
    json.key("stages").begin_array();
    for (const StageRecord& record : result.trace.records()) {
      json.begin_object().kv("stage", record.stage);
      for (const auto& param : record.params) {
        json.kv(param.first, param.second);
      }
      if (!record.reason.empty()) json.kv("reason", record.reason);
      json.end_object();
    }
    json.end_array().end_object().print();
  } else if (!args.quiet) {
    std::cout << "Input:     " << args.input_file << "\n";
    std::cout << "Output:    " << output << "\n";
    std::cout << "Material:  " << material_class_name(result.material) << std::fixed
              << std::setprecision(1) << " (LUFS " << result.fingerprint.lufs() << ", crest "
              << result.fingerprint.crest_db() << " dB)\n";
    std::cout << "Intensity: " << std::setprecision(2) << result.effective_intensity << "\n";
    std::cout << "Stages:\n";
    for (const StageRecord& record : result.trace.records()) {
      std::cout << "  " << record.stage;
      for (const auto& param : record.params) {
        std::cout << " " << param.first << "=" << param.second;
      }
      if (!record.reason.empty()) std::cout << " (" << record.reason << ")";
      std::cout << "\n";
    }
  }
  return 0;
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage(argv[0]);
    return 1;
  }

  try {
    CliArgs args = ArgParser::parse(argc, argv);

    if (args.help) {
      print_usage(argv[0]);
      return 0;
    }
    if (args.version) {
      std::cout << "masterprint version " << version() << "\n";
      return 0;
    }

    set_log_level(args.verbose ? "debug" : (args.quiet || args.json_output) ? "warn" : "info");

    if (args.input_file.empty() && !args.clear_cache) {
      std::cerr << "Error: Missing audio file\n\n";
      print_usage(argv[0]);
      return 1;
    }
    if (args.intensity < 0.0f || args.intensity > 1.0f) {
      std::cerr << "Error: Intensity must be within [0, 1]\n";
      return 1;
    }

    std::unique_ptr<DspBackend> backend = select_backend(backend_preference_from_env());
    FingerprintServiceConfig service_config;
    service_config.db_path = args.db_path;
    FingerprintService service(extractor_compute(*backend), service_config);

    if (args.clear_cache) {
      service.clear_cache();
      if (!args.input_file.empty()) service.clear_cache(args.input_file);
      if (args.input_file.empty()) return 0;
    }

    if (args.fingerprint_only) {
      return cmd_fingerprint(args, service);
    }
    return cmd_master(args, service);

  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
