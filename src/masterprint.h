#pragma once

/// @file masterprint.h
/// @brief Main header for masterprint - audio fingerprinting and adaptive mastering.
/// @details Include this file to access all masterprint functionality.

// Utility
#include "util/exception.h"
#include "util/fork_join.h"
#include "util/log.h"
#include "util/math_utils.h"
#include "util/types.h"
#include "util/version.h"

// Core
#include "core/audio.h"
#include "core/audio_buffer.h"
#include "core/audio_io.h"
#include "core/fft.h"
#include "core/resample.h"
#include "core/spectrum.h"
#include "core/window.h"

// Filters
#include "filters/iir.h"

// DSP backends
#include "backend/dsp_backend.h"

// Fingerprint
#include "fingerprint/fingerprint.h"
#include "fingerprint/fingerprint_extractor.h"
#include "fingerprint/mastering_targets.h"
#include "fingerprint/sampled_analyzer.h"

// Streaming
#include "streaming/streaming_harmonic.h"
#include "streaming/streaming_spectral.h"
#include "streaming/streaming_temporal.h"

// Cache
#include "cache/fingerprint_service.h"
#include "cache/fingerprint_store.h"
#include "cache/hashing.h"
#include "cache/sidecar.h"

// Mastering
#include "mastering/chunked_pipeline.h"
#include "mastering/mastering_engine.h"
#include "mastering/processing_branches.h"
