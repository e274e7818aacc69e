#pragma once

/// @file feature_guard.h
/// @brief Isolates sub-feature failures so each field falls back to its own default.

#include <cmath>
#include <exception>

#include "fingerprint/fingerprint.h"
#include "util/log.h"

namespace masterprint {

/// @brief Runs @p compute and stores its result under the field's name.
/// @details An exception or a non-finite result stores the field default instead and logs a
///          warning. Other fields in @p out are never touched.
/// @param out Destination map
/// @param field Field being computed
/// @param compute Callable returning float
template <typename Compute>
void guarded_feature(FeatureMap& out, FingerprintField field, Compute&& compute) {
  const FieldSpec& spec = field_spec(field);
  try {
    float value = compute();
    if (std::isfinite(value)) {
      out[spec.name] = value;
      return;
    }
    logger()->warn("Feature '{}' produced a non-finite value, using default {}", spec.name,
                   spec.default_value);
  } catch (const std::exception& e) {
    logger()->warn("Feature '{}' failed ({}), using default {}", spec.name, e.what(),
                   spec.default_value);
  }
  out[spec.name] = spec.default_value;
}

}  // namespace masterprint
