#pragma once

/// @file stage_trace.h
/// @brief Ordered diagnostic record of the stages a branch applied.

#include <string>
#include <utility>
#include <vector>

namespace masterprint {

/// @brief One applied stage: name, numeric parameters and an optional reason.
struct StageRecord {
  std::string stage;
  std::vector<std::pair<std::string, float>> params;
  std::string reason;

  /// @brief Appends a numeric parameter and returns the record for chaining.
  StageRecord& with(const std::string& name, float value) {
    params.emplace_back(name, value);
    return *this;
  }

  /// @brief Sets the reason and returns the record for chaining.
  StageRecord& because(const std::string& why) {
    reason = why;
    return *this;
  }

  /// @brief Returns true if a parameter with @p name was recorded.
  bool has(const std::string& name) const;

  /// @brief Returns the parameter value, or @p fallback if absent.
  float param(const std::string& name, float fallback = 0.0f) const;
};

/// @brief Append-only list of stage records. Diagnostics only.
class StageTrace {
 public:
  /// @brief Appends a new record and returns it for parameter chaining.
  StageRecord& add(const std::string& stage);

  /// @brief Appends every record of @p other.
  void append(const StageTrace& other);

  const std::vector<StageRecord>& records() const { return records_; }
  size_t size() const { return records_.size(); }
  bool empty() const { return records_.empty(); }

  /// @brief Returns the first record named @p stage, or nullptr.
  const StageRecord* find(const std::string& stage) const;

  bool contains(const std::string& stage) const { return find(stage) != nullptr; }

  /// @brief Returns the stage names in order.
  std::vector<std::string> stage_names() const;

 private:
  std::vector<StageRecord> records_;
};

}  // namespace masterprint
