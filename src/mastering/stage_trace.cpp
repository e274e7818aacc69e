#include "mastering/stage_trace.h"

namespace masterprint {

bool StageRecord::has(const std::string& name) const {
  for (const auto& p : params) {
    if (p.first == name) return true;
  }
  return false;
}

float StageRecord::param(const std::string& name, float fallback) const {
  for (const auto& p : params) {
    if (p.first == name) return p.second;
  }
  return fallback;
}

StageRecord& StageTrace::add(const std::string& stage) {
  records_.emplace_back();
  records_.back().stage = stage;
  return records_.back();
}

void StageTrace::append(const StageTrace& other) {
  records_.insert(records_.end(), other.records_.begin(), other.records_.end());
}

const StageRecord* StageTrace::find(const std::string& stage) const {
  for (const auto& record : records_) {
    if (record.stage == stage) return &record;
  }
  return nullptr;
}

std::vector<std::string> StageTrace::stage_names() const {
  std::vector<std::string> names;
  names.reserve(records_.size());
  for (const auto& record : records_) {
    names.push_back(record.stage);
  }
  return names;
}

}  // namespace masterprint
