#include "payledger/telemetry/telemetry_sink.hpp"

#include <utility>

namespace payledger {
namespace telemetry {

void TelemetrySink::register_metric(std::uint64_t id, std::string name) {
  std::scoped_lock lock(mutex_);
  names_[id] = std::move(name);
  totals_.try_emplace(id, 0);
}

void TelemetrySink::push(Sample sample) {
  std::scoped_lock lock(mutex_);
  totals_[sample.id] += sample.value;
}

void TelemetrySink::increment(std::uint64_t id, std::int64_t delta) {
  push(Sample{.id = id, .value = delta});
}

std::vector<TelemetrySink::Total> TelemetrySink::totals() const {
  std::scoped_lock lock(mutex_);
  std::vector<Total> out;
  out.reserve(totals_.size());
  for (const auto& [id, value] : totals_) {
    auto name_it = names_.find(id);
    out.push_back(Total{
        .id = id,
        .name = name_it != names_.end() ? name_it->second : "metric_" + std::to_string(id),
        .value = value,
    });
  }
  return out;
}

std::size_t TelemetrySink::metric_count() const {
  std::scoped_lock lock(mutex_);
  return totals_.size();
}

}  // namespace telemetry
}  // namespace payledger
