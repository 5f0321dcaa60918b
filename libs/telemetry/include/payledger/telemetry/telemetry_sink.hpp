#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace payledger {
namespace telemetry {

struct Sample {
  std::uint64_t id{};
  std::int64_t value{};
};

// Counter sink. Samples fold into per-id totals as they arrive, so memory is
// bounded by the number of distinct metric ids.
class TelemetrySink {
 public:
  void register_metric(std::uint64_t id, std::string name);
  void push(Sample sample);
  void increment(std::uint64_t id, std::int64_t delta = 1);

  struct Total {
    std::uint64_t id{0};
    std::string name;
    std::int64_t value{0};
  };

  // Ascending by id; unnamed metrics are reported as "metric_<id>".
  [[nodiscard]] std::vector<Total> totals() const;
  [[nodiscard]] std::size_t metric_count() const;

 private:
  mutable std::mutex mutex_;
  std::map<std::uint64_t, std::int64_t> totals_{};
  std::map<std::uint64_t, std::string> names_{};
};

}  // namespace telemetry
}  // namespace payledger
