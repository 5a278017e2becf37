#include "pmlink/core/id_generator.h"

#include <chrono>
#include <iomanip>
#include <sstream>

namespace pmlink::core {

namespace {

// "2026-01-01T09:30:00Z" -> "20260101T093000Z"
std::string compact_utc_second(const Timestamp ts) {
  std::string compact;
  for (const char ch : format_iso8601(ts)) {
    if (ch != '-' && ch != ':') {
      compact.push_back(ch);
    }
  }
  return compact;
}

}  // namespace

std::string SystemIdGenerator::next(std::string_view prefix) {
  const Timestamp ts = clock_.now();
  const auto since_second =
      ts.time_since_epoch() - std::chrono::floor<std::chrono::seconds>(ts.time_since_epoch());
  const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(since_second).count();

  const auto c = counter_.fetch_add(1, std::memory_order_relaxed);

  std::ostringstream oss;
  oss << prefix << '-' << compact_utc_second(ts) << '-' << std::setfill('0') << std::setw(6)
      << micros << '-' << c;
  return oss.str();
}

std::string DeterministicIdGenerator::next(std::string_view prefix) {
  const auto c = counter_.fetch_add(1, std::memory_order_relaxed);
  return std::string(prefix) + "-" + std::to_string(c);
}

}  // namespace pmlink::core
