#include "pmlink/app/match_summary.h"

#include <algorithm>
#include <cstddef>
#include <iomanip>
#include <map>
#include <sstream>

namespace pmlink::app {

namespace {

std::optional<MetricRange> range_of(const std::vector<double>& values) {
  if (values.empty()) {
    return std::nullopt;
  }
  MetricRange range;
  range.min = *std::min_element(values.begin(), values.end());
  range.max = *std::max_element(values.begin(), values.end());
  double sum = 0.0;
  for (const double v : values) {
    sum += v;
  }
  range.avg = sum / static_cast<double>(values.size());
  return range;
}

}  // namespace

MatchSummary summarize(const domain::MatchSet& match_set, const size_t top_n) {
  MatchSummary summary;
  summary.total_matches = match_set.matches.size();

  std::map<std::string, size_t> counts;
  std::vector<double> scores;
  std::vector<double> overlaps;
  for (const auto& match : match_set.matches) {
    ++counts[std::string(domain::to_string(match.domain))];
    scores.push_back(match.score);
    if (match.entity_overlap_ratio > 0.0) {
      overlaps.push_back(match.entity_overlap_ratio);
    }
  }

  for (const auto& [name, count] : counts) {
    summary.by_domain.push_back(DomainCount{name, count});
  }
  // counts is name-ordered, so a stable sort on count keeps names ascending within ties
  std::stable_sort(summary.by_domain.begin(), summary.by_domain.end(),
                   [](const DomainCount& a, const DomainCount& b) { return a.count > b.count; });

  summary.text_score = range_of(scores);
  summary.entity_overlap = range_of(overlaps);

  const size_t n = std::min(top_n, match_set.matches.size());
  summary.top_matches.assign(match_set.matches.begin(),
                             match_set.matches.begin() + static_cast<std::ptrdiff_t>(n));
  return summary;
}

std::string render_summary(const MatchSummary& summary) {
  std::ostringstream out;
  if (summary.total_matches == 0) {
    out << "No matches found!\n";
    return out.str();
  }

  out << std::fixed;
  out << "Match summary: " << summary.total_matches << " total matches\n";

  out << "By domain:\n";
  for (const auto& entry : summary.by_domain) {
    out << "  " << entry.domain << ": " << entry.count << "\n";
  }

  out << "Quality metrics:\n";
  if (summary.text_score.has_value()) {
    const auto& s = summary.text_score.value();
    out << std::setprecision(1) << "  Text similarity - Min: " << s.min << ", Max: " << s.max
        << ", Avg: " << s.avg << "\n";
  }
  if (summary.entity_overlap.has_value()) {
    const auto& e = summary.entity_overlap.value();
    out << std::setprecision(3) << "  Entity overlap - Min: " << e.min << ", Max: " << e.max
        << ", Avg: " << e.avg << "\n";
  }

  out << "Top " << summary.top_matches.size() << " matches:\n";
  for (size_t i = 0; i < summary.top_matches.size(); ++i) {
    const auto& m = summary.top_matches[i];
    out << "\n"
        << (i + 1) << ". Score: " << std::setprecision(1) << m.score
        << " | Domain: " << domain::to_string(m.domain) << " | Entity: " << std::setprecision(3)
        << m.entity_overlap_ratio << "\n";
    out << "   Left:  " << m.left_title << "\n";
    out << "   Right: " << m.right_title << "\n";
    if (!m.shared_entities.empty()) {
      out << "   Shared: ";
      for (size_t k = 0; k < m.shared_entities.size(); ++k) {
        out << (k > 0 ? ", " : "") << m.shared_entities[k];
      }
      out << "\n";
    }
  }

  return out.str();
}

}  // namespace pmlink::app
