#include "suppression_intervals.hpp"

#include <algorithm>
#include <cctype>

namespace airtime::eligibility {

namespace {

std::string Trim(const std::string& value) {
  auto begin = value.begin();
  auto end   = value.end();
  while (begin != end && std::isspace(static_cast<unsigned char>(*begin))) ++begin;
  while (end != begin && std::isspace(static_cast<unsigned char>(*(end - 1)))) --end;
  return std::string(begin, end);
}

} // namespace

TitleIndex BuildTitleIndex(const Timeline& timeline) {
  TitleIndex index;
  for (std::size_t i = 0; i < timeline.size(); ++i) {
    if (timeline[i]->title) index[*timeline[i]->title].push_back(i);
  }
  return index;
}

std::vector<SuppressionInterval> BuildSuppressionIntervals(const Timeline& timeline, const TitleIndex& index,
                                                           const std::vector<model::TitleMappingRule>& rules, util::Micros cap) {
  std::vector<SuppressionInterval> intervals;
  static const std::vector<std::size_t> kNone;

  for (const auto& rule : rules) {
    const auto before_it = index.find(rule.before_title);
    if (before_it == index.end()) continue;

    const auto after_title = Trim(rule.after_title);
    if (after_title.empty()) {
      for (const auto b : before_it->second) {
        intervals.push_back({timeline[b]->start_time, timeline[b]->end_time});
      }
      continue;
    }

    const auto  after_it = index.find(after_title);
    const auto& after    = after_it == index.end() ? kNone : after_it->second;

    for (const auto b : before_it->second) {
      const auto start   = timeline[b]->start_time;
      const auto cap_end = start + cap;

      auto end  = cap_end;
      auto next = std::upper_bound(after.begin(), after.end(), b);
      if (next != after.end()) {
        end = std::min(timeline[*next]->start_time, cap_end);
      }

      if (end > start) intervals.push_back({start, end});
    }
  }

  return MergeIntervals(std::move(intervals));
}

std::vector<SuppressionInterval> MergeIntervals(std::vector<SuppressionInterval> intervals) {
  if (intervals.empty()) return intervals;

  std::sort(intervals.begin(), intervals.end(),
            [](const SuppressionInterval& a, const SuppressionInterval& b) { return a.start < b.start; });

  std::vector<SuppressionInterval> merged;
  merged.push_back(intervals.front());
  for (std::size_t i = 1; i < intervals.size(); ++i) {
    auto& current = merged.back();
    if (intervals[i].start <= current.end) {
      current.end = std::max(current.end, intervals[i].end);
    } else {
      merged.push_back(intervals[i]);
    }
  }
  return merged;
}

} // namespace airtime::eligibility
