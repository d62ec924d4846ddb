#include "arena/forecast/reasoning_extractor.hpp"

#include <cmath>
#include <cstdlib>
#include <regex>
#include <utility>
#include <vector>

namespace arena {
namespace forecast {

namespace {

constexpr auto kFlags = std::regex::ECMAScript | std::regex::icase;

// Percent text -> fraction. An overlong digit run overflows to HUGE_VAL and
// is treated as no magnitude at all.
std::optional<double> percentToFraction(const std::string& digits) {
  const double percent = std::strtod(digits.c_str(), nullptr);
  if (!std::isfinite(percent)) {
    return std::nullopt;
  }
  return percent / 100.0;
}

}  // namespace

domain::Direction inferDirection(const std::string& reasoning,
                                 const std::string& action) {
  if (action == "buy") {
    return domain::Direction::Up;
  }
  if (action == "sell") {
    return domain::Direction::Down;
  }

  static const std::regex kSideways("sideways|flat|range[- ]bound|consolidat",
                                    kFlags);
  static const std::regex kBullish("bullish|upside|growth|rally", kFlags);
  static const std::regex kBearish("bearish|downside|decline|correction",
                                   kFlags);

  if (std::regex_search(reasoning, kSideways)) {
    return domain::Direction::Flat;
  }
  if (std::regex_search(reasoning, kBullish)) {
    return domain::Direction::Up;
  }
  if (std::regex_search(reasoning, kBearish)) {
    return domain::Direction::Down;
  }
  return domain::Direction::Unknown;
}

std::optional<double> extractMagnitude(const std::string& reasoning) {
  static const std::regex kGain(
      R"((\d+\.?\d*)%\s+(?:gain|upside|appreciation|increase|growth))",
      kFlags);
  static const std::regex kLoss(
      R"((\d+\.?\d*)%\s+(?:loss|downside|decline|decrease|drop))", kFlags);

  std::smatch match;
  if (std::regex_search(reasoning, match, kGain)) {
    return percentToFraction(match[1].str());
  }
  if (std::regex_search(reasoning, match, kLoss)) {
    if (auto fraction = percentToFraction(match[1].str())) {
      return -*fraction;
    }
  }
  return std::nullopt;
}

std::optional<std::string> extractHorizon(const std::string& reasoning) {
  static const std::vector<std::pair<std::regex, std::string>> kPatterns = {
      {std::regex(R"(\b(?:short[- ]term|next\s+few\s+hours?|intraday)\b)",
                  kFlags),
       "intraday"},
      {std::regex(
           R"(\b(?:next\s+(?:1-2|few)\s+days?|24[- ]?48\s*h|tomorrow)\b)",
           kFlags),
       "1-2 days"},
      {std::regex(
           R"(\b(?:this\s+week|next\s+week|within\s+a\s+week|5\s+days?)\b)",
           kFlags),
       "1 week"},
      {std::regex(R"(\b(?:next\s+(?:2|two)\s+weeks?|fortnight)\b)", kFlags),
       "2 weeks"},
      {std::regex(R"(\b(?:this\s+month|next\s+month|30\s+days?)\b)", kFlags),
       "1 month"},
      {std::regex(
           R"(\b(?:long[- ]term|quarter|several\s+months?|this\s+year)\b)",
           kFlags),
       "3+ months"},
  };

  for (const auto& [pattern, horizon] : kPatterns) {
    if (std::regex_search(reasoning, pattern)) {
      return horizon;
    }
  }
  return std::nullopt;
}

}  // namespace forecast
}  // namespace arena
