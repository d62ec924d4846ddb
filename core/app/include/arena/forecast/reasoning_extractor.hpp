#pragma once

#include "arena/domain/forecast.hpp"

#include <optional>
#include <string>

namespace arena {
namespace forecast {

// -----------------------------------------------------------------------------
// Reasoning extraction - verifiable predictions scraped from decision prose
// -----------------------------------------------------------------------------
//
// @brief  Turns an agent's free-text reasoning into a predicted direction,
//         magnitude and time horizon.
//
// @details
// Every pattern list is evaluated in order and the first match wins.
// Matching is case-insensitive. No model call is made: this is plain
// pattern matching and is sensitive to phrasing.
//
// Thread-safety: Stateless (the compiled patterns are function-local
// statics, initialised once). Safe to call from any thread.
// -----------------------------------------------------------------------------

// buy -> Up and sell -> Down regardless of the text. For any other action
// the reasoning is scanned for sideways, then bullish, then bearish terms.
domain::Direction inferDirection(const std::string& reasoning,
                                 const std::string& action);

// "N% gain|upside|appreciation|increase|growth" -> +N/100,
// "N% loss|downside|decline|decrease|drop"      -> -N/100, else nullopt.
// A number too large to represent also yields nullopt.
std::optional<double> extractMagnitude(const std::string& reasoning);

// One of "intraday", "1-2 days", "1 week", "2 weeks", "1 month",
// "3+ months", or nullopt when no horizon phrase is present.
std::optional<std::string> extractHorizon(const std::string& reasoning);

}  // namespace forecast
}  // namespace arena
