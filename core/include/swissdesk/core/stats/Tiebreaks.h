#pragma once

#include <optional>
#include <string>
#include <vector>

namespace swissdesk::core::stats {

enum class TiebreakCriterion {
    Buchholz,             // sum of opponents' scores
    BuchholzCut1,         // Buchholz without the weakest opponent
    MedianBuchholz,       // Buchholz without the weakest and strongest opponent
    SonnebornBerger,      // beaten opponents' scores + half of drawn opponents' scores
    Cumulative,           // sum of the running score after every round
    OpponentsCumulative,  // sum of the opponents' cumulative scores
    HeadToHead,           // points scored against players on the same score
    Wins,                 // games won over the board
    BlackGames,           // games played with Black
    Rating
};

std::string TiebreakToString(TiebreakCriterion criterion);
std::optional<TiebreakCriterion> TiebreakFromString(const std::string& value);
std::vector<TiebreakCriterion> DefaultTiebreakOrder();
std::vector<TiebreakCriterion> AllTiebreaks();

}  // namespace swissdesk::core::stats
