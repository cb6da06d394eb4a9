#include "swissdesk/core/stats/Tiebreaks.h"

namespace swissdesk::core::stats {

std::string TiebreakToString(TiebreakCriterion criterion) {
    switch (criterion) {
        case TiebreakCriterion::Buchholz:
            return "buchholz";
        case TiebreakCriterion::BuchholzCut1:
            return "buchholz_cut1";
        case TiebreakCriterion::MedianBuchholz:
            return "median_buchholz";
        case TiebreakCriterion::SonnebornBerger:
            return "sonneborn_berger";
        case TiebreakCriterion::Cumulative:
            return "cumulative";
        case TiebreakCriterion::OpponentsCumulative:
            return "opponents_cumulative";
        case TiebreakCriterion::HeadToHead:
            return "head_to_head";
        case TiebreakCriterion::Wins:
            return "wins";
        case TiebreakCriterion::BlackGames:
            return "black_games";
        case TiebreakCriterion::Rating:
            return "rating";
    }
    return "unknown";
}

std::optional<TiebreakCriterion> TiebreakFromString(const std::string& value) {
    for (const auto criterion : AllTiebreaks()) {
        if (TiebreakToString(criterion) == value) {
            return criterion;
        }
    }
    return std::nullopt;
}

std::vector<TiebreakCriterion> DefaultTiebreakOrder() {
    return {
        TiebreakCriterion::MedianBuchholz,
        TiebreakCriterion::Buchholz,
        TiebreakCriterion::Cumulative,
        TiebreakCriterion::OpponentsCumulative,
        TiebreakCriterion::SonnebornBerger,
        TiebreakCriterion::HeadToHead,
        TiebreakCriterion::Wins,
        TiebreakCriterion::Rating,
    };
}

std::vector<TiebreakCriterion> AllTiebreaks() {
    return {
        TiebreakCriterion::Buchholz,
        TiebreakCriterion::BuchholzCut1,
        TiebreakCriterion::MedianBuchholz,
        TiebreakCriterion::SonnebornBerger,
        TiebreakCriterion::Cumulative,
        TiebreakCriterion::OpponentsCumulative,
        TiebreakCriterion::HeadToHead,
        TiebreakCriterion::Wins,
        TiebreakCriterion::BlackGames,
        TiebreakCriterion::Rating,
    };
}

}  // namespace swissdesk::core::stats
