#pragma once

#include "swissdesk/core/players/PlayerRegistry.h"
#include "swissdesk/core/tournament/RoundLedger.h"
#include "swissdesk/core/tournament/TournamentTypes.h"

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace swissdesk::core::tournament {

struct SwissPlayerState {
    std::string id;
    std::string name;
    std::optional<int> rating;
    double score = 0.0;
    std::vector<Color> colors;  // real games only, oldest first
    bool had_bye = false;
    std::unordered_set<std::string> opponents;
};

struct SwissContext {
    int round_index = 1;
    std::vector<SwissPlayerState> players;  // active players only
};

class SwissScheduler {
public:
    static constexpr long kDefaultSearchBudget = 200000;

    explicit SwissScheduler(long search_budget = kDefaultSearchBudget);

    // Collects scores, colors, byes and opponents of the active players from
    // every round in |ledger|.
    static SwissContext BuildContext(const players::PlayerRegistry& registry,
                                     const RoundLedger& ledger,
                                     double bye_points);

    // Pairs one round. Never fails for two or more players; when no pairing
    // without rematches exists the round comes back with |forced_repeat| set.
    Round BuildRound(const SwissContext& context) const;

private:
    long search_budget_;
};

}  // namespace swissdesk::core::tournament
