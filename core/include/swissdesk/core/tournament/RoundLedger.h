#pragma once

#include "swissdesk/core/tournament/TournamentTypes.h"
#include "swissdesk/core/util/Error.h"

#include <cstdint>
#include <vector>

namespace swissdesk::core::tournament {

// Ordered rounds of a tournament. Rounds are recorded strictly in index
// order, so a recorded round never follows an unrecorded one.
class RoundLedger {
public:
    bool Append(Round round, util::Error* error);
    bool RecordResults(int round_index, const std::vector<Outcome>& outcomes, util::Error* error);
    bool UndoLast(util::Error* error);

    // Replaces the whole ledger after validating ordering and result counts.
    bool Load(std::vector<Round> rounds, util::Error* error);

    const std::vector<Round>& rounds() const { return rounds_; }
    const Round* Find(int round_index) const;
    bool empty() const { return rounds_.empty(); }
    int size() const { return static_cast<int>(rounds_.size()); }
    int recorded_count() const;
    bool has_pending_round() const { return !rounds_.empty() && !rounds_.back().is_recorded; }

    // Bumped on every mutation.
    std::uint64_t version() const { return version_; }

private:
    static bool ValidateOutcomes(const Round& round, const std::vector<Outcome>& outcomes, util::Error* error);

    std::vector<Round> rounds_;
    std::uint64_t version_ = 0;
};

}  // namespace swissdesk::core::tournament
