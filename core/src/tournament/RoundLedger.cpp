#include "swissdesk/core/tournament/RoundLedger.h"

namespace swissdesk::core::tournament {

namespace {

using util::ErrorKind;
using util::Fail;

std::string RoundLabel(int round_index) {
    return "Round " + std::to_string(round_index);
}

}  // namespace

bool RoundLedger::ValidateOutcomes(const Round& round,
                                   const std::vector<Outcome>& outcomes,
                                   util::Error* error) {
    if (outcomes.size() != round.pairings.size()) {
        return Fail(error, ErrorKind::Validation,
                    RoundLabel(round.index) + " has " + std::to_string(round.pairings.size()) +
                        " pairings but " + std::to_string(outcomes.size()) + " outcomes were given.");
    }
    for (size_t i = 0; i < outcomes.size(); ++i) {
        const bool bye = round.pairings[i].is_bye();
        if (bye && outcomes[i] != Outcome::Bye) {
            return Fail(error, ErrorKind::Validation,
                        RoundLabel(round.index) + " board " + std::to_string(i + 1) +
                            " is a bye and only accepts the bye result.");
        }
        if (!bye && outcomes[i] == Outcome::Bye) {
            return Fail(error, ErrorKind::Validation,
                        RoundLabel(round.index) + " board " + std::to_string(i + 1) +
                            " is not a bye.");
        }
    }
    return true;
}

bool RoundLedger::Append(Round round, util::Error* error) {
    if (has_pending_round()) {
        return Fail(error, ErrorKind::Sequence,
                    RoundLabel(rounds_.back().index) + " must be recorded before pairing another round.");
    }
    const int expected = size() + 1;
    if (round.index != expected) {
        return Fail(error, ErrorKind::Sequence,
                    "Expected round " + std::to_string(expected) + ", got " + std::to_string(round.index) + ".");
    }
    round.results.clear();
    round.is_recorded = false;
    rounds_.push_back(std::move(round));
    ++version_;
    return true;
}

bool RoundLedger::RecordResults(int round_index, const std::vector<Outcome>& outcomes, util::Error* error) {
    if (!has_pending_round()) {
        return Fail(error, ErrorKind::Sequence, "There is no paired round awaiting results.");
    }
    Round& pending = rounds_.back();
    if (round_index != pending.index) {
        return Fail(error, ErrorKind::Sequence,
                    "Results must be recorded for round " + std::to_string(pending.index) + ", not " +
                        std::to_string(round_index) + ".");
    }
    if (!ValidateOutcomes(pending, outcomes, error)) {
        return false;
    }
    pending.results = outcomes;
    pending.is_recorded = true;
    ++version_;
    return true;
}

// A round's pre-recording state is fully determined by its pairings, so
// stepping back one version only has to drop the results.
bool RoundLedger::UndoLast(util::Error* error) {
    if (rounds_.empty()) {
        return Fail(error, ErrorKind::Sequence, "Nothing to undo.");
    }
    Round& last = rounds_.back();
    if (!last.is_recorded) {
        return Fail(error, ErrorKind::Sequence,
                    RoundLabel(last.index) + " has no recorded results to undo.");
    }
    last.results.clear();
    last.is_recorded = false;
    ++version_;
    return true;
}

bool RoundLedger::Load(std::vector<Round> rounds, util::Error* error) {
    for (size_t i = 0; i < rounds.size(); ++i) {
        const Round& round = rounds[i];
        if (round.index != static_cast<int>(i) + 1) {
            return Fail(error, ErrorKind::Decode,
                        "Round at position " + std::to_string(i + 1) + " has index " +
                            std::to_string(round.index) + ".");
        }
        if (round.is_recorded) {
            util::Error outcome_error;
            if (!ValidateOutcomes(round, round.results, &outcome_error)) {
                return Fail(error, ErrorKind::Decode, outcome_error.message);
            }
            continue;
        }
        if (!round.results.empty()) {
            return Fail(error, ErrorKind::Decode,
                        RoundLabel(round.index) + " carries results but is not recorded.");
        }
        if (i + 1 != rounds.size()) {
            return Fail(error, ErrorKind::Decode,
                        RoundLabel(round.index) + " is unrecorded but is not the last round.");
        }
    }
    rounds_ = std::move(rounds);
    ++version_;
    return true;
}

const Round* RoundLedger::Find(int round_index) const {
    if (round_index < 1 || round_index > size()) {
        return nullptr;
    }
    return &rounds_[static_cast<size_t>(round_index - 1)];
}

int RoundLedger::recorded_count() const {
    int count = 0;
    for (const auto& round : rounds_) {
        if (round.is_recorded) {
            ++count;
        }
    }
    return count;
}

}  // namespace swissdesk::core::tournament
