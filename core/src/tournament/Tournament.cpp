#include "swissdesk/core/tournament/Tournament.h"

#include <algorithm>
#include <iostream>
#include <sstream>
#include <unordered_set>

namespace swissdesk::core::tournament {

namespace {

using util::ErrorKind;
using util::Fail;

std::string RatingLabel(const players::PlayerDetails& details) {
    if (!details.rating.has_value()) {
        return "unrated";
    }
    return std::to_string(*details.rating);
}

bool ValidateRoundShape(const Round& round, const players::PlayerRegistry& registry, util::Error* error) {
    const std::string label = "Round " + std::to_string(round.index);
    std::unordered_set<std::string> seen;
    int byes = 0;
    for (const auto& pairing : round.pairings) {
        for (const auto* id : {&pairing.player_a_id, &pairing.player_b_id}) {
            if (id->empty()) {
                continue;
            }
            if (!registry.Contains(*id)) {
                return Fail(error, ErrorKind::Decode, label + " references unknown player '" + *id + "'.");
            }
            if (!seen.insert(*id).second) {
                return Fail(error, ErrorKind::Decode, label + " pairs player '" + *id + "' twice.");
            }
        }
        if (pairing.player_a_id.empty()) {
            return Fail(error, ErrorKind::Decode, label + " has a pairing without player A.");
        }
        if (pairing.is_bye()) {
            byes += 1;
            if (pairing.color_a != Color::None || pairing.color_b != Color::None || pairing.repeat) {
                return Fail(error, ErrorKind::Decode, label + " has a bye with colors or a repeat flag.");
            }
            continue;
        }
        if (pairing.color_a == Color::None || pairing.color_b != OppositeColor(pairing.color_a)) {
            return Fail(error, ErrorKind::Decode, label + " has a pairing with invalid colors.");
        }
    }
    if (byes > 1) {
        return Fail(error, ErrorKind::Decode, label + " has more than one bye.");
    }
    return true;
}

}  // namespace

std::string StatusToString(TournamentStatus status) {
    switch (status) {
        case TournamentStatus::NotStarted:
            return "not_started";
        case TournamentStatus::AwaitingResults:
            return "awaiting_results";
        case TournamentStatus::ReadyForNextRound:
            return "ready_for_next_round";
        case TournamentStatus::Finished:
            return "finished";
    }
    return "unknown";
}

Tournament::Tournament(std::string name, api::TournamentConfig config)
    : name_(std::move(name)), config_(std::move(config)) {}

bool Tournament::Restore(std::string name,
                         api::TournamentConfig config,
                         players::PlayerRegistry registry,
                         RoundLedger ledger,
                         Tournament& out,
                         util::Error* error) {
    util::Error invalid;
    if (!config.Validate(&invalid)) {
        return Fail(error, ErrorKind::Decode, invalid.message);
    }
    if (ledger.size() > config.num_rounds) {
        return Fail(error, ErrorKind::Decode,
                    "Record holds " + std::to_string(ledger.size()) + " rounds but num_rounds is " +
                        std::to_string(config.num_rounds) + ".");
    }
    for (const auto& round : ledger.rounds()) {
        if (!ValidateRoundShape(round, registry, error)) {
            return false;
        }
    }

    Tournament restored(std::move(name), std::move(config));
    restored.registry_ = std::move(registry);
    restored.ledger_ = std::move(ledger);
    restored.log_fn_ = out.log_fn_;
    out = std::move(restored);
    return true;
}

void Tournament::SetName(std::string name) {
    name_ = std::move(name);
    AppendLogLine("Tournament renamed to '" + name_ + "'.");
}

bool Tournament::SetNumRounds(int num_rounds, util::Error* error) {
    if (started()) {
        return Fail(error, ErrorKind::Sequence, "Number of rounds cannot change after the first round is paired.");
    }
    api::TournamentConfig updated = config_;
    updated.num_rounds = num_rounds;
    if (!updated.Validate(error)) {
        return false;
    }
    config_ = std::move(updated);
    AppendLogLine("Number of rounds set to " + std::to_string(num_rounds) + ".");
    return true;
}

bool Tournament::SetByePoints(double bye_points, util::Error* error) {
    if (started()) {
        return Fail(error, ErrorKind::Sequence, "Bye points cannot change after the first round is paired.");
    }
    api::TournamentConfig updated = config_;
    updated.bye_points = bye_points;
    if (!updated.Validate(error)) {
        return false;
    }
    config_ = std::move(updated);
    std::ostringstream line;
    line << "Bye points set to " << bye_points << ".";
    AppendLogLine(line.str());
    return true;
}

bool Tournament::SetTiebreakOrder(std::vector<stats::TiebreakCriterion> order, util::Error* error) {
    api::TournamentConfig updated = config_;
    updated.tiebreak_order = std::move(order);
    if (!updated.Validate(error)) {
        return false;
    }
    config_ = std::move(updated);
    AppendLogLine("Tiebreak order updated.");
    return true;
}

bool Tournament::AddPlayer(players::PlayerDetails details, std::string* player_id, util::Error* error) {
    if (started()) {
        return Fail(error, ErrorKind::Sequence, "Cannot add players after the tournament has started.");
    }
    std::string id;
    if (!registry_.Add(std::move(details), &id, error)) {
        return false;
    }
    const auto* player = registry_.Find(id);
    AppendLogLine("Player '" + player->name() + "' (" + RatingLabel(player->details) + ") added.");
    if (player_id) {
        *player_id = id;
    }
    return true;
}

bool Tournament::UpdatePlayer(const std::string& player_id, players::PlayerDetails details, util::Error* error) {
    if (!registry_.Update(player_id, std::move(details), error)) {
        return false;
    }
    AppendLogLine("Player '" + DisplayName(player_id) + "' details updated.");
    return true;
}

bool Tournament::RemovePlayer(const std::string& player_id, util::Error* error) {
    if (started()) {
        return Fail(error, ErrorKind::Sequence, "Cannot remove players after the tournament has started.");
    }
    const std::string name = DisplayName(player_id);
    if (!registry_.Remove(player_id, error)) {
        return false;
    }
    AppendLogLine("Player '" + name + "' removed from tournament.");
    return true;
}

bool Tournament::SetActive(const std::string& player_id, bool active, util::Error* error) {
    if (!registry_.SetActive(player_id, active, error)) {
        return false;
    }
    AppendLogLine("Player '" + DisplayName(player_id) + "' " + (active ? "reactivated." : "withdrawn."));
    return true;
}

bool Tournament::GenerateNextRound(Round* round, util::Error* error) {
    if (ledger_.has_pending_round()) {
        return Fail(error, ErrorKind::Sequence,
                    "Round " + std::to_string(ledger_.size()) + " must be recorded before pairing the next round.");
    }
    if (ledger_.size() >= config_.num_rounds) {
        return Fail(error, ErrorKind::Sequence,
                    "All " + std::to_string(config_.num_rounds) + " rounds have already been played.");
    }
    const auto active = registry_.ActivePlayers();
    if (active.size() < 2) {
        return Fail(error, ErrorKind::Validation, "At least two active players are needed to pair a round.");
    }

    const auto context = SwissScheduler::BuildContext(registry_, ledger_, config_.bye_points);
    Round next = scheduler_.BuildRound(context);
    if (next.forced_repeat) {
        std::cerr << "[swissdesk] No pairing without rematches exists for round " << next.index
                  << "; repeating pairings." << '\n';
        AppendLogLine("WARNING: Round " + std::to_string(next.index) +
                      " contains a forced repeat pairing (" +
                      util::ErrorKindToString(ErrorKind::PairingExhausted) + ").");
    }
    if (!ledger_.Append(next, error)) {
        return false;
    }

    std::ostringstream line;
    const auto bye = next.bye_player_id();
    const size_t boards = next.pairings.size() - (bye.has_value() ? 1 : 0);
    line << "Round " << next.index << " paired (" << boards << " boards, bye: "
         << (bye.has_value() ? DisplayName(*bye) : std::string("none")) << ").";
    AppendLogLine(line.str());

    if (round) {
        *round = std::move(next);
    }
    return true;
}

bool Tournament::RecordResults(int round_index, const std::vector<Outcome>& outcomes, util::Error* error) {
    if (!ledger_.RecordResults(round_index, outcomes, error)) {
        return false;
    }
    AppendLogLine("Round " + std::to_string(round_index) + " results recorded.");
    return true;
}

bool Tournament::UndoLast(util::Error* error) {
    const int round_index = ledger_.size();
    if (!ledger_.UndoLast(error)) {
        return false;
    }
    AppendLogLine("Round " + std::to_string(round_index) + " results undone.");
    return true;
}

std::vector<stats::StandingRow> Tournament::ComputeStandings() const {
    const stats::StandingsTable table(registry_, ledger_, config_.bye_points);
    return table.Rank(config_.tiebreak_order);
}

stats::Crosstable Tournament::ComputeCrosstable() const {
    const stats::StandingsTable table(registry_, ledger_, config_.bye_points);
    return table.BuildCrosstable(config_.tiebreak_order);
}

TournamentStatus Tournament::status() const {
    if (ledger_.empty()) {
        return TournamentStatus::NotStarted;
    }
    if (ledger_.has_pending_round()) {
        return TournamentStatus::AwaitingResults;
    }
    if (ledger_.recorded_count() >= config_.num_rounds) {
        return TournamentStatus::Finished;
    }
    return TournamentStatus::ReadyForNextRound;
}

std::string Tournament::LastLogLines(int n) const {
    std::ostringstream out;
    const size_t count = n <= 0 ? 0 : std::min(history_.size(), static_cast<size_t>(n));
    for (size_t i = history_.size() - count; i < history_.size(); ++i) {
        out << history_[i] << '\n';
    }
    return out.str();
}

std::string Tournament::DisplayName(const std::string& player_id) const {
    const auto* player = registry_.Find(player_id);
    return player ? player->name() : player_id;
}

void Tournament::AppendLogLine(const std::string& line) {
    if (history_.size() >= max_log_lines_) {
        history_.pop_front();
    }
    history_.push_back(line);
    if (log_fn_) {
        log_fn_(line);
    }
}

}  // namespace swissdesk::core::tournament
