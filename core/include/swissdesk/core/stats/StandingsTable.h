#pragma once

#include "swissdesk/core/players/PlayerRegistry.h"
#include "swissdesk/core/stats/Tiebreaks.h"
#include "swissdesk/core/tournament/RoundLedger.h"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace swissdesk::core::stats {

struct Encounter {
    int round_index = 0;
    std::string opponent_id;
    tournament::Color color = tournament::Color::None;
    double points = 0.0;
};

struct PlayerStats {
    std::string player_id;
    std::string name;
    std::optional<int> rating;
    bool is_active = true;
    int games = 0;
    int wins = 0;
    int draws = 0;
    int losses = 0;
    int byes = 0;
    int black_games = 0;
    double points = 0.0;
    double cumulative = 0.0;
    std::vector<Encounter> encounters;
    std::vector<int> bye_rounds;
};

struct StandingRow {
    int rank = 0;
    std::string player_id;
    std::string name;
    std::optional<int> rating;
    bool is_active = true;
    double points = 0.0;
    std::vector<double> tiebreaks;  // in the requested criterion order
    int games = 0;
    int wins = 0;
    int draws = 0;
    int losses = 0;
    int byes = 0;

    bool operator==(const StandingRow& other) const;
};

struct Crosstable {
    // Rows and columns share the standings order.
    std::vector<std::string> player_ids;
    std::vector<std::string> names;
    std::vector<double> points;
    std::vector<std::vector<std::vector<Encounter>>> cells;
    std::vector<std::vector<int>> bye_rounds;

    const std::vector<Encounter>& cell(size_t row, size_t column) const { return cells[row][column]; }
};

// Stateless view over the recorded rounds of a ledger. Built from scratch on
// every call; nothing is cached between computations.
class StandingsTable {
public:
    StandingsTable(const players::PlayerRegistry& registry,
                   const tournament::RoundLedger& ledger,
                   double bye_points);

    std::vector<StandingRow> Rank(const std::vector<TiebreakCriterion>& order) const;
    Crosstable BuildCrosstable(const std::vector<TiebreakCriterion>& order) const;

    double TiebreakValue(const std::string& player_id, TiebreakCriterion criterion) const;
    const std::vector<PlayerStats>& stats() const { return stats_; }
    const PlayerStats* Find(const std::string& player_id) const;

private:
    void RecordGame(int round_index, const tournament::Pairing& pairing, tournament::Outcome outcome);
    void RecordBye(int round_index, const std::string& player_id, double points);
    std::vector<double> OpponentScores(const PlayerStats& player) const;

    std::vector<PlayerStats> stats_;
    std::unordered_map<std::string, size_t> index_;
};

}  // namespace swissdesk::core::stats
