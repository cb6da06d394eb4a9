#include "swissdesk/core/stats/StandingsTable.h"

#include <algorithm>
#include <numeric>

namespace swissdesk::core::stats {

using tournament::Color;
using tournament::Outcome;

bool StandingRow::operator==(const StandingRow& other) const {
    return rank == other.rank && player_id == other.player_id && name == other.name &&
           rating == other.rating && is_active == other.is_active && points == other.points &&
           tiebreaks == other.tiebreaks && games == other.games && wins == other.wins &&
           draws == other.draws && losses == other.losses && byes == other.byes;
}

StandingsTable::StandingsTable(const players::PlayerRegistry& registry,
                               const tournament::RoundLedger& ledger,
                               double bye_points) {
    stats_.reserve(registry.size());
    for (const auto& player : registry.players()) {
        PlayerStats stats;
        stats.player_id = player.id;
        stats.name = player.name();
        stats.rating = player.details.rating;
        stats.is_active = player.is_active;
        index_[player.id] = stats_.size();
        stats_.push_back(std::move(stats));
    }

    for (const auto& round : ledger.rounds()) {
        if (!round.is_recorded) {
            continue;
        }
        for (size_t board = 0; board < round.pairings.size(); ++board) {
            const auto& pairing = round.pairings[board];
            if (pairing.is_bye()) {
                RecordBye(round.index, pairing.player_a_id, bye_points);
            } else {
                RecordGame(round.index, pairing, round.results[board]);
            }
        }
        for (auto& entry : stats_) {
            entry.cumulative += entry.points;
        }
    }
}

void StandingsTable::RecordGame(int round_index,
                                const tournament::Pairing& pairing,
                                tournament::Outcome outcome) {
    const auto a_it = index_.find(pairing.player_a_id);
    const auto b_it = index_.find(pairing.player_b_id);
    if (a_it == index_.end() || b_it == index_.end()) {
        return;
    }

    auto& a = stats_[a_it->second];
    auto& b = stats_[b_it->second];
    const double a_points = tournament::PointsFor(pairing, outcome, a.player_id, 0.0);
    const double b_points = tournament::PointsFor(pairing, outcome, b.player_id, 0.0);

    a.games += 1;
    b.games += 1;
    a.points += a_points;
    b.points += b_points;
    if (outcome == Outcome::PlayerAWin) {
        a.wins += 1;
        b.losses += 1;
    } else if (outcome == Outcome::PlayerBWin) {
        b.wins += 1;
        a.losses += 1;
    } else {
        a.draws += 1;
        b.draws += 1;
    }
    if (pairing.color_a == Color::Black) {
        a.black_games += 1;
    }
    if (pairing.color_b == Color::Black) {
        b.black_games += 1;
    }
    a.encounters.push_back({round_index, b.player_id, pairing.color_a, a_points});
    b.encounters.push_back({round_index, a.player_id, pairing.color_b, b_points});
}

void StandingsTable::RecordBye(int round_index, const std::string& player_id, double points) {
    const auto it = index_.find(player_id);
    if (it == index_.end()) {
        return;
    }
    auto& entry = stats_[it->second];
    entry.byes += 1;
    entry.points += points;
    entry.bye_rounds.push_back(round_index);
}

const PlayerStats* StandingsTable::Find(const std::string& player_id) const {
    const auto it = index_.find(player_id);
    if (it == index_.end()) {
        return nullptr;
    }
    return &stats_[it->second];
}

std::vector<double> StandingsTable::OpponentScores(const PlayerStats& player) const {
    std::vector<double> scores;
    scores.reserve(player.encounters.size());
    for (const auto& encounter : player.encounters) {
        const auto* opponent = Find(encounter.opponent_id);
        if (opponent) {
            scores.push_back(opponent->points);
        }
    }
    return scores;
}

double StandingsTable::TiebreakValue(const std::string& player_id, TiebreakCriterion criterion) const {
    const auto* player = Find(player_id);
    if (!player) {
        return 0.0;
    }

    switch (criterion) {
        case TiebreakCriterion::Buchholz:
        case TiebreakCriterion::BuchholzCut1:
        case TiebreakCriterion::MedianBuchholz: {
            auto scores = OpponentScores(*player);
            std::sort(scores.begin(), scores.end());
            double total = std::accumulate(scores.begin(), scores.end(), 0.0);
            if (criterion == TiebreakCriterion::BuchholzCut1 && scores.size() >= 2) {
                total -= scores.front();
            }
            if (criterion == TiebreakCriterion::MedianBuchholz && scores.size() >= 3) {
                total -= scores.front() + scores.back();
            }
            return total;
        }
        case TiebreakCriterion::SonnebornBerger: {
            double total = 0.0;
            for (const auto& encounter : player->encounters) {
                const auto* opponent = Find(encounter.opponent_id);
                if (opponent) {
                    total += encounter.points * opponent->points;
                }
            }
            return total;
        }
        case TiebreakCriterion::Cumulative:
            return player->cumulative;
        case TiebreakCriterion::OpponentsCumulative: {
            double total = 0.0;
            for (const auto& encounter : player->encounters) {
                const auto* opponent = Find(encounter.opponent_id);
                if (opponent) {
                    total += opponent->cumulative;
                }
            }
            return total;
        }
        case TiebreakCriterion::HeadToHead: {
            double total = 0.0;
            for (const auto& encounter : player->encounters) {
                const auto* opponent = Find(encounter.opponent_id);
                if (opponent && opponent->points == player->points) {
                    total += encounter.points;
                }
            }
            return total;
        }
        case TiebreakCriterion::Wins:
            return static_cast<double>(player->wins);
        case TiebreakCriterion::BlackGames:
            return static_cast<double>(player->black_games);
        case TiebreakCriterion::Rating:
            return static_cast<double>(player->rating.value_or(0));
    }
    return 0.0;
}

std::vector<StandingRow> StandingsTable::Rank(const std::vector<TiebreakCriterion>& order) const {
    std::vector<StandingRow> rows;
    rows.reserve(stats_.size());
    for (const auto& entry : stats_) {
        StandingRow row;
        row.player_id = entry.player_id;
        row.name = entry.name;
        row.rating = entry.rating;
        row.is_active = entry.is_active;
        row.points = entry.points;
        row.games = entry.games;
        row.wins = entry.wins;
        row.draws = entry.draws;
        row.losses = entry.losses;
        row.byes = entry.byes;
        row.tiebreaks.reserve(order.size());
        for (const auto criterion : order) {
            row.tiebreaks.push_back(TiebreakValue(entry.player_id, criterion));
        }
        rows.push_back(std::move(row));
    }

    std::sort(rows.begin(), rows.end(), [](const StandingRow& a, const StandingRow& b) {
        if (a.points != b.points) {
            return a.points > b.points;
        }
        for (size_t i = 0; i < a.tiebreaks.size(); ++i) {
            if (a.tiebreaks[i] != b.tiebreaks[i]) {
                return a.tiebreaks[i] > b.tiebreaks[i];
            }
        }
        return a.name < b.name;
    });

    int rank = 1;
    for (auto& row : rows) {
        row.rank = rank++;
    }
    return rows;
}

Crosstable StandingsTable::BuildCrosstable(const std::vector<TiebreakCriterion>& order) const {
    const auto rows = Rank(order);
    Crosstable table;
    std::unordered_map<std::string, size_t> column;
    for (const auto& row : rows) {
        column[row.player_id] = table.player_ids.size();
        table.player_ids.push_back(row.player_id);
        table.names.push_back(row.name);
        table.points.push_back(row.points);
    }

    const size_t count = rows.size();
    table.cells.assign(count, std::vector<std::vector<Encounter>>(count));
    table.bye_rounds.assign(count, {});
    for (size_t r = 0; r < count; ++r) {
        const auto* player = Find(table.player_ids[r]);
        if (!player) {
            continue;
        }
        table.bye_rounds[r] = player->bye_rounds;
        for (const auto& encounter : player->encounters) {
            const auto it = column.find(encounter.opponent_id);
            if (it != column.end()) {
                table.cells[r][it->second].push_back(encounter);
            }
        }
    }
    return table;
}

}  // namespace swissdesk::core::stats
