#pragma once

#include "swissdesk/core/api/TournamentConfig.h"
#include "swissdesk/core/players/PlayerRegistry.h"
#include "swissdesk/core/stats/StandingsTable.h"
#include "swissdesk/core/tournament/RoundLedger.h"
#include "swissdesk/core/tournament/SwissScheduler.h"
#include "swissdesk/core/util/Error.h"

#include <deque>
#include <functional>
#include <string>
#include <vector>

namespace swissdesk::core::tournament {

enum class TournamentStatus {
    NotStarted,
    AwaitingResults,
    ReadyForNextRound,
    Finished
};

std::string StatusToString(TournamentStatus status);

// Single-threaded engine driven by a shell. Every mutating call either
// applies completely or leaves the tournament untouched.
class Tournament {
public:
    using LogFn = std::function<void(const std::string&)>;

    Tournament() = default;
    explicit Tournament(std::string name, api::TournamentConfig config = {});

    // Builds a tournament from already decoded parts, checking that rounds
    // only reference registered players and respect the pairing shape.
    static bool Restore(std::string name,
                        api::TournamentConfig config,
                        players::PlayerRegistry registry,
                        RoundLedger ledger,
                        Tournament& out,
                        util::Error* error);

    void set_log_fn(LogFn log_fn) { log_fn_ = std::move(log_fn); }

    const std::string& name() const { return name_; }
    void SetName(std::string name);

    const api::TournamentConfig& config() const { return config_; }
    bool SetNumRounds(int num_rounds, util::Error* error);
    bool SetByePoints(double bye_points, util::Error* error);
    bool SetTiebreakOrder(std::vector<stats::TiebreakCriterion> order, util::Error* error);

    bool AddPlayer(players::PlayerDetails details, std::string* player_id, util::Error* error);
    bool UpdatePlayer(const std::string& player_id, players::PlayerDetails details, util::Error* error);
    bool RemovePlayer(const std::string& player_id, util::Error* error);
    bool SetActive(const std::string& player_id, bool active, util::Error* error);

    bool GenerateNextRound(Round* round, util::Error* error);
    bool RecordResults(int round_index, const std::vector<Outcome>& outcomes, util::Error* error);
    bool UndoLast(util::Error* error);

    std::vector<stats::StandingRow> ComputeStandings() const;
    stats::Crosstable ComputeCrosstable() const;

    TournamentStatus status() const;
    int completed_rounds() const { return ledger_.recorded_count(); }
    bool started() const { return !ledger_.empty(); }

    const players::PlayerRegistry& players() const { return registry_; }
    const RoundLedger& ledger() const { return ledger_; }
    const std::deque<std::string>& history() const { return history_; }
    std::string LastLogLines(int n) const;

private:
    std::string DisplayName(const std::string& player_id) const;
    void AppendLogLine(const std::string& line);

    std::string name_;
    api::TournamentConfig config_;
    players::PlayerRegistry registry_;
    RoundLedger ledger_;
    SwissScheduler scheduler_;

    LogFn log_fn_{};
    std::deque<std::string> history_;
    size_t max_log_lines_ = 2000;
};

}  // namespace swissdesk::core::tournament
