#include "swissdesk/core/api/TournamentConfig.h"
#include "swissdesk/core/persist/TournamentRecord.h"
#include "swissdesk/core/stats/Tiebreaks.h"
#include "swissdesk/core/tournament/Tournament.h"
#include "swissdesk/core/util/AtomicFileWriter.h"
#include "swissdesk/core/util/Error.h"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

using swissdesk::core::api::TournamentConfig;
using swissdesk::core::tournament::Tournament;
using swissdesk::core::util::Error;
using swissdesk::core::util::ErrorKind;
using swissdesk::core::util::Fail;

namespace players = swissdesk::core::players;
namespace stats = swissdesk::core::stats;
namespace tournament = swissdesk::core::tournament;

constexpr const char* kUsage =
    "Usage: swissdesk <tournament.json> <command> [args]\n"
    "Commands:\n"
    "  new <name> [settings.json]\n"
    "  add <name> [rating]\n"
    "  edit <id> <name> [rating|-]\n"
    "  remove <id>\n"
    "  withdraw <id>\n"
    "  reactivate <id>\n"
    "  rounds <n>\n"
    "  tiebreaks <id,id,...>\n"
    "  pair\n"
    "  record <round> <result> [result ...]   (1-0, 0-1, 1/2-1/2, bye)\n"
    "  undo\n"
    "  standings\n"
    "  crosstable\n"
    "  pairings [round]\n"
    "  status\n";

int ReportError(const Error& error) {
    std::cerr << "[swissdesk] " << swissdesk::core::util::ErrorKindToString(error.kind) << ": "
              << error.message << '\n';
    return 1;
}

bool LoadTournament(const std::string& path, Tournament& out, Error* error) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Fail(error, ErrorKind::Io, "Failed to open tournament: " + path);
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return swissdesk::core::persist::FromJsonString(buffer.str(), out, error);
}

bool SaveTournament(const std::string& path, const Tournament& t, Error* error) {
    if (!swissdesk::core::util::AtomicFileWriter::Write(path, swissdesk::core::persist::ToJsonString(t))) {
        return Fail(error, ErrorKind::Io, "Failed to write tournament: " + path);
    }
    return true;
}

bool ParseInt(const std::string& text, const std::string& what, int& value, Error* error) {
    try {
        size_t consumed = 0;
        value = std::stoi(text, &consumed);
        if (consumed != text.size()) {
            return Fail(error, ErrorKind::Validation, "Invalid " + what + ": " + text);
        }
    } catch (const std::exception&) {
        return Fail(error, ErrorKind::Validation, "Invalid " + what + ": " + text);
    }
    return true;
}

bool ParseRating(const std::string& text, std::optional<int>& rating, Error* error) {
    if (text == "-") {
        rating.reset();
        return true;
    }
    int value = 0;
    if (!ParseInt(text, "rating", value, error)) {
        return false;
    }
    rating = value;
    return true;
}

bool ParseTiebreakList(const std::string& text, std::vector<stats::TiebreakCriterion>& order, Error* error) {
    std::vector<stats::TiebreakCriterion> parsed;
    std::istringstream stream(text);
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (item.empty()) {
            continue;
        }
        const auto criterion = stats::TiebreakFromString(item);
        if (!criterion.has_value()) {
            std::string known;
            for (const auto candidate : stats::AllTiebreaks()) {
                known += (known.empty() ? "" : ", ") + stats::TiebreakToString(candidate);
            }
            return Fail(error, ErrorKind::Validation, "Unknown tiebreak '" + item + "' (known: " + known + ").");
        }
        parsed.push_back(*criterion);
    }
    order = std::move(parsed);
    return true;
}

std::string FormatPoints(double points) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << points;
    return out.str();
}

std::string PlayerLabel(const Tournament& t, const std::string& player_id) {
    const auto* player = t.players().Find(player_id);
    if (!player) {
        return player_id;
    }
    std::string label = player->name();
    if (player->details.rating.has_value()) {
        label += " (" + std::to_string(*player->details.rating) + ")";
    }
    return label;
}

void PrintPairings(const Tournament& t, const tournament::Round& round) {
    std::cout << "Round " << round.index << (round.is_recorded ? "" : " (awaiting results)") << '\n';
    if (round.forced_repeat) {
        std::cout << "  WARNING: this round contains a forced repeat pairing." << '\n';
    }
    for (size_t board = 0; board < round.pairings.size(); ++board) {
        const auto& pairing = round.pairings[board];
        std::cout << "  " << std::setw(3) << board + 1 << ". ";
        if (pairing.is_bye()) {
            std::cout << std::left << std::setw(28) << PlayerLabel(t, pairing.player_a_id) << std::right
                      << " bye";
        } else {
            std::cout << std::left << std::setw(28) << PlayerLabel(t, pairing.player_a_id) << " - "
                      << std::setw(28) << PlayerLabel(t, pairing.player_b_id) << std::right;
            if (pairing.repeat) {
                std::cout << " [repeat]";
            }
        }
        if (round.is_recorded) {
            std::cout << "  " << tournament::OutcomeToString(round.results[board]);
        }
        std::cout << '\n';
    }
}

void PrintStandings(const Tournament& t) {
    const auto rows = t.ComputeStandings();
    const auto& order = t.config().tiebreak_order;
    std::cout << t.name() << ": standings after " << t.completed_rounds() << " of " << t.config().num_rounds
              << " rounds" << '\n';
    std::cout << std::setw(4) << "#" << "  " << std::left << std::setw(24) << "Name" << std::right
              << std::setw(7) << "Rating" << std::setw(6) << "Pts";
    for (const auto criterion : order) {
        std::cout << "  " << stats::TiebreakToString(criterion);
    }
    std::cout << "  G/W/D/L/B" << '\n';
    for (const auto& row : rows) {
        std::cout << std::setw(4) << row.rank << "  " << std::left << std::setw(24)
                  << (row.is_active ? row.name : row.name + " (w)") << std::right << std::setw(7)
                  << (row.rating.has_value() ? std::to_string(*row.rating) : std::string("-")) << std::setw(6)
                  << FormatPoints(row.points);
        for (size_t i = 0; i < row.tiebreaks.size(); ++i) {
            const auto width = static_cast<int>(stats::TiebreakToString(order[i]).size());
            std::cout << "  " << std::setw(width) << FormatPoints(row.tiebreaks[i]);
        }
        std::cout << "  " << row.games << '/' << row.wins << '/' << row.draws << '/' << row.losses << '/'
                  << row.byes << '\n';
    }
}

// One cell per round: "+3w" beat the player ranked 3 with White, "=5b" drew
// with Black, "-2w" lost, "+BYE" bye, "--" did not play.
void PrintCrosstable(const Tournament& t) {
    const auto table = t.ComputeCrosstable();
    const int rounds = t.completed_rounds();
    std::cout << std::setw(4) << "#" << "  " << std::left << std::setw(24) << "Name" << std::right;
    for (int r = 1; r <= rounds; ++r) {
        std::cout << std::setw(6) << ("R" + std::to_string(r));
    }
    std::cout << std::setw(6) << "Pts" << '\n';

    for (size_t row = 0; row < table.player_ids.size(); ++row) {
        std::map<int, std::string> cells;
        for (size_t column = 0; column < table.player_ids.size(); ++column) {
            for (const auto& encounter : table.cell(row, column)) {
                const char sign = encounter.points >= 1.0 ? '+' : (encounter.points > 0.0 ? '=' : '-');
                const char color = encounter.color == tournament::Color::White ? 'w' : 'b';
                cells[encounter.round_index] = std::string(1, sign) + std::to_string(column + 1) + color;
            }
        }
        for (const int bye_round : table.bye_rounds[row]) {
            cells[bye_round] = "+BYE";
        }
        std::cout << std::setw(4) << row + 1 << "  " << std::left << std::setw(24) << table.names[row]
                  << std::right;
        for (int r = 1; r <= rounds; ++r) {
            const auto it = cells.find(r);
            std::cout << std::setw(6) << (it == cells.end() ? std::string("--") : it->second);
        }
        std::cout << std::setw(6) << FormatPoints(table.points[row]) << '\n';
    }
}

void PrintStatus(const Tournament& t) {
    std::cout << "Tournament: " << t.name() << '\n';
    std::cout << "Status: " << tournament::StatusToString(t.status()) << '\n';
    std::cout << "Rounds: " << t.completed_rounds() << " recorded, " << t.ledger().size() << " paired, "
              << t.config().num_rounds << " planned" << '\n';
    std::cout << "Players: " << t.players().size() << " (" << t.players().ActivePlayers().size() << " active)"
              << '\n';
    for (const auto& player : t.players().players()) {
        std::cout << "  " << std::left << std::setw(6) << player.id << std::right << PlayerLabel(t, player.id)
                  << (player.is_active ? "" : " [withdrawn]") << '\n';
    }
}

bool RunCommand(Tournament& t,
                const std::string& command,
                const std::vector<std::string>& args,
                bool& modified,
                Error* error) {
    auto need = [&](size_t min_args, size_t max_args) {
        if (args.size() < min_args || args.size() > max_args) {
            return Fail(error, ErrorKind::Validation, "Wrong number of arguments for '" + command + "'.");
        }
        return true;
    };

    if (command == "add") {
        if (!need(1, 2)) {
            return false;
        }
        players::PlayerDetails details;
        details.name = args[0];
        if (args.size() == 2 && !ParseRating(args[1], details.rating, error)) {
            return false;
        }
        std::string id;
        if (!t.AddPlayer(std::move(details), &id, error)) {
            return false;
        }
        std::cout << id << '\n';
        modified = true;
        return true;
    }
    if (command == "edit") {
        if (!need(2, 3)) {
            return false;
        }
        const auto* player = t.players().Find(args[0]);
        if (!player) {
            return Fail(error, ErrorKind::Validation, "Unknown player '" + args[0] + "'.");
        }
        players::PlayerDetails details = player->details;
        details.name = args[1];
        if (args.size() == 3 && !ParseRating(args[2], details.rating, error)) {
            return false;
        }
        modified = t.UpdatePlayer(args[0], std::move(details), error);
        return modified;
    }
    if (command == "remove") {
        if (!need(1, 1)) {
            return false;
        }
        modified = t.RemovePlayer(args[0], error);
        return modified;
    }
    if (command == "withdraw" || command == "reactivate") {
        if (!need(1, 1)) {
            return false;
        }
        modified = t.SetActive(args[0], command == "reactivate", error);
        return modified;
    }
    if (command == "rounds") {
        int rounds = 0;
        if (!need(1, 1) || !ParseInt(args[0], "round count", rounds, error)) {
            return false;
        }
        modified = t.SetNumRounds(rounds, error);
        return modified;
    }
    if (command == "tiebreaks") {
        std::vector<stats::TiebreakCriterion> order;
        if (!need(1, 1) || !ParseTiebreakList(args[0], order, error)) {
            return false;
        }
        modified = t.SetTiebreakOrder(std::move(order), error);
        return modified;
    }
    if (command == "pair") {
        if (!need(0, 0)) {
            return false;
        }
        tournament::Round round;
        if (!t.GenerateNextRound(&round, error)) {
            return false;
        }
        modified = true;
        PrintPairings(t, round);
        return true;
    }
    if (command == "record") {
        int round_index = 0;
        if (args.empty() || !ParseInt(args[0], "round number", round_index, error)) {
            return Fail(error, ErrorKind::Validation, "Usage: record <round> <result> [result ...]");
        }
        std::vector<tournament::Outcome> outcomes;
        for (size_t i = 1; i < args.size(); ++i) {
            const auto outcome = tournament::OutcomeFromString(args[i]);
            if (!outcome.has_value()) {
                return Fail(error, ErrorKind::Validation, "Unknown result '" + args[i] + "'.");
            }
            outcomes.push_back(*outcome);
        }
        if (!t.RecordResults(round_index, outcomes, error)) {
            return false;
        }
        modified = true;
        PrintStandings(t);
        return true;
    }
    if (command == "undo") {
        if (!need(0, 0)) {
            return false;
        }
        modified = t.UndoLast(error);
        return modified;
    }
    if (command == "standings") {
        if (!need(0, 0)) {
            return false;
        }
        PrintStandings(t);
        return true;
    }
    if (command == "crosstable") {
        if (!need(0, 0)) {
            return false;
        }
        PrintCrosstable(t);
        return true;
    }
    if (command == "pairings") {
        if (!need(0, 1)) {
            return false;
        }
        int round_index = t.ledger().size();
        if (args.size() == 1 && !ParseInt(args[0], "round number", round_index, error)) {
            return false;
        }
        const auto* round = t.ledger().Find(round_index);
        if (!round) {
            return Fail(error, ErrorKind::Validation, "No round " + std::to_string(round_index) + " has been paired.");
        }
        PrintPairings(t, *round);
        return true;
    }
    if (command == "status") {
        if (!need(0, 0)) {
            return false;
        }
        PrintStatus(t);
        return true;
    }
    return Fail(error, ErrorKind::Validation, "Unknown command '" + command + "'.\n" + kUsage);
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << kUsage;
        return 1;
    }

    const std::string record_path = argv[1];
    const std::string command = argv[2];
    std::vector<std::string> args;
    for (int i = 3; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }

    auto log_line = [](const std::string& line) { std::cout << "[swissdesk] " << line << '\n'; };

    Error error;
    if (command == "new") {
        if (args.empty() || args.size() > 2) {
            std::cerr << kUsage;
            return 1;
        }
        if (std::filesystem::exists(record_path)) {
            std::cerr << "[swissdesk] Refusing to overwrite existing tournament: " << record_path << '\n';
            return 1;
        }
        TournamentConfig config;
        if (args.size() == 2) {
            std::cout << "[swissdesk] Settings: " << args[1] << '\n';
            if (!TournamentConfig::LoadFromFile(args[1], config, &error)) {
                return ReportError(error);
            }
        }
        Tournament created(args[0], config);
        if (!SaveTournament(record_path, created, &error)) {
            return ReportError(error);
        }
        std::cout << "[swissdesk] Created tournament '" << created.name() << "' (" << config.num_rounds
                  << " rounds) at " << record_path << '\n';
        return 0;
    }

    Tournament t;
    if (!LoadTournament(record_path, t, &error)) {
        return ReportError(error);
    }
    t.set_log_fn(log_line);

    bool modified = false;
    if (!RunCommand(t, command, args, modified, &error)) {
        return ReportError(error);
    }
    if (modified && !SaveTournament(record_path, t, &error)) {
        return ReportError(error);
    }
    return 0;
}
