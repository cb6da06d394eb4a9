#pragma once

#include <optional>
#include <string>
#include <vector>

namespace swissdesk::core::tournament {

enum class Color {
    None,
    White,
    Black
};

// Result of one board, read from player A's side.
enum class Outcome {
    PlayerAWin,
    PlayerBWin,
    Draw,
    Bye
};

struct Pairing {
    std::string player_a_id;
    std::string player_b_id;  // empty for a bye
    Color color_a = Color::None;
    Color color_b = Color::None;
    bool repeat = false;

    bool is_bye() const { return player_b_id.empty(); }
    bool involves(const std::string& player_id) const {
        return player_a_id == player_id || (!is_bye() && player_b_id == player_id);
    }
    bool operator==(const Pairing& other) const;
};

struct Round {
    int index = 0;
    std::vector<Pairing> pairings;
    std::vector<Outcome> results;  // parallel to |pairings| once recorded
    bool is_recorded = false;
    bool forced_repeat = false;

    std::optional<std::string> bye_player_id() const;
    bool operator==(const Round& other) const;
};

std::string ColorToString(Color color);
std::optional<Color> ColorFromString(const std::string& value);
Color OppositeColor(Color color);

std::string OutcomeToString(Outcome outcome);
std::optional<Outcome> OutcomeFromString(const std::string& value);

// Points earned by |player_id| on a recorded board.
double PointsFor(const Pairing& pairing, Outcome outcome, const std::string& player_id, double bye_points);

}  // namespace swissdesk::core::tournament
