#include "swissdesk/core/tournament/TournamentTypes.h"

namespace swissdesk::core::tournament {

bool Pairing::operator==(const Pairing& other) const {
    return player_a_id == other.player_a_id && player_b_id == other.player_b_id &&
           color_a == other.color_a && color_b == other.color_b && repeat == other.repeat;
}

std::optional<std::string> Round::bye_player_id() const {
    for (const auto& pairing : pairings) {
        if (pairing.is_bye()) {
            return pairing.player_a_id;
        }
    }
    return std::nullopt;
}

bool Round::operator==(const Round& other) const {
    return index == other.index && pairings == other.pairings && results == other.results &&
           is_recorded == other.is_recorded && forced_repeat == other.forced_repeat;
}

std::string ColorToString(Color color) {
    switch (color) {
        case Color::White:
            return "white";
        case Color::Black:
            return "black";
        case Color::None:
            break;
    }
    return "none";
}

std::optional<Color> ColorFromString(const std::string& value) {
    if (value == "white") {
        return Color::White;
    }
    if (value == "black") {
        return Color::Black;
    }
    if (value == "none") {
        return Color::None;
    }
    return std::nullopt;
}

Color OppositeColor(Color color) {
    if (color == Color::White) {
        return Color::Black;
    }
    if (color == Color::Black) {
        return Color::White;
    }
    return Color::None;
}

std::string OutcomeToString(Outcome outcome) {
    switch (outcome) {
        case Outcome::PlayerAWin:
            return "1-0";
        case Outcome::PlayerBWin:
            return "0-1";
        case Outcome::Draw:
            return "1/2-1/2";
        case Outcome::Bye:
            return "bye";
    }
    return "*";
}

std::optional<Outcome> OutcomeFromString(const std::string& value) {
    if (value == "1-0") {
        return Outcome::PlayerAWin;
    }
    if (value == "0-1") {
        return Outcome::PlayerBWin;
    }
    if (value == "1/2-1/2" || value == "=") {
        return Outcome::Draw;
    }
    if (value == "bye") {
        return Outcome::Bye;
    }
    return std::nullopt;
}

double PointsFor(const Pairing& pairing, Outcome outcome, const std::string& player_id, double bye_points) {
    if (pairing.is_bye()) {
        return pairing.player_a_id == player_id ? bye_points : 0.0;
    }
    const bool is_a = pairing.player_a_id == player_id;
    const bool is_b = pairing.player_b_id == player_id;
    if (!is_a && !is_b) {
        return 0.0;
    }
    switch (outcome) {
        case Outcome::PlayerAWin:
            return is_a ? 1.0 : 0.0;
        case Outcome::PlayerBWin:
            return is_b ? 1.0 : 0.0;
        case Outcome::Draw:
            return 0.5;
        case Outcome::Bye:
            break;
    }
    return 0.0;
}

}  // namespace swissdesk::core::tournament
