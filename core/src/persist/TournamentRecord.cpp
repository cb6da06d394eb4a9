#include "swissdesk/core/persist/TournamentRecord.h"

#include <iostream>
#include <optional>
#include <utility>
#include <vector>

namespace swissdesk::core::persist {

namespace {

using tournament::Color;
using tournament::Outcome;
using tournament::Pairing;
using tournament::Round;
using util::ErrorKind;
using util::Fail;

bool DecodeFail(util::Error* error, const std::string& message) {
    return Fail(error, ErrorKind::Decode, message);
}

nlohmann::json OptionalToJson(const std::optional<std::string>& value) {
    if (!value.has_value()) {
        return nullptr;
    }
    return *value;
}

bool ReadOptionalString(const nlohmann::json& node,
                        const char* key,
                        std::optional<std::string>& out,
                        util::Error* error) {
    out.reset();
    if (!node.contains(key) || node.at(key).is_null()) {
        return true;
    }
    if (!node.at(key).is_string()) {
        return DecodeFail(error, std::string("Player field '") + key + "' must be a string or null.");
    }
    out = node.at(key).get<std::string>();
    return true;
}

nlohmann::json PlayerToJson(const players::Player& player) {
    const auto& details = player.details;
    nlohmann::json node;
    node["name"] = details.name;
    node["rating"] = details.rating.has_value() ? nlohmann::json(*details.rating) : nlohmann::json(nullptr);
    node["gender"] = OptionalToJson(details.gender);
    node["dob"] = OptionalToJson(details.dob);
    node["phone"] = OptionalToJson(details.phone);
    node["email"] = OptionalToJson(details.email);
    node["club"] = OptionalToJson(details.club);
    node["federation"] = OptionalToJson(details.federation);
    node["is_active"] = player.is_active;
    return node;
}

bool PlayerFromJson(const std::string& id, const nlohmann::json& node, players::Player& out, util::Error* error) {
    if (!node.is_object()) {
        return DecodeFail(error, "Player '" + id + "' must be an object.");
    }
    if (!node.contains("name") || !node.at("name").is_string()) {
        return DecodeFail(error, "Player '" + id + "' has no name.");
    }
    players::Player player;
    player.id = id;
    player.details.name = node.at("name").get<std::string>();
    if (node.contains("rating") && !node.at("rating").is_null()) {
        int rating = 0;
        if (!api::ParseInt(node.at("rating"), "Rating of player '" + id + "'", rating, error)) {
            return false;
        }
        player.details.rating = rating;
    }
    if (!ReadOptionalString(node, "gender", player.details.gender, error) ||
        !ReadOptionalString(node, "dob", player.details.dob, error) ||
        !ReadOptionalString(node, "phone", player.details.phone, error) ||
        !ReadOptionalString(node, "email", player.details.email, error) ||
        !ReadOptionalString(node, "club", player.details.club, error) ||
        !ReadOptionalString(node, "federation", player.details.federation, error)) {
        return false;
    }
    if (node.contains("is_active")) {
        if (!node.at("is_active").is_boolean()) {
            return DecodeFail(error, "Player '" + id + "' has a non-boolean is_active.");
        }
        player.is_active = node.at("is_active").get<bool>();
    }
    out = std::move(player);
    return true;
}

nlohmann::json RoundToJson(const Round& round) {
    nlohmann::json node;
    node["index"] = round.index;
    node["forced_repeat"] = round.forced_repeat;
    node["pairings"] = nlohmann::json::array();
    for (const auto& pairing : round.pairings) {
        node["pairings"].push_back({
            {"player_a", pairing.player_a_id},
            {"player_b", pairing.is_bye() ? nlohmann::json(nullptr) : nlohmann::json(pairing.player_b_id)},
            {"color_a", tournament::ColorToString(pairing.color_a)},
            {"color_b", tournament::ColorToString(pairing.color_b)},
            {"repeat", pairing.repeat},
        });
    }
    if (round.is_recorded) {
        node["results"] = nlohmann::json::array();
        for (const auto outcome : round.results) {
            node["results"].push_back(tournament::OutcomeToString(outcome));
        }
    }
    return node;
}

bool ReadColor(const nlohmann::json& node, const char* key, Color& out, util::Error* error) {
    out = Color::None;
    if (!node.contains(key)) {
        return true;
    }
    if (!node.at(key).is_string()) {
        return DecodeFail(error, std::string("Pairing field '") + key + "' must be a string.");
    }
    const auto color = tournament::ColorFromString(node.at(key).get<std::string>());
    if (!color.has_value()) {
        return DecodeFail(error, "Unknown color '" + node.at(key).get<std::string>() + "'.");
    }
    out = *color;
    return true;
}

bool PairingFromJson(const nlohmann::json& node, Pairing& out, util::Error* error) {
    if (!node.is_object()) {
        return DecodeFail(error, "Pairing must be an object.");
    }
    if (!node.contains("player_a") || !node.at("player_a").is_string()) {
        return DecodeFail(error, "Pairing has no player_a.");
    }
    Pairing pairing;
    pairing.player_a_id = node.at("player_a").get<std::string>();
    if (node.contains("player_b") && !node.at("player_b").is_null()) {
        if (!node.at("player_b").is_string() || node.at("player_b").get<std::string>().empty()) {
            return DecodeFail(error, "Pairing player_b must be a player id or null.");
        }
        pairing.player_b_id = node.at("player_b").get<std::string>();
    }
    if (!ReadColor(node, "color_a", pairing.color_a, error) || !ReadColor(node, "color_b", pairing.color_b, error)) {
        return false;
    }
    if (node.contains("repeat")) {
        if (!node.at("repeat").is_boolean()) {
            return DecodeFail(error, "Pairing repeat must be a boolean.");
        }
        pairing.repeat = node.at("repeat").get<bool>();
    }
    out = std::move(pairing);
    return true;
}

bool RoundFromJson(const nlohmann::json& node, int position, Round& out, util::Error* error) {
    const std::string label = "Round " + std::to_string(position);
    if (!node.is_object()) {
        return DecodeFail(error, label + " must be an object.");
    }
    Round round;
    round.index = position;
    if (node.contains("index")) {
        if (!api::ParseInt(node.at("index"), label + " index", round.index, error)) {
            return false;
        }
    }
    if (node.contains("forced_repeat")) {
        if (!node.at("forced_repeat").is_boolean()) {
            return DecodeFail(error, label + " has a non-boolean forced_repeat.");
        }
        round.forced_repeat = node.at("forced_repeat").get<bool>();
    }
    if (!node.contains("pairings") || !node.at("pairings").is_array()) {
        return DecodeFail(error, label + " has no pairings array.");
    }
    for (const auto& pairing_node : node.at("pairings")) {
        Pairing pairing;
        if (!PairingFromJson(pairing_node, pairing, error)) {
            return false;
        }
        round.pairings.push_back(std::move(pairing));
    }
    if (node.contains("results") && !node.at("results").is_null()) {
        if (!node.at("results").is_array()) {
            return DecodeFail(error, label + " results must be an array.");
        }
        for (const auto& result_node : node.at("results")) {
            if (!result_node.is_string()) {
                return DecodeFail(error, label + " results must be strings.");
            }
            const auto outcome = tournament::OutcomeFromString(result_node.get<std::string>());
            if (!outcome.has_value()) {
                return DecodeFail(error, label + " has unknown result '" + result_node.get<std::string>() + "'.");
            }
            round.results.push_back(*outcome);
        }
        round.is_recorded = true;
    }
    out = std::move(round);
    return true;
}

}  // namespace

nlohmann::json ToRecord(const tournament::Tournament& tournament) {
    const auto& config = tournament.config();
    nlohmann::json root;
    root["name"] = tournament.name();
    root["num_rounds"] = config.num_rounds;
    root["tiebreak_order"] = api::TiebreakOrderToJson(config.tiebreak_order);
    root["bye_points"] = config.bye_points;

    root["players"] = nlohmann::json::object();
    root["player_order"] = nlohmann::json::array();
    for (const auto& player : tournament.players().players()) {
        root["players"][player.id] = PlayerToJson(player);
        root["player_order"].push_back(player.id);
    }

    root["rounds"] = nlohmann::json::array();
    for (const auto& round : tournament.ledger().rounds()) {
        root["rounds"].push_back(RoundToJson(round));
    }
    return root;
}

bool FromRecord(const nlohmann::json& root, tournament::Tournament& out, util::Error* error) {
    if (!root.is_object()) {
        return DecodeFail(error, "Tournament record must be a JSON object.");
    }
    if (!root.contains("name") || !root.at("name").is_string()) {
        return DecodeFail(error, "Tournament record has no name.");
    }
    if (!root.contains("num_rounds")) {
        return DecodeFail(error, "Tournament record has no num_rounds.");
    }
    if (!root.contains("tiebreak_order")) {
        return DecodeFail(error, "Tournament record has no tiebreak_order.");
    }
    if (!root.contains("players") || !root.at("players").is_object()) {
        return DecodeFail(error, "Tournament record has no players object.");
    }
    if (!root.contains("rounds") || !root.at("rounds").is_array()) {
        return DecodeFail(error, "Tournament record has no rounds array.");
    }

    api::TournamentConfig config;
    if (!api::ParseInt(root.at("num_rounds"), "num_rounds", config.num_rounds, error)) {
        return false;
    }
    if (!api::ParseTiebreakOrder(root.at("tiebreak_order"), config.tiebreak_order, error)) {
        return false;
    }
    if (root.contains("bye_points")) {
        if (!root.at("bye_points").is_number()) {
            return DecodeFail(error, "bye_points must be a number.");
        }
        config.bye_points = root.at("bye_points").get<double>();
    }

    const auto& players_node = root.at("players");
    std::vector<std::string> order;
    if (root.contains("player_order")) {
        const auto& order_node = root.at("player_order");
        if (!order_node.is_array() || order_node.size() != players_node.size()) {
            return DecodeFail(error, "player_order must list every player exactly once.");
        }
        for (const auto& id_node : order_node) {
            if (!id_node.is_string() || !players_node.contains(id_node.get<std::string>())) {
                return DecodeFail(error, "player_order references an unknown player.");
            }
            order.push_back(id_node.get<std::string>());
        }
    } else {
        for (const auto& item : players_node.items()) {
            order.push_back(item.key());
        }
    }

    players::PlayerRegistry registry;
    for (const auto& id : order) {
        players::Player player;
        if (!PlayerFromJson(id, players_node.at(id), player, error)) {
            return false;
        }
        util::Error invalid;
        if (!registry.Insert(std::move(player), &invalid)) {
            return DecodeFail(error, invalid.message);
        }
    }

    std::vector<Round> rounds;
    int position = 1;
    for (const auto& round_node : root.at("rounds")) {
        Round round;
        if (!RoundFromJson(round_node, position, round, error)) {
            return false;
        }
        rounds.push_back(std::move(round));
        ++position;
    }
    tournament::RoundLedger ledger;
    if (!ledger.Load(std::move(rounds), error)) {
        return false;
    }

    return tournament::Tournament::Restore(root.at("name").get<std::string>(),
                                           std::move(config),
                                           std::move(registry),
                                           std::move(ledger),
                                           out,
                                           error);
}

std::string ToJsonString(const tournament::Tournament& tournament, int indent) {
    return ToRecord(tournament).dump(indent);
}

bool FromJsonString(const std::string& text, tournament::Tournament& out, util::Error* error) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& ex) {
        std::cerr << "[record] Failed to parse tournament record: " << ex.what() << '\n';
        return DecodeFail(error, std::string("Failed to parse tournament record: ") + ex.what());
    }
    if (!FromRecord(root, out, error)) {
        std::cerr << "[record] Rejected tournament record" << (error ? ": " + error->message : std::string(".")) << '\n';
        return false;
    }
    return true;
}

}  // namespace swissdesk::core::persist
