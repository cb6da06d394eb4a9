#include "swissdesk/core/api/TournamentConfig.h"

#include "swissdesk/core/util/AtomicFileWriter.h"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <limits>

namespace swissdesk::core::api {

namespace {

using util::ErrorKind;
using util::Fail;

bool LoadJson(const std::string& path, nlohmann::json& root, util::Error* error) {
    std::ifstream input(path);
    if (!input) {
        return Fail(error, ErrorKind::Io, "Failed to open settings: " + path);
    }
    try {
        input >> root;
    } catch (const std::exception& ex) {
        return Fail(error, ErrorKind::Decode, std::string("Failed to parse JSON: ") + ex.what());
    }
    return true;
}

}  // namespace

bool ParseInt(const nlohmann::json& node, const std::string& what, int& value, util::Error* error) {
    if (!node.is_number_integer()) {
        return Fail(error, ErrorKind::Decode, what + " must be an integer.");
    }
    constexpr auto kMin = static_cast<std::int64_t>(std::numeric_limits<int>::min());
    constexpr auto kMax = static_cast<std::int64_t>(std::numeric_limits<int>::max());
    if (node.is_number_unsigned()) {
        const auto raw = node.get<std::uint64_t>();
        if (raw > static_cast<std::uint64_t>(kMax)) {
            return Fail(error, ErrorKind::Decode, what + " is out of range.");
        }
        value = static_cast<int>(raw);
        return true;
    }
    const auto raw = node.get<std::int64_t>();
    if (raw < kMin || raw > kMax) {
        return Fail(error, ErrorKind::Decode, what + " is out of range.");
    }
    value = static_cast<int>(raw);
    return true;
}

bool ParseTiebreakOrder(const nlohmann::json& node,
                        std::vector<stats::TiebreakCriterion>& order,
                        util::Error* error) {
    if (!node.is_array()) {
        return Fail(error, ErrorKind::Decode, "tiebreak_order must be an array.");
    }
    std::vector<stats::TiebreakCriterion> parsed;
    for (const auto& item : node) {
        if (!item.is_string()) {
            return Fail(error, ErrorKind::Decode, "tiebreak_order entries must be strings.");
        }
        const auto criterion = stats::TiebreakFromString(item.get<std::string>());
        if (!criterion.has_value()) {
            return Fail(error, ErrorKind::Decode, "Unknown tiebreak '" + item.get<std::string>() + "'.");
        }
        parsed.push_back(*criterion);
    }
    order = std::move(parsed);
    return true;
}

nlohmann::json TiebreakOrderToJson(const std::vector<stats::TiebreakCriterion>& order) {
    nlohmann::json node = nlohmann::json::array();
    for (const auto criterion : order) {
        node.push_back(stats::TiebreakToString(criterion));
    }
    return node;
}

bool TournamentConfig::Validate(util::Error* error) const {
    if (num_rounds < 1) {
        return Fail(error, ErrorKind::Validation, "Number of rounds must be positive.");
    }
    if (!(bye_points > 0.0 && bye_points <= 1.0)) {
        return Fail(error, ErrorKind::Validation, "Bye points must be in (0, 1].");
    }
    for (size_t i = 0; i < tiebreak_order.size(); ++i) {
        if (std::find(tiebreak_order.begin(), tiebreak_order.begin() + static_cast<std::ptrdiff_t>(i),
                      tiebreak_order[i]) != tiebreak_order.begin() + static_cast<std::ptrdiff_t>(i)) {
            return Fail(error, ErrorKind::Validation,
                        "Tiebreak '" + stats::TiebreakToString(tiebreak_order[i]) + "' is listed twice.");
        }
    }
    return true;
}

bool TournamentConfig::FromJson(const nlohmann::json& root, TournamentConfig& config, util::Error* error) {
    if (!root.is_object()) {
        return Fail(error, ErrorKind::Decode, "Settings must be a JSON object.");
    }
    TournamentConfig parsed;
    if (root.contains("num_rounds") && !ParseInt(root.at("num_rounds"), "num_rounds", parsed.num_rounds, error)) {
        return false;
    }
    try {
        parsed.bye_points = root.value("bye_points", parsed.bye_points);
    } catch (const nlohmann::json::exception& ex) {
        return Fail(error, ErrorKind::Decode, std::string("Invalid settings value: ") + ex.what());
    }
    if (root.contains("tiebreak_order") && !ParseTiebreakOrder(root.at("tiebreak_order"), parsed.tiebreak_order, error)) {
        return false;
    }
    util::Error invalid;
    if (!parsed.Validate(&invalid)) {
        return Fail(error, ErrorKind::Decode, invalid.message);
    }
    config = std::move(parsed);
    return true;
}

nlohmann::json TournamentConfig::ToJson(const TournamentConfig& config) {
    nlohmann::json root;
    root["num_rounds"] = config.num_rounds;
    root["tiebreak_order"] = TiebreakOrderToJson(config.tiebreak_order);
    root["bye_points"] = config.bye_points;
    return root;
}

bool TournamentConfig::LoadFromFile(const std::string& path, TournamentConfig& config, util::Error* error) {
    nlohmann::json root;
    if (!LoadJson(path, root, error)) {
        return false;
    }
    return FromJson(root, config, error);
}

bool TournamentConfig::SaveToFile(const std::string& path, const TournamentConfig& config, util::Error* error) {
    if (!util::AtomicFileWriter::Write(path, ToJson(config).dump(2))) {
        return Fail(error, ErrorKind::Io, "Failed to write settings: " + path);
    }
    return true;
}

}  // namespace swissdesk::core::api
