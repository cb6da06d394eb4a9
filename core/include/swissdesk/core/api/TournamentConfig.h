#pragma once

#include "swissdesk/core/stats/Tiebreaks.h"
#include "swissdesk/core/util/Error.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace swissdesk::core::api {

struct TournamentConfig {
    int num_rounds = 3;
    std::vector<stats::TiebreakCriterion> tiebreak_order = stats::DefaultTiebreakOrder();
    double bye_points = 1.0;

    bool Validate(util::Error* error) const;

    // Missing keys keep their defaults; unknown tiebreak names are rejected.
    static bool FromJson(const nlohmann::json& root, TournamentConfig& config, util::Error* error);
    static nlohmann::json ToJson(const TournamentConfig& config);

    static bool LoadFromFile(const std::string& path, TournamentConfig& config, util::Error* error);
    static bool SaveToFile(const std::string& path, const TournamentConfig& config, util::Error* error);
};

// Reads an integer that fits in an int; anything else is a Decode error.
bool ParseInt(const nlohmann::json& node, const std::string& what, int& value, util::Error* error);

bool ParseTiebreakOrder(const nlohmann::json& node,
                        std::vector<stats::TiebreakCriterion>& order,
                        util::Error* error);
nlohmann::json TiebreakOrderToJson(const std::vector<stats::TiebreakCriterion>& order);

}  // namespace swissdesk::core::api
