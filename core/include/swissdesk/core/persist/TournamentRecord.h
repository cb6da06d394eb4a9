#pragma once

#include "swissdesk/core/tournament/Tournament.h"
#include "swissdesk/core/util/Error.h"

#include <nlohmann/json.hpp>

#include <string>

namespace swissdesk::core::persist {

// Canonical record of a whole tournament: name, configuration, every player
// (inactive ones included) and the full round ledger.
nlohmann::json ToRecord(const tournament::Tournament& tournament);

// Validates the record's shape and rebuilds the tournament. On failure |out|
// is left untouched and |error| carries a Decode error.
bool FromRecord(const nlohmann::json& root, tournament::Tournament& out, util::Error* error);

std::string ToJsonString(const tournament::Tournament& tournament, int indent = 2);
bool FromJsonString(const std::string& text, tournament::Tournament& out, util::Error* error);

}  // namespace swissdesk::core::persist
