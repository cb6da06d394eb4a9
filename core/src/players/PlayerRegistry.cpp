#include "swissdesk/core/players/PlayerRegistry.h"

#include <algorithm>
#include <cctype>

namespace swissdesk::core::players {

namespace {

using util::ErrorKind;
using util::Fail;

std::string Trim(const std::string& value) {
    size_t begin = 0;
    size_t end = value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(value[begin])) != 0) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1])) != 0) {
        --end;
    }
    return value.substr(begin, end - begin);
}

// Numeric suffix of generated ids ("p12" -> 12), or 0 for foreign ids.
int SequenceOf(const std::string& id) {
    if (id.size() < 2 || id[0] != 'p') {
        return 0;
    }
    int value = 0;
    for (size_t i = 1; i < id.size(); ++i) {
        if (std::isdigit(static_cast<unsigned char>(id[i])) == 0 || value > 100000000) {
            return 0;
        }
        value = value * 10 + (id[i] - '0');
    }
    return value;
}

}  // namespace

bool PlayerRegistry::ValidateDetails(PlayerDetails& details,
                                     const std::string& self_id,
                                     util::Error* error) const {
    details.name = Trim(details.name);
    if (details.name.empty()) {
        return Fail(error, ErrorKind::Validation, "Player name cannot be empty.");
    }
    if (details.rating.has_value() &&
        (*details.rating < kMinRating || *details.rating > kMaxRating)) {
        return Fail(error, ErrorKind::Validation,
                    "Rating " + std::to_string(*details.rating) + " for '" + details.name +
                        "' is outside " + std::to_string(kMinRating) + ".." +
                        std::to_string(kMaxRating) + ".");
    }
    for (const auto& player : players_) {
        if (player.id != self_id && player.name() == details.name) {
            return Fail(error, ErrorKind::Validation,
                        "Player '" + details.name + "' already exists.");
        }
    }
    return true;
}

std::string PlayerRegistry::NextId() {
    std::string id;
    do {
        id = "p" + std::to_string(next_sequence_++);
    } while (index_.count(id) > 0);
    return id;
}

void PlayerRegistry::Reindex() {
    index_.clear();
    for (size_t i = 0; i < players_.size(); ++i) {
        index_[players_[i].id] = i;
    }
}

bool PlayerRegistry::Add(PlayerDetails details, std::string* id_out, util::Error* error) {
    if (!ValidateDetails(details, std::string(), error)) {
        return false;
    }
    Player player;
    player.id = NextId();
    player.details = std::move(details);
    player.is_active = true;
    index_[player.id] = players_.size();
    if (id_out) {
        *id_out = player.id;
    }
    players_.push_back(std::move(player));
    return true;
}

bool PlayerRegistry::Insert(Player player, util::Error* error) {
    if (player.id.empty()) {
        return Fail(error, ErrorKind::Validation, "Player id cannot be empty.");
    }
    if (index_.count(player.id) > 0) {
        return Fail(error, ErrorKind::Validation, "Duplicate player id '" + player.id + "'.");
    }
    if (!ValidateDetails(player.details, player.id, error)) {
        return false;
    }
    next_sequence_ = std::max(next_sequence_, SequenceOf(player.id) + 1);
    index_[player.id] = players_.size();
    players_.push_back(std::move(player));
    return true;
}

bool PlayerRegistry::Update(const std::string& id, PlayerDetails details, util::Error* error) {
    const auto it = index_.find(id);
    if (it == index_.end()) {
        return Fail(error, ErrorKind::Validation, "Unknown player id '" + id + "'.");
    }
    if (!ValidateDetails(details, id, error)) {
        return false;
    }
    players_[it->second].details = std::move(details);
    return true;
}

bool PlayerRegistry::Remove(const std::string& id, util::Error* error) {
    const auto it = index_.find(id);
    if (it == index_.end()) {
        return Fail(error, ErrorKind::Validation, "Unknown player id '" + id + "'.");
    }
    players_.erase(players_.begin() + static_cast<std::ptrdiff_t>(it->second));
    Reindex();
    return true;
}

bool PlayerRegistry::SetActive(const std::string& id, bool active, util::Error* error) {
    const auto it = index_.find(id);
    if (it == index_.end()) {
        return Fail(error, ErrorKind::Validation, "Unknown player id '" + id + "'.");
    }
    players_[it->second].is_active = active;
    return true;
}

const Player* PlayerRegistry::Find(const std::string& id) const {
    const auto it = index_.find(id);
    if (it == index_.end()) {
        return nullptr;
    }
    return &players_[it->second];
}

std::vector<const Player*> PlayerRegistry::ActivePlayers() const {
    std::vector<const Player*> active;
    for (const auto& player : players_) {
        if (player.is_active) {
            active.push_back(&player);
        }
    }
    return active;
}

}  // namespace swissdesk::core::players
