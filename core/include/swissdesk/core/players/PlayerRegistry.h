#pragma once

#include "swissdesk/core/players/Player.h"
#include "swissdesk/core/util/Error.h"

#include <string>
#include <unordered_map>
#include <vector>

namespace swissdesk::core::players {

// Arena of players keyed by opaque id. Rounds refer to players by id only.
class PlayerRegistry {
public:
    bool Add(PlayerDetails details, std::string* id_out, util::Error* error);
    bool Update(const std::string& id, PlayerDetails details, util::Error* error);
    bool Remove(const std::string& id, util::Error* error);
    bool SetActive(const std::string& id, bool active, util::Error* error);

    // Inserts a player with a caller-provided id (record loading).
    bool Insert(Player player, util::Error* error);

    const Player* Find(const std::string& id) const;
    bool Contains(const std::string& id) const { return Find(id) != nullptr; }

    // Players in insertion order.
    const std::vector<Player>& players() const { return players_; }
    std::vector<const Player*> ActivePlayers() const;
    size_t size() const { return players_.size(); }
    bool empty() const { return players_.empty(); }

private:
    bool ValidateDetails(PlayerDetails& details, const std::string& self_id, util::Error* error) const;
    std::string NextId();
    void Reindex();

    std::vector<Player> players_;
    std::unordered_map<std::string, size_t> index_;
    int next_sequence_ = 1;
};

}  // namespace swissdesk::core::players
