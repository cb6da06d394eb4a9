#pragma once

#include <optional>
#include <string>

namespace swissdesk::core::players {

constexpr int kMinRating = 0;
constexpr int kMaxRating = 4000;

// Editable attributes of a competitor. Everything except |name| is optional.
struct PlayerDetails {
    std::string name;
    std::optional<int> rating;
    std::optional<std::string> gender;
    std::optional<std::string> dob;
    std::optional<std::string> phone;
    std::optional<std::string> email;
    std::optional<std::string> club;
    std::optional<std::string> federation;
};

struct Player {
    std::string id;
    PlayerDetails details;
    bool is_active = true;

    const std::string& name() const { return details.name; }
};

}  // namespace swissdesk::core::players
