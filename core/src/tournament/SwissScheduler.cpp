#include "swissdesk/core/tournament/SwissScheduler.h"

#include <algorithm>
#include <limits>
#include <unordered_map>
#include <utility>

namespace swissdesk::core::tournament {

namespace {

struct ColorState {
    int whites = 0;
    int blacks = 0;
    Color last = Color::None;
    Color before_last = Color::None;
};

ColorState ColorStateOf(const SwissPlayerState& player) {
    ColorState state;
    for (const Color color : player.colors) {
        if (color == Color::White) {
            state.whites += 1;
        } else if (color == Color::Black) {
            state.blacks += 1;
        }
        state.before_last = state.last;
        state.last = color;
    }
    return state;
}

bool ThirdInRow(const ColorState& state, Color color) {
    return state.last == color && state.before_last == color;
}

int ColorPenalty(const ColorState& state, Color color) {
    int penalty = 0;
    if (ThirdInRow(state, color)) {
        penalty += 1000;
    }
    const int balance = state.whites - state.blacks + (color == Color::White ? 1 : -1);
    penalty += 10 * balance * balance;
    if (state.last == color) {
        penalty += 1;
    }
    return penalty;
}

Color DueColor(const ColorState& state) {
    const int balance = state.whites - state.blacks;
    if (balance > 0) {
        return Color::Black;
    }
    if (balance < 0) {
        return Color::White;
    }
    return OppositeColor(state.last);
}

// True when every color assignment hands one of the two players a third
// consecutive identical color.
bool ColorConflict(const ColorState& a, const ColorState& b) {
    const bool a_white_blocked = ThirdInRow(a, Color::White) || ThirdInRow(b, Color::Black);
    const bool a_black_blocked = ThirdInRow(a, Color::Black) || ThirdInRow(b, Color::White);
    return a_white_blocked && a_black_blocked;
}

class PairingSearch {
public:
    PairingSearch(const std::vector<double>& scores,
                  const std::vector<std::vector<bool>>& met,
                  const std::vector<ColorState>& colors,
                  bool allow_repeats,
                  long budget)
        : scores_(scores), met_(met), colors_(colors), allow_repeats_(allow_repeats), budget_(budget) {}

    bool Run(const std::vector<int>& seeded, std::vector<std::pair<int, int>>* pairs) {
        seeded_ = &seeded;
        pairs_.clear();
        if (!PairGroups(0, {})) {
            return false;
        }
        *pairs = pairs_;
        return true;
    }

    bool exhausted() const { return exhausted_; }

private:
    bool PairGroups(size_t begin, std::vector<int> carried) {
        const auto& seeded = *seeded_;
        if (begin == seeded.size() && carried.empty()) {
            return true;
        }

        std::vector<int> bracket = std::move(carried);
        size_t end = begin;
        if (begin < seeded.size()) {
            const double group_score = scores_[static_cast<size_t>(seeded[begin])];
            while (end < seeded.size() && scores_[static_cast<size_t>(seeded[end])] == group_score) {
                bracket.push_back(seeded[end]);
                ++end;
            }
        }

        const bool is_last = end == seeded.size();
        if (is_last && bracket.size() % 2 == 1) {
            return false;
        }
        const int min_floats = is_last ? 0 : static_cast<int>(bracket.size() % 2);
        const int max_floats = is_last ? 0 : static_cast<int>(bracket.size());
        for (int floats = min_floats; floats <= max_floats; floats += 2) {
            std::vector<bool> used(bracket.size(), false);
            std::vector<int> floaters;
            if (PairBracket(bracket, used, floats, floaters, end)) {
                return true;
            }
            if (exhausted_) {
                return false;
            }
        }
        return false;
    }

    bool PairBracket(const std::vector<int>& bracket,
                     std::vector<bool>& used,
                     int floats_left,
                     std::vector<int>& floaters,
                     size_t rest_begin) {
        std::vector<size_t> open;
        for (size_t i = 0; i < bracket.size(); ++i) {
            if (!used[i]) {
                open.push_back(i);
            }
        }
        if (open.empty()) {
            return floats_left == 0 && PairGroups(rest_begin, floaters);
        }
        if (static_cast<size_t>(floats_left) > open.size()) {
            return false;
        }
        if (++nodes_ > budget_) {
            exhausted_ = true;
            return false;
        }

        const size_t top = open.front();
        const int a = bracket[top];
        for (const size_t slot : Candidates(bracket, open)) {
            const int b = bracket[slot];
            used[top] = true;
            used[slot] = true;
            pairs_.emplace_back(a, b);
            if (PairBracket(bracket, used, floats_left, floaters, rest_begin)) {
                return true;
            }
            pairs_.pop_back();
            used[top] = false;
            used[slot] = false;
            if (exhausted_) {
                return false;
            }
        }

        if (floats_left > 0) {
            used[top] = true;
            floaters.push_back(a);
            if (PairBracket(bracket, used, floats_left - 1, floaters, rest_begin)) {
                return true;
            }
            floaters.pop_back();
            used[top] = false;
        }
        return false;
    }

    // Fold order over the still open slots: the natural partner half-way
    // down, the rest of the bottom half moving away from it, then the top
    // half from the bottom up.
    std::vector<size_t> Candidates(const std::vector<int>& bracket, const std::vector<size_t>& open) const {
        const size_t half = open.size() / 2;
        std::vector<size_t> order;
        order.reserve(open.size());
        for (size_t i = std::max<size_t>(half, 1); i < open.size(); ++i) {
            order.push_back(open[i]);
        }
        for (size_t i = half; i-- > 1;) {
            order.push_back(open[i]);
        }

        const int a = bracket[open.front()];
        std::vector<std::pair<int, size_t>> keyed;
        keyed.reserve(order.size());
        for (const size_t slot : order) {
            const int b = bracket[slot];
            const bool met = met_[static_cast<size_t>(a)][static_cast<size_t>(b)];
            if (met && !allow_repeats_) {
                continue;
            }
            const bool conflict = ColorConflict(colors_[static_cast<size_t>(a)], colors_[static_cast<size_t>(b)]);
            keyed.emplace_back((met ? 2 : 0) + (conflict ? 1 : 0), slot);
        }
        std::stable_sort(keyed.begin(), keyed.end(), [](const auto& lhs, const auto& rhs) {
            return lhs.first < rhs.first;
        });

        std::vector<size_t> candidates;
        candidates.reserve(keyed.size());
        for (const auto& entry : keyed) {
            candidates.push_back(entry.second);
        }
        return candidates;
    }

    const std::vector<double>& scores_;
    const std::vector<std::vector<bool>>& met_;
    const std::vector<ColorState>& colors_;
    const bool allow_repeats_;
    const long budget_;
    const std::vector<int>* seeded_ = nullptr;
    std::vector<std::pair<int, int>> pairs_;
    long nodes_ = 0;
    bool exhausted_ = false;
};

std::pair<int, int> ChooseColors(int a,
                                 int b,
                                 int board,
                                 const std::vector<int>& rank,
                                 const std::vector<ColorState>& colors) {
    const auto& a_state = colors[static_cast<size_t>(a)];
    const auto& b_state = colors[static_cast<size_t>(b)];
    const int option1 = ColorPenalty(a_state, Color::White) + ColorPenalty(b_state, Color::Black);
    const int option2 = ColorPenalty(a_state, Color::Black) + ColorPenalty(b_state, Color::White);

    if (option1 < option2) {
        return {a, b};
    }
    if (option2 < option1) {
        return {b, a};
    }

    const bool a_higher = rank[static_cast<size_t>(a)] < rank[static_cast<size_t>(b)];
    const int higher = a_higher ? a : b;
    const int lower = a_higher ? b : a;
    Color due = DueColor(colors[static_cast<size_t>(higher)]);
    if (due == Color::None) {
        due = OppositeColor(DueColor(colors[static_cast<size_t>(lower)]));
    }
    if (due == Color::None) {
        due = board % 2 == 1 ? Color::White : Color::Black;
    }
    if (due == Color::White) {
        return {higher, lower};
    }
    return {lower, higher};
}

}  // namespace

SwissScheduler::SwissScheduler(long search_budget) : search_budget_(search_budget) {}

SwissContext SwissScheduler::BuildContext(const players::PlayerRegistry& registry,
                                          const RoundLedger& ledger,
                                          double bye_points) {
    SwissContext context;
    context.round_index = ledger.size() + 1;

    std::unordered_map<std::string, size_t> slot;
    for (const auto* player : registry.ActivePlayers()) {
        SwissPlayerState state;
        state.id = player->id;
        state.name = player->name();
        state.rating = player->details.rating;
        slot[player->id] = context.players.size();
        context.players.push_back(std::move(state));
    }

    for (const auto& round : ledger.rounds()) {
        for (size_t board = 0; board < round.pairings.size(); ++board) {
            const auto& pairing = round.pairings[board];
            const auto a = slot.find(pairing.player_a_id);
            if (pairing.is_bye()) {
                if (a != slot.end()) {
                    auto& state = context.players[a->second];
                    state.had_bye = true;
                    if (round.is_recorded) {
                        state.score += bye_points;
                    }
                }
                continue;
            }
            const auto b = slot.find(pairing.player_b_id);
            if (a != slot.end()) {
                auto& state = context.players[a->second];
                state.opponents.insert(pairing.player_b_id);
                state.colors.push_back(pairing.color_a);
                if (round.is_recorded) {
                    state.score += PointsFor(pairing, round.results[board], pairing.player_a_id, bye_points);
                }
            }
            if (b != slot.end()) {
                auto& state = context.players[b->second];
                state.opponents.insert(pairing.player_a_id);
                state.colors.push_back(pairing.color_b);
                if (round.is_recorded) {
                    state.score += PointsFor(pairing, round.results[board], pairing.player_b_id, bye_points);
                }
            }
        }
    }
    return context;
}

Round SwissScheduler::BuildRound(const SwissContext& context) const {
    Round round;
    round.index = context.round_index;
    const auto& players = context.players;
    const int count = static_cast<int>(players.size());
    if (count < 2) {
        return round;
    }

    std::vector<int> seeded(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        seeded[static_cast<size_t>(i)] = i;
    }
    std::stable_sort(seeded.begin(), seeded.end(), [&](int lhs, int rhs) {
        const auto& a = players[static_cast<size_t>(lhs)];
        const auto& b = players[static_cast<size_t>(rhs)];
        if (a.score != b.score) {
            return a.score > b.score;
        }
        if (a.rating.has_value() != b.rating.has_value()) {
            return a.rating.has_value();
        }
        if (a.rating != b.rating) {
            return *a.rating > *b.rating;
        }
        return a.name < b.name;
    });

    std::vector<int> rank(static_cast<size_t>(count));
    std::vector<double> scores(static_cast<size_t>(count));
    std::vector<ColorState> colors(static_cast<size_t>(count));
    std::unordered_map<std::string, int> slot;
    for (int i = 0; i < count; ++i) {
        rank[static_cast<size_t>(seeded[static_cast<size_t>(i)])] = i;
        scores[static_cast<size_t>(i)] = players[static_cast<size_t>(i)].score;
        colors[static_cast<size_t>(i)] = ColorStateOf(players[static_cast<size_t>(i)]);
        slot[players[static_cast<size_t>(i)].id] = i;
    }

    std::vector<std::vector<bool>> met(static_cast<size_t>(count), std::vector<bool>(static_cast<size_t>(count), false));
    for (int i = 0; i < count; ++i) {
        for (const auto& opponent : players[static_cast<size_t>(i)].opponents) {
            const auto it = slot.find(opponent);
            if (it != slot.end()) {
                met[static_cast<size_t>(i)][static_cast<size_t>(it->second)] = true;
                met[static_cast<size_t>(it->second)][static_cast<size_t>(i)] = true;
            }
        }
    }

    std::vector<int> bye_candidates;
    if (count % 2 == 1) {
        for (auto it = seeded.rbegin(); it != seeded.rend(); ++it) {
            if (!players[static_cast<size_t>(*it)].had_bye) {
                bye_candidates.push_back(*it);
            }
        }
        if (bye_candidates.empty()) {
            bye_candidates.assign(seeded.rbegin(), seeded.rend());
        }
    }

    const auto without = [&seeded](int bye) {
        std::vector<int> rest;
        rest.reserve(seeded.size());
        for (const int player : seeded) {
            if (player != bye) {
                rest.push_back(player);
            }
        }
        return rest;
    };

    // Strict pass first; the relaxed pass allows rematches and always pairs
    // an even pool, so it settles on the first bye candidate.
    std::vector<std::pair<int, int>> pairs;
    int bye = -1;
    for (const bool allow_repeats : {false, true}) {
        PairingSearch search(scores, met, colors, allow_repeats,
                             allow_repeats ? std::numeric_limits<long>::max() : search_budget_);
        bool paired = false;
        if (bye_candidates.empty()) {
            paired = search.Run(seeded, &pairs);
        } else {
            for (const int candidate : bye_candidates) {
                if (search.Run(without(candidate), &pairs)) {
                    bye = candidate;
                    paired = true;
                    break;
                }
                if (search.exhausted()) {
                    break;
                }
            }
        }
        if (paired) {
            break;
        }
    }

    std::sort(pairs.begin(), pairs.end(), [&rank](const auto& lhs, const auto& rhs) {
        const int lhs_best = std::min(rank[static_cast<size_t>(lhs.first)], rank[static_cast<size_t>(lhs.second)]);
        const int rhs_best = std::min(rank[static_cast<size_t>(rhs.first)], rank[static_cast<size_t>(rhs.second)]);
        return lhs_best < rhs_best;
    });

    int board = 1;
    for (const auto& pair : pairs) {
        const auto colors_for_board = ChooseColors(pair.first, pair.second, board, rank, colors);
        Pairing pairing;
        pairing.player_a_id = players[static_cast<size_t>(colors_for_board.first)].id;
        pairing.player_b_id = players[static_cast<size_t>(colors_for_board.second)].id;
        pairing.color_a = Color::White;
        pairing.color_b = Color::Black;
        pairing.repeat = met[static_cast<size_t>(pair.first)][static_cast<size_t>(pair.second)];
        round.forced_repeat = round.forced_repeat || pairing.repeat;
        round.pairings.push_back(std::move(pairing));
        ++board;
    }

    if (bye >= 0) {
        Pairing pairing;
        pairing.player_a_id = players[static_cast<size_t>(bye)].id;
        round.pairings.push_back(std::move(pairing));
    }
    return round;
}

}  // namespace swissdesk::core::tournament
