#include "holdem/pot.hpp"

#include <algorithm>

namespace holdem {

bool Pot::is_eligible(const PlayerId& player_id) const {
    return std::find(eligible_players.begin(), eligible_players.end(), player_id) != eligible_players.end();
}

std::vector<Pot> construct_pots(const std::vector<PlayerContribution>& contributions) {
    std::vector<ChipAmount> levels;
    ChipAmount top;
    for (const auto& contribution : contributions) {
        if (contribution.has_folded) {
            continue;
        }
        if (contribution.is_all_in && contribution.amount.is_positive()) {
            levels.push_back(contribution.amount);
        }
        top = max_chips(top, contribution.amount);
    }
    if (top.is_positive()) {
        levels.push_back(top);
    }
    std::sort(levels.begin(), levels.end());
    levels.erase(std::unique(levels.begin(), levels.end()), levels.end());

    std::vector<Pot> pots;
    ChipAmount previous;
    for (ChipAmount level : levels) {
        Pot pot;
        for (const auto& contribution : contributions) {
            pot.amount += min_chips(contribution.amount, level) - min_chips(contribution.amount, previous);
            if (!contribution.has_folded && contribution.amount >= level) {
                pot.eligible_players.push_back(contribution.player_id);
            }
        }
        previous = level;

        if (pot.amount.is_zero()) {
            continue;
        }
        if (!pots.empty() && pots.back().eligible_players == pot.eligible_players) {
            pots.back().amount += pot.amount;
        } else {
            pots.push_back(std::move(pot));
        }
    }

    // Folded chips above every live contribution.
    ChipAmount dead;
    for (const auto& contribution : contributions) {
        if (contribution.amount > previous) {
            dead += contribution.amount - previous;
        }
    }
    if (dead.is_positive()) {
        if (pots.empty()) {
            pots.push_back(Pot{dead, {}});
        } else {
            pots.back().amount += dead;
        }
    }

    return pots;
}

ChipAmount pots_total(const std::vector<Pot>& pots) {
    ChipAmount total;
    for (const auto& pot : pots) {
        total += pot.amount;
    }
    return total;
}

Result<std::vector<Payout>> distribute_pot(const Pot& pot, std::size_t pot_index,
                                           const HandRanking& ranking) {
    for (const auto& tier : ranking) {
        std::vector<PlayerId> winners;
        for (const auto& player_id : tier) {
            if (pot.is_eligible(player_id) &&
                std::find(winners.begin(), winners.end(), player_id) == winners.end()) {
                winners.push_back(player_id);
            }
        }
        if (winners.empty()) {
            continue;
        }

        const auto count = static_cast<int64_t>(winners.size());
        ChipAmount share = pot.amount / count;
        int64_t odd_chips = (pot.amount % count).value();

        std::vector<Payout> payouts;
        payouts.reserve(winners.size());
        for (int64_t i = 0; i < count; ++i) {
            ChipAmount amount = share + ChipAmount(i < odd_chips ? 1 : 0);
            payouts.push_back({winners[static_cast<std::size_t>(i)], amount, pot_index});
        }
        return payouts;
    }

    return make_error(ErrorCode::InvalidState,
        "No eligible winner for pot " + std::to_string(pot_index),
        {{"pot_index", pot_index},
         {"amount", pot.amount.value()},
         {"eligible_players", pot.eligible_players}});
}

Result<std::vector<Payout>> distribute_all_pots(const std::vector<Pot>& pots,
                                                const HandRanking& ranking) {
    std::vector<Payout> all_payouts;
    for (std::size_t i = 0; i < pots.size(); ++i) {
        Result<std::vector<Payout>> payouts = distribute_pot(pots[i], i, ranking);
        if (!payouts) {
            return payouts.error();
        }
        const auto& pot_payouts = payouts.value();
        all_payouts.insert(all_payouts.end(), pot_payouts.begin(), pot_payouts.end());
    }
    return all_payouts;
}

std::vector<Payout> distribute_to_sole_winner(const std::vector<Pot>& pots, const PlayerId& winner) {
    std::vector<Payout> payouts;
    payouts.reserve(pots.size());
    for (std::size_t i = 0; i < pots.size(); ++i) {
        payouts.push_back({winner, pots[i].amount, i});
    }
    return payouts;
}

} // namespace holdem
