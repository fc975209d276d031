#include "chopsticks/evaluation/classifier.h"

#include "chopsticks/core/moves.h"

namespace chs
{
    namespace
    {
        bool can_kill_last_hand(const State& state) noexcept
        {
            const Hands opponent = state.opponent();
            if (opponent.live_count() != 1)
                return false;
            const int target = opponent.sum();
            const Hands mover = state.mover();
            const auto kills = [target](const int attacker)
            { return attacker != 0 && attacker + target == finger_modulus; };
            return kills(mover.left) || kills(mover.right);
        }
    } // namespace

    std::optional<ResolvedValue> classify(const State& state)
    {
        state.validate();
        if (state.is_terminal())
            return terminal_value(state);
        if (can_kill_last_hand(state))
            return ResolvedValue::win(1);
        // No move ends the game here, so every move leads to a live state
        for (const auto& transition : legal_moves(state))
            if (!can_kill_last_hand(transition.result))
                return std::nullopt;
        return ResolvedValue::loss(2);
    }
} // namespace chs
