#pragma once

#include "player.h"
#include "../evaluation/move_selector.h"

CHOPSTICKS_SUPPRESS_EXPORT_WARNING

namespace chs
{
    class CHOPSTICKS_API SolvingPlayer final : public Player
    {
    public:
        explicit SolvingPlayer(const SelectorConfig& config = {}): selector_(config) {}
        [[nodiscard]] Move get_move(const State& state) override { return selector_.choose_move(state); }
        [[nodiscard]] MoveSelector& selector() noexcept { return selector_; }

    private:
        MoveSelector selector_;
    };
} // namespace chs

CHOPSTICKS_RESTORE_EXPORT_WARNING
