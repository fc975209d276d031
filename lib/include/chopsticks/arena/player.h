#pragma once

#include "../core/moves.h"

CHOPSTICKS_SUPPRESS_EXPORT_WARNING

namespace chs
{
    class CHOPSTICKS_API Player
    {
    public:
        Player() noexcept = default;
        virtual ~Player() noexcept = default;
        Player(const Player&) = delete;
        Player(Player&&) = delete;
        Player& operator=(const Player&) = delete;
        Player& operator=(Player&&) = delete;

        /// \throws NoLegalMoves if the state is terminal.
        [[nodiscard]] virtual Move get_move(const State& state) = 0;
    };
} // namespace chs

CHOPSTICKS_RESTORE_EXPORT_WARNING
