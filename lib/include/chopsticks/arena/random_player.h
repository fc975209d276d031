#pragma once

#include "player.h"

CHOPSTICKS_SUPPRESS_EXPORT_WARNING

namespace chs
{
    class CHOPSTICKS_API RandomPlayer final : public Player
    {
    public:
        [[nodiscard]] Move get_move(const State& state) override;
    };
} // namespace chs

CHOPSTICKS_RESTORE_EXPORT_WARNING
