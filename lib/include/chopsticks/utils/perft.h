#pragma once

#include <cstdint>

#include "../core/state.h"

CHOPSTICKS_SUPPRESS_EXPORT_WARNING

namespace chs
{
    /// \brief Counts the move paths of the given length, a path ending early at a terminal state counts once.
    CHOPSTICKS_API std::uint64_t perft(const State& state, int depth);
    CHOPSTICKS_API std::uint64_t perft(int depth);
} // namespace chs

CHOPSTICKS_RESTORE_EXPORT_WARNING
