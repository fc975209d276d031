#pragma once

#include <stdexcept>

#include "macros.h"

CHOPSTICKS_SUPPRESS_EXPORT_WARNING

namespace chs
{
    /// Hand values out of range, a malformed state text, or a query that needs a finished game.
    class CHOPSTICKS_API InvalidState final : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    /// Move generation or selection was requested on a terminal state.
    class CHOPSTICKS_API NoLegalMoves final : public std::logic_error
    {
    public:
        NoLegalMoves(): std::logic_error("The game is already over, there are no legal moves") {}
    };

    class CHOPSTICKS_API IllegalMove final : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };
} // namespace chs

CHOPSTICKS_RESTORE_EXPORT_WARNING
