#pragma once

#include <optional>

#include "resolved_value.h"

namespace chs
{
    /// \brief Classifies a state from one and two ply tactics, without solving the state graph.
    /// \returns The exact value if the state is terminal, if the side to move can take the last
    /// live hand of the opponent (win in 1), or if every move lets the opponent do so (loss in 2);
    /// std::nullopt otherwise.
    /// \throws InvalidState if the state has out of range hand values.
    [[nodiscard]] CHOPSTICKS_API std::optional<ResolvedValue> classify(const State& state);
} // namespace chs
