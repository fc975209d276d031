#pragma once

#include <span>
#include <string>

#include "../core/state.h"

CHOPSTICKS_SUPPRESS_EXPORT_WARNING

namespace chs
{
    enum class Outcome : std::uint8_t
    {
        win,
        loss,
        drawn // Drawn by repetition, optimal play never ends the game
    };

    /// No forced outcome takes more plies than there are distinct positions.
    inline constexpr int max_distance = static_cast<int>(state_count);

    /// \brief The exact game-theoretic value of a state, relative to the side to move in that state.
    struct ResolvedValue final
    {
        Outcome outcome = Outcome::drawn;
        int distance = 0; // Plies until the forced end of the game, 0 when drawn

        [[nodiscard]] static constexpr ResolvedValue win(const int distance) noexcept
        {
            return {.outcome = Outcome::win, .distance = distance};
        }

        [[nodiscard]] static constexpr ResolvedValue loss(const int distance) noexcept
        {
            return {.outcome = Outcome::loss, .distance = distance};
        }

        [[nodiscard]] static constexpr ResolvedValue drawn() noexcept { return {}; }

        [[nodiscard]] constexpr friend bool operator==(ResolvedValue, ResolvedValue) noexcept = default;

        [[nodiscard]] constexpr bool is_win() const noexcept { return outcome == Outcome::win; }
        [[nodiscard]] constexpr bool is_loss() const noexcept { return outcome == Outcome::loss; }
        [[nodiscard]] constexpr bool is_drawn() const noexcept { return outcome == Outcome::drawn; }

        /// \brief The same value seen by the other side.
        [[nodiscard]] constexpr ResolvedValue flipped() const noexcept
        {
            switch (outcome)
            {
                case Outcome::win: return loss(distance);
                case Outcome::loss: return win(distance);
                default: return drawn();
            }
        }

        /// \brief Value for the side that moved into a state with this value, one ply further away.
        [[nodiscard]] constexpr ResolvedValue backed_up() const noexcept
        {
            ResolvedValue res = flipped();
            if (!res.is_drawn())
                res.distance++;
            return res;
        }
    };

    /// \brief Value of a terminal state for its side to move.
    /// \remarks The side to move has lost if it has no live hand, which is always the case for a
    /// terminal state reached by playing. Both sides being out of hands counts as a loss as well.
    [[nodiscard]] constexpr ResolvedValue terminal_value(const State& state) noexcept
    {
        return state.mover().is_dead() ? ResolvedValue::loss(0) : ResolvedValue::win(0);
    }

    /// \brief Value of a state given the values of its moves, each already backed up to the mover.
    /// \remarks The fastest win is preferred; lacking a win a draw, lacking that the slowest loss.
    [[nodiscard]] CHOPSTICKS_API ResolvedValue combine(std::span<const ResolvedValue> move_values) noexcept;

    [[nodiscard]] CHOPSTICKS_API std::string to_string(ResolvedValue value);
} // namespace chs

CHOPSTICKS_RESTORE_EXPORT_WARNING
