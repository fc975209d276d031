#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <clu/static_vector.h>

#include "state.h"

CHOPSTICKS_SUPPRESS_EXPORT_WARNING

namespace chs
{
    enum class MoveKind : std::uint8_t
    {
        tap,
        split
    };

    /// \brief A move of the side to move.
    /// \remarks Hands are named by their values rather than their positions, since the two hands
    /// of a side are interchangeable. A tap adds the attacking hand's value to the target hand of
    /// the opponent, a split redistributes the mover's fingers into the pair (first, second).
    struct Move final
    {
        MoveKind kind = MoveKind::tap;
        std::uint8_t first = 0; // Attacking value of a tap, lower hand of a split
        std::uint8_t second = 0; // Target value of a tap, higher hand of a split

        [[nodiscard]] static constexpr Move tap(const int attacker, const int target) noexcept
        {
            return {.kind = MoveKind::tap,
                .first = static_cast<std::uint8_t>(attacker),
                .second = static_cast<std::uint8_t>(target)};
        }

        [[nodiscard]] static constexpr Move split(const int low, const int high) noexcept
        {
            return {.kind = MoveKind::split,
                .first = static_cast<std::uint8_t>(low < high ? low : high),
                .second = static_cast<std::uint8_t>(low < high ? high : low)};
        }

        [[nodiscard]] constexpr friend bool operator==(Move, Move) noexcept = default;
        [[nodiscard]] constexpr bool is_tap() const noexcept { return kind == MoveKind::tap; }
        [[nodiscard]] constexpr bool is_split() const noexcept { return kind == MoveKind::split; }
    };

    struct Transition final
    {
        Move move;
        State result; // Canonical
    };

    /// At most 4 distinct taps and 2 splits are possible from any position.
    inline constexpr std::size_t max_move_count = 6;
    using MoveList = clu::static_vector<Transition, max_move_count>;

    /// \brief Enumerates the legal moves of the side to move, in a stable order.
    /// \remarks Taps come before splits. Taps are ordered by attacking value then by target value,
    /// splits by their lower hand. Taps with the same operand values are generated once.
    /// \throws InvalidState if the state has out of range hand values.
    /// \throws NoLegalMoves if the state is terminal.
    [[nodiscard]] CHOPSTICKS_API MoveList legal_moves(const State& state);

    /// \brief Plays a move and returns the canonical resulting state.
    /// \throws IllegalMove if the move is not one of legal_moves(state).
    [[nodiscard]] CHOPSTICKS_API State play(const State& state, Move move);

    [[nodiscard]] CHOPSTICKS_API std::string to_string(Move move);

    /// \brief Parses "t<attacker><target>" or "s<low><high>", case-insensitive.
    [[nodiscard]] CHOPSTICKS_API std::optional<Move> parse_move(std::string_view str) noexcept;
} // namespace chs

CHOPSTICKS_RESTORE_EXPORT_WARNING
