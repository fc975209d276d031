#pragma once

#include <array>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "macros.h"

CHOPSTICKS_SUPPRESS_EXPORT_WARNING

namespace chs
{
    inline constexpr int max_fingers = 4;
    inline constexpr int finger_modulus = max_fingers + 1;

    /// Number of unordered hand pairs, from (0,0) to (4,4).
    inline constexpr std::size_t pair_count = (max_fingers + 1) * (max_fingers + 2) / 2;
    /// Number of canonical states: side to move times the pairs of both sides.
    inline constexpr std::size_t state_count = 2 * pair_count * pair_count;

    enum class Side : bool
    {
        first,
        second
    };

    [[nodiscard]] constexpr Side opponent_of(const Side side) noexcept
    {
        return side == Side::first ? Side::second : Side::first;
    }

    [[nodiscard]] constexpr std::size_t index_of(const Side side) noexcept { return static_cast<std::size_t>(side); }

    struct Hands final
    {
        std::uint8_t left = 1;
        std::uint8_t right = 1;

        [[nodiscard]] constexpr friend bool operator==(Hands, Hands) noexcept = default;
        [[nodiscard]] constexpr friend auto operator<=>(Hands, Hands) noexcept = default;

        [[nodiscard]] constexpr bool is_valid() const noexcept { return left <= max_fingers && right <= max_fingers; }
        [[nodiscard]] constexpr bool is_dead() const noexcept { return left == 0 && right == 0; }
        [[nodiscard]] constexpr int live_count() const noexcept { return (left != 0) + (right != 0); }
        [[nodiscard]] constexpr int sum() const noexcept { return left + right; }

        constexpr void sort() noexcept
        {
            if (left > right)
                std::swap(left, right);
        }

        [[nodiscard]] constexpr Hands sorted() const noexcept
        {
            Hands res = *this;
            res.sort();
            return res;
        }

        /// Two pairs holding the same values are the same pair, whichever hand holds which.
        [[nodiscard]] constexpr bool same_as(const Hands other) const noexcept { return sorted() == other.sorted(); }

        /// \brief Dense index of the unordered pair, in [0, pair_count).
        [[nodiscard]] constexpr std::size_t index() const noexcept
        {
            const Hands s = sorted();
            return static_cast<std::size_t>(s.right * (s.right + 1) / 2 + s.left);
        }

        [[nodiscard]] static constexpr Hands from_index(const std::size_t index) noexcept
        {
            std::size_t high = 0;
            while ((high + 1) * (high + 2) / 2 <= index)
                high++;
            const std::size_t low = index - high * (high + 1) / 2;
            return {.left = static_cast<std::uint8_t>(low), .right = static_cast<std::uint8_t>(high)};
        }
    };

    /// \brief A position: the side to move and the hands of both sides.
    /// \remarks Hand order within a pair carries no meaning, canonicalize() sorts each pair ascending.
    struct CHOPSTICKS_API State final
    {
        Side current = Side::first;
        std::array<Hands, 2> hands{};

        /// \brief Builds a state from raw hand values.
        /// \throws InvalidState if any value is outside [0, max_fingers].
        [[nodiscard]] static State make(int first_left, int first_right, //
            int second_left, int second_right, Side current = Side::first);

        /// \brief Reads the text form "<side>:<ab>|<cd>", e.g. "0:11|11" for the start position.
        [[nodiscard]] static State read(std::string_view repr);

        /// \brief Inverse of index(), the result is canonical.
        [[nodiscard]] static constexpr State from_index(std::size_t index) noexcept
        {
            const std::size_t second = index % pair_count;
            index /= pair_count;
            const std::size_t first = index % pair_count;
            index /= pair_count;
            return {.current = static_cast<Side>(index != 0),
                .hands = {Hands::from_index(first), Hands::from_index(second)}};
        }

        [[nodiscard]] constexpr friend bool operator==(const State&, const State&) noexcept = default;
        [[nodiscard]] constexpr friend auto operator<=>(const State&, const State&) noexcept = default;

        [[nodiscard]] constexpr Hands& mover() noexcept { return hands[index_of(current)]; }
        [[nodiscard]] constexpr const Hands& mover() const noexcept { return hands[index_of(current)]; }
        [[nodiscard]] constexpr Hands& opponent() noexcept { return hands[index_of(opponent_of(current))]; }
        [[nodiscard]] constexpr const Hands& opponent() const noexcept
        {
            return hands[index_of(opponent_of(current))];
        }

        [[nodiscard]] constexpr bool is_valid() const noexcept { return hands[0].is_valid() && hands[1].is_valid(); }
        void validate() const;

        constexpr void canonicalize() noexcept
        {
            hands[0].sort();
            hands[1].sort();
        }

        [[nodiscard]] constexpr bool is_canonical() const noexcept
        {
            return hands[0].left <= hands[0].right && hands[1].left <= hands[1].right;
        }

        /// A side with both hands dead has lost, whoever is to move.
        [[nodiscard]] constexpr bool is_terminal() const noexcept { return hands[0].is_dead() || hands[1].is_dead(); }

        /// \brief The side that still has a live hand.
        /// \returns std::nullopt if both sides are out of hands.
        /// \throws InvalidState if the game is not over.
        [[nodiscard]] std::optional<Side> winner() const;

        /// \brief Dense index of the canonical form of this state, in [0, state_count).
        [[nodiscard]] constexpr std::size_t index() const noexcept
        {
            return (index_of(current) * pair_count + hands[0].index()) * pair_count + hands[1].index();
        }
    };

    [[nodiscard]] constexpr State canonicalize(State state) noexcept
    {
        state.canonicalize();
        return state;
    }

    [[nodiscard]] CHOPSTICKS_API std::string to_string(const State& state);
} // namespace chs

CHOPSTICKS_RESTORE_EXPORT_WARNING
