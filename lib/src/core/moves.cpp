#include "chopsticks/core/moves.h"

#include <algorithm>
#include <cctype>
#include <format>

#include "chopsticks/core/errors.h"

namespace chs
{
    namespace
    {
        /// Values of the live hands of a sorted pair, ascending and without repetition.
        clu::static_vector<std::uint8_t, 2> distinct_live_values(const Hands hands) noexcept
        {
            clu::static_vector<std::uint8_t, 2> res;
            if (hands.left != 0)
                res.push_back(hands.left);
            if (hands.right != 0 && hands.right != hands.left)
                res.push_back(hands.right);
            return res;
        }

        State tapped(State state, const int attacker, const int target) noexcept
        {
            Hands& hit = state.opponent();
            std::uint8_t& hand = hit.left == target ? hit.left : hit.right;
            hand = static_cast<std::uint8_t>((hand + attacker) % finger_modulus);
            state.current = opponent_of(state.current);
            state.canonicalize();
            return state;
        }

        State redistributed(State state, const Hands hands) noexcept
        {
            state.mover() = hands;
            state.current = opponent_of(state.current);
            state.canonicalize();
            return state;
        }
    } // namespace

    MoveList legal_moves(const State& state)
    {
        state.validate();
        if (state.is_terminal())
            throw NoLegalMoves();
        const Hands mover = state.mover().sorted();
        const Hands opponent = state.opponent().sorted();
        MoveList res;
        for (const int attacker : distinct_live_values(mover))
            for (const int target : distinct_live_values(opponent))
                res.push_back(Transition{
                    .move = Move::tap(attacker, target), .result = tapped(state, attacker, target)});
        const int sum = mover.sum();
        for (int low = std::max(0, sum - max_fingers); low <= sum / 2; low++)
        {
            const Hands hands{static_cast<std::uint8_t>(low), static_cast<std::uint8_t>(sum - low)};
            if (hands == mover) // A split must change something
                continue;
            res.push_back(Transition{.move = Move::split(low, sum - low), .result = redistributed(state, hands)});
        }
        return res;
    }

    State play(const State& state, const Move move)
    {
        for (const auto& [legal, result] : legal_moves(state))
            if (legal == move)
                return result;
        throw IllegalMove(std::format("{} is not a legal move in state {}", to_string(move), to_string(state)));
    }

    std::string to_string(const Move move)
    {
        return std::format("{}{}{}", move.is_tap() ? 't' : 's', move.first, move.second);
    }

    std::optional<Move> parse_move(const std::string_view str) noexcept
    {
        if (str.size() != 3)
            return std::nullopt;
        if (str[1] < '0' || str[1] > '9' || str[2] < '0' || str[2] > '9')
            return std::nullopt;
        const int first = str[1] - '0', second = str[2] - '0';
        switch (std::tolower(static_cast<unsigned char>(str[0])))
        {
            case 't': return Move::tap(first, second);
            case 's': return Move::split(first, second);
            default: return std::nullopt;
        }
    }
} // namespace chs
