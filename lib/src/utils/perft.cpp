#include "chopsticks/utils/perft.h"
#include "chopsticks/core/moves.h"

namespace chs
{
    std::uint64_t perft(const State& state, const int depth)
    {
        if (depth == 0 || state.is_terminal())
            return 1;
        std::uint64_t result = 0;
        for (const auto& transition : legal_moves(state))
            result += perft(transition.result, depth - 1);
        return result;
    }

    std::uint64_t perft(const int depth) { return perft(State{}, depth); }
} // namespace chs
