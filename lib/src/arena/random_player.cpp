#include "chopsticks/arena/random_player.h"

#include <clu/random.h>

namespace chs
{
    Move RandomPlayer::get_move(const State& state)
    {
        const auto moves = legal_moves(state);
        const int move_idx = clu::randint(0, static_cast<int>(moves.size()) - 1);
        return moves[static_cast<std::size_t>(move_idx)].move;
    }
} // namespace chs
