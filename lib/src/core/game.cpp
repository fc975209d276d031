#include "chopsticks/core/game.h"

#include <algorithm>
#include <iterator>

namespace chs
{
    bool GameRecord::repeated() const noexcept
    {
        const auto last = std::prev(states_.end());
        return std::find(states_.begin(), last, *last) != last;
    }
} // namespace chs
