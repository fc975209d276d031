#include "chopsticks/evaluation/resolved_value.h"

#include <algorithm>
#include <format>

namespace chs
{
    ResolvedValue combine(const std::span<const ResolvedValue> move_values) noexcept
    {
        int fastest_win = -1, slowest_loss = -1;
        bool has_draw = false;
        for (const auto [outcome, distance] : move_values)
        {
            switch (outcome)
            {
                case Outcome::win:
                    fastest_win = fastest_win < 0 ? distance : std::min(fastest_win, distance);
                    break;
                case Outcome::loss: slowest_loss = std::max(slowest_loss, distance); break;
                case Outcome::drawn: has_draw = true; break;
            }
        }
        if (fastest_win >= 0)
            return ResolvedValue::win(fastest_win);
        if (has_draw || slowest_loss < 0)
            return ResolvedValue::drawn();
        return ResolvedValue::loss(slowest_loss);
    }

    std::string to_string(const ResolvedValue value)
    {
        switch (value.outcome)
        {
            case Outcome::win: return std::format("win in {}", value.distance);
            case Outcome::loss: return std::format("loss in {}", value.distance);
            default: return "drawn";
        }
    }
} // namespace chs
