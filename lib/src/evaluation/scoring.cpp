#include "chopsticks/evaluation/scoring.h"

#include <cmath>
#include <format>
#include <stdexcept>

namespace chs
{
    void ScoreWeights::validate() const
    {
        if (!std::isfinite(win_base) || !std::isfinite(loss_base) || !std::isfinite(survival_weight))
            throw std::invalid_argument(std::format(
                "Score weights must be finite, got {}, {} and {}", win_base, loss_base, survival_weight));
        if (survival_weight <= 0)
            throw std::invalid_argument(std::format("Survival weight must be positive, got {}", survival_weight));
        if (win_base - max_distance <= 0)
            throw std::invalid_argument(
                std::format("Win base {} must exceed the longest distance {}", win_base, max_distance));
        if (loss_base + survival_weight * max_distance >= 0)
            throw std::invalid_argument(std::format(
                "Loss base {} with survival weight {} lets a loss outscore a draw", loss_base, survival_weight));
        // One ply must always change the score
        if (win_base - 1 == win_base)
            throw std::invalid_argument(std::format("Win base {} is too large to tell distances apart", win_base));
        if (loss_base + survival_weight == loss_base)
            throw std::invalid_argument(std::format(
                "Survival weight {} is too small to change the loss base {}", survival_weight, loss_base));
    }

    Scorer::Scorer(const ScoreWeights& weights): weights_(weights) { weights_.validate(); }

    double Scorer::score(const ResolvedValue value) const noexcept
    {
        switch (value.outcome)
        {
            case Outcome::win: return weights_.win_base - value.distance;
            case Outcome::loss: return weights_.loss_base + weights_.survival_weight * value.distance;
            default: return 0;
        }
    }
} // namespace chs
