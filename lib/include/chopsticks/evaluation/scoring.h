#pragma once

#include "resolved_value.h"

CHOPSTICKS_SUPPRESS_EXPORT_WARNING

namespace chs
{
    /// \brief Weights of the scoring function.
    /// \remarks A win scores win_base - distance, a loss loss_base + survival_weight * distance and a
    /// draw 0. The survival term makes slower losses score higher, without ever reaching a draw.
    struct CHOPSTICKS_API ScoreWeights final
    {
        double win_base = 1000.0;
        double loss_base = -1000.0;
        double survival_weight = 1.0;

        /// \throws std::invalid_argument unless the weights are finite, all wins score above 0,
        /// all losses below 0, and one ply of distance always changes a score.
        void validate() const;
    };

    class CHOPSTICKS_API Scorer final
    {
    public:
        explicit Scorer(const ScoreWeights& weights = {});

        /// \brief Score of a value for the side it belongs to.
        [[nodiscard]] double score(ResolvedValue value) const noexcept;

        /// \brief Score of a value owned by one side, from the point of view of the given side.
        [[nodiscard]] double score(const ResolvedValue value, const Side owner, const Side perspective) const noexcept
        {
            return score(owner == perspective ? value : value.flipped());
        }

        [[nodiscard]] const ScoreWeights& weights() const noexcept { return weights_; }

    private:
        ScoreWeights weights_;
    };
} // namespace chs

CHOPSTICKS_RESTORE_EXPORT_WARNING
