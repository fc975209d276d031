#include <gtest/gtest.h>

#include <limits>
#include <stdexcept>

#include <chopsticks/evaluation/scoring.h>

namespace chs
{
    TEST(ScoringTest, DefaultFormula)
    {
        const Scorer scorer;
        EXPECT_DOUBLE_EQ(scorer.score(ResolvedValue::win(3)), 997.0);
        EXPECT_DOUBLE_EQ(scorer.score(ResolvedValue::loss(4)), -996.0);
        EXPECT_DOUBLE_EQ(scorer.score(ResolvedValue::drawn()), 0.0);
    }

    TEST(ScoringTest, WinsBeatDrawsBeatLosses)
    {
        const Scorer scorer(ScoreWeights{.survival_weight = 2.0});
        for (int d = 0; d < max_distance; d++)
        {
            EXPECT_GT(scorer.score(ResolvedValue::win(d)), 0.0);
            EXPECT_LT(scorer.score(ResolvedValue::loss(d)), 0.0);
            if (d > 0)
            {
                // Faster wins and slower losses are preferred
                EXPECT_LT(scorer.score(ResolvedValue::win(d)), scorer.score(ResolvedValue::win(d - 1)));
                EXPECT_GT(scorer.score(ResolvedValue::loss(d)), scorer.score(ResolvedValue::loss(d - 1)));
            }
        }
    }

    TEST(ScoringTest, PerspectiveFlipsTheValue)
    {
        const Scorer scorer;
        const ResolvedValue value = ResolvedValue::win(5);
        EXPECT_DOUBLE_EQ(scorer.score(value, Side::first, Side::first), 995.0);
        EXPECT_DOUBLE_EQ(scorer.score(value, Side::first, Side::second), -995.0);
        EXPECT_DOUBLE_EQ(scorer.score(ResolvedValue::drawn(), Side::second, Side::first), 0.0);
    }

    TEST(ScoringTest, RejectsWeightsThatBreakTheOrder)
    {
        EXPECT_THROW(Scorer(ScoreWeights{.survival_weight = 0.0}), std::invalid_argument);
        EXPECT_THROW(Scorer(ScoreWeights{.survival_weight = -1.0}), std::invalid_argument);
        EXPECT_THROW(Scorer(ScoreWeights{.win_base = 100.0}), std::invalid_argument);
        EXPECT_THROW(Scorer(ScoreWeights{.loss_base = -100.0}), std::invalid_argument);
        EXPECT_THROW(Scorer(ScoreWeights{.loss_base = -1000.0, .survival_weight = 3.0}), std::invalid_argument);

        constexpr double nan = std::numeric_limits<double>::quiet_NaN();
        constexpr double inf = std::numeric_limits<double>::infinity();
        EXPECT_THROW(Scorer(ScoreWeights{.survival_weight = nan}), std::invalid_argument);
        EXPECT_THROW(Scorer(ScoreWeights{.win_base = nan}), std::invalid_argument);
        EXPECT_THROW(Scorer(ScoreWeights{.loss_base = nan}), std::invalid_argument);
        EXPECT_THROW(Scorer(ScoreWeights{.win_base = inf}), std::invalid_argument);
        EXPECT_THROW(Scorer(ScoreWeights{.loss_base = -inf}), std::invalid_argument);
        EXPECT_THROW(Scorer(ScoreWeights{.survival_weight = inf}), std::invalid_argument);

        // Too small or too large for a single ply to register
        EXPECT_THROW(Scorer(ScoreWeights{.survival_weight = 1e-300}), std::invalid_argument);
        EXPECT_THROW(Scorer(ScoreWeights{.win_base = 1e20}), std::invalid_argument);
        EXPECT_THROW(Scorer(ScoreWeights{.loss_base = -1e20, .survival_weight = 1.0}), std::invalid_argument);

        EXPECT_THROW(ScoreWeights{.survival_weight = nan}.validate(), std::invalid_argument);

        EXPECT_NO_THROW(Scorer(ScoreWeights{.win_base = 500.0, .loss_base = -500.0, .survival_weight = 0.5}));
    }
} // namespace chs
