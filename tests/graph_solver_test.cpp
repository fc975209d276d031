#include <gtest/gtest.h>

#include <vector>

#include <chopsticks/core/errors.h>
#include <chopsticks/evaluation/graph_solver.h>

namespace chs
{
    namespace
    {
        std::vector<ResolvedValue> backed_up_values(GraphSolver& solver, const State& state)
        {
            std::vector<ResolvedValue> res;
            for (const auto& transition : legal_moves(state))
                res.push_back(solver.resolve(transition.result).backed_up());
            return res;
        }
    } // namespace

    class GraphSolverTest : public ::testing::Test
    {
    protected:
        GraphSolver solver;
    };

    TEST_F(GraphSolverTest, TerminalStates)
    {
        EXPECT_EQ(solver.resolve(State::read("0:00|12")), ResolvedValue::loss(0));
        EXPECT_EQ(solver.resolve(State::read("1:12|00")), ResolvedValue::loss(0));
        EXPECT_EQ(solver.resolve(State::read("0:12|00")), ResolvedValue::win(0));
        EXPECT_EQ(solver.resolve(State::read("0:00|00")), ResolvedValue::loss(0));
    }

    TEST_F(GraphSolverTest, ImmediateKill)
    {
        EXPECT_EQ(solver.resolve(State::read("0:01|04")), ResolvedValue::win(1));
        EXPECT_EQ(solver.resolve(State::read("1:03|23")), ResolvedValue::win(1));
    }

    TEST_F(GraphSolverTest, ForcedLossInTwo)
    {
        // The only move is 1 onto 4, after which 4 onto 1 ends the game
        EXPECT_EQ(solver.resolve(State::read("0:01|44")), ResolvedValue::loss(2));
    }

    TEST_F(GraphSolverTest, CanonicalAndRawStatesAgree)
    {
        EXPECT_EQ(solver.resolve(State::make(1, 0, 4, 4)), solver.resolve(State::make(0, 1, 4, 4)));
        EXPECT_EQ(solver.resolve(State::make(3, 1, 2, 0)), solver.resolve(State::make(1, 3, 0, 2)));
    }

    TEST_F(GraphSolverTest, RejectsInvalidState)
    {
        State state;
        state.hands[0].left = 5;
        EXPECT_THROW((void)solver.resolve(state), InvalidState);
    }

    TEST_F(GraphSolverTest, SolveAllFillsTheTable)
    {
        EXPECT_EQ(solver.resolved_count(), 0u);
        EXPECT_EQ(solver.solve_all(), state_count);
        EXPECT_EQ(solver.resolved_count(), state_count);
        EXPECT_GT(solver.traversed_nodes(), 0u);
        for (const auto& [state, value] : solver.memo_table().entries())
        {
            EXPECT_GE(value.distance, 0);
            EXPECT_LT(value.distance, max_distance);
            if (value.is_drawn())
            {
                EXPECT_EQ(value.distance, 0);
            }
            EXPECT_EQ(state.is_terminal(), !value.is_drawn() && value.distance == 0) << to_string(state);
        }
        solver.clear();
        EXPECT_EQ(solver.resolved_count(), 0u);
        EXPECT_EQ(solver.traversed_nodes(), 0u);
    }

    TEST_F(GraphSolverTest, ValuesAgreeWithTheirMoves)
    {
        for (std::size_t i = 0; i < state_count; i++)
        {
            const State state = State::from_index(i);
            if (state.is_terminal())
                continue;
            const auto values = backed_up_values(solver, state);
            EXPECT_EQ(solver.resolve(state), combine(values)) << to_string(state);
        }
    }

    TEST_F(GraphSolverTest, DrawsCannotBeBrokenByEitherSide)
    {
        solver.solve_all();
        for (std::size_t i = 0; i < state_count; i++)
        {
            const State state = State::from_index(i);
            if (solver.resolve(state) != ResolvedValue::drawn())
                continue;
            bool keeps_draw = false;
            for (const auto& value : backed_up_values(solver, state))
            {
                EXPECT_FALSE(value.is_win()) << to_string(state);
                keeps_draw = keeps_draw || value.is_drawn();
            }
            EXPECT_TRUE(keeps_draw) << to_string(state);
        }
    }

    TEST_F(GraphSolverTest, QueryOrderDoesNotMatter)
    {
        GraphSolver reversed;
        for (std::size_t i = state_count; i-- > 0;)
            (void)reversed.resolve(State::from_index(i));
        GraphSolver from_start;
        (void)from_start.resolve(State{});
        for (std::size_t i = 0; i < state_count; i++)
        {
            const State state = State::from_index(i);
            const ResolvedValue value = solver.resolve(state);
            EXPECT_EQ(value, reversed.resolve(state)) << to_string(state);
            EXPECT_EQ(value, from_start.resolve(state)) << to_string(state);
        }
    }

    TEST_F(GraphSolverTest, ResolvingIsLazy)
    {
        (void)solver.resolve(State::read("0:01|44"));
        EXPECT_LT(solver.resolved_count(), state_count);
        const std::size_t nodes = solver.traversed_nodes();
        (void)solver.resolve(State::read("0:01|44"));
        EXPECT_EQ(solver.traversed_nodes(), nodes);
    }

    TEST(ResolvedValueTest, BackingUpFlipsAndCountsThePly)
    {
        EXPECT_EQ(ResolvedValue::win(3).backed_up(), ResolvedValue::loss(4));
        EXPECT_EQ(ResolvedValue::loss(0).backed_up(), ResolvedValue::win(1));
        EXPECT_EQ(ResolvedValue::drawn().backed_up(), ResolvedValue::drawn());
        EXPECT_EQ(ResolvedValue::win(3).flipped(), ResolvedValue::loss(3));
    }

    TEST(ResolvedValueTest, CombinePrefersFastWinsThenDrawsThenSlowLosses)
    {
        using V = ResolvedValue;
        EXPECT_EQ(combine(std::vector{V::loss(2), V::win(5), V::win(3), V::drawn()}), V::win(3));
        EXPECT_EQ(combine(std::vector{V::loss(2), V::drawn(), V::loss(8)}), V::drawn());
        EXPECT_EQ(combine(std::vector{V::loss(2), V::loss(8), V::loss(4)}), V::loss(8));
        EXPECT_EQ(combine(std::vector{V::drawn(), V::drawn()}), V::drawn());
    }

    TEST(ResolvedValueTest, Text)
    {
        EXPECT_EQ(to_string(ResolvedValue::win(3)), "win in 3");
        EXPECT_EQ(to_string(ResolvedValue::loss(0)), "loss in 0");
        EXPECT_EQ(to_string(ResolvedValue::drawn()), "drawn");
    }
} // namespace chs
