#pragma once

#include "graph_solver.h"
#include "scoring.h"

CHOPSTICKS_SUPPRESS_EXPORT_WARNING

namespace chs
{
    struct SelectorConfig final
    {
        ScoreWeights weights{};
        bool use_classifier = true; // Try classify() on each successor before the graph solver
    };

    /// \brief Picks the move with the highest score for the side to move.
    class CHOPSTICKS_API MoveSelector final
    {
    public:
        struct Candidate final
        {
            Move move;
            State result;
            ResolvedValue value; // For the side to move, backed up through the move
            double score = 0;
        };

        using CandidateList = clu::static_vector<Candidate, max_move_count>;

        explicit MoveSelector(const SelectorConfig& config = {});

        /// \brief The best move, the first one in generation order among equal scores.
        /// \throws NoLegalMoves if the state is terminal.
        [[nodiscard]] Move choose_move(const State& state);

        /// \brief Every legal move with its value and score, in generation order.
        /// \throws NoLegalMoves if the state is terminal.
        [[nodiscard]] CandidateList evaluate_moves(const State& state);

        /// \brief Value of a state for its side to move, classified if possible, solved otherwise.
        [[nodiscard]] ResolvedValue value_of(const State& state);

        [[nodiscard]] const SelectorConfig& config() const noexcept { return config_; }
        [[nodiscard]] const Scorer& scorer() const noexcept { return scorer_; }
        [[nodiscard]] GraphSolver& solver() noexcept { return solver_; }
        [[nodiscard]] const GraphSolver& solver() const noexcept { return solver_; }
        [[nodiscard]] std::size_t classified_count() const noexcept { return classified_; }

    private:
        SelectorConfig config_;
        Scorer scorer_;
        GraphSolver solver_;
        std::size_t classified_ = 0;
    };
} // namespace chs

CHOPSTICKS_RESTORE_EXPORT_WARNING
