#pragma once

#include <span>

#include "memo_table.h"
#include "../core/moves.h"

CHOPSTICKS_SUPPRESS_EXPORT_WARNING

namespace chs
{
    /// \brief Exact solver of the cyclic state graph.
    /// \remarks Values are computed lazily on first use and kept until clear() is called. The
    /// values of states lying on a cycle with states still being explored are deferred; once the
    /// search leaves the first state of such a cycle cluster, the whole cluster is finalized by
    /// backward induction from its exits, and whatever that leaves open is drawn by repetition.
    /// Cached values therefore never depend on the order of queries.
    class CHOPSTICKS_API GraphSolver final
    {
    public:
        GraphSolver();

        /// \brief Exact value of a state for its side to move.
        /// \throws InvalidState if the state has out of range hand values.
        [[nodiscard]] ResolvedValue resolve(const State& state);

        /// \brief Resolves every canonical state.
        /// \returns The number of states in the memo table afterwards.
        std::size_t solve_all();

        void clear() noexcept;

        [[nodiscard]] const MemoTable& memo_table() const noexcept { return memo_; }
        [[nodiscard]] std::size_t resolved_count() const noexcept { return memo_.size(); }
        [[nodiscard]] std::size_t traversed_nodes() const noexcept { return nodes_; }

    private:
        struct Visit final
        {
            int order = -1;
            int lowlink = -1;
            bool in_progress = false;
        };

        std::size_t nodes_ = 0;
        int next_order_ = 0;
        MemoTable memo_;
        std::vector<Visit> visits_;
        std::vector<std::size_t> in_progress_;

        void visit(const State& state);
        void finalize_cluster(std::span<const std::size_t> cluster);
        ResolvedValue value_from_moves(const State& state) const;
    };
} // namespace chs

CHOPSTICKS_RESTORE_EXPORT_WARNING
