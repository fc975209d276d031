#include "chopsticks/evaluation/graph_solver.h"

#include <algorithm>
#include <clu/static_vector.h>

namespace chs
{
    GraphSolver::GraphSolver(): visits_(state_count) {}

    ResolvedValue GraphSolver::resolve(const State& state)
    {
        state.validate();
        const State canonical = canonicalize(state);
        if (const auto* value = memo_.try_load(canonical))
            return *value;
        if (canonical.is_terminal())
        {
            const ResolvedValue value = terminal_value(canonical);
            memo_.store(canonical, value);
            return value;
        }
        visit(canonical);
        return *memo_.try_load(canonical);
    }

    std::size_t GraphSolver::solve_all()
    {
        for (std::size_t i = 0; i < state_count; i++)
            (void)resolve(State::from_index(i));
        return memo_.size();
    }

    void GraphSolver::clear() noexcept
    {
        memo_.clear();
        std::ranges::fill(visits_, Visit{});
        in_progress_.clear();
        next_order_ = 0;
        nodes_ = 0;
    }

    void GraphSolver::visit(const State& state)
    {
        nodes_++;
        const std::size_t index = state.index();
        const int order = next_order_++;
        visits_[index] = {.order = order, .lowlink = order, .in_progress = true};
        in_progress_.push_back(index);

        for (const auto& transition : legal_moves(state))
        {
            const State& next = transition.result;
            const std::size_t next_index = next.index();
            if (memo_.try_load(next_index))
                continue;
            if (next.is_terminal())
            {
                memo_.store(next_index, terminal_value(next));
                continue;
            }
            if (visits_[next_index].in_progress) // Back on the current path, a cycle
            {
                visits_[index].lowlink = std::min(visits_[index].lowlink, visits_[next_index].order);
                continue;
            }
            visit(next);
            visits_[index].lowlink = std::min(visits_[index].lowlink, visits_[next_index].lowlink);
        }

        // Still on a cycle through an earlier state, the value stays deferred until that one is done
        if (visits_[index].lowlink != order)
            return;

        const auto first = std::ranges::find(in_progress_, index);
        const std::vector<std::size_t> cluster(first, in_progress_.end());
        in_progress_.erase(first, in_progress_.end());
        for (const std::size_t member : cluster)
            visits_[member].in_progress = false;
        if (cluster.size() == 1)
            memo_.store(index, value_from_moves(state));
        else
            finalize_cluster(cluster);
    }

    ResolvedValue GraphSolver::value_from_moves(const State& state) const
    {
        clu::static_vector<ResolvedValue, max_move_count> values;
        for (const auto& transition : legal_moves(state))
            values.push_back(memo_.try_load(transition.result)->backed_up());
        return combine(values);
    }

    void GraphSolver::finalize_cluster(const std::span<const std::size_t> cluster)
    {
        struct Member final
        {
            State state;
            MoveList moves;
        };

        std::vector<Member> pending;
        pending.reserve(cluster.size());
        int longest_exit = 0;
        for (const std::size_t index : cluster)
        {
            const State state = State::from_index(index);
            auto& member = pending.emplace_back(Member{.state = state, .moves = legal_moves(state)});
            for (const auto& transition : member.moves)
                if (const auto* value = memo_.try_load(transition.result))
                    longest_exit = std::max(longest_exit, value->backed_up().distance);
        }

        // Round n labels the states won or lost in exactly n plies. A won state needs one move into a
        // state lost within n - 1 plies, a lost state needs every move into a state won within n - 1.
        std::vector<std::pair<std::size_t, ResolvedValue>> labeled;
        for (int round = 1; !pending.empty(); round++)
        {
            labeled.clear();
            for (const auto& [state, moves] : pending)
            {
                bool wins = false, loses = true;
                for (const auto& transition : moves)
                {
                    const auto* value = memo_.try_load(transition.result);
                    if (!value)
                    {
                        loses = false;
                        continue;
                    }
                    const ResolvedValue via = value->backed_up();
                    if (via.is_drawn() || via.distance > round)
                        loses = false;
                    else if (via.is_win())
                        wins = true;
                }
                if (wins)
                    labeled.emplace_back(state.index(), ResolvedValue::win(round));
                else if (loses)
                    labeled.emplace_back(state.index(), ResolvedValue::loss(round));
            }
            if (labeled.empty() && round >= longest_exit)
                break;
            for (const auto& [index, value] : labeled)
                memo_.store(index, value);
            std::erase_if(pending, [&](const Member& member) { return memo_.try_load(member.state) != nullptr; });
        }

        for (const auto& member : pending)
            memo_.store(member.state, ResolvedValue::drawn());
    }
} // namespace chs
