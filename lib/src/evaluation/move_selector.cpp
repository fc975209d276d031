#include "chopsticks/evaluation/move_selector.h"

#include "chopsticks/evaluation/classifier.h"

namespace chs
{
    MoveSelector::MoveSelector(const SelectorConfig& config): config_(config), scorer_(config.weights) {}

    Move MoveSelector::choose_move(const State& state)
    {
        const auto candidates = evaluate_moves(state);
        const Candidate* best = &candidates[0];
        for (const auto& candidate : candidates)
            if (candidate.score > best->score)
                best = &candidate;
        return best->move;
    }

    MoveSelector::CandidateList MoveSelector::evaluate_moves(const State& state)
    {
        CandidateList res;
        for (const auto& [move, result] : legal_moves(state))
        {
            const ResolvedValue value = value_of(result).backed_up();
            res.push_back(Candidate{.move = move, .result = result, .value = value, .score = scorer_.score(value)});
        }
        return res;
    }

    ResolvedValue MoveSelector::value_of(const State& state)
    {
        if (config_.use_classifier)
        {
            if (const auto value = classify(state))
            {
                classified_++;
                return *value;
            }
        }
        return solver_.resolve(state);
    }
} // namespace chs
