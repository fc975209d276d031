#pragma once

#include <vector>

#include "moves.h"

CHOPSTICKS_SUPPRESS_EXPORT_WARNING

namespace chs
{
    /// \brief The states of one game, from its initial state to the current one.
    class CHOPSTICKS_API GameRecord final
    {
    public:
        GameRecord() noexcept: GameRecord(State{}) {}
        explicit GameRecord(const State& state): states_{canonicalize(state)} {}

        /// \throws IllegalMove if the move is not legal in the current state.
        void play(const Move move) { states_.push_back(chs::play(states_.back(), move)); }

        void undo() noexcept
        {
            if (states_.size() > 1)
                states_.pop_back();
        }

        void reset() noexcept { states_.erase(states_.begin() + 1, states_.end()); }

        void reset(const State& state) noexcept
        {
            states_[0] = canonicalize(state);
            reset();
        }

        [[nodiscard]] const State& current() const noexcept { return states_.back(); }
        [[nodiscard]] const auto& states() const noexcept { return states_; }
        [[nodiscard]] std::size_t ply_count() const noexcept { return states_.size() - 1; }

        /// \brief Whether the current state already occurred earlier in this game.
        /// \remarks A repeated position ends the game as a draw by repetition.
        [[nodiscard]] bool repeated() const noexcept;

        [[nodiscard]] bool finished() const noexcept { return current().is_terminal() || repeated(); }

    private:
        std::vector<State> states_;
    };
} // namespace chs

CHOPSTICKS_RESTORE_EXPORT_WARNING
