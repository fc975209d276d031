#pragma once

#include <vector>
#include <optional>
#include <algorithm>
#include <ranges>

#include "resolved_value.h"

namespace chs
{
    /// \brief Final values of canonical states, addressed by State::index().
    class MemoTable final
    {
    public:
        MemoTable(): data_(state_count) {}

        void store(const State& state, const ResolvedValue value) noexcept { store(state.index(), value); }
        void store(const std::size_t index, const ResolvedValue value) noexcept { data_[index] = value; }

        [[nodiscard]] const ResolvedValue* try_load(const State& state) const noexcept
        {
            return try_load(state.index());
        }

        [[nodiscard]] const ResolvedValue* try_load(const std::size_t index) const noexcept
        {
            const auto& entry = data_[index];
            return entry ? &*entry : nullptr;
        }

        void clear() noexcept { std::ranges::fill(data_, std::nullopt); }

        [[nodiscard]] std::size_t size() const noexcept
        {
            return static_cast<std::size_t>(std::ranges::count_if(
                data_, [](const std::optional<ResolvedValue>& entry) { return entry.has_value(); }));
        }

        [[nodiscard]] auto entries() const noexcept
        {
            return std::views::iota(std::size_t{}, state_count) //
                | std::views::filter([this](const std::size_t index) { return data_[index].has_value(); }) //
                | std::views::transform([this](const std::size_t index)
                    { return std::pair(State::from_index(index), *data_[index]); });
        }

    private:
        std::vector<std::optional<ResolvedValue>> data_;
    };
} // namespace chs
