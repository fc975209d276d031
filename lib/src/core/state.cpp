#include "chopsticks/core/state.h"

#include <format>

#include "chopsticks/core/errors.h"

namespace chs
{
    namespace
    {
        std::uint8_t checked_hand(const int value)
        {
            if (value < 0 || value > max_fingers)
                throw InvalidState(std::format("Hand value {} is outside [0, {}]", value, max_fingers));
            return static_cast<std::uint8_t>(value);
        }
    } // namespace

    State State::make(const int first_left, const int first_right, //
        const int second_left, const int second_right, const Side current)
    {
        return {.current = current,
            .hands = {Hands{checked_hand(first_left), checked_hand(first_right)},
                Hands{checked_hand(second_left), checked_hand(second_right)}}};
    }

    State State::read(const std::string_view repr)
    {
        const auto error = [&] { throw InvalidState(std::format("Invalid state representation \"{}\"", repr)); };
        if (repr.size() != 7 || repr[1] != ':' || repr[4] != '|')
            error();
        const auto digit = [&](const char ch)
        {
            if (ch < '0' || ch > '9')
                error();
            return ch - '0';
        };
        const int side = digit(repr[0]);
        if (side > 1)
            error();
        return make(digit(repr[2]), digit(repr[3]), digit(repr[5]), digit(repr[6]), static_cast<Side>(side));
    }

    void State::validate() const
    {
        if (!is_valid())
            throw InvalidState(std::format("Hand values of state {} are outside [0, {}]", to_string(*this), max_fingers));
    }

    std::optional<Side> State::winner() const
    {
        if (!is_terminal())
            throw InvalidState(std::format("State {} is not terminal, there is no winner yet", to_string(*this)));
        const bool first_dead = hands[0].is_dead(), second_dead = hands[1].is_dead();
        if (first_dead && second_dead)
            return std::nullopt;
        return first_dead ? Side::second : Side::first;
    }

    std::string to_string(const State& state)
    {
        return std::format("{}:{}{}|{}{}", index_of(state.current), //
            state.hands[0].left, state.hands[0].right, state.hands[1].left, state.hands[1].right);
    }
} // namespace chs
