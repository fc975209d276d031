#include "chopsticks/utils/tui.h"

#include <initializer_list>
#include <clu/text/print.h>

namespace chs
{
    namespace
    {
        void display_hand(const int fingers)
        {
            static constexpr std::string_view raised = "|";
            static constexpr std::string_view folded = ".";
            if (fingers == 0)
            {
                clu::print_nonformatted("\x1b[2m x x x x \x1b[m");
                return;
            }
            clu::print_nonformatted(" ");
            for (int i = 0; i < max_fingers; i++)
                clu::print("{} ", i < fingers ? raised : folded);
        }
    } // namespace

    void clear_screen() { clu::print_nonformatted("\033[H\033[J"); }

    void display_hands(const Hands hands)
    {
        clu::print_nonformatted("[");
        display_hand(hands.left);
        clu::print_nonformatted("] [");
        display_hand(hands.right);
        clu::print_nonformatted("]");
    }

    void display_state(const State& state)
    {
        for (const Side side : {Side::first, Side::second})
        {
            if (state.current == side)
                clu::print("\x1b[7mPLAYER {}\x1b[m  ", index_of(side));
            else
                clu::print("PLAYER {}  ", index_of(side));
            display_hands(state.hands[index_of(side)]);
            clu::println("  ({}, {})", state.hands[index_of(side)].left, state.hands[index_of(side)].right);
        }
    }
} // namespace chs
