#pragma once

#include "../core/state.h"

CHOPSTICKS_SUPPRESS_EXPORT_WARNING

namespace chs
{
    CHOPSTICKS_API void clear_screen();
    CHOPSTICKS_API void display_hands(Hands hands);
    CHOPSTICKS_API void display_state(const State& state);
} // namespace chs

CHOPSTICKS_RESTORE_EXPORT_WARNING
