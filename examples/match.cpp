#include <algorithm>
#include <array>
#include <cstdio>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <clu/text/print.h>

#include <chopsticks/arena/random_player.h>
#include <chopsticks/arena/solving_player.h>
#include <chopsticks/core/game.h>
#include <chopsticks/utils/tui.h>

namespace
{
    struct Config
    {
        std::array<std::unique_ptr<chs::Player>, 2> players;
        chs::State initial{};
        bool pause = false; // Wait for enter between plies when no one is typing moves
    };

    const std::string help = //
        R"(Usage: match <p0> <p1> [state]
    <p0> <p1>   the players, each of them one of
                  ai       plays the solved optimal moves
                  random   plays uniformly random legal moves
                  -        manual input
    [state]     initial state, e.g. "0:11|11" (side to move, then the hands of both sides)
Moves are typed as t<attacker><target> to tap, e.g. t12, or s<low><high> to split, e.g. s13)";

    std::unique_ptr<chs::Player> make_player(const std::string& kind)
    {
        if (kind == "-")
            return nullptr;
        if (kind == "ai")
            return std::make_unique<chs::SolvingPlayer>();
        if (kind == "random")
            return std::make_unique<chs::RandomPlayer>();
        throw std::runtime_error(help);
    }

    chs::Move get_user_move(const chs::State& state)
    {
        while (true)
        {
            clu::print("Your move: ");
            std::string input;
            if (!std::getline(std::cin, input))
                throw std::runtime_error("Input closed");
            const auto move = chs::parse_move(input);
            if (!move)
            {
                clu::println("Please enter a tap like t12 or a split like s13");
                continue;
            }
            const auto moves = chs::legal_moves(state);
            if (std::ranges::none_of(moves, [&](const chs::Transition& t) { return t.move == *move; }))
            {
                clu::println("That move is illegal");
                continue;
            }
            return *move;
        }
    }

    Config process_args(const int argc, const char* argv[])
    {
        if (argc != 3 && argc != 4)
            throw std::runtime_error(help);
        Config config{.players = {make_player(argv[1]), make_player(argv[2])}};
        config.pause = config.players[0] && config.players[1];
        if (argc == 4)
            config.initial = chs::State::read(argv[3]);
        return config;
    }

    void run_match(const Config& config)
    {
        chs::GameRecord record(config.initial);
        while (true)
        {
            const chs::State& state = record.current();
            chs::clear_screen();
            clu::println("Ply {}", record.ply_count());
            chs::display_state(state);
            if (state.is_terminal())
            {
                if (const auto winner = state.winner())
                    clu::println("Player {} wins", chs::index_of(*winner));
                else
                    clu::println("Both sides are out of hands");
                break;
            }
            if (record.repeated())
            {
                clu::println("Position repeated, the game is drawn");
                break;
            }
            const auto& player = config.players[chs::index_of(state.current)];
            const chs::Move move = player ? player->get_move(state) : get_user_move(state);
            clu::println("Player {} plays {}", chs::index_of(state.current), chs::to_string(move));
            record.play(move);
            if (config.pause)
                (void)std::getchar();
        }
        clu::println("Game ended after {} plies", record.ply_count());
    }
} // namespace

int main(const int argc, const char* argv[])
try
{
    const auto config = process_args(argc, argv);
    run_match(config);
    return 0;
}
catch (const std::exception& e)
{
    clu::println("Error due to exception:\n{}", e.what());
    return 1;
}
