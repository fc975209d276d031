#include <iterator>

#include <clu/text/print.h>
#include <clu/chrono_utils.h>
#include <clu/parse.h>
#include <chopsticks/utils/humanize.h>
#include <chopsticks/utils/perft.h>
#include <chopsticks/evaluation/graph_solver.h>

namespace
{
    // Move paths from the start position, counted by hand
    constexpr std::uint64_t expected_values[]{1, 2, 5};

    void census()
    {
        chs::GraphSolver solver;
        std::size_t resolved = 0;
        const auto elapsed = clu::timeit([&] { resolved = solver.solve_all(); });
        std::size_t wins = 0, losses = 0, draws = 0;
        for (const auto& [state, value] : solver.memo_table().entries())
        {
            switch (value.outcome)
            {
                case chs::Outcome::win: wins++; break;
                case chs::Outcome::loss: losses++; break;
                case chs::Outcome::drawn: draws++; break;
            }
        }
        clu::println("[Census]");
        clu::println("{} states resolved in {:1}, {} nodes traversed", resolved, chs::humanize(elapsed),
            solver.traversed_nodes());
        clu::println("Wins: {}, losses: {}, drawn: {}", wins, losses, draws);
        clu::println("Start position: {}", chs::to_string(solver.resolve(chs::State{})));
    }
} // namespace

int main(const int argc, const char* argv[])
{
    int max_depth = 12;
    if (argc == 2)
    {
        const auto depth = clu::parse<int>(argv[1]);
        if (!depth || *depth <= 0)
        {
            clu::println("Usage: perft_test [max depth]");
            return 1;
        }
        max_depth = *depth;
    }
    clu::println("[Perft]");
    for (int i = 0; i <= max_depth; i++)
    {
        std::uint64_t res;
        const auto elapsed = clu::timeit([&] { res = chs::perft(i); });
        clu::println("Depth {:2}: {:20} paths (elapsed {})", i, res, chs::humanize(elapsed));
        if (static_cast<std::size_t>(i) < std::size(expected_values) && res != expected_values[i])
        {
            clu::println("ERROR! Expected: {} paths", expected_values[i]);
            return 1;
        }
    }
    census();
}
