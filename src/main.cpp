#include "freediag/finset/fin_set.hpp"
#include "freediag/graph/free_diagram.inline.hpp"
#include "freediag/graph/shape_conversions.hpp"

#include <iostream>
#include <stdexcept>

#include <spdlog/cfg/argv.h>
#include <spdlog/spdlog.h>

using namespace freediag;

namespace
{

void print_diagram(const std::string& title, const FreeDiagram<FinFunction>& diagram)
{
    std::cout << "\n--- " << title << " ---\n";
    for (VertexIdx v : diagram.vertices())
    {
        std::cout << "  vertex " << v << ": " << diagram.ob(v) << "\n";
    }
    for (EdgeIdx e : diagram.edges())
    {
        std::cout << "  edge " << e << ": " << diagram.src(e) << " -> " << diagram.tgt(e)
                  << "  " << diagram.hom(e) << "\n";
    }
}

} // namespace

int main(int argc, char** argv)
{
    try
    {
        // Accepts SPDLOG_LEVEL=debug (or freediag=debug) on the command line.
        spdlog::cfg::load_argv_levels(argc, argv);

        std::cout << "\n\n====== freediag ======\n" << std::flush;

        const FinSet A(2);
        const FinSet B(3);
        const FinSet C(4);

        const FinFunction f({0, 2}, B);
        const FinFunction g({1, 3}, C);
        const FinFunction h({1, 1}, B);
        const FinFunction k({0, 0, 1}, B);

        print_diagram("span (f, g)", to_free_diagram(make_span(f, g)));
        print_diagram("cospan (f, h)", to_free_diagram(make_cospan(f, h)));
        print_diagram("parallel pair (f, h)", to_free_diagram(make_parallel_pair(f, h)));
        print_diagram("bulk", FreeDiagram<FinFunction>({A, B, C}, {{0, 1, f}, {0, 2, g}, {1, 1, k}}));

        std::cout << "\n\n====== normal exit ======\n" << std::flush;
    }
    catch (const std::exception& e)
    {
        std::cerr << "\n\nError:\n" << e.what() << "\n" << std::flush;
        std::cout << "\n\n====== abnormal exit ======\n" << std::flush;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
