#include "crossfill/errors.hpp"
#include "crossfill/grid.hpp"
#include "crossfill/io/loader.hpp"
#include "crossfill/render.hpp"
#include "crossfill/solver.hpp"
#include "crossfill/word_pool.hpp"
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <unistd.h>
#include <vector>

std::atomic<bool> g_timeout_flag{false};
crossfill::Solver* g_current_solver = nullptr;

void timeout_handler(int) {
    g_timeout_flag = true;
    if (g_current_solver) {
        g_current_solver->stop();
    }
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options] <structure> <words> [output.svg]\n";
    std::cerr << "  -v                     Verbose mode (print search progress)\n";
    std::cerr << "  -s                     Print solver statistics to stderr\n";
    std::cerr << "  -t SEC                 Timeout in seconds\n";
    std::cerr << "  -n STEPS               Maximum number of word placements\n";
    std::cerr << "  --lcv                  Try least constraining words first\n";
    std::cerr << "  --no-forward-checking  Disable forward checking\n";
    std::cerr << "  --no-arc-consistency   Disable the AC-3 presolve\n";
    std::cerr << "  --reject-single-cells  Treat open cells outside every slot as an error\n";
}

bool g_print_stats = false;

void print_stats(const crossfill::Solver& solver) {
    if (!g_print_stats) return;
    const auto& s = solver.stats();
    std::cerr << "Stats: nodes=" << s.nodes
              << " backtracks=" << s.backtracks
              << " max_depth=" << s.max_depth
              << " prunes=" << s.prune_count
              << " presolve_removed=" << s.presolve_removed
              << "\n";
}

int main(int argc, char* argv[]) {
    bool verbose = false;
    int timeout_sec = 0;
    size_t step_limit = 0;
    bool forward_checking = true;
    bool arc_consistency = true;
    bool lcv = false;
    crossfill::TopologyOptions topology_options;
    std::vector<const char*> positional;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-v") == 0) {
            verbose = true;
        } else if (std::strcmp(argv[i], "-s") == 0) {
            g_print_stats = true;
        } else if (std::strcmp(argv[i], "-t") == 0 && i + 1 < argc) {
            timeout_sec = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "-n") == 0 && i + 1 < argc) {
            step_limit = std::strtoull(argv[++i], nullptr, 10);
        } else if (std::strcmp(argv[i], "--lcv") == 0) {
            lcv = true;
        } else if (std::strcmp(argv[i], "--no-forward-checking") == 0) {
            forward_checking = false;
        } else if (std::strcmp(argv[i], "--no-arc-consistency") == 0) {
            arc_consistency = false;
        } else if (std::strcmp(argv[i], "--reject-single-cells") == 0) {
            topology_options.single_cells = crossfill::SingleCellPolicy::Reject;
        } else if (std::strcmp(argv[i], "-h") == 0 ||
                   std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (argv[i][0] != '-') {
            positional.push_back(argv[i]);
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (positional.size() < 2 || positional.size() > 3) {
        print_usage(argv[0]);
        return 1;
    }
    const std::string structure_path = positional[0];
    const std::string words_path = positional[1];
    const std::string output_path = positional.size() == 3 ? positional[2] : "";

    try {
        auto topology = crossfill::Topology::from_structure(
            crossfill::io::load_structure(structure_path), topology_options);
        crossfill::WordPool pool(crossfill::io::load_word_list(words_path));

        crossfill::Solver solver;
        solver.set_verbose(verbose);
        solver.set_forward_checking(forward_checking);
        solver.set_arc_consistency(arc_consistency);
        solver.set_step_limit(step_limit);
        if (lcv) {
            solver.set_value_order(crossfill::ValueOrder::LeastConstraining);
        }
        g_current_solver = &solver;

        // Setup timeout
        if (timeout_sec > 0) {
            std::signal(SIGALRM, timeout_handler);
            alarm(timeout_sec);
        }

        crossfill::Assignment assignment;
        try {
            assignment = solver.fill(topology, pool);
        } catch (const crossfill::SearchBudgetExceededError& e) {
            print_stats(solver);
            std::cerr << (g_timeout_flag ? "Timed out: " : "Search gave up: ") << e.what() << "\n";
            return 1;
        } catch (const crossfill::UnsatisfiableError& e) {
            print_stats(solver);
            std::cerr << "No solution: " << e.what() << "\n";
            return 1;
        }
        g_current_solver = nullptr;
        print_stats(solver);

        crossfill::render_text(std::cout, topology, assignment);
        if (!output_path.empty()) {
            crossfill::save_svg(output_path, topology, assignment);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
