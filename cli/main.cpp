#include <cstdlib>

#include <array>
#include <fstream>
#include <iostream>

#include <CLI/CLI.hpp>

#include "remin/config.h"
#include "remin/driver.h"

#include "remin/automaton/dfa.h"

using namespace remin;
using namespace std::literals;

enum Stages { Eps, Nfa, Dfa, Min, Num_Stages };

int main(int argc, char** argv) {
    CLI::App app{"Compiles a regular expression to a minimal deterministic finite automaton"};
    auto formatter = app.get_formatter();
    formatter->label("INT", "<level>");
    formatter->label("TEXT", "<arg>");
    Driver driver; // thrown Errors point into its path
    try {
        static const auto version = "remin command-line utility version " REMIN_VER "\n";

        bool show_version       = false;
        bool no_minimize        = false;
        bool per_state_closures = false;
        std::string pattern;
        std::vector<std::string> words;
        std::array<std::string, Num_Stages> output;
        int verbose = 0;
        auto& flags = driver.flags();

        // clang-format off
        app.add_option(      "pattern",              pattern,                 "Regular expression over ASCII letters and digits with '+', '*' and parentheses.");
        app.add_flag  ("-v,--version",               show_version,            "Display version info and exit.");
        app.add_flag  ("-V,--verbose",               verbose,                 "Verbose mode. Multiple -V options increase the verbosity. The maximum is 3.");
        app.add_option("-m,--match",                 words,                   "Checks whether the resulting automaton accepts <arg>.");
        app.add_option(   "--output-eps",            output[Eps],             "Emits the ε-NFA using Graphviz' DOT language.");
        app.add_option(   "--output-nfa",            output[Nfa],             "Emits the ε-free NFA using Graphviz' DOT language.");
        app.add_option(   "--output-dfa",            output[Dfa],             "Emits the DFA after subset construction using Graphviz' DOT language.");
        app.add_option(   "--output-min",            output[Min],             "Emits the minimal DFA using Graphviz' DOT language.");
        app.add_flag  (   "--no-minimize",           no_minimize,             "Stops after subset construction.");
        app.add_flag  (   "--prune",                 flags.prune_unreachable, "Removes states unreachable from the start before minimizing.");
        app.add_flag  (   "--per-state-closures",    per_state_closures,      "Keeps one NFA state per ε-NFA state instead of merging ε-closures.");
        app.add_flag  (   "--renumber",              flags.renumber,          "Renumbers the ε-NFA in depth-first order before removing ε-transitions.");
        app.parse(argc, argv);
        // clang-format on

        if (show_version) {
            std::cerr << version;
            std::exit(EXIT_SUCCESS);
        }

        flags.minimize       = !no_minimize;
        flags.merge_closures = !per_state_closures;

        if (verbose > int(Log::Level::Debug) + 1) throw CLI::ValidationError("--verbose can only be given 0 to 3 times");
        if (verbose > 0) driver.log().set(&std::cerr).set((Log::Level)(verbose - 1));

        if (!output[Min].empty() && !flags.minimize)
            throw std::invalid_argument("error: --output-min contradicts --no-minimize");

        // prepare output files and streams
        std::array<std::ofstream, Num_Stages> ofs;
        std::array<std::ostream*, Num_Stages> os;
        os.fill(nullptr);
        for (size_t stage = 0; stage != Num_Stages; ++stage) {
            if (output[stage].empty()) continue;
            if (output[stage] == "-") {
                os[stage] = &std::cout;
            } else {
                ofs[stage].open(output[stage]);
                if (!ofs[stage]) throw std::invalid_argument("error: cannot open '"s + output[stage] + "' for writing");
                os[stage] = &ofs[stage];
            }
        }

        if (pattern.empty()) throw std::invalid_argument("error: no pattern given");

        auto automata = driver.compile(pattern);

        if (os[Eps]) *os[Eps] << *automata.eps;
        if (os[Nfa]) *os[Nfa] << *automata.nfa;
        if (os[Dfa]) *os[Dfa] << *automata.dfa;
        if (os[Min]) *os[Min] << *automata.min;

        for (const auto& word : words)
            outln("{}: {}", word, automaton::accepts(automata.result(), word) ? "accept" : "reject");
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    } catch (const Error& e) {
        errln("{}", e);
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        errln("{}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
