#include "../include/app.hpp"

#include <argparse/argparse.hpp>
#include <fmt/format.h>

#include <cstdlib>
#include <iostream>

auto main(const int argc, char const * const * const argv) -> int
{
    argparse::ArgumentParser program("FA.io");

    program.add_argument("-f", "--file")
        .default_value(std::string{"fa.txt"})
        .help("Specify the automaton description you wish to load.");
    program.add_argument("-o", "--outfile")
        .help("Specify the file you wish to write the report to (optional)");
    program.add_argument("-s", "--standardize")
        .default_value(false)
        .implicit_value(true)
        .help("Give the automaton a single start state.");
    program.add_argument("-d", "--determinize")
        .default_value(false)
        .implicit_value(true)
        .help("Run the subset construction.");
    program.add_argument("-c", "--complete")
        .default_value(false)
        .implicit_value(true)
        .help("Add a sink state so every state has a transition on every symbol.");
    program.add_argument("-w", "--word")
        .append()
        .help("A space separated word to test against the final automaton (repeatable).");

    try {
        program.parse_args(argc, argv);
    }
    catch (const std::runtime_error& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        std::exit(1);
    }

    // set up the optional arguments
    app::Options options;
    if (auto o = program.present("-o"))
    {
        options.out_file = std::filesystem::path{*o};
    }
    options.standardize = program.get<bool>("--standardize");
    options.determinize = program.get<bool>("--determinize");
    options.complete    = program.get<bool>("--complete");
    if (auto words = program.present<std::vector<std::string>>("--word"))
    {
        options.words = *words;
    }

    // run with the options and the required arguments
    const std::filesystem::path infile{program.get<std::string>("--file")};
    try {
        app::run(infile, options);
    }
    catch (const std::runtime_error& err) {
        fmt::print(stderr, "{}\n", err.what());
        return 1;
    }
    return 0;
}
