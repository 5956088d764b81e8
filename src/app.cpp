#include "../include/app.hpp"

#include "../include/parser.hpp"
#include "../include/automaton.hpp"
#include "../include/transforms.hpp"
#include "../include/truth_table.hpp"
#include "../include/utility.hpp"
#include "../include/ranges_helpers.hpp"

#include <fmt/format.h>

#include <fstream>
#include <stdexcept>

namespace app
{
    namespace views = std::views;

    static
    auto describe(std::string_view title, const automata::Automaton& fa) -> std::string
    {
        return fmt::format(
            "{}\n{}{}\n\n",
            title,
            automata::truth_table(fa),
            automata::classify(fa)
        );
    }

    static
    auto to_word(std::string_view text) -> std::vector<std::string>
    {
        const auto symbols = utility::split_whitespace(text);
        return symbols
            | views::transform([](std::string_view sym){ return parser::to_symbol(sym); })
            | utility::to<std::vector<std::string>>();
    }

    auto resolve_steps(Options options) -> Options
    {
        if (!options.standardize && !options.determinize && !options.complete)
        {
            options.standardize = true;
            options.complete = true;
        }
        return options;
    }

    auto report(const std::filesystem::path& path, Options options) -> std::string
    {
        options = resolve_steps(std::move(options));

        auto fa = parser::load_automaton_or_empty(path);
        std::string out = describe("Automaton", fa);

        if (options.standardize)
        {
            automata::standardize(fa);
            out += describe("Standardized", fa);
        }
        if (options.determinize)
        {
            fa = automata::determinize(fa);
            out += describe("Determinized", fa);
        }
        if (options.complete)
        {
            automata::complete(fa);
            out += describe("Completed", fa);
        }

        for (const auto& word : options.words)
        {
            out += fmt::format(
                "'{}' : {}\n",
                word,
                automata::accepts(fa, to_word(word)) ? "accepted" : "rejected"
            );
        }
        return out;
    }

    auto run(const std::filesystem::path &path, Options options) -> void
    {
        const auto out_file = options.out_file;
        const auto output = report(path, std::move(options));

        // write the result
        if (out_file.has_value())
        {
            std::ofstream output_file;
            output_file.open(out_file.value(), std::ios::out | std::ios::trunc);
            if (!output_file)
            {
                throw std::runtime_error(
                    fmt::format("<OUTPUT FILE ERROR> : could not open '{}' for writing", out_file->string()));
            }
            output_file << output;
            output_file.close();
        }
        else
        {
            fmt::print("{}", output);
        }
    }
}
