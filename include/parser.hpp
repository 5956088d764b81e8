#ifndef PARSER_H
#define PARSER_H

#include "FA_elements.hpp"
#include "automaton.hpp"

#include <string>
#include <string_view>
#include <filesystem>

#include <tl/expected.hpp>

namespace parser
{

    enum class ParseError
    {
        EmptyPath,
        FileNotFound,
        UnreadableFile,
        MalformedTransition
    };

    [[noreturn]]
    void HandleParseError(const ParseError err);

    [[nodiscard]]
    auto read_file(const std::filesystem::path& path) -> tl::expected<std::string, ParseError>;

    // maps the textual spellings of the empty transition onto automata::epsilon
    [[nodiscard]]
    auto to_symbol(std::string_view token) -> std::string;

    [[nodiscard]]
    auto transition_from_line(std::string_view line) -> tl::expected<FATransition, ParseError>;

    [[nodiscard]]
    auto parse_automaton(std::string_view text) -> tl::expected<automata::Automaton, ParseError>;

    [[nodiscard]]
    auto load_automaton(const std::filesystem::path& path) -> tl::expected<automata::Automaton, ParseError>;

    // like load_automaton, but a missing file is reported on stderr and gives an
    // empty automaton. Any other error is raised through HandleParseError
    [[nodiscard]]
    auto load_automaton_or_empty(const std::filesystem::path& path) -> automata::Automaton;
}

#endif
