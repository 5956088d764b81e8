#include "../include/parser.hpp"
#include "../include/FA_elements.hpp"
#include "../include/utility.hpp"
#include "../include/ranges_helpers.hpp"

#include <array>
#include <utility>
#include <fstream>
#include <sstream>
#include <ranges>
#include <algorithm>
#include <stdexcept>

#include <fmt/format.h>

namespace parser
{
    // namespaces aliases
    namespace views = std::views;
    namespace ranges = std::ranges;

    // helper functions
    namespace helpers
    {
        static auto to_strings(const std::vector<std::string_view>& tokens) -> std::vector<std::string>
        {
            return tokens
                | views::transform([](std::string_view tok){ return std::string(tok); })
                | utility::to<std::vector<std::string>>();
        }

        static auto lines(std::string_view text)
        {
            return text
                | views::split('\n')
                | views::transform([](auto r){ return utility::trim(std::string_view(r.begin(), r.end())); });
        }

        static auto apply_section(automata::Automaton& fa, const FASection& section) -> void
        {
            for (const auto& token : section.m_tokens)
            {
                switch (section.m_section)
                {
                case Section::States:
                    fa.add_state(token);
                    break;
                case Section::Alphabet:
                    fa.add_symbol(to_symbol(token));
                    break;
                case Section::Start:
                    fa.add_state(token);
                    fa.add_start_state(token);
                    break;
                case Section::Accept:
                    fa.add_state(token);
                    fa.add_accept_state(token);
                    break;
                case Section::Transitions:
                    break;
                }
            }
        }
    }

    auto section_from_line(std::string_view line) -> std::optional<FASection>
    {
        using namespace std::literals;
        static constexpr std::array markers{
            std::pair{"States:"sv,      Section::States},
            std::pair{"Alphabet:"sv,    Section::Alphabet},
            std::pair{"Start:"sv,       Section::Start},
            std::pair{"Accept:"sv,      Section::Accept},
            std::pair{"Transitions:"sv, Section::Transitions}
        };

        for (const auto& [marker, section] : markers)
        {
            if (line.starts_with(marker))
            {
                auto tokens = utility::split_whitespace(line.substr(marker.size()));
                return FASection(section, helpers::to_strings(tokens));
            }
        }
        return std::nullopt;
    }

    auto to_symbol(std::string_view token) -> std::string
    {
        if (token == "eps" || token == automata::epsilon)
        {
            return std::string{automata::epsilon};
        }
        return std::string{token};
    }

    auto read_file(const std::filesystem::path& path) -> tl::expected<std::string, ParseError>
    {
        if (path.empty())
        {
            return tl::unexpected<ParseError>(ParseError::EmptyPath);
        }

        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec))
        {
            return tl::unexpected<ParseError>(ParseError::FileNotFound);
        }

        std::ifstream file(path);
        if (!file)
        {
            return tl::unexpected<ParseError>(ParseError::UnreadableFile);
        }

        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    auto transition_from_line(std::string_view line) -> tl::expected<FATransition, ParseError>
    {
        auto toks = utility::split_whitespace(line);
        if (toks.size() != 3)
        {
            return tl::unexpected<ParseError>(ParseError::MalformedTransition);
        }
        return FATransition(toks[0], to_symbol(toks[1]), toks[2]);
    }

    auto parse_automaton(std::string_view text) -> tl::expected<automata::Automaton, ParseError>
    {
        Sections_t sections;
        std::vector<std::string_view> transition_lines;

        // a Transitions: marker swallows every following line up to the next blank one
        bool in_transitions = false;
        for (auto line : helpers::lines(text))
        {
            if (in_transitions)
            {
                if (line.empty())
                {
                    in_transitions = false;
                }
                else
                {
                    transition_lines.push_back(line);
                }
                continue;
            }

            if (auto section = section_from_line(line); section.has_value())
            {
                if (section->m_section == Section::Transitions)
                {
                    in_transitions = true;
                }
                else
                {
                    sections.push_back(std::move(section.value()));
                }
            }
        }

        auto transitions = utility::to_expected(transition_lines | views::transform(transition_from_line));
        if (!transitions)
        {
            return tl::unexpected<ParseError>(transitions.error());
        }

        automata::Automaton fa;
        for (const auto& section : sections)
        {
            helpers::apply_section(fa, section);
        }
        for (const auto& [from_state, symbol, to_state] : transitions.value())
        {
            fa.add_state(from_state);
            fa.add_state(to_state);
            fa.add_symbol(symbol);
            fa.add_transition(from_state, symbol, to_state);
        }
        return fa;
    }

    auto load_automaton(const std::filesystem::path& path) -> tl::expected<automata::Automaton, ParseError>
    {
        return read_file(path).and_then(parse_automaton);
    }

    auto load_automaton_or_empty(const std::filesystem::path& path) -> automata::Automaton
    {
        return load_automaton(path)
            .or_else([&path](const ParseError err) -> tl::expected<automata::Automaton, ParseError>
            {
                if (err == ParseError::EmptyPath || err == ParseError::FileNotFound)
                {
                    fmt::print(stderr, "Error: File '{}' not found.\n", path.string());
                    return automata::Automaton{};
                }
                HandleParseError(err);
            })
            .value();
    }

    // handle errors during loading and parsing
    void HandleParseError(const ParseError err)
    {
        switch (err)
        {
        case ParseError::EmptyPath:
            throw std::runtime_error(
                "<EMPTY PATH> you provided an empty path to the automaton description");
            break;
        case ParseError::FileNotFound:
            throw std::runtime_error(
                "<FILE NOT FOUND> : the automaton description does not exist");
            break;
        case ParseError::UnreadableFile:
            throw std::runtime_error(
                "<UNREADABLE FILE> : the automaton description could not be opened");
            break;
        case ParseError::MalformedTransition:
            throw std::runtime_error(
                "<MALFORMED TRANSITION> : every line after 'Transitions:' must read "
                "'from_state symbol to_state' - is a blank line missing after the transitions?");
            break;
        default:
            throw std::runtime_error(
                "Something unexpected went wrong ... try again.");
            break;
        }
    }
}
