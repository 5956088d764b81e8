#ifndef FA_ELEMENTS_H
#define FA_ELEMENTS_H

#include <string>
#include <string_view>
#include <vector>
#include <optional>

namespace parser
{
    // the line markers of the text format
    enum class Section
    {
        States,
        Alphabet,
        Start,
        Accept,
        Transitions
    };

    struct FASection
    {
        FASection() = default;
        FASection(
            Section section,
            const std::vector<std::string>& tokens
        )
            : m_section{section},
              m_tokens{tokens} {}

        auto operator<=>(const FASection &) const = default;

        Section m_section{Section::States};
        std::vector<std::string> m_tokens;
    };

    // one `from_state symbol to_state` line
    struct FATransition
    {
        FATransition() = default;
        FATransition(
            std::string_view from_state,
            std::string_view symbol,
            std::string_view to_state
        )
            : m_from_state{from_state},
              m_symbol{symbol},
              m_to_state{to_state} {}

        auto operator<=>(const FATransition &) const = default;

        std::string m_from_state;
        std::string m_symbol;
        std::string m_to_state;
    };

    // a section line like "States: q0 q1" split into its marker and tokens
    [[nodiscard]]
    auto section_from_line(std::string_view line) -> std::optional<FASection>;
}

using Sections_t = std::vector<parser::FASection>;
using FATransitions_t = std::vector<parser::FATransition>;

#endif
