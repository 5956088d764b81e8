#include "../include/truth_table.hpp"
#include "../include/utility.hpp"
#include "../include/ranges_helpers.hpp"

#include <ranges>
#include <algorithm>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace automata
{
    using namespace ::utility;

    TruthTable::TruthTable(const Automaton& fa)
    {
        build(fa);
    }

    static
    auto column_widths(
        const std::vector<std::string>& header,
        const std::vector<std::vector<std::string>>& rows
    ) -> std::vector<std::size_t>
    {
        auto widths = header
            | views::transform([](const auto& title){ return display_width(title); })
            | to<std::vector<std::size_t>>();

        for (const auto& row : rows)
        {
            for (std::size_t col = 0; col < row.size(); ++col)
            {
                widths[col] = std::max(widths[col], display_width(row[col]));
            }
        }
        return widths;
    }

    static
    auto write_border(const std::vector<std::size_t>& widths) -> std::string
    {
        auto dashes = widths
            | views::transform([](std::size_t w){ return std::string(w + 2, '-'); });
        return fmt::format("+{}+", fmt::join(dashes, "+"));
    }

    static
    auto write_row(const std::vector<std::string>& row, const std::vector<std::size_t>& widths) -> std::string
    {
        std::vector<std::string> cells;
        for (std::size_t col = 0; col < row.size(); ++col)
        {
            cells.push_back(fmt::format(" {:^{}} ", row[col], widths[col]));
        }
        return fmt::format("|{}|", fmt::join(cells, "|"));
    }

    auto TruthTable::label(const Automaton& fa, const State_t& state) -> std::string
    {
        const bool start  = fa.is_start(state);
        const bool accept = fa.is_accept(state);

        if (start && accept)
        {
            return fmt::format("<--> {}", state);
        }
        else if (accept)
        {
            return fmt::format("<-- {}", state);
        }
        else if (start)
        {
            return fmt::format("--> {}", state);
        }
        return state;
    }

    auto TruthTable::cell(const Automaton& fa, const State_t& state, std::string_view symbol) -> std::string
    {
        if (auto targets = fa.destinations(state, symbol); targets != nullptr)
        {
            return fmt::format("{}", fmt::join(*targets, " "));
        }
        return "-";
    }

    auto TruthTable::build(const Automaton& fa) -> void
    {
        // epsilon only gets a column when something actually uses it
        std::vector<std::string> symbols{fa.alphabet().begin(), fa.alphabet().end()};
        if (fa.has_epsilon_transitions())
        {
            symbols.emplace_back(epsilon);
        }

        m_header = {"State"};
        m_header.insert(m_header.end(), symbols.begin(), symbols.end());

        m_rows.clear();
        for (const auto& state : fa.states())
        {
            std::vector<std::string> row{label(fa, state)};
            for (const auto& symbol : symbols)
            {
                row.push_back(cell(fa, state, symbol));
            }
            m_rows.push_back(std::move(row));
        }
    }

    auto TruthTable::write() const -> std::string
    {
        const auto widths = column_widths(m_header, m_rows);
        const auto border = write_border(widths);

        std::vector<std::string> lines{border, write_row(m_header, widths), border};
        for (const auto& row : m_rows)
        {
            lines.push_back(write_row(row, widths));
        }
        lines.push_back(border);

        return fmt::format("{}\n", fmt::join(lines, "\n"));
    }

    auto truth_table(const Automaton& fa) -> std::string
    {
        return TruthTable(fa).write();
    }
}
