#ifndef TRUTH_TABLE_H
#define TRUTH_TABLE_H

#include "automaton.hpp"

#include <vector>
#include <string>
#include <string_view>

namespace automata
{
    class TruthTable
    {
    public:
        TruthTable() = default;
        explicit TruthTable(const Automaton& fa);

        // lays the automaton out as a header row plus one row per state,
        // replacing whatever was built before. Nothing refers back to fa afterwards
        auto build(const Automaton& fa) -> void;

        // the boxed, column aligned table ready for printing
        auto write() const -> std::string;

        auto header() const -> const std::vector<std::string>& { return m_header; }
        auto rows() const -> const std::vector<std::vector<std::string>>& { return m_rows; }

    private:
        // "-->", "<--", "<-->" or nothing in front of the state name
        static auto label(const Automaton& fa, const State_t& state) -> std::string;

        // the space joined destinations, "-" when there is no transition
        static auto cell(const Automaton& fa, const State_t& state, std::string_view symbol) -> std::string;

        std::vector<std::string> m_header;
        std::vector<std::vector<std::string>> m_rows;
    };

    [[nodiscard]]
    auto truth_table(const Automaton& fa) -> std::string;
}

#endif
