#ifndef AUTOMATON_H
#define AUTOMATON_H

#include <set>
#include <map>
#include <string>
#include <string_view>

namespace automata
{
    // the reserved symbol labelling an empty transition
    inline constexpr std::string_view epsilon = "ε";

    using State_t     = std::string;
    using Symbol_t    = std::string;
    using StateSet    = std::set<State_t>;
    using SymbolSet   = std::set<Symbol_t>;
    using SymbolMap   = std::map<Symbol_t, StateSet>;
    using Transitions = std::map<State_t, SymbolMap>;

    class Automaton
    {
    public:
        Automaton() = default;

        // building, each of these can be called again with the same value
        auto add_state(std::string_view state) -> void;
        auto add_symbol(std::string_view symbol) -> void;
        auto add_start_state(std::string_view state) -> void;
        auto add_accept_state(std::string_view state) -> void;
        auto add_transition(
            std::string_view from_state,
            std::string_view symbol,
            std::string_view to_state
        ) -> void;

        // replaces the initial states wholesale (used by standardization)
        auto set_start_states(StateSet start_states) -> void;

        auto states() const -> const StateSet& { return m_states; }
        auto alphabet() const -> const SymbolSet& { return m_alphabet; }
        auto start_states() const -> const StateSet& { return m_start_states; }
        auto accept_states() const -> const StateSet& { return m_accept_states; }
        auto transitions() const -> const Transitions& { return m_transitions; }

        // the outgoing transitions of a state, or nullptr if it has none recorded
        auto transitions_from(std::string_view state) const -> const SymbolMap*;

        // the destinations for (state, symbol), or nullptr if there is no entry
        auto destinations(std::string_view state, std::string_view symbol) const -> const StateSet*;

        auto has_state(std::string_view state) const -> bool;
        auto is_start(std::string_view state) const -> bool;
        auto is_accept(std::string_view state) const -> bool;
        auto has_epsilon_transitions() const -> bool;
        auto empty() const -> bool { return m_states.empty(); }

        // returns base if it is not a state yet, else the first free base_1, base_2, ...
        [[nodiscard]]
        auto fresh_state_name(std::string_view base) const -> State_t;

        auto operator==(const Automaton&) const -> bool = default;

    private:
        StateSet m_states;
        SymbolSet m_alphabet;
        StateSet m_start_states;
        StateSet m_accept_states;
        Transitions m_transitions;
    };

    [[nodiscard]]
    auto is_deterministic(const Automaton& fa) -> bool;

    [[nodiscard]]
    auto is_complete(const Automaton& fa) -> bool;

    [[nodiscard]]
    auto is_standard(const Automaton& fa) -> bool;

    // "deterministic complete standard" style summary, or "not recognized"
    [[nodiscard]]
    auto classify(const Automaton& fa) -> std::string;
}

#endif
