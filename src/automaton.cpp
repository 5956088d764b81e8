#include "../include/automaton.hpp"
#include "../include/utility.hpp"

#include <ranges>
#include <vector>
#include <algorithm>

#include <fmt/format.h>

namespace automata
{
    namespace ranges = std::ranges;

    auto Automaton::add_state(std::string_view state) -> void
    {
        m_states.emplace(state);
    }

    auto Automaton::add_symbol(std::string_view symbol) -> void
    {
        // epsilon never counts as part of the alphabet
        if (symbol != epsilon)
        {
            m_alphabet.emplace(symbol);
        }
    }

    auto Automaton::add_start_state(std::string_view state) -> void
    {
        m_start_states.emplace(state);
    }

    auto Automaton::add_accept_state(std::string_view state) -> void
    {
        m_accept_states.emplace(state);
    }

    auto Automaton::add_transition(
        std::string_view from_state,
        std::string_view symbol,
        std::string_view to_state
    ) -> void
    {
        m_transitions[State_t{from_state}][Symbol_t{symbol}].emplace(to_state);
    }

    auto Automaton::set_start_states(StateSet start_states) -> void
    {
        m_start_states = std::move(start_states);
    }

    auto Automaton::transitions_from(std::string_view state) const -> const SymbolMap*
    {
        if (auto it = m_transitions.find(State_t{state}); it != m_transitions.end())
        {
            return &it->second;
        }
        return nullptr;
    }

    auto Automaton::destinations(std::string_view state, std::string_view symbol) const -> const StateSet*
    {
        if (auto symbols = transitions_from(state); symbols != nullptr)
        {
            if (auto it = symbols->find(Symbol_t{symbol}); it != symbols->end())
            {
                return &it->second;
            }
        }
        return nullptr;
    }

    auto Automaton::has_state(std::string_view state) const -> bool
    {
        return m_states.contains(State_t{state});
    }

    auto Automaton::is_start(std::string_view state) const -> bool
    {
        return m_start_states.contains(State_t{state});
    }

    auto Automaton::is_accept(std::string_view state) const -> bool
    {
        return m_accept_states.contains(State_t{state});
    }

    auto Automaton::has_epsilon_transitions() const -> bool
    {
        return ranges::any_of(m_transitions, [](const auto& entry){
            return entry.second.contains(Symbol_t{epsilon});
        });
    }

    auto Automaton::fresh_state_name(std::string_view base) const -> State_t
    {
        State_t name{base};
        for (unsigned suffix = 1; has_state(name); ++suffix)
        {
            name = fmt::format("{}_{}", base, suffix);
        }
        return name;
    }

    auto is_deterministic(const Automaton& fa) -> bool
    {
        for (const auto& [state, symbols] : fa.transitions())
        {
            for (const auto& [symbol, targets] : symbols)
            {
                if (symbol == epsilon || targets.size() > 1)
                {
                    return false;
                }
            }
        }
        return true;
    }

    auto is_complete(const Automaton& fa) -> bool
    {
        return ranges::all_of(fa.states(), [&fa](const auto& state){
            // a state with no transitions at all is incomplete, even over an empty alphabet
            if (fa.transitions_from(state) == nullptr)
            {
                return false;
            }
            return ranges::all_of(fa.alphabet(), [&](const auto& symbol){
                return fa.destinations(state, symbol) != nullptr;
            });
        });
    }

    auto is_standard(const Automaton& fa) -> bool
    {
        return fa.start_states().size() == 1;
    }

    auto classify(const Automaton& fa) -> std::string
    {
        std::vector<std::string> labels{
            is_deterministic(fa) ? "deterministic" : "",
            is_complete(fa)      ? "complete"      : "",
            is_standard(fa)      ? "standard"      : ""
        };

        auto summary = utility::join_non_empty_strings(labels, " ");
        return summary.empty() ? "not recognized" : summary;
    }
}
