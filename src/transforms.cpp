#include "../include/transforms.hpp"

#include <map>
#include <queue>
#include <ranges>
#include <vector>
#include <algorithm>

#include <fmt/format.h>

namespace automata
{
    namespace ranges = std::ranges;

    namespace helpers
    {
        using ClosureMap = std::map<State_t, StateSet>;

        static auto closure_map(const Automaton& fa) -> ClosureMap
        {
            ClosureMap closures;
            for (const auto& state : fa.states())
            {
                closures.emplace(state, epsilon_closure(fa, state));
            }
            return closures;
        }

        // union of the closures of every state in `states`
        static auto close(const ClosureMap& closures, const StateSet& states) -> StateSet
        {
            StateSet closed;
            for (const auto& state : states)
            {
                if (auto it = closures.find(state); it != closures.end())
                {
                    closed.insert(it->second.begin(), it->second.end());
                }
                else
                {
                    closed.insert(state);
                }
            }
            return closed;
        }

        // the direct (non epsilon) successors of a set of states on one symbol
        static auto step(const Automaton& fa, const StateSet& states, std::string_view symbol) -> StateSet
        {
            StateSet targets;
            for (const auto& state : states)
            {
                if (auto dest = fa.destinations(state, symbol); dest != nullptr)
                {
                    targets.insert(dest->begin(), dest->end());
                }
            }
            return targets;
        }
    }

    auto standardize(Automaton& fa) -> Automaton&
    {
        if (is_standard(fa))
        {
            return fa;
        }

        const auto new_start = fa.fresh_state_name("q0_new");
        fa.add_state(new_start);

        // copy rather than move: the old start states keep their transitions
        for (const auto& start : fa.start_states())
        {
            if (fa.is_accept(start))
            {
                fa.add_accept_state(new_start);
            }
            if (auto symbols = fa.transitions_from(start); symbols != nullptr)
            {
                for (const auto& [symbol, targets] : *symbols)
                {
                    for (const auto& target : targets)
                    {
                        fa.add_transition(new_start, symbol, target);
                    }
                }
            }
        }

        fa.set_start_states({new_start});
        return fa;
    }

    auto complete(Automaton& fa) -> Automaton&
    {
        if (is_complete(fa))
        {
            return fa;
        }

        const auto sink = fa.fresh_state_name("p");
        fa.add_state(sink);

        for (const auto& state : fa.states())
        {
            for (const auto& symbol : fa.alphabet())
            {
                if (fa.destinations(state, symbol) == nullptr)
                {
                    fa.add_transition(state, symbol, sink);
                }
            }
        }

        for (const auto& symbol : fa.alphabet())
        {
            fa.add_transition(sink, symbol, sink);
        }

        return fa;
    }

    auto epsilon_closure(const Automaton& fa, std::string_view state) -> StateSet
    {
        StateSet closure{State_t{state}};
        std::vector<State_t> work_list{State_t{state}};

        while (!work_list.empty())
        {
            const auto current = std::move(work_list.back());
            work_list.pop_back();

            auto targets = fa.destinations(current, epsilon);
            if (targets == nullptr)
            {
                continue;
            }
            for (const auto& target : *targets)
            {
                // only states seen for the first time get expanded
                if (closure.insert(target).second)
                {
                    work_list.push_back(target);
                }
            }
        }
        return closure;
    }

    auto epsilon_closure(const Automaton& fa, const StateSet& states) -> StateSet
    {
        StateSet closure;
        for (const auto& state : states)
        {
            auto part = epsilon_closure(fa, state);
            closure.insert(part.begin(), part.end());
        }
        return closure;
    }

    auto determinize(const Automaton& fa) -> Automaton
    {
        if (is_deterministic(fa))
        {
            return fa;
        }

        const auto closures = helpers::closure_map(fa);

        Automaton dfa;
        for (const auto& symbol : fa.alphabet())
        {
            dfa.add_symbol(symbol);
        }

        std::map<StateSet, State_t> subset_names;
        std::queue<StateSet> pending;

        auto register_subset = [&](const StateSet& subset) -> const State_t&
        {
            auto [it, inserted] = subset_names.try_emplace(subset, fmt::format("S{}", subset_names.size()));
            if (inserted)
            {
                dfa.add_state(it->second);
                pending.push(subset);
            }
            return it->second;
        };

        const auto initial = helpers::close(closures, fa.start_states());
        dfa.add_start_state(register_subset(initial));

        while (!pending.empty())
        {
            const auto subset = std::move(pending.front());
            pending.pop();
            const auto name = subset_names.at(subset);

            if (ranges::any_of(subset, [&fa](const auto& s){ return fa.is_accept(s); }))
            {
                dfa.add_accept_state(name);
            }

            for (const auto& symbol : fa.alphabet())
            {
                auto target = helpers::close(closures, helpers::step(fa, subset, symbol));
                if (target.empty())
                {
                    continue;
                }
                dfa.add_transition(name, symbol, register_subset(target));
            }
        }

        return dfa;
    }

    auto accepts(const Automaton& fa, const std::vector<std::string>& word) -> bool
    {
        auto current = epsilon_closure(fa, fa.start_states());
        for (const auto& symbol : word)
        {
            if (current.empty() || !fa.alphabet().contains(symbol))
            {
                return false;
            }
            current = epsilon_closure(fa, helpers::step(fa, current, symbol));
        }
        return ranges::any_of(current, [&fa](const auto& s){ return fa.is_accept(s); });
    }
}
