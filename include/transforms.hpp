#ifndef TRANSFORMS_H
#define TRANSFORMS_H

#include "automaton.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace automata
{
    // give the automaton a single start state; an already standard automaton is left alone.
    // the new start state is accepting if any of the old ones was
    auto standardize(Automaton& fa) -> Automaton&;

    // route every missing (state, symbol) transition to a new non-accepting sink state
    auto complete(Automaton& fa) -> Automaton&;

    [[nodiscard]]
    auto epsilon_closure(const Automaton& fa, std::string_view state) -> StateSet;

    [[nodiscard]]
    auto epsilon_closure(const Automaton& fa, const StateSet& states) -> StateSet;

    // subset construction, seeded from the closure of every start state.
    // new states are named S0, S1, ... in discovery order, S0 being the start
    [[nodiscard]]
    auto determinize(const Automaton& fa) -> Automaton;

    [[nodiscard]]
    auto accepts(const Automaton& fa, const std::vector<std::string>& word) -> bool;
}

#endif
