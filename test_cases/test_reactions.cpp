/*
 * <Tests for recipes and the reaction orchestrator>
 * Copyright (C) 2025 Conrad Hübler <Conrad.Huebler@gmx.net>
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 *
 */

#include "src/capabilities/reaction_orchestrator.h"
#include "src/capabilities/recipes.h"
#include "src/capabilities/simulation.h"

#include "src/core/parameter_registry.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

class ReactionTest {
public:
    int tests_run = 0;
    int tests_passed = 0;

    void assert_equal(double expected, double actual, double tolerance, const std::string& msg = "")
    {
        tests_run++;
        if (std::abs(expected - actual) < tolerance) {
            tests_passed++;
            std::cout << "✓ " << msg << std::endl;
        } else {
            std::cout << "✗ FAIL: " << msg << " - Expected: " << expected
                      << ", Got: " << actual << std::endl;
        }
    }

    void assert_true(bool condition, const std::string& msg = "")
    {
        tests_run++;
        if (condition) {
            tests_passed++;
            std::cout << "✓ " << msg << std::endl;
        } else {
            std::cout << "✗ FAIL: " << msg << std::endl;
        }
    }

    void assert_false(bool condition, const std::string& msg = "")
    {
        assert_true(!condition, msg);
    }

    void print_summary()
    {
        std::cout << "\n============================================" << std::endl;
        std::cout << "Tests: " << tests_passed << "/" << tests_run << " passed" << std::endl;
        std::cout << "============================================" << std::endl;
    }
};

/* No random velocities, so the system energy equals the transient heat */
const json QUIET = { { "energy", { { "velocity_kick", 0.0 } } } };

Atom atom(int id, int protons)
{
    Atom result;
    result.id = id;
    result.protons = protons;
    result.electrons = protons;
    return result;
}

int countEvents(const std::vector<SimulationEvent>& events, EventType type)
{
    return static_cast<int>(std::count_if(events.begin(), events.end(),
        [type](const SimulationEvent& event) { return event.type == type; }));
}

int countMolecules(const Simulation& simulation, const std::string& name)
{
    int count = 0;
    for (const auto& molecule : simulation.molecules())
        if (molecule.name == name)
            ++count;
    return count;
}

/* Two bonded hydrogens turned into a molecule */
void addHydrogenMolecule(Simulation& simulation, const Position& position)
{
    const int a = simulation.addAtom(1, position);
    const int b = simulation.addAtom(1, position + Position(1.0, 0, 0));
    simulation.createManualBond(a, b);
    simulation.identifyMolecules();
}

int main()
{
    ReactionTest test;
    initialize_parameter_registry();

    std::cout << "\n=== Recipes ===" << std::endl;
    test.assert_equal(6, Recipes::all().size(), 0.5, "Six recipes");
    test.assert_true(Recipes::find("water") && Recipes::find("water")->heat_intensity == 8.0, "Water recipe heat intensity");
    test.assert_true(Recipes::find("ammonia") && !Recipes::find("ammonia")->natural, "Ammonia needs a catalyst");
    test.assert_true(Recipes::find("gold") == nullptr, "Unknown recipe");
    test.assert_true(Recipes::ids().front() == "water", "Recipe ids in catalog order");

    std::vector<SpawnSite> sites = Recipes::layout(*Recipes::find("water"), Position(10, 0, 0));
    test.assert_equal(6, sites.size(), 0.5, "2 H2 + O2 gives six atoms");
    test.assert_true(sites[0].partner == 1 && sites[1].partner == 0, "Diatomic partners reference each other");
    test.assert_equal(1.5, (sites[1].position - sites[0].position).norm(), 1e-12, "Diatomic atoms 1.5 apart");
    test.assert_equal(3.0, ((sites[0].position + sites[1].position) / 2.0 - Position(10, 0, 0)).norm(), 1e-12,
        "Units on a circle of radius 3");

    std::vector<SpawnSite> custom = Recipes::layoutSymbols("H, Xx ,O,", Position::Zero(), 2.0);
    test.assert_equal(2, custom.size(), 0.5, "Unknown and empty symbols skipped");
    test.assert_true(custom[1].protons == 8 && custom[1].position.x() == 2.0, "Symbols laid out along x");

    std::cout << "\n=== Chemical Stability ===" << std::endl;
    test.assert_true(ReactionOrchestrator::isChemicallyStable({ 1, 1 }), "H2");
    test.assert_true(ReactionOrchestrator::isChemicallyStable({ 8, 6, 8 }), "CO2 in any order");
    test.assert_true(ReactionOrchestrator::isChemicallyStable({ 1, 9 }), "HF");
    test.assert_true(ReactionOrchestrator::isChemicallyStable({ 1, 1, 1 }), "H3 passes the valence bound");
    test.assert_false(ReactionOrchestrator::isChemicallyStable({ 1, 8 }), "OH fails the valence bound");
    test.assert_false(ReactionOrchestrator::isChemicallyStable({ 11, 17 }), "NaCl pair fails the valence bound");
    test.assert_false(ReactionOrchestrator::isChemicallyStable({ 1 }), "Single atom");
    test.assert_false(ReactionOrchestrator::isChemicallyStable({ 1, 1, 1, 1, 1, 1, 1 }), "More than six atoms");

    std::cout << "\n=== Connectivity ===" << std::endl;
    ConfigManager bonding("bonding", json::object());
    BondEvaluator evaluator(bonding);
    auto co2 = ReactionOrchestrator::connect({ atom(1, 6), atom(2, 8), atom(3, 8) }, evaluator);
    test.assert_true(co2 && co2->size() == 2 && (*co2)[0] == IntPair(1, 2) && (*co2)[1] == IntPair(1, 3), "C, O, O: star around carbon");
    auto methane = ReactionOrchestrator::connect({ atom(5, 1), atom(6, 1), atom(7, 6), atom(8, 1), atom(9, 1) }, evaluator);
    test.assert_true(methane && methane->size() == 4, "C + 4 H: four bonds to carbon");
    auto h3 = ReactionOrchestrator::connect({ atom(1, 1), atom(2, 1), atom(3, 1) }, evaluator);
    test.assert_false(h3.has_value(), "Three hydrogens cannot be connected");
    test.assert_false(ReactionOrchestrator::connect({ atom(1, 2), atom(2, 1) }, evaluator).has_value(), "Helium cannot bond");

    std::cout << "\n=== Product Planning ===" << std::endl;
    auto water = ReactionOrchestrator::planProducts({ atom(1, 1), atom(2, 1), atom(3, 8), atom(4, 8), atom(5, 1), atom(6, 1) });
    test.assert_equal(2, water.size(), 0.5, "4 H + 2 O gives two groups");
    test.assert_true(water[0].geometry == "bent" && water[0].atoms.front() == 3 && water[0].bonds.size() == 2, "First water around oxygen 3");
    test.assert_true(water[1].atoms.front() == 4, "Second water around oxygen 4");

    auto ch4 = ReactionOrchestrator::planProducts({ atom(1, 6), atom(2, 1), atom(3, 1), atom(4, 1), atom(5, 1) });
    test.assert_true(ch4.size() == 1 && ch4[0].geometry == "tetrahedral" && ch4[0].bonds.size() == 4, "C + 4 H gives methane");

    auto leftovers = ReactionOrchestrator::planProducts({ atom(1, 7), atom(2, 7), atom(3, 1), atom(4, 1) });
    test.assert_equal(2, leftovers.size(), 0.5, "2 N + 2 H gives two diatomics");
    test.assert_true(leftovers[0].geometry == "linear" && leftovers[0].atoms == std::vector<int>({ 3, 4 }), "Diatomics by atomic number");

    std::cout << "\n=== Molecule + Molecule ===" << std::endl;
    {
        Simulation simulation(QUIET);
        const int carbon = simulation.addAtom(6, Position::Zero());
        addHydrogenMolecule(simulation, Position(3, 0, 0));
        addHydrogenMolecule(simulation, Position(-4, 0, 0));
        test.assert_false(simulation.reactions().findMoleculeReaction(simulation).has_value(), "No reaction without energy");

        simulation.addEnergy(20.0);
        auto plan = simulation.reactions().findMoleculeReaction(simulation);
        test.assert_true(plan && plan->description == "C + 2 H₂ → CH₄", "C + 2 H2 detected");
        test.assert_equal(15.0, plan->cost, 1e-9, "Cost max(15, 0.6 E)");
        test.assert_equal(2, plan->molecules.size(), 0.5, "Both hydrogen molecules consumed");
        test.assert_true(plan->groups.size() == 1 && plan->groups[0].atoms.front() == carbon, "Methane planned around the carbon");
    }

    std::cout << "\n=== Atom + Molecule ===" << std::endl;
    {
        Simulation simulation(QUIET);
        addHydrogenMolecule(simulation, Position::Zero());
        const int oxygen = simulation.addAtom(8, Position(3, 0, 0));
        simulation.addEnergy(15.0);
        test.assert_false(simulation.reactions().findAtomMoleculeReaction(simulation).has_value(), "O + H2 needs 16 energy");

        simulation.addEnergy(5.0);
        auto plan = simulation.reactions().findAtomMoleculeReaction(simulation);
        test.assert_true(plan && plan->kind == "atom+molecule", "O + H2 detected");
        test.assert_true(plan->groups.size() == 1 && plan->groups[0].geometry == "bent", "Product is bent water");
        test.assert_equal(2, plan->groups[0].bonds.size(), 0.5, "Two bonds to oxygen");
        test.assert_true(std::find(plan->groups[0].atoms.begin(), plan->groups[0].atoms.end(), oxygen) != plan->groups[0].atoms.end(),
            "Free atom joins the group");
    }

    {
        Simulation simulation(QUIET);
        const int o = simulation.addAtom(8, Position::Zero());
        const int h = simulation.addAtom(1, Position(1.0, 0, 0));
        simulation.createManualBond(o, h);
        simulation.identifyMolecules();
        test.assert_true(simulation.molecules().size() == 1 && simulation.molecules()[0].name == "hydrogen oxygen (HO)",
            "Hydroxyl carries a systematic name");
        simulation.addAtom(1, Position(3, 0, 0));
        simulation.addEnergy(10.0);
        test.assert_false(simulation.reactions().findAtomMoleculeReaction(simulation).has_value(),
            "H + HO is not priced like H + oxygen gas");
        simulation.addEnergy(6.0);
        auto plan = simulation.reactions().findAtomMoleculeReaction(simulation);
        test.assert_true(plan.has_value(), "H + HO detected at 16 energy");
        test.assert_equal(16.0, plan ? plan->cost : 0.0, 1e-9, "H + HO costs 10 + 3 per molecule atom");
    }

    std::cout << "\n=== Cluster Reactions ===" << std::endl;
    {
        Simulation simulation(QUIET);
        const int a = simulation.addAtom(1, Position::Zero());
        const int b = simulation.addAtom(1, Position(2, 0, 0));
        simulation.addEnergy(5.0);
        test.assert_true(simulation.reactions().detect(simulation), "Stable pair detected");
        test.assert_true(simulation.bondCount(a) == 1 && simulation.bondCount(b) == 1, "Pair bonded at once");
        test.assert_false(simulation.reactionInProgress(), "Pair bonding takes no lock");
    }
    {
        Simulation simulation(QUIET);
        const int oxygen = simulation.addAtom(8, Position::Zero());
        simulation.addAtom(1, Position(2, 0, 0));
        simulation.addAtom(1, Position(0, 2, 0));
        simulation.addEnergy(30.0);
        test.assert_true(simulation.reactions().detect(simulation), "Three atom cluster detected");
        test.assert_true(simulation.reactionInProgress(), "Cluster reaction holds the lock");
        test.assert_true(simulation.reactions().current()->kind == "cluster", "Plan kind");
        for (int i = 0; i < 5; ++i)
            simulation.step(1.0 / 60.0);
        test.assert_false(simulation.reactionInProgress(), "Lock released");
        test.assert_equal(1, countMolecules(simulation, "Water (H₂O)"), 0.5, "Cluster became water");
        test.assert_equal(2, simulation.bondCount(oxygen), 0.5, "Oxygen saturated");
        test.assert_true(simulation.transientHeat() < 30.0 - 16.0 + 1e-9, "Bond cost consumed per bond");
    }

    std::cout << "\n=== Staged Execution ===" << std::endl;
    {
        json config = QUIET;
        config["simulation"] = { { "auto_reactions", false } };
        Simulation simulation(config);
        const int h1 = simulation.addAtom(1, Position(-10, 0, 0));
        const int h2 = simulation.addAtom(1, Position(10, 0, 0));
        const int o = simulation.addAtom(8, Position(0, 10, 0));

        ReactionPlan plan;
        plan.kind = "manual";
        plan.description = "2 H + O → H₂O";
        plan.groups.push_back({ { o, h1, h2 }, { OrderedPair(o, h1), OrderedPair(o, h2) }, "bent" });
        plan.center = Position(1, 1, 1);

        test.assert_true(simulation.reactions().begin(simulation, plan), "Plan accepted");
        test.assert_true(simulation.reactions().current()->id == "manual-1", "Plan id from kind and counter");
        test.assert_true(simulation.reactions().current()->stage == ReactionStage::Positioning, "Staging runs at once");
        test.assert_false(simulation.reactions().begin(simulation, plan), "Second plan rejected while locked");

        simulation.step(1.0 / 60.0);
        test.assert_true(simulation.reactions().current()->stage == ReactionStage::Bonding, "Atoms positioned");
        test.assert_equal(1.5, (*simulation.atomPosition(h1) - *simulation.atomPosition(o)).norm(), 1e-9, "Placed at reaction bond length");

        for (int i = 0; i < 4; ++i)
            simulation.step(1.0 / 60.0);
        const auto events = simulation.drainEvents();
        test.assert_equal(1, countEvents(events, EventType::ReactionStarted), 0.5, "ReactionStarted emitted");
        test.assert_equal(1, countEvents(events, EventType::ReactionCompleted), 0.5, "ReactionCompleted emitted");
        auto completed = std::find_if(events.begin(), events.end(),
            [](const SimulationEvent& event) { return event.type == EventType::ReactionCompleted; });
        test.assert_true(completed != events.end() && completed->flag, "Reaction reported as successful");
        test.assert_equal(1, countMolecules(simulation, "Water (H₂O)"), 0.5, "Water formed");
        test.assert_equal(1, simulation.reactions().completed(), 0.5, "One completed reaction");
    }
    {
        json config = QUIET;
        config["simulation"] = { { "auto_reactions", false } };
        Simulation simulation(config);
        const int h1 = simulation.addAtom(1, Position(-3, 0, 0));
        const int h2 = simulation.addAtom(1, Position(3, 0, 0));

        ReactionPlan plan;
        plan.kind = "manual";
        plan.groups.push_back({ { h1, h2 }, { OrderedPair(h1, h2) }, "linear" });
        simulation.reactions().begin(simulation, plan);
        simulation.deleteAtom(h2);
        for (int i = 0; i < 4; ++i)
            simulation.step(1.0 / 60.0);

        const auto events = simulation.drainEvents();
        auto completed = std::find_if(events.begin(), events.end(),
            [](const SimulationEvent& event) { return event.type == EventType::ReactionCompleted; });
        test.assert_true(completed != events.end() && !completed->flag, "Plan with a deleted atom completes without bonds");
        test.assert_false(simulation.reactionInProgress(), "Lock released after the failed plan");
    }

    std::cout << "\n=== Water Recipe ===" << std::endl;
    {
        Simulation simulation(QUIET);
        std::vector<int> ids = simulation.spawnRecipe("water");
        test.assert_equal(6, ids.size(), 0.5, "Six atoms spawned");
        test.assert_equal(2, countMolecules(simulation, "Hydrogen Gas (H₂)"), 0.5, "Two hydrogen molecules");
        test.assert_equal(1, countMolecules(simulation, "Oxygen Gas (O₂)"), 0.5, "One oxygen molecule");

        simulation.addEnergy(25.0);
        for (int i = 0; i < 10; ++i)
            simulation.step(1.0 / 60.0);
        test.assert_equal(2, countMolecules(simulation, "Water (H₂O)"), 0.5, "2 H2 + O2 gave two water molecules");
        test.assert_equal(2, simulation.molecules().size(), 0.5, "Nothing else left");
        test.assert_true(std::find(simulation.discoveredMolecules().begin(), simulation.discoveredMolecules().end(), "Water (H₂O)")
                != simulation.discoveredMolecules().end(),
            "Water discovered");
    }

    test.print_summary();
    return (test.tests_run == test.tests_passed) ? 0 : 1;
}
