/*
 * <Scenario tests for the bonding simulation>
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

#include "src/capabilities/simulation.h"

#include "src/core/parameter_registry.h"
#include "src/core/point_mass_world.h"
#include "src/core/valency_logger.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

class SimulationTest {
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

    void assert_equal(const std::string& expected, const std::string& actual, const std::string& msg = "")
    {
        tests_run++;
        if (expected == actual) {
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

const double DT = 1.0 / 60.0;

json quiet()
{
    return { { "energy", { { "velocity_kick", 0.0 } } } };
}

void run(Simulation& simulation, int steps)
{
    for (int i = 0; i < steps; ++i)
        simulation.step(DT);
}

int countEvents(const std::vector<SimulationEvent>& events, EventType type)
{
    return static_cast<int>(std::count_if(events.begin(), events.end(),
        [type](const SimulationEvent& event) { return event.type == type; }));
}

/* Hydrogen molecule from two atoms 1.0 apart, returns the molecule id */
std::string hydrogenMolecule(Simulation& simulation, const Position& position)
{
    const int a = simulation.addAtom(1, position);
    const int b = simulation.addAtom(1, position + Position(1, 0, 0));
    simulation.createManualBond(a, b);
    simulation.identifyMolecules();
    return PairKey(a, b);
}

int main()
{
    SimulationTest test;
    initialize_parameter_registry();
    ValencyLogger::set_verbosity(0);

    std::cout << "\n=== Hydrogen Pair Bonds Over Time ===" << std::endl;
    {
        Simulation simulation(quiet());
        const int a = simulation.addAtom(1, Position::Zero());
        const int b = simulation.addAtom(1, Position(1, 0, 0));
        simulation.addEnergy(5.0);

        run(simulation, 60);
        test.assert_true(simulation.bondManager().isForming(a, b), "Pair is forming after one second");
        test.assert_true(simulation.bonds().empty(), "No bond before the formation duration");

        run(simulation, 90);
        test.assert_equal(1, simulation.bonds().size(), 0.5, "One bond after the formation duration");
        test.assert_equal(1, simulation.molecules().size(), 0.5, "One molecule");
        test.assert_equal("Hydrogen Gas (H₂)", simulation.molecules().front().name, "Identified as hydrogen gas");
        test.assert_equal(1.36, simulation.evaluator().activationEnergy(1, 1), 1e-9, "H-H activation energy");
        test.assert_true(simulation.freeAtoms().empty(), "Both atoms are molecule members");

        const auto events = simulation.drainEvents();
        test.assert_equal(1, countEvents(events, EventType::BondCreated), 0.5, "BondCreated emitted once");
        auto formed = std::find_if(events.begin(), events.end(),
            [](const SimulationEvent& event) { return event.type == EventType::MoleculeFormed; });
        test.assert_true(formed != events.end() && formed->flag, "First hydrogen molecule is a discovery");
        test.assert_true(simulation.drainEvents().empty(), "Event queue drained");

        std::cout << "\n=== Overstretched Molecule Breaks ===" << std::endl;
        const Molecule molecule = simulation.molecules().front();
        PointMassWorld& world = static_cast<PointMassWorld&>(simulation.world());
        test.assert_true(world.setPartOffset(molecule.body, 1, Position(5, 0, 0)), "Molecule deformed");
        simulation.step(DT);
        test.assert_equal(0, simulation.molecules().size(), 0.5, "Molecule dissolved");
        test.assert_equal(0, simulation.bonds().size(), 0.5, "Bond broken");
        test.assert_equal(2, simulation.freeAtoms().size(), 0.5, "Atoms free again");
        test.assert_true(simulation.bondManager().inCooldown(a, b, simulation.elapsedMs()), "Broken pair in cooldown");
        const auto broken = simulation.drainEvents();
        test.assert_equal(1, countEvents(broken, EventType::BondBroken), 0.5, "BondBroken emitted");
        test.assert_equal(1, countEvents(broken, EventType::MoleculeBroken), 0.5, "MoleculeBroken emitted");
        test.assert_true(simulation.atomPosition(b).has_value() && (*simulation.atomPosition(b) - *simulation.atomPosition(a)).norm() > 2.22,
            "Atoms keep their stretched positions");
    }

    std::cout << "\n=== Water Forms From Proximity ===" << std::endl;
    {
        Simulation simulation(quiet());
        const int oxygen = simulation.addAtom(8, Position::Zero());
        simulation.addAtom(1, Position(-1.5, 0, 0));
        simulation.addAtom(1, Position(1.5, 0, 0));
        simulation.addEnergy(12.0);
        run(simulation, 150);

        test.assert_equal(1, simulation.molecules().size(), 0.5, "One molecule");
        test.assert_equal("Water (H₂O)", simulation.molecules().front().name, "Identified as water");
        test.assert_equal("bent", simulation.molecules().front().geometry, "Water is bent");
        test.assert_equal(oxygen, simulation.molecules().front().central_atom, 0.5, "Oxygen in the center");
        test.assert_equal(2, simulation.bonds().size(), 0.5, "Two O-H bonds");
        test.assert_true(simulation.bonds().front().bond.type == BondType::Hydrogen, "O-H bond type");
        test.assert_false(simulation.reactionInProgress(), "Below the reaction threshold nothing else runs");
    }

    std::cout << "\n=== Valence Limit ===" << std::endl;
    {
        Simulation simulation(quiet());
        hydrogenMolecule(simulation, Position::Zero());
        const int third = simulation.addAtom(1, Position(5, 0, 0));
        simulation.drainEvents();

        test.assert_true(simulation.createManualBond(third, 1) == BondStatus::ValenceExceeded, "Saturated hydrogen rejected");
        test.assert_equal(1, simulation.bonds().size(), 0.5, "Bond count unchanged");
        const auto events = simulation.drainEvents();
        test.assert_true(events.size() == 1 && events[0].type == EventType::BondRejected && events[0].subject == "1-3",
            "BondRejected emitted for the pair");

        test.assert_true(simulation.createManualBond(1, 2) == BondStatus::AlreadyBonded, "Repeated bond request reported");
        test.assert_equal(1, simulation.bonds().size(), 0.5, "Repeated request leaves one bond");
        test.assert_equal(1, simulation.molecules().size(), 0.5, "Molecule untouched by the repeated request");
        test.assert_true(simulation.createManualBond(1, 1) == BondStatus::SelfBond, "Self bond rejected");
        test.assert_true(simulation.createManualBond(1, 42) == BondStatus::UnknownAtom, "Unknown atom rejected");
        const int iron = simulation.addAtom(26, Position(9, 0, 0));
        test.assert_true(simulation.createManualBond(third, iron) == BondStatus::InvalidElement, "Element outside the catalog rejected");
    }

    std::cout << "\n=== Energy Accumulates and Decays ===" << std::endl;
    {
        Simulation simulation(quiet());
        simulation.addEnergy(5.0);
        simulation.addEnergy(5.0);
        test.assert_equal(10.0, simulation.transientHeat(), 1e-12, "Two additions of 5 give 10");
        test.assert_equal(400.0, simulation.temperature(), 1e-12, "Temperature follows the heat");

        double previous = simulation.transientHeat();
        bool monotonic = true;
        for (int i = 0; i < 600; ++i) {
            simulation.step(DT);
            if (simulation.transientHeat() > previous || simulation.transientHeat() < 0)
                monotonic = false;
            previous = simulation.transientHeat();
        }
        test.assert_true(monotonic, "Heat decays monotonically and stays non-negative");
        test.assert_true(simulation.transientHeat() < 10.0, "Heat has decayed");

        simulation.applyHeatPulse();
        test.assert_equal(15.0, simulation.transientHeat(), 1e-9, "Pulse raises heat to intensity * boost");
        simulation.setHeatIntensity(8.0);
        test.assert_equal(8.0, simulation.energyModel().heatIntensity(), 1e-12, "Intensity reaches the energy model");
        simulation.applyHeatPulse();
        test.assert_equal(24.0, simulation.transientHeat(), 1e-9, "Stronger pulse");
        simulation.resetEnergy();
        test.assert_equal(0.0, simulation.transientHeat(), 1e-12, "Energy reset");
        simulation.addEnergy(-4.0);
        test.assert_equal(0.0, simulation.transientHeat(), 1e-12, "Negative energy ignored");

        const double before = simulation.elapsedMs();
        simulation.step(0.0);
        test.assert_equal(before, simulation.elapsedMs(), 1e-12, "Zero time step does nothing");
    }

    std::cout << "\n=== Global Heating ===" << std::endl;
    {
        Simulation simulation(quiet());
        const int atom = simulation.addAtom(2, Position::Zero());
        test.assert_true(simulation.toggleGlobalHeating(), "Heating switched on");
        simulation.step(DT);
        test.assert_true(simulation.world().velocity(simulation.atom(atom)->body).norm() > 0, "Heating kicks free atoms");
        test.assert_false(simulation.toggleGlobalHeating(), "Heating switched off");
    }

    std::cout << "\n=== Atom Commands ===" << std::endl;
    {
        Simulation simulation(quiet());
        test.assert_equal(-1, simulation.addAtom(0, Position::Zero()), 0.5, "Zero protons rejected");
        test.assert_equal(-1, simulation.addAtom(1, -1, 1, Position::Zero()), 0.5, "Negative neutrons rejected");

        const int oxygen = simulation.addAtom(8, Position(3, 0, 0));
        test.assert_equal(1, oxygen, 0.5, "Ids start at 1");
        test.assert_equal(16.0, simulation.world().mass(simulation.atom(oxygen)->body), 1e-12, "Oxygen-16 mass");
        test.assert_true(simulation.setNeutrons(oxygen, 10), "Neutrons changed");
        test.assert_equal(18.0, simulation.world().mass(simulation.atom(oxygen)->body), 1e-12, "Mass follows the isotope");
        test.assert_false(simulation.setNeutrons(oxygen, -2), "Negative neutrons rejected");
        test.assert_true(simulation.setElectrons(oxygen, 10), "Ion with ten electrons");
        test.assert_false(simulation.setElectrons(oxygen, -1), "Negative electrons rejected");
        test.assert_false(simulation.setProtons(oxygen, 0), "Zero protons rejected");
        test.assert_false(simulation.deleteAtom(99), "Unknown atom");

        const std::string molecule = hydrogenMolecule(simulation, Position::Zero());
        test.assert_equal(1, simulation.molecules().size(), 0.5, "Hydrogen molecule built");
        const Position part = *simulation.atomPosition(2);
        test.assert_equal(-0.6, part.x() - simulation.world().position(simulation.molecule(molecule)->body).x(), 1e-9,
            "Member position from its part offset");

        simulation.drainEvents();
        test.assert_true(simulation.setProtons(2, 9), "Hydrogen turned into fluorine");
        test.assert_equal(0, simulation.molecules().size(), 0.5, "Molecule dissolved by the element change");
        test.assert_equal(0, simulation.bonds().size(), 0.5, "Bonds of the changed atom removed");
        test.assert_equal(9, simulation.atom(2)->protons, 0.5, "New element stored");
        test.assert_equal(1, countEvents(simulation.drainEvents(), EventType::BondBroken), 0.5, "BondBroken for the dissolved bond");

        test.assert_true(simulation.createManualBond(2, 3) == BondStatus::Created, "F-H bond");
        simulation.identifyMolecules();
        test.assert_true(simulation.deleteAtom(3), "Member atom deleted");
        test.assert_true(simulation.atom(3) == nullptr, "Atom gone");
        test.assert_equal(0, simulation.bonds().size(), 0.5, "Its bonds are gone");
        test.assert_equal(0, simulation.molecules().size(), 0.5, "Its molecule is gone");
        test.assert_true(simulation.atom(2) && !simulation.atom(2)->molecule_member, "Partner is free again");
    }

    std::cout << "\n=== Bond Deletion and Electrolysis ===" << std::endl;
    {
        Simulation simulation(quiet());
        const std::string molecule = hydrogenMolecule(simulation, Position::Zero());
        test.assert_true(simulation.deleteBond(molecule), "Molecule bond deleted");
        test.assert_false(simulation.deleteBond(molecule), "Second deletion reports false");
        test.assert_equal(0, simulation.molecules().size(), 0.5, "Molecule reopened");
        test.assert_true(simulation.bondManager().inCooldown(1, 2, simulation.elapsedMs()), "Pair in cooldown after deletion");

        std::vector<SpawnSite> sites = {
            { 1, Position(20, 0, 0), 1 }, { 1, Position(21.5, 0, 0), 0 },
            { 8, Position(40, 0, 0), 3 }, { 8, Position(41.5, 0, 0), 2 }
        };
        std::vector<int> ids = simulation.spawn(sites);
        test.assert_equal(4, ids.size(), 0.5, "Four atoms spawned");
        test.assert_equal(2, simulation.molecules().size(), 0.5, "Paired sites became molecules");

        test.assert_equal(2, simulation.electrolyzeAll(), 0.5, "Both molecules split");
        test.assert_equal(0, simulation.molecules().size(), 0.5, "No molecules left");
        test.assert_equal(0, simulation.bonds().size(), 0.5, "Internal bonds deleted");
        test.assert_equal(-1.5, simulation.world().velocity(simulation.atom(ids[0])->body).x(), 1e-9, "Atoms pushed apart");
        test.assert_true(simulation.bondManager().inCooldown(ids[2], ids[3], simulation.elapsedMs()), "Released atoms blocked from re-bonding");
        test.assert_false(simulation.breakMolecule("1-2"), "Unknown molecule");
    }

    std::cout << "\n=== Molecule Identity ===" << std::endl;
    {
        Simulation simulation(quiet());
        const std::string id = hydrogenMolecule(simulation, Position::Zero());
        test.assert_true(simulation.breakMolecule(id), "Molecule split");
        test.assert_true(simulation.createManualBond(1, 2) == BondStatus::Created, "Manual bond ignores the cooldown");
        test.assert_equal(1, simulation.identifyMolecules(), 0.5, "Molecule formed again");
        test.assert_true(simulation.molecule(id) != nullptr, "Same canonical id after restore");
        test.assert_equal(1, simulation.discoveredMolecules().size(), 0.5, "Rediscovery is not a new discovery");

        Simulation forward(quiet()), backward(quiet());
        for (Simulation* current : { &forward, &backward }) {
            current->addAtom(1, Position(-1, 0, 0));
            current->addAtom(8, Position::Zero());
            current->addAtom(1, Position(1, 0, 0));
        }
        forward.createManualBond(1, 2);
        forward.createManualBond(2, 3);
        backward.createManualBond(3, 2);
        backward.createManualBond(2, 1);
        forward.identifyMolecules();
        backward.identifyMolecules();
        test.assert_true(forward.molecules().size() == 1 && backward.molecules().size() == 1, "One molecule each");
        test.assert_true(forward.molecules().front().id == backward.molecules().front().id
                && forward.molecules().front().name == backward.molecules().front().name,
            "Identity independent of bond order");
    }

    std::cout << "\n=== Modes and Configuration ===" << std::endl;
    {
        Simulation simulation(quiet());
        test.assert_equal("educational", simulation.mode().name, "Default mode");
        test.assert_true(simulation.autoReactions(), "Educational mode reacts automatically");
        simulation.setMode(SimulationMode::sandbox());
        test.assert_false(simulation.autoReactions(), "Sandbox switches reactions off");
        test.assert_true(simulation.toggleAutoReactions(), "Reactions toggled back on");

        json config = quiet();
        config["simulation"] = { { "mode", "Realistic" }, { "auto", false } };
        Simulation realistic(config);
        test.assert_equal("realistic", realistic.mode().name, "Mode from configuration");
        test.assert_false(realistic.autoReactions(), "Explicit setting overrides the preset");

        json unknown = quiet();
        unknown["simulation"] = { { "mode", "chaos" } };
        Simulation fallback(unknown);
        test.assert_equal("educational", fallback.mode().name, "Unknown mode falls back to educational");

        auto owned = std::make_unique<PointMassWorld>();
        PointMassWorld* world = owned.get();
        Simulation injected(quiet(), std::move(owned));
        injected.addAtom(6, Position::Zero());
        test.assert_equal(1, world->bodyCount(), 0.5, "Injected world receives the bodies");
    }

    std::cout << "\n=== Summary ===" << std::endl;
    {
        Simulation simulation(quiet());
        hydrogenMolecule(simulation, Position::Zero());
        simulation.addAtom(8, Position(6, 0, 0));
        json summary = simulation.summary();
        test.assert_equal(3, summary["atoms"].get<int>(), 0.5, "Three atoms");
        test.assert_equal(1, summary["free_atoms"].get<int>(), 0.5, "One free atom");
        test.assert_equal(1, summary["bonds"].get<int>(), 0.5, "One bond");
        test.assert_true(summary["molecules"].size() == 1 && summary["molecules"][0]["name"] == "Hydrogen Gas (H₂)", "Molecule listed");
        test.assert_true(summary["discovered"].size() == 1, "Discovery listed");

        const auto views = simulation.bonds();
        test.assert_equal(1.2, views.front().distance, 1e-9, "Bond length from the molecule template");
        test.assert_false(views.front().stressed, "Template bond relaxed");
    }

    test.print_summary();
    return (test.tests_run == test.tests_passed) ? 0 : 1;
}
