/*
 * <Tests for the bond lifecycle and the point mass world>
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

#include "src/core/bond_manager.h"
#include "src/core/parameter_registry.h"
#include "src/core/point_mass_world.h"

#include <cmath>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

class BondManagerTest {
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

    void assert_status(BondStatus expected, BondStatus actual, const std::string& msg = "")
    {
        tests_run++;
        if (expected == actual) {
            tests_passed++;
            std::cout << "✓ " << msg << std::endl;
        } else {
            std::cout << "✗ FAIL: " << msg << " - Expected: " << BondStatusName(expected)
                      << ", Got: " << BondStatusName(actual) << std::endl;
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

/* Atoms with one body each, placed on the x axis */
struct Fixture {
    PointMassWorld world;
    AtomTable atoms;

    int add(int id, int protons, double x)
    {
        Atom atom;
        atom.id = id;
        atom.protons = protons;
        atom.neutrons = protons == 1 ? 0 : protons;
        atom.electrons = protons;
        atom.body = world.createBody(Position(x, 0, 0), atom.mass(), 0.0);
        atoms[id] = atom;
        return id;
    }

    std::vector<AtomSnapshot> snapshots() const
    {
        std::vector<AtomSnapshot> result;
        for (const auto& entry : atoms)
            result.push_back({ entry.first, entry.second.protons, entry.second.body, world.position(entry.second.body) });
        return result;
    }

    BondManager::PositionLookup lookup() const
    {
        return [this](int id) -> std::optional<Position> {
            auto it = atoms.find(id);
            if (it == atoms.end())
                return std::nullopt;
            return world.position(it->second.body);
        };
    }
};

int main()
{
    BondManagerTest test;
    initialize_parameter_registry();

    ConfigManager config("bonding", json::object());
    BondEvaluator evaluator(config);

    std::cout << "\n=== Point Mass World ===" << std::endl;
    {
        PointMassWorld world;
        BodyId body = world.createBody(Position::Zero(), 2.0, 0.0);
        world.applyForce(body, Position(4, 0, 0));
        world.step(1.0);
        test.assert_equal(1.0, world.position(body).x(), 1e-9, "x += 1/2 a dt^2");
        test.assert_equal(2.0, world.velocity(body).x(), 1e-9, "v += a dt");
        world.step(1.0);
        test.assert_equal(3.0, world.position(body).x(), 1e-9, "Force is consumed by a step");
        world.setMass(body, -1.0);
        test.assert_equal(2.0, world.mass(body), 1e-9, "Non-positive mass ignored");

        BodyId aggregate = world.createAggregate(Position(1, 1, 1), 3.0, 0.0, { Position(1, 0, 0), Position(-1, 0, 0) });
        test.assert_equal(2.0, world.partPosition(aggregate, 0).x(), 1e-9, "Part position = center + offset");
        test.assert_equal(1.0, world.partPosition(aggregate, 7).x(), 1e-9, "Unknown part falls back to the center");
        test.assert_true(world.setPartOffset(aggregate, 1, Position(-2, 0, 0)), "Part offset can be changed");
        test.assert_false(world.setPartOffset(aggregate, 2, Position::Zero()), "Unknown part rejected");
        test.assert_equal(2, world.bodyCount(), 0.5, "Two bodies");
        world.removeBody(body);
        test.assert_false(world.hasBody(body), "Body removed");
        test.assert_equal(0.0, world.mass(body), 1e-9, "Removed body has no mass");
    }

    std::cout << "\n=== Bond Table ===" << std::endl;
    {
        Fixture f;
        f.add(1, 1, 0);
        f.add(2, 1, 1);
        f.add(3, 8, 2);
        f.add(4, 26, 3);
        BondManager manager(evaluator, config);

        test.assert_status(BondStatus::SelfBond, manager.addBond(f.atoms[1], f.atoms[1]), "Self bond rejected");
        test.assert_status(BondStatus::InvalidElement, manager.addBond(f.atoms[1], f.atoms[4]), "Unknown element rejected");
        test.assert_status(BondStatus::Created, manager.addBond(f.atoms[2], f.atoms[1]), "H-H created");
        test.assert_status(BondStatus::AlreadyBonded, manager.addBond(f.atoms[1], f.atoms[2]), "Duplicate request reported");
        test.assert_status(BondStatus::ValenceExceeded, manager.addBond(f.atoms[1], f.atoms[3]), "Saturated hydrogen rejected");
        test.assert_equal(1, manager.bonds().size(), 0.5, "One bond stored");

        const Bond* bond = manager.bond("1-2");
        test.assert_true(bond && bond->atom_a == 1 && bond->atom_b == 2, "Bond id is the ordered pair key");
        test.assert_equal(330.0, bond->energy, 1e-9, "Bond energy stored from the evaluator");
        test.assert_equal(1, manager.bondCount(1), 0.5, "Bond count of atom 1");
        test.assert_true(manager.bondsOf(2).size() == 1 && manager.bondsOf(2)[0].id == "1-2", "Bonds of atom 2");
        test.assert_true(manager.bondsOf(3).empty(), "Unbonded atom has no bonds");
        test.assert_equal(1, manager.freeBonds().size(), 0.5, "Bond starts in the free pool");

        manager.tagMolecule("1-2", "1-2", 0.8);
        test.assert_equal(0, manager.freeBonds().size(), 0.5, "Tagged bond leaves the free pool");
        test.assert_equal(1, manager.moleculeBonds("1-2").size(), 0.5, "Tagged bond belongs to the molecule");
        test.assert_equal(0, manager.moleculeBonds("").size(), 0.5, "Empty molecule id matches nothing");

        std::vector<Bond> released = manager.releaseMolecule("1-2");
        test.assert_equal(1, released.size(), 0.5, "Release returns the bond");
        test.assert_true(manager.bond("1-2")->molecule_id.empty() && manager.bond("1-2")->rest_length == 0.0,
            "Released bond is back in the free pool");

        manager.tagMolecule("1-2", "1-2", 0.8);
        test.assert_equal(1, manager.deleteMoleculeBonds("1-2").size(), 0.5, "Molecule bonds deleted");
        test.assert_false(manager.hasBond(1, 2), "No bond after deletion");

        manager.addBond(f.atoms[1], f.atoms[2]);
        test.assert_equal(1, manager.removeBondsOf(2).size(), 0.5, "removeBondsOf returns the records");
        test.assert_false(manager.removeBond("1-2"), "Removing a missing bond reports false");
    }

    std::cout << "\n=== Cooldown ===" << std::endl;
    {
        BondManager manager(evaluator, config);
        manager.setCooldown(1, 2, 500.0);
        manager.setCooldown(2, 1, 200.0);
        test.assert_true(manager.inCooldown(2, 1, 300.0), "Cooldown keeps the later deadline");
        test.assert_false(manager.inCooldown(1, 2, 500.0), "Cooldown expires at its deadline");
        test.assert_false(manager.inCooldown(1, 3, 0.0), "Unknown pair is not in cooldown");
    }

    std::cout << "\n=== Forming ===" << std::endl;
    {
        Fixture f;
        f.add(1, 1, 0);
        f.add(2, 1, 2);
        BondManager manager(evaluator, config);

        manager.startForming(2, 1, 0.0);
        manager.startForming(1, 2, 10.0);
        test.assert_equal(1, manager.forming().size(), 0.5, "Duplicate transition ignored");
        test.assert_true(manager.isForming(1, 2), "Pair is forming");
        test.assert_equal(1, manager.pendingCount(1), 0.5, "Pending count includes the transition");

        auto finished = manager.advanceForming(1500.0, f.atoms, f.world);
        test.assert_equal(0, finished.size(), 0.5, "Not finished before the duration");
        f.world.step(0.1);
        test.assert_true(f.world.velocity(f.atoms[1].body).x() > 0 && f.world.velocity(f.atoms[2].body).x() < 0,
            "Formation force pulls the pair together");

        finished = manager.advanceForming(2000.0, f.atoms, f.world);
        test.assert_equal(1, finished.size(), 0.5, "Finished after the formation duration");
        test.assert_equal(0, manager.forming().size(), 0.5, "Finished pair removed from forming");

        manager.startForming(1, 2, 0.0);
        test.assert_equal(1, manager.cancelForming(2), 0.5, "Cancel drops the transition of the atom");

        manager.startForming(1, 2, 0.0);
        f.atoms.erase(2);
        finished = manager.advanceForming(5000.0, f.atoms, f.world);
        test.assert_true(finished.empty() && manager.forming().empty(), "Transition with a missing atom dropped silently");
    }

    std::cout << "\n=== Proximity Scan ===" << std::endl;
    {
        Fixture f;
        f.add(1, 1, 0);
        f.add(2, 1, 1);
        BondManager manager(evaluator, config);

        test.assert_true(manager.scanDue(0.0), "First scan is due at once");
        test.assert_equal(0, manager.scan(0.0, f.atoms, f.snapshots(), 1.0, f.world), 0.5, "No transition below activation energy");
        test.assert_true(manager.inCooldown(1, 2, 10.0), "Rejected pair put into cooldown");
        test.assert_false(manager.scanDue(50.0), "Next scan waits for the check interval");
        test.assert_equal(0, manager.scan(100.0, f.atoms, f.snapshots(), 5.0, f.world), 0.5, "Pair skipped while in cooldown");
        test.assert_equal(1, manager.scan(1000.0, f.atoms, f.snapshots(), 5.0, f.world), 0.5, "Eligible close pair starts forming");
        test.assert_true(manager.isForming(1, 2), "Transition recorded");
    }
    {
        Fixture f;
        f.add(1, 1, 0);
        f.add(2, 1, 5);
        f.add(3, 1, 30);
        BondManager manager(evaluator, config);
        test.assert_equal(0, manager.scan(0.0, f.atoms, f.snapshots(), 5.0, f.world), 0.5, "Pair inside the attraction shell does not form");
        f.world.step(0.1);
        test.assert_true(f.world.velocity(f.atoms[1].body).x() > 0, "Attraction pulls towards the partner");
        test.assert_equal(0.0, f.world.velocity(f.atoms[3].body).norm(), 1e-12, "Distant atom untouched");
        test.assert_false(manager.inCooldown(1, 3, 0.0), "Pairs beyond the attraction shell are not evaluated");
    }

    std::cout << "\n=== Bond Stress ===" << std::endl;
    {
        Fixture f;
        f.add(1, 1, 0);
        f.add(2, 1, 1);
        BondManager manager(evaluator, config);
        manager.addBond(f.atoms[1], f.atoms[2]);

        BondView relaxed = manager.view(*manager.bond("1-2"), f.atoms, f.lookup());
        test.assert_equal(2.22, relaxed.break_length, 1e-9, "H-H break length");
        test.assert_equal(1.0 / 2.22, relaxed.stress, 1e-9, "Stress = distance / break length");
        test.assert_false(relaxed.stressed, "Relaxed bond not stressed");
        test.assert_true(manager.overstretched(f.atoms, f.lookup()).empty(), "Nothing overstretched");

        f.world.setPosition(f.atoms[2].body, Position(2.0, 0, 0));
        test.assert_true(manager.views(f.atoms, f.lookup()).front().stressed, "Bond beyond 70% of break length is stressed");
        f.world.setPosition(f.atoms[2].body, Position(3.0, 0, 0));
        test.assert_equal(1, manager.overstretched(f.atoms, f.lookup()).size(), 0.5, "Bond beyond break length reported");

        manager.clear();
        test.assert_true(manager.bonds().empty() && manager.forming().empty(), "clear() empties the manager");
    }

    test.print_summary();
    return (test.tests_run == test.tests_passed) ? 0 : 1;
}
