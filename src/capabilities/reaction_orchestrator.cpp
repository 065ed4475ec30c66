/*
 * <Detection and staged execution of complex reactions>
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
#include "src/capabilities/simulation.h"

#include "src/core/molecule_identifier.h"
#include "src/core/periodic_table.h"
#include "src/core/vsepr.h"

#include <algorithm>
#include <limits>
#include <map>
#include <set>

namespace {

/*! \brief Molecules of one name, nearest to origin first, closer than radius */
std::vector<const Molecule*> nearbyMolecules(const Simulation& simulation, const std::string& name,
    const Position& origin, double radius)
{
    std::vector<std::pair<double, const Molecule*>> found;
    for (const auto& molecule : simulation.molecules()) {
        const Molecule* stored = simulation.molecule(molecule.id);
        if (!stored || stored->name != name)
            continue;
        auto position = simulation.atomPosition(stored->atoms.front());
        if (!position)
            continue;
        const double distance = (*position - origin).norm();
        if (distance < radius)
            found.push_back({ distance, stored });
    }
    std::stable_sort(found.begin(), found.end(),
        [](const std::pair<double, const Molecule*>& x, const std::pair<double, const Molecule*>& y) { return x.first < y.first; });

    std::vector<const Molecule*> result;
    for (const auto& entry : found)
        result.push_back(entry.second);
    return result;
}

std::string groupGeometry(const std::vector<Atom>& atoms, const std::vector<IntPair>& pairs)
{
    if (auto known = MoleculeIdentifier::matchKnown(MoleculeIdentifier::composition(atoms)))
        return known->geometry;

    std::vector<Bond> bonds;
    for (const auto& pair : pairs) {
        Bond bond;
        bond.atom_a = pair.first;
        bond.atom_b = pair.second;
        bonds.push_back(bond);
    }
    return VSEPR::determineGeometry(atoms, bonds, VSEPR::findOptimalCentralAtom(atoms));
}

bool isConnected(const std::vector<Atom>& atoms, const std::vector<IntPair>& bonds)
{
    if (atoms.empty())
        return false;

    std::map<int, std::set<int>> adjacency;
    for (const auto& bond : bonds) {
        adjacency[bond.first].insert(bond.second);
        adjacency[bond.second].insert(bond.first);
    }

    std::set<int> visited = { atoms.front().id };
    std::vector<int> pending = { atoms.front().id };
    while (!pending.empty()) {
        const int current = pending.back();
        pending.pop_back();
        for (int neighbour : adjacency[current])
            if (visited.insert(neighbour).second)
                pending.push_back(neighbour);
    }
    return visited.size() == atoms.size();
}

}

ReactionOrchestrator::ReactionOrchestrator(const ConfigManager& config)
    : m_energy_threshold(config.get<double>("energy_threshold"))
    , m_check_interval(config.get<double>("check_interval"))
    , m_molecule_proximity(config.get<double>("molecule_proximity"))
    , m_atom_molecule_proximity(config.get<double>("atom_molecule_proximity"))
    , m_cluster_proximity(config.get<double>("cluster_proximity"))
    , m_water_energy(config.get<double>("water_energy"))
    , m_methane_energy(config.get<double>("methane_energy"))
    , m_ammonia_energy(config.get<double>("ammonia_energy"))
    , m_three_atom_energy(config.get<double>("three_atom_energy"))
    , m_bond_cost(config.get<double>("bond_cost"))
    , m_bond_length(config.get<double>("bond_length"))
    , m_group_spacing(config.get<double>("group_spacing"))
    , m_last_check(-std::numeric_limits<double>::infinity())
{
}

void ReactionOrchestrator::update(Simulation& simulation)
{
    if (m_plan) {
        advance(simulation);
        return;
    }

    if (!simulation.m_auto_reactions || simulation.transientHeat() <= m_energy_threshold)
        return;
    if (simulation.m_time_ms - m_last_check < m_check_interval)
        return;

    m_last_check = simulation.m_time_ms;
    detect(simulation);
}

bool ReactionOrchestrator::detect(Simulation& simulation)
{
    if (m_locked)
        return false;

    if (auto plan = findMoleculeReaction(simulation))
        return begin(simulation, *plan);
    if (auto plan = findAtomMoleculeReaction(simulation))
        return begin(simulation, *plan);
    return clusterReaction(simulation);
}

bool ReactionOrchestrator::begin(Simulation& simulation, ReactionPlan plan)
{
    if (m_locked) {
        ValencyLogger::debug("Reaction rejected, another one is running");
        return false;
    }

    if (plan.id.empty())
        plan.id = nextId(plan.kind);
    plan.stage = ReactionStage::Staging;
    plan.bonds_created = 0;

    m_locked = true;
    m_plan = plan;
    advance(simulation);
    return true;
}

void ReactionOrchestrator::advance(Simulation& simulation)
{
    if (!m_plan)
        return;

    ReactionPlan& plan = *m_plan;
    ValencyLogger::debug_fmt("Reaction {}: {}", plan.id, ReactionStageName(plan.stage));

    switch (plan.stage) {
    case ReactionStage::Staging: {
        simulation.emit(EventType::ReactionStarted, plan.id, plan.description);
        ValencyLogger::info_fmt("Reaction started: {}", plan.description);

        for (const auto& molecule : plan.molecules)
            simulation.releaseMolecule(molecule, Simulation::Release::Delete, 0.0);

        const double consumed = simulation.m_energy.consume(plan.cost);
        ValencyLogger::debug_fmt("Reaction {} consumed {:.1f} energy", plan.id, consumed);
        plan.stage = ReactionStage::Positioning;
        break;
    }

    case ReactionStage::Positioning: {
        // groups with a deleted or captured atom are dropped
        std::vector<ReactionGroup> valid;
        for (const auto& group : plan.groups) {
            const bool intact = std::all_of(group.atoms.begin(), group.atoms.end(), [&simulation](int id) {
                const Atom* atom = simulation.atom(id);
                return atom && !atom->molecule_member;
            });
            if (intact)
                valid.push_back(group);
        }
        plan.groups = valid;

        for (std::size_t k = 0; k < plan.groups.size(); ++k) {
            std::vector<Atom> members;
            for (int id : plan.groups[k].atoms)
                members.push_back(*simulation.atom(id));

            const Position anchor = plan.center + Position(m_group_spacing * k, 0, 0);
            for (const auto& entry : VSEPR::calculateMolecularPositions(members, plan.groups[k].geometry, m_bond_length, -1)) {
                const BodyId body = simulation.m_atoms.at(entry.first).body;
                simulation.m_world->setPosition(body, anchor + entry.second);
                simulation.m_world->setVelocity(body, Position::Zero());
            }
        }
        plan.stage = ReactionStage::Bonding;
        break;
    }

    case ReactionStage::Bonding:
        for (const auto& group : plan.groups) {
            for (const auto& pair : group.bonds) {
                if (!simulation.atom(pair.first) || !simulation.atom(pair.second))
                    continue;
                if (simulation.bondAtoms(pair.first, pair.second) != BondStatus::Created)
                    continue;
                ++plan.bonds_created;
                if (plan.bond_cost > 0)
                    simulation.m_energy.consume(plan.bond_cost);
            }
        }
        plan.stage = ReactionStage::Identifying;
        break;

    case ReactionStage::Identifying:
        simulation.identifyMolecules();
        plan.stage = ReactionStage::Done;
        break;

    case ReactionStage::Done: {
        const bool success = plan.bonds_created > 0;
        simulation.emit(EventType::ReactionCompleted, plan.id, plan.description, success);
        if (success)
            ValencyLogger::success_fmt("Reaction completed: {} ({} bonds)", plan.description, plan.bonds_created);
        else
            ValencyLogger::warn_fmt("Reaction {} completed without bonds", plan.id);

        m_locked = false;
        ++m_completed;
        m_plan.reset();
        break;
    }
    }
}

std::optional<ReactionPlan> ReactionOrchestrator::findMoleculeReaction(const Simulation& simulation) const
{
    const double energy = simulation.systemEnergy();

    auto make_plan = [&simulation](const std::string& description, const std::vector<const Molecule*>& molecules,
                         const std::vector<int>& free_atoms, double cost) {
        ReactionPlan plan;
        plan.kind = "molecule+molecule";
        plan.description = description;
        plan.cost = cost;

        std::vector<Atom> pool;
        int positions = 0;
        for (const Molecule* molecule : molecules) {
            plan.molecules.push_back(molecule->id);
            for (int id : molecule->atoms) {
                pool.push_back(*simulation.atom(id));
                if (auto position = simulation.atomPosition(id)) {
                    plan.center += *position;
                    ++positions;
                }
            }
        }
        for (int id : free_atoms) {
            pool.push_back(*simulation.atom(id));
            if (auto position = simulation.atomPosition(id)) {
                plan.center += *position;
                ++positions;
            }
        }
        if (positions)
            plan.center /= static_cast<double>(positions);
        plan.groups = planProducts(pool);
        return plan;
    };

    // 2 H2 + O2
    for (const auto& oxygen : simulation.molecules()) {
        if (oxygen.name != "Oxygen Gas (O₂)")
            continue;
        auto origin = simulation.atomPosition(oxygen.atoms.front());
        if (!origin)
            continue;
        auto hydrogen = nearbyMolecules(simulation, "Hydrogen Gas (H₂)", *origin, m_molecule_proximity);
        if (hydrogen.size() >= 2 && energy >= m_water_energy)
            return make_plan("2 H₂ + O₂ → 2 H₂O", { simulation.molecule(oxygen.id), hydrogen[0], hydrogen[1] }, {},
                std::max(10.0, 0.7 * energy));
    }

    for (const auto& atom : simulation.freeAtoms()) {
        auto origin = simulation.atomPosition(atom.id);
        if (!origin || simulation.bondCount(atom.id) > 0)
            continue;

        // C + 2 H2
        if (atom.protons == 6 && energy >= m_methane_energy) {
            auto hydrogen = nearbyMolecules(simulation, "Hydrogen Gas (H₂)", *origin, m_molecule_proximity);
            if (hydrogen.size() >= 2)
                return make_plan("C + 2 H₂ → CH₄", { hydrogen[0], hydrogen[1] }, { atom.id }, std::max(15.0, 0.6 * energy));
        }

        // N + 3 H2
        if (atom.protons == 7 && energy >= m_ammonia_energy) {
            auto hydrogen = nearbyMolecules(simulation, "Hydrogen Gas (H₂)", *origin, m_molecule_proximity);
            if (hydrogen.size() >= 3)
                return make_plan("N + 3 H₂ → NH₃ + H₂", { hydrogen[0], hydrogen[1], hydrogen[2] }, { atom.id },
                    std::max(18.0, 0.7 * energy));
        }
    }
    return std::nullopt;
}

std::optional<ReactionPlan> ReactionOrchestrator::findAtomMoleculeReaction(const Simulation& simulation) const
{
    const double energy = simulation.systemEnergy();

    for (const auto& molecule : simulation.molecules()) {
        const Position center = simulation.m_world->position(molecule.body);

        std::vector<Atom> members;
        for (int id : molecule.atoms)
            members.push_back(*simulation.atom(id));

        for (const auto& atom : simulation.freeAtoms()) {
            auto position = simulation.atomPosition(atom.id);
            if (!position || simulation.bondCount(atom.id) > 0)
                continue;
            if ((*position - center).norm() >= m_atom_molecule_proximity)
                continue;

            std::vector<Atom> merged = members;
            merged.push_back(atom);

            std::vector<int> protons;
            for (const auto& member : merged)
                protons.push_back(member.protons);
            if (!isChemicallyStable(protons))
                continue;

            double cost = 10.0 + 3.0 * molecule.atoms.size();
            // only catalog names are capitalized, systematic names never match
            if (atom.protons == 6 && molecule.name.find("Oxygen Gas") != std::string::npos)
                cost = 15.0;
            else if (atom.protons == 1 && molecule.name.find("Oxygen") != std::string::npos)
                cost = 8.0;
            if (energy < cost)
                continue;

            auto bonds = connect(merged, simulation.m_evaluator);
            if (!bonds)
                continue;

            ReactionPlan plan;
            plan.kind = "atom+molecule";
            plan.description = PeriodicTable::symbol(atom.protons) + " + " + molecule.formula + " → "
                + MoleculeIdentifier::formula(MoleculeIdentifier::composition(merged));
            plan.molecules.push_back(molecule.id);
            plan.groups.push_back({ {}, *bonds, groupGeometry(merged, *bonds) });
            for (const auto& member : merged)
                plan.groups.back().atoms.push_back(member.id);
            plan.cost = cost;
            plan.center = (center + *position) / 2.0;
            return plan;
        }
    }
    return std::nullopt;
}

bool ReactionOrchestrator::clusterReaction(Simulation& simulation)
{
    const double energy = simulation.systemEnergy();

    std::vector<Atom> candidates;
    std::map<int, Position> positions;
    for (const auto& atom : simulation.freeAtoms()) {
        auto position = simulation.atomPosition(atom.id);
        if (!position || simulation.bondCount(atom.id) > 0 || simulation.m_bonds.pendingCount(atom.id) > 0)
            continue;
        candidates.push_back(atom);
        positions[atom.id] = *position;
    }

    auto close = [&positions, this](const Atom& x, const Atom& y) {
        return (positions[x.id] - positions[y.id]).norm() < m_cluster_proximity;
    };

    for (std::size_t i = 0; i < candidates.size(); ++i) {
        for (std::size_t j = i + 1; j < candidates.size(); ++j) {
            const Atom& a = candidates[i];
            const Atom& b = candidates[j];
            if (!close(a, b))
                continue;

            if (isChemicallyStable({ a.protons, b.protons })
                && energy >= simulation.m_evaluator.activationEnergy(a.protons, b.protons)
                && simulation.bondAtoms(a.id, b.id) == BondStatus::Created) {
                ValencyLogger::info_fmt("Cluster pair {} bonded", PairKey(a.id, b.id));
                return true;
            }

            if (energy < m_three_atom_energy)
                continue;

            for (std::size_t k = j + 1; k < candidates.size(); ++k) {
                const Atom& c = candidates[k];
                if (!close(a, c) || !close(b, c))
                    continue;
                if (!isChemicallyStable({ a.protons, b.protons, c.protons }))
                    continue;

                const std::vector<Atom> group = { a, b, c };
                auto bonds = connect(group, simulation.m_evaluator);
                if (!bonds)
                    continue;

                ReactionPlan plan;
                plan.kind = "cluster";
                plan.description = PeriodicTable::symbol(a.protons) + " + " + PeriodicTable::symbol(b.protons) + " + "
                    + PeriodicTable::symbol(c.protons) + " → " + MoleculeIdentifier::formula(MoleculeIdentifier::composition(group));
                plan.groups.push_back({ { a.id, b.id, c.id }, *bonds, groupGeometry(group, *bonds) });
                plan.bond_cost = m_bond_cost;
                plan.center = (positions[a.id] + positions[b.id] + positions[c.id]) / 3.0;
                return begin(simulation, plan);
            }
        }
    }
    return false;
}

bool ReactionOrchestrator::isChemicallyStable(const std::vector<int>& protons)
{
    std::map<int, int> counts;
    for (int z : protons)
        counts[z]++;

    static const std::vector<std::map<int, int>> stable = {
        { { 6, 1 }, { 8, 2 } }, // CO2
        { { 6, 1 }, { 1, 4 } }, // CH4
        { { 1, 2 }, { 8, 1 } }, // H2O
        { { 7, 1 }, { 1, 3 } }, // NH3
        { { 1, 2 } },
        { { 8, 2 } },
        { { 7, 2 } },
        { { 6, 1 }, { 8, 1 } }, // CO
        { { 7, 1 }, { 8, 1 } }, // NO
        { { 1, 1 }, { 9, 1 } } // HF
    };
    if (std::find(stable.begin(), stable.end(), counts) != stable.end())
        return true;

    const int n = static_cast<int>(protons.size());
    if (n < 2 || n > 6)
        return false;

    int valence = 0;
    for (int z : protons)
        valence += PeriodicTable::valence(z, 4);
    return valence / 2 <= n * (n - 1) / 2;
}

std::optional<std::vector<IntPair>> ReactionOrchestrator::connect(const std::vector<Atom>& atoms, const BondEvaluator& evaluator)
{
    if (atoms.size() < 2)
        return std::nullopt;

    const bool all_known = std::all_of(atoms.begin(), atoms.end(),
        [](const Atom& atom) { return PeriodicTable::maxBonds(atom.protons) > 0; });
    if (!all_known)
        return std::nullopt;

    const int central = VSEPR::findOptimalCentralAtom(atoms);
    int central_capacity = 0;
    for (const auto& atom : atoms)
        if (atom.id == central)
            central_capacity = PeriodicTable::maxBonds(atom.protons);

    if (central_capacity >= static_cast<int>(atoms.size()) - 1) {
        std::vector<IntPair> star;
        for (const auto& atom : atoms)
            if (atom.id != central)
                star.push_back(OrderedPair(central, atom.id));
        return star;
    }

    const std::vector<IntPair> greedy = evaluator.optimalBondingStructure(atoms);
    if (isConnected(atoms, greedy))
        return greedy;
    return std::nullopt;
}

std::vector<ReactionGroup> ReactionOrchestrator::planProducts(const std::vector<Atom>& pool)
{
    std::map<int, std::vector<int>> by_element;
    for (const auto& atom : pool)
        by_element[atom.protons].push_back(atom.id);
    for (auto& entry : by_element)
        std::sort(entry.second.begin(), entry.second.end());

    auto take = [&by_element](int z) {
        const int id = by_element[z].front();
        by_element[z].erase(by_element[z].begin());
        return id;
    };

    auto centered = [&take](int center_z, int ligand_z, int ligands, const std::string& geometry) {
        ReactionGroup group;
        const int center = take(center_z);
        group.atoms.push_back(center);
        for (int i = 0; i < ligands; ++i) {
            const int ligand = take(ligand_z);
            group.atoms.push_back(ligand);
            group.bonds.push_back(OrderedPair(center, ligand));
        }
        group.geometry = geometry;
        return group;
    };

    std::vector<ReactionGroup> groups;
    while (by_element[8].size() >= 1 && by_element[1].size() >= 2)
        groups.push_back(centered(8, 1, 2, "bent"));
    while (by_element[6].size() >= 1 && by_element[1].size() >= 4)
        groups.push_back(centered(6, 1, 4, "tetrahedral"));
    while (by_element[7].size() >= 1 && by_element[1].size() >= 3)
        groups.push_back(centered(7, 1, 3, "trigonal_pyramidal"));

    for (auto& entry : by_element) {
        while (entry.second.size() >= 2) {
            ReactionGroup group;
            const int a = take(entry.first);
            const int b = take(entry.first);
            group.atoms = { a, b };
            group.bonds = { OrderedPair(a, b) };
            group.geometry = "linear";
            groups.push_back(group);
        }
    }
    return groups;
}

std::string ReactionOrchestrator::nextId(const std::string& kind)
{
    return kind + "-" + std::to_string(++m_counter);
}
