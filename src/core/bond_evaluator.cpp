/*
 * <Bond eligibility, bond properties and partner preferences>
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

#include "src/core/bond_evaluator.h"
#include "src/core/periodic_table.h"

#include <algorithm>
#include <cmath>
#include <limits>

BondEvaluator::BondEvaluator(const ConfigManager& config)
    : m_bond_length_factor(config.get<double>("bond_length_factor"))
    , m_break_factor(config.get<double>("break_factor"))
    , m_template_stretch(config.get<double>("template_stretch"))
    , m_default_radius(config.get<double>("default_radius"))
    , m_preference_radius(config.get<double>("preference_radius"))
    , m_stress_warning(config.get<double>("stress_warning"))
    , m_use_preferences(config.get<bool>("use_preferences"))
    , m_rules(defaultRules())
{
}

std::vector<PreferenceRule> BondEvaluator::defaultRules()
{
    std::vector<PreferenceRule> rules;
    rules.push_back({ 1, 1, [](int protons) { return protons == 8; }, 0.0, "H-H waits for a nearby oxygen" });
    rules.push_back({ 8, 8, [](int protons) { return protons != 8; }, 0.0, "O-O waits for a nearby partner of another element" });
    return rules;
}

bool BondEvaluator::canFormBond(const Atom& a, int bonds_a, const Atom& b, int bonds_b, double system_energy) const
{
    const ChemicalElement* element_a = PeriodicTable::element(a.protons);
    const ChemicalElement* element_b = PeriodicTable::element(b.protons);
    if (!element_a || !element_b)
        return false;

    if (element_a->max_bonds == 0 || element_b->max_bonds == 0)
        return false;

    if (bonds_a >= element_a->max_bonds || bonds_b >= element_b->max_bonds)
        return false;

    const double activation = activationEnergy(a.protons, b.protons);
    if (system_energy < activation) {
        ValencyLogger::debug_fmt("{}-{} needs {:.2f} energy, {:.2f} available",
            element_a->symbol, element_b->symbol, activation, system_energy);
        return false;
    }
    return true;
}

double BondEvaluator::activationEnergy(int za, int zb) const
{
    const ChemicalElement* element_a = PeriodicTable::element(za);
    const ChemicalElement* element_b = PeriodicTable::element(zb);
    if (!element_a || !element_b)
        return std::numeric_limits<double>::infinity();

    const double en_difference = std::abs(element_a->electronegativity - element_b->electronegativity);
    const double average_ie = (element_a->ionization_energy + element_b->ionization_energy) / 2.0;
    return std::max(average_ie * (1.0 - en_difference / 4.0) * 0.1, 1.0);
}

std::optional<BondingPair> BondEvaluator::bondProperties(int za, int zb) const
{
    const ChemicalElement* element_a = PeriodicTable::element(za);
    const ChemicalElement* element_b = PeriodicTable::element(zb);
    if (!element_a || !element_b)
        return std::nullopt;

    BondingPair pair;
    pair.polarity = std::abs(element_a->electronegativity - element_b->electronegativity);

    // polar and nonpolar covalent are not distinguished
    pair.type = pair.polarity > 1.7 ? BondType::Ionic : BondType::Covalent;
    auto is_acceptor = [](int z) { return z == 7 || z == 8 || z == 9; };
    if ((za == 1 && is_acceptor(zb)) || (zb == 1 && is_acceptor(za)))
        pair.type = BondType::Hydrogen;

    pair.order = std::min({ std::min(element_a->valence_electrons, element_a->max_bonds),
        std::min(element_b->valence_electrons, element_b->max_bonds), 3 });

    double type_multiplier = 1.0;
    if (pair.type == BondType::Ionic)
        type_multiplier = 1.5;
    else if (pair.type == BondType::Hydrogen)
        type_multiplier = 0.3;
    pair.energy = (element_a->electronegativity + element_b->electronegativity) * 50.0 * pair.order * 1.5 * type_multiplier;

    pair.length = idealLength(za, zb);
    return pair;
}

double BondEvaluator::idealLength(int za, int zb) const
{
    const ChemicalElement* element_a = PeriodicTable::element(za);
    const ChemicalElement* element_b = PeriodicTable::element(zb);
    if (!element_a || !element_b)
        return 2.0;
    return (element_a->atomic_radius + element_b->atomic_radius) * m_bond_length_factor;
}

double BondEvaluator::breakLength(int za, int zb, double rest_length) const
{
    const double radii = PeriodicTable::radius(za, m_default_radius) + PeriodicTable::radius(zb, m_default_radius);
    return std::max(radii * m_break_factor, rest_length * m_template_stretch);
}

bool BondEvaluator::isPreferred(const AtomSnapshot& a, const AtomSnapshot& b, const std::vector<AtomSnapshot>& free_atoms) const
{
    if (!m_use_preferences)
        return true;

    for (const auto& rule : m_rules) {
        if (!rule.matches(a.protons, b.protons))
            continue;

        const double radius = rule.radius > 0 ? rule.radius : m_preference_radius;
        for (const auto& other : free_atoms) {
            if (other.id == a.id || other.id == b.id || !rule.competitor(other.protons))
                continue;
            if ((other.position - a.position).norm() < radius || (other.position - b.position).norm() < radius) {
                ValencyLogger::debug_fmt("Pair {}-{} vetoed: {}", a.id, b.id, rule.description);
                return false;
            }
        }
    }
    return true;
}

std::vector<IntPair> BondEvaluator::optimalBondingStructure(const std::vector<Atom>& atoms) const
{
    struct Candidate {
        int a;
        int b;
        double energy;
    };

    std::vector<Candidate> candidates;
    for (std::size_t i = 0; i < atoms.size(); ++i) {
        for (std::size_t j = i + 1; j < atoms.size(); ++j) {
            auto properties = bondProperties(atoms[i].protons, atoms[j].protons);
            if (properties)
                candidates.push_back({ atoms[i].id, atoms[j].id, properties->energy });
        }
    }
    // stable_sort keeps the pair order for equal energies
    std::stable_sort(candidates.begin(), candidates.end(),
        [](const Candidate& x, const Candidate& y) { return x.energy > y.energy; });

    std::map<int, int> capacity;
    for (const auto& atom : atoms)
        capacity[atom.id] = PeriodicTable::maxBonds(atom.protons);

    std::vector<IntPair> plan;
    for (const auto& candidate : candidates) {
        if (capacity[candidate.a] > 0 && capacity[candidate.b] > 0) {
            plan.push_back(OrderedPair(candidate.a, candidate.b));
            --capacity[candidate.a];
            --capacity[candidate.b];
        }
    }
    return plan;
}
