/*
 * <Bond table, gradual bond formation and bond stress>
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
#include "src/core/periodic_table.h"

#include <algorithm>
#include <limits>

BondManager::BondManager(const BondEvaluator& evaluator, const ConfigManager& config)
    : m_evaluator(evaluator)
    , m_bond_threshold(config.get<double>("bond_threshold"))
    , m_attraction_threshold(config.get<double>("attraction_threshold"))
    , m_attraction_strength(config.get<double>("attraction_strength"))
    , m_cooldown(config.get<double>("cooldown"))
    , m_check_interval(config.get<double>("check_interval"))
    , m_formation_duration(config.get<double>("formation_duration"))
    , m_formation_force(config.get<double>("formation_force"))
    , m_molecule_block(config.get<double>("molecule_block"))
    , m_last_scan(-std::numeric_limits<double>::infinity())
{
}

BondStatus BondManager::addBond(const Atom& a, const Atom& b)
{
    if (a.id == b.id)
        return BondStatus::SelfBond;

    if (!PeriodicTable::element(a.protons) || !PeriodicTable::element(b.protons))
        return BondStatus::InvalidElement;

    if (hasBond(a.id, b.id))
        return BondStatus::AlreadyBonded;

    if (bondCount(a.id) >= PeriodicTable::maxBonds(a.protons) || bondCount(b.id) >= PeriodicTable::maxBonds(b.protons))
        return BondStatus::ValenceExceeded;

    auto properties = m_evaluator.bondProperties(a.protons, b.protons);
    if (!properties)
        return BondStatus::InvalidElement;

    const IntPair pair = OrderedPair(a.id, b.id);
    Bond bond;
    bond.id = PairKey(a.id, b.id);
    bond.atom_a = pair.first;
    bond.atom_b = pair.second;
    bond.order = properties->order;
    bond.type = properties->type;
    bond.energy = properties->energy;
    bond.ideal_length = properties->length;
    bond.polarity = properties->polarity;
    m_bonds[bond.id] = bond;

    ValencyLogger::debug_fmt("Bond {} created ({}, order {}, {:.1f} energy)", bond.id, BondTypeName(bond.type), bond.order, bond.energy);
    return BondStatus::Created;
}

bool BondManager::removeBond(const std::string& bond_id)
{
    return m_bonds.erase(bond_id) > 0;
}

std::vector<Bond> BondManager::removeBondsOf(int atom)
{
    std::vector<Bond> removed;
    for (auto it = m_bonds.begin(); it != m_bonds.end();) {
        if (it->second.involves(atom)) {
            removed.push_back(it->second);
            it = m_bonds.erase(it);
        } else
            ++it;
    }
    return removed;
}

const Bond* BondManager::bond(const std::string& bond_id) const
{
    auto it = m_bonds.find(bond_id);
    return it == m_bonds.end() ? nullptr : &it->second;
}

std::vector<Bond> BondManager::bondsOf(int atom) const
{
    std::vector<Bond> result;
    for (const auto& entry : m_bonds)
        if (entry.second.involves(atom))
            result.push_back(entry.second);
    return result;
}

std::vector<Bond> BondManager::freeBonds() const
{
    std::vector<Bond> result;
    for (const auto& entry : m_bonds)
        if (entry.second.molecule_id.empty())
            result.push_back(entry.second);
    return result;
}

std::vector<Bond> BondManager::moleculeBonds(const std::string& molecule_id) const
{
    std::vector<Bond> result;
    for (const auto& entry : m_bonds)
        if (!molecule_id.empty() && entry.second.molecule_id == molecule_id)
            result.push_back(entry.second);
    return result;
}

int BondManager::bondCount(int atom) const
{
    int count = 0;
    for (const auto& entry : m_bonds)
        if (entry.second.involves(atom))
            ++count;
    return count;
}

int BondManager::pendingCount(int atom) const
{
    return static_cast<int>(std::count_if(m_forming.begin(), m_forming.end(),
        [atom](const FormingBond& f) { return f.atom_a == atom || f.atom_b == atom; }));
}

void BondManager::tagMolecule(const std::string& bond_id, const std::string& molecule_id, double rest_length)
{
    auto it = m_bonds.find(bond_id);
    if (it == m_bonds.end())
        return;
    it->second.molecule_id = molecule_id;
    it->second.rest_length = rest_length;
}

std::vector<Bond> BondManager::releaseMolecule(const std::string& molecule_id)
{
    std::vector<Bond> released;
    for (auto& entry : m_bonds) {
        if (molecule_id.empty() || entry.second.molecule_id != molecule_id)
            continue;
        entry.second.molecule_id.clear();
        entry.second.rest_length = 0.0;
        released.push_back(entry.second);
    }
    return released;
}

std::vector<Bond> BondManager::deleteMoleculeBonds(const std::string& molecule_id)
{
    std::vector<Bond> deleted;
    for (auto it = m_bonds.begin(); it != m_bonds.end();) {
        if (!molecule_id.empty() && it->second.molecule_id == molecule_id) {
            deleted.push_back(it->second);
            it = m_bonds.erase(it);
        } else
            ++it;
    }
    return deleted;
}

void BondManager::setCooldown(int a, int b, double until_ms)
{
    double& stamp = m_cooldowns[PairKey(a, b)];
    stamp = std::max(stamp, until_ms);
}

bool BondManager::inCooldown(int a, int b, double now_ms) const
{
    auto it = m_cooldowns.find(PairKey(a, b));
    return it != m_cooldowns.end() && now_ms < it->second;
}

bool BondManager::isForming(int a, int b) const
{
    const IntPair pair = OrderedPair(a, b);
    return std::any_of(m_forming.begin(), m_forming.end(), [&pair](const FormingBond& f) {
        return f.atom_a == pair.first && f.atom_b == pair.second;
    });
}

void BondManager::startForming(int a, int b, double now_ms)
{
    if (a == b || isForming(a, b) || hasBond(a, b))
        return;
    const IntPair pair = OrderedPair(a, b);
    m_forming.push_back({ pair.first, pair.second, now_ms });
    ValencyLogger::debug_fmt("Bond {} forming", PairKey(a, b));
}

int BondManager::cancelForming(int atom)
{
    const auto before = m_forming.size();
    m_forming.erase(std::remove_if(m_forming.begin(), m_forming.end(),
                        [atom](const FormingBond& f) { return f.atom_a == atom || f.atom_b == atom; }),
        m_forming.end());
    return static_cast<int>(before - m_forming.size());
}

std::vector<FormingBond> BondManager::advanceForming(double now_ms, const AtomTable& atoms, PhysicsWorld& world)
{
    std::vector<FormingBond> finished;
    std::vector<FormingBond> running;

    for (const auto& forming : m_forming) {
        auto a = atoms.find(forming.atom_a);
        auto b = atoms.find(forming.atom_b);
        if (a == atoms.end() || b == atoms.end())
            continue;

        double p = m_formation_duration > 0 ? (now_ms - forming.start_ms) / m_formation_duration : 1.0;
        p = std::min(std::max(p, 0.0), 1.0);

        if (p >= 1.0) {
            finished.push_back(forming);
            continue;
        }
        running.push_back(forming);

        // members of a molecule have no body to pull on
        const BodyId body_a = a->second.body;
        const BodyId body_b = b->second.body;
        if (!world.hasBody(body_a) || !world.hasBody(body_b))
            continue;

        Position direction = world.position(body_b) - world.position(body_a);
        const double distance = direction.norm();
        if (distance < 1e-9)
            continue;
        direction /= distance;

        const double ease = p < 0.5 ? 2.0 * p * p : -1.0 + (4.0 - 2.0 * p) * p;
        const Position force = direction * ease * m_formation_force;
        world.applyForce(body_a, force);
        world.applyForce(body_b, -force);
    }

    m_forming = running;
    return finished;
}

int BondManager::scan(double now_ms, const AtomTable& atoms, const std::vector<AtomSnapshot>& free_atoms, double system_energy, PhysicsWorld& world)
{
    m_last_scan = now_ms;
    int started = 0;

    for (std::size_t i = 0; i < free_atoms.size(); ++i) {
        for (std::size_t j = i + 1; j < free_atoms.size(); ++j) {
            const AtomSnapshot& first = free_atoms[i];
            const AtomSnapshot& second = free_atoms[j];

            if (hasBond(first.id, second.id) || isForming(first.id, second.id) || inCooldown(first.id, second.id, now_ms))
                continue;

            const double distance = (second.position - first.position).norm();
            if (distance >= m_attraction_threshold)
                continue;

            auto a = atoms.find(first.id);
            auto b = atoms.find(second.id);
            if (a == atoms.end() || b == atoms.end())
                continue;

            const bool eligible = m_evaluator.canFormBond(a->second, bondCount(first.id) + pendingCount(first.id),
                                      b->second, bondCount(second.id) + pendingCount(second.id), system_energy)
                && m_evaluator.isPreferred(first, second, free_atoms);

            setCooldown(first.id, second.id, now_ms + m_cooldown);
            if (!eligible)
                continue;

            if (distance < m_bond_threshold) {
                startForming(first.id, second.id, now_ms);
                ++started;
            } else if (distance > 1e-9) {
                const Position direction = (second.position - first.position) / distance;
                const Position force = direction * (m_attraction_threshold - distance) * m_attraction_strength;
                world.applyForce(first.body, force);
                world.applyForce(second.body, -force);
            }
        }
    }
    return started;
}

BondView BondManager::view(const Bond& bond, const AtomTable& atoms, const PositionLookup& lookup) const
{
    BondView result;
    result.bond = bond;

    auto a = atoms.find(bond.atom_a);
    auto b = atoms.find(bond.atom_b);
    const int za = a == atoms.end() ? 0 : a->second.protons;
    const int zb = b == atoms.end() ? 0 : b->second.protons;
    result.break_length = m_evaluator.breakLength(za, zb, bond.rest_length);

    auto position_a = lookup(bond.atom_a);
    auto position_b = lookup(bond.atom_b);
    if (position_a && position_b)
        result.distance = (*position_b - *position_a).norm();

    result.stress = result.break_length > 0 ? result.distance / result.break_length : 0.0;
    result.stressed = result.stress > m_evaluator.stressWarning();
    return result;
}

std::vector<BondView> BondManager::views(const AtomTable& atoms, const PositionLookup& lookup) const
{
    std::vector<BondView> result;
    for (const auto& entry : m_bonds)
        result.push_back(view(entry.second, atoms, lookup));
    return result;
}

std::vector<Bond> BondManager::overstretched(const AtomTable& atoms, const PositionLookup& lookup) const
{
    std::vector<Bond> result;
    for (const auto& entry : m_bonds) {
        const BondView current = view(entry.second, atoms, lookup);
        if (current.distance > current.break_length)
            result.push_back(entry.second);
    }
    return result;
}

void BondManager::clear()
{
    m_bonds.clear();
    m_cooldowns.clear();
    m_forming.clear();
    m_last_scan = -std::numeric_limits<double>::infinity();
}
