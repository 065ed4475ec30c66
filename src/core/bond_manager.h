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

#pragma once

#include "src/core/bond_evaluator.h"
#include "src/core/chemistry.h"
#include "src/core/config_manager.h"
#include "src/core/physics_world.h"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

/*! \brief Pair of atoms on its way to a bond */
struct FormingBond {
    int atom_a;
    int atom_b;
    double start_ms;
};

/*! \brief Owner of all bonds, free and molecule internal
 *
 * Pair states: Unbonded -> Forming -> Bonded -> Unbonded.
 * The manager never creates or removes atoms, it only refers to them
 * by id and receives the atom table from the caller.
 */
class BondManager {
public:
    typedef std::function<std::optional<Position>(int atom)> PositionLookup;

    BondManager(const BondEvaluator& evaluator, const ConfigManager& config);

    /*! \brief Create a bond at once, enforcing self, element, duplicate and valence checks */
    BondStatus addBond(const Atom& a, const Atom& b);

    bool removeBond(const std::string& bond_id);

    /*! \brief Remove all bonds of an atom, returns the removed records */
    std::vector<Bond> removeBondsOf(int atom);

    bool hasBond(int a, int b) const { return m_bonds.count(PairKey(a, b)) > 0; }
    const Bond* bond(const std::string& bond_id) const;
    const std::map<std::string, Bond>& bonds() const { return m_bonds; }

    std::vector<Bond> bondsOf(int atom) const;
    std::vector<Bond> freeBonds() const;
    std::vector<Bond> moleculeBonds(const std::string& molecule_id) const;

    /*! \brief Bonds of an atom, internal ones included */
    int bondCount(int atom) const;

    /*! \brief Forming transitions the atom takes part in */
    int pendingCount(int atom) const;

    /*! \brief Assign a bond to a molecule with its template distance */
    void tagMolecule(const std::string& bond_id, const std::string& molecule_id, double rest_length);

    /*! \brief Return the bonds of a molecule to the free pool */
    std::vector<Bond> releaseMolecule(const std::string& molecule_id);

    /*! \brief Delete the bonds of a molecule, returns the deleted records */
    std::vector<Bond> deleteMoleculeBonds(const std::string& molecule_id);

    void setCooldown(int a, int b, double until_ms);
    bool inCooldown(int a, int b, double now_ms) const;

    bool isForming(int a, int b) const;
    void startForming(int a, int b, double now_ms);

    /*! \brief Drop every transition referencing the atom */
    int cancelForming(int atom);

    const std::vector<FormingBond>& forming() const { return m_forming; }

    /*! \brief Pull forming pairs together and hand back the finished ones
     *
     * Force per atom is ease(p) * formation_force with the ease-in-out
     * curve p < 0.5 ? 2p^2 : -1 + (4 - 2p)p. Pairs with an atom missing
     * from atoms are dropped silently.
     */
    std::vector<FormingBond> advanceForming(double now_ms, const AtomTable& atoms, PhysicsWorld& world);

    bool scanDue(double now_ms) const { return now_ms - m_last_scan >= m_check_interval; }

    /*! \brief Proximity scan over free atoms
     *
     * Starts forming for eligible pairs closer than bond_threshold and
     * attracts eligible pairs closer than attraction_threshold. Every
     * evaluated pair is put into cooldown.
     *
     * @return Number of transitions started
     */
    int scan(double now_ms, const AtomTable& atoms, const std::vector<AtomSnapshot>& free_atoms, double system_energy, PhysicsWorld& world);

    BondView view(const Bond& bond, const AtomTable& atoms, const PositionLookup& lookup) const;
    std::vector<BondView> views(const AtomTable& atoms, const PositionLookup& lookup) const;

    /*! \brief Bonds longer than their break length */
    std::vector<Bond> overstretched(const AtomTable& atoms, const PositionLookup& lookup) const;

    double cooldown() const { return m_cooldown; }
    double moleculeBlock() const { return m_molecule_block; }

    void clear();

private:
    const BondEvaluator& m_evaluator;
    std::map<std::string, Bond> m_bonds;
    std::map<std::string, double> m_cooldowns;
    std::vector<FormingBond> m_forming;

    double m_bond_threshold;
    double m_attraction_threshold;
    double m_attraction_strength;
    double m_cooldown;
    double m_check_interval;
    double m_formation_duration;
    double m_formation_force;
    double m_molecule_block;
    double m_last_scan;
};
