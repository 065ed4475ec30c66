/*
 * <VSEPR geometry classification and placement templates>
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

#include "src/core/vsepr.h"
#include "src/core/periodic_table.h"

#include <cmath>
#include <limits>

namespace VSEPR {

static const double BENT_ANGLE = 104.5 * pi / 180.0;
static const double PYRAMIDAL_ANGLE = 107.0 * pi / 180.0;

double lonePairs(int valence_electrons, int bonds)
{
    return std::max(0.0, (valence_electrons - 2.0 * bonds) / 2.0);
}

std::string determineGeometry(const std::vector<Atom>& atoms, const std::vector<Bond>& bonds, int central_atom)
{
    if (atoms.size() == 1)
        return "atomic";
    if (atoms.size() == 2)
        return "linear";

    const ChemicalElement* element = nullptr;
    for (const auto& atom : atoms) {
        if (atom.id == central_atom)
            element = PeriodicTable::element(atom.protons);
    }
    if (!element)
        return "unknown";

    int bond_count = 0;
    for (const auto& bond : bonds) {
        if (bond.involves(central_atom))
            ++bond_count;
    }

    const double lone_pairs = lonePairs(element->valence_electrons, bond_count);
    const double total_pairs = bond_count + lone_pairs;

    // half-integer pair counts match nothing
    if (total_pairs == 2)
        return "linear";
    if (total_pairs == 3)
        return lone_pairs == 0 ? "trigonal_planar" : "bent";
    if (total_pairs == 4) {
        if (lone_pairs == 0)
            return "tetrahedral";
        if (lone_pairs == 1)
            return "trigonal_pyramidal";
        if (lone_pairs == 2)
            return "bent";
    }
    if (total_pairs == 5) {
        if (lone_pairs == 0)
            return "trigonal_bipyramidal";
        if (lone_pairs == 1)
            return "seesaw";
        if (lone_pairs == 2)
            return "T_shaped";
        if (lone_pairs == 3)
            return "linear";
    }
    if (total_pairs == 6) {
        if (lone_pairs == 0)
            return "octahedral";
        if (lone_pairs == 1)
            return "square_pyramidal";
        if (lone_pairs == 2)
            return "square_planar";
    }
    return "complex";
}

std::map<int, Position> calculateMolecularPositions(const std::vector<Atom>& atoms, const std::string& geometry, double bond_length, int central_atom)
{
    std::map<int, Position> positions;
    const double L = bond_length;

    if (atoms.empty())
        return positions;

    if (atoms.size() == 1) {
        positions[atoms[0].id] = Position::Zero();
        return positions;
    }

    if (atoms.size() == 2) {
        positions[atoms[0].id] = Position(-L / 2.0, 0, 0);
        positions[atoms[1].id] = Position(L / 2.0, 0, 0);
        return positions;
    }

    if (central_atom < 0)
        central_atom = findOptimalCentralAtom(atoms);

    std::vector<int> others;
    for (const auto& atom : atoms) {
        if (atom.id != central_atom)
            others.push_back(atom.id);
    }
    positions[central_atom] = Position::Zero();

    const int n = static_cast<int>(others.size());
    auto circle = [L, n](int i) {
        const double angle = 2.0 * pi * i / n;
        return Position(L * std::cos(angle), L * std::sin(angle), 0);
    };

    std::vector<Position> slots;
    if (geometry == "linear") {
        // alternate sides so the center stays between its neighbours
        for (int i = 0; i < n; ++i)
            slots.push_back(Position((i % 2 == 0 ? 1.0 : -1.0) * (i / 2 + 1) * L, 0, 0));
    } else if (geometry == "bent") {
        slots.push_back(Position(L * std::sin(BENT_ANGLE / 2.0), L * std::cos(BENT_ANGLE / 2.0), 0));
        slots.push_back(Position(L * std::sin(-BENT_ANGLE / 2.0), L * std::cos(-BENT_ANGLE / 2.0), 0));
    } else if (geometry == "trigonal_planar") {
        for (int i = 0; i < 3; ++i) {
            const double angle = 2.0 * pi * i / 3.0;
            slots.push_back(Position(L * std::cos(angle), L * std::sin(angle), 0));
        }
    } else if (geometry == "tetrahedral") {
        slots.push_back(Position(1, 1, 1).normalized() * L);
        slots.push_back(Position(-1, -1, 1).normalized() * L);
        slots.push_back(Position(-1, 1, -1).normalized() * L);
        slots.push_back(Position(1, -1, -1).normalized() * L);
    } else if (geometry == "trigonal_pyramidal") {
        // three ligands on a cone below the center, cos^2(theta) = (2 cos(alpha) + 1) / 3
        const double theta = std::acos(std::sqrt((2.0 * std::cos(PYRAMIDAL_ANGLE) + 1.0) / 3.0));
        for (int i = 0; i < 3; ++i) {
            const double phi = 2.0 * pi * i / 3.0;
            slots.push_back(Position(L * std::sin(theta) * std::cos(phi), -L * std::cos(theta), L * std::sin(theta) * std::sin(phi)));
        }
    }

    for (int i = 0; i < n; ++i)
        positions[others[i]] = i < static_cast<int>(slots.size()) ? slots[i] : circle(i);

    return positions;
}

int findOptimalCentralAtom(const std::vector<Atom>& atoms)
{
    if (atoms.empty())
        return -1;

    bool any_multivalent = false;
    for (const auto& atom : atoms) {
        if (PeriodicTable::maxBonds(atom.protons) >= 2)
            any_multivalent = true;
    }

    int best = -1;
    bool found = false;
    double best_score = -std::numeric_limits<double>::infinity();
    for (const auto& atom : atoms) {
        const ChemicalElement* element = PeriodicTable::element(atom.protons);
        if (any_multivalent && (!element || element->max_bonds < 2))
            continue;
        const double score = element ? element->max_bonds - element->electronegativity
                                     : -std::numeric_limits<double>::infinity();
        if (!found || score > best_score) {
            best = atom.id;
            best_score = score;
            found = true;
        }
    }
    return best;
}

} // namespace VSEPR
