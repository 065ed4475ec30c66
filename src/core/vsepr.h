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

#pragma once

#include "src/core/chemistry.h"

#include <map>
#include <string>
#include <vector>

namespace VSEPR {

/**
 * @brief Lone electron pairs at a center, max(0, (valence - 2 * bonds) / 2)
 */
double lonePairs(int valence_electrons, int bonds);

/**
 * @brief Classify the shape around the central atom
 * @param atoms Members of the molecule
 * @param bonds Bonds among the members (only those touching central count)
 * @param central_atom Id of the central atom
 * @return atomic, linear, bent, trigonal_planar, tetrahedral,
 *         trigonal_pyramidal, trigonal_bipyramidal, seesaw, T_shaped,
 *         octahedral, square_pyramidal, square_planar, complex or
 *         unknown (central element not in the catalog)
 */
std::string determineGeometry(const std::vector<Atom>& atoms, const std::vector<Bond>& bonds, int central_atom);

/**
 * @brief Relative positions of all atoms for a geometry
 *
 * The central atom sits at the origin. Two-atom molecules are centered
 * on the origin instead. Geometries without a template, and atoms beyond
 * the capacity of a template, are placed on a circle of radius bond_length.
 *
 * @return Offset per atom id
 */
std::map<int, Position> calculateMolecularPositions(const std::vector<Atom>& atoms, const std::string& geometry, double bond_length, int central_atom);

/**
 * @brief Atom best suited as center: maximal (max bonds - electronegativity)
 *
 * Only atoms able to form at least two bonds are candidates, unless there
 * are none. Ties keep the atom encountered first.
 *
 * @return Atom id, -1 for an empty list
 */
int findOptimalCentralAtom(const std::vector<Atom>& atoms);

} // namespace VSEPR
