/*
 * <Element catalog of the bonding engine>
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
 * Element Catalog
 * ===============
 * Static chemical constants of the first 18 elements (H - Ar).
 * Everything outside this range is unknown to the engine and can
 * never take part in a bond.
 */

#pragma once

#include <string>
#include <vector>

struct ChemicalElement {
    int atomic_number;
    std::string symbol;
    std::string name;
    int valence_electrons;
    int max_bonds;
    double electronegativity; // Pauling, 0 for noble gases
    double atomic_radius; // Angstrom
    double ionization_energy; // eV
    double electron_affinity; // eV
    std::vector<int> oxidation_states;
};

namespace PeriodicTable {

/**
 * @brief Look up an element
 * @param atomic_number Atomic number
 * @return Pointer into the static catalog, nullptr if the element is unknown
 */
const ChemicalElement* element(int atomic_number);

/**
 * @brief Look up an element by its symbol (case-sensitive, e.g. "Cl")
 * @return Atomic number or 0 if no such element is known
 */
int atomicNumber(const std::string& symbol);

/**
 * @brief Number of elements in the catalog
 */
int count();

/**
 * @brief Element symbol, "E<Z>" for unknown elements
 */
std::string symbol(int atomic_number);

/**
 * @brief Element name, "Custom" for unknown elements
 */
std::string name(int atomic_number);

/**
 * @brief Maximum number of bonds, 0 for unknown elements
 */
int maxBonds(int atomic_number);

/**
 * @brief Valence electrons, or fallback for unknown elements
 */
int valence(int atomic_number, int fallback = 0);

/**
 * @brief Atomic radius in Angstrom, or fallback for unknown elements
 */
double radius(int atomic_number, double fallback);

/**
 * @brief Check if an element is a noble gas (He, Ne, Ar)
 */
bool isNobleGas(int atomic_number);

} // namespace PeriodicTable
