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
 */

#include "src/core/periodic_table.h"

namespace PeriodicTable {

/**
 * Index: atomic_number - 1
 * Z, symbol, name, valence, max bonds, EN, radius [A], IE [eV], EA [eV], oxidation states
 */
static const std::vector<ChemicalElement> CATALOG = {
    { 1, "H", "Hydrogen", 1, 1, 2.20, 0.37, 13.6, 0.75, { -1, 1 } },
    { 2, "He", "Helium", 2, 0, 0.00, 0.32, 24.6, 0.00, { 0 } },
    { 3, "Li", "Lithium", 1, 1, 0.98, 1.52, 5.4, 0.62, { 1 } },
    { 4, "Be", "Beryllium", 2, 2, 1.57, 1.12, 9.3, 0.00, { 2 } },
    { 5, "B", "Boron", 3, 3, 2.04, 0.88, 8.3, 0.28, { 3 } },
    { 6, "C", "Carbon", 4, 4, 2.55, 0.77, 11.3, 1.26, { -4, -3, -2, -1, 0, 1, 2, 3, 4 } },
    { 7, "N", "Nitrogen", 5, 3, 3.04, 0.75, 14.5, 0.07, { -3, -2, -1, 0, 1, 2, 3, 4, 5 } },
    { 8, "O", "Oxygen", 6, 2, 3.44, 0.73, 13.6, 1.46, { -2, -1, 0, 1, 2 } },
    { 9, "F", "Fluorine", 7, 1, 3.98, 0.71, 17.4, 3.40, { -1 } },
    { 10, "Ne", "Neon", 8, 0, 0.00, 0.69, 21.6, 0.00, { 0 } },
    { 11, "Na", "Sodium", 1, 1, 0.93, 1.86, 5.1, 0.55, { 1 } },
    { 12, "Mg", "Magnesium", 2, 2, 1.31, 1.60, 7.6, 0.00, { 2 } },
    { 13, "Al", "Aluminum", 3, 3, 1.61, 1.43, 6.0, 0.43, { 3 } },
    { 14, "Si", "Silicon", 4, 4, 1.90, 1.18, 8.2, 1.39, { -4, 2, 4 } },
    { 15, "P", "Phosphorus", 5, 5, 2.19, 1.10, 10.5, 0.75, { -3, 3, 5 } },
    { 16, "S", "Sulfur", 6, 6, 2.58, 1.04, 10.4, 2.08, { -2, 2, 4, 6 } },
    { 17, "Cl", "Chlorine", 7, 7, 3.16, 0.99, 13.0, 3.61, { -1, 1, 3, 5, 7 } },
    { 18, "Ar", "Argon", 8, 0, 0.00, 0.97, 15.8, 0.00, { 0 } }
};

// ============================================================================
// PUBLIC INTERFACE
// ============================================================================

const ChemicalElement* element(int atomic_number)
{
    if (atomic_number < 1 || atomic_number > static_cast<int>(CATALOG.size()))
        return nullptr;
    return &CATALOG[atomic_number - 1];
}

int atomicNumber(const std::string& symbol)
{
    for (const auto& entry : CATALOG) {
        if (entry.symbol == symbol)
            return entry.atomic_number;
    }
    return 0;
}

int count()
{
    return static_cast<int>(CATALOG.size());
}

std::string symbol(int atomic_number)
{
    const ChemicalElement* entry = element(atomic_number);
    return entry ? entry->symbol : "E" + std::to_string(atomic_number);
}

std::string name(int atomic_number)
{
    const ChemicalElement* entry = element(atomic_number);
    return entry ? entry->name : "Custom";
}

int maxBonds(int atomic_number)
{
    const ChemicalElement* entry = element(atomic_number);
    return entry ? entry->max_bonds : 0;
}

int valence(int atomic_number, int fallback)
{
    const ChemicalElement* entry = element(atomic_number);
    return entry ? entry->valence_electrons : fallback;
}

double radius(int atomic_number, double fallback)
{
    const ChemicalElement* entry = element(atomic_number);
    return entry ? entry->atomic_radius : fallback;
}

bool isNobleGas(int atomic_number)
{
    // Noble gases are the only catalog entries without bonding capacity
    const ChemicalElement* entry = element(atomic_number);
    return entry && entry->max_bonds == 0;
}

} // namespace PeriodicTable
