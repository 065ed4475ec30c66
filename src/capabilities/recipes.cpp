/*
 * <Molecular recipes and reactant layouts>
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

#include "src/capabilities/recipes.h"
#include "src/core/periodic_table.h"

#include <cmath>
#include <sstream>

namespace Recipes {

const std::vector<Recipe>& all()
{
    static const std::vector<Recipe> recipes = {
        { "water", "Water", "H₂O", "2 H₂ + O₂ → 2 H₂O", 8.0, 12.0,
            { { 1, 2, true }, { 8, 1, true } }, true },
        { "carbon_dioxide", "Carbon Dioxide", "CO₂", "C + O₂ → CO₂", 15.0, 18.0,
            { { 6, 1, false }, { 8, 1, true } }, true },
        { "methane", "Methane", "CH₄", "C + 2 H₂ → CH₄", 12.0, 15.0,
            { { 6, 1, false }, { 1, 2, true } }, true },
        { "ammonia", "Ammonia", "NH₃", "N₂ + 3 H₂ → 2 NH₃ (Haber process)", 20.0, 25.0,
            { { 7, 1, true }, { 1, 3, true } }, false },
        { "hydrogen_gas", "Hydrogen Gas", "H₂", "H + H → H₂", 3.0, 5.0,
            { { 1, 2, false } }, true },
        { "oxygen_gas", "Oxygen Gas", "O₂", "O + O → O₂", 5.0, 8.0,
            { { 8, 2, false } }, true }
    };
    return recipes;
}

const Recipe* find(const std::string& id)
{
    for (const auto& recipe : all()) {
        if (recipe.id == id)
            return &recipe;
    }
    return nullptr;
}

StringList ids()
{
    StringList result;
    for (const auto& recipe : all())
        result.push_back(recipe.id);
    return result;
}

std::vector<SpawnSite> layout(const Recipe& recipe, const Position& origin)
{
    int units = 0;
    for (const auto& reactant : recipe.reactants)
        units += reactant.count;

    std::vector<SpawnSite> sites;
    int slot = 0;
    for (const auto& reactant : recipe.reactants) {
        for (int i = 0; i < reactant.count; ++i, ++slot) {
            const double angle = units > 0 ? 2.0 * pi * slot / units : 0.0;
            const Position center = origin + Position(3.0 * std::cos(angle), 3.0 * std::sin(angle), 0.0);
            if (reactant.diatomic) {
                const int first = static_cast<int>(sites.size());
                sites.push_back({ reactant.protons, center - Position(0.75, 0, 0), first + 1 });
                sites.push_back({ reactant.protons, center + Position(0.75, 0, 0), first });
            } else
                sites.push_back({ reactant.protons, center, -1 });
        }
    }
    return sites;
}

std::vector<SpawnSite> layoutSymbols(const std::string& symbols, const Position& origin, double spacing)
{
    std::vector<SpawnSite> sites;
    std::stringstream stream(symbols);
    std::string symbol;
    while (std::getline(stream, symbol, ',')) {
        symbol.erase(0, symbol.find_first_not_of(" \t"));
        symbol.erase(symbol.find_last_not_of(" \t") + 1);
        if (symbol.empty())
            continue;

        int protons = PeriodicTable::atomicNumber(symbol);
        if (protons == 0) {
            ValencyLogger::warn("Unknown element symbol '" + symbol + "' skipped");
            continue;
        }
        sites.push_back({ protons, origin + Position(spacing * sites.size(), 0, 0), -1 });
    }
    return sites;
}

}
