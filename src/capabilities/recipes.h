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

#pragma once

#include "src/core/global.h"

#include <string>
#include <vector>

/*! \brief count units of one element, either single atoms or bonded pairs */
struct Reactant {
    int protons;
    int count;
    bool diatomic;
};

struct Recipe {
    std::string id;
    std::string name;
    std::string formula;
    std::string description;
    double heat_intensity;
    double activation_energy;
    std::vector<Reactant> reactants;
    bool natural = true; // false if the reaction needs conditions the simulation lacks
};

/*! \brief One atom to spawn, paired atoms are bonded right away */
struct SpawnSite {
    int protons;
    Position position;
    int partner = -1; // index into the layout
};

namespace Recipes {

const std::vector<Recipe>& all();

/*! \brief Recipe by id, nullptr if unknown */
const Recipe* find(const std::string& id);

StringList ids();

/*! \brief Units on a circle of radius 3 around origin
 *
 * A diatomic unit places its two atoms 1.5 apart along x.
 */
std::vector<SpawnSite> layout(const Recipe& recipe, const Position& origin);

/*! \brief Atoms along x with the given spacing, from symbols like "H,H,O" */
std::vector<SpawnSite> layoutSymbols(const std::string& symbols, const Position& origin, double spacing);

}
