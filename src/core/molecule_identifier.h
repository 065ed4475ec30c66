/*
 * <Connected components, classification and naming of molecules>
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
#include <optional>
#include <string>
#include <vector>

/*! \brief Atom count per atomic number */
typedef std::map<int, int> Composition;

struct KnownMolecule {
    std::string name;
    std::string geometry;
    double bond_length;
    int atom_count;
    Composition composition;
};

class MoleculeIdentifier {
public:
    MoleculeIdentifier() = default;

    /*! \brief Connected components of size >= 2
     *
     * Only atoms that are not molecule members and bonds between two such
     * atoms are considered. Every component is sorted ascending, the list
     * is ordered by the smallest id of each component.
     */
    static std::vector<std::vector<int>> components(const AtomTable& atoms, const std::vector<Bond>& bonds);

    /*! \brief Ascending atom ids joined by '-' */
    static std::string canonicalId(std::vector<int> atoms);

    static Composition composition(const std::vector<Atom>& atoms);

    /*! \brief Exact match of atom count and element counts */
    static std::optional<KnownMolecule> matchKnown(const Composition& composition);
    static const std::vector<KnownMolecule>& knownMolecules();

    /*! \brief Elements by atomic number, Unicode subscripts for counts > 1 */
    static std::string formula(const Composition& composition);

    /*! \brief e.g. "dihydrogen dioxygen (H₂O₂)", parts by ascending electronegativity */
    static std::string systematicName(const Composition& composition);

    /*! \brief Build the record of one component (body is left invalid)
     *
     * Known compositions take name, geometry and bond length from the
     * table, others get a systematic name, the VSEPR geometry of their
     * actual bonds and the mean ideal bond length. Offsets are relative
     * to the centroid of the placement template.
     */
    Molecule describe(const std::vector<Atom>& atoms, const std::vector<Bond>& bonds) const;

    /*! \brief Append a name if unseen, returns true for a first discovery */
    bool discover(const std::string& name);
    bool isDiscovered(const std::string& name) const;
    const StringList& discovered() const { return m_discovered; }
    void clearDiscovered() { m_discovered.clear(); }

    json exportDiscovered() const;

    /*! \brief Merge names from {"discovered": [...]}, returns the number added */
    int importDiscovered(const json& data);

    bool saveDiscovered(const std::string& path) const;
    bool loadDiscovered(const std::string& path);

private:
    StringList m_discovered;
};
