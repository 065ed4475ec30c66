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

#include "src/core/molecule_identifier.h"
#include "src/core/periodic_table.h"
#include "src/core/vsepr.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <set>
#include <stack>

namespace {

const char* SUBSCRIPTS[] = { "₀", "₁", "₂", "₃", "₄", "₅", "₆", "₇", "₈", "₉" };

const char* PREFIXES[] = { "", "mono", "di", "tri", "tetra", "penta", "hexa", "hepta", "octa", "nona", "deca" };

std::string subscript(int count)
{
    std::string digits = std::to_string(count);
    std::string result;
    for (char c : digits)
        result += SUBSCRIPTS[c - '0'];
    return result;
}

std::string lowercase(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(), ::tolower);
    return text;
}

double sortElectronegativity(int atomic_number)
{
    const ChemicalElement* element = PeriodicTable::element(atomic_number);
    return element ? element->electronegativity : std::numeric_limits<double>::infinity();
}

}

std::vector<std::vector<int>> MoleculeIdentifier::components(const AtomTable& atoms, const std::vector<Bond>& bonds)
{
    std::map<int, std::set<int>> adjacency;
    auto is_free = [&atoms](int id) {
        auto it = atoms.find(id);
        return it != atoms.end() && !it->second.molecule_member;
    };

    for (const auto& bond : bonds) {
        if (!is_free(bond.atom_a) || !is_free(bond.atom_b))
            continue;
        adjacency[bond.atom_a].insert(bond.atom_b);
        adjacency[bond.atom_b].insert(bond.atom_a);
    }

    std::vector<std::vector<int>> result;
    std::set<int> visited;
    for (const auto& entry : adjacency) {
        if (visited.count(entry.first))
            continue;

        std::vector<int> component;
        std::stack<int> pending;
        pending.push(entry.first);
        visited.insert(entry.first);
        while (!pending.empty()) {
            const int current = pending.top();
            pending.pop();
            component.push_back(current);
            for (int neighbour : adjacency[current]) {
                if (visited.insert(neighbour).second)
                    pending.push(neighbour);
            }
        }

        std::sort(component.begin(), component.end());
        if (component.size() >= 2)
            result.push_back(component);
    }
    return result;
}

std::string MoleculeIdentifier::canonicalId(std::vector<int> atoms)
{
    std::sort(atoms.begin(), atoms.end());
    std::string id;
    for (std::size_t i = 0; i < atoms.size(); ++i) {
        if (i)
            id += "-";
        id += std::to_string(atoms[i]);
    }
    return id;
}

Composition MoleculeIdentifier::composition(const std::vector<Atom>& atoms)
{
    Composition result;
    for (const auto& atom : atoms)
        result[atom.protons]++;
    return result;
}

const std::vector<KnownMolecule>& MoleculeIdentifier::knownMolecules()
{
    static const std::vector<KnownMolecule> known = {
        { "Water (H₂O)", "bent", 2.0, 3, { { 8, 1 }, { 1, 2 } } },
        { "Carbon Dioxide (CO₂)", "linear", 2.2, 3, { { 6, 1 }, { 8, 2 } } },
        { "Nitrous Oxide (N₂O)", "linear", 1.8, 3, { { 7, 2 }, { 8, 1 } } },
        { "Methane (CH₄)", "tetrahedral", 1.8, 5, { { 6, 1 }, { 1, 4 } } },
        { "Ammonia (NH₃)", "trigonal_pyramidal", 1.6, 4, { { 7, 1 }, { 1, 3 } } },
        { "Nitrogen Gas (N₂)", "linear", 1.6, 2, { { 7, 2 } } },
        { "Oxygen Gas (O₂)", "linear", 1.5, 2, { { 8, 2 } } },
        { "Hydrogen Gas (H₂)", "linear", 1.2, 2, { { 1, 2 } } }
    };
    return known;
}

std::optional<KnownMolecule> MoleculeIdentifier::matchKnown(const Composition& composition)
{
    int atom_count = 0;
    for (const auto& entry : composition)
        atom_count += entry.second;

    for (const auto& known : knownMolecules()) {
        if (known.atom_count == atom_count && known.composition == composition)
            return known;
    }
    return std::nullopt;
}

std::string MoleculeIdentifier::formula(const Composition& composition)
{
    std::string result;
    for (const auto& entry : composition) {
        result += PeriodicTable::symbol(entry.first);
        if (entry.second > 1)
            result += subscript(entry.second);
    }
    return result;
}

std::string MoleculeIdentifier::systematicName(const Composition& composition)
{
    std::vector<std::pair<int, int>> parts(composition.begin(), composition.end());
    // std::map order breaks electronegativity ties by atomic number
    std::stable_sort(parts.begin(), parts.end(), [](const std::pair<int, int>& x, const std::pair<int, int>& y) {
        return sortElectronegativity(x.first) < sortElectronegativity(y.first);
    });

    std::string name;
    std::string ordered_formula;
    for (const auto& part : parts) {
        std::string prefix;
        if (part.second > 10)
            prefix = std::to_string(part.second) + "-";
        else if (part.second > 1)
            prefix = PREFIXES[part.second];

        if (!name.empty())
            name += " ";
        name += prefix + lowercase(PeriodicTable::name(part.first));

        ordered_formula += PeriodicTable::symbol(part.first);
        if (part.second > 1)
            ordered_formula += subscript(part.second);
    }
    return name + " (" + ordered_formula + ")";
}

Molecule MoleculeIdentifier::describe(const std::vector<Atom>& atoms, const std::vector<Bond>& bonds) const
{
    Molecule molecule;
    std::vector<Atom> members = atoms;
    std::sort(members.begin(), members.end(), [](const Atom& x, const Atom& y) { return x.id < y.id; });

    for (const auto& atom : members)
        molecule.atoms.push_back(atom.id);
    molecule.id = canonicalId(molecule.atoms);

    const Composition counts = composition(members);
    molecule.formula = formula(counts);
    molecule.central_atom = VSEPR::findOptimalCentralAtom(members);

    double energy = 0.0;
    double length = 0.0;
    for (const auto& bond : bonds) {
        energy += bond.energy;
        length += bond.ideal_length;
    }

    if (auto known = matchKnown(counts)) {
        molecule.name = known->name;
        molecule.geometry = known->geometry;
        molecule.bond_length = known->bond_length;
    } else {
        molecule.name = systematicName(counts);
        molecule.geometry = VSEPR::determineGeometry(members, bonds, molecule.central_atom);
        molecule.bond_length = bonds.empty() ? 2.0 : length / bonds.size();
    }
    molecule.stability = members.empty() ? 0.0 : energy / members.size();

    auto positions = VSEPR::calculateMolecularPositions(members, molecule.geometry, molecule.bond_length, molecule.central_atom);
    Position centroid = Position::Zero();
    for (const auto& entry : positions)
        centroid += entry.second;
    if (!positions.empty())
        centroid /= static_cast<double>(positions.size());

    for (int id : molecule.atoms) {
        auto it = positions.find(id);
        molecule.offsets.push_back(it == positions.end() ? Position::Zero() : Position(it->second - centroid));
    }
    return molecule;
}

bool MoleculeIdentifier::discover(const std::string& name)
{
    if (name.empty() || isDiscovered(name))
        return false;
    m_discovered.push_back(name);
    return true;
}

bool MoleculeIdentifier::isDiscovered(const std::string& name) const
{
    return std::find(m_discovered.begin(), m_discovered.end(), name) != m_discovered.end();
}

json MoleculeIdentifier::exportDiscovered() const
{
    json data;
    data["discovered"] = m_discovered;
    return data;
}

int MoleculeIdentifier::importDiscovered(const json& data)
{
    if (!data.is_object() || !data.contains("discovered") || !data["discovered"].is_array())
        return 0;

    int added = 0;
    for (const auto& entry : data["discovered"]) {
        if (entry.is_string() && discover(entry.get<std::string>()))
            ++added;
    }
    return added;
}

bool MoleculeIdentifier::saveDiscovered(const std::string& path) const
{
    std::ofstream file(path);
    if (!file.is_open()) {
        ValencyLogger::error("Cannot write discovered molecules to " + path);
        return false;
    }
    file << exportDiscovered().dump(2) << std::endl;
    return true;
}

bool MoleculeIdentifier::loadDiscovered(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        ValencyLogger::warn("No discovered molecules file at " + path);
        return false;
    }

    json data;
    try {
        file >> data;
    } catch (const json::parse_error& error) {
        ValencyLogger::error_fmt("Malformed discovered molecules file {}: {}", path, error.what());
        return false;
    }

    const int added = importDiscovered(data);
    ValencyLogger::info_fmt("Loaded {} discovered molecules from {}", added, path);
    return true;
}
