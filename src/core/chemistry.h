/*
 * <Atom, bond and molecule records of the bonding engine>
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

#include <map>
#include <string>
#include <vector>

typedef int BodyId;
const BodyId InvalidBody = -1;

enum class BondType {
    Covalent,
    Ionic,
    Metallic,
    Hydrogen
};

inline std::string BondTypeName(BondType type)
{
    switch (type) {
    case BondType::Covalent:
        return "covalent";
    case BondType::Ionic:
        return "ionic";
    case BondType::Metallic:
        return "metallic";
    case BondType::Hydrogen:
        return "hydrogen";
    }
    return "unknown";
}

/*! \brief Outcome of a bond request */
enum class BondStatus {
    Created,
    AlreadyBonded, // duplicate request, nothing changed
    ValenceExceeded,
    InvalidElement,
    UnknownAtom,
    SelfBond
};

inline std::string BondStatusName(BondStatus status)
{
    switch (status) {
    case BondStatus::Created:
        return "created";
    case BondStatus::AlreadyBonded:
        return "already bonded";
    case BondStatus::ValenceExceeded:
        return "valence exceeded";
    case BondStatus::InvalidElement:
        return "invalid element";
    case BondStatus::UnknownAtom:
        return "unknown atom";
    case BondStatus::SelfBond:
        return "self bond";
    }
    return "unknown";
}

struct Atom {
    int id = -1;
    int protons = 1;
    int neutrons = 0;
    int electrons = 1;
    bool molecule_member = false;
    std::string molecule_id;
    BodyId body = InvalidBody; // invalid while the atom is part of a molecule body

    double mass() const
    {
        int nucleons = protons + neutrons;
        return nucleons > 0 ? nucleons : 1.0;
    }
};

typedef std::map<int, Atom> AtomTable;

struct Bond {
    std::string id; // PairKey(atom_a, atom_b)
    int atom_a = -1; // atom_a < atom_b
    int atom_b = -1;
    int order = 1;
    BondType type = BondType::Covalent;
    double energy = 0.0;
    double ideal_length = 0.0;
    double polarity = 0.0;
    double rest_length = 0.0; // template distance inside a molecule, 0 in the free pool
    std::string molecule_id; // empty while the bond is in the free pool

    bool involves(int atom) const { return atom == atom_a || atom == atom_b; }
    int partner(int atom) const { return atom == atom_a ? atom_b : atom_a; }
};

/*! \brief Bond with its current stretch, as reported to callers */
struct BondView {
    Bond bond;
    double distance = 0.0;
    double break_length = 0.0;
    double stress = 0.0; // distance / break_length
    bool stressed = false;
};

struct Molecule {
    std::string id; // ascending atom ids joined by '-'
    std::string name;
    std::string formula;
    std::string geometry;
    std::vector<int> atoms;
    int central_atom = -1;
    std::vector<Position> offsets; // per entry of atoms, relative to the body
    BodyId body = InvalidBody;
    double stability = 0.0;
    double bond_length = 0.0;

    int partIndex(int atom) const
    {
        for (std::size_t i = 0; i < atoms.size(); ++i)
            if (atoms[i] == atom)
                return static_cast<int>(i);
        return -1;
    }
};

/*! \brief Free atom as seen by the proximity scans */
struct AtomSnapshot {
    int id;
    int protons;
    BodyId body;
    Position position;
};

enum class EventType {
    BondCreated,
    BondBroken,
    BondRejected,
    MoleculeFormed,
    MoleculeBroken,
    ReactionStarted,
    ReactionCompleted
};

inline std::string EventTypeName(EventType type)
{
    switch (type) {
    case EventType::BondCreated:
        return "bond created";
    case EventType::BondBroken:
        return "bond broken";
    case EventType::BondRejected:
        return "bond rejected";
    case EventType::MoleculeFormed:
        return "molecule formed";
    case EventType::MoleculeBroken:
        return "molecule broken";
    case EventType::ReactionStarted:
        return "reaction started";
    case EventType::ReactionCompleted:
        return "reaction completed";
    }
    return "unknown";
}

/*! \brief Notification queued by the simulation
 *
 * subject is the bond, molecule or reaction id. flag carries
 * "newly discovered" for MoleculeFormed and "success" for ReactionCompleted.
 */
struct SimulationEvent {
    EventType type;
    std::string subject;
    std::string detail;
    bool flag = false;
};
