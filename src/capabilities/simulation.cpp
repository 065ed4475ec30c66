/*
 * <State owner of the bonding engine>
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

#include "src/capabilities/simulation.h"

#include "src/core/periodic_table.h"
#include "src/core/point_mass_world.h"

#include <algorithm>

namespace {

json moduleInput(const json& controller, const std::string& module)
{
    if (controller.is_object() && controller.contains(module) && controller[module].is_object())
        return controller[module];
    return json::object();
}

bool explicitlySet(const json& input, const StringList& keys)
{
    for (const auto& item : input.items()) {
        std::string key = item.key();
        std::transform(key.begin(), key.end(), key.begin(), ::tolower);
        if (std::find(keys.begin(), keys.end(), key) != keys.end())
            return true;
    }
    return false;
}

}

Simulation::Simulation(const json& controller, std::unique_ptr<PhysicsWorld> world)
    : m_bonding_config("bonding", moduleInput(controller, "bonding"))
    , m_energy_config("energy", moduleInput(controller, "energy"))
    , m_reaction_config("reaction", moduleInput(controller, "reaction"))
    , m_simulation_config("simulation", moduleInput(controller, "simulation"))
    , m_world(world ? std::move(world) : std::unique_ptr<PhysicsWorld>(new PointMassWorld))
    , m_evaluator(m_bonding_config)
    , m_bonds(m_evaluator, m_bonding_config)
    , m_energy(m_energy_config)
    , m_reactions(m_reaction_config)
    , m_molecule_mass_factor(m_simulation_config.get<double>("molecule_mass_factor"))
    , m_separation_speed(m_simulation_config.get<double>("separation_speed"))
{
    const std::string mode_name = m_simulation_config.get<std::string>("mode");
    auto mode = SimulationMode::fromName(mode_name);
    if (!mode) {
        ValencyLogger::warn("Unknown mode '" + mode_name + "', using educational");
        mode = SimulationMode::educational();
    }
    m_mode = *mode;
    m_auto_reactions = m_mode.auto_reactions;

    if (explicitlySet(moduleInput(controller, "simulation"), { "auto_reactions", "auto" }))
        m_auto_reactions = m_simulation_config.get<bool>("auto_reactions");
}

void Simulation::step(double dt)
{
    if (dt <= 0)
        return;
    m_time_ms += dt * 1000.0;

    m_world->step(dt);

    m_energy.decay(m_mode.decay_rate);
    if (m_energy.continuousHeating())
        m_energy.thermalKick(*m_world, activeBodies(), m_energy.heatIntensity() * m_energy.continuousHeatFactor());

    checkStress();
    completeForming();

    m_energy.limitVelocities(*m_world, activeBodies(), m_mode.max_velocity);

    if (!m_reactions.locked() && m_bonds.scanDue(m_time_ms))
        m_bonds.scan(m_time_ms, m_atoms, freeSnapshots(), systemEnergy(), *m_world);

    m_reactions.update(*this);

    if (m_identify_pending && !m_reactions.locked())
        identifyMolecules();
}

int Simulation::addAtom(int protons, int neutrons, int electrons, const Position& position)
{
    if (protons < 1 || neutrons < 0 || electrons < 0) {
        ValencyLogger::warn_fmt("Rejected atom with {} protons, {} neutrons, {} electrons", protons, neutrons, electrons);
        return -1;
    }

    Atom atom;
    atom.id = m_next_atom_id++;
    atom.protons = protons;
    atom.neutrons = neutrons;
    atom.electrons = electrons;
    atom.body = m_world->createBody(position, atom.mass(), m_mode.damping);
    m_atoms[atom.id] = atom;

    ValencyLogger::debug_fmt("Atom {} ({}) added", atom.id, PeriodicTable::symbol(protons));
    return atom.id;
}

int Simulation::addAtom(int protons, const Position& position)
{
    return addAtom(protons, protons == 1 ? 0 : protons, protons, position);
}

bool Simulation::deleteAtom(int id)
{
    auto it = m_atoms.find(id);
    if (it == m_atoms.end())
        return false;

    m_bonds.cancelForming(id);
    if (it->second.molecule_member)
        releaseMolecule(it->second.molecule_id, Release::Reopen, 0.0);

    for (const auto& bond : m_bonds.removeBondsOf(id))
        emit(EventType::BondBroken, bond.id, "atom deleted");

    m_world->removeBody(it->second.body);
    m_atoms.erase(it);
    m_identify_pending = true;

    ValencyLogger::info_fmt("Atom {} deleted", id);
    return true;
}

bool Simulation::setProtons(int id, int protons)
{
    auto it = m_atoms.find(id);
    if (it == m_atoms.end())
        return false;
    if (protons < 1) {
        ValencyLogger::warn_fmt("Atom {} needs at least one proton", id);
        return false;
    }

    // a new element invalidates every bond of the atom
    if (it->second.molecule_member)
        releaseMolecule(it->second.molecule_id, Release::Reopen, 0.0);
    for (const auto& bond : m_bonds.removeBondsOf(id))
        emit(EventType::BondBroken, bond.id, "element changed");
    m_bonds.cancelForming(id);

    it->second.protons = protons;
    it->second.electrons = protons;
    updateMass(id);
    m_identify_pending = true;

    ValencyLogger::info_fmt("Atom {} is now {}", id, PeriodicTable::name(protons));
    return true;
}

bool Simulation::setNeutrons(int id, int neutrons)
{
    auto it = m_atoms.find(id);
    if (it == m_atoms.end())
        return false;
    if (neutrons < 0) {
        ValencyLogger::warn_fmt("Negative neutron count for atom {}", id);
        return false;
    }
    it->second.neutrons = neutrons;
    updateMass(id);
    return true;
}

bool Simulation::setElectrons(int id, int electrons)
{
    auto it = m_atoms.find(id);
    if (it == m_atoms.end())
        return false;
    if (electrons < 0) {
        ValencyLogger::warn_fmt("Negative electron count for atom {}", id);
        return false;
    }
    it->second.electrons = electrons;
    return true;
}

void Simulation::addEnergy(double amount)
{
    if (amount <= 0)
        return;
    m_energy.addEnergy(amount);
    m_energy.thermalKick(*m_world, activeBodies(), amount * m_energy.velocityKick());
    ValencyLogger::info_fmt("Energy +{:.1f}, transient heat {:.1f}", amount, m_energy.transientHeat());
}

void Simulation::applyHeatPulse()
{
    const double intensity = m_energy.heatIntensity();
    m_energy.applyHeatPulse(intensity);
    m_energy.thermalKick(*m_world, activeBodies(), intensity);
    ValencyLogger::info_fmt("Heat pulse {:.1f}, transient heat {:.1f}", intensity, m_energy.transientHeat());
}

void Simulation::setHeatIntensity(double intensity)
{
    m_energy.setHeatIntensity(intensity);
}

bool Simulation::toggleGlobalHeating()
{
    m_energy.setContinuousHeating(!m_energy.continuousHeating());
    ValencyLogger::info(std::string("Global heating ") + (m_energy.continuousHeating() ? "on" : "off"));
    return m_energy.continuousHeating();
}

void Simulation::resetEnergy()
{
    m_energy.reset();
    ValencyLogger::info("Energy reset");
}

BondStatus Simulation::createManualBond(int a, int b)
{
    const BondStatus status = bondAtoms(a, b);
    switch (status) {
    case BondStatus::Created:
    case BondStatus::AlreadyBonded:
        break;
    case BondStatus::ValenceExceeded:
    case BondStatus::InvalidElement:
        emit(EventType::BondRejected, PairKey(a, b), BondStatusName(status));
        ValencyLogger::warn_fmt("Bond {} rejected: {}", PairKey(a, b), BondStatusName(status));
        break;
    case BondStatus::UnknownAtom:
    case BondStatus::SelfBond:
        ValencyLogger::warn_fmt("Bond {} rejected: {}", PairKey(a, b), BondStatusName(status));
        break;
    }
    return status;
}

bool Simulation::deleteBond(const std::string& bond_id)
{
    const Bond* bond = m_bonds.bond(bond_id);
    if (!bond)
        return false;

    const Bond removed = *bond;
    if (!removed.molecule_id.empty())
        releaseMolecule(removed.molecule_id, Release::Reopen, 0.0);

    m_bonds.removeBond(bond_id);
    m_bonds.setCooldown(removed.atom_a, removed.atom_b, m_time_ms + m_bonds.cooldown());
    emit(EventType::BondBroken, bond_id, "deleted");
    m_identify_pending = true;
    return true;
}

bool Simulation::breakMolecule(const std::string& molecule_id)
{
    auto it = m_molecules.find(molecule_id);
    if (it == m_molecules.end())
        return false;

    const std::vector<int> members = it->second.atoms;
    const std::string name = it->second.name;
    releaseMolecule(molecule_id, Release::Delete, m_separation_speed);

    for (std::size_t i = 0; i < members.size(); ++i)
        for (std::size_t j = i + 1; j < members.size(); ++j)
            m_bonds.setCooldown(members[i], members[j], m_time_ms + m_bonds.moleculeBlock());

    ValencyLogger::success_fmt("Electrolysis split {} into {} atoms", name, members.size());
    return true;
}

int Simulation::electrolyzeAll()
{
    std::vector<std::string> ids;
    for (const auto& entry : m_molecules)
        ids.push_back(entry.first);

    int count = 0;
    for (const auto& id : ids) {
        if (breakMolecule(id))
            ++count;
    }
    return count;
}

void Simulation::setMode(const SimulationMode& mode)
{
    m_mode = mode;
    m_auto_reactions = mode.auto_reactions;
    for (BodyId body : m_world->bodies())
        m_world->setDamping(body, mode.damping);
    ValencyLogger::info_fmt("Mode {}: damping {}, decay {}, max velocity {}", mode.name, mode.damping, mode.decay_rate, mode.max_velocity);
}

bool Simulation::toggleAutoReactions()
{
    m_auto_reactions = !m_auto_reactions;
    ValencyLogger::info(std::string("Automatic reactions ") + (m_auto_reactions ? "on" : "off"));
    return m_auto_reactions;
}

std::vector<int> Simulation::spawn(const std::vector<SpawnSite>& sites)
{
    std::vector<int> ids;
    for (const auto& site : sites)
        ids.push_back(addAtom(site.protons, site.position));

    for (std::size_t i = 0; i < sites.size(); ++i) {
        const int partner = sites[i].partner;
        if (partner <= static_cast<int>(i) || partner >= static_cast<int>(ids.size()))
            continue;
        if (ids[i] > 0 && ids[partner] > 0)
            bondAtoms(ids[i], ids[partner]);
    }

    if (!m_reactions.locked())
        identifyMolecules();
    return ids;
}

std::vector<int> Simulation::spawnRecipe(const std::string& recipe_id, const Position& origin)
{
    const Recipe* recipe = Recipes::find(recipe_id);
    if (!recipe) {
        ValencyLogger::warn("Unknown recipe '" + recipe_id + "'");
        return {};
    }
    ValencyLogger::info_fmt("Spawning reactants of {} ({})", recipe->name, recipe->description);
    return spawn(Recipes::layout(*recipe, origin));
}

bool Simulation::saveDiscovered(const std::string& path) const
{
    return m_identifier.saveDiscovered(path);
}

bool Simulation::loadDiscovered(const std::string& path)
{
    return m_identifier.loadDiscovered(path);
}

int Simulation::identifyMolecules()
{
    m_identify_pending = false;
    const std::vector<Bond> free_bonds = m_bonds.freeBonds();

    int formed = 0;
    for (const auto& component : MoleculeIdentifier::components(m_atoms, free_bonds)) {
        const std::string id = MoleculeIdentifier::canonicalId(component);
        if (m_molecules.count(id))
            continue;

        std::vector<Atom> members;
        for (int atom : component)
            members.push_back(m_atoms.at(atom));

        std::vector<Bond> internal;
        for (const auto& bond : free_bonds) {
            if (std::binary_search(component.begin(), component.end(), bond.atom_a)
                && std::binary_search(component.begin(), component.end(), bond.atom_b))
                internal.push_back(bond);
        }

        const Molecule molecule = m_identifier.describe(members, internal);
        materialize(molecule);

        const bool newly_discovered = m_identifier.discover(molecule.name);
        emit(EventType::MoleculeFormed, molecule.id, molecule.name, newly_discovered);
        if (newly_discovered)
            ValencyLogger::success_fmt("New molecule discovered: {} [{}]", molecule.name, molecule.geometry);
        else
            ValencyLogger::info_fmt("Molecule formed: {} [{}]", molecule.name, molecule.geometry);
        ++formed;
    }
    return formed;
}

std::vector<Atom> Simulation::freeAtoms() const
{
    std::vector<Atom> result;
    for (const auto& entry : m_atoms)
        if (!entry.second.molecule_member)
            result.push_back(entry.second);
    return result;
}

const Atom* Simulation::atom(int id) const
{
    auto it = m_atoms.find(id);
    return it == m_atoms.end() ? nullptr : &it->second;
}

std::vector<BondView> Simulation::bonds() const
{
    return m_bonds.views(m_atoms, [this](int id) { return atomPosition(id); });
}

std::vector<Molecule> Simulation::molecules() const
{
    std::vector<Molecule> result;
    for (const auto& entry : m_molecules)
        result.push_back(entry.second);
    return result;
}

const Molecule* Simulation::molecule(const std::string& id) const
{
    auto it = m_molecules.find(id);
    return it == m_molecules.end() ? nullptr : &it->second;
}

std::optional<Position> Simulation::atomPosition(int id) const
{
    auto it = m_atoms.find(id);
    if (it == m_atoms.end())
        return std::nullopt;

    const Atom& atom = it->second;
    if (!atom.molecule_member)
        return m_world->hasBody(atom.body) ? std::optional<Position>(m_world->position(atom.body)) : std::nullopt;

    auto molecule = m_molecules.find(atom.molecule_id);
    if (molecule == m_molecules.end())
        return std::nullopt;
    const int part = molecule->second.partIndex(id);
    if (part < 0)
        return std::nullopt;
    return m_world->partPosition(molecule->second.body, part);
}

double Simulation::systemEnergy() const
{
    return m_energy.systemEnergy(*m_world, activeBodies());
}

std::vector<SimulationEvent> Simulation::drainEvents()
{
    std::vector<SimulationEvent> events;
    events.swap(m_events);
    return events;
}

json Simulation::summary() const
{
    json result;
    result["time_ms"] = m_time_ms;
    result["mode"] = m_mode.name;
    result["atoms"] = m_atoms.size();
    result["free_atoms"] = freeAtoms().size();
    result["bonds"] = m_bonds.bonds().size();
    result["system_energy"] = systemEnergy();
    result["transient_heat"] = m_energy.transientHeat();
    result["temperature"] = m_energy.temperature();
    result["reactions"] = m_reactions.completed();

    json molecules = json::array();
    for (const auto& entry : m_molecules) {
        json molecule;
        molecule["id"] = entry.second.id;
        molecule["name"] = entry.second.name;
        molecule["formula"] = entry.second.formula;
        molecule["geometry"] = entry.second.geometry;
        molecule["atoms"] = entry.second.atoms;
        molecule["stability"] = entry.second.stability;
        molecules.push_back(molecule);
    }
    result["molecules"] = molecules;
    result["discovered"] = m_identifier.discovered();
    return result;
}

void Simulation::emit(EventType type, const std::string& subject, const std::string& detail, bool flag)
{
    m_events.push_back({ type, subject, detail, flag });
}

BondStatus Simulation::bondAtoms(int a, int b)
{
    auto first = m_atoms.find(a);
    auto second = m_atoms.find(b);
    if (first == m_atoms.end() || second == m_atoms.end())
        return BondStatus::UnknownAtom;
    if (a == b)
        return BondStatus::SelfBond;
    if (!PeriodicTable::element(first->second.protons) || !PeriodicTable::element(second->second.protons))
        return BondStatus::InvalidElement;
    if (m_bonds.hasBond(a, b))
        return BondStatus::AlreadyBonded;
    if (m_bonds.bondCount(a) >= PeriodicTable::maxBonds(first->second.protons)
        || m_bonds.bondCount(b) >= PeriodicTable::maxBonds(second->second.protons))
        return BondStatus::ValenceExceeded;

    // a molecule is rigid, it has to be reopened before it can grow
    if (first->second.molecule_member)
        releaseMolecule(first->second.molecule_id, Release::Reopen, 0.0);
    if (second->second.molecule_member)
        releaseMolecule(second->second.molecule_id, Release::Reopen, 0.0);

    const BondStatus status = m_bonds.addBond(first->second, second->second);
    if (status == BondStatus::Created) {
        emit(EventType::BondCreated, PairKey(a, b),
            PeriodicTable::symbol(first->second.protons) + "-" + PeriodicTable::symbol(second->second.protons));
        ValencyLogger::info_fmt("Bond {} formed ({}-{})", PairKey(a, b),
            PeriodicTable::symbol(first->second.protons), PeriodicTable::symbol(second->second.protons));
        m_identify_pending = true;
    }
    return status;
}

void Simulation::materialize(const Molecule& description)
{
    Molecule molecule = description;

    double mass = 0.0;
    Position centroid = Position::Zero();
    Position momentum = Position::Zero();
    for (int id : molecule.atoms) {
        Atom& atom = m_atoms.at(id);
        const double atom_mass = atom.mass();
        if (m_world->hasBody(atom.body)) {
            centroid += m_world->position(atom.body);
            momentum += atom_mass * m_world->velocity(atom.body);
            m_world->removeBody(atom.body);
        }
        mass += atom_mass;
        atom.body = InvalidBody;
        atom.molecule_member = true;
        atom.molecule_id = molecule.id;
    }
    if (!molecule.atoms.empty())
        centroid /= static_cast<double>(molecule.atoms.size());

    molecule.body = m_world->createAggregate(centroid, m_molecule_mass_factor * mass, m_mode.damping, molecule.offsets);
    if (mass > 0)
        m_world->setVelocity(molecule.body, momentum / mass);

    for (const auto& bond : m_bonds.freeBonds()) {
        const int part_a = molecule.partIndex(bond.atom_a);
        const int part_b = molecule.partIndex(bond.atom_b);
        if (part_a < 0 || part_b < 0)
            continue;
        m_bonds.tagMolecule(bond.id, molecule.id, (molecule.offsets[part_a] - molecule.offsets[part_b]).norm());
    }

    m_molecules[molecule.id] = molecule;
}

bool Simulation::releaseMolecule(const std::string& molecule_id, Release release, double separation_speed)
{
    auto it = m_molecules.find(molecule_id);
    if (it == m_molecules.end())
        return false;

    const Molecule molecule = it->second;
    const Position center = m_world->position(molecule.body);
    const Position velocity = m_world->velocity(molecule.body);

    for (std::size_t i = 0; i < molecule.atoms.size(); ++i) {
        auto atom = m_atoms.find(molecule.atoms[i]);
        if (atom == m_atoms.end())
            continue;

        const Position part = m_world->partPosition(molecule.body, static_cast<int>(i));
        Position atom_velocity = velocity;
        const Position outward = part - center;
        if (separation_speed > 0 && outward.norm() > 1e-9)
            atom_velocity += outward.normalized() * separation_speed;

        atom->second.body = m_world->createBody(part, atom->second.mass(), m_mode.damping);
        m_world->setVelocity(atom->second.body, atom_velocity);
        atom->second.molecule_member = false;
        atom->second.molecule_id.clear();
    }
    m_world->removeBody(molecule.body);

    if (release == Release::Reopen)
        m_bonds.releaseMolecule(molecule_id);
    else {
        for (const auto& bond : m_bonds.deleteMoleculeBonds(molecule_id))
            emit(EventType::BondBroken, bond.id, "molecule dissolved");
    }

    m_molecules.erase(it);
    emit(EventType::MoleculeBroken, molecule_id, molecule.name);
    ValencyLogger::info_fmt("Molecule {} ({}) released", molecule.name, molecule_id);
    m_identify_pending = true;
    return true;
}

void Simulation::checkStress()
{
    const auto lookup = [this](int id) { return atomPosition(id); };

    for (const auto& stretched : m_bonds.overstretched(m_atoms, lookup)) {
        const Bond* current = m_bonds.bond(stretched.id);
        if (!current)
            continue;

        const std::string molecule_id = current->molecule_id;
        m_bonds.removeBond(stretched.id);
        m_bonds.setCooldown(stretched.atom_a, stretched.atom_b, m_time_ms + m_bonds.cooldown());
        emit(EventType::BondBroken, stretched.id, "overstretched");
        ValencyLogger::info_fmt("Bond {} broke under stress", stretched.id);

        if (!molecule_id.empty())
            releaseMolecule(molecule_id, Release::Reopen, 0.0);
        m_identify_pending = true;
    }
}

void Simulation::completeForming()
{
    for (const auto& finished : m_bonds.advanceForming(m_time_ms, m_atoms, *m_world)) {
        if (!m_atoms.count(finished.atom_a) || !m_atoms.count(finished.atom_b))
            continue;

        const BondStatus status = bondAtoms(finished.atom_a, finished.atom_b);
        if (status != BondStatus::Created)
            ValencyLogger::debug_fmt("Forming {} dropped: {}", PairKey(finished.atom_a, finished.atom_b), BondStatusName(status));
    }
}

std::vector<AtomSnapshot> Simulation::freeSnapshots() const
{
    std::vector<AtomSnapshot> result;
    for (const auto& entry : m_atoms) {
        const Atom& atom = entry.second;
        if (atom.molecule_member || !m_world->hasBody(atom.body))
            continue;
        result.push_back({ atom.id, atom.protons, atom.body, m_world->position(atom.body) });
    }
    return result;
}

std::vector<BodyId> Simulation::activeBodies() const
{
    std::vector<BodyId> result;
    for (const auto& entry : m_atoms)
        if (!entry.second.molecule_member && entry.second.body != InvalidBody)
            result.push_back(entry.second.body);
    for (const auto& entry : m_molecules)
        result.push_back(entry.second.body);
    return result;
}

void Simulation::updateMass(int id)
{
    auto it = m_atoms.find(id);
    if (it == m_atoms.end())
        return;

    if (!it->second.molecule_member) {
        m_world->setMass(it->second.body, it->second.mass());
        return;
    }

    auto molecule = m_molecules.find(it->second.molecule_id);
    if (molecule == m_molecules.end())
        return;
    double mass = 0.0;
    for (int member : molecule->second.atoms)
        mass += m_atoms.at(member).mass();
    m_world->setMass(molecule->second.body, m_molecule_mass_factor * mass);
}
