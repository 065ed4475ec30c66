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

#pragma once

#include "src/capabilities/reaction_orchestrator.h"
#include "src/capabilities/recipes.h"

#include "src/core/bond_evaluator.h"
#include "src/core/bond_manager.h"
#include "src/core/chemistry.h"
#include "src/core/config_manager.h"
#include "src/core/energy_model.h"
#include "src/core/molecule_identifier.h"
#include "src/core/physics_world.h"
#include "src/core/simulation_mode.h"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

/*! \brief Owner of atoms, bonds, molecules and energy
 *
 * Every mutation goes through the commands below or through step(dt),
 * which runs one tick:
 *  1. physics step
 *  2. heat decay and continuous heating
 *  3. stress check
 *  4. forming transitions, finished ones become bonds
 *  5. velocity limit
 *  6. proximity scan (throttled, skipped while a reaction runs)
 *  7. reaction orchestrator
 *  8. molecule identification if the bond set changed
 *
 * The controller json holds one object per module (bonding, energy,
 * reaction, simulation) merged over the registered defaults.
 */
class Simulation {
public:
    explicit Simulation(const json& controller = json::object(), std::unique_ptr<PhysicsWorld> world = nullptr);

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    /*! \brief Advance by dt seconds */
    void step(double dt);

    /*! \brief Add an atom with its own body, returns the id or -1 for protons < 1 */
    int addAtom(int protons, int neutrons, int electrons, const Position& position);

    /*! \brief Neutral atom of the common isotope (hydrogen without neutrons) */
    int addAtom(int protons, const Position& position);

    bool deleteAtom(int id);
    bool setProtons(int id, int protons);
    bool setNeutrons(int id, int neutrons);
    bool setElectrons(int id, int electrons);

    void addEnergy(double amount);
    void applyHeatPulse();
    void setHeatIntensity(double intensity);
    bool toggleGlobalHeating();
    void resetEnergy();

    BondStatus createManualBond(int a, int b);
    bool deleteBond(const std::string& bond_id);

    /*! \brief Electrolysis: delete internal bonds and push the atoms apart */
    bool breakMolecule(const std::string& molecule_id);
    int electrolyzeAll();

    void setMode(const SimulationMode& mode);
    const SimulationMode& mode() const { return m_mode; }
    bool toggleAutoReactions();
    bool autoReactions() const { return m_auto_reactions; }

    /*! \brief Spawn atoms, paired sites are bonded, returns the new ids */
    std::vector<int> spawn(const std::vector<SpawnSite>& sites);
    std::vector<int> spawnRecipe(const std::string& recipe_id, const Position& origin = Position::Zero());

    bool saveDiscovered(const std::string& path) const;
    bool loadDiscovered(const std::string& path);

    /*! \brief Group free bonded atoms into molecules, returns the number formed */
    int identifyMolecules();

    std::vector<Atom> freeAtoms() const;
    const AtomTable& atoms() const { return m_atoms; }
    const Atom* atom(int id) const;
    int bondCount(int id) const { return m_bonds.bondCount(id); }
    std::vector<BondView> bonds() const;
    std::vector<Molecule> molecules() const;
    const Molecule* molecule(const std::string& id) const;
    const StringList& discoveredMolecules() const { return m_identifier.discovered(); }

    /*! \brief Body position, or the part position for molecule members */
    std::optional<Position> atomPosition(int id) const;

    double systemEnergy() const;
    double temperature() const { return m_energy.temperature(); }
    double transientHeat() const { return m_energy.transientHeat(); }
    bool reactionInProgress() const { return m_reactions.locked(); }
    double elapsedMs() const { return m_time_ms; }

    std::vector<SimulationEvent> drainEvents();

    PhysicsWorld& world() { return *m_world; }
    BondEvaluator& evaluator() { return m_evaluator; }
    const BondManager& bondManager() const { return m_bonds; }
    EnergyModel& energyModel() { return m_energy; }
    ReactionOrchestrator& reactions() { return m_reactions; }

    json summary() const;

private:
    friend class ReactionOrchestrator;

    enum class Release {
        Reopen, // internal bonds return to the free pool
        Delete
    };

    void emit(EventType type, const std::string& subject, const std::string& detail = "", bool flag = false);

    /*! \brief Valence checked bond, reopening molecules of the endpoints */
    BondStatus bondAtoms(int a, int b);

    void materialize(const Molecule& molecule);
    bool releaseMolecule(const std::string& molecule_id, Release release, double separation_speed);

    void checkStress();
    void completeForming();

    std::vector<AtomSnapshot> freeSnapshots() const;
    std::vector<BodyId> activeBodies() const;
    void updateMass(int id);

    ConfigManager m_bonding_config;
    ConfigManager m_energy_config;
    ConfigManager m_reaction_config;
    ConfigManager m_simulation_config;

    std::unique_ptr<PhysicsWorld> m_world;
    BondEvaluator m_evaluator;
    BondManager m_bonds;
    MoleculeIdentifier m_identifier;
    EnergyModel m_energy;
    ReactionOrchestrator m_reactions;

    AtomTable m_atoms;
    std::map<std::string, Molecule> m_molecules;
    std::vector<SimulationEvent> m_events;

    SimulationMode m_mode;
    bool m_auto_reactions = true;
    bool m_identify_pending = false;
    double m_time_ms = 0.0;
    int m_next_atom_id = 1;

    double m_molecule_mass_factor;
    double m_separation_speed;
};
