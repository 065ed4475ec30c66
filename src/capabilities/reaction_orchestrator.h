/*
 * <Detection and staged execution of complex reactions>
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

#include "src/core/bond_evaluator.h"
#include "src/core/chemistry.h"
#include "src/core/config_manager.h"

#include <optional>
#include <string>
#include <vector>

class Simulation;

enum class ReactionStage {
    Staging,
    Positioning,
    Bonding,
    Identifying,
    Done
};

inline std::string ReactionStageName(ReactionStage stage)
{
    switch (stage) {
    case ReactionStage::Staging:
        return "staging";
    case ReactionStage::Positioning:
        return "positioning";
    case ReactionStage::Bonding:
        return "bonding";
    case ReactionStage::Identifying:
        return "identifying";
    case ReactionStage::Done:
        return "done";
    }
    return "unknown";
}

/*! \brief Atoms placed and bonded together as one product */
struct ReactionGroup {
    std::vector<int> atoms;
    std::vector<IntPair> bonds;
    std::string geometry;
};

struct ReactionPlan {
    std::string id;
    std::string kind; // molecule+molecule, atom+molecule or cluster
    std::string description;
    std::vector<std::string> molecules; // dissolved while staging
    std::vector<ReactionGroup> groups;
    double cost = 0.0;
    double bond_cost = 0.0; // consumed per bond created
    Position center = Position::Zero();
    ReactionStage stage = ReactionStage::Staging;
    int bonds_created = 0;
};

/*! \brief Composes reactions beyond pairwise bonding
 *
 * At most one plan is in flight. While it runs the reaction lock is set,
 * which suspends proximity scans and molecule identification in the
 * simulation. Each call of update advances the plan by one stage, every
 * stage checks that the atoms it touches still exist.
 */
class ReactionOrchestrator {
public:
    explicit ReactionOrchestrator(const ConfigManager& config);

    /*! \brief Advance the running plan or look for a new one, once per tick */
    void update(Simulation& simulation);

    /*! \brief Search all candidates now, ignoring interval and threshold
     *
     * A stable free pair is bonded at once, everything else starts a plan.
     * @return true if anything happened
     */
    bool detect(Simulation& simulation);

    /*! \brief Take the lock and run the staging step of plan */
    bool begin(Simulation& simulation, ReactionPlan plan);

    bool locked() const { return m_locked; }
    const std::optional<ReactionPlan>& current() const { return m_plan; }
    int completed() const { return m_completed; }

    std::optional<ReactionPlan> findMoleculeReaction(const Simulation& simulation) const;
    std::optional<ReactionPlan> findAtomMoleculeReaction(const Simulation& simulation) const;

    /*! \brief Known stoichiometry, else sum(valence) / 2 <= n(n - 1) / 2 for 2 to 6 atoms */
    static bool isChemicallyStable(const std::vector<int>& protons);

    /*! \brief Bonds connecting all atoms within valence limits
     *
     * A star around the optimal central atom is tried first, then the
     * greedy optimal structure. nullopt if neither connects everything.
     */
    static std::optional<std::vector<IntPair>> connect(const std::vector<Atom>& atoms, const BondEvaluator& evaluator);

    /*! \brief Split a pool of atoms into water, methane, ammonia and diatomic groups */
    static std::vector<ReactionGroup> planProducts(const std::vector<Atom>& pool);

private:
    void advance(Simulation& simulation);
    bool clusterReaction(Simulation& simulation);
    std::string nextId(const std::string& kind);

    double m_energy_threshold;
    double m_check_interval;
    double m_molecule_proximity;
    double m_atom_molecule_proximity;
    double m_cluster_proximity;
    double m_water_energy;
    double m_methane_energy;
    double m_ammonia_energy;
    double m_three_atom_energy;
    double m_bond_cost;
    double m_bond_length;
    double m_group_spacing;

    bool m_locked = false;
    std::optional<ReactionPlan> m_plan;
    double m_last_check;
    int m_counter = 0;
    int m_completed = 0;
};
