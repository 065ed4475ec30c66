/*
 * <Bond eligibility, bond properties and partner preferences>
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
#include "src/core/config_manager.h"

#include <functional>
#include <optional>
#include <string>
#include <vector>

/*! \brief Derived properties of a bond between two elements */
struct BondingPair {
    int order = 1;
    BondType type = BondType::Covalent;
    double energy = 0.0;
    double length = 0.0;
    double polarity = 0.0;
};

/*! \brief Rejects a candidate pair when a better partner is nearby
 *
 * The rule applies to the unordered element pair (element_a, element_b).
 * Any free atom other than the candidates that satisfies competitor
 * and lies within radius of one of the candidates vetoes the pair.
 * A radius <= 0 uses the evaluator's preference_radius.
 */
struct PreferenceRule {
    int element_a;
    int element_b;
    std::function<bool(int protons)> competitor;
    double radius = 0.0;
    std::string description;

    bool matches(int za, int zb) const
    {
        return (za == element_a && zb == element_b) || (za == element_b && zb == element_a);
    }
};

class BondEvaluator {
public:
    explicit BondEvaluator(const ConfigManager& config);

    /*! \brief Pure eligibility predicate
     *
     * bonds_a and bonds_b are the current bond counts including bonds that
     * are still forming. Fails for unknown elements, elements without
     * bonding capacity, saturated atoms and insufficient energy.
     */
    bool canFormBond(const Atom& a, int bonds_a, const Atom& b, int bonds_b, double system_energy) const;

    /*! \brief avgIE * (1 - |dEN| / 4) * 0.1, at least 1; infinite for unknown elements */
    double activationEnergy(int za, int zb) const;

    std::optional<BondingPair> bondProperties(int za, int zb) const;

    /*! \brief (rA + rB) * bond_length_factor, 2.0 if an element is unknown */
    double idealLength(int za, int zb) const;

    /*! \brief max((rA + rB) * break_factor, rest_length * template_stretch) */
    double breakLength(int za, int zb, double rest_length = 0.0) const;

    /*! \brief false if any preference rule vetoes the candidate pair */
    bool isPreferred(const AtomSnapshot& a, const AtomSnapshot& b, const std::vector<AtomSnapshot>& free_atoms) const;

    /*! \brief Greedy bond plan, strongest bonds first, within valence limits */
    std::vector<IntPair> optimalBondingStructure(const std::vector<Atom>& atoms) const;

    void addRule(PreferenceRule rule) { m_rules.push_back(std::move(rule)); }
    void clearRules() { m_rules.clear(); }
    const std::vector<PreferenceRule>& rules() const { return m_rules; }

    double stressWarning() const { return m_stress_warning; }

    static std::vector<PreferenceRule> defaultRules();

private:
    double m_bond_length_factor;
    double m_break_factor;
    double m_template_stretch;
    double m_default_radius;
    double m_preference_radius;
    double m_stress_warning;
    bool m_use_preferences;
    std::vector<PreferenceRule> m_rules;
};
