/*
 * <Parameter definitions of the bonding engine modules>
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

#include "src/core/parameter_registry.h"

#include <string>

namespace {

void param(const std::string& module, const std::string& name, ParamType type, std::any value,
    const std::string& help, const std::string& category, std::vector<std::string> aliases = {})
{
    ParameterDefinition def;
    def.name = name;
    def.module = module;
    def.type = type;
    def.defaultValue = std::move(value);
    def.helpText = help;
    def.category = category;
    def.aliases = std::move(aliases);
    ParameterRegistry::getInstance().addDefinition(module, std::move(def));
}

void registerBonding()
{
    const std::string m = "bonding";
    param(m, "bond_threshold", ParamType::Double, 3.5, "Distance below which an eligible pair starts forming a bond.", "Distance", { "threshold" });
    param(m, "attraction_threshold", ParamType::Double, 10.0, "Distance below which eligible pairs attract each other.", "Distance");
    param(m, "attraction_strength", ParamType::Double, 0.05, "Attraction force per unit of distance inside the attraction shell.", "Distance");
    param(m, "preference_radius", ParamType::Double, 5.0, "Radius searched for competing partners by the preference rules.", "Distance");
    param(m, "use_preferences", ParamType::Bool, true, "Apply the partner preference rules (H-H vs. O, O-O vs. others).", "Distance");

    param(m, "cooldown", ParamType::Double, 1000.0, "Per-pair cooldown between bond evaluations in ms.", "Timing");
    param(m, "check_interval", ParamType::Double, 100.0, "Minimum time between proximity scans in ms.", "Timing");
    param(m, "formation_duration", ParamType::Double, 2000.0, "Duration of a gradual bond formation in ms.", "Timing", { "formation_time" });
    param(m, "formation_force", ParamType::Double, 10.0, "Peak pull force applied while a bond is forming.", "Timing");
    param(m, "molecule_block", ParamType::Double, 500.0, "Re-bond block for atoms released by electrolysis in ms.", "Timing");

    param(m, "bond_length_factor", ParamType::Double, 1.2, "Ideal bond length as multiple of the summed atomic radii.", "Geometry");
    param(m, "break_factor", ParamType::Double, 3.0, "Break length as multiple of the summed atomic radii.", "Geometry");
    param(m, "template_stretch", ParamType::Double, 1.5, "Molecule bonds survive at least this multiple of their template length.", "Geometry");
    param(m, "stress_warning", ParamType::Double, 0.7, "Stress ratio above which a bond counts as stressed.", "Geometry");
    param(m, "default_radius", ParamType::Double, 1.0, "Radius assumed for elements missing from the catalog.", "Geometry");
}

void registerEnergy()
{
    const std::string m = "energy";
    param(m, "max_energy", ParamType::Double, 100.0, "Upper bound of the transient heat energy.", "Basic");
    param(m, "base_temperature", ParamType::Double, 300.0, "Temperature in Kelvin without transient heat.", "Basic", { "T0" });
    param(m, "temperature_coefficient", ParamType::Double, 10.0, "Kelvin added per unit of transient heat.", "Basic");
    param(m, "kinetic_scale", ParamType::Double, 10.0, "Scaling of the kinetic contribution to the system energy.", "Basic");
    param(m, "decay_epsilon", ParamType::Double, 0.01, "Transient heat below this value snaps to zero.", "Basic");

    param(m, "heat_intensity", ParamType::Double, 5.0, "Intensity of heat pulses and continuous heating.", "Heating", { "intensity" });
    param(m, "pulse_energy_boost", ParamType::Double, 3.0, "Transient heat of a pulse as multiple of the intensity.", "Heating");
    param(m, "continuous_heating", ParamType::Bool, false, "Kick all bodies every step with a small random velocity.", "Heating");
    param(m, "continuous_heat_factor", ParamType::Double, 0.05, "Velocity kick of continuous heating as multiple of the intensity.", "Heating");
    param(m, "velocity_kick", ParamType::Double, 0.1, "Velocity kick per unit of added energy (0 disables).", "Heating");
    param(m, "seed", ParamType::Int, 42, "Seed of the thermal random number generator.", "Heating");
}

void registerReaction()
{
    const std::string m = "reaction";
    param(m, "energy_threshold", ParamType::Double, 20.0, "Transient heat required before complex reactions are searched.", "Basic");
    param(m, "check_interval", ParamType::Double, 100.0, "Minimum time between reaction searches in ms.", "Basic");

    param(m, "molecule_proximity", ParamType::Double, 10.0, "Distance for molecule + molecule reactions.", "Proximity");
    param(m, "atom_molecule_proximity", ParamType::Double, 8.0, "Distance for atom + molecule reactions.", "Proximity");
    param(m, "cluster_proximity", ParamType::Double, 6.0, "Distance for free atom clusters.", "Proximity");

    param(m, "water_energy", ParamType::Double, 12.0, "Activation energy of 2 H2 + O2.", "Activation");
    param(m, "methane_energy", ParamType::Double, 15.0, "Activation energy of C + 2 H2.", "Activation");
    param(m, "ammonia_energy", ParamType::Double, 18.0, "Activation energy of N + 3 H2.", "Activation");
    param(m, "three_atom_energy", ParamType::Double, 20.0, "Activation energy of a three atom cluster.", "Activation");
    param(m, "bond_cost", ParamType::Double, 8.0, "Energy consumed per bond of a three atom cluster.", "Activation");

    param(m, "bond_length", ParamType::Double, 1.5, "Bond length used to place reaction products.", "Geometry");
    param(m, "group_spacing", ParamType::Double, 4.0, "Spacing between reaction product groups.", "Geometry");
}

void registerSimulation()
{
    const std::string m = "simulation";
    param(m, "mode", ParamType::String, std::string("educational"), "Preset: sandbox|educational|realistic.", "Basic");
    param(m, "auto_reactions", ParamType::Bool, true, "Search complex reactions automatically (overrides mode preset).", "Basic", { "auto" });
    param(m, "time_step", ParamType::Double, 1.0 / 60.0, "Time step in seconds.", "Basic", { "dt" });
    param(m, "steps", ParamType::Int, 600, "Number of steps to simulate.", "Basic");
    param(m, "verbosity", ParamType::Int, 1, "Output level 0-3.", "Basic", { "v" });

    param(m, "recipe", ParamType::String, std::string("water"), "Recipe whose reactants are spawned.", "Setup");
    param(m, "atoms", ParamType::String, std::string(""), "Comma separated element symbols spawned instead of a recipe.", "Setup");
    param(m, "energy", ParamType::Double, 0.0, "Transient heat added before the run (recipe heat if 0).", "Setup", { "heat" });
    param(m, "spacing", ParamType::Double, 2.0, "Distance between atoms spawned from -atoms.", "Setup");

    param(m, "molecule_mass_factor", ParamType::Double, 0.8, "Mass of a molecule body relative to its atoms.", "Molecules");
    param(m, "separation_speed", ParamType::Double, 1.5, "Outward speed of atoms released by electrolysis.", "Molecules");
    param(m, "discovered_file", ParamType::String, std::string(""), "JSON file the discovered molecules are loaded from and saved to.", "Molecules", { "discovered" });
}

}

void initialize_parameter_registry()
{
    static bool initialized = false;
    if (initialized)
        return;
    initialized = true;

    registerBonding();
    registerEnergy();
    registerReaction();
    registerSimulation();
}
