/*
 * <Command line driver of the bonding engine>
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
#include "src/capabilities/simulation.h"

#include "src/core/config_manager.h"
#include "src/core/global.h"
#include "src/core/parameter_registry.h"
#include "src/core/simulation_mode.h"
#include "src/core/valency_logger.h"

#include <fmt/core.h>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <map>
#include <string>

namespace {

void showHelp()
{
    std::cout << "Valency - chemical bonding simulation" << std::endl
              << std::endl
              << "Usage: valency -<command> [-key value ...]" << std::endl
              << std::endl
              << "Commands:" << std::endl
              << "  -run                 Spawn a recipe or atom set and simulate it" << std::endl
              << "  -recipes             List the available recipes" << std::endl
              << "  -modes               List the simulation mode presets" << std::endl
              << "  -help [module]       Show this help or the parameters of a module" << std::endl
              << "  -list-modules        List all modules with parameters" << std::endl
              << "  -export-config <m>   Print the default configuration of a module as JSON" << std::endl
              << std::endl
              << "Examples:" << std::endl
              << "  valency -run -recipe water -steps 900" << std::endl
              << "  valency -run -atoms H,H,O -energy 15 -mode sandbox" << std::endl
              << "  valency -run -recipe methane -dt 0.01 -verbosity 3" << std::endl;
}

void listRecipes()
{
    for (const auto& recipe : Recipes::all()) {
        fmt::print("{:<16} {:<16} {:<8} heat {:>5.1f}  activation {:>5.1f}  {}{}\n", recipe.id, recipe.name,
            recipe.formula, recipe.heat_intensity, recipe.activation_energy, recipe.description,
            recipe.natural ? "" : " (needs catalyst)");
    }
}

void listModes()
{
    for (const auto& name : SimulationMode::names()) {
        const auto mode = SimulationMode::fromName(name);
        if (mode)
            ValencyLogger::param_table(mode->toJson(), "Mode: " + name);
    }
}

/*! \brief Sort the flat -key value pairs into the modules declaring them
 *
 * A key declared by several modules (check_interval) reaches all of them.
 */
json distribute(const json& run)
{
    const ParameterRegistry& registry = ParameterRegistry::getInstance();
    json modules = json::object();
    for (const auto& module : registry.modules())
        modules[module] = json::object();

    for (const auto& item : run.items()) {
        bool known = false;
        for (const auto& module : registry.modules()) {
            if (registry.findDefinition(module, item.key())) {
                modules[module][item.key()] = item.value();
                known = true;
            }
        }
        if (!known)
            ValencyLogger::warn("Unknown parameter '" + item.key() + "' ignored");
    }
    return modules;
}

int run(const json& run_input)
{
    const json modules = distribute(run_input);
    const ConfigManager config("simulation", modules["simulation"]);

    ValencyLogger::initialize(config.get<int>("verbosity"));
    ValencyLogger::header("Valency bonding simulation");
    for (const auto& item : modules.items())
        if (!item.value().empty())
            ValencyLogger::param_table(item.value(), "Parameters: " + item.key());

    Simulation simulation(modules);
    ValencyLogger::param_table(simulation.mode().toJson(), "Mode");

    const std::string discovered_file = config.get<std::string>("discovered_file");
    if (!discovered_file.empty() && std::ifstream(discovered_file).good())
        simulation.loadDiscovered(discovered_file);

    const std::string atoms = config.get<std::string>("atoms");
    if (!atoms.empty()) {
        auto ids = simulation.spawn(Recipes::layoutSymbols(atoms, Position::Zero(), config.get<double>("spacing")));
        if (ids.empty()) {
            ValencyLogger::error("No valid atoms in '" + atoms + "'");
            return 1;
        }
    } else {
        const std::string recipe_id = config.get<std::string>("recipe");
        const Recipe* recipe = Recipes::find(recipe_id);
        if (!recipe) {
            std::string known;
            for (const auto& id : Recipes::ids())
                known += (known.empty() ? "" : ", ") + id;
            ValencyLogger::error("Unknown recipe '" + recipe_id + "', available: " + known);
            return 1;
        }
        if (!recipe->natural)
            ValencyLogger::warn(recipe->name + " does not form without a catalyst under normal conditions");
        simulation.spawnRecipe(recipe->id);
        simulation.setHeatIntensity(recipe->heat_intensity);
        simulation.applyHeatPulse();
    }

    const double energy = config.get<double>("energy");
    if (energy > 0)
        simulation.addEnergy(energy);

    const int steps = config.get<int>("steps");
    const double dt = config.get<double>("time_step");
    const int report = std::max(1, steps / 10);

    int events = 0;
    for (int i = 1; i <= steps; ++i) {
        simulation.step(dt);
        events += static_cast<int>(simulation.drainEvents().size());
        if (i % report == 0)
            ValencyLogger::progress(i, steps, fmt::format("E = {:.2f}, T = {:.0f} K", simulation.systemEnergy(), simulation.temperature()));
    }

    ValencyLogger::header("Summary");
    ValencyLogger::param("Simulated time", fmt::format("{:.2f} s", simulation.elapsedMs() / 1000.0));
    ValencyLogger::param("Events", events);
    ValencyLogger::param_value("Free atoms", simulation.freeAtoms().size());
    ValencyLogger::param_value("Bonds", simulation.bonds().size());
    ValencyLogger::param_value("Reactions", simulation.reactions().completed());
    ValencyLogger::energy(simulation.systemEnergy(), "System energy");
    ValencyLogger::temperature(simulation.temperature(), "Temperature");

    for (const auto& molecule : simulation.molecules()) {
        ValencyLogger::result_raw(fmt::format("  {:<32} {:<10} {:<20} atoms {}", molecule.name, molecule.formula,
            molecule.geometry, molecule.id));
    }

    if (!simulation.discoveredMolecules().empty()) {
        ValencyLogger::info("Discovered molecules:");
        for (const auto& name : simulation.discoveredMolecules())
            ValencyLogger::result_raw("  " + name);
    }

    if (!discovered_file.empty() && !simulation.saveDiscovered(discovered_file))
        return 1;
    return 0;
}

}

int main(int argc, char** argv)
{
    ValencyLogger::initialize();

    initialize_parameter_registry();
    if (!ParameterRegistry::getInstance().validateRegistry())
        std::cerr << "Warning: Parameter registry validation failed" << std::endl;

    if (argc < 2) {
        showHelp();
        return 1;
    }

    std::string command = argv[1];
    if (!command.empty() && command[0] == '-')
        command.erase(0, 1);

    if (command == "help" || command == "h") {
        if (argc >= 3)
            ParameterRegistry::getInstance().printHelp(argv[2]);
        else
            showHelp();
        return 0;
    }

    if (command == "list-modules") {
        ParameterRegistry::getInstance().printAllModules();
        return 0;
    }

    if (command == "export-config") {
        if (argc < 3) {
            std::cerr << "Error: -export-config requires module name" << std::endl;
            std::cerr << "Usage: valency -export-config <module>" << std::endl;
            return 1;
        }
        json config = ParameterRegistry::getInstance().getDefaultJson(argv[2]);
        if (config.empty()) {
            std::cerr << "Error: Unknown module '" << argv[2] << "'" << std::endl;
            std::cerr << "Use: valency -list-modules to see available modules" << std::endl;
            return 1;
        }
        std::cout << config.dump(2) << std::endl;
        return 0;
    }

    if (command == "recipes") {
        listRecipes();
        return 0;
    }

    if (command == "modes") {
        listModes();
        return 0;
    }

    if (command == "run") {
        json controller = CLI2Json(argc, argv);
        try {
            return run(controller.contains("run") ? controller["run"] : json::object());
        } catch (const std::runtime_error& error) {
            ValencyLogger::error(error.what());
            return 1;
        }
    }

    std::cerr << "Unknown command -" << command << std::endl;
    showHelp();
    return 1;
}
