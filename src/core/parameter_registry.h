/*
 * <Central registry of typed module parameters>
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

#include <any>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

enum class ParamType { String,
    Int,
    Double,
    Bool };

struct ParameterDefinition {
    std::string name; // canonical name (e.g. "bond_threshold")
    std::string module; // owning module (e.g. "bonding", "energy")
    ParamType type;
    std::any defaultValue;
    std::string helpText;
    std::string category = "General"; // grouping for help output
    std::vector<std::string> aliases; // alternative spellings
};

class ParameterRegistry {
public:
    static ParameterRegistry& getInstance();

    void addDefinition(const std::string& module, ParameterDefinition&& def);
    const ParameterDefinition* findDefinition(const std::string& module, const std::string& alias) const;
    std::vector<ParameterDefinition> getForModule(const std::string& module) const;
    std::vector<std::string> modules() const;

    void printHelp(const std::string& module) const;
    void printAllModules() const;

    nlohmann::json getDefaultJson(const std::string& module) const;

    bool validateRegistry() const;

    std::string resolveAlias(const std::string& module, const std::string& alias) const;

private:
    ParameterRegistry() = default;
    std::map<std::string, std::vector<ParameterDefinition>> registry;
    std::map<std::string, std::map<std::string, std::string>> alias_to_name_map;
};

/*! \brief Registers the parameters of bonding, energy, reaction and simulation
 *
 * Safe to call more than once; only the first call populates the registry.
 */
void initialize_parameter_registry();
