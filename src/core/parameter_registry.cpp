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

#include "src/core/parameter_registry.h"
#include "src/core/valency_logger.h"

#include <algorithm>
#include <iostream>

using json = nlohmann::json;

namespace {

std::string typeName(ParamType type)
{
    switch (type) {
    case ParamType::String:
        return "string";
    case ParamType::Int:
        return "int";
    case ParamType::Double:
        return "double";
    case ParamType::Bool:
        return "bool";
    }
    return "?";
}

json defaultToJson(const ParameterDefinition& param)
{
    switch (param.type) {
    case ParamType::String:
        return std::any_cast<std::string>(param.defaultValue);
    case ParamType::Int:
        return std::any_cast<int>(param.defaultValue);
    case ParamType::Double:
        return std::any_cast<double>(param.defaultValue);
    case ParamType::Bool:
        return std::any_cast<bool>(param.defaultValue);
    }
    return json();
}

}

ParameterRegistry& ParameterRegistry::getInstance()
{
    static ParameterRegistry instance;
    return instance;
}

void ParameterRegistry::addDefinition(const std::string& module, ParameterDefinition&& def)
{
    std::string canonical_name = def.name;
    def.module = module;
    registry[module].push_back(std::move(def));

    alias_to_name_map[module][canonical_name] = canonical_name;
    const auto& added_def = registry[module].back();
    for (const auto& alias : added_def.aliases) {
        alias_to_name_map[module][alias] = canonical_name;
    }
}

const ParameterDefinition* ParameterRegistry::findDefinition(const std::string& module, const std::string& alias) const
{
    const std::string canonical_name = resolveAlias(module, alias);
    if (canonical_name.empty())
        return nullptr;

    auto registry_it = registry.find(module);
    if (registry_it == registry.end())
        return nullptr;

    for (const auto& def : registry_it->second) {
        if (def.name == canonical_name)
            return &def;
    }
    return nullptr;
}

std::vector<ParameterDefinition> ParameterRegistry::getForModule(const std::string& module) const
{
    auto it = registry.find(module);
    if (it != registry.end())
        return it->second;
    return {};
}

std::vector<std::string> ParameterRegistry::modules() const
{
    std::vector<std::string> names;
    for (const auto& entry : registry)
        names.push_back(entry.first);
    return names;
}

void ParameterRegistry::printHelp(const std::string& module) const
{
    auto it = registry.find(module);
    if (it == registry.end()) {
        std::cout << "No parameters registered for module: " << module << std::endl;
        return;
    }

    std::cout << "Parameters for module: " << module << std::endl;
    std::cout << std::string(60, '=') << std::endl;

    std::map<std::string, std::vector<const ParameterDefinition*>> by_category;
    for (const auto& param : it->second) {
        by_category[param.category].push_back(&param);
    }

    for (const auto& [category, params] : by_category) {
        std::cout << "\n[" << category << "]" << std::endl;

        for (const auto* param : params) {
            std::cout << "  -" << param->name << " <" << typeName(param->type) << ">"
                      << " (default: " << defaultToJson(*param).dump() << ")" << std::endl;
            std::cout << "      " << param->helpText << std::endl;

            if (!param->aliases.empty()) {
                std::cout << "      Aliases: ";
                for (size_t i = 0; i < param->aliases.size(); ++i) {
                    if (i > 0)
                        std::cout << ", ";
                    std::cout << param->aliases[i];
                }
                std::cout << std::endl;
            }
        }
    }
    std::cout << std::endl;
}

void ParameterRegistry::printAllModules() const
{
    std::cout << "Available modules:" << std::endl;
    for (const auto& [module, params] : registry) {
        std::cout << "  " << module << " (" << params.size() << " parameters)" << std::endl;
    }
}

json ParameterRegistry::getDefaultJson(const std::string& module) const
{
    json result = json::object();

    auto it = registry.find(module);
    if (it == registry.end())
        return result;

    for (const auto& param : it->second) {
        try {
            result[param.name] = defaultToJson(param);
        } catch (const std::bad_any_cast&) {
            ValencyLogger::warn_fmt("Default of parameter '{}' in module '{}' does not match its declared type {}",
                param.name, module, typeName(param.type));
        }
    }

    return result;
}

bool ParameterRegistry::validateRegistry() const
{
    bool valid = true;

    for (const auto& [module, params] : registry) {
        std::map<std::string, int> name_counts;

        for (const auto& param : params) {
            if (++name_counts[param.name] > 1) {
                ValencyLogger::error_fmt("Duplicate parameter '{}' in module '{}'", param.name, module);
                valid = false;
            }
            for (const auto& alias : param.aliases) {
                if (++name_counts[alias] > 1) {
                    ValencyLogger::error_fmt("Alias '{}' conflicts with another name in module '{}'", alias, module);
                    valid = false;
                }
            }
            try {
                defaultToJson(param);
            } catch (const std::bad_any_cast&) {
                ValencyLogger::error_fmt("Parameter '{}' in module '{}' has a default of the wrong type", param.name, module);
                valid = false;
            }
        }
    }

    // Same name in different modules must keep its type
    std::map<std::string, std::pair<std::string, ParamType>> first_occurrence;
    for (const auto& [module, params] : registry) {
        for (const auto& param : params) {
            auto it = first_occurrence.find(param.name);
            if (it == first_occurrence.end()) {
                first_occurrence[param.name] = { module, param.type };
            } else if (it->second.second != param.type) {
                ValencyLogger::warn_fmt("Parameter '{}' has different types in modules '{}' and '{}'",
                    param.name, it->second.first, module);
            }
        }
    }

    return valid;
}

std::string ParameterRegistry::resolveAlias(const std::string& module, const std::string& alias) const
{
    auto module_it = alias_to_name_map.find(module);
    if (module_it == alias_to_name_map.end())
        return "";

    auto alias_it = module_it->second.find(alias);
    if (alias_it == module_it->second.end())
        return "";

    return alias_it->second;
}
