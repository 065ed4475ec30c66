/*
 * <Configuration manager merging registry defaults with user input>
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

#include <stdexcept>
#include <string>
#include <type_traits>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

/*! \brief Type-safe parameter access for one module
 *
 * Defaults are taken from the ParameterRegistry, user values are merged
 * on top (alias resolution first, then case-insensitive name match;
 * unknown keys are kept as given).
 *
 * ```cpp
 * ConfigManager config("bonding", controller["bonding"]);
 * double threshold = config.get<double>("bond_threshold");
 * int seed = config.get<int>("seed", 42);  // with default
 * ```
 */
class ConfigManager {
public:
    /*! \brief Load defaults of module and merge user_input
     *
     * @param module Module name (e.g. "bonding", "energy")
     * @param user_input User configuration, typically controller[module]
     */
    ConfigManager(const std::string& module, const json& user_input = json::object());

    /*! \brief Parameter access, throws std::runtime_error if key is missing */
    template <typename T>
    T get(const std::string& key) const;

    /*! \brief Parameter access returning default_value if key is missing */
    template <typename T>
    T get(const std::string& key, T default_value) const;

    bool has(const std::string& key) const;

    /*! \brief Overwrite (or add) a single value after construction */
    void set(const std::string& key, const json& value);

    json exportConfig() const { return m_config; }
    std::string getModule() const { return m_module; }

private:
    /*! \brief Case-insensitive key lookup, throws if not found */
    json findKey(const std::string& key) const;

    std::string m_module;
    json m_config;
};

template <typename T>
T ConfigManager::get(const std::string& key) const
{
    json value;
    try {
        value = findKey(key);
    } catch (const std::runtime_error&) {
        throw std::runtime_error("ConfigManager: Parameter '" + key + "' not found in module '" + m_module + "'");
    }

    try {
        return value.get<T>();
    } catch (const json::type_error&) {
        std::string expected = "object";
        if constexpr (std::is_same_v<T, bool>)
            expected = "boolean";
        else if constexpr (std::is_arithmetic_v<T>)
            expected = "number";
        else if constexpr (std::is_same_v<T, std::string>)
            expected = "string";
        throw std::runtime_error("ConfigManager: Parameter '" + key + "' in module '" + m_module + "' is a "
            + value.type_name() + ", expected a " + expected);
    }
}

template <typename T>
T ConfigManager::get(const std::string& key, T default_value) const
{
    if (!has(key))
        return default_value;
    return get<T>(key);
}
