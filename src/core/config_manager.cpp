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

#include "src/core/config_manager.h"
#include "src/core/parameter_registry.h"
#include "src/core/valency_logger.h"

#include <algorithm>
#include <cctype>

namespace {

std::string lower(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(), ::tolower);
    return text;
}

}

ConfigManager::ConfigManager(const std::string& module, const json& user_input)
    : m_module(module)
{
    auto& registry = ParameterRegistry::getInstance();
    m_config = registry.getDefaultJson(module);

    if (!user_input.is_object())
        return;

    for (const auto& item : user_input.items()) {
        const std::string user_key = item.key();

        std::string resolved_key = registry.resolveAlias(module, user_key);
        if (!resolved_key.empty() && m_config.contains(resolved_key)) {
            m_config[resolved_key] = item.value();
            continue;
        }

        const std::string user_key_lower = lower(user_key);
        bool found = false;
        for (const auto& def_item : m_config.items()) {
            if (lower(def_item.key()) == user_key_lower) {
                m_config[def_item.key()] = item.value();
                found = true;
                break;
            }
        }

        if (!found) {
            ValencyLogger::debug_fmt("ConfigManager: '{}' is not a registered parameter of module '{}'", user_key, module);
            m_config[user_key] = item.value();
        }
    }
}

bool ConfigManager::has(const std::string& key) const
{
    const std::string key_lower = lower(key);
    for (const auto& item : m_config.items()) {
        if (lower(item.key()) == key_lower)
            return true;
    }
    return false;
}

void ConfigManager::set(const std::string& key, const json& value)
{
    const std::string key_lower = lower(key);
    for (const auto& item : m_config.items()) {
        if (lower(item.key()) == key_lower) {
            m_config[item.key()] = value;
            return;
        }
    }
    m_config[key] = value;
}

json ConfigManager::findKey(const std::string& key) const
{
    const std::string key_lower = lower(key);
    for (const auto& item : m_config.items()) {
        if (lower(item.key()) == key_lower)
            return item.value();
    }
    throw std::runtime_error("Key not found: " + key);
}
