/*
 * <Mode presets of the simulation>
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

#include "src/core/simulation_mode.h"

#include <algorithm>

std::optional<SimulationMode> SimulationMode::fromName(std::string name)
{
    std::transform(name.begin(), name.end(), name.begin(), ::tolower);
    if (name == "sandbox")
        return sandbox();
    if (name == "educational")
        return educational();
    if (name == "realistic")
        return realistic();
    return std::nullopt;
}

json SimulationMode::toJson() const
{
    json mode;
    mode["name"] = name;
    mode["damping"] = damping;
    mode["decay_rate"] = decay_rate;
    mode["max_velocity"] = max_velocity;
    mode["auto_reactions"] = auto_reactions;
    return mode;
}
