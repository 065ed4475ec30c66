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

#pragma once

#include "src/core/global.h"

#include <optional>
#include <string>

/*! \brief Tunables switched as a whole by setMode
 *
 * decay_rate is applied once per step to the transient heat.
 */
struct SimulationMode {
    std::string name = "educational";
    double damping = 0.9;
    double decay_rate = 0.998;
    double max_velocity = 3.0;
    bool auto_reactions = true;

    static SimulationMode sandbox() { return { "sandbox", 0.8, 0.99, 5.0, false }; }
    static SimulationMode educational() { return { "educational", 0.9, 0.998, 3.0, true }; }
    static SimulationMode realistic() { return { "realistic", 0.4, 0.96, 15.0, true }; }

    /*! \brief Preset by case-insensitive name, nullopt if unknown */
    static std::optional<SimulationMode> fromName(std::string name);

    static StringList names() { return { "sandbox", "educational", "realistic" }; }

    json toJson() const;
};
