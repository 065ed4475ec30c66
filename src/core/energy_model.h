/*
 * <Transient heat, kinetic energy and temperature of the simulation>
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

#include "src/core/config_manager.h"
#include "src/core/physics_world.h"

#include <algorithm>
#include <random>
#include <vector>

/*! \brief Energy bookkeeping of one simulation
 *
 * The transient heat is a decaying scalar in [0, max_energy]. The system
 * energy adds the scaled kinetic energy of all free bodies to it.
 */
class EnergyModel {
public:
    explicit EnergyModel(const ConfigManager& config);

    /*! \brief transient = min(max, transient + amount), negative amounts are ignored */
    double addEnergy(double amount);

    /*! \brief transient = max(transient, intensity * pulse_energy_boost) */
    double applyHeatPulse(double intensity);

    /*! \brief transient *= rate, snapped to 0 below decay_epsilon */
    double decay(double rate);

    /*! \brief Remove up to amount, returns what was actually removed */
    double consume(double amount);

    void reset() { m_transient = 0.0; }

    double transientHeat() const { return m_transient; }
    double temperature() const { return m_base_temperature + m_transient * m_temperature_coefficient; }

    double kineticEnergy(const PhysicsWorld& world, const std::vector<BodyId>& bodies) const;
    double systemEnergy(const PhysicsWorld& world, const std::vector<BodyId>& bodies) const;

    /*! \brief Add a uniform random velocity in [-amplitude/2, amplitude/2] per component */
    void thermalKick(PhysicsWorld& world, const std::vector<BodyId>& bodies, double amplitude);

    /*! \brief Rescale every body faster than max_velocity down to it */
    void limitVelocities(PhysicsWorld& world, const std::vector<BodyId>& bodies, double max_velocity) const;

    double heatIntensity() const { return m_heat_intensity; }
    void setHeatIntensity(double intensity) { m_heat_intensity = std::max(0.0, intensity); }
    bool continuousHeating() const { return m_continuous_heating; }
    void setContinuousHeating(bool enable) { m_continuous_heating = enable; }
    double continuousHeatFactor() const { return m_continuous_heat_factor; }
    double velocityKick() const { return m_velocity_kick; }
    double maxEnergy() const { return m_max_energy; }

private:
    double m_transient = 0.0;
    double m_max_energy;
    double m_base_temperature;
    double m_temperature_coefficient;
    double m_kinetic_scale;
    double m_pulse_energy_boost;
    double m_decay_epsilon;
    double m_heat_intensity;
    double m_continuous_heat_factor;
    double m_velocity_kick;
    bool m_continuous_heating;
    std::mt19937 m_generator;
};
