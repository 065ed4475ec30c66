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

#include "src/core/energy_model.h"

#include <algorithm>
#include <chrono>

EnergyModel::EnergyModel(const ConfigManager& config)
    : m_max_energy(config.get<double>("max_energy"))
    , m_base_temperature(config.get<double>("base_temperature"))
    , m_temperature_coefficient(config.get<double>("temperature_coefficient"))
    , m_kinetic_scale(config.get<double>("kinetic_scale"))
    , m_pulse_energy_boost(config.get<double>("pulse_energy_boost"))
    , m_decay_epsilon(config.get<double>("decay_epsilon"))
    , m_heat_intensity(config.get<double>("heat_intensity"))
    , m_continuous_heat_factor(config.get<double>("continuous_heat_factor"))
    , m_velocity_kick(config.get<double>("velocity_kick"))
    , m_continuous_heating(config.get<bool>("continuous_heating"))
{
    int seed = config.get<int>("seed");
    if (seed < 0)
        seed = static_cast<int>(std::chrono::system_clock::now().time_since_epoch().count() & 0x7fffffff);
    m_generator.seed(static_cast<unsigned int>(seed));
}

double EnergyModel::addEnergy(double amount)
{
    if (amount > 0)
        m_transient = std::min(m_max_energy, m_transient + amount);
    return m_transient;
}

double EnergyModel::applyHeatPulse(double intensity)
{
    m_transient = std::min(m_max_energy, std::max(m_transient, intensity * m_pulse_energy_boost));
    return m_transient;
}

double EnergyModel::decay(double rate)
{
    m_transient *= std::min(std::max(rate, 0.0), 1.0);
    if (m_transient < m_decay_epsilon)
        m_transient = 0.0;
    return m_transient;
}

double EnergyModel::consume(double amount)
{
    if (amount <= 0)
        return 0.0;
    const double removed = std::min(amount, m_transient);
    m_transient = std::max(0.0, m_transient - removed);
    return removed;
}

double EnergyModel::kineticEnergy(const PhysicsWorld& world, const std::vector<BodyId>& bodies) const
{
    double ekin = 0.0;
    for (BodyId body : bodies) {
        if (!world.hasBody(body))
            continue;
        ekin += 0.5 * world.mass(body) * world.velocity(body).squaredNorm();
    }
    return ekin;
}

double EnergyModel::systemEnergy(const PhysicsWorld& world, const std::vector<BodyId>& bodies) const
{
    return m_transient + m_kinetic_scale * kineticEnergy(world, bodies);
}

void EnergyModel::thermalKick(PhysicsWorld& world, const std::vector<BodyId>& bodies, double amplitude)
{
    if (amplitude <= 0)
        return;

    std::uniform_real_distribution<double> jitter(-0.5, 0.5);
    for (BodyId body : bodies) {
        if (!world.hasBody(body))
            continue;
        Position kick(jitter(m_generator), jitter(m_generator), jitter(m_generator));
        world.setVelocity(body, world.velocity(body) + kick * amplitude);
    }
}

void EnergyModel::limitVelocities(PhysicsWorld& world, const std::vector<BodyId>& bodies, double max_velocity) const
{
    for (BodyId body : bodies) {
        if (!world.hasBody(body))
            continue;
        const Position velocity = world.velocity(body);
        const double speed = velocity.norm();
        if (speed > max_velocity && speed > 0)
            world.setVelocity(body, velocity * (max_velocity / speed));
    }
}
