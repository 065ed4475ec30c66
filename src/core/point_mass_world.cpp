/*
 * <Point mass implementation of the physics collaborator>
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

#include "src/core/point_mass_world.h"

#include <cmath>

BodyId PointMassWorld::createBody(const Position& position, double mass, double damping)
{
    PointMass body;
    body.position = position;
    body.mass = mass > 0 ? mass : 1.0;
    body.damping = damping;
    const BodyId id = m_next_id++;
    m_bodies.emplace(id, body);
    return id;
}

BodyId PointMassWorld::createAggregate(const Position& center, double mass, double damping, const std::vector<Position>& offsets)
{
    const BodyId id = createBody(center, mass, damping);
    m_bodies[id].parts = offsets;
    return id;
}

void PointMassWorld::removeBody(BodyId body)
{
    m_bodies.erase(body);
}

bool PointMassWorld::hasBody(BodyId body) const
{
    return m_bodies.count(body) > 0;
}

Position PointMassWorld::position(BodyId body) const
{
    auto it = m_bodies.find(body);
    return it == m_bodies.end() ? Position::Zero() : it->second.position;
}

void PointMassWorld::setPosition(BodyId body, const Position& position)
{
    auto it = m_bodies.find(body);
    if (it != m_bodies.end())
        it->second.position = position;
}

Position PointMassWorld::velocity(BodyId body) const
{
    auto it = m_bodies.find(body);
    return it == m_bodies.end() ? Position::Zero() : it->second.velocity;
}

void PointMassWorld::setVelocity(BodyId body, const Position& velocity)
{
    auto it = m_bodies.find(body);
    if (it != m_bodies.end())
        it->second.velocity = velocity;
}

double PointMassWorld::mass(BodyId body) const
{
    auto it = m_bodies.find(body);
    return it == m_bodies.end() ? 0.0 : it->second.mass;
}

void PointMassWorld::setMass(BodyId body, double mass)
{
    auto it = m_bodies.find(body);
    if (it != m_bodies.end() && mass > 0)
        it->second.mass = mass;
}

void PointMassWorld::setDamping(BodyId body, double damping)
{
    auto it = m_bodies.find(body);
    if (it != m_bodies.end())
        it->second.damping = damping;
}

void PointMassWorld::applyForce(BodyId body, const Position& force)
{
    auto it = m_bodies.find(body);
    if (it != m_bodies.end())
        it->second.force += force;
}

Position PointMassWorld::partPosition(BodyId body, int part) const
{
    auto it = m_bodies.find(body);
    if (it == m_bodies.end())
        return Position::Zero();
    if (part < 0 || part >= static_cast<int>(it->second.parts.size()))
        return it->second.position;
    return it->second.position + it->second.parts[part];
}

std::vector<BodyId> PointMassWorld::bodies() const
{
    std::vector<BodyId> ids;
    ids.reserve(m_bodies.size());
    for (const auto& entry : m_bodies)
        ids.push_back(entry.first);
    return ids;
}

void PointMassWorld::step(double dt)
{
    if (dt <= 0)
        return;

    for (auto& entry : m_bodies) {
        PointMass& body = entry.second;
        const Position acceleration = body.force / body.mass;
        body.position += body.velocity * dt + 0.5 * acceleration * dt * dt;
        body.velocity += acceleration * dt;
        body.velocity *= std::pow(1.0 - std::min(std::max(body.damping, 0.0), 1.0), dt);
        body.force.setZero();
    }
}

bool PointMassWorld::setPartOffset(BodyId body, int part, const Position& offset)
{
    auto it = m_bodies.find(body);
    if (it == m_bodies.end() || part < 0 || part >= static_cast<int>(it->second.parts.size()))
        return false;
    it->second.parts[part] = offset;
    return true;
}
