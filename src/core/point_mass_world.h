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

#pragma once

#include "src/core/physics_world.h"

#include <map>

/*! \brief Translational point masses without collisions
 *
 * Integration per step:
 *   x += v dt + 1/2 a dt^2
 *   v += a dt
 *   v *= (1 - damping)^dt
 * Aggregates do not rotate, parts stay at their offsets unless
 * setPartOffset moves them.
 */
class PointMassWorld : public PhysicsWorld {
public:
    PointMassWorld() = default;

    BodyId createBody(const Position& position, double mass, double damping) override;
    BodyId createAggregate(const Position& center, double mass, double damping, const std::vector<Position>& offsets) override;
    void removeBody(BodyId body) override;
    bool hasBody(BodyId body) const override;

    Position position(BodyId body) const override;
    void setPosition(BodyId body, const Position& position) override;
    Position velocity(BodyId body) const override;
    void setVelocity(BodyId body, const Position& velocity) override;
    double mass(BodyId body) const override;
    void setMass(BodyId body, double mass) override;
    void setDamping(BodyId body, double damping) override;
    void applyForce(BodyId body, const Position& force) override;
    Position partPosition(BodyId body, int part) const override;
    std::vector<BodyId> bodies() const override;
    void step(double dt) override;

    /*! \brief Deform an aggregate, returns false for unknown body or part */
    bool setPartOffset(BodyId body, int part, const Position& offset);

    int bodyCount() const { return static_cast<int>(m_bodies.size()); }

private:
    struct PointMass {
        Position position = Position::Zero();
        Position velocity = Position::Zero();
        Position force = Position::Zero();
        double mass = 1.0;
        double damping = 0.0;
        std::vector<Position> parts;
    };

    std::map<BodyId, PointMass> m_bodies;
    BodyId m_next_id = 0;
};
