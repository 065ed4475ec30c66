/*
 * <Interface to the rigid body physics collaborator>
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

#include "src/core/chemistry.h"

#include <vector>

/*! \brief Bodies the bonding engine reads and pushes, but never integrates itself
 *
 * Every atom outside a molecule owns one body. A molecule owns one
 * aggregate body whose parts sit at fixed offsets from its center.
 * Accessors on a body that does not exist return zero vectors.
 */
class PhysicsWorld {
public:
    virtual ~PhysicsWorld() = default;

    virtual BodyId createBody(const Position& position, double mass, double damping) = 0;
    virtual BodyId createAggregate(const Position& center, double mass, double damping, const std::vector<Position>& offsets) = 0;
    virtual void removeBody(BodyId body) = 0;
    virtual bool hasBody(BodyId body) const = 0;

    virtual Position position(BodyId body) const = 0;
    virtual void setPosition(BodyId body, const Position& position) = 0;
    virtual Position velocity(BodyId body) const = 0;
    virtual void setVelocity(BodyId body, const Position& velocity) = 0;
    virtual double mass(BodyId body) const = 0;
    virtual void setMass(BodyId body, double mass) = 0;
    virtual void setDamping(BodyId body, double damping) = 0;

    /*! \brief Accumulate a force, consumed by the next step */
    virtual void applyForce(BodyId body, const Position& force) = 0;

    /*! \brief World position of part of an aggregate body */
    virtual Position partPosition(BodyId body, int part) const = 0;

    virtual std::vector<BodyId> bodies() const = 0;

    /*! \brief Advance all bodies, dt in seconds */
    virtual void step(double dt) = 0;
};
