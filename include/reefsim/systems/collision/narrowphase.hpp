/**
 * @file narrowphase.hpp
 * @brief Exact overlap tests between collision shapes
 *
 * Supported pairs:
 * - Sphere vs sphere: centre distance against summed radii
 * - Box vs box: per-axis interval overlap of the two AABBs
 * - Sphere vs box (either order): closest point on the box to the sphere centre
 *
 * Every boundary is inclusive, so touching shapes collide. Any other pair,
 * including a body without a shape, never collides.
 *
 * Shapes are not validated. A zero or negative radius is tested as given.
 */

#pragma once

#include "reefsim/components/basic.hpp"
#include "reefsim/systems/collision/collision_data.hpp"

namespace Collision {

/**
 * @brief Computes world-space bounds of a box centred at a position
 */
AABB computeAABB(const Position &center, const Components::Box &box);

bool sphereSphere(const Position &posA, const Components::Sphere &a,
                  const Position &posB, const Components::Sphere &b);

bool boxBox(const Position &posA, const Components::Box &a,
            const Position &posB, const Components::Box &b);

bool sphereBox(const Position &spherePos, const Components::Sphere &sphere,
               const Position &boxPos, const Components::Box &box);

/**
 * @brief Dispatches on the shape pair and runs the matching test
 *
 * @return true if the shapes overlap or touch
 */
bool shapesOverlap(const Position &posA, const Components::Shape &a,
                   const Position &posB, const Components::Shape &b);

} // namespace Collision
