/**
 * @file narrowphase.cpp
 * @brief Implementation of the shape-pair overlap tests
 */

#include "reefsim/systems/collision/narrowphase.hpp"

#include <variant>

namespace Collision {

namespace {

/**
 * @brief Visitor over (shape, shape) pairs
 *
 * The catch-all overload turns any pair without a dedicated test into
 * "no collision".
 */
struct ShapePairTest {
    const Position &posA;
    const Position &posB;

    bool operator()(const Components::Sphere &a, const Components::Sphere &b) const {
        return sphereSphere(posA, a, posB, b);
    }

    bool operator()(const Components::Box &a, const Components::Box &b) const {
        return boxBox(posA, a, posB, b);
    }

    bool operator()(const Components::Sphere &a, const Components::Box &b) const {
        return sphereBox(posA, a, posB, b);
    }

    bool operator()(const Components::Box &a, const Components::Sphere &b) const {
        return sphereBox(posB, b, posA, a);
    }

    template <typename A, typename B>
    bool operator()(const A &, const B &) const {
        return false;
    }
};

} // namespace

AABB computeAABB(const Position &center, const Components::Box &box)
{
    Position const half = static_cast<Position>(box.halfExtents);
    return { center - half, center + half };
}

bool sphereSphere(const Position &posA, const Components::Sphere &a,
                  const Position &posB, const Components::Sphere &b)
{
    return posA.dist(posB) <= a.radius + b.radius;
}

bool boxBox(const Position &posA, const Components::Box &a,
            const Position &posB, const Components::Box &b)
{
    AABB const boxA = computeAABB(posA, a);
    AABB const boxB = computeAABB(posB, b);

    return boxA.min.x <= boxB.max.x && boxA.max.x >= boxB.min.x &&
           boxA.min.y <= boxB.max.y && boxA.max.y >= boxB.min.y &&
           boxA.min.z <= boxB.max.z && boxA.max.z >= boxB.min.z;
}

bool sphereBox(const Position &spherePos, const Components::Sphere &sphere,
               const Position &boxPos, const Components::Box &box)
{
    AABB const bounds = computeAABB(boxPos, box);
    Position const closest = closestPointOnBox(bounds.min, bounds.max, spherePos);
    return spherePos.dist(closest) <= sphere.radius;
}

bool shapesOverlap(const Position &posA, const Components::Shape &a,
                   const Position &posB, const Components::Shape &b)
{
    return std::visit(ShapePairTest{posA, posB}, a, b);
}

} // namespace Collision
