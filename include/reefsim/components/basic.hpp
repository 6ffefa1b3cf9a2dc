#ifndef REEFSIM_COMPONENTS_BASIC_HPP
#define REEFSIM_COMPONENTS_BASIC_HPP

#include <string>
#include <variant>
#include <vector>

#include <entt/entt.hpp>

#include "reefsim/math/vector_math.hpp" // for Position, Vector

namespace Components {

    // Use the Position and Vector classes from vector_math.hpp
    using Position = ::Position;
    using Velocity = ::Vector;

    // Collision shapes
    struct Sphere {
        double radius;
    };

    // Axis-aligned box, stored as half the full size on each axis
    struct Box {
        Vector halfExtents;
    };

    // std::monostate marks a body without a collision shape
    using Shape = std::variant<std::monostate, Sphere, Box>;

    // Tag: excluded from integration, still collidable
    struct Static {};

    // Semantic role used by gameplay dispatch (player, collectible, ...)
    struct Category {
        std::string tag;
    };

    struct Collectible {
        bool collected = false;
    };

    struct Name {
        std::string value;
    };

    /**
     * @brief Receives the full collision list of a body after resolution.
     *
     * Invoked synchronously from PhysicsEngine::update. Implementations may
     * add or remove bodies through the engine; removals take effect after the
     * current update finishes iterating.
     */
    class ICollisionListener {
    public:
        virtual ~ICollisionListener() = default;

        /**
         * @param self The body that moved into contact
         * @param others Every body it overlaps this frame, in query order
         */
        virtual void onCollision(entt::entity self, const std::vector<entt::entity>& others) = 0;
    };

    // Non-owning; the owner clears it or removes the body before it dies
    struct CollisionListener {
        ICollisionListener* listener = nullptr;
    };

} // namespace Components

#endif
