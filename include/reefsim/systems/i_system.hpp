/**
 * @file i_system.hpp
 * @brief Interface for the per-body physics systems
 */

#pragma once

#include <entt/entt.hpp>
#include "reefsim/core/system_config.hpp"

namespace Systems {

/**
 * @class ISystem
 * @brief Base interface for all physics systems
 *
 * The engine advances bodies one at a time (forces, integration, collision
 * query, resolution), so systems act on a single entity per call rather than
 * on a whole view.
 */
class ISystem {
protected:
    SystemConfig sysConfig;  // Common configuration all systems have

public:
    virtual ~ISystem() = default;

    /**
     * @brief Advances one body by one simulation step
     *
     * @param registry EnTT registry containing all bodies
     * @param entity The body to advance
     * @param dt Step length in seconds
     */
    virtual void update(entt::registry& registry, entt::entity entity, double dt) = 0;

    /**
     * @brief Sets the system configuration
     *
     * @param config System configuration parameters
     */
    virtual void setSystemConfig(const SystemConfig& config) {
        sysConfig = config;
    }

    /**
     * @brief Gets the system configuration
     */
    virtual const SystemConfig& getSystemConfig() const {
        return sysConfig;
    }
};

/**
 * @brief Template for system-specific configurations
 *
 * Derived systems that need parameters beyond SystemConfig keep them in
 * specificConfig.
 */
template<typename SpecificConfig>
class ConfigurableSystem : public ISystem {
protected:
    SpecificConfig specificConfig;

public:
    /**
     * @brief Sets the system-specific configuration
     */
    void setSpecificConfig(const SpecificConfig& config) {
        specificConfig = config;
    }

    /**
     * @brief Gets the system-specific configuration
     */
    const SpecificConfig& getSpecificConfig() const {
        return specificConfig;
    }
};

} // namespace Systems
