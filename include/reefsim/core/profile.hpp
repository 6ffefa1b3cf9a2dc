/**
 * @file profile.hpp
 * @brief Scoped timing of the per-frame simulation entry points
 *
 * Each frame the engine, the particle system and the game session open a
 * named scope. Scopes opened while another scope is active become its
 * children, so the printed summary reads as a call tree:
 *
 * @code
 * void PhysicsEngine::update(double dt) {
 *     PROFILE_SCOPE("PhysicsEngine::update");
 *     // ... code ...
 * }
 *
 * Profiling::Profiler::printStats();
 * @endcode
 *
 * Profiling can be switched off at runtime with Profiler::setEnabled(false);
 * scopes opened while disabled record nothing.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Profiling {

/**
 * @brief Process-wide collector of scope timings.
 *
 * Singleton; use the static methods.
 */
class Profiler {
public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration  = std::chrono::nanoseconds;

    /**
     * @brief Aggregated timing statistics for one named scope
     */
    struct ProfileData {
        Duration total_time{0};        ///< Accumulated time inside the scope
        Duration self_time{0};         ///< total_time minus time spent in children
        uint64_t call_count{0};        ///< Number of completed entries
        Duration min_time{Duration::max()};
        Duration max_time{0};

        std::string parent_name;           ///< Enclosing scope, empty for roots
        std::vector<std::string> children; ///< Scopes opened inside this one
    };

    /**
     * @brief Opens a named scope.
     * @param name Scope name; must be closed with endSection(name).
     */
    static void startSection(const std::string& name);

    /**
     * @brief Closes the innermost scope.
     *
     * A name that does not match the innermost open scope is reported on
     * std::cerr and ignored.
     */
    static void endSection(const std::string& name);

    /**
     * @brief Prints the call tree with totals, call counts and percentages.
     */
    static void printStats(std::ostream& os = std::cout);

    /**
     * @brief Returns the statistics gathered for a scope, if any.
     */
    static std::optional<ProfileData> getStats(const std::string& name);

    /**
     * @brief Drops all recorded data and any open scopes.
     */
    static void reset();

    static void setEnabled(bool enabled);
    static bool isEnabled();

private:
    struct SectionData {
        TimePoint start_time;
        ProfileData profile_data;
    };

    std::unordered_map<std::string, SectionData> sections;
    std::vector<std::string> open_scopes;
    bool enabled = true;

    Profiler() = default;

    static Profiler& getInstance();

    static void printNode(std::ostream& os,
                          const std::string& name,
                          const std::string& prefix,
                          bool is_last,
                          Duration total_program_time);
};

/**
 * @brief RAII guard: opens a scope on construction, closes it on destruction.
 */
class ScopedProfiler {
public:
    explicit ScopedProfiler(std::string name);
    ~ScopedProfiler();

    ScopedProfiler(const ScopedProfiler&) = delete;
    ScopedProfiler& operator=(const ScopedProfiler&) = delete;

private:
    std::string section_name;
    bool active;
};

} // namespace Profiling

#define REEFSIM_PROFILE_CONCAT_INNER(a, b) a##b
#define REEFSIM_PROFILE_CONCAT(a, b) REEFSIM_PROFILE_CONCAT_INNER(a, b)

/**
 * @brief Times the enclosing block under the given name.
 */
#define PROFILE_SCOPE(name) \
    ::Profiling::ScopedProfiler REEFSIM_PROFILE_CONCAT(_scopedProfiler, __LINE__) { name }
