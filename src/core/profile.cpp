/**
 * @file profile.cpp
 * @brief Implementation of the scope profiler declared in profile.hpp
 */

#include "reefsim/core/profile.hpp"

#include <algorithm>
#include <iomanip>
#include <utility>

namespace Profiling {

Profiler& Profiler::getInstance() {
    static Profiler instance;
    return instance;
}

void Profiler::setEnabled(bool enabled) {
    getInstance().enabled = enabled;
}

bool Profiler::isEnabled() {
    return getInstance().enabled;
}

void Profiler::startSection(const std::string& name) {
    auto& instance = getInstance();
    auto& section  = instance.sections[name];
    section.start_time = Clock::now();

    if (instance.open_scopes.empty()) {
        section.profile_data.parent_name.clear();
    } else {
        const std::string parentName = instance.open_scopes.back();
        auto& data = section.profile_data;

        // Re-parent when the same scope is opened from a different caller
        if (!data.parent_name.empty() && data.parent_name != parentName) {
            auto& oldSiblings = instance.sections[data.parent_name].profile_data.children;
            oldSiblings.erase(std::remove(oldSiblings.begin(), oldSiblings.end(), name),
                              oldSiblings.end());
        }
        data.parent_name = parentName;

        auto& siblings = instance.sections[parentName].profile_data.children;
        if (std::find(siblings.begin(), siblings.end(), name) == siblings.end()) {
            siblings.push_back(name);
        }
    }

    instance.open_scopes.push_back(name);
}

void Profiler::endSection(const std::string& name) {
    auto& instance = getInstance();

    if (instance.open_scopes.empty()) {
        std::cerr << "[Profiler] endSection(\"" << name << "\") with no open scope\n";
        return;
    }
    if (instance.open_scopes.back() != name) {
        std::cerr << "[Profiler] endSection(\"" << name
                  << "\") but innermost scope is \"" << instance.open_scopes.back() << "\"\n";
        return;
    }

    auto& data = instance.sections[name].profile_data;
    Duration const elapsed = Clock::now() - instance.sections[name].start_time;

    data.total_time += elapsed;
    data.self_time  += elapsed;
    data.call_count += 1;
    data.min_time = std::min(data.min_time, elapsed);
    data.max_time = std::max(data.max_time, elapsed);

    if (!data.parent_name.empty()) {
        instance.sections[data.parent_name].profile_data.self_time -= elapsed;
    }

    instance.open_scopes.pop_back();
}

std::optional<Profiler::ProfileData> Profiler::getStats(const std::string& name) {
    const auto& instance = getInstance();
    auto it = instance.sections.find(name);
    if (it == instance.sections.end()) {
        return std::nullopt;
    }
    return it->second.profile_data;
}

void Profiler::printStats(std::ostream& os) {
    auto& instance = getInstance();
    os << "\nProfiling Statistics:\n";

    std::vector<std::string> roots;
    Duration totalTime{0};
    for (const auto& [name, section] : instance.sections) {
        if (section.profile_data.parent_name.empty()) {
            roots.push_back(name);
            totalTime += section.profile_data.total_time;
        }
    }
    std::sort(roots.begin(), roots.end());

    for (size_t i = 0; i < roots.size(); ++i) {
        printNode(os, roots[i], "", i + 1 == roots.size(), totalTime);
    }
}

void Profiler::printNode(std::ostream& os,
                         const std::string& name,
                         const std::string& prefix,
                         bool isLast,
                         Duration totalProgramTime)
{
    const auto& pd = getInstance().sections.at(name).profile_data;

    double totalPercent = 0.0;
    double selfPercent = 0.0;
    if (totalProgramTime.count() > 0) {
        totalPercent = (pd.total_time.count() * 100.0) / totalProgramTime.count();
        selfPercent  = (pd.self_time.count()  * 100.0) / totalProgramTime.count();
    }

    auto totalMs = std::chrono::duration_cast<std::chrono::milliseconds>(pd.total_time).count();
    double avgUs = 0.0;
    if (pd.call_count > 0) {
        avgUs = std::chrono::duration<double, std::micro>(pd.total_time).count() / pd.call_count;
    }

    os << prefix << (isLast ? "└── " : "├── ")
       << name << " [" << pd.call_count << " calls] "
       << totalMs << "ms, avg " << std::fixed << std::setprecision(1) << avgUs << "us"
       << " (total: " << std::setprecision(2) << totalPercent << "%, "
       << "self: " << selfPercent << "%)\n";

    std::string const childPrefix = prefix + (isLast ? "    " : "│   ");
    for (size_t i = 0; i < pd.children.size(); ++i) {
        printNode(os, pd.children[i], childPrefix, i + 1 == pd.children.size(), totalProgramTime);
    }
}

void Profiler::reset() {
    auto& instance = getInstance();
    instance.sections.clear();
    instance.open_scopes.clear();
}

// ScopedProfiler

ScopedProfiler::ScopedProfiler(std::string name)
    : section_name(std::move(name))
    , active(Profiler::isEnabled())
{
    if (active) {
        Profiler::startSection(section_name);
    }
}

ScopedProfiler::~ScopedProfiler() {
    if (active) {
        Profiler::endSection(section_name);
    }
}

} // namespace Profiling
