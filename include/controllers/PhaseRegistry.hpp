/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PHASE_REGISTRY_HPP
#define PHASE_REGISTRY_HPP

/**
 * @file PhaseRegistry.hpp
 * @brief Ordered, type-indexed container of simulation phases
 *
 * Phases run in registration order. Type lookup via get<T>() lets the owner
 * and tests reach a specific phase.
 *
 * @code
 * PhaseRegistry phases;
 * phases.add<Spawner>(config.spawner);
 * phases.add<SteeringController>(config.steering, config.arrival);
 * phases.updateAll(dt, ctx);
 * @endcode
 */

#include "controllers/SimulationPhase.hpp"
#include <memory>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ArenaEngine {

class PhaseRegistry
{
public:
    PhaseRegistry() = default;

    PhaseRegistry(const PhaseRegistry&) = delete;
    PhaseRegistry& operator=(const PhaseRegistry&) = delete;

    PhaseRegistry(PhaseRegistry&&) noexcept = default;
    PhaseRegistry& operator=(PhaseRegistry&&) noexcept = default;

    /**
     * @brief Add a phase of type T at the end of the tick order
     * @return The new phase, or the existing one if T is already registered
     */
    template<typename T, typename... Args>
    T& add(Args&&... args)
    {
        static_assert(std::is_base_of_v<SimulationPhase, T>,
            "T must derive from SimulationPhase");

        std::type_index const typeIdx(typeid(T));
        auto it = m_typeToIndex.find(typeIdx);
        if (it != m_typeToIndex.end()) {
            return *static_cast<T*>(m_phases[it->second].get());
        }

        auto phase = std::make_unique<T>(std::forward<Args>(args)...);
        T& ref = *phase;
        m_typeToIndex[typeIdx] = m_phases.size();
        m_phases.push_back(std::move(phase));
        return ref;
    }

    template<typename T>
    T* get()
    {
        auto it = m_typeToIndex.find(std::type_index(typeid(T)));
        if (it != m_typeToIndex.end()) {
            return static_cast<T*>(m_phases[it->second].get());
        }
        return nullptr;
    }

    template<typename T>
    const T* get() const
    {
        return const_cast<PhaseRegistry*>(this)->get<T>();
    }

    template<typename T>
    [[nodiscard]] bool has() const
    {
        return m_typeToIndex.find(std::type_index(typeid(T))) != m_typeToIndex.end();
    }

    void updateAll(float deltaTime, SimulationContext& ctx)
    {
        for (auto& phase : m_phases) {
            phase->update(deltaTime, ctx);
        }
    }

    void levelStartAll(SimulationContext& ctx)
    {
        for (auto& phase : m_phases) {
            phase->onLevelStart(ctx);
        }
    }

    void surfaceRebuiltAll(SimulationContext& ctx)
    {
        for (auto& phase : m_phases) {
            phase->onSurfaceRebuilt(ctx);
        }
    }

    [[nodiscard]] size_t size() const { return m_phases.size(); }
    [[nodiscard]] bool empty() const { return m_phases.empty(); }

    void clear()
    {
        m_phases.clear();
        m_typeToIndex.clear();
    }

private:
    std::vector<std::unique_ptr<SimulationPhase>> m_phases;
    std::unordered_map<std::type_index, size_t> m_typeToIndex;
};

} // namespace ArenaEngine

#endif // PHASE_REGISTRY_HPP
