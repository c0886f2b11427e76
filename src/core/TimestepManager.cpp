/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/TimestepManager.hpp"
#include <algorithm>

namespace ArenaEngine {

TimestepManager::TimestepManager(float updateHz, bool realtime)
    : m_fixedTimestep(updateHz > 0.0f ? 1.0f / updateHz : 1.0f / 60.0f)
    , m_realtime(realtime)
{
    m_frameStartNs = SDL_GetTicksNS();
    m_previousFrameNs = m_frameStartNs;
}

void TimestepManager::startFrame() {
    const Uint64 nowNs = SDL_GetTicksNS();
    const Uint64 elapsedNs = nowNs - m_previousFrameNs;
    m_frameStartNs = nowNs;
    m_previousFrameNs = nowNs;

    // Fast mode and the first realtime frame both run a single step
    if (!m_realtime || m_firstFrame) {
        m_firstFrame = false;
        m_accumulator = m_fixedTimestep;
        return;
    }

    const double elapsedSeconds = static_cast<double>(elapsedNs) / NS_PER_SECOND;
    updateFPS(elapsedSeconds);
    m_accumulator += std::min(elapsedSeconds, MAX_ACCUMULATOR);
}

bool TimestepManager::shouldUpdate() {
    if (m_accumulator < m_fixedTimestep) {
        return false;
    }
    m_accumulator -= m_fixedTimestep;
    ++m_updateCount;
    return true;
}

void TimestepManager::endFrame() const {
    if (!m_realtime) {
        return;
    }

    const Uint64 budgetNs = static_cast<Uint64>(static_cast<double>(m_fixedTimestep) * NS_PER_SECOND);
    const Uint64 spentNs = SDL_GetTicksNS() - m_frameStartNs;
    if (spentNs < budgetNs) {
        SDL_DelayPrecise(budgetNs - spentNs);
    }
}

void TimestepManager::setRealtime(bool realtime) {
    if (m_realtime == realtime) {
        return;
    }
    m_realtime = realtime;
    reset();
}

void TimestepManager::reset() {
    m_accumulator = 0.0;
    m_updateCount = 0;
    m_currentFPS = 0.0f;
    m_firstFrame = true;
    m_frameStartNs = SDL_GetTicksNS();
    m_previousFrameNs = m_frameStartNs;
}

void TimestepManager::updateFPS(double elapsedSeconds) {
    if (elapsedSeconds <= 0.0) {
        return;
    }
    const float sampleFPS = std::clamp(static_cast<float>(1.0 / elapsedSeconds), 0.1f, 1000.0f);
    m_currentFPS = m_currentFPS <= 0.0f
        ? sampleFPS
        : m_smoothingAlpha * sampleFPS + (1.0f - m_smoothingAlpha) * m_currentFPS;
}

} // namespace ArenaEngine
