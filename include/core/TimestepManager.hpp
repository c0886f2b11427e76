/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TIMESTEP_MANAGER_HPP
#define TIMESTEP_MANAGER_HPP

#include <cstdint>
#include <SDL3/SDL.h>

namespace ArenaEngine {

/**
 * TimestepManager drives the simulation at a fixed update rate.
 *
 * In realtime mode elapsed wall time feeds an accumulator that is drained in
 * fixed steps, and endFrame() sleeps the rest of the frame with
 * SDL_DelayPrecise. Otherwise every frame runs exactly one step without
 * waiting, which lets the headless runner fast-forward a level.
 */
class TimestepManager {
public:
    /**
     * @param updateHz Fixed update frequency (e.g., 60.0f)
     * @param realtime Pace frames against wall time
     */
    explicit TimestepManager(float updateHz = 60.0f, bool realtime = true);

    /**
     * Call this at the start of each frame
     */
    void startFrame();

    /**
     * Returns true while a fixed step is pending; may return true several
     * times per frame for catch-up.
     */
    bool shouldUpdate();

    /**
     * Fixed delta time for updates in seconds
     */
    float getUpdateDeltaTime() const { return m_fixedTimestep; }

    /**
     * Call this at the end of each frame; sleeps in realtime mode
     */
    void endFrame() const;

    float getUpdateFrequencyHz() const { return 1.0f / m_fixedTimestep; }
    uint64_t getUpdateCount() const { return m_updateCount; }
    double getSimulatedSeconds() const { return static_cast<double>(m_updateCount) * m_fixedTimestep; }

    /**
     * Measured frames per second (EMA smoothed); 0 until the second frame
     */
    float getCurrentFPS() const { return m_currentFPS; }

    void setRealtime(bool realtime);
    bool isRealtime() const { return m_realtime; }

    /**
     * Reset timing state (useful when restarting a level)
     */
    void reset();

private:
    float m_fixedTimestep;
    bool m_realtime;

    Uint64 m_frameStartNs{0};   // SDL_GetTicksNS() at startFrame()
    Uint64 m_previousFrameNs{0};

    double m_accumulator{0.0};
    static constexpr double MAX_ACCUMULATOR = 0.25; // Clamp after stalls
    static constexpr double NS_PER_SECOND = 1e9;

    uint64_t m_updateCount{0};
    float m_currentFPS{0.0f};
    float m_smoothingAlpha{0.03f};
    bool m_firstFrame{true};

    void updateFPS(double elapsedSeconds);
};

} // namespace ArenaEngine

#endif // TIMESTEP_MANAGER_HPP
