#pragma once

#include <functional>
#include <utility>

#include "gt/world/CellTypes.hpp"

namespace gt::movement {

using PositionChangeHandler = std::function<void(const world::WorldPosition&)>;
using PositionProvider = std::function<world::WorldPosition()>;

enum class MoveDirection {
    North,
    South,
    East,
    West
};

/**
 * @brief Discrete movement from on-screen buttons.
 *
 * Each step moves one configured step (in degrees) away from whatever the
 * position provider reports, then emits the absolute result.
 */
class ButtonMovementSource {
public:
    explicit ButtonMovementSource(double stepDegrees);

    void Connect(PositionChangeHandler handler) { m_handler = std::move(handler); }
    void SetPositionProvider(PositionProvider provider) { m_positionProvider = std::move(provider); }

    /// Returns false when nothing is connected.
    bool Step(MoveDirection direction);

    double StepDegrees() const { return m_stepDegrees; }

private:
    double m_stepDegrees;
    PositionChangeHandler m_handler;
    PositionProvider m_positionProvider;
};

/**
 * @brief Absolute fixes from a device location service.
 *
 * Fixes received while disabled are dropped; enabling does not replay them.
 */
class GeolocationMovementSource {
public:
    void Connect(PositionChangeHandler handler) { m_handler = std::move(handler); }

    void SetEnabled(bool enabled);
    bool IsEnabled() const { return m_enabled; }

    /// Returns true when the fix was forwarded.
    bool OnFix(double latitude, double longitude);

private:
    bool m_enabled = false;
    PositionChangeHandler m_handler;
};

/// Routes any number of position sources into one handler.
template<typename... Sources>
void ConnectPositionSources(const PositionChangeHandler& handler, Sources&... sources) {
    (sources.Connect(handler), ...);
}

} // namespace gt::movement
