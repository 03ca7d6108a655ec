#include "gt/movement/MovementSources.hpp"

#include <cmath>

#include "gt/core/Logger.hpp"

namespace gt::movement {

ButtonMovementSource::ButtonMovementSource(double stepDegrees)
    : m_stepDegrees(stepDegrees) {}

bool ButtonMovementSource::Step(MoveDirection direction) {
    if (!m_handler || !m_positionProvider) {
        return false;
    }

    world::WorldPosition delta(0.0);
    switch (direction) {
        case MoveDirection::North: delta.x = m_stepDegrees; break;
        case MoveDirection::South: delta.x = -m_stepDegrees; break;
        case MoveDirection::East:  delta.y = m_stepDegrees; break;
        case MoveDirection::West:  delta.y = -m_stepDegrees; break;
    }

    m_handler(m_positionProvider() + delta);
    return true;
}

void GeolocationMovementSource::SetEnabled(bool enabled) {
    if (m_enabled == enabled) {
        return;
    }
    m_enabled = enabled;
    gt::core::Logger::Info("[Geolocation] Tracking {}", enabled ? "enabled" : "disabled");
}

bool GeolocationMovementSource::OnFix(double latitude, double longitude) {
    if (!m_enabled || !m_handler) {
        return false;
    }
    if (!std::isfinite(latitude) || !std::isfinite(longitude) ||
        std::abs(latitude) > 90.0 || std::abs(longitude) > 180.0) {
        gt::core::Logger::Warning("[Geolocation] Dropping invalid fix ({}, {})", latitude, longitude);
        return false;
    }
    m_handler(world::WorldPosition(latitude, longitude));
    return true;
}

} // namespace gt::movement
