#include "DrawingState.h"
#include "HitTest.h"
#include "Model.h"
#include "Preferences.h"
#include "Viewport.h"
#include <SDL3/SDL_log.h>
#include <cmath>

namespace Planform {

DrawingState::DrawingState(
    Model& model, const Viewport& viewport, const Preferences& prefs
)
    : m_model(model), m_viewport(viewport), m_prefs(prefs)
{
}

void DrawingState::UpdateTarget(const Point2D& worldPointer) {
    Point2D target = worldPointer;

    if (IsPending()) {
        if (const Corner* last = m_model.FindCorner(m_lastNode)) {
            if (std::fabs(worldPointer.x - last->x) < SNAP_TOLERANCE) {
                target.x = last->x;
            }
            if (std::fabs(worldPointer.y - last->y) < SNAP_TOLERANCE) {
                target.y = last->y;
            }
        }
    }

    m_target = Geometry::SnapToGrid(
        target, m_prefs.gridSize * m_viewport.GetCmPerPixel());
}

DrawOutcome DrawingState::Click() {
    // The chain's corners may have been removed behind our back
    if (IsPending() && (!m_model.FindCorner(m_lastNode) ||
                        !m_model.FindCorner(m_firstNode))) {
        Reset();
    }

    const std::string hitId = CornerAtTarget();

    if (!IsPending()) {
        const std::string seed = hitId.empty() ? AddCornerAtTarget() : hitId;
        m_lastNode = seed;
        m_firstNode = seed;
        m_target = m_model.FindCorner(seed)->Position();
        return DrawOutcome::Started;
    }

    if (hitId == m_lastNode) {
        return DrawOutcome::None;
    }

    const Corner* first = m_model.FindCorner(m_firstNode);
    if (hitId == m_firstNode &&
        Geometry::Distance(m_target, first->Position()) < SNAP_TOLERANCE) {
        if (!AddWallBetween(m_lastNode, m_firstNode)) {
            return DrawOutcome::None;
        }
        Reset();
        m_model.UpdateRooms();
        return DrawOutcome::Closed;
    }

    const std::string next = hitId.empty() ? AddCornerAtTarget() : hitId;
    if (!AddWallBetween(m_lastNode, next)) {
        return DrawOutcome::None;
    }

    m_lastNode = next;
    m_target = m_model.FindCorner(next)->Position();
    return DrawOutcome::Extended;
}

void DrawingState::Reset() {
    m_lastNode.clear();
    m_firstNode.clear();
}

std::string DrawingState::CornerAtTarget() const {
    HitTester hitTester(m_model, m_viewport);
    const Corner* corner = hitTester.FindCornerAt(
        m_target.x, m_target.y, m_prefs.snapTolerance);
    return corner ? corner->id : std::string();
}

std::string DrawingState::AddCornerAtTarget() {
    Corner corner;
    corner.id = m_model.GenerateCornerId();
    corner.x = m_target.x;
    corner.y = m_target.y;
    m_model.AddCorner(corner);
    return corner.id;
}

bool DrawingState::AddWallBetween(
    const std::string& startId, const std::string& endId
) {
    Wall wall;
    wall.id = m_model.GenerateWallId();
    wall.startCorner = startId;
    wall.endCorner = endId;
    wall.thickness = m_prefs.wallThickness;
    wall.height = m_prefs.wallHeight;

    std::string error;
    if (!m_model.AddWall(wall, &error)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                     "Draw: could not add wall: %s", error.c_str());
        return false;
    }
    return true;
}

} // namespace Planform
