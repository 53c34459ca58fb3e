#pragma once

#include "Geometry.h"
#include <string>

namespace Planform {

class Model;
class Viewport;
class Preferences;

/**
 * Result of committing a draw-mode click.
 */
enum class DrawOutcome {
    None,       // Nothing committed
    Started,    // Chain seeded from a new or existing corner
    Extended,   // A wall was appended to the chain
    Closed      // The chain was closed back onto its first corner
};

/**
 * Draw-mode state machine.
 *
 * Idle: no open chain. Pending: an open path whose most recent corner is
 * lastNode and whose first corner is firstNode. Clicks append corners and
 * walls to the model; clicking back onto firstNode closes the chain,
 * refreshes the room cache and returns to Idle. Corners and walls already
 * committed stay in the model when the chain is abandoned.
 */
class DrawingState {
public:
    // World-cm distance for axis locking and closing onto the first corner
    static constexpr float SNAP_TOLERANCE = 25.0f;

    DrawingState(Model& model, const Viewport& viewport,
                 const Preferences& prefs);

    bool IsPending() const { return !m_lastNode.empty(); }
    const std::string& GetLastNode() const { return m_lastNode; }
    const std::string& GetFirstNode() const { return m_firstNode; }

    // Snapped world position the next click will commit to
    const Point2D& GetTarget() const { return m_target; }

    /**
     * Resolve the click target from the raw pointer position.
     * While pending, an axis within SNAP_TOLERANCE of lastNode locks to
     * it; the result is then snapped to the grid at the current zoom.
     * @param worldPointer Pointer position in world cm
     */
    void UpdateTarget(const Point2D& worldPointer);

    /**
     * Commit a click at the current target.
     * @return What the click did; Closed means drawing is finished
     */
    DrawOutcome Click();

    // Abandon the open chain (committed geometry is kept)
    void Reset();

private:
    // Corner under the target, or empty
    std::string CornerAtTarget() const;
    std::string AddCornerAtTarget();
    bool AddWallBetween(const std::string& startId, const std::string& endId);

    Model& m_model;
    const Viewport& m_viewport;
    const Preferences& m_prefs;

    std::string m_lastNode;
    std::string m_firstNode;
    Point2D m_target;
};

} // namespace Planform
