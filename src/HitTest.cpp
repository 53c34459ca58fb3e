#include "HitTest.h"
#include "Model.h"
#include "Viewport.h"

namespace Planform {

HitTester::HitTester(const Model& model, const Viewport& viewport)
    : m_model(model), m_viewport(viewport)
{
}

const Corner* HitTester::FindCornerAt(
    float worldX, float worldY, float tolerancePx
) const {
    const Point2D p(worldX, worldY);
    const float tolerance = tolerancePx * m_viewport.GetCmPerPixel();

    for (const auto& [id, corner] : m_model.GetCorners()) {
        if (Geometry::Distance(p, corner.Position()) < tolerance) {
            return &corner;
        }
    }
    return nullptr;
}

const Wall* HitTester::FindWallAt(
    float worldX, float worldY, float tolerancePx
) const {
    const Point2D p(worldX, worldY);
    const float tolerance = tolerancePx * m_viewport.GetCmPerPixel();

    for (const auto& [id, wall] : m_model.GetWalls()) {
        const Corner* start = m_model.FindCorner(wall.startCorner);
        const Corner* end = m_model.FindCorner(wall.endCorner);
        if (!start || !end) {
            continue;
        }

        const Point2D a = start->Position();
        const Point2D b = end->Position();
        if (a == b) {
            continue;
        }

        if (Geometry::PointToSegmentDistance(p, a, b) < tolerance) {
            return &wall;
        }
    }
    return nullptr;
}

HitResult HitTester::HitAt(
    float worldX, float worldY,
    float cornerTolerancePx, float wallTolerancePx
) const {
    HitResult result;

    if (const Corner* corner = FindCornerAt(worldX, worldY, cornerTolerancePx)) {
        result.kind = HitResult::Kind::Corner;
        result.id = corner->id;
    } else if (const Wall* wall = FindWallAt(worldX, worldY, wallTolerancePx)) {
        result.kind = HitResult::Kind::Wall;
        result.id = wall->id;
    }
    return result;
}

} // namespace Planform
