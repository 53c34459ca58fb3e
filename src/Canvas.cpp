#include "Canvas.h"
#include "LengthFormat.h"
#include "Model.h"
#include "Viewport.h"
#include "render/Renderer.h"
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace Planform {

const Color Canvas::BACKGROUND_COLOR = Color(1.0f, 1.0f, 1.0f, 1.0f);
const Color Canvas::GRID_COLOR = Color::FromHex("#d0d0d0");
const Color Canvas::WALL_COLOR = Color::FromHex("#dddddd");
const Color Canvas::WALL_HOVER_COLOR = Color::FromHex("#008cba");
const Color Canvas::WALL_SELECTED_COLOR = Color::FromHex("#f59e42");
const Color Canvas::DELETE_COLOR = Color::FromHex("#ff0000");
const Color Canvas::WALL_EDGE_COLOR = Color::FromHex("#bbbbbb");
const Color Canvas::WALL_SHADOW_COLOR = Color(0.0f, 0.0f, 0.0f, 0.10f);
const Color Canvas::ROOM_FILL_COLOR = Color(0.0f, 0.55f, 0.73f, 0.12f);
const Color Canvas::LABEL_BACKGROUND_COLOR = Color(1.0f, 1.0f, 1.0f, 0.85f);
const Color Canvas::LABEL_TEXT_COLOR = Color::FromHex("#222222");

Canvas::Canvas() {
}

void Canvas::Render(
    IRenderer& renderer,
    const Model& model,
    const Viewport& viewport,
    const CanvasState& state
) {
    m_labels.clear();
    
    // Render in order: grid, rooms, walls, corners, preview
    renderer.Clear(BACKGROUND_COLOR);
    RenderGrid(renderer, viewport, state.gridSize);
    RenderRooms(renderer, model, viewport);
    RenderWalls(renderer, model, viewport, state);
    RenderCorners(renderer, model, viewport, state);
    if (state.mode == EditorMode::Draw) {
        RenderPreview(renderer, viewport, state);
    }
}

const WallLabel* Canvas::FindLabelAt(float deviceX, float deviceY) const {
    for (const auto& label : m_labels) {
        if (label.Contains(deviceX, deviceY)) {
            return &label;
        }
    }
    return nullptr;
}

const WallLabel* Canvas::FindLabel(const std::string& wallId) const {
    for (const auto& label : m_labels) {
        if (label.wallId == wallId) {
            return &label;
        }
    }
    return nullptr;
}

void Canvas::RenderGrid(
    IRenderer& renderer, const Viewport& viewport, float gridSize
) {
    const float spacing = gridSize * viewport.GetZoom();
    
    // Too dense to be useful
    if (spacing <= MIN_GRID_SPACING_PX) {
        return;
    }
    
    const float width = static_cast<float>(viewport.GetDeviceWidth());
    const float height = static_cast<float>(viewport.GetDeviceHeight());
    const float offsetX = std::fmod(-viewport.GetOriginX(), spacing);
    const float offsetY = std::fmod(-viewport.GetOriginY(), spacing);
    
    for (float x = offsetX; x <= width; x += spacing) {
        renderer.DrawLine(x, 0.0f, x, height, GRID_COLOR, 1.0f);
    }
    for (float y = offsetY; y <= height; y += spacing) {
        renderer.DrawLine(0.0f, y, width, y, GRID_COLOR, 1.0f);
    }
}

void Canvas::RenderRooms(
    IRenderer& renderer, const Model& model, const Viewport& viewport
) {
    for (const auto& [id, room] : model.GetRooms()) {
        std::vector<Point2D> polygon = model.RoomPolygon(room);
        if (polygon.size() < 3) {
            continue;  // Stale cache entry
        }
        
        std::vector<Point2D> device;
        device.reserve(polygon.size());
        for (const auto& p : polygon) {
            device.push_back(viewport.DeviceFromWorld(p));
        }
        renderer.DrawPolygonFilled(device, ROOM_FILL_COLOR);
        
        // Name and area at the vertex centroid
        const Point2D center = viewport.DeviceFromWorld(
            Geometry::PolygonCentroid(polygon));
        const float areaM2 = Geometry::PolygonArea(polygon) / 10000.0f;
        
        char areaText[32];
        snprintf(areaText, sizeof(areaText), "%.1f m\xc2\xb2", areaM2);
        const std::string name = room.name.empty() ? "Room" : room.name;
        
        const float nameW = renderer.MeasureText(name, LABEL_FONT_SIZE);
        const float areaW = renderer.MeasureText(areaText, LABEL_FONT_SIZE);
        renderer.DrawText(center.x - nameW / 2.0f,
                          center.y - LABEL_FONT_SIZE,
                          name, LABEL_TEXT_COLOR, LABEL_FONT_SIZE);
        renderer.DrawText(center.x - areaW / 2.0f, center.y,
                          areaText, LABEL_TEXT_COLOR, LABEL_FONT_SIZE);
    }
}

void Canvas::RenderWalls(
    IRenderer& renderer,
    const Model& model,
    const Viewport& viewport,
    const CanvasState& state
) {
    for (const auto& [id, wall] : model.GetWalls()) {
        const Corner* startCorner = model.FindCorner(wall.startCorner);
        const Corner* endCorner = model.FindCorner(wall.endCorner);
        if (!startCorner || !endCorner) continue;
        
        const Point2D start = viewport.DeviceFromWorld(startCorner->Position());
        const Point2D end = viewport.DeviceFromWorld(endCorner->Position());
        
        const float dx = end.x - start.x;
        const float dy = end.y - start.y;
        const float len = std::sqrt(dx * dx + dy * dy);
        if (len == 0.0f) continue;
        
        // Unit normal
        const float nx = -dy / len;
        const float ny = dx / len;
        
        const bool isHover = (id == state.hoveredWall);
        const bool isDelete = isHover && state.mode == EditorMode::Delete;
        const bool isSelected = (id == state.selectedWall);
        
        Color fill = WALL_COLOR;
        if (isDelete) {
            fill = DELETE_COLOR;
        } else if (isSelected) {
            fill = WALL_SELECTED_COLOR;
        } else if (isHover) {
            fill = WALL_HOVER_COLOR;
        }
        
        const float thicknessPx = wall.thickness * viewport.GetPixelsPerCm();
        const float edgeGap = std::max(4.0f, thicknessPx * 0.5f);
        
        // Shadow, body, then the two edge lines
        renderer.DrawLine(start.x, start.y, end.x, end.y,
                          WALL_SHADOW_COLOR, thicknessPx + 6.0f);
        renderer.DrawLine(start.x, start.y, end.x, end.y, fill, thicknessPx);
        for (float offset : {-edgeGap / 2.0f, edgeGap / 2.0f}) {
            renderer.DrawLine(
                start.x + nx * offset, start.y + ny * offset,
                end.x + nx * offset, end.y + ny * offset,
                WALL_EDGE_COLOR, 2.0f);
        }
        
        const float lengthCm = Geometry::Distance(
            startCorner->Position(), endCorner->Position());
        WallLabel label = DrawLengthLabel(
            renderer, start, end, thicknessPx, lengthCm,
            id == state.editingWall);
        label.wallId = id;
        m_labels.push_back(label);
    }
}

void Canvas::RenderCorners(
    IRenderer& renderer,
    const Model& model,
    const Viewport& viewport,
    const CanvasState& state
) {
    // Corners are only drawn while hovered
    const Corner* corner = model.FindCorner(state.hoveredCorner);
    if (!corner) {
        return;
    }
    
    const Point2D pos = viewport.DeviceFromWorld(corner->Position());
    const Color color = (state.mode == EditorMode::Delete)
        ? DELETE_COLOR : WALL_HOVER_COLOR;
    renderer.DrawCircle(pos.x, pos.y, CORNER_RADIUS_HOVER, color);
}

void Canvas::RenderPreview(
    IRenderer& renderer, const Viewport& viewport, const CanvasState& state
) {
    const Point2D target = viewport.DeviceFromWorld(state.drawTarget);
    renderer.DrawCircle(target.x, target.y, CORNER_RADIUS_HOVER,
                        WALL_HOVER_COLOR);
    
    if (!state.drawPending) {
        return;
    }
    
    const Point2D last = viewport.DeviceFromWorld(state.drawLastNode);
    renderer.DrawLine(last.x, last.y, target.x, target.y,
                      WALL_HOVER_COLOR, WALL_WIDTH_HOVER);
    
    const float lengthCm = Geometry::Distance(
        state.drawLastNode, state.drawTarget);
    DrawLengthLabel(renderer, last, target,
                    state.previewThickness * viewport.GetPixelsPerCm(),
                    lengthCm, false);
}

WallLabel Canvas::DrawLengthLabel(
    IRenderer& renderer,
    const Point2D& start, const Point2D& end,
    float thicknessPx, float lengthCm, bool hidden
) {
    const float dx = end.x - start.x;
    const float dy = end.y - start.y;
    const float len = std::sqrt(dx * dx + dy * dy);
    
    float nx = 0.0f;
    float ny = 0.0f;
    if (len > 0.0f) {
        nx = -dy / len;
        ny = dx / len;
    }
    
    const float distance = thicknessPx + LABEL_OFFSET_PX;
    
    WallLabel label;
    label.text = LengthFormat::FormatFeetInches(lengthCm);
    label.centerX = (start.x + end.x) / 2.0f + nx * distance;
    label.centerY = (start.y + end.y) / 2.0f + ny * distance;
    
    const float textW = renderer.MeasureText(label.text, LABEL_FONT_SIZE);
    label.w = textW + 2.0f * LABEL_PADDING_X;
    label.h = LABEL_HEIGHT;
    label.x = label.centerX - label.w / 2.0f;
    label.y = label.centerY - label.h / 2.0f;
    
    if (!hidden) {
        renderer.DrawRect(label.x, label.y, label.w, label.h,
                          LABEL_BACKGROUND_COLOR);
        renderer.DrawText(label.centerX - textW / 2.0f,
                          label.centerY - LABEL_FONT_SIZE / 2.0f,
                          label.text, LABEL_TEXT_COLOR, LABEL_FONT_SIZE);
    }
    return label;
}

} // namespace Planform
