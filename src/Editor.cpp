#include "Editor.h"
#include "LengthFormat.h"
#include "Model.h"
#include "Preferences.h"
#include "Viewport.h"
#include <SDL3/SDL_log.h>
#include <algorithm>
#include <cmath>

namespace Planform {

Editor::Editor(Model& model, Viewport& viewport, const Preferences& prefs)
    : m_model(model)
    , m_viewport(viewport)
    , m_prefs(prefs)
    , m_hitTester(model, viewport)
    , m_drawing(model, viewport, prefs)
    , m_mode(EditorMode::Move)
    , m_pointerDown(false)
    , m_dragging(false)
    , m_pressX(0.0f), m_pressY(0.0f)
    , m_lastX(0.0f), m_lastY(0.0f)
    , m_dragTarget(DragTarget::None)
    , m_needsRender(true)
{
}

void Editor::SetMode(EditorMode mode) {
    if (m_mode == EditorMode::Draw && mode != EditorMode::Draw) {
        m_drawing.Reset();
    }
    m_mode = mode;
    m_needsRender = true;
}

// ============================================================================
// Pointer input
// ============================================================================

void Editor::OnPointerDown(float deviceX, float deviceY) {
    const Point2D world = m_viewport.WorldFromDevice(deviceX, deviceY);
    
    m_pointerDown = true;
    m_dragging = false;
    m_pressX = m_lastX = deviceX;
    m_pressY = m_lastY = deviceY;
    m_dragId.clear();
    
    HitResult hit = m_hitTester.HitAt(
        world.x, world.y, m_prefs.snapTolerance, WallTolerancePx());
    m_selectedWall = hit.IsWall() ? hit.id : std::string();
    
    // A press on empty space pans once it turns into a drag
    m_dragTarget = hit.IsNone() ? DragTarget::Pan : DragTarget::None;
    
    switch (m_mode) {
        case EditorMode::Move:
            if (hit.IsCorner()) {
                m_dragTarget = DragTarget::Corner;
                m_dragId = hit.id;
            } else if (hit.IsWall()) {
                m_dragTarget = DragTarget::Wall;
                m_dragId = hit.id;
            }
            break;
        case EditorMode::Delete:
            DeleteAt(world);
            break;
        case EditorMode::Draw:
            m_drawing.UpdateTarget(world);
            break;
    }
    
    m_needsRender = true;
}

void Editor::OnPointerMove(float deviceX, float deviceY) {
    if (m_pointerDown) {
        if (!m_dragging &&
            std::hypot(deviceX - m_pressX, deviceY - m_pressY) >
                DRAG_THRESHOLD_PX) {
            m_dragging = true;
        }
        
        if (m_dragging) {
            const float ddx = deviceX - m_lastX;
            const float ddy = deviceY - m_lastY;
            const Point2D world = m_viewport.WorldFromDevice(deviceX, deviceY);
            
            switch (m_dragTarget) {
                case DragTarget::Corner:
                    m_model.MoveCorner(m_dragId, world.x, world.y);
                    break;
                case DragTarget::Wall:
                    m_model.TranslateWall(
                        m_dragId,
                        ddx * m_viewport.GetCmPerPixel(),
                        ddy * m_viewport.GetCmPerPixel());
                    break;
                case DragTarget::Pan:
                    m_viewport.Pan(ddx, ddy);
                    break;
                case DragTarget::None:
                    break;
            }
            
            m_lastX = deviceX;
            m_lastY = deviceY;
            m_needsRender = true;
        }
    } else {
        UpdateHover(m_viewport.WorldFromDevice(deviceX, deviceY));
    }
    
    if (m_mode == EditorMode::Draw) {
        m_drawing.UpdateTarget(m_viewport.WorldFromDevice(deviceX, deviceY));
        m_needsRender = true;
    }
}

void Editor::OnPointerUp(float deviceX, float deviceY) {
    if (!m_pointerDown) {
        return;
    }
    
    const Point2D world = m_viewport.WorldFromDevice(deviceX, deviceY);
    
    // A drag never commits a point
    if (m_mode == EditorMode::Draw && !m_dragging) {
        m_drawing.UpdateTarget(world);
        if (m_drawing.Click() == DrawOutcome::Closed) {
            SDL_Log("Room closed (%zu room(s) detected)",
                    m_model.GetRooms().size());
            SetMode(EditorMode::Move);
        }
    }
    
    m_pointerDown = false;
    m_dragging = false;
    m_dragTarget = DragTarget::None;
    m_dragId.clear();
    
    UpdateHover(world);
    m_needsRender = true;
}

void Editor::OnWheel(float wheelDelta, float deviceX, float deviceY) {
    m_viewport.ZoomAt(wheelDelta, deviceX, deviceY);
    
    // Grid spacing in world units changed with the zoom
    if (m_mode == EditorMode::Draw) {
        m_drawing.UpdateTarget(m_viewport.WorldFromDevice(deviceX, deviceY));
    }
    m_needsRender = true;
}

bool Editor::OnDoubleClick(float deviceX, float deviceY) {
    if (m_mode == EditorMode::Draw) {
        return false;
    }
    
    const WallLabel* label = m_canvas.FindLabelAt(deviceX, deviceY);
    if (!label) {
        return false;
    }
    return BeginLengthEdit(label->wallId);
}

void Editor::OnEscape() {
    CancelLengthEdit();
    m_drawing.Reset();
    SetMode(EditorMode::Move);
}

void Editor::OnResize(int width, int height) {
    m_viewport.SetDeviceSize(width, height);
    m_needsRender = true;
}

// ============================================================================
// Inline length editing
// ============================================================================

bool Editor::BeginLengthEdit(const std::string& wallId) {
    if (!m_model.FindWall(wallId)) {
        return false;
    }
    
    m_editWallId = wallId;
    m_editText = LengthFormat::FormatFeetInches(m_model.WallLength(wallId));
    
    if (const WallLabel* label = m_canvas.FindLabel(wallId)) {
        m_editAnchor = Point2D(label->centerX, label->centerY);
    } else if (auto center = m_model.WallCenter(wallId)) {
        m_editAnchor = m_viewport.DeviceFromWorld(*center);
    }
    
    m_needsRender = true;
    return true;
}

bool Editor::CommitLengthEdit() {
    if (!IsEditingLength()) {
        return false;
    }
    
    const std::string wallId = m_editWallId;
    const std::optional<float> lengthCm =
        LengthFormat::ParseFeetInches(m_editText);
    CancelLengthEdit();
    
    if (!lengthCm || *lengthCm < Model::MIN_WALL_LENGTH) {
        return false;
    }
    return m_model.SetWallLength(wallId, *lengthCm);
}

void Editor::CancelLengthEdit() {
    m_editWallId.clear();
    m_editText.clear();
    m_needsRender = true;
}

// ============================================================================
// Rendering
// ============================================================================

void Editor::Render(IRenderer& renderer) {
    CanvasState state;
    state.mode = m_mode;
    state.hoveredCorner = m_hoveredCorner;
    state.hoveredWall = m_hoveredWall;
    state.selectedWall = m_selectedWall;
    state.editingWall = m_editWallId;
    state.gridSize = m_prefs.gridSize;
    state.drawTarget = m_drawing.GetTarget();
    state.previewThickness = m_prefs.wallThickness;
    
    if (const Corner* last = m_model.FindCorner(m_drawing.GetLastNode())) {
        state.drawPending = true;
        state.drawLastNode = last->Position();
    }
    
    m_canvas.Render(renderer, m_model, m_viewport, state);
    m_needsRender = false;
}

// ============================================================================
// Helpers
// ============================================================================

float Editor::WallTolerancePx() const {
    // Move mode picks walls by their highlighted stroke
    if (m_mode == EditorMode::Move) {
        return std::max(HitTester::MOVE_WALL_TOLERANCE_PX,
                        2.0f * Canvas::WALL_WIDTH_HOVER);
    }
    return m_prefs.snapTolerance;
}

void Editor::UpdateHover(const Point2D& world) {
    std::string corner;
    std::string wall;
    
    HitResult hit = m_hitTester.HitAt(
        world.x, world.y, m_prefs.snapTolerance, WallTolerancePx());
    if (hit.IsCorner()) {
        corner = hit.id;
    } else if (hit.IsWall()) {
        wall = hit.id;
    }
    
    if (corner != m_hoveredCorner || wall != m_hoveredWall) {
        m_hoveredCorner = corner;
        m_hoveredWall = wall;
        m_needsRender = true;
    }
}

void Editor::DeleteAt(const Point2D& world) {
    HitResult hit = m_hitTester.HitAt(
        world.x, world.y, m_prefs.snapTolerance, WallTolerancePx());
    
    bool removed = false;
    if (hit.IsCorner()) {
        removed = m_model.RemoveCorner(hit.id);
    } else if (hit.IsWall()) {
        removed = m_model.RemoveWall(hit.id);
    }
    if (!removed) {
        return;
    }
    
    // Drop references to anything that no longer exists
    if (!m_model.FindCorner(m_hoveredCorner)) m_hoveredCorner.clear();
    if (!m_model.FindWall(m_hoveredWall)) m_hoveredWall.clear();
    if (!m_model.FindWall(m_selectedWall)) m_selectedWall.clear();
    if (IsEditingLength() && !m_model.FindWall(m_editWallId)) {
        CancelLengthEdit();
    }
    
    m_model.UpdateRooms();
}

} // namespace Planform
