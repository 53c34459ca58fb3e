#pragma once

#include "Canvas.h"
#include "DrawingState.h"
#include "HitTest.h"
#include <string>

namespace Planform {

class IRenderer;
class Model;
class Viewport;
class Preferences;

/**
 * Editor routes pointer and keyboard input to the document according to
 * the current mode and owns the interaction state the canvas draws.
 *
 * All coordinates are device pixels relative to the canvas' top-left
 * corner. Every handler runs synchronously; any handler that changes what
 * is on screen raises the needs-render flag, which Render() clears.
 */
class Editor {
public:
    // Pointer travel (device px) before a press becomes a drag
    static constexpr float DRAG_THRESHOLD_PX = 3.0f;

    Editor(Model& model, Viewport& viewport, const Preferences& prefs);

    // Mode
    EditorMode GetMode() const { return m_mode; }

    /**
     * Switch modes. Leaving draw mode abandons the pending chain.
     */
    void SetMode(EditorMode mode);

    // Pointer input
    void OnPointerDown(float deviceX, float deviceY);
    void OnPointerMove(float deviceX, float deviceY);
    void OnPointerUp(float deviceX, float deviceY);

    /**
     * Zoom around the cursor (any mode).
     * @param wheelDelta > 0 zooms out, otherwise zooms in
     */
    void OnWheel(float wheelDelta, float deviceX, float deviceY);

    /**
     * Open the inline length editor if a wall label is under the cursor.
     * Ignored in draw mode, where the clicks belong to the drawing.
     * @return true if an edit was started
     */
    bool OnDoubleClick(float deviceX, float deviceY);

    // Abort drawing and any length edit, then return to move mode
    void OnEscape();

    void OnResize(int width, int height);

    // Inline length editing
    bool BeginLengthEdit(const std::string& wallId);
    bool IsEditingLength() const { return !m_editWallId.empty(); }
    const std::string& GetEditWallId() const { return m_editWallId; }
    const std::string& GetEditText() const { return m_editText; }
    void SetEditText(const std::string& text) { m_editText = text; }

    // Device position of the edited label's center
    Point2D GetEditAnchor() const { return m_editAnchor; }

    /**
     * Apply the edit text as the wall's new length and close the editor.
     * Unparsable text or lengths under Model::MIN_WALL_LENGTH are
     * discarded without touching the document.
     * @return true if the wall was resized
     */
    bool CommitLengthEdit();
    void CancelLengthEdit();

    // Interaction state
    const std::string& GetHoveredCorner() const { return m_hoveredCorner; }
    const std::string& GetHoveredWall() const { return m_hoveredWall; }
    const std::string& GetSelectedWall() const { return m_selectedWall; }
    const DrawingState& GetDrawingState() const { return m_drawing; }
    bool IsPointerDown() const { return m_pointerDown; }

    // Rendering
    void Render(IRenderer& renderer);
    bool NeedsRender() const { return m_needsRender; }
    void RequestRender() { m_needsRender = true; }

private:
    enum class DragTarget { None, Corner, Wall, Pan };

    float WallTolerancePx() const;
    void UpdateHover(const Point2D& world);
    void DeleteAt(const Point2D& world);

    Model& m_model;
    Viewport& m_viewport;
    const Preferences& m_prefs;
    HitTester m_hitTester;
    DrawingState m_drawing;
    Canvas m_canvas;

    EditorMode m_mode;

    // Pointer state
    bool m_pointerDown;
    bool m_dragging;
    float m_pressX, m_pressY;
    float m_lastX, m_lastY;
    DragTarget m_dragTarget;
    std::string m_dragId;

    std::string m_hoveredCorner;
    std::string m_hoveredWall;
    std::string m_selectedWall;

    // Length editing
    std::string m_editWallId;
    std::string m_editText;
    Point2D m_editAnchor;

    bool m_needsRender;
};

} // namespace Planform
