#pragma once

#include "Color.h"
#include "Geometry.h"
#include <string>
#include <vector>

namespace Planform {

class IRenderer;
class Model;
class Viewport;
struct Wall;

/**
 * Editor interaction modes.
 */
enum class EditorMode {
    Move,    // Drag corners/walls, pan on empty space
    Draw,    // Click to place corners and walls
    Delete   // Click a corner or wall to remove it
};

/**
 * Per-frame interaction state the canvas needs to draw highlights and the
 * drawing preview.
 */
struct CanvasState {
    EditorMode mode = EditorMode::Move;
    std::string hoveredCorner;
    std::string hoveredWall;
    std::string selectedWall;
    std::string editingWall;         // Label hidden while being edited
    float gridSize = 20.0f;          // Device px at zoom 1

    // Draw-mode preview
    bool drawPending = false;
    Point2D drawLastNode;            // World cm
    Point2D drawTarget;              // World cm
    float previewThickness = 10.0f;  // World cm
};

/**
 * Placement of a wall's length label in device pixels (recorded during the
 * last Render() so double-clicks can be matched against it).
 */
struct WallLabel {
    std::string wallId;
    std::string text;
    float centerX = 0.0f;
    float centerY = 0.0f;
    float x = 0.0f;       // Background box
    float y = 0.0f;
    float w = 0.0f;
    float h = 0.0f;

    bool Contains(float px, float py) const {
        return px >= x && px <= x + w && py >= y && py <= y + h;
    }
};

/**
 * Canvas draws the floor plan through an IRenderer: grid, rooms, walls
 * with their length labels, hovered corners and the draw-mode preview.
 */
class Canvas {
public:
    // Label styling
    static constexpr float LABEL_FONT_SIZE = 15.0f;
    static constexpr float LABEL_OFFSET_PX = 16.0f;  // Beyond wall thickness
    static constexpr float LABEL_PADDING_X = 6.0f;
    static constexpr float LABEL_HEIGHT = 26.0f;

    static constexpr float CORNER_RADIUS_HOVER = 7.0f;
    static constexpr float WALL_WIDTH_HOVER = 7.0f;
    static constexpr float MIN_GRID_SPACING_PX = 5.0f;

    // Palette
    static const Color BACKGROUND_COLOR;
    static const Color GRID_COLOR;
    static const Color WALL_COLOR;
    static const Color WALL_HOVER_COLOR;
    static const Color WALL_SELECTED_COLOR;
    static const Color DELETE_COLOR;
    static const Color WALL_EDGE_COLOR;
    static const Color WALL_SHADOW_COLOR;
    static const Color ROOM_FILL_COLOR;
    static const Color LABEL_BACKGROUND_COLOR;
    static const Color LABEL_TEXT_COLOR;

    Canvas();

    /**
     * Draw the whole canvas.
     * @param renderer Drawing backend
     * @param model Document to draw
     * @param viewport Current pan/zoom (its device size bounds the grid)
     * @param state Hover/selection/preview state
     */
    void Render(
        IRenderer& renderer,
        const Model& model,
        const Viewport& viewport,
        const CanvasState& state
    );

    // Labels laid out by the last Render()
    const std::vector<WallLabel>& GetLabels() const { return m_labels; }
    const WallLabel* FindLabelAt(float deviceX, float deviceY) const;
    const WallLabel* FindLabel(const std::string& wallId) const;

private:
    // Render passes
    void RenderGrid(IRenderer& renderer, const Viewport& viewport,
                    float gridSize);
    void RenderRooms(IRenderer& renderer, const Model& model,
                     const Viewport& viewport);
    void RenderWalls(IRenderer& renderer, const Model& model,
                     const Viewport& viewport, const CanvasState& state);
    void RenderCorners(IRenderer& renderer, const Model& model,
                       const Viewport& viewport, const CanvasState& state);
    void RenderPreview(IRenderer& renderer, const Viewport& viewport,
                       const CanvasState& state);

    /**
     * Lay out and (unless hidden) draw a length label beside a segment.
     * @param start, end Segment endpoints in device px
     * @param thicknessPx Wall thickness in device px
     * @param lengthCm Length shown on the label
     * @return Label placement (wallId left empty)
     */
    WallLabel DrawLengthLabel(
        IRenderer& renderer,
        const Point2D& start, const Point2D& end,
        float thicknessPx, float lengthCm, bool hidden
    );

    std::vector<WallLabel> m_labels;
};

} // namespace Planform
