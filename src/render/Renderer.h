#pragma once

#include "../Geometry.h"
#include <string>
#include <vector>

namespace Planform {

struct Color;

/**
 * Abstract 2D renderer interface.
 * Provides simple primitives for drawing the floor plan canvas. All
 * coordinates are device pixels relative to the canvas' top-left corner.
 */
class IRenderer {
public:
    virtual ~IRenderer() = default;
    
    /**
     * Fill the whole canvas.
     * @param color Background color
     */
    virtual void Clear(const Color& color) = 0;
    
    /**
     * Draw a filled rectangle.
     * @param x, y Top-left corner
     * @param w, h Width and height
     * @param color Fill color
     */
    virtual void DrawRect(
        float x, float y, float w, float h, 
        const Color& color
    ) = 0;
    
    /**
     * Draw a rectangle outline.
     * @param x, y Top-left corner
     * @param w, h Width and height
     * @param color Line color
     * @param thickness Line thickness in pixels
     */
    virtual void DrawRectOutline(
        float x, float y, float w, float h, 
        const Color& color, float thickness = 1.0f
    ) = 0;
    
    /**
     * Draw a line with round caps.
     * @param x1, y1 Start point
     * @param x2, y2 End point
     * @param color Line color
     * @param thickness Line thickness in pixels
     */
    virtual void DrawLine(
        float x1, float y1, float x2, float y2,
        const Color& color, float thickness = 1.0f
    ) = 0;
    
    /**
     * Draw a filled circle.
     * @param cx, cy Center
     * @param radius Radius in pixels
     * @param color Fill color
     */
    virtual void DrawCircle(
        float cx, float cy, float radius,
        const Color& color
    ) = 0;
    
    /**
     * Fill a simple polygon (may be concave).
     * @param points Vertices in order
     * @param color Fill color
     */
    virtual void DrawPolygonFilled(
        const std::vector<Point2D>& points,
        const Color& color
    ) = 0;
    
    /**
     * Draw a single line of text.
     * @param x, y Top-left of the text box
     * @param text UTF-8 text
     * @param color Text color
     * @param fontSize Font size in pixels
     */
    virtual void DrawText(
        float x, float y, const std::string& text,
        const Color& color, float fontSize
    ) = 0;
    
    /**
     * Measure the width of a single line of text.
     * @param text UTF-8 text
     * @param fontSize Font size in pixels
     * @return Width in pixels
     */
    virtual float MeasureText(
        const std::string& text, float fontSize
    ) const = 0;
};

} // namespace Planform
