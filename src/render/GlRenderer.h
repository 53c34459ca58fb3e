#pragma once

#include "Renderer.h"
#include <SDL3/SDL.h>
#include <imgui.h>

namespace Planform {

/**
 * OpenGL 3.3 renderer implementation.
 * Uses immediate-mode style API backed by ImGui's draw list for simplicity:
 * canvas primitives are queued into the canvas panel's draw list and
 * rasterized by the ImGui OpenGL backend at the end of the frame.
 */
class GlRenderer : public IRenderer {
public:
    explicit GlRenderer(SDL_Window* window);
    ~GlRenderer() override;
    
    /**
     * Route subsequent primitives into a canvas region.
     * @param drawList Draw list of the window hosting the canvas
     * @param x, y Screen position of the canvas' top-left corner
     * @param w, h Canvas size in pixels (used for clipping and Clear)
     */
    void BeginCanvas(ImDrawList* drawList, float x, float y, float w, float h);
    void EndCanvas();
    
    // Clear the default framebuffer before ImGui renders
    void ClearFramebuffer(const Color& color);
    
    void Clear(const Color& color) override;
    void DrawRect(
        float x, float y, float w, float h, 
        const Color& color
    ) override;
    void DrawRectOutline(
        float x, float y, float w, float h, 
        const Color& color, float thickness
    ) override;
    void DrawLine(
        float x1, float y1, float x2, float y2,
        const Color& color, float thickness
    ) override;
    void DrawCircle(
        float cx, float cy, float radius,
        const Color& color
    ) override;
    void DrawPolygonFilled(
        const std::vector<Point2D>& points,
        const Color& color
    ) override;
    void DrawText(
        float x, float y, const std::string& text,
        const Color& color, float fontSize
    ) override;
    float MeasureText(const std::string& text, float fontSize) const override;

    
private:
    ImVec2 ToScreen(float x, float y) const {
        return ImVec2(m_originX + x, m_originY + y);
    }
    
    SDL_Window* m_window;
    ImDrawList* m_drawList;  // Non-owning, valid between Begin/EndCanvas
    float m_originX, m_originY;
    float m_width, m_height;
};

} // namespace Planform
