#include "GlRenderer.h"
#include "../Color.h"
#include <glad/gl.h>
#include <cfloat>

namespace Planform {

// Helper: Color to ImGui's packed ABGR
static ImU32 ToU32(const Color& color) {
    return ImGui::ColorConvertFloat4ToU32(
        ImVec4(color.r, color.g, color.b, color.a));
}

GlRenderer::GlRenderer(SDL_Window* window)
    : m_window(window)
    , m_drawList(nullptr)
    , m_originX(0.0f), m_originY(0.0f)
    , m_width(0.0f), m_height(0.0f)
{
    // OpenGL context is created by App, just store the window
}

GlRenderer::~GlRenderer() {
    // Context cleanup handled by App
}

void GlRenderer::BeginCanvas(
    ImDrawList* drawList, float x, float y, float w, float h
) {
    m_drawList = drawList;
    m_originX = x;
    m_originY = y;
    m_width = w;
    m_height = h;
    
    m_drawList->PushClipRect(ImVec2(x, y), ImVec2(x + w, y + h), true);
}

void GlRenderer::EndCanvas() {
    if (m_drawList) {
        m_drawList->PopClipRect();
    }
    m_drawList = nullptr;
}

void GlRenderer::ClearFramebuffer(const Color& color) {
    int w, h;
    SDL_GetWindowSizeInPixels(m_window, &w, &h);
    glViewport(0, 0, w, h);
    glClearColor(color.r, color.g, color.b, color.a);
    glClear(GL_COLOR_BUFFER_BIT);
}

void GlRenderer::Clear(const Color& color) {
    if (!m_drawList) return;
    m_drawList->AddRectFilled(
        ToScreen(0.0f, 0.0f),
        ToScreen(m_width, m_height),
        ToU32(color)
    );
}

void GlRenderer::DrawRect(
    float x, float y, float w, float h, 
    const Color& color
) {
    if (!m_drawList) return;
    m_drawList->AddRectFilled(
        ToScreen(x, y),
        ToScreen(x + w, y + h),
        ToU32(color)
    );
}

void GlRenderer::DrawRectOutline(
    float x, float y, float w, float h, 
    const Color& color, float thickness
) {
    if (!m_drawList) return;
    m_drawList->AddRect(
        ToScreen(x, y),
        ToScreen(x + w, y + h),
        ToU32(color),
        0.0f,  // No rounding
        0,     // No corner flags
        thickness
    );
}

void GlRenderer::DrawLine(
    float x1, float y1, float x2, float y2,
    const Color& color, float thickness
) {
    if (!m_drawList) return;
    const ImU32 col = ToU32(color);
    const ImVec2 a = ToScreen(x1, y1);
    const ImVec2 b = ToScreen(x2, y2);
    m_drawList->AddLine(a, b, col, thickness);
    
    // Round caps so thick walls meet cleanly at corners
    if (thickness > 2.0f) {
        m_drawList->AddCircleFilled(a, thickness * 0.5f, col);
        m_drawList->AddCircleFilled(b, thickness * 0.5f, col);
    }
}

void GlRenderer::DrawCircle(
    float cx, float cy, float radius,
    const Color& color
) {
    if (!m_drawList) return;
    m_drawList->AddCircleFilled(ToScreen(cx, cy), radius, ToU32(color));
}

void GlRenderer::DrawPolygonFilled(
    const std::vector<Point2D>& points,
    const Color& color
) {
    if (!m_drawList || points.size() < 3) return;
    
    ImVector<ImVec2> screen;
    screen.reserve(static_cast<int>(points.size()));
    for (const auto& p : points) {
        screen.push_back(ToScreen(p.x, p.y));
    }
    m_drawList->AddConcavePolyFilled(screen.Data, screen.Size, ToU32(color));
}

void GlRenderer::DrawText(
    float x, float y, const std::string& text,
    const Color& color, float fontSize
) {
    if (!m_drawList) return;
    m_drawList->AddText(
        ImGui::GetFont(), fontSize,
        ToScreen(x, y), ToU32(color),
        text.c_str()
    );
}

float GlRenderer::MeasureText(const std::string& text, float fontSize) const {
    return ImGui::GetFont()->CalcTextSizeA(
        fontSize, FLT_MAX, 0.0f, text.c_str()).x;
}

} // namespace Planform
