#pragma once

#include <string>

namespace Planform {

class App;
class Editor;
class GlRenderer;
class Model;

/**
 * Canvas panel renderer and input handler.
 * Hosts the mode toolbar and the editing canvas, translating ImGui mouse
 * and keyboard state into Editor events.
 */
class CanvasPanel {
public:
    CanvasPanel();
    
    /**
     * Render the panel and forward this frame's input.
     * @param app Application (file operations)
     * @param renderer Renderer for drawing
     * @param editor Editor receiving input
     * @param model Current model (toolbar statistics)
     */
    void Render(App& app, GlRenderer& renderer, Editor& editor, Model& model);
    
private:
    void RenderToolbar(App& app, Editor& editor, Model& model);
    void RenderCanvas(GlRenderer& renderer, Editor& editor);
    void RenderLengthEditor(Editor& editor, float canvasX, float canvasY);
    
    // Last canvas size reported to the editor
    int m_canvasWidth;
    int m_canvasHeight;
    
    // Last pointer position forwarded (canvas-relative)
    float m_lastMouseX;
    float m_lastMouseY;
    
    // Double-click consumed by the length editor; its release is dropped
    bool m_swallowRelease;
    
    // Inline length edit buffer, seeded when a new edit opens
    char m_editBuffer[64];
    std::string m_bufferWallId;
};

} // namespace Planform
