#include "CanvasPanel.h"
#include "../App.h"
#include "../Editor.h"
#include "../Model.h"
#include "../render/GlRenderer.h"
#include <imgui.h>
#include <cstdio>
#include <cstring>

namespace Planform {

namespace {

const float TOOLBAR_HEIGHT = 36.0f;

bool ModeButton(const char* label, bool active) {
    if (active) {
        ImGui::PushStyleColor(ImGuiCol_Button,
            ImGui::GetStyleColorVec4(ImGuiCol_ButtonActive));
    }
    bool pressed = ImGui::Button(label);
    if (active) {
        ImGui::PopStyleColor();
    }
    return pressed;
}

} // namespace

CanvasPanel::CanvasPanel()
    : m_canvasWidth(0)
    , m_canvasHeight(0)
    , m_lastMouseX(-1.0f)
    , m_lastMouseY(-1.0f)
    , m_swallowRelease(false)
{
    m_editBuffer[0] = '\0';
}

void CanvasPanel::Render(
    App& app, GlRenderer& renderer, Editor& editor, Model& model
) {
    // Single window covering the whole viewport
    const ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(viewport->WorkPos);
    ImGui::SetNextWindowSize(viewport->WorkSize);
    
    ImGuiWindowFlags flags = 
        ImGuiWindowFlags_NoMove | 
        ImGuiWindowFlags_NoCollapse |
        ImGuiWindowFlags_NoScrollbar |
        ImGuiWindowFlags_NoResize |
        ImGuiWindowFlags_NoTitleBar |
        ImGuiWindowFlags_NoBringToFrontOnFocus;
    
    ImGui::PushStyleVar(ImGuiStyleVar_WindowPadding, ImVec2(0, 0));
    ImGui::PushStyleVar(ImGuiStyleVar_WindowRounding, 0.0f);
    ImGui::Begin("Planform/Canvas", nullptr, flags);
    ImGui::PopStyleVar(2);
    
    RenderToolbar(app, editor, model);
    RenderCanvas(renderer, editor);
    
    ImGui::End();
}

// ============================================================================
// Toolbar
// ============================================================================

void CanvasPanel::RenderToolbar(App& app, Editor& editor, Model& model) {
    ImGui::BeginChild("##toolbar", ImVec2(0, TOOLBAR_HEIGHT), false,
                      ImGuiWindowFlags_NoScrollbar);
    ImGui::SetCursorPos(ImVec2(8.0f, 6.0f));
    
    EditorMode mode = editor.GetMode();
    if (ModeButton("Move", mode == EditorMode::Move)) {
        editor.SetMode(EditorMode::Move);
    }
    ImGui::SameLine();
    if (ModeButton("Draw", mode == EditorMode::Draw)) {
        editor.SetMode(EditorMode::Draw);
    }
    ImGui::SameLine();
    if (ModeButton("Delete", mode == EditorMode::Delete)) {
        editor.SetMode(EditorMode::Delete);
    }
    
    ImGui::SameLine(0.0f, 24.0f);
    if (ImGui::Button("Detect Rooms")) {
        model.UpdateRooms();
        editor.RequestRender();
    }
    ImGui::SameLine();
    if (ImGui::Button("New")) {
        app.NewDocument();
    }
    ImGui::SameLine();
    if (ImGui::Button("Save")) {
        app.SaveDocument();
    }
    
    ImGui::SameLine(0.0f, 24.0f);
    ImGui::AlignTextToFramePadding();
    ImGui::Text("%zu corners, %zu walls, %zu rooms",
                model.GetCorners().size(),
                model.GetWalls().size(),
                model.GetRooms().size());
    
    if (!app.GetStatusMessage().empty()) {
        ImGui::SameLine(0.0f, 24.0f);
        ImGui::TextDisabled("%s", app.GetStatusMessage().c_str());
    }
    
    ImGui::EndChild();
}

// ============================================================================
// Canvas input and drawing
// ============================================================================

void CanvasPanel::RenderCanvas(GlRenderer& renderer, Editor& editor) {
    ImVec2 canvasPos = ImGui::GetCursorScreenPos();
    ImVec2 canvasSize = ImGui::GetContentRegionAvail();
    if (canvasSize.x < 1.0f || canvasSize.y < 1.0f) {
        return;
    }
    
    int width = static_cast<int>(canvasSize.x);
    int height = static_cast<int>(canvasSize.y);
    if (width != m_canvasWidth || height != m_canvasHeight) {
        m_canvasWidth = width;
        m_canvasHeight = height;
        editor.OnResize(width, height);
    }
    
    // Reserve space for canvas
    ImGui::InvisibleButton("canvas", canvasSize);
    bool hovered = ImGui::IsItemHovered();
    
    ImGuiIO& io = ImGui::GetIO();
    float mouseX = io.MousePos.x - canvasPos.x;
    float mouseY = io.MousePos.y - canvasPos.y;
    
    // Escape works wherever focus is, including the length editor
    if (ImGui::IsKeyPressed(ImGuiKey_Escape)) {
        editor.OnEscape();
        m_bufferWallId.clear();
    }
    
    if (hovered) {
        // Wheel up zooms in
        if (io.MouseWheel != 0.0f) {
            editor.OnWheel(-io.MouseWheel, mouseX, mouseY);
        }
        
        if (ImGui::IsMouseClicked(ImGuiMouseButton_Left)) {
            // Outside draw mode a double-click belongs to the label editor
            bool startedEdit = ImGui::IsMouseDoubleClicked(ImGuiMouseButton_Left) &&
                               editor.OnDoubleClick(mouseX, mouseY);
            if (startedEdit) {
                m_swallowRelease = true;
            } else {
                if (editor.IsEditingLength()) {
                    // Clicking away commits the open edit
                    editor.SetEditText(m_editBuffer);
                    editor.CommitLengthEdit();
                }
                editor.OnPointerDown(mouseX, mouseY);
            }
        }
    }
    
    bool moved = mouseX != m_lastMouseX || mouseY != m_lastMouseY;
    if (moved && ImGui::IsMousePosValid() && (hovered || editor.IsPointerDown())) {
        editor.OnPointerMove(mouseX, mouseY);
    }
    m_lastMouseX = mouseX;
    m_lastMouseY = mouseY;
    
    if (ImGui::IsMouseReleased(ImGuiMouseButton_Left)) {
        if (m_swallowRelease) {
            m_swallowRelease = false;
        } else if (editor.IsPointerDown()) {
            editor.OnPointerUp(mouseX, mouseY);
        }
    }
    
    // ImGui rebuilds draw lists every frame, so the canvas is always redrawn
    ImDrawList* drawList = ImGui::GetWindowDrawList();
    renderer.BeginCanvas(drawList, canvasPos.x, canvasPos.y,
                         canvasSize.x, canvasSize.y);
    editor.Render(renderer);
    renderer.EndCanvas();
    
    if (editor.IsEditingLength()) {
        RenderLengthEditor(editor, canvasPos.x, canvasPos.y);
    } else {
        m_bufferWallId.clear();
    }
}

void CanvasPanel::RenderLengthEditor(
    Editor& editor, float canvasX, float canvasY
) {
    bool opened = m_bufferWallId != editor.GetEditWallId();
    if (opened) {
        m_bufferWallId = editor.GetEditWallId();
        snprintf(m_editBuffer, sizeof(m_editBuffer), "%s",
                 editor.GetEditText().c_str());
    }
    
    Point2D anchor = editor.GetEditAnchor();
    ImGui::SetNextWindowPos(
        ImVec2(canvasX + anchor.x, canvasY + anchor.y),
        ImGuiCond_Always, ImVec2(0.5f, 0.5f));
    
    ImGuiWindowFlags flags =
        ImGuiWindowFlags_NoDecoration |
        ImGuiWindowFlags_AlwaysAutoResize |
        ImGuiWindowFlags_NoSavedSettings;
    
    ImGui::Begin("##lengthEdit", nullptr, flags);
    
    if (opened) {
        ImGui::SetKeyboardFocusHere();
    }
    ImGui::SetNextItemWidth(90.0f);
    bool entered = ImGui::InputText(
        "##length", m_editBuffer, sizeof(m_editBuffer),
        ImGuiInputTextFlags_EnterReturnsTrue | 
        ImGuiInputTextFlags_AutoSelectAll);
    bool blurred = ImGui::IsItemDeactivated() &&
                   !ImGui::IsKeyPressed(ImGuiKey_Escape);
    
    ImGui::End();
    
    if (entered || (blurred && !opened)) {
        editor.SetEditText(m_editBuffer);
        editor.CommitLengthEdit();
        m_bufferWallId.clear();
    }
}

} // namespace Planform
