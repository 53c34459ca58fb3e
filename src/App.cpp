#include "App.h"
#include "render/GlRenderer.h"
#include "platform/Fs.h"
#include "IOJson.h"
#include <glad/gl.h>
#include <SDL3/SDL.h>
#include <imgui.h>
#include <imgui_impl_sdl3.h>
#include <imgui_impl_opengl3.h>

void SDL_WindowDeleter::operator()(SDL_Window* window) const {
    if (window) {
        SDL_DestroyWindow(window);
    }
}

void SDL_GLContextDeleter::operator()(SDL_GLContextState* context) const {
    if (context) {
        SDL_GL_DestroyContext(context);
    }
}

namespace Planform {

App::App()
    : m_editor(m_model, m_viewport, m_prefs)
    , m_running(false)
    , m_lastDirtyState(false)
{
}

App::~App() {
    Shutdown();
}

bool App::Init(
    const std::string& title, int width, int height,
    const std::string& documentPath
) {
    if (!SDL_Init(SDL_INIT_VIDEO)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                     "SDL_Init failed: %s", SDL_GetError());
        return false;
    }
    
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, 
        SDL_GL_CONTEXT_PROFILE_CORE);
    SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);
    
    m_window.reset(SDL_CreateWindow(
        title.c_str(),
        width, height,
        SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE | SDL_WINDOW_HIGH_PIXEL_DENSITY
    ));
    
    if (!m_window) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                     "SDL_CreateWindow failed: %s", SDL_GetError());
        return false;
    }
    
    m_glContext.reset(SDL_GL_CreateContext(m_window.get()));
    if (!m_glContext) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                     "SDL_GL_CreateContext failed: %s", SDL_GetError());
        return false;
    }
    
    SDL_GL_MakeCurrent(m_window.get(), m_glContext.get());
    SDL_GL_SetSwapInterval(1);
    
    if (gladLoadGL((GLADloadfunc)SDL_GL_GetProcAddress) == 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                     "Could not load OpenGL entry points");
        return false;
    }
    
    m_renderer = std::make_unique<GlRenderer>(m_window.get());
    
    SetupImGui();
    
    // Load user preferences; write defaults on first run so they can be
    // edited by hand
    std::string prefsPath = Preferences::GetDefaultPath();
    if (!m_prefs.LoadFromFile(prefsPath) && !Platform::FileExists(prefsPath)) {
        m_prefs.SaveToFile(prefsPath);
    }
    
    m_running = true;
    
    if (!documentPath.empty()) {
        if (Platform::FileExists(documentPath)) {
            OpenDocument(documentPath);
        } else {
            // New document that Save will create
            m_documentPath = documentPath;
            SDL_Log("Starting new document at %s", documentPath.c_str());
        }
    }
    
    UpdateWindowTitle();
    return true;
}

SDL_AppResult App::Iterate() {
    if (!m_running) {
        return SDL_APP_SUCCESS;
    }
    
    // Title carries a '*' while there are unsaved edits
    if (m_model.dirty != m_lastDirtyState) {
        m_lastDirtyState = m_model.dirty;
        UpdateWindowTitle();
    }
    
    Render();
    return SDL_APP_CONTINUE;
}

SDL_AppResult App::HandleEvent(SDL_Event* event) {
    ImGui_ImplSDL3_ProcessEvent(event);
    
    switch (event->type) {
        case SDL_EVENT_QUIT:
        case SDL_EVENT_WINDOW_CLOSE_REQUESTED:
            m_running = false;
            break;
    }
    
    return m_running ? SDL_APP_CONTINUE : SDL_APP_SUCCESS;
}

void App::Shutdown() {
    if (!m_window) return;
    
    if (m_model.dirty) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "Exiting with unsaved changes");
    }
    
    // Init may have failed before ImGui was set up
    if (ImGui::GetCurrentContext()) {
        ShutdownImGui();
    }
    m_renderer.reset();
    m_glContext.reset();
    m_window.reset();
    
    SDL_Quit();
}

void App::NewDocument() {
    m_model.Reset();
    m_editor.OnEscape();
    m_documentPath.clear();
    m_statusMessage = "New document";
    UpdateWindowTitle();
}

bool App::OpenDocument(const std::string& path) {
    std::string error;
    if (!IOJson::LoadFromFile(path, m_model, error)) {
        // Model is untouched on failure
        m_statusMessage = "Open failed: " + error;
        return false;
    }
    
    // Pending drawing state refers to the old document
    m_editor.OnEscape();
    m_documentPath = path;
    m_statusMessage = "Opened " + path;
    UpdateWindowTitle();
    return true;
}

bool App::SaveDocument() {
    if (m_documentPath.empty()) {
        m_statusMessage = "No document path (pass one on the command line)";
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "%s",
                    m_statusMessage.c_str());
        return false;
    }
    
    std::string error;
    if (!IOJson::SaveToFile(m_model, m_documentPath, error)) {
        m_statusMessage = "Save failed: " + error;
        return false;
    }
    
    m_model.ClearDirty();
    m_statusMessage = "Saved " + m_documentPath;
    UpdateWindowTitle();
    return true;
}

void App::UpdateWindowTitle() {
    if (!m_window) return;
    
    std::string name = "Untitled";
    if (!m_documentPath.empty()) {
        size_t lastSlash = m_documentPath.find_last_of("/\\");
        name = (lastSlash != std::string::npos)
            ? m_documentPath.substr(lastSlash + 1)
            : m_documentPath;
    }
    
    std::string title = name + " - Planform";
    if (m_model.dirty) {
        title = "*" + title;
    }
    SDL_SetWindowTitle(m_window.get(), title.c_str());
}

void App::Render() {
    ImGui_ImplOpenGL3_NewFrame();
    ImGui_ImplSDL3_NewFrame();
    ImGui::NewFrame();
    
    m_renderer->ClearFramebuffer(Color(0.1f, 0.1f, 0.12f, 1.0f));
    
    m_canvasPanel.Render(*this, *m_renderer, m_editor, m_model);
    
    ImGui::Render();
    ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
    SDL_GL_SwapWindow(m_window.get());
}

void App::SetupImGui() {
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.IniFilename = nullptr;  // Fixed layout, nothing to persist
    
    ImGui_ImplSDL3_InitForOpenGL(m_window.get(), m_glContext.get());
    ImGui_ImplOpenGL3_Init("#version 330");
    
    ImGui::StyleColorsLight();
}

void App::ShutdownImGui() {
    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplSDL3_Shutdown();
    ImGui::DestroyContext();
}

} // namespace Planform
