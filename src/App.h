#pragma once

#include "Editor.h"
#include "Model.h"
#include "Preferences.h"
#include "Viewport.h"
#include "UI/CanvasPanel.h"
#include <memory>
#include <string>

#include <SDL3/SDL_events.h>
#include <SDL3/SDL_init.h>

struct SDL_Window;
struct SDL_GLContextState;

struct SDL_WindowDeleter {
    void operator()(SDL_Window* window) const;
};

struct SDL_GLContextDeleter {
    void operator()(SDL_GLContextState* context) const;
};

namespace Planform {

class GlRenderer;

/**
 * Window shell around one floor plan document: owns the GL window, the
 * model and its editor, and drives them from the SDL main callbacks.
 */
class App {
public:
    App();
    ~App();
    
    /**
     * Initialize the application.
     * @param title Window title
     * @param width Window width
     * @param height Window height
     * @param documentPath Document to open (empty for a new document)
     * @return true on success
     */
    bool Init(const std::string& title, int width, int height,
              const std::string& documentPath);
    
    /**
     * Per-frame iteration (called by SDL3 main callbacks).
     * @return SDL_APP_CONTINUE to keep running, SDL_APP_SUCCESS to quit
     */
    SDL_AppResult Iterate();
    
    /**
     * Handle a single SDL event (called by SDL3 main callbacks).
     * @param event The SDL event to process
     * @return SDL_APP_CONTINUE to keep running, SDL_APP_SUCCESS to quit
     */
    SDL_AppResult HandleEvent(SDL_Event* event);
    
    void Shutdown();
    
    // Failures are reported through the status message
    void NewDocument();
    bool OpenDocument(const std::string& path);
    bool SaveDocument();
    
    // Last load/save result, shown in the toolbar
    const std::string& GetStatusMessage() const { return m_statusMessage; }
    
private:
    void Render();
    void UpdateWindowTitle();
    
    void SetupImGui();
    void ShutdownImGui();
    
    std::unique_ptr<SDL_Window, SDL_WindowDeleter> m_window;
    std::unique_ptr<SDL_GLContextState, SDL_GLContextDeleter> m_glContext;
    
    // Core systems (declaration order matters: Editor references the rest)
    std::unique_ptr<GlRenderer> m_renderer;
    Preferences m_prefs;
    Model m_model;
    Viewport m_viewport;
    Editor m_editor;
    CanvasPanel m_canvasPanel;
    
    // Application state
    bool m_running;
    std::string m_documentPath;
    std::string m_statusMessage;
    bool m_lastDirtyState;
};

} // namespace Planform
