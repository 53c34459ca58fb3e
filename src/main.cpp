// Enable SDL3 main callbacks - SDL owns the event loop
#define SDL_MAIN_USE_CALLBACKS 1

#include "App.h"
#include <SDL3/SDL.h>
#include <SDL3/SDL_main.h>
#include <string>

// Global app instance (stored in appstate)
static Planform::App* g_app = nullptr;

/**
 * SDL3 callback: Application initialization.
 * Called once at startup before any other callbacks.
 * Usage: planform [document.json]
 */
SDL_AppResult SDL_AppInit(void** appstate, int argc, char* argv[]) {
    std::string documentPath;
    if (argc > 1) {
        documentPath = argv[1];
    }
    
    g_app = new Planform::App();
    
    if (!g_app->Init("Planform", 1280, 720, documentPath)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                     "Failed to initialize application");
        delete g_app;
        g_app = nullptr;
        return SDL_APP_FAILURE;
    }
    
    *appstate = g_app;
    return SDL_APP_CONTINUE;
}

/**
 * SDL3 callback: Per-frame iteration.
 * Called repeatedly by SDL, including during live window resize on macOS.
 */
SDL_AppResult SDL_AppIterate(void* appstate) {
    Planform::App* app = static_cast<Planform::App*>(appstate);
    return app->Iterate();
}

/**
 * SDL3 callback: Event handling.
 * Called for each SDL event before the next iteration.
 */
SDL_AppResult SDL_AppEvent(void* appstate, SDL_Event* event) {
    Planform::App* app = static_cast<Planform::App*>(appstate);
    return app->HandleEvent(event);
}

/**
 * SDL3 callback: Application shutdown.
 * Called once when the app is terminating.
 */
void SDL_AppQuit(void* appstate, SDL_AppResult result) {
    (void)result;
    
    if (appstate) {
        Planform::App* app = static_cast<Planform::App*>(appstate);
        app->Shutdown();
        delete app;
    }
    
    g_app = nullptr;
}
