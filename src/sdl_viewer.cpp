#include "sdl_viewer.hpp"
#include "log.hpp"

#include "imgui_impl_sdl2.h"
#include "imgui_impl_opengl3.h"

#include <algorithm>
#include <cstdio>

static const float STATUS_HEIGHT = 48.0f;

// ---------------------------------------------------------------------------
// Window setup: SDL2 + GL 3.3 core + Dear ImGui
// ---------------------------------------------------------------------------
std::string SdlViewer::open(int image_w, int image_h)
{
    if (SDL_Init(SDL_INIT_VIDEO) != 0)
        return std::string("SDL_Init error: ") + SDL_GetError();

    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);

    // Start at the image size, within sane bounds; the image is scaled to fit
    const int win_w = std::max(320, std::min(image_w, 1600));
    const int win_h = std::max(240, std::min(image_h, 1000))
                    + static_cast<int>(STATUS_HEIGHT);

    window = SDL_CreateWindow(
        "Swatch Viewer",
        SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
        win_w, win_h,
        SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE
    );
    if (!window) {
        std::string err = std::string("SDL_CreateWindow error: ") + SDL_GetError();
        SDL_Quit();
        return err;
    }

    gl_context = SDL_GL_CreateContext(window);
    if (!gl_context) {
        std::string err = std::string("SDL_GL_CreateContext error: ") + SDL_GetError();
        SDL_DestroyWindow(window);
        window = nullptr;
        SDL_Quit();
        return err;
    }
    SDL_GL_MakeCurrent(window, gl_context);
    SDL_GL_SetSwapInterval(1);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::GetIO().IniFilename = nullptr;
    ImGui::StyleColorsDark();
    ImGuiStyle& style      = ImGui::GetStyle();
    style.WindowBorderSize = 0.0f;
    style.WindowPadding    = ImVec2(8.0f, 6.0f);

    ImGui_ImplSDL2_InitForOpenGL(window, gl_context);
    ImGui_ImplOpenGL3_Init("#version 330");
    imgui_up = true;

    LOG_DEBUG("viewer window %dx%d opened", win_w, win_h);
    return {};  // success
}

void SdlViewer::close()
{
    if (imgui_up) {
        tex.release();
        ImGui_ImplOpenGL3_Shutdown();
        ImGui_ImplSDL2_Shutdown();
        ImGui::DestroyContext();
        imgui_up = false;
    }
    if (gl_context) {
        SDL_GL_DeleteContext(gl_context);
        gl_context = nullptr;
    }
    if (window) {
        SDL_DestroyWindow(window);
        window = nullptr;
        SDL_Quit();
    }
}

// ---------------------------------------------------------------------------
// show: upload once, redraw until a decisive key arrives
// ---------------------------------------------------------------------------
UserAction SdlViewer::show(const PixelBuffer& buf, const ViewInfo& info)
{
    if (!window) return UserAction::Quit;

    if (buf.width > 0 && buf.height > 0 && !buf.bytes.empty()) {
        tex.ensure(buf.width, buf.height);
        tex.upload(buf);
    }

    char title[160];
    std::snprintf(title, sizeof(title), "Swatch Viewer  -  %u / %u  -  %s",
                  info.index + 1, info.count, info.caption.c_str());
    SDL_SetWindowTitle(window, title);
    std::printf("Image viewer showing: %s\n", info.caption.c_str());
    std::printf("Press <Enter> to view next image or 'q' to quit...\n");
    std::fflush(stdout);

    while (true) {
        draw_frame(info);

        // Block until an SDL event arrives or 50 ms elapses
        SDL_Event event;
        bool got = SDL_WaitEventTimeout(&event, 50) != 0;
        while (got) {
            ImGui_ImplSDL2_ProcessEvent(&event);
            if (event.type == SDL_QUIT)
                return UserAction::Quit;
            if (event.type == SDL_WINDOWEVENT
                    && event.window.event == SDL_WINDOWEVENT_CLOSE)
                return UserAction::Quit;
            if (event.type == SDL_KEYDOWN && !event.key.repeat) {
                switch (event.key.keysym.sym) {
                    case SDLK_RETURN:
                    case SDLK_KP_ENTER:
                        return UserAction::Next;
                    case SDLK_q:
                    case SDLK_ESCAPE:
                        return UserAction::Quit;
                    default:
                        break;
                }
            }
            got = SDL_PollEvent(&event) != 0;
        }
    }
}

void SdlViewer::draw_frame(const ViewInfo& info)
{
    ImGui_ImplOpenGL3_NewFrame();
    ImGui_ImplSDL2_NewFrame();
    ImGui::NewFrame();

    int win_w, win_h;
    SDL_GetWindowSize(window, &win_w, &win_h);
    const float fw      = static_cast<float>(win_w);
    const float fh      = static_cast<float>(win_h);
    const float area_h  = std::max(1.0f, fh - STATUS_HEIGHT);

    // -------------------------------------------------------------------
    // Image area: scaled to fit, centered, nearest-neighbour
    // -------------------------------------------------------------------
    ImGui::SetNextWindowPos(ImVec2(0.0f, 0.0f));
    ImGui::SetNextWindowSize(ImVec2(fw, area_h));
    ImGui::PushStyleVar(ImGuiStyleVar_WindowPadding, ImVec2(0.0f, 0.0f));
    ImGui::Begin("##image", nullptr,
        ImGuiWindowFlags_NoTitleBar            |
        ImGuiWindowFlags_NoResize              |
        ImGuiWindowFlags_NoMove                |
        ImGuiWindowFlags_NoBringToFrontOnFocus |
        ImGuiWindowFlags_NoScrollbar);
    ImGui::PopStyleVar();

    if (tex.id && tex.w > 0 && tex.h > 0) {
        const float scale = std::min(fw / tex.w, area_h / tex.h);
        const float iw    = tex.w * scale;
        const float ih    = tex.h * scale;
        ImGui::SetCursorPos(ImVec2((fw - iw) * 0.5f, (area_h - ih) * 0.5f));
        ImGui::Image(tex.imgui_id(), ImVec2(iw, ih));
    }
    ImGui::End();

    // -------------------------------------------------------------------
    // Status bar
    // -------------------------------------------------------------------
    ImGui::SetNextWindowPos(ImVec2(0.0f, area_h));
    ImGui::SetNextWindowSize(ImVec2(fw, STATUS_HEIGHT));
    ImGui::PushStyleVar(ImGuiStyleVar_WindowPadding, ImVec2(6.0f, 4.0f));
    ImGui::Begin("##status", nullptr,
        ImGuiWindowFlags_NoTitleBar            |
        ImGuiWindowFlags_NoResize              |
        ImGuiWindowFlags_NoMove                |
        ImGuiWindowFlags_NoBringToFrontOnFocus |
        ImGuiWindowFlags_NoScrollbar);
    ImGui::PopStyleVar();
    if (info.failed)
        ImGui::TextColored(ImVec4(1.0f, 0.45f, 0.35f, 1.0f), "image %u / %u   %s",
                           info.index + 1, info.count, info.caption.c_str());
    else
        ImGui::Text("image %u / %u   %s   %dx%d",
                    info.index + 1, info.count, info.caption.c_str(), tex.w, tex.h);
    ImGui::TextDisabled("Press <Enter> to view next image or 'q' to quit");
    ImGui::End();

    ImGui::Render();
    glViewport(0, 0, win_w, win_h);
    glClearColor(0.08f, 0.08f, 0.08f, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT);
    ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
    SDL_GL_SwapWindow(window);
}
