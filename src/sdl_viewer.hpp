#pragma once

#include "display_loop.hpp"

#include <SDL2/SDL.h>
#include <SDL2/SDL_opengl.h>
#include "imgui.h"

#include <cstdint>
#include <string>

// ---------------------------------------------------------------------------
// GL texture helper: RGB8, reallocated only when the size changes
// ---------------------------------------------------------------------------
struct GlTex {
    GLuint id = 0;
    int    w  = 0;
    int    h  = 0;

    void ensure(int nw, int nh) {
        if (nw == w && nh == h && id != 0) return;
        if (id) glDeleteTextures(1, &id);
        glGenTextures(1, &id);
        glBindTexture(GL_TEXTURE_2D, id);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
        glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
        glTexImage2D(GL_TEXTURE_2D, 0, GL_RGB, nw, nh, 0,
                     GL_RGB, GL_UNSIGNED_BYTE, nullptr);
        w = nw; h = nh;
    }

    void upload(const PixelBuffer& buf) {
        glBindTexture(GL_TEXTURE_2D, id);
        glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
        glTexSubImage2D(GL_TEXTURE_2D, 0, 0, 0, buf.width, buf.height,
                        GL_RGB, GL_UNSIGNED_BYTE, buf.bytes.data());
    }

    ImTextureID imgui_id() const {
        return reinterpret_cast<ImTextureID>(static_cast<uintptr_t>(id));
    }

    void release() {
        if (id) glDeleteTextures(1, &id);
        id = 0; w = 0; h = 0;
    }
};

// ---------------------------------------------------------------------------
// SdlViewer: one window, one image at a time
//   Enter / keypad Enter -> Next
//   q / Escape / close   -> Quit
// ---------------------------------------------------------------------------
class SdlViewer : public IViewer {
public:
    SdlViewer() = default;
    ~SdlViewer() override { close(); }

    SdlViewer(const SdlViewer&)            = delete;
    SdlViewer& operator=(const SdlViewer&) = delete;

    // Returns empty string on success, or an error message.
    std::string open(int image_w, int image_h);
    void        close();

    UserAction show(const PixelBuffer& buf, const ViewInfo& info) override;

private:
    void draw_frame(const ViewInfo& info);

    SDL_Window*   window     = nullptr;
    SDL_GLContext gl_context = nullptr;
    bool          imgui_up   = false;
    GlTex         tex;
};
