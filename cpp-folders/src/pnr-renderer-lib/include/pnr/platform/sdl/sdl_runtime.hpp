#pragma once

/*
    PNR РЕНДЕРЕР САН

    ФАЙЛ: sdl_runtime.hpp
    МОДУЛЬ: platform
    ЗОРИЛГО: Энэ файл нь pnr-renderer-lib-ийн platform модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <cstdint>
#include <cstring>
#include <string>

#include <SDL2/SDL.h>
#include <SDL2/SDL_image.h>

#include "pnr/core/log.hpp"
#include "pnr/platform/platform_input.hpp"

namespace pnr
{
    struct WindowDesc
    {
        std::string title{};
        int width = 1280;
        int height = 720;
        bool resizable = true;
    };

    // SDL2 цонх + streaming RGBA8 texture. Canvas-аа upload_rgba8-аар хуулж, present-ээр гаргана.
    class SdlRuntime final
    {
    {
    public:
        explicit SdlRuntime(const WindowDesc& win)
        {
            if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0)
            {
                log_error(std::string("SDL_Init failed: ") + SDL_GetError());
                return;
            }

            const int img_flags = IMG_INIT_PNG | IMG_INIT_JPG;
            if ((IMG_Init(img_flags) & img_flags) == 0)
            {
                log_error(std::string("IMG_Init failed: ") + IMG_GetError());
                return;
            }

            uint32_t window_flags = SDL_WINDOW_SHOWN;
            if (win.resizable) window_flags |= SDL_WINDOW_RESIZABLE;
            window_ = SDL_CreateWindow(
                win.title.c_str(),
                SDL_WINDOWPOS_CENTERED,
                SDL_WINDOWPOS_CENTERED,
                win.width,
                win.height,
                window_flags
            );
            if (!window_)
            {
                log_error(std::string("SDL_CreateWindow failed: ") + SDL_GetError());
                return;
            }

            renderer_ = SDL_CreateRenderer(window_, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
            if (!renderer_)
            {
                log_error(std::string("SDL_CreateRenderer failed: ") + SDL_GetError());
                return;
            }

            if (!ensure_texture(win.width, win.height)) return;
            valid_ = true;
        }

        ~SdlRuntime()
        {
            if (texture_) SDL_DestroyTexture(texture_);
            if (renderer_) SDL_DestroyRenderer(renderer_);
            if (window_) SDL_DestroyWindow(window_);
            IMG_Quit();
            SDL_Quit();
        }

        SdlRuntime(const SdlRuntime&) = delete;
        SdlRuntime& operator=(const SdlRuntime&) = delete;

        bool valid() const { return valid_; }

        bool pump_input(PlatformInputState& out)
        {
            out = PlatformInputState{};

            SDL_Event e;
            while (SDL_PollEvent(&e))
            {
                if (e.type == SDL_QUIT) out.quit = true;
                if (e.type == SDL_KEYDOWN)
                {
                    switch (e.key.keysym.sym)
                    {
                        case SDLK_ESCAPE: out.quit = true; break;
                        case SDLK_v: out.cycle_view = true; break;
                        case SDLK_g: out.toggle_overlay = true; break;
                        case SDLK_t: out.toggle_brush_tbn = true; break;
                        case SDLK_c: out.toggle_canvas = true; break;
                        case SDLK_RIGHTBRACKET: out.quantization_delta += 1; break;
                        case SDLK_LEFTBRACKET: out.quantization_delta -= 1; break;
                        case SDLK_EQUALS: out.brush_size_steps += 1; break;
                        case SDLK_MINUS: out.brush_size_steps -= 1; break;
                        default: break;
                    }
                }
                if (e.type == SDL_MOUSEWHEEL)
                {
                    const float flip = (e.wheel.direction == SDL_MOUSEWHEEL_FLIPPED) ? -1.0f : 1.0f;
                    out.wheel_x += (float)e.wheel.x * flip;
                    out.wheel_y += (float)e.wheel.y * flip;
                }
                if (e.type == SDL_WINDOWEVENT && e.window.event == SDL_WINDOWEVENT_SIZE_CHANGED)
                {
                    out.resized = true;
                    out.resized_w = e.window.data1;
                    out.resized_h = e.window.data2;
                }
            }

            const uint8_t* ks = SDL_GetKeyboardState(nullptr);
            out.zoom_in = ks[SDL_SCANCODE_UP] != 0;
            out.zoom_out = ks[SDL_SCANCODE_DOWN] != 0;
            return !out.quit;
        }

        void set_title(const std::string& title)
        {
            if (window_) SDL_SetWindowTitle(window_, title.c_str());
        }

        SDL_Window* window() const { return window_; }

        void upload_rgba8(const uint8_t* src, int width, int height, int src_pitch_bytes)
        {
            if (!src || !ensure_texture(width, height)) return;
            void* dst = nullptr;
            int dst_pitch = 0;
            if (SDL_LockTexture(texture_, nullptr, &dst, &dst_pitch) != 0) return;

            const int copy_bytes = width * 4;
            auto* d = static_cast<uint8_t*>(dst);
            for (int y = 0; y < height; ++y)
            {
                std::memcpy(d + y * dst_pitch, src + y * src_pitch_bytes, (size_t)copy_bytes);
            }
            SDL_UnlockTexture(texture_);
        }

        void present()
        {
            if (!renderer_ || !texture_) return;
            SDL_SetRenderDrawColor(renderer_, 10, 10, 14, 255);
            SDL_RenderClear(renderer_);
            SDL_RenderCopy(renderer_, texture_, nullptr, nullptr);
            SDL_RenderPresent(renderer_);
        }

    private:
        // Цонхны хэмжээ өөрчлөгдөхөд streaming texture-ийг шинээр үүсгэнэ.
        bool ensure_texture(int width, int height)
        {
            if (!renderer_ || width <= 0 || height <= 0) return false;
            if (texture_ && tex_w_ == width && tex_h_ == height) return true;
            if (texture_) SDL_DestroyTexture(texture_);
            texture_ = SDL_CreateTexture(
                renderer_,
                SDL_PIXELFORMAT_RGBA32,
                SDL_TEXTUREACCESS_STREAMING,
                width,
                height
            );
            if (!texture_)
            {
                log_error(std::string("SDL_CreateTexture failed: ") + SDL_GetError());
                tex_w_ = tex_h_ = 0;
                return false;
            }
            tex_w_ = width;
            tex_h_ = height;
            return true;
        }

        bool valid_ = false;
        SDL_Window* window_ = nullptr;
        SDL_Renderer* renderer_ = nullptr;
        SDL_Texture* texture_ = nullptr;
        int tex_w_ = 0;
        int tex_h_ = 0;
    };
}
