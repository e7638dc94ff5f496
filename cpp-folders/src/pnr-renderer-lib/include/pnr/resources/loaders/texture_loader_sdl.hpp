#pragma once

/*
    PNR РЕНДЕРЕР САН

    ФАЙЛ: texture_loader_sdl.hpp
    МОДУЛЬ: resources
    ЗОРИЛГО: Энэ файл нь pnr-renderer-lib-ийн resources модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include <SDL2/SDL.h>
#include <SDL2/SDL_image.h>

#include "pnr/core/log.hpp"
#include "pnr/core/result.hpp"
#include "pnr/resources/brush_atlas.hpp"
#include "pnr/resources/texture.hpp"

namespace pnr
{
    inline Result<Texture2DData> load_texture2d_sdl_image(const std::string& path, bool flip_y = true)
    {
        using R = Result<Texture2DData>;
        SDL_Surface* loaded = IMG_Load(path.c_str());
        if (!loaded) return R::failure("failed to load image '" + path + "': " + IMG_GetError());

        SDL_Surface* rgba = SDL_ConvertSurfaceFormat(loaded, SDL_PIXELFORMAT_RGBA32, 0);
        SDL_FreeSurface(loaded);
        if (!rgba) return R::failure("failed to convert image '" + path + "': " + SDL_GetError());

        Texture2DData out{rgba->w, rgba->h, Color{0, 0, 0, 0}};
        out.source_path = path;

        auto* pixels = static_cast<uint8_t*>(rgba->pixels);
        const int pitch = rgba->pitch;
        for (int y = 0; y < out.h; ++y)
        {
            const int dst_y = flip_y ? (out.h - 1 - y) : y;
            auto* row = reinterpret_cast<uint32_t*>(pixels + y * pitch);
            for (int x = 0; x < out.w; ++x)
            {
                uint8_t r = 0, g = 0, b = 0, a = 0;
                SDL_GetRGBA(row[x], rgba->format, &r, &g, &b, &a);
                out.at(x, dst_y) = Color{r, g, b, a};
            }
        }

        SDL_FreeSurface(rgba);
        return R::success(std::move(out));
    }

    inline bool is_image_file_name(const std::string& name)
    {
        if (name.empty() || name[0] == '.') return false;
        const size_t dot = name.find_last_of('.');
        if (dot == std::string::npos) return false;
        std::string ext = name.substr(dot);
        std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return (char)std::tolower(c); });
        return ext == ".png" || ext == ".jpg" || ext == ".jpeg" || ext == ".bmp" || ext == ".tga";
    }

    // Хавтасны бүх зургийг (нуугдмал файлыг алгасна) нэрийн дарааллаар уншиж atlas болгоно.
    // Нүдний хэмжээ = эхний бийрийн өргөн.
    inline Result<BrushAtlas> load_brush_atlas_dir(const std::string& dir)
    {
        namespace fs = std::filesystem;
        using R = Result<BrushAtlas>;

        std::error_code ec{};
        if (!fs::is_directory(dir, ec)) return R::failure("brush directory '" + dir + "' does not exist");

        std::vector<fs::path> files{};
        for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec))
        {
            if (!it->is_regular_file(ec)) continue;
            if (is_image_file_name(it->path().filename().string())) files.push_back(it->path());
        }
        if (ec) return R::failure("failed to list '" + dir + "': " + ec.message());
        if (files.empty()) return R::failure("brush directory '" + dir + "' contains no brush images");
        std::sort(files.begin(), files.end());

        std::vector<Texture2DData> brushes{};
        brushes.reserve(files.size());
        for (const auto& f : files)
        {
            auto tex = load_texture2d_sdl_image(f.string());
            if (!tex) return R::forward_failure(tex, "brush");
            brushes.push_back(std::move(tex.value));
        }

        auto atlas = assemble_brush_atlas(brushes, brushes.front().w);
        if (atlas)
        {
            log_info("brush atlas: " + std::to_string(atlas.value.brush_count) + " brushes, cell " +
                     std::to_string(atlas.value.cell_px) + "px");
        }
        return atlas;
    }
}
