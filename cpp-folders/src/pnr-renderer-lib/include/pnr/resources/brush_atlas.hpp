#pragma once

/*
    PNR РЕНДЕРЕР САН

    ФАЙЛ: brush_atlas.hpp
    МОДУЛЬ: resources
    ЗОРИЛГО: Бийрийн хэлбэрийн mask-уудыг хэвтээ чиглэлд N тэнцүү нүдэнд байрлуулсан atlas.
            Mask утга 0 = бүрэн тунгалаг биш (stroke-ийн төв), 1 = бүрэн тунгалаг (ирмэг).
*/


#include <algorithm>
#include <cmath>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include "pnr/core/result.hpp"
#include "pnr/resources/texture.hpp"

namespace pnr
{
    struct BrushAtlas
    {
        Texture2DData texture{};
        int brush_count = 0;
        int cell_px = 0;

        bool valid() const
        {
            return brush_count > 0 && cell_px > 0 && texture.valid() && texture.w == brush_count * cell_px;
        }
    };

    // Бийр бүр яг cell_px өргөнтэй байх ёстой. Өндөр нь cell_px-ээс бага бол нүдний
    // дунд босоо байдлаар байрлуулж, үлдсэн хэсгийг цагаан (тунгалаг) үлдээнэ.
    inline Result<BrushAtlas> assemble_brush_atlas(const std::vector<Texture2DData>& brushes, int cell_px)
    {
        if (brushes.empty()) return Result<BrushAtlas>::failure("brush atlas: no brush images");
        if (cell_px <= 0) return Result<BrushAtlas>::failure("brush atlas: cell size must be positive");

        BrushAtlas atlas{};
        atlas.brush_count = (int)brushes.size();
        atlas.cell_px = cell_px;
        atlas.texture = Texture2DData{cell_px * atlas.brush_count, cell_px, Color{255, 255, 255, 255}};
        atlas.texture.source_path = "brush_atlas";

        for (size_t i = 0; i < brushes.size(); ++i)
        {
            const Texture2DData& b = brushes[i];
            if (!b.valid())
            {
                return Result<BrushAtlas>::failure("brush atlas: brush " + std::to_string(i) + " is empty");
            }
            if (b.w != cell_px || b.h > cell_px)
            {
                return Result<BrushAtlas>::failure(
                    "brush atlas: brush '" + b.source_path + "' is " + std::to_string(b.w) + "x" + std::to_string(b.h) +
                    ", expected width " + std::to_string(cell_px) + " and height <= " + std::to_string(cell_px));
            }

            const int x_offset = (int)i * cell_px;
            const int y_offset = (cell_px - b.h) / 2;
            for (int y = 0; y < b.h; ++y)
            {
                for (int x = 0; x < b.w; ++x)
                {
                    atlas.texture.at(x_offset + x, y_offset + y) = b.at(x, y);
                }
            }
        }
        return Result<BrushAtlas>::success(std::move(atlas));
    }

    // Гаднаас бийрийн зураг өгөгдөөгүй үед ашиглах procedural бийрүүд:
    // зөөлөн ирмэгтэй эллипс дээр бийрийн үсний зураас (streak) нэмсэн mask.
    inline BrushAtlas make_procedural_brush_atlas(int brush_count = 4, int cell_px = 64, uint32_t seed = 7u)
    {
        std::vector<Texture2DData> brushes{};
        brushes.reserve((size_t)std::max(1, brush_count));
        std::mt19937 rng(seed);
        std::uniform_real_distribution<float> jitter(0.0f, 1.0f);

        for (int bi = 0; bi < std::max(1, brush_count); ++bi)
        {
            Texture2DData t{cell_px, cell_px, Color{255, 255, 255, 255}};
            const float rx = 0.42f + 0.06f * jitter(rng);
            const float ry = 0.22f + 0.14f * jitter(rng);
            const float streak_freq = 9.0f + 8.0f * jitter(rng);
            const float streak_phase = 6.2831853f * jitter(rng);
            for (int y = 0; y < cell_px; ++y)
            {
                for (int x = 0; x < cell_px; ++x)
                {
                    const float u = ((float)x + 0.5f) / (float)cell_px - 0.5f;
                    const float v = ((float)y + 0.5f) / (float)cell_px - 0.5f;
                    const float d = std::sqrt((u * u) / (rx * rx) + (v * v) / (ry * ry));
                    float coverage = std::clamp((1.0f - d) * 4.0f, 0.0f, 1.0f);
                    const float streak = 0.75f + 0.25f * std::sin(v * streak_freq * 6.2831853f + streak_phase);
                    coverage *= streak;
                    const uint8_t m = (uint8_t)std::clamp((int)std::lround((1.0f - coverage) * 255.0f), 0, 255);
                    t.at(x, y) = Color{m, m, m, 255};
                }
            }
            t.source_path = "procedural_brush_" + std::to_string(bi);
            brushes.push_back(std::move(t));
        }

        Result<BrushAtlas> r = assemble_brush_atlas(brushes, cell_px);
        return r.value;
    }
}
