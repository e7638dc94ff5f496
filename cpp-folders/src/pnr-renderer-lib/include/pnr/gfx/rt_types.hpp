#pragma once

/*
    PNR РЕНДЕРЕР САН

    ФАЙЛ: rt_types.hpp
    МОДУЛЬ: gfx
    ЗОРИЛГО: Энэ файл нь pnr-renderer-lib-ийн gfx модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.

    Координатын тохиролцоо: pixel (0,0) нь зүүн доод булан, Y дээшээ өснө.
    Normalized screen (u,v) = ((x + 0.5) / w, (y + 0.5) / h).
*/


#include <algorithm>
#include <cmath>
#include <cstdint>
#include <vector>

#include <glm/glm.hpp>

namespace pnr
{
    struct Color
    {
        uint8_t r, g, b, a;
    };

    struct ColorF
    {
        float r, g, b, a;
    };

    inline glm::vec3 rgb_of(const ColorF& c)
    {
        return glm::vec3(c.r, c.g, c.b);
    }

    inline Color to_color8(const ColorF& c)
    {
        auto q = [](float v) -> uint8_t {
            return (uint8_t)std::clamp((int)std::lround(v * 255.0f), 0, 255);
        };
        return Color{q(c.r), q(c.g), q(c.b), q(c.a)};
    }

    template<typename TPixel>
    struct PixelBuffer2D
    {
        int w = 0;
        int h = 0;
        std::vector<TPixel> data;

        PixelBuffer2D() = default;
        PixelBuffer2D(int W, int H, const TPixel& clear) { resize(W, H, clear); }

        void resize(int W, int H, const TPixel& clear)
        {
            w = std::max(0, W);
            h = std::max(0, H);
            data.assign((size_t)w * (size_t)h, clear);
        }

        void clear(const TPixel& clear_value)
        {
            std::fill(data.begin(), data.end(), clear_value);
        }

        TPixel& at(int x, int y) { return data[(size_t)y * (size_t)w + (size_t)x]; }
        const TPixel& at(int x, int y) const { return data[(size_t)y * (size_t)w + (size_t)x]; }

        // Normalized координатаас хамгийн ойрын pixel-ийг авна. Ирмэг дээр clamp хийнэ.
        const TPixel& at_uv_nearest(float u, float v) const
        {
            const int x = std::clamp((int)std::floor(u * (float)w), 0, std::max(0, w - 1));
            const int y = std::clamp((int)std::floor(v * (float)h), 0, std::max(0, h - 1));
            return at(x, y);
        }
    };

    struct RT_ColorLDR
    {
        int w = 0;
        int h = 0;
        PixelBuffer2D<Color> color;

        RT_ColorLDR() = default;
        RT_ColorLDR(int W, int H, Color clear = {0, 0, 0, 255}) : w(W), h(H), color(W, H, clear) {}

        void clear(Color c = {0, 0, 0, 255}) { color.clear(c); }
    };

    // Reference Field: ердийн гэрэлтүүлэгтэй рендерийн өнгө + гадаргуугийн гүн.
    // Гүнийг өнгөний alpha (туслах) сувагт хадгална. Hardware-маягийн z-buffer нь
    // зөвхөн хамгийн ойрын гадаргууг сонгоход хэрэглэгдэх ба доод pass-ууд уншдаггүй.
    struct RT_ReferenceField
    {
        int w = 0;
        int h = 0;
        PixelBuffer2D<ColorF> color;   // rgb = shading, a = surface depth [0,1]
        PixelBuffer2D<float> zbuffer;

        RT_ReferenceField() = default;
        RT_ReferenceField(int W, int H)
            : w(W), h(H), color(W, H, ColorF{0.0f, 0.0f, 0.0f, 1.0f}), zbuffer(W, H, 1.0f)
        {}

        void clear(const glm::vec3& background)
        {
            color.clear(ColorF{background.r, background.g, background.b, 1.0f});
            zbuffer.clear(1.0f);
        }

        ColorF sample_nearest(const glm::vec2& uv) const
        {
            return color.at_uv_nearest(uv.x, uv.y);
        }
    };

    // Canvas: бүх stroke-ийг alpha blending-ээр нийлүүлсэн зураг. alpha = хуримтлагдсан coverage.
    struct RT_Canvas
    {
        int w = 0;
        int h = 0;
        PixelBuffer2D<ColorF> color;

        RT_Canvas() = default;
        RT_Canvas(int W, int H, ColorF clear = {0.0f, 0.0f, 0.0f, 0.0f}) : w(W), h(H), color(W, H, clear) {}

        void clear(const glm::vec3& background)
        {
            color.clear(ColorF{background.r, background.g, background.b, 0.0f});
        }
    };
}
