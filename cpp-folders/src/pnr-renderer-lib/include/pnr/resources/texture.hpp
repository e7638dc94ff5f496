#pragma once

/*
    PNR РЕНДЕРЕР САН

    ФАЙЛ: texture.hpp
    МОДУЛЬ: resources
    ЗОРИЛГО: RGBA8 texture (albedo, цаасны ширхэг, бийрний зураг) болон түүнийг
            шэйдерээс уншах bilinear sampler.
*/


#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "pnr/gfx/rt_types.hpp"

namespace pnr
{
    // Texel (0,0) нь зүүн доод булан (loader y-г эргүүлж уншина), uv-ийн эхлэлтэй давхцана.
    struct Texture2DData
    {
        std::string source_path{};
        int w = 0;
        int h = 0;
        std::vector<Color> texels{};

        Texture2DData() = default;
        Texture2DData(int W, int H, Color fill = {0, 0, 0, 255})
            : w(W), h(H), texels((size_t)W * (size_t)H, fill)
        {}

        bool valid() const { return w > 0 && h > 0 && texels.size() == (size_t)w * (size_t)h; }

        Color& at(int x, int y) { return texels[(size_t)y * (size_t)w + (size_t)x]; }
        const Color& at(int x, int y) const { return texels[(size_t)y * (size_t)w + (size_t)x]; }
    };

    inline Texture2DData make_solid_texture(int w, int h, Color c)
    {
        return Texture2DData{w, h, c};
    }

    // Painterly зам нь display-referred өнгөөр ажилладаг тул sRGB-г шугаман болгохгүй.
    inline glm::vec4 color_to_vec4(const Color& c)
    {
        return glm::vec4((float)c.r, (float)c.g, (float)c.b, (float)c.a) * (1.0f / 255.0f);
    }

    // uv нь [0,1)-д ороож давтагдана. Texture байхгүй бол цагаан.
    inline glm::vec4 sample_texture2d_bilinear_repeat(const Texture2DData* tex, const glm::vec2& uv)
    {
        if (!tex || !tex->valid()) return glm::vec4(1.0f);
        const float fx = (uv.x - std::floor(uv.x)) * (float)(tex->w - 1);
        const float fy = (uv.y - std::floor(uv.y)) * (float)(tex->h - 1);
        const int x0 = std::clamp((int)std::floor(fx), 0, tex->w - 1);
        const int y0 = std::clamp((int)std::floor(fy), 0, tex->h - 1);
        const int x1 = std::min(x0 + 1, tex->w - 1);
        const int y1 = std::min(y0 + 1, tex->h - 1);
        const float tx = fx - (float)x0;
        const float ty = fy - (float)y0;

        const glm::vec4 bottom = glm::mix(color_to_vec4(tex->at(x0, y0)), color_to_vec4(tex->at(x1, y0)), tx);
        const glm::vec4 top = glm::mix(color_to_vec4(tex->at(x0, y1)), color_to_vec4(tex->at(x1, y1)), tx);
        return glm::mix(bottom, top, ty);
    }
}
