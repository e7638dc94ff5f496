#pragma once

/*
    PNR РЕНДЕРЕР САН

    ФАЙЛ: paint_shading.hpp
    МОДУЛЬ: shader
    ЗОРИЛГО: Энэ файл нь pnr-renderer-lib-ийн shader модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <algorithm>
#include <cmath>

#include <glm/glm.hpp>

namespace pnr
{
    // Гэрэлтэлтийг Q түвшинд хуваана. Q <= 0 бол өөрчлөхгүй.
    // Q > 1 үед гаралт нь k / (Q - 1), k >= 1 тул хамгийн бага түвшин 1 / (Q - 1) >= 1 / Q
    // бөгөөд хэзээ ч 0 болохгүй. Q == 1 бол нэг л түвшин (1.0) үлдэнэ.
    inline float quantize_brightness(float brightness, int quantization)
    {
        if (quantization <= 0) return brightness;
        if (quantization == 1) return 1.0f;
        const float steps = (float)(quantization - 1);
        const float b = std::clamp(std::isfinite(brightness) ? brightness : 0.0f, 0.0f, 1.0f);
        const float k = std::max(1.0f, std::round(b * steps));
        return k / steps;
    }

    inline float luminance(const glm::vec3& c)
    {
        return 0.2126f * c.r + 0.7152f * c.g + 0.0722f * c.b;
    }

    // saturation = 0 үед луминанс, 1 үед оролтын өнгө яг хэвээрээ.
    inline glm::vec3 apply_saturation(const glm::vec3& c, float saturation)
    {
        const float s = std::clamp(saturation, 0.0f, 1.0f);
        if (s >= 1.0f) return c;
        const float l = luminance(c);
        return glm::mix(glm::vec3(l), c, s);
    }

    // Post pass-ын нэг pixel: paper (R суваг)-аар үржүүлж, дараа нь saturation.
    inline glm::vec3 paint_post_color(const glm::vec3& canvas_rgb, float paper_r, bool enable_canvas, float saturation)
    {
        glm::vec3 c = canvas_rgb;
        if (enable_canvas) c *= paper_r;
        return apply_saturation(c, saturation);
    }
}
