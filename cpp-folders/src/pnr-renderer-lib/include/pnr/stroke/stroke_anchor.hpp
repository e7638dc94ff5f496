#pragma once

/*
    PNR РЕНДЕРЕР САН

    ФАЙЛ: stroke_anchor.hpp
    МОДУЛЬ: stroke
    ЗОРИЛГО: Энэ файл нь pnr-renderer-lib-ийн stroke модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <glm/glm.hpp>

namespace pnr
{
    // Model орон зайд нэг бийрийн зураасны байрлал. Frame (tangent, bitangent, normal) нь
    // баруун гарын ортонормаль суурь: cross(tangent, bitangent) == normal.
    struct StrokeAnchor
    {
        glm::vec3 position{0.0f};
        glm::vec3 normal{0.0f, 0.0f, 1.0f};
        glm::vec3 tangent{1.0f, 0.0f, 0.0f};
        glm::vec3 bitangent{0.0f, 1.0f, 0.0f};
        glm::vec2 uv{0.0f};
        int brush_variant = 0;
    };

    // Нэг frame-ийн амьд үлдсэн anchor. Тэнхлэгүүд нь clip орон зайд шилжсэн tangent/bitangent.
    struct ShadedStroke
    {
        glm::vec4 clip{0.0f, 0.0f, 0.0f, 1.0f};
        glm::vec4 color{0.0f, 0.0f, 0.0f, 1.0f};   // a = model coverage flag, тунгалаг байдал биш
        glm::vec4 axis_u{0.0f};
        glm::vec4 axis_v{0.0f};
        int brush_variant = 0;
    };
}
