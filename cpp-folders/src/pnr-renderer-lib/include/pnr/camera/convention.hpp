#pragma once

/*
    PNR РЕНДЕРЕР САН

    ФАЙЛ: convention.hpp
    МОДУЛЬ: camera
    ЗОРИЛГО: Камер, проекц, дэлгэцийн координатын нэг мөр дүрэм. Reference Field,
            anchor проекц, point splat бүгд эндээс уншина.
*/

#include <algorithm>

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>

namespace pnr
{
    // LH: +Z нь камерын урагш. NDC Z нь [-1, 1].
    inline glm::mat4 look_at_lh(const glm::vec3& eye, const glm::vec3& target, const glm::vec3& up)
    {
        return glm::lookAtLH(eye, target, up);
    }

    inline glm::mat4 perspective_lh_no(float fovy_radians, float aspect, float znear, float zfar)
    {
        return glm::perspectiveLH_NO(fovy_radians, aspect, znear, zfar);
    }

    // Reference Field болон anchor-ууд хоёулаа яг энэ томьёогоор гүнээ тооцно.
    inline float ndc_depth01(float ndc_z)
    {
        return ndc_z * 0.5f + 0.5f;
    }

    // clip.w > 0 гэж үзнэ. Үр дүнг [0,1]-д хавчина.
    inline float clip_depth01(const glm::vec4& clip)
    {
        return std::clamp(ndc_depth01(clip.z / clip.w), 0.0f, 1.0f);
    }

    // NDC -> pixel координат. Pixel (x, y)-ийн төв нь (x + 0.5, y + 0.5). Canvas-ийн Y дээшээ.
    inline glm::vec2 ndc_to_screen(const glm::vec2& ndc, int w, int h)
    {
        return glm::vec2((ndc.x * 0.5f + 0.5f) * (float)w, (ndc.y * 0.5f + 0.5f) * (float)h);
    }

    // Clip байрлалаас [0,1]^2 screen координат. Дэлгэцээс гарсан anchor ирмэгийн pixel-ийг уншина.
    inline glm::vec2 clip_to_screen_uv(const glm::vec4& clip)
    {
        const glm::vec2 ndc = glm::vec2(clip) / clip.w;
        return glm::clamp(ndc * 0.5f + 0.5f, glm::vec2(0.0f), glm::vec2(1.0f));
    }
}
