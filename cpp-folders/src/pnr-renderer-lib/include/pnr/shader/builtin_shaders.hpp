#pragma once

/*
    PNR РЕНДЕРЕР САН

    ФАЙЛ: builtin_shaders.hpp
    МОДУЛЬ: shader
    ЗОРИЛГО: Энэ файл нь pnr-renderer-lib-ийн shader модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <algorithm>
#include <cmath>

#include <glm/glm.hpp>

#include "pnr/camera/convention.hpp"
#include "pnr/resources/texture.hpp"
#include "pnr/shader/paint_shading.hpp"
#include "pnr/shader/types.hpp"

namespace pnr
{
    inline VertexOut make_default_vertex_out(const ShaderVertex& vin, const ShaderUniforms& u)
    {
        VertexOut o{};
        const glm::vec4 wp4 = u.model * glm::vec4(vin.position, 1.0f);
        o.world_pos = glm::vec3(wp4);
        o.clip = u.viewproj * wp4;
        glm::mat3 nrm_m = glm::mat3(u.model);
        const float det = glm::determinant(nrm_m);
        if (std::abs(det) > 1e-8f) nrm_m = glm::transpose(glm::inverse(nrm_m));
        o.normal_ws = glm::normalize(nrm_m * vin.normal);
        o.uv = vin.uv;
        return o;
    }

    // Reference Field-ийн програм: albedo * (ambient + diffuse + Blinn specular), квантчилсан.
    // Alpha суваг нь interpolate хийсэн world байрлалыг дахин проекцлоод авсан гадаргуугийн гүн.
    inline ShaderProgram make_reference_field_program()
    {
        ShaderProgram p{};
        p.vs = [](const ShaderVertex& vin, const ShaderUniforms& u) -> VertexOut {
            return make_default_vertex_out(vin, u);
        };
        p.fs = [](const FragmentIn& fin, const ShaderUniforms& u) -> FragmentOut {
            FragmentOut o{};
            const glm::vec3 albedo_tex = glm::vec3(sample_texture2d_bilinear_repeat(u.base_color_tex, fin.uv));
            const glm::vec3 albedo = glm::max(u.base_color * albedo_tex, glm::vec3(0.0f));

            const PaintLighting& l = u.lighting;
            const glm::vec3 N = glm::normalize(fin.normal_ws);
            const glm::vec3 L = glm::normalize(-l.light_dir_ws);
            const glm::vec3 V = glm::normalize(u.camera_pos - fin.world_pos);
            const glm::vec3 H = glm::normalize(L + V);
            const float NdotL = std::max(0.0f, glm::dot(N, L));
            const float NdotH = std::max(0.0f, glm::dot(N, H));
            float brightness = l.ambient + l.diffuse * NdotL + l.specular * std::pow(NdotH, l.shininess);
            brightness = quantize_brightness(brightness, u.quantization);
            const glm::vec3 c = albedo * l.light_color * brightness;

            const glm::vec4 clip = u.viewproj * glm::vec4(fin.world_pos, 1.0f);
            float depth = fin.depth01;
            if (clip.w > 1e-8f) depth = clip_depth01(clip);

            o.color = ColorF{c.r, c.g, c.b, depth};
            return o;
        };
        return p;
    }
}
