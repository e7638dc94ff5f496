#pragma once

/*
    PNR РЕНДЕРЕР САН

    ФАЙЛ: types.hpp
    МОДУЛЬ: shader
    ЗОРИЛГО: Энэ файл нь pnr-renderer-lib-ийн shader модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <cstdint>
#include <functional>

#include <glm/glm.hpp>

#include "pnr/gfx/rt_types.hpp"
#include "pnr/resources/texture.hpp"

namespace pnr
{
    struct ShaderVertex
    {
        glm::vec3 position{0.0f};
        glm::vec3 normal{0.0f, 1.0f, 0.0f};
        glm::vec2 uv{0.0f};
    };

    struct VertexOut
    {
        glm::vec4 clip{0.0f, 0.0f, 0.0f, 1.0f};

        // Fragment shader-д шууд ашиглагдах үндсэн өгөгдөл.
        glm::vec3 world_pos{0.0f};
        glm::vec3 normal_ws{0.0f, 1.0f, 0.0f};
        glm::vec2 uv{0.0f};
    };

    struct FragmentIn
    {
        // Pixel шатны шэйдингт хэрэглэгдэх үндсэн атрибутууд.
        glm::vec3 world_pos{0.0f};
        glm::vec3 normal_ws{0.0f, 1.0f, 0.0f};
        glm::vec2 uv{0.0f};
        float depth01 = 1.0f;
        int px = 0;
        int py = 0;
    };

    struct FragmentOut
    {
        ColorF color{0.0f, 0.0f, 0.0f, 1.0f};
        bool discard = false;
    };

    // Painterly гэрэлтүүлгийн параметрүүд: ambient floor + Lambert diffuse + Blinn specular.
    struct PaintLighting
    {
        glm::vec3 light_dir_ws{-0.4f, -1.0f, 0.6f};   // гэрлийн туяа явах чиглэл
        glm::vec3 light_color{1.0f, 1.0f, 1.0f};
        float ambient = 0.15f;
        float diffuse = 1.0f;
        float specular = 0.5f;
        float shininess = 64.0f;
    };

    struct ShaderUniforms
    {
        glm::mat4 model{1.0f};
        glm::mat4 viewproj{1.0f};
        glm::vec3 camera_pos{0.0f};

        PaintLighting lighting{};
        int quantization = 0;
        glm::vec3 base_color{1.0f, 1.0f, 1.0f};
        const Texture2DData* base_color_tex = nullptr;
    };

    using VertexShaderFn = std::function<VertexOut(const ShaderVertex&, const ShaderUniforms&)>;
    using FragmentShaderFn = std::function<FragmentOut(const FragmentIn&, const ShaderUniforms&)>;

    // Rasterizer-т өгөх vertex/fragment хос.
    struct ShaderProgram
    {
        VertexShaderFn vs{};
        FragmentShaderFn fs{};

        bool valid() const { return (bool)vs && (bool)fs; }
    };
}
