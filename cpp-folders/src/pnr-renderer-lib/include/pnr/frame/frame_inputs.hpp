#pragma once

/*
    PNR РЕНДЕРЕР САН

    ФАЙЛ: frame_inputs.hpp
    МОДУЛЬ: frame
    ЗОРИЛГО: Энэ файл нь pnr-renderer-lib-ийн frame модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <glm/glm.hpp>

#include "pnr/camera/orbit_camera.hpp"

namespace pnr
{
    // Нэг frame-ийн камерын төлөв. Бүх pass яг энэ матрицуудыг хуваалцана.
    struct FrameCamera
    {
        glm::mat4 model{1.0f};
        glm::mat4 view{1.0f};
        glm::mat4 proj{1.0f};
        glm::vec3 position{0.0f};

        glm::mat4 viewproj() const { return proj * view; }
        glm::mat4 model_viewproj() const { return proj * view * model; }
    };

    inline FrameCamera make_frame_camera(const OrbitCamera& cam, const glm::mat4& model = glm::mat4(1.0f))
    {
        FrameCamera fc{};
        fc.model = model;
        fc.view = cam.view();
        fc.proj = cam.proj();
        fc.position = cam.position();
        return fc;
    }

    struct FrameSize
    {
        int w = 0;
        int h = 0;

        bool valid() const { return w > 0 && h > 0; }
    };
}
