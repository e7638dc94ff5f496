#pragma once

/*
    PNR РЕНДЕРЕР САН

    ФАЙЛ: orbit_camera.hpp
    МОДУЛЬ: camera
    ЗОРИЛГО: Эх цэгийг тойрон эргэх viewer камер. Core pipeline зөвхөн view/proj/pos-ийг авна.
*/


#include <algorithm>
#include <cmath>

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>
#include <glm/gtc/matrix_transform.hpp>

#include "pnr/camera/convention.hpp"

namespace pnr
{
    class OrbitCamera
    {
    public:
        OrbitCamera() = default;

        OrbitCamera(
            const glm::vec3& position,
            const glm::vec3& direction,
            float fov_y_radians,
            float aspect,
            float znear,
            float zfar
        )
            : position_(position)
            , direction_(glm::normalize(direction))
            , fov_y_radians_(fov_y_radians)
            , aspect_(aspect)
            , znear_(znear)
            , zfar_(zfar)
        {}

        // Камерыг баруун тэнхлэгийг тойруулан дээш/доош эргүүлнэ.
        // Туйлаас 5 градусаас ойртох эргэлтийг хийхгүй.
        void rotate_up(float angle_radians)
        {
            const float len = glm::length(position_);
            if (len <= 1e-6f) return;
            const glm::vec3 up{0.0f, 1.0f, 0.0f};
            const float theta = std::acos(std::clamp(glm::dot(position_ / len, up), -1.0f, 1.0f));
            const float next = theta + angle_radians;
            const float min_pole = glm::radians(5.0f);
            const float max_pole = glm::radians(175.0f);
            if ((next < min_pole && angle_radians < 0.0f) || (next > max_pole && angle_radians > 0.0f)) return;

            const glm::mat4 rot = glm::rotate(glm::mat4(1.0f), angle_radians, right());
            position_ = len * glm::normalize(glm::vec3(rot * glm::vec4(position_ / len, 0.0f)));
            direction_ = -glm::normalize(position_);
        }

        void zoom(float amount)
        {
            position_ += glm::normalize(direction_) * amount;
        }

        void set_aspect(float aspect)
        {
            if (aspect > 0.0f && std::isfinite(aspect)) aspect_ = aspect;
        }

        glm::vec3 right() const
        {
            return glm::normalize(glm::cross(direction_, glm::vec3(0.0f, 1.0f, 0.0f)));
        }

        const glm::vec3& position() const { return position_; }
        const glm::vec3& direction() const { return direction_; }
        float aspect() const { return aspect_; }
        float znear() const { return znear_; }
        float zfar() const { return zfar_; }

        glm::mat4 view() const
        {
            return look_at_lh(position_, position_ + direction_, glm::vec3(0.0f, 1.0f, 0.0f));
        }

        glm::mat4 proj() const
        {
            return perspective_lh_no(fov_y_radians_, aspect_, znear_, zfar_);
        }

    private:
        glm::vec3 position_{2.0f, 2.0f, 2.0f};
        glm::vec3 direction_{glm::normalize(glm::vec3(-1.0f, -1.0f, -1.0f))};
        float fov_y_radians_ = glm::radians(100.0f);
        float aspect_ = 1.0f;
        float znear_ = 0.1f;
        float zfar_ = 10.0f;
    };
}
