#pragma once

/*
    PNR РЕНДЕРЕР САН

    ФАЙЛ: render_config.hpp
    МОДУЛЬ: frame
    ЗОРИЛГО: Энэ файл нь pnr-renderer-lib-ийн frame модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <cmath>
#include <string>

#include <glm/glm.hpp>

#include "pnr/core/result.hpp"
#include "pnr/shader/types.hpp"

namespace pnr
{
    enum class ViewMode
    {
        Painted = 0,
        Points = 1,
        Raster = 2
    };

    inline const char* view_mode_name(ViewMode m)
    {
        switch (m)
        {
            case ViewMode::Painted: return "painted";
            case ViewMode::Points: return "points";
            case ViewMode::Raster: return "raster";
        }
        return "unknown";
    }

    inline ViewMode next_view_mode(ViewMode m)
    {
        switch (m)
        {
            case ViewMode::Painted: return ViewMode::Points;
            case ViewMode::Points: return ViewMode::Raster;
            case ViewMode::Raster: return ViewMode::Painted;
        }
        return ViewMode::Painted;
    }

    // Stroke-ийн өнгийг хаанаас авах вэ.
    enum class ColorSource
    {
        AnchorShading = 0,
        ReferenceField = 1
    };

    // Brush atlas-ийн хэлбэр. Бүх pass нэг л утгыг барьж ажиллана.
    struct BrushConfig
    {
        int brush_count = 4;
        int cell_px = 64;
    };

    struct RenderConfig
    {
        int stroke_density = 3000;
        float brush_size = 0.04f;
        int quantization = 0;
        glm::vec3 background{0.0f, 0.0f, 0.0f};
        float saturation = 1.0f;
        bool enable_canvas = true;
        bool enable_brush_tbn = true;

        float occlusion_tolerance = 0.01f;
        PaintLighting lighting{};
        ColorSource color_source = ColorSource::AnchorShading;
        ViewMode view_mode = ViewMode::Painted;
        bool show_overlay = true;
    };

    namespace detail
    {
        inline bool in_unit_range(float v)
        {
            return std::isfinite(v) && v >= 0.0f && v <= 1.0f;
        }
    }

    inline Status validate_render_config(const RenderConfig& cfg, const BrushConfig& brushes = {})
    {
        if (cfg.stroke_density <= 0)
        {
            return Status::failure("stroke_density must be positive, got " + std::to_string(cfg.stroke_density));
        }
        if (!std::isfinite(cfg.brush_size) || cfg.brush_size <= 0.0f)
        {
            return Status::failure("brush_size must be a positive finite value");
        }
        if (cfg.quantization < 0)
        {
            return Status::failure("quantization must be non-negative, got " + std::to_string(cfg.quantization));
        }
        if (!detail::in_unit_range(cfg.background.r) || !detail::in_unit_range(cfg.background.g) ||
            !detail::in_unit_range(cfg.background.b))
        {
            return Status::failure("background components must lie in [0,1]");
        }
        if (!detail::in_unit_range(cfg.saturation))
        {
            return Status::failure("saturation must lie in [0,1]");
        }
        if (!std::isfinite(cfg.occlusion_tolerance) || cfg.occlusion_tolerance < 0.0f)
        {
            return Status::failure("occlusion_tolerance must be non-negative");
        }
        if (brushes.brush_count < 1)
        {
            return Status::failure("brush_count must be at least 1");
        }
        return status_ok();
    }
}
